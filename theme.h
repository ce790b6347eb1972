#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "display_types.h"

enum widget_kind {
  WIDGET_TEXT = 0,
  WIDGET_IMAGE = 1,
  WIDGET_RADIAL = 2,
  WIDGET_BAR = 3,
  WIDGET_GRAPH = 4,
};

enum text_align { ALIGN_LEFT = 0, ALIGN_CENTER = 1, ALIGN_RIGHT = 2 };

// Decoded picture, XRGB8888.
struct image_xrgb {
  uint32_t w = 0, h = 0;
  std::vector<uint32_t> px;
};

struct widget_style {
  rgb_u8 fg{255,255,255};
  rgb_u8 bg{0,0,0};
  // Background of the box: crop of the theme background image, else solid bg.
  bool bg_from_image = true;
  std::string font = "simplex";        // Hershey face
  double font_scale = 0.6;
  int thickness = 1;
};

struct text_params {
  std::string text;                    // fixed label when no stat is bound
  std::string format = "%.0f";         // printf format for numeric values
  std::string unit;
  text_align align = ALIGN_LEFT;
  std::string fallback = "-";
};

struct image_params {
  std::string path;
  image_xrgb img;
};

struct radial_params {
  int32_t cx = 0, cy = 0;
  int32_t radius = 0;
  int32_t bar_width = 10;
  double min = 0.0, max = 100.0;
  double start_angle = 0.0, end_angle = 360.0;   // degrees, may wrap past 360
  int step_count = 1;
  double step_sep = 0.0;                        // degrees between segments
  bool clockwise = true;
  rgb_u8 bar_color{0,255,0};
  bool show_bg_arc = false;
  rgb_u8 bg_arc_color{60,60,60};
  bool show_text = false;
  std::string format = "%.0f";
  std::string unit = "%";
  std::string fallback = "-";
};

struct bar_params {
  double min = 0.0, max = 100.0;
  bool vertical = false;
  bool reverse = false;                         // fill from the right / top
  rgb_u8 bar_color{0,255,0};
  bool outline = true;
  rgb_u8 outline_color{255,255,255};
  std::string fallback = "-";
};

struct graph_params {
  double min = 0.0, max = 100.0;
  bool autoscale = false;
  uint32_t history = 10;
  rgb_u8 line_color{0,255,0};
  int line_width = 2;
  bool axis = false;
  rgb_u8 axis_color{128,128,128};
  std::string fallback = "-";
};

struct widget_def {
  std::string id;
  widget_kind kind = WIDGET_TEXT;
  rect_u32 box;                                 // logical canvas coordinates
  std::string stat;                             // empty: not data bound
  uint32_t interval_ms = 0;                     // 0: drawn once
  widget_style style;
  text_params text;
  image_params image;
  radial_params radial;
  bar_params bar;
  graph_params graph;
};

struct theme {
  std::string name;
  std::string display_size;                     // "3.5\"" etc, informational
  uint32_t width = 0, height = 0;               // portrait
  orientation orient = ORIENT_PORTRAIT;
  bool has_led = false;
  rgb_u8 led;
  rgb_u8 bg_color{0,0,0};
  std::string bg_image_path;
  image_xrgb bg_image;                          // logical size when set
  std::vector<widget_def> widgets;

  uint32_t logicalWidth() const { return orientation_is_landscape(orient) ? height : width; }
  uint32_t logicalHeight() const { return orientation_is_landscape(orient) ? width : height; }
};

// Signed arc length in degrees from start to end, following the direction flag.
double radial_span(const radial_params &r);

const char *widget_kind_to_string(widget_kind k);
bool widget_kind_from_string(const std::string &s, widget_kind *out);

// Named panel sizes ("0.96\"", "2.1\"", "3.5\"", "5\"", "8.8\"") to portrait resolution.
bool display_size_lookup(const std::string &name, uint32_t *w, uint32_t *h);

// Parses and validates. Asset paths are resolved against base_dir unless absolute.
// Any failure is a configuration error and nothing is rendered.
bool theme_from_json_text(const std::string &text, const std::string &base_dir, theme *out, std::string *err);
bool theme_load(const std::string &path, theme *out, std::string *err);

// Geometry and range checks, also run by theme_from_json_text.
bool theme_validate(const theme &t, std::string *err);

// Hershey font names ("simplex", "plain", "duplex", "complex", "triplex", "small", "script").
bool font_face_lookup(const std::string &name, int *face);

// Decodes an image file to XRGB8888.
bool image_load(const std::string &path, image_xrgb *out, std::string *err);
