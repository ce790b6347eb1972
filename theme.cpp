#include "theme.h"
#include "sys_util.h"

#include <ctype.h>
#include <math.h>
#include <stdint.h>
#include <string.h>
#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

using nlohmann::json;

const char *widget_kind_to_string(widget_kind k) {
  switch (k) {
    case WIDGET_TEXT:   return "text";
    case WIDGET_IMAGE:  return "image";
    case WIDGET_RADIAL: return "radial";
    case WIDGET_BAR:    return "bar";
    case WIDGET_GRAPH:  return "graph";
    default:            return "text";
  }
}

bool widget_kind_from_string(const std::string &s, widget_kind *out) {
  if (s == "text")   { *out = WIDGET_TEXT; return true; }
  if (s == "image")  { *out = WIDGET_IMAGE; return true; }
  if (s == "radial") { *out = WIDGET_RADIAL; return true; }
  if (s == "bar")    { *out = WIDGET_BAR; return true; }
  if (s == "graph")  { *out = WIDGET_GRAPH; return true; }
  return false;
}

bool display_size_lookup(const std::string &name, uint32_t *w, uint32_t *h) {
  struct entry { const char *name; uint32_t w, h; };
  static const entry kSizes[] = {
    { "0.96\"", 80, 160 },
    { "2.1\"", 480, 480 },
    { "3.5\"", 320, 480 },
    { "5\"", 480, 800 },
    { "8.8\"", 480, 1920 },
  };
  for (const entry &e : kSizes) {
    if (name == e.name) { *w = e.w; *h = e.h; return true; }
  }
  return false;
}

bool font_face_lookup(const std::string &name, int *face) {
  if (name == "simplex")  { *face = cv::FONT_HERSHEY_SIMPLEX; return true; }
  if (name == "plain")    { *face = cv::FONT_HERSHEY_PLAIN; return true; }
  if (name == "duplex")   { *face = cv::FONT_HERSHEY_DUPLEX; return true; }
  if (name == "complex")  { *face = cv::FONT_HERSHEY_COMPLEX; return true; }
  if (name == "triplex")  { *face = cv::FONT_HERSHEY_TRIPLEX; return true; }
  if (name == "small")    { *face = cv::FONT_HERSHEY_COMPLEX_SMALL; return true; }
  if (name == "script")   { *face = cv::FONT_HERSHEY_SCRIPT_SIMPLEX; return true; }
  return false;
}

bool image_load(const std::string &path, image_xrgb *out, std::string *err) {
  cv::Mat m = cv::imread(path, cv::IMREAD_COLOR);
  if (m.empty()) {
    if (err) *err = "cannot decode image " + path;
    return false;
  }
  cv::Mat bgra;
  cv::cvtColor(m, bgra, cv::COLOR_BGR2BGRA);
  out->w = (uint32_t)bgra.cols;
  out->h = (uint32_t)bgra.rows;
  out->px.resize((size_t)out->w * out->h);
  for (uint32_t y=0; y<out->h; y++) {
    const uint8_t *s = bgra.ptr<uint8_t>((int)y);
    uint32_t *d = out->px.data() + (size_t)y * out->w;
    for (uint32_t x=0; x<out->w; x++, s+=4) d[x] = pack_xrgb8888(s[2], s[1], s[0]);
  }
  return true;
}

// One floating conversion (e/f/g), no '*' widths, no %n.
static bool numeric_format_ok(const std::string &f) {
  int conversions = 0;
  for (size_t i=0; i<f.size(); i++) {
    if (f[i] != '%') continue;
    i++;
    if (i < f.size() && f[i] == '%') continue;
    while (i < f.size() && strchr("-+ #0", f[i])) i++;
    while (i < f.size() && isdigit((unsigned char)f[i])) i++;
    if (i < f.size() && f[i] == '.') {
      i++;
      while (i < f.size() && isdigit((unsigned char)f[i])) i++;
    }
    if (i >= f.size() || !strchr("eEfFgG", f[i])) return false;
    conversions++;
  }
  return conversions == 1;
}

static std::string resolve_path(const std::string &base_dir, const std::string &p) {
  if (p.empty() || p[0] == '/' || base_dir.empty()) return p;
  return base_dir + "/" + p;
}

double radial_span(const radial_params &r) {
  double span = r.end_angle - r.start_angle;
  if (r.clockwise) { if (span <= 0.0) span += 360.0; }
  else { if (span >= 0.0) span -= 360.0; }
  return span;
}

bool theme_validate(const theme &t, std::string *err) {
  auto fail = [&](const std::string &m) {
    if (err) *err = m;
    return false;
  };
  if (t.width == 0 || t.height == 0) return fail("display size not set");
  const uint32_t lw = t.logicalWidth(), lh = t.logicalHeight();
  if (!t.bg_image_path.empty() && (t.bg_image.w != lw || t.bg_image.h != lh)) {
    return fail("background image " + std::to_string(t.bg_image.w) + "x" + std::to_string(t.bg_image.h) +
                " does not match display " + std::to_string(lw) + "x" + std::to_string(lh));
  }

  std::set<std::string> ids;
  for (const widget_def &w : t.widgets) {
    const std::string who = "widget '" + w.id + "': ";
    if (!ids.insert(w.id).second) return fail(who + "duplicate id");
    if (rect_empty(w.box)) return fail(who + "empty geometry");
    if (!rect_inside(w.box, lw, lh)) {
      return fail(who + "geometry " + std::to_string(w.box.x) + "," + std::to_string(w.box.y) + " " +
                  std::to_string(w.box.w) + "x" + std::to_string(w.box.h) + " outside the " +
                  std::to_string(lw) + "x" + std::to_string(lh) + " canvas");
    }
    int face = 0;
    if (!font_face_lookup(w.style.font, &face)) return fail(who + "unknown font " + w.style.font);
    if (w.style.font_scale <= 0.0) return fail(who + "font scale must be positive");

    switch (w.kind) {
      case WIDGET_TEXT:
        if (!w.stat.empty() && !numeric_format_ok(w.text.format)) return fail(who + "bad format " + w.text.format);
        break;
      case WIDGET_IMAGE:
        if (w.image.img.px.empty()) return fail(who + "missing image " + w.image.path);
        break;
      case WIDGET_RADIAL: {
        const radial_params &r = w.radial;
        if (r.radius <= 0) return fail(who + "radius must be positive");
        if (r.bar_width <= 0 || r.bar_width > r.radius) return fail(who + "bar width must be in 1..radius");
        if (!(r.min < r.max)) return fail(who + "min must be less than max");
        if (r.step_count < 1) return fail(who + "step count must be at least 1");
        double seg = fabs(radial_span(r)) / r.step_count;
        if (r.step_sep < 0.0 || (r.step_count > 1 && r.step_sep >= seg)) return fail(who + "step separation must be in 0..segment width");
        if (r.show_text && !numeric_format_ok(r.format)) return fail(who + "bad format " + r.format);
        break;
      }
      case WIDGET_BAR:
        if (!(w.bar.min < w.bar.max)) return fail(who + "min must be less than max");
        break;
      case WIDGET_GRAPH:
        if (w.graph.history < 2) return fail(who + "history must hold at least 2 samples");
        if (!w.graph.autoscale && !(w.graph.min < w.graph.max)) return fail(who + "min must be less than max");
        if (w.graph.line_width < 1) return fail(who + "line width must be positive");
        break;
    }
    if (w.kind != WIDGET_IMAGE && w.kind != WIDGET_TEXT && w.stat.empty()) return fail(who + "no stat bound");
  }
  return true;
}

bool theme_from_json_text(const std::string &text, const std::string &base_dir, theme *out, std::string *err) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "theme is not a JSON object";
    return false;
  }
  auto fail = [&](const std::string &m) {
    if (err) *err = m;
    return false;
  };

  // Reads a string member; false when present with another type.
  auto opt_str = [](const json &o, const char *k, std::string &v) {
    if (!o.contains(k)) return true;
    if (!o[k].is_string()) return false;
    v = o[k].get<std::string>();
    return true;
  };
  // Integer member that fits int32; false when present and anything else.
  auto opt_i32 = [](const json &o, const char *k, int32_t &v) {
    if (!o.contains(k)) return true;
    if (!o[k].is_number_integer()) return false;
    if (o[k].is_number_unsigned() ? o[k].get<uint64_t>() > (uint64_t)INT32_MAX
                                  : (o[k].get<int64_t>() < INT32_MIN || o[k].get<int64_t>() > INT32_MAX)) return false;
    v = (int32_t)o[k].get<int64_t>();
    return true;
  };

  theme t;
  t.name = "unnamed";
  if (!opt_str(j, "name", t.name)) return fail("bad value for name");

  json d = j.contains("display") && j["display"].is_object() ? j["display"] : json::object();
  if (d.contains("size") && d["size"].is_string()) {
    t.display_size = d["size"].get<std::string>();
    if (!display_size_lookup(t.display_size, &t.width, &t.height)) return fail("unknown display size " + t.display_size);
  }
  int32_t dw = (int32_t)t.width, dh = (int32_t)t.height;
  if (!opt_i32(d, "width", dw)) return fail("bad value for display width");
  if (!opt_i32(d, "height", dh)) return fail("bad value for display height");
  t.width = (uint32_t)std::max(0, dw);
  t.height = (uint32_t)std::max(0, dh);

  std::string o = "portrait";
  if (!opt_str(d, "orientation", o)) return fail("bad value for orientation");
  if (!orientation_from_string(o, &t.orient)) return fail("unknown orientation " + o);

  if (d.contains("led") && d["led"].is_string()) {
    if (!parse_rgb_csv(d["led"].get<std::string>().c_str(), &t.led)) return fail("bad led colour");
    t.has_led = true;
  }
  if (d.contains("background") && d["background"].is_string()) {
    if (!parse_rgb_csv(d["background"].get<std::string>().c_str(), &t.bg_color)) return fail("bad background colour");
  }
  if (d.contains("backgroundImage") && d["backgroundImage"].is_string()) {
    t.bg_image_path = resolve_path(base_dir, d["backgroundImage"].get<std::string>());
    std::string e;
    if (!image_load(t.bg_image_path, &t.bg_image, &e)) return fail(e);
  }

  if (j.contains("widgets") && !j["widgets"].is_array()) return fail("widgets must be an array");
  if (j.contains("widgets")) {
    size_t n = 0;
    for (const auto &jw : j["widgets"]) {
      n++;
      if (!jw.is_object()) return fail("widget " + std::to_string(n) + " is not an object");
      widget_def w;
      w.id = "widget" + std::to_string(n);
      if (!opt_str(jw, "id", w.id)) return fail("widget " + std::to_string(n) + ": bad value for id");
      const std::string who = "widget '" + w.id + "': ";

      std::string type = "text";
      if (!opt_str(jw, "type", type)) return fail(who + "bad value for type");
      if (!widget_kind_from_string(type, &w.kind)) return fail(who + "unknown type " + type);

      auto get_str = [&](const char *k, std::string &v) {
        if (jw.contains(k) && jw[k].is_string()) v = jw[k].get<std::string>();
      };
      auto get_num = [&](const char *k, double &v) {
        if (jw.contains(k) && jw[k].is_number()) v = jw[k].get<double>();
      };
      std::string out_of_range;
      auto get_int = [&](const char *k, int32_t &v) {
        if (jw.contains(k) && jw[k].is_number_integer() && !opt_i32(jw, k, v)) out_of_range = k;
      };
      auto get_bool = [&](const char *k, bool &v) {
        if (jw.contains(k) && jw[k].is_boolean()) v = jw[k].get<bool>();
      };
      bool colour_ok = true;
      auto get_rgb = [&](const char *k, rgb_u8 &v) {
        if (jw.contains(k) && jw[k].is_string() && !parse_rgb_csv(jw[k].get<std::string>().c_str(), &v)) colour_ok = false;
      };

      get_str("stat", w.stat);
      int32_t interval = w.stat.empty() ? 0 : 1000;
      get_int("interval", interval);
      if (interval < 0) return fail(who + "negative interval");
      w.interval_ms = (uint32_t)interval;

      int32_t x = 0, y = 0, bw = 0, bh = 0;
      get_int("x", x);
      get_int("y", y);
      get_int("width", bw);
      get_int("height", bh);

      get_rgb("color", w.style.fg);
      if (jw.contains("background")) {
        get_rgb("background", w.style.bg);
        w.style.bg_from_image = false;
      } else {
        w.style.bg = t.bg_color;
        w.style.bg_from_image = !t.bg_image_path.empty();
      }
      get_str("font", w.style.font);
      get_num("fontScale", w.style.font_scale);
      get_int("thickness", w.style.thickness);
      if (w.style.thickness < 1) w.style.thickness = 1;

      switch (w.kind) {
        case WIDGET_TEXT: {
          get_str("text", w.text.text);
          get_str("format", w.text.format);
          get_str("unit", w.text.unit);
          get_str("fallback", w.text.fallback);
          std::string align = "left";
          if (!opt_str(jw, "align", align)) return fail(who + "bad value for align");
          if (align == "center") w.text.align = ALIGN_CENTER;
          else if (align == "right") w.text.align = ALIGN_RIGHT;
          else if (align == "left") w.text.align = ALIGN_LEFT;
          else return fail(who + "unknown alignment " + align);
          break;
        }
        case WIDGET_IMAGE: {
          get_str("path", w.image.path);
          if (w.image.path.empty()) return fail(who + "image path missing");
          w.image.path = resolve_path(base_dir, w.image.path);
          std::string e;
          if (!image_load(w.image.path, &w.image.img, &e)) return fail(who + e);
          if (bw == 0) bw = (int32_t)w.image.img.w;
          if (bh == 0) bh = (int32_t)w.image.img.h;
          break;
        }
        case WIDGET_RADIAL: {
          radial_params &r = w.radial;
          r.cx = x; r.cy = y;
          get_int("radius", r.radius);
          get_int("barWidth", r.bar_width);
          get_num("min", r.min);
          get_num("max", r.max);
          get_num("angleStart", r.start_angle);
          get_num("angleEnd", r.end_angle);
          int32_t steps = r.step_count;
          get_int("steps", steps);
          r.step_count = steps;
          get_num("stepSep", r.step_sep);
          get_bool("clockwise", r.clockwise);
          get_rgb("barColor", r.bar_color);
          get_bool("bgArc", r.show_bg_arc);
          get_rgb("bgArcColor", r.bg_arc_color);
          get_bool("showText", r.show_text);
          get_str("format", r.format);
          get_str("unit", r.unit);
          get_str("fallback", r.fallback);
          if (!out_of_range.empty()) return fail(who + "bad value for " + out_of_range);
          if (r.radius <= 0) return fail(who + "radius must be positive");
          if (r.radius > (int32_t)std::max(t.logicalWidth(), t.logicalHeight()) || r.cx < r.radius || r.cy < r.radius)
            return fail(who + "geometry outside the canvas");
          // Box is the circle's square, centred on x,y.
          x = r.cx - r.radius;
          y = r.cy - r.radius;
          bw = bh = 2 * r.radius + 1;
          break;
        }
        case WIDGET_BAR:
          get_num("min", w.bar.min);
          get_num("max", w.bar.max);
          get_bool("vertical", w.bar.vertical);
          get_bool("reverse", w.bar.reverse);
          get_rgb("barColor", w.bar.bar_color);
          get_bool("outline", w.bar.outline);
          get_rgb("outlineColor", w.bar.outline_color);
          get_str("fallback", w.bar.fallback);
          break;
        case WIDGET_GRAPH: {
          get_num("min", w.graph.min);
          get_num("max", w.graph.max);
          get_bool("autoscale", w.graph.autoscale);
          int32_t hist = (int32_t)w.graph.history;
          get_int("history", hist);
          w.graph.history = hist > 0 ? (uint32_t)hist : 0;
          get_rgb("lineColor", w.graph.line_color);
          get_int("lineWidth", w.graph.line_width);
          get_bool("axis", w.graph.axis);
          get_rgb("axisColor", w.graph.axis_color);
          get_str("fallback", w.graph.fallback);
          break;
        }
      }
      if (!out_of_range.empty()) return fail(who + "bad value for " + out_of_range);
      if (!colour_ok) return fail(who + "bad colour, expected r,g,b");
      if (x < 0 || y < 0 || bw <= 0 || bh <= 0) return fail(who + "geometry outside the canvas");
      w.box.x = (uint32_t)x; w.box.y = (uint32_t)y; w.box.w = (uint32_t)bw; w.box.h = (uint32_t)bh;
      t.widgets.push_back(std::move(w));
    }
  }

  if (!theme_validate(t, err)) return false;
  *out = std::move(t);
  return true;
}

bool theme_load(const std::string &path, theme *out, std::string *err) {
  std::string text = slurp_file(path);
  if (text.empty()) {
    if (err) *err = "cannot read theme " + path;
    return false;
  }
  if (!theme_from_json_text(text, dir_of(path), out, err)) return false;
  fprintf(stderr, "[theme] loaded '%s': %ux%u %s, %zu widgets\n", out->name.c_str(), out->logicalWidth(),
          out->logicalHeight(), orientation_to_string(out->orient), out->widgets.size());
  return true;
}
