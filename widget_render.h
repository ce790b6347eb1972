#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "canvas.h"
#include "stat_cache.h"
#include "theme.h"

// ---- radial gauge geometry (degrees, clockwise from 3 o'clock like cv::ellipse) ----

// (v-min)/(max-min) clamped to [0,1].
double radial_fraction(const radial_params &r, double v);
// Signed swept arc for v: 0 at min, radial_span() at max.
double radial_sweep(const radial_params &r, double v);
// Absolute end angle of the bar: start + sweep.
double radial_angle(const radial_params &r, double v);
// A segment is lit when its angular midpoint lies within the swept range (ties lit).
bool radial_step_filled(const radial_params &r, int step, double sweep);
int radial_filled_steps(const radial_params &r, double v);

// ---- linear bar ----
uint32_t bar_fill_length(const bar_params &b, double v, uint32_t length);

// ---- line graph ----

// Fixed-capacity FIFO of samples; pushing into a full ring evicts the oldest.
class HistoryRing {
public:
  explicit HistoryRing(size_t capacity = 0) : buf_(capacity), head_(0), size_(0) {}

  void push(double v);
  void clear() { head_ = 0; size_ = 0; }
  size_t size() const { return size_; }
  size_t capacity() const { return buf_.size(); }
  // Oldest first.
  double at(size_t i) const { return buf_[(head_ + i) % buf_.size()]; }
  std::vector<double> values() const;

private:
  std::vector<double> buf_;
  size_t head_;
  size_t size_;
};

// Vertical range used to plot: min/max over the buffer when autoscaling (widened by 1 when
// flat), else the configured bounds.
void graph_range(const graph_params &g, const HistoryRing &ring, double *lo, double *hi);
// Polyline in box-local pixels, oldest sample at x = 0.
std::vector<cv::Point> graph_points(const graph_params &g, const HistoryRing &ring, uint32_t w, uint32_t h);

// ---- text ----
std::string format_stat(const std::string &fmt, const std::string &unit, const stat_value &v, const std::string &fallback);

// ---- drawing; everything is clipped to the widget box ----
void draw_widget_background(canvas &c, const theme &t, const widget_def &w);
void draw_text_widget(canvas &c, const theme &t, const widget_def &w, const std::string &s);
void draw_image_widget(canvas &c, const theme &t, const widget_def &w);
void draw_radial_widget(canvas &c, const theme &t, const widget_def &w, const stat_value &v);
void draw_bar_widget(canvas &c, const theme &t, const widget_def &w, const stat_value &v);
void draw_graph_widget(canvas &c, const theme &t, const widget_def &w, const HistoryRing &ring);
