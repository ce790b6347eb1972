#include "widget_render.h"

#include <math.h>
#include <stdio.h>
#include <algorithm>

#include <opencv2/imgproc.hpp>

static inline cv::Scalar to_scalar(const rgb_u8 &c) { return cv::Scalar(c.b, c.g, c.r, 255); }

// ---------------- radial gauge ----------------

double radial_fraction(const radial_params &r, double v) {
  if (!(r.max > r.min)) return 0.0;
  double f = (v - r.min) / (r.max - r.min);
  if (!(f > 0.0)) return 0.0;   // also NaN
  if (f > 1.0) return 1.0;
  return f;
}

double radial_sweep(const radial_params &r, double v) {
  return radial_span(r) * radial_fraction(r, v);
}

double radial_angle(const radial_params &r, double v) {
  return r.start_angle + radial_sweep(r, v);
}

bool radial_step_filled(const radial_params &r, int step, double sweep) {
  if (r.step_count < 1) return false;
  double seg = fabs(radial_span(r)) / r.step_count;
  double mid = step * seg + (seg - r.step_sep) / 2.0;
  return mid <= fabs(sweep) + 1e-9;
}

int radial_filled_steps(const radial_params &r, double v) {
  double sweep = radial_sweep(r, v);
  int n = 0;
  for (int i=0; i<r.step_count; i++) if (radial_step_filled(r, i, sweep)) n++;
  return n;
}

// ---------------- bar ----------------

uint32_t bar_fill_length(const bar_params &b, double v, uint32_t length) {
  if (!(b.max > b.min)) return 0;
  double f = (v - b.min) / (b.max - b.min);
  if (!(f > 0.0)) return 0;
  if (f > 1.0) f = 1.0;
  return (uint32_t)lround(f * length);
}

// ---------------- graph ----------------

void HistoryRing::push(double v) {
  if (buf_.empty()) return;
  if (size_ < buf_.size()) {
    buf_[(head_ + size_) % buf_.size()] = v;
    size_++;
  } else {
    buf_[head_] = v;
    head_ = (head_ + 1) % buf_.size();
  }
}

std::vector<double> HistoryRing::values() const {
  std::vector<double> out;
  out.reserve(size_);
  for (size_t i=0; i<size_; i++) out.push_back(at(i));
  return out;
}

void graph_range(const graph_params &g, const HistoryRing &ring, double *lo, double *hi) {
  if (!g.autoscale || ring.size() == 0) {
    *lo = g.min;
    *hi = g.max;
    if (!(*hi > *lo)) { *lo -= 1.0; *hi += 1.0; }
    return;
  }
  double mn = ring.at(0), mx = ring.at(0);
  for (size_t i=1; i<ring.size(); i++) {
    mn = std::min(mn, ring.at(i));
    mx = std::max(mx, ring.at(i));
  }
  if (mn == mx) { mn -= 1.0; mx += 1.0; }
  *lo = mn;
  *hi = mx;
}

std::vector<cv::Point> graph_points(const graph_params &g, const HistoryRing &ring, uint32_t w, uint32_t h) {
  std::vector<cv::Point> pts;
  if (ring.size() == 0 || w == 0 || h == 0) return pts;
  double lo = 0, hi = 0;
  graph_range(g, ring, &lo, &hi);
  const double slots = ring.capacity() > 1 ? (double)(ring.capacity() - 1) : 1.0;
  for (size_t i=0; i<ring.size(); i++) {
    double v = std::min(std::max(ring.at(i), lo), hi);
    int x = (int)lround(i * (w - 1) / slots);
    int y = (int)lround((h - 1) - (v - lo) / (hi - lo) * (h - 1));
    pts.push_back(cv::Point(x, y));
  }
  return pts;
}

// ---------------- text ----------------

std::string format_stat(const std::string &fmt, const std::string &unit, const stat_value &v, const std::string &fallback) {
  if (v.kind == STAT_TEXT) return v.text;
  if (v.kind != STAT_NUMBER || !isfinite(v.number)) return fallback;
  char buf[64];
  snprintf(buf, sizeof(buf), fmt.c_str(), v.number);
  return std::string(buf) + (unit.empty() ? v.unit : unit);
}

static void put_text_in(cv::Mat &roi, const widget_style &st, text_align align, const std::string &s, const cv::Scalar &color) {
  if (s.empty()) return;
  int face = cv::FONT_HERSHEY_SIMPLEX;
  font_face_lookup(st.font, &face);
  int baseline = 0;
  cv::Size sz = cv::getTextSize(s, face, st.font_scale, st.thickness, &baseline);
  int x = 0;
  if (align == ALIGN_CENTER) x = (roi.cols - sz.width) / 2;
  else if (align == ALIGN_RIGHT) x = roi.cols - sz.width;
  int y = (roi.rows + sz.height) / 2;
  cv::putText(roi, s, cv::Point(x, y), face, st.font_scale, color, st.thickness, cv::LINE_8);
}

// ---------------- drawing ----------------

void draw_widget_background(canvas &c, const theme &t, const widget_def &w) {
  const rect_u32 &b = w.box;
  if (w.style.bg_from_image && t.bg_image.w == c.w && t.bg_image.h == c.h) {
    c.blit(b, t.bg_image.px.data() + (size_t)b.y * t.bg_image.w + b.x, t.bg_image.w);
  } else {
    c.fill(b, pack_xrgb8888(w.style.bg));
  }
}

void draw_text_widget(canvas &c, const theme &t, const widget_def &w, const std::string &s) {
  draw_widget_background(c, t, w);
  cv::Mat roi = c.roi(w.box);
  put_text_in(roi, w.style, w.text.align, s, to_scalar(w.style.fg));
}

void draw_image_widget(canvas &c, const theme &t, const widget_def &w) {
  draw_widget_background(c, t, w);
  const image_xrgb &img = w.image.img;
  rect_u32 r = w.box;
  r.w = std::min(r.w, img.w);
  r.h = std::min(r.h, img.h);
  c.blit(r, img.px.data(), img.w);
}

static void draw_arc(cv::Mat &roi, const radial_params &r, double a0, double a1, const cv::Scalar &color) {
  if (a0 == a1) return;
  int mid = r.radius - r.bar_width / 2;
  if (mid < 1) mid = 1;
  cv::ellipse(roi, cv::Point(r.radius, r.radius), cv::Size(mid, mid), 0.0, a0, a1, color, r.bar_width, cv::LINE_8);
}

void draw_radial_widget(canvas &c, const theme &t, const widget_def &w, const stat_value &v) {
  const radial_params &r = w.radial;
  draw_widget_background(c, t, w);
  cv::Mat roi = c.roi(w.box);

  const bool avail = v.kind == STAT_NUMBER && isfinite(v.number);
  const double span = radial_span(r);
  const double sweep = avail ? radial_sweep(r, v.number) : 0.0;
  const double dir = span < 0 ? -1.0 : 1.0;

  if (r.step_count > 1) {
    const double seg = fabs(span) / r.step_count;
    for (int i=0; i<r.step_count; i++) {
      double a0 = r.start_angle + dir * (i * seg);
      double a1 = a0 + dir * (seg - r.step_sep);
      if (avail && radial_step_filled(r, i, sweep)) draw_arc(roi, r, a0, a1, to_scalar(r.bar_color));
      else if (r.show_bg_arc) draw_arc(roi, r, a0, a1, to_scalar(r.bg_arc_color));
    }
  } else {
    if (r.show_bg_arc) draw_arc(roi, r, r.start_angle + sweep, r.start_angle + span, to_scalar(r.bg_arc_color));
    if (avail) draw_arc(roi, r, r.start_angle, r.start_angle + sweep, to_scalar(r.bar_color));
  }

  if (!avail) put_text_in(roi, w.style, ALIGN_CENTER, r.fallback, to_scalar(w.style.fg));
  else if (r.show_text) put_text_in(roi, w.style, ALIGN_CENTER, format_stat(r.format, r.unit, v, r.fallback), to_scalar(w.style.fg));
}

void draw_bar_widget(canvas &c, const theme &t, const widget_def &w, const stat_value &v) {
  const bar_params &b = w.bar;
  draw_widget_background(c, t, w);
  cv::Mat roi = c.roi(w.box);

  if (v.kind != STAT_NUMBER || !isfinite(v.number)) {
    put_text_in(roi, w.style, ALIGN_CENTER, b.fallback, to_scalar(w.style.fg));
  } else {
    const uint32_t len = b.vertical ? w.box.h : w.box.w;
    const int n = (int)bar_fill_length(b, v.number, len);
    if (n > 0) {
      cv::Rect fr;
      if (b.vertical) fr = b.reverse ? cv::Rect(0, 0, roi.cols, n) : cv::Rect(0, roi.rows - n, roi.cols, n);
      else fr = b.reverse ? cv::Rect(roi.cols - n, 0, n, roi.rows) : cv::Rect(0, 0, n, roi.rows);
      cv::rectangle(roi, fr, to_scalar(b.bar_color), cv::FILLED, cv::LINE_8);
    }
  }
  if (b.outline) cv::rectangle(roi, cv::Rect(0, 0, roi.cols, roi.rows), to_scalar(b.outline_color), 1, cv::LINE_8);
}

void draw_graph_widget(canvas &c, const theme &t, const widget_def &w, const HistoryRing &ring) {
  const graph_params &g = w.graph;
  draw_widget_background(c, t, w);
  cv::Mat roi = c.roi(w.box);

  if (g.axis) {
    cv::line(roi, cv::Point(0, 0), cv::Point(0, roi.rows - 1), to_scalar(g.axis_color), 1, cv::LINE_8);
    cv::line(roi, cv::Point(0, roi.rows - 1), cv::Point(roi.cols - 1, roi.rows - 1), to_scalar(g.axis_color), 1, cv::LINE_8);
  }
  if (ring.size() == 0) {
    put_text_in(roi, w.style, ALIGN_CENTER, g.fallback, to_scalar(w.style.fg));
    return;
  }
  std::vector<cv::Point> pts = graph_points(g, ring, w.box.w, w.box.h);
  if (pts.size() == 1) {
    cv::circle(roi, pts[0], std::max(1, g.line_width / 2), to_scalar(g.line_color), cv::FILLED, cv::LINE_8);
    return;
  }
  cv::polylines(roi, pts, false, to_scalar(g.line_color), g.line_width, cv::LINE_8);
}
