#pragma once
#include <stdint.h>
#include <string>
#include <vector>
#include "canvas.h"
#include "stat_cache.h"
#include "theme.h"
#include "widget_render.h"

// Per-widget render bookkeeping.
struct widget_state {
  bool rendered = false;
  stat_value last;                      // value drawn last time
  uint64_t last_seq = 0;                // graphs: last sample pushed
  HistoryRing history;
};

// Sole owner of the canvas. Draws due widgets in declaration order and reports one dirty
// rectangle (the widget box) per widget actually redrawn.
class Compositor {
public:
  explicit Compositor(const theme &t);

  // Paints the background and every widget; the whole canvas becomes dirty.
  std::vector<rect_u32> renderAll(const stat_snapshot &values);

  // Redraws due widgets whose bound value changed since their last render (for graphs:
  // a new sample arrived). Widgets never drawn, or drawn before forceRedraw(), always redraw.
  std::vector<rect_u32> renderDue(const std::vector<size_t> &due, const stat_snapshot &values);

  void forceRedraw();

  canvas &surface() { return c_; }
  const canvas &surface() const { return c_; }
  const widget_state &state(size_t widget) const { return states_[widget]; }

private:
  bool renderWidget(size_t i, const stat_snapshot &values, bool force);

  const theme &t_;
  canvas c_;
  std::vector<widget_state> states_;
};
