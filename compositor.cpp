#include "compositor.h"
#include <math.h>
#include <algorithm>

Compositor::Compositor(const theme &t) : t_(t) {
  c_.resize(t_.logicalWidth(), t_.logicalHeight());
  states_.resize(t_.widgets.size());
  for (size_t i=0; i<t_.widgets.size(); i++) {
    if (t_.widgets[i].kind == WIDGET_GRAPH) states_[i].history = HistoryRing(t_.widgets[i].graph.history);
  }
}

void Compositor::forceRedraw() {
  for (widget_state &s : states_) s.rendered = false;
}

bool Compositor::renderWidget(size_t i, const stat_snapshot &values, bool force) {
  const widget_def &w = t_.widgets[i];
  widget_state &s = states_[i];
  const stat_sample *smp = w.stat.empty() ? nullptr : stat_find(values, w.stat);
  const stat_value v = smp ? smp->value : stat_value::unavailable();

  bool draw = force || !s.rendered;
  if (w.kind == WIDGET_GRAPH) {
    if (smp && smp->seq != s.last_seq) {
      s.last_seq = smp->seq;
      if (v.kind == STAT_NUMBER && isfinite(v.number)) {
        s.history.push(v.number);
        draw = true;
      }
    }
  } else if (!w.stat.empty()) {
    if (!stat_value_equal(v, s.last)) draw = true;
  }
  if (!draw) return false;

  s.last = v;
  s.rendered = true;
  switch (w.kind) {
    case WIDGET_TEXT:
      if (w.stat.empty()) draw_text_widget(c_, t_, w, w.text.text);
      else draw_text_widget(c_, t_, w, w.text.text + format_stat(w.text.format, w.text.unit, v, w.text.fallback));
      break;
    case WIDGET_IMAGE:
      draw_image_widget(c_, t_, w);
      break;
    case WIDGET_RADIAL:
      draw_radial_widget(c_, t_, w, v);
      break;
    case WIDGET_BAR:
      draw_bar_widget(c_, t_, w, v);
      break;
    case WIDGET_GRAPH:
      draw_graph_widget(c_, t_, w, s.history);
      break;
  }
  c_.markDirty(w.box);
  return true;
}

std::vector<rect_u32> Compositor::renderAll(const stat_snapshot &values) {
  if (t_.bg_image.w == c_.w && t_.bg_image.h == c_.h && !t_.bg_image.px.empty()) {
    c_.px = t_.bg_image.px;
  } else {
    c_.fill(c_.bounds(), pack_xrgb8888(t_.bg_color));
  }
  for (size_t i=0; i<t_.widgets.size(); i++) renderWidget(i, values, true);
  c_.markAllDirty();
  return std::vector<rect_u32>(1, c_.bounds());
}

std::vector<rect_u32> Compositor::renderDue(const std::vector<size_t> &due, const stat_snapshot &values) {
  std::vector<size_t> order(due);
  std::sort(order.begin(), order.end());
  order.erase(std::unique(order.begin(), order.end()), order.end());
  std::vector<rect_u32> out;
  for (size_t i : order) {
    if (i >= t_.widgets.size()) continue;
    if (renderWidget(i, values, false)) out.push_back(t_.widgets[i].box);
  }
  return out;
}
