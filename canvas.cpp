#include "canvas.h"
#include <algorithm>
#include <string.h>

void canvas::markDirty(const rect_u32 &r) {
  if (rect_empty(r) || !rect_inside(r, w, h)) return;
  dirty.push_back(r);
}

void canvas::markAllDirty() {
  dirty.clear();
  dirty.push_back(bounds());
}

std::vector<rect_u32> canvas::takeDirty() {
  std::vector<rect_u32> out;
  out.swap(dirty);
  return out;
}

void canvas::fill(const rect_u32 &r, uint32_t xrgb) {
  if (!rect_inside(r, w, h)) return;
  for (uint32_t y=0; y<r.h; y++) {
    uint32_t *d = px.data() + (size_t)(r.y + y) * w + r.x;
    std::fill(d, d + r.w, xrgb);
  }
}

void canvas::blit(const rect_u32 &r, const uint32_t *src, uint32_t src_stride) {
  if (!src || !rect_inside(r, w, h)) return;
  for (uint32_t y=0; y<r.h; y++) {
    memcpy(px.data() + (size_t)(r.y + y) * w + r.x, src + (size_t)y * src_stride, (size_t)r.w * 4);
  }
}

void canvas::copyOut(const rect_u32 &r, std::vector<uint32_t> &out) const {
  out.resize((size_t)r.w * r.h);
  if (!rect_inside(r, w, h)) return;
  for (uint32_t y=0; y<r.h; y++) {
    memcpy(out.data() + (size_t)y * r.w, px.data() + (size_t)(r.y + y) * w + r.x, (size_t)r.w * 4);
  }
}
