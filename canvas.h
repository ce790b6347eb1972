#pragma once
#include <stdint.h>
#include <vector>
#include <opencv2/core.hpp>
#include "display_types.h"

// XRGB8888 surface in logical (theme) orientation, plus the rectangles touched since the
// last hand-off to the transmitter.
struct canvas {
  uint32_t w = 0, h = 0;
  std::vector<uint32_t> px;
  std::vector<rect_u32> dirty;

  void resize(uint32_t W, uint32_t H) {
    w = W; h = H;
    px.assign((size_t)w * (size_t)h, 0);
    dirty.clear();
  }

  rect_u32 bounds() const { rect_u32 r; r.w = w; r.h = h; return r; }

  // 8UC4 views sharing px. Byte order in memory is B,G,R,X.
  cv::Mat mat() { return cv::Mat((int)h, (int)w, CV_8UC4, px.data()); }
  cv::Mat roi(const rect_u32 &r) { return mat()(cv::Rect((int)r.x, (int)r.y, (int)r.w, (int)r.h)); }

  void markDirty(const rect_u32 &r);
  void markAllDirty();
  std::vector<rect_u32> takeDirty();

  void fill(const rect_u32 &r, uint32_t xrgb);
  // Copies src (r.w * r.h, row-major) into r.
  void blit(const rect_u32 &r, const uint32_t *src, uint32_t src_stride);
  // Extracts r into out (r.w * r.h).
  void copyOut(const rect_u32 &r, std::vector<uint32_t> &out) const;
};
