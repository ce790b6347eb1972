#pragma once
#include <stdint.h>
#include <vector>
#include "display_types.h"

// Rotation applied to a region on its way from canvas space to the panel's scan order.
enum pixel_rotation { ROT_NONE=0, ROT_CW90=1, ROT_CCW90=2, ROT_180=3 };

static inline uint16_t rgb565_from_xrgb(uint32_t p) {
  uint32_t r = (p >> 16) & 0xFF, g = (p >> 8) & 0xFF, b = p & 0xFF;
  return (uint16_t)(((r >> 3) << 11) | ((g >> 2) << 5) | (b >> 3));
}

static inline uint32_t bytes_per_pixel(pixel_format f) { return f == PIXFMT_BGRA8888 ? 4u : 2u; }

// Packs a tightly packed w x h XRGB8888 block into the wire format, rotating it first.
// A rotated block is h x w.
void pack_pixels(const uint32_t *src, uint32_t w, uint32_t h, pixel_rotation rot, pixel_format fmt,
                 std::vector<uint8_t> &out);

// Region of a logical (lw x lh) canvas expressed in the rotated frame.
rect_u32 rotate_rect(const rect_u32 &r, uint32_t lw, uint32_t lh, pixel_rotation rot);

// Solid fill in the wire format, used by device-side clears.
void pack_solid(uint32_t xrgb, uint32_t count, pixel_format fmt, std::vector<uint8_t> &out);
