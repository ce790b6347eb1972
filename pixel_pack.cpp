#include "pixel_pack.h"

static inline void put_pixel(uint32_t p, pixel_format fmt, uint8_t *d) {
  switch (fmt) {
    case PIXFMT_RGB565_LE: {
      uint16_t v = rgb565_from_xrgb(p);
      d[0] = v & 0xFF; d[1] = v >> 8;
      break;
    }
    case PIXFMT_RGB565_BE: {
      uint16_t v = rgb565_from_xrgb(p);
      d[0] = v >> 8; d[1] = v & 0xFF;
      break;
    }
    case PIXFMT_BGRA8888:
    default:
      d[0] = p & 0xFF; d[1] = (p >> 8) & 0xFF; d[2] = (p >> 16) & 0xFF; d[3] = 0xFF;
      break;
  }
}

void pack_pixels(const uint32_t *src, uint32_t w, uint32_t h, pixel_rotation rot, pixel_format fmt,
                 std::vector<uint8_t> &out) {
  const uint32_t bpp = bytes_per_pixel(fmt);
  out.resize((size_t)w * h * bpp);
  uint8_t *d = out.data();

  // Output dimensions after rotation.
  uint32_t ow = (rot == ROT_CW90 || rot == ROT_CCW90) ? h : w;
  uint32_t oh = (rot == ROT_CW90 || rot == ROT_CCW90) ? w : h;

  for (uint32_t oy=0; oy<oh; oy++) {
    for (uint32_t ox=0; ox<ow; ox++) {
      uint32_t sx, sy;
      switch (rot) {
        case ROT_CW90:  sx = oy;         sy = h - 1 - ox; break;
        case ROT_CCW90: sx = w - 1 - oy; sy = ox;         break;
        case ROT_180:   sx = w - 1 - ox; sy = h - 1 - oy; break;
        case ROT_NONE:
        default:        sx = ox;         sy = oy;         break;
      }
      put_pixel(src[(size_t)sy * w + sx], fmt, d);
      d += bpp;
    }
  }
}

rect_u32 rotate_rect(const rect_u32 &r, uint32_t lw, uint32_t lh, pixel_rotation rot) {
  rect_u32 o;
  switch (rot) {
    case ROT_CW90:
      o.x = lh - r.y - r.h; o.y = r.x; o.w = r.h; o.h = r.w;
      break;
    case ROT_CCW90:
      o.x = r.y; o.y = lw - r.x - r.w; o.w = r.h; o.h = r.w;
      break;
    case ROT_180:
      o.x = lw - r.x - r.w; o.y = lh - r.y - r.h; o.w = r.w; o.h = r.h;
      break;
    case ROT_NONE:
    default:
      o = r;
      break;
  }
  return o;
}

void pack_solid(uint32_t xrgb, uint32_t count, pixel_format fmt, std::vector<uint8_t> &out) {
  const uint32_t bpp = bytes_per_pixel(fmt);
  out.resize((size_t)count * bpp);
  uint8_t px[4];
  put_pixel(xrgb, fmt, px);
  for (uint32_t i=0; i<count; i++)
    for (uint32_t k=0; k<bpp; k++) out[(size_t)i * bpp + k] = px[k];
}
