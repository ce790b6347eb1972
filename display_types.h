#pragma once
#include <stdint.h>
#include <stdio.h>
#include <string>

struct rect_u32 { uint32_t x=0,y=0,w=0,h=0; };
struct rgb_u8 { uint8_t r=0,g=0,b=0; };

// Values match the orientation byte used by the Turing / WeAct firmwares.
enum orientation {
  ORIENT_PORTRAIT=0,
  ORIENT_REVERSE_PORTRAIT=1,
  ORIENT_LANDSCAPE=2,
  ORIENT_REVERSE_LANDSCAPE=3,
};

enum pixel_format { PIXFMT_RGB565_LE=0, PIXFMT_RGB565_BE=1, PIXFMT_BGRA8888=2 };
enum checksum_kind { CHECKSUM_NONE=0, CHECKSUM_ADDITIVE=1, CHECKSUM_CRC32=2 };

// Result of every device-facing operation.
enum class LcdStatus {
  OK = 0,
  HANDSHAKE_FAILED = 1,
  TRANSPORT_ERROR = 2,
  CONNECTION_LOST = 3,
  UNSUPPORTED_OPERATION = 4,
  RECOVERED = 5,
  NOT_CONNECTED = 6,
  CONFIG_ERROR = 7,
};

static inline const char *lcd_status_name(LcdStatus s) {
  switch (s) {
    case LcdStatus::OK:                    return "ok";
    case LcdStatus::HANDSHAKE_FAILED:      return "handshake_failed";
    case LcdStatus::TRANSPORT_ERROR:       return "transport_error";
    case LcdStatus::CONNECTION_LOST:       return "connection_lost";
    case LcdStatus::UNSUPPORTED_OPERATION: return "unsupported_operation";
    case LcdStatus::RECOVERED:             return "recovered";
    case LcdStatus::NOT_CONNECTED:         return "not_connected";
    case LcdStatus::CONFIG_ERROR:          return "config_error";
    default:                               return "unknown";
  }
}

static inline bool orientation_is_landscape(orientation o) {
  return o == ORIENT_LANDSCAPE || o == ORIENT_REVERSE_LANDSCAPE;
}

static inline bool orientation_is_reverse(orientation o) {
  return o == ORIENT_REVERSE_PORTRAIT || o == ORIENT_REVERSE_LANDSCAPE;
}

static inline const char *orientation_to_string(orientation o) {
  switch (o) {
    case ORIENT_PORTRAIT:          return "portrait";
    case ORIENT_REVERSE_PORTRAIT:  return "reverse_portrait";
    case ORIENT_LANDSCAPE:         return "landscape";
    case ORIENT_REVERSE_LANDSCAPE: return "reverse_landscape";
    default:                       return "portrait";
  }
}

static inline bool orientation_from_string(const std::string &s, orientation *out) {
  if (s == "portrait")          { *out = ORIENT_PORTRAIT; return true; }
  if (s == "reverse_portrait")  { *out = ORIENT_REVERSE_PORTRAIT; return true; }
  if (s == "landscape")         { *out = ORIENT_LANDSCAPE; return true; }
  if (s == "reverse_landscape") { *out = ORIENT_REVERSE_LANDSCAPE; return true; }
  return false;
}

static inline uint8_t clamp_u8(int v) { return (v < 0) ? 0 : (v > 255 ? 255 : (uint8_t)v); }

static inline uint32_t pack_xrgb8888(uint8_t r, uint8_t g, uint8_t b) {
  return 0xFF000000u | ((uint32_t)r<<16) | ((uint32_t)g<<8) | (uint32_t)b;
}

static inline uint32_t pack_xrgb8888(const rgb_u8 &c) { return pack_xrgb8888(c.r, c.g, c.b); }

// "r,g,b" with each component 0..255
static inline bool parse_rgb_csv(const char *s, rgb_u8 *out) {
  if (!s) return false;
  int rr=-1, gg=-1, bb=-1;
  if (sscanf(s, "%d,%d,%d", &rr, &gg, &bb) != 3) return false;
  if (rr<0||rr>255||gg<0||gg>255||bb<0||bb>255) return false;
  out->r=(uint8_t)rr; out->g=(uint8_t)gg; out->b=(uint8_t)bb;
  return true;
}

static inline std::string rgb_to_csv(const rgb_u8 &c) {
  return std::to_string(c.r) + "," + std::to_string(c.g) + "," + std::to_string(c.b);
}

static inline bool rect_empty(const rect_u32 &r) { return r.w == 0 || r.h == 0; }

static inline bool rect_inside(const rect_u32 &r, uint32_t w, uint32_t h) {
  return (uint64_t)r.x + r.w <= w && (uint64_t)r.y + r.h <= h;
}

static inline bool rect_overlaps(const rect_u32 &a, const rect_u32 &b) {
  return a.x < b.x + b.w && b.x < a.x + a.w && a.y < b.y + b.h && b.y < a.y + a.h;
}

// Edge-adjacent rectangles count as touching so the merger can join neighbours.
static inline bool rect_touches(const rect_u32 &a, const rect_u32 &b) {
  return a.x <= b.x + b.w && b.x <= a.x + a.w && a.y <= b.y + b.h && b.y <= a.y + a.h;
}

static inline rect_u32 rect_union(const rect_u32 &a, const rect_u32 &b) {
  uint32_t x0 = a.x < b.x ? a.x : b.x;
  uint32_t y0 = a.y < b.y ? a.y : b.y;
  uint32_t x1 = (a.x + a.w) > (b.x + b.w) ? (a.x + a.w) : (b.x + b.w);
  uint32_t y1 = (a.y + a.h) > (b.y + b.h) ? (a.y + a.h) : (b.y + b.h);
  rect_u32 r; r.x=x0; r.y=y0; r.w=x1-x0; r.h=y1-y0;
  return r;
}

static inline bool rect_equal(const rect_u32 &a, const rect_u32 &b) {
  return a.x==b.x && a.y==b.y && a.w==b.w && a.h==b.h;
}
