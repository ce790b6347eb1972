// XuanFang 3.5" (revision B and its flagship with RGB backplate).
// Every command is 10 bytes: opcode, 8 payload bytes, opcode.
#include "lcd_codec.h"

namespace {

enum rev_b_cmd : uint8_t {
  B_HELLO = 0xCA,
  B_SET_ORIENTATION = 0xCB,
  B_DISPLAY_BITMAP = 0xCC,
  B_SET_LIGHTING = 0xCD,
  B_SET_BRIGHTNESS = 0xCE,
};

const uint8_t kHelloText[5] = { 'H', 'E', 'L', 'L', 'O' };

std::vector<uint8_t> rev_b_command(uint8_t cmd, std::initializer_list<uint8_t> payload) {
  std::vector<uint8_t> b(10, 0);
  b[0] = cmd;
  size_t i = 1;
  for (uint8_t v : payload) { if (i > 8) break; b[i++] = v; }
  b[9] = cmd;
  return b;
}

class RevBCodec : public LcdCodec {
public:
  const char *name() const override { return "rev_b"; }

  void hello(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_drain(plan);
    plan_write(plan, rev_b_command(B_HELLO, { kHelloText[0], kHelloText[1], kHelloText[2], kHelloText[3], kHelloText[4] }));
    plan_read(plan, 10, true);
    plan_drain(plan);
  }

  bool parseHello(const std::vector<uint8_t> &r, const lcd_ctx &c, device_info *info, std::string *why) const override {
    if (r.size() != 10) {
      if (why) *why = "HELLO answer has " + std::to_string(r.size()) + " bytes, expected 10";
      return false;
    }
    if (r[0] != B_HELLO || r[9] != B_HELLO) {
      if (why) *why = "HELLO answer not framed by 0xCA";
      return false;
    }
    for (int i=0;i<5;i++) {
      if (r[1 + i] != kHelloText[i]) {
        if (why) *why = "HELLO answer does not echo HELLO";
        return false;
      }
    }
    if (r[6] != 0x0A) {
      if (why) *why = "HELLO answer has unknown marker byte";
      return false;
    }
    info->sub_revision = r[7];
    info->width = c.cap->width;
    info->height = c.cap->height;
    switch (r[7]) {
      case 0x01: info->variant = "A01"; info->led = false; info->brightness_range = false; break;
      case 0x02: info->variant = "A02"; info->led = true;  info->brightness_range = false; break;
      case 0x11: info->variant = "A11"; info->led = false; info->brightness_range = true;  break;
      case 0x12: info->variant = "A12"; info->led = true;  info->brightness_range = true;  break;
      default:
        if (why) *why = "unknown sub-revision";
        return false;
    }
    return true;
  }

  void reset(const lcd_ctx &c, io_plan &plan) const override {
    // No reset opcode: the firmware is brought back to a known state by painting it white.
    rect_u32 full; full.w = c.lw; full.h = c.lh;
    std::vector<uint8_t> px;
    pack_solid(pack_xrgb8888(255, 255, 255), c.lw * c.lh, PIXFMT_RGB565_BE, px);
    bitmap(c, full, std::move(px), plan);
  }

  bool brightness(const lcd_ctx &c, int level, io_plan &plan) const override {
    uint8_t v;
    if (c.info.brightness_range) v = (uint8_t)(int)((level / 100.0) * 255.0);
    else v = (level == 0) ? 1 : 0;   // on/off firmware: 1 = backlight off
    plan_write(plan, rev_b_command(B_SET_BRIGHTNESS, { v }));
    return true;
  }

  bool led(const lcd_ctx &c, const rgb_u8 &color, io_plan &plan) const override {
    if (!c.info.led) return false;
    plan_write(plan, rev_b_command(B_SET_LIGHTING, { color.r, color.g, color.b }));
    return true;
  }

  bool setOrientation(const lcd_ctx &c, orientation o, io_plan &plan) const override {
    (void)c;
    // Portrait = 0, landscape = 1. Reverse variants are rendered rotated by transform().
    plan_write(plan, rev_b_command(B_SET_ORIENTATION, { (uint8_t)(orientation_is_landscape(o) ? 1 : 0) }));
    return true;
  }

  region_xform transform(const lcd_ctx &c, const rect_u32 &r) const override {
    region_xform x;
    if (orientation_is_reverse(c.orient)) {
      x.rot = ROT_180;
      x.native = rotate_rect(r, c.lw, c.lh, ROT_180);
    } else {
      x.rot = ROT_NONE;
      x.native = r;
    }
    return x;
  }

  void bitmap(const lcd_ctx &c, const rect_u32 &r, std::vector<uint8_t> payload, io_plan &plan) const override {
    (void)c;
    uint32_t x1 = r.x + r.w - 1, y1 = r.y + r.h - 1;
    plan_write(plan, rev_b_command(B_DISPLAY_BITMAP, {
      (uint8_t)(r.x >> 8), (uint8_t)(r.x & 255), (uint8_t)(r.y >> 8), (uint8_t)(r.y & 255),
      (uint8_t)(x1 >> 8), (uint8_t)(x1 & 255), (uint8_t)(y1 >> 8), (uint8_t)(y1 & 255) }));
    plan_payload(plan, std::move(payload));
    // The controller needs a pause after each bitmap before it accepts the next command.
    plan_delay(plan, 50);
  }
};

} // namespace

std::unique_ptr<LcdCodec> make_codec_rev_b() { return std::unique_ptr<LcdCodec>(new RevBCodec()); }
