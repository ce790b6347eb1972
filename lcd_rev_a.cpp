// Turing Smart Screen 3.5" and UsbMonitor 3.5"/5"/7" (revision A).
// Commands are 6 bytes: four 10-bit coordinates packed MSB first, then the opcode.
#include "lcd_codec.h"

namespace {

enum rev_a_cmd : uint8_t {
  A_RESET = 101,
  A_CLEAR = 102,
  A_SCREEN_OFF = 108,
  A_SCREEN_ON = 109,
  A_SET_BRIGHTNESS = 110,
  A_SET_ORIENTATION = 121,
  A_DISPLAY_BITMAP = 197,
  A_HELLO = 69,
};

std::vector<uint8_t> rev_a_command(uint8_t cmd, uint32_t x, uint32_t y, uint32_t ex, uint32_t ey) {
  std::vector<uint8_t> b(6);
  b[0] = (uint8_t)(x >> 2);
  b[1] = (uint8_t)(((x & 3) << 6) + (y >> 4));
  b[2] = (uint8_t)(((y & 15) << 4) + (ex >> 6));
  b[3] = (uint8_t)(((ex & 63) << 2) + (ey >> 8));
  b[4] = (uint8_t)(ey & 255);
  b[5] = cmd;
  return b;
}

class RevACodec : public LcdCodec {
public:
  const char *name() const override { return "rev_a"; }

  void hello(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_drain(plan);
    plan_write(plan, std::vector<uint8_t>(6, A_HELLO));
    plan_read(plan, 6, false);
    plan_drain(plan);
  }

  bool parseHello(const std::vector<uint8_t> &resp, const lcd_ctx &c, device_info *info, std::string *why) const override {
    (void)c;
    // The official Turing 3.5" ignores HELLO; UsbMonitor clones answer with six identical size bytes.
    if (resp.empty()) {
      info->variant = "turing_3_5";
      info->width = 320; info->height = 480;
      return true;
    }
    if (resp.size() == 6) {
      bool same = true;
      for (uint8_t b : resp) if (b != resp[0]) same = false;
      if (same && resp[0] == 0x01) { info->variant = "usbmonitor_3_5"; info->width = 320; info->height = 480; info->sub_revision = 1; return true; }
      if (same && resp[0] == 0x02) { info->variant = "usbmonitor_5";   info->width = 480; info->height = 800; info->sub_revision = 2; return true; }
      if (same && resp[0] == 0x03) { info->variant = "usbmonitor_7";   info->width = 600; info->height = 1024; info->sub_revision = 3; return true; }
    }
    if (why) *why = "unexpected HELLO answer (" + std::to_string(resp.size()) + " bytes)";
    return false;
  }

  void reset(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_write(plan, rev_a_command(A_RESET, 0, 0, 0, 0));
    // The panel drops off the bus while it reboots.
    plan_reopen(plan, 5000);
  }

  bool brightness(const lcd_ctx &c, int level, io_plan &plan) const override {
    (void)c;
    // 0 = brightest, 255 = darkest
    int abs_level = (int)(255.0 - (level / 100.0) * 255.0);
    plan_write(plan, rev_a_command(A_SET_BRIGHTNESS, (uint32_t)abs_level, 0, 0, 0));
    return true;
  }

  bool power(const lcd_ctx &c, bool on, io_plan &plan) const override {
    (void)c;
    plan_write(plan, rev_a_command(on ? A_SCREEN_ON : A_SCREEN_OFF, 0, 0, 0, 0));
    return true;
  }

  bool setOrientation(const lcd_ctx &c, orientation o, io_plan &plan) const override {
    uint32_t w = c.cap->width, h = c.cap->height;
    if (orientation_is_landscape(o)) { w = c.cap->height; h = c.cap->width; }
    std::vector<uint8_t> b = rev_a_command(A_SET_ORIENTATION, 0, 0, 0, 0);
    b.resize(16, 0);
    b[6] = (uint8_t)(o + 100);
    b[7] = (uint8_t)(w >> 8);
    b[8] = (uint8_t)(w & 255);
    b[9] = (uint8_t)(h >> 8);
    b[10] = (uint8_t)(h & 255);
    plan_write(plan, b);
    return true;
  }

  void bitmap(const lcd_ctx &c, const rect_u32 &r, std::vector<uint8_t> payload, io_plan &plan) const override {
    (void)c;
    plan_write(plan, rev_a_command(A_DISPLAY_BITMAP, r.x, r.y, r.x + r.w - 1, r.y + r.h - 1));
    plan_payload(plan, std::move(payload));
  }
};

} // namespace

std::unique_ptr<LcdCodec> make_codec_rev_a() { return std::unique_ptr<LcdCodec>(new RevACodec()); }
