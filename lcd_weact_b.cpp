// WeAct Studio Display FS 0.96" (80x160). Commands end with 0x0A, coordinates are little-endian.
#include "lcd_codec.h"

namespace {

enum weact_cmd : uint8_t {
  W_SET_ORIENTATION = 0x02,
  W_SET_BRIGHTNESS = 0x03,
  W_FULL = 0x04,
  W_SET_BITMAP = 0x05,
  W_FREE = 0x07,
  W_SYSTEM_VERSION = 0x42,
  W_END = 0x0A,
  W_READ = 0x80,
};

const size_t kVersionLen = 19;
const uint32_t kFadeMs = 1000;

class WeActBCodec : public LcdCodec {
public:
  const char *name() const override { return "weact_b"; }

  void hello(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_drain(plan);
    plan_write(plan, { (uint8_t)(W_SYSTEM_VERSION | W_READ), W_END });
    plan_read(plan, kVersionLen, true);
    plan_drain(plan);
  }

  bool parseHello(const std::vector<uint8_t> &r, const lcd_ctx &c, device_info *info, std::string *why) const override {
    if (r.size() != kVersionLen) {
      if (why) *why = "version answer has " + std::to_string(r.size()) + " bytes, expected 19";
      return false;
    }
    std::string v;
    for (size_t i=1; i<9; i++) if (r[i] >= 0x20 && r[i] < 0x7F) v.push_back((char)r[i]);
    while (!v.empty() && v.back() == ' ') v.pop_back();
    info->variant = v.empty() ? "weact_b" : v;
    info->width = c.cap->width;
    info->height = c.cap->height;
    return true;
  }

  void reset(const lcd_ctx &c, io_plan &plan) const override {
    // Clear to black with the firmware fill.
    std::vector<uint8_t> b;
    b.push_back(W_FULL);
    put_le16(b, 0);
    put_le16(b, 0);
    put_le16(b, c.cap->width - 1);
    put_le16(b, c.cap->height - 1);
    put_le16(b, 0x0000);
    b.push_back(W_END);
    plan_write(plan, b);
  }

  bool brightness(const lcd_ctx &c, int level, io_plan &plan) const override {
    (void)c;
    std::vector<uint8_t> b;
    b.push_back(W_SET_BRIGHTNESS);
    b.push_back((uint8_t)(int)((level / 100.0) * 255.0));
    put_le16(b, kFadeMs);
    b.push_back(W_END);
    plan_write(plan, b);
    return true;
  }

  bool power(const lcd_ctx &c, bool on, io_plan &plan) const override {
    if (on) return brightness(c, c.brightness, plan);
    brightness(c, 0, plan);
    plan_write(plan, { W_FREE, W_END });
    return true;
  }

  bool setOrientation(const lcd_ctx &c, orientation o, io_plan &plan) const override {
    (void)c;
    plan_write(plan, { W_SET_ORIENTATION, (uint8_t)o, W_END });
    return true;
  }

  void bitmap(const lcd_ctx &c, const rect_u32 &r, std::vector<uint8_t> payload, io_plan &plan) const override {
    (void)c;
    std::vector<uint8_t> b;
    b.push_back(W_SET_BITMAP);
    put_le16(b, r.x);
    put_le16(b, r.y);
    put_le16(b, r.x + r.w - 1);
    put_le16(b, r.y + r.h - 1);
    b.push_back(W_END);
    plan_write(plan, b);
    plan_payload(plan, std::move(payload));
  }
};

} // namespace

std::unique_ptr<LcdCodec> make_codec_weact_b() { return std::unique_ptr<LcdCodec>(new WeActBCodec()); }
