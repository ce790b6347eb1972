// Codec for the in-process simulated panel (see sim_panel.h for the receiving side).
#include "lcd_codec.h"
#include "sim_panel.h"

namespace {

class SimulatedCodec : public LcdCodec {
public:
  const char *name() const override { return "simulated"; }

  void hello(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_drain(plan);
    plan_write(plan, { SIM_HELLO, 'S', 'I', 'M', 'U' });
    plan_read(plan, 8, true);
  }

  bool parseHello(const std::vector<uint8_t> &r, const lcd_ctx &c, device_info *info, std::string *why) const override {
    (void)c;
    if (r.size() != 8 || r[0] != 'S' || r[1] != 'I' || r[2] != 'M' || r[3] != 'U') {
      if (why) *why = "simulated panel did not identify itself";
      return false;
    }
    info->variant = "simulated";
    info->width = ((uint32_t)r[4] << 8) | r[5];
    info->height = ((uint32_t)r[6] << 8) | r[7];
    info->led = true;
    return true;
  }

  void reset(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_reopen(plan, 0);
    plan_write(plan, { SIM_RESET });
  }

  bool brightness(const lcd_ctx &c, int level, io_plan &plan) const override {
    (void)c;
    plan_write(plan, { SIM_BRIGHTNESS, (uint8_t)level });
    return true;
  }

  bool led(const lcd_ctx &c, const rgb_u8 &color, io_plan &plan) const override {
    (void)c;
    plan_write(plan, { SIM_LED, color.r, color.g, color.b });
    return true;
  }

  bool power(const lcd_ctx &c, bool on, io_plan &plan) const override {
    (void)c;
    plan_write(plan, { SIM_POWER, (uint8_t)(on ? 1 : 0) });
    return true;
  }

  bool setOrientation(const lcd_ctx &c, orientation o, io_plan &plan) const override {
    std::vector<uint8_t> b;
    b.push_back(SIM_ORIENTATION);
    b.push_back((uint8_t)o);
    uint32_t w = c.cap->width, h = c.cap->height;
    if (orientation_is_landscape(o)) { w = c.cap->height; h = c.cap->width; }
    put_be16(b, w);
    put_be16(b, h);
    plan_write(plan, b);
    return true;
  }

  void bitmap(const lcd_ctx &c, const rect_u32 &r, std::vector<uint8_t> payload, io_plan &plan) const override {
    std::vector<uint8_t> b;
    if (r.x == 0 && r.y == 0 && r.w == c.lw && r.h == c.lh) {
      b.push_back(SIM_FULL);
    } else {
      b.push_back(SIM_REGION);
      put_be16(b, r.x);
      put_be16(b, r.y);
      put_be16(b, r.w);
      put_be16(b, r.h);
    }
    plan_write(plan, b);
    plan_payload(plan, std::move(payload));
  }
};

} // namespace

std::unique_ptr<LcdCodec> make_codec_simulated() { return std::unique_ptr<LcdCodec>(new SimulatedCodec()); }
