// Kipye Qiye 3.5" (revision D). The panel only scans in portrait; landscape is rotated on the host.
// The firmware never answers identification, and its acknowledgements are discarded.
#include "lcd_codec.h"

namespace {

const uint8_t kSetOrg[] = { 67, 72, 0, 0 };
const uint8_t kSet180[] = { 67, 71, 0, 0 };
const uint8_t kSetBacklight[] = { 67, 67 };
const uint8_t kDispColor[] = { 67, 66 };
const uint8_t kBlockWrite[] = { 67, 65 };
const uint8_t kIntoPicMode[] = { 68, 0, 0, 0 };
const uint8_t kOutPicMode[] = { 65, 0, 0, 0 };
const uint8_t kDataPrefix = 0x50;

template <size_t N>
std::vector<uint8_t> cmd(const uint8_t (&b)[N]) { return std::vector<uint8_t>(b, b + N); }

class RevDCodec : public LcdCodec {
public:
  const char *name() const override { return "rev_d"; }

  void hello(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_drain(plan);
  }

  bool parseHello(const std::vector<uint8_t> &resp, const lcd_ctx &c, device_info *info, std::string *why) const override {
    (void)resp; (void)why;
    info->variant = "kipye_3_5";
    info->width = c.cap->width;
    info->height = c.cap->height;
    return true;
  }

  void reset(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    // No reset opcode: fill the panel white.
    std::vector<uint8_t> b = cmd(kDispColor);
    put_be16(b, 0xFFFF);
    plan_write(plan, b);
    plan_drain(plan);
  }

  bool brightness(const lcd_ctx &c, int level, io_plan &plan) const override {
    (void)c;
    std::vector<uint8_t> b = cmd(kSetBacklight);
    put_be16(b, (uint32_t)(level * 5));   // 0..500
    // The firmware sometimes ignores the first one.
    plan_write(plan, b);
    plan_drain(plan);
    plan_write(plan, b);
    plan_drain(plan);
    return true;
  }

  bool setOrientation(const lcd_ctx &c, orientation o, io_plan &plan) const override {
    (void)c;
    plan_write(plan, orientation_is_reverse(o) ? cmd(kSet180) : cmd(kSetOrg));
    plan_drain(plan);
    return true;
  }

  region_xform transform(const lcd_ctx &c, const rect_u32 &r) const override {
    region_xform x;
    x.rot = orientation_is_landscape(c.orient) ? ROT_CW90 : ROT_NONE;
    x.native = rotate_rect(r, c.lw, c.lh, x.rot);
    return x;
  }

  void bitmap(const lcd_ctx &c, const rect_u32 &r, std::vector<uint8_t> payload, io_plan &plan) const override {
    (void)c;
    std::vector<uint8_t> b = cmd(kBlockWrite);
    put_be16(b, r.x);
    put_be16(b, r.x + r.w - 1);
    put_be16(b, r.y);
    put_be16(b, r.y + r.h - 1);
    plan_write(plan, b);
    plan_drain(plan);
    plan_write(plan, cmd(kIntoPicMode));
    plan_drain(plan);
    plan_payload(plan, std::move(payload));
    plan_drain(plan);
    plan_write(plan, cmd(kOutPicMode));
    plan_drain(plan);
  }

  void frameChunk(const uint8_t *data, size_t len, std::vector<uint8_t> &out) const override {
    out.push_back(kDataPrefix);
    out.insert(out.end(), data, data + len);
  }
};

} // namespace

std::unique_ptr<LcdCodec> make_codec_rev_d() { return std::unique_ptr<LcdCodec>(new RevDCodec()); }
