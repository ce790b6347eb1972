// Turing Smart Screen 5" (revision C). Every write is padded to a multiple of 250 bytes.
// Only full frames are accepted; the panel scans in landscape and takes BGRA pixels.
#include "lcd_codec.h"
#include <string.h>

namespace {

const size_t kPacket = 250;
const size_t kStatusLen = 1024;
const int kStatusTimeoutMs = 100;

const uint8_t kHello[] = { 0x01, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0xc5, 0xd3 };
const uint8_t kOptions[] = { 0x7d, 0xef, 0x69, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0x2d };
const uint8_t kTurnOff[] = { 0x83, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kTurnOn[] = { 0x83, 0xef, 0x69, 0x00, 0x00, 0x00, 0x00 };
const uint8_t kSetBrightness[] = { 0x7b, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00 };
const uint8_t kQueryStatus[] = { 0xcf, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kPreUpdateBitmap[] = { 0x86, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kStartDisplayBitmap = 0x2c;
const uint8_t kDisplayBitmap[] = { 0xc8, 0xef, 0x69, 0x00, 0x17, 0x70 };
const char kRomPrefix[] = "chs_5inch";

std::vector<uint8_t> padded(const uint8_t *b, size_t n, const uint8_t *extra, size_t extra_n, uint8_t pad) {
  return padded_command(b, n, extra, extra_n, pad, kPacket);
}

class RevCCodec : public LcdCodec {
public:
  const char *name() const override { return "rev_c"; }

  void hello(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_drain(plan);
    plan_write(plan, padded(kHello, sizeof(kHello), nullptr, 0, 0x00));
    plan_read(plan, 23, true);
    plan_drain(plan);
  }

  bool parseHello(const std::vector<uint8_t> &r, const lcd_ctx &c, device_info *info, std::string *why) const override {
    if (r.size() != 23 || memcmp(r.data(), kRomPrefix, sizeof(kRomPrefix) - 1) != 0) {
      if (why) *why = "HELLO answer is not a chs_5inch ROM string";
      return false;
    }
    info->variant.assign((const char *)r.data(), strnlen((const char *)r.data(), r.size()));
    info->width = c.cap->width;
    info->height = c.cap->height;
    return true;
  }

  void reset(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    // The firmware reset reboots the USB device; a status query is enough to resynchronise.
    plan_drain(plan);
    plan_write(plan, padded(kQueryStatus, sizeof(kQueryStatus), nullptr, 0, 0x00));
    plan_read(plan, kStatusLen, false, kStatusTimeoutMs);
  }

  bool brightness(const lcd_ctx &c, int level, io_plan &plan) const override {
    (void)c;
    uint8_t v = (uint8_t)(int)((level / 100.0) * 255.0);
    plan_write(plan, padded(kSetBrightness, sizeof(kSetBrightness), &v, 1, 0x00));
    return true;
  }

  bool power(const lcd_ctx &c, bool on, io_plan &plan) const override {
    (void)c;
    if (on) plan_write(plan, padded(kTurnOn, sizeof(kTurnOn), nullptr, 0, 0x00));
    else plan_write(plan, padded(kTurnOff, sizeof(kTurnOff), nullptr, 0, 0x00));
    return true;
  }

  bool setOrientation(const lcd_ctx &c, orientation o, io_plan &plan) const override {
    (void)c;
    // startmode default, padding, flip, sleep interval off
    const uint8_t opts[4] = { 0x00, 0x00, (uint8_t)(orientation_is_reverse(o) ? 0x01 : 0x00), 0x00 };
    plan_write(plan, padded(kOptions, sizeof(kOptions), opts, sizeof(opts), 0x00));
    return true;
  }

  region_xform transform(const lcd_ctx &c, const rect_u32 &r) const override {
    region_xform x;
    switch (c.orient) {
      case ORIENT_PORTRAIT:          x.rot = ROT_CCW90; break;
      case ORIENT_REVERSE_PORTRAIT:  x.rot = ROT_CW90;  break;
      case ORIENT_REVERSE_LANDSCAPE: x.rot = ROT_180;   break;
      case ORIENT_LANDSCAPE:
      default:                       x.rot = ROT_NONE;  break;
    }
    x.native = rotate_rect(r, c.lw, c.lh, x.rot);
    return x;
  }

  void bitmap(const lcd_ctx &c, const rect_u32 &r, std::vector<uint8_t> payload, io_plan &plan) const override {
    (void)c; (void)r;
    plan_write(plan, padded(kPreUpdateBitmap, sizeof(kPreUpdateBitmap), nullptr, 0, 0x00));
    plan_write(plan, padded(&kStartDisplayBitmap, 1, nullptr, 0, kStartDisplayBitmap));
    plan_write(plan, padded(kDisplayBitmap, sizeof(kDisplayBitmap), nullptr, 0, 0x00));
    plan_payload(plan, std::move(payload));
    plan_read(plan, kStatusLen, false, kStatusTimeoutMs);
    plan_write(plan, padded(kQueryStatus, sizeof(kQueryStatus), nullptr, 0, 0x00));
    plan_read(plan, kStatusLen, false, kStatusTimeoutMs);
  }

  // 249 data bytes per 250-byte packet, zero filled.
  void frameChunk(const uint8_t *data, size_t len, std::vector<uint8_t> &out) const override {
    out.insert(out.end(), data, data + len);
    pad_to_packet(out, kPacket);
  }
};

} // namespace

std::unique_ptr<LcdCodec> make_codec_rev_c() { return std::unique_ptr<LcdCodec>(new RevCCodec()); }
