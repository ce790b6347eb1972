// Turing Smart Screen 8.8" (revision E). Same 0xef 0x69 command family and 250-byte packets as
// revision C; the panel scans 1920x480 landscape and takes BGRA pixels. Full frames only.
#include "lcd_codec.h"
#include <string.h>

namespace {

const size_t kPacket = 250;
const size_t kStatusLen = 1024;
const int kStatusTimeoutMs = 100;
const uint32_t kRestartMs = 15000;

const uint8_t kHello[] = { 0x01, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0xc5, 0xd3 };
const uint8_t kRestart[] = { 0x84, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kOptions[] = { 0x7d, 0xef, 0x69, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0xff };
const uint8_t kTurnOff[] = { 0x83, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kSetBrightness[] = { 0x7b, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00 };
const uint8_t kStopVideo[] = { 0x79, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kStopMedia[] = { 0x96, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kQueryStatus[] = { 0xcf, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kPreUpdateBitmap[] = { 0x86, 0xef, 0x69, 0x00, 0x00, 0x00, 0x01 };
const uint8_t kStartDisplayBitmap = 0x2c;
const uint8_t kDisplayBitmap[] = { 0xc8, 0xef, 0x69 };
const char kRomPrefix[] = "chs_88inch";

std::vector<uint8_t> packet(const uint8_t *b, size_t n, const uint8_t *arg = nullptr, size_t arg_n = 0, uint8_t pad = 0x00) {
  return padded_command(b, n, arg, arg_n, pad, kPacket);
}

// The firmware ignores commands until it has answered a HELLO.
void wake(io_plan &plan) {
  plan_drain(plan);
  plan_write(plan, packet(kHello, sizeof(kHello)));
  plan_read(plan, kStatusLen, false, kStatusTimeoutMs);
}

void stop_media(io_plan &plan) {
  plan_write(plan, packet(kStopMedia, sizeof(kStopMedia)));
  plan_write(plan, packet(kStopVideo, sizeof(kStopVideo)));
  plan_read(plan, kStatusLen, false, kStatusTimeoutMs);
}

class RevECodec : public LcdCodec {
public:
  const char *name() const override { return "rev_e"; }

  void hello(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    plan_drain(plan);
    plan_write(plan, packet(kHello, sizeof(kHello)));
    plan_read(plan, 23, true);
    plan_drain(plan);
  }

  bool parseHello(const std::vector<uint8_t> &r, const lcd_ctx &c, device_info *info, std::string *why) const override {
    if (r.size() != 23 || memcmp(r.data(), kRomPrefix, sizeof(kRomPrefix) - 1) != 0) {
      if (why) *why = "HELLO answer is not a chs_88inch ROM string";
      return false;
    }
    info->variant.assign((const char *)r.data(), strnlen((const char *)r.data(), r.size()));
    info->width = c.cap->width;
    info->height = c.cap->height;
    return true;
  }

  void reset(const lcd_ctx &c, io_plan &plan) const override {
    (void)c;
    wake(plan);
    plan_write(plan, packet(kRestart, sizeof(kRestart)));
    plan_write(plan, packet(kRestart, sizeof(kRestart)));
    // The port may change name while the panel reboots.
    plan_reopen(plan, kRestartMs);
  }

  bool brightness(const lcd_ctx &c, int level, io_plan &plan) const override {
    (void)c;
    uint8_t v = (uint8_t)(int)((level / 100.0) * 255.0);
    plan_write(plan, packet(kSetBrightness, sizeof(kSetBrightness), &v, 1));
    return true;
  }

  bool power(const lcd_ctx &c, bool on, io_plan &plan) const override {
    // There is no screen-on command; stopping media playback brings the panel back, then brightness.
    wake(plan);
    stop_media(plan);
    if (on) brightness(c, c.brightness, plan);
    else plan_write(plan, packet(kTurnOff, sizeof(kTurnOff)));
    return true;
  }

  bool setOrientation(const lcd_ctx &c, orientation o, io_plan &plan) const override {
    (void)c;
    // startmode default, padding, flip, sleep interval off
    const uint8_t opts[4] = { 0x00, 0x00, (uint8_t)(orientation_is_reverse(o) ? 0x01 : 0x00), 0x00 };
    plan_write(plan, packet(kOptions, sizeof(kOptions), opts, sizeof(opts)));
    return true;
  }

  region_xform transform(const lcd_ctx &c, const rect_u32 &r) const override {
    region_xform x;
    switch (c.orient) {
      case ORIENT_PORTRAIT:          x.rot = ROT_CW90;  break;
      case ORIENT_REVERSE_PORTRAIT:  x.rot = ROT_CCW90; break;
      case ORIENT_REVERSE_LANDSCAPE: x.rot = ROT_180;   break;
      case ORIENT_LANDSCAPE:
      default:                       x.rot = ROT_NONE;  break;
    }
    x.native = rotate_rect(r, c.lw, c.lh, x.rot);
    return x;
  }

  void bitmap(const lcd_ctx &c, const rect_u32 &r, std::vector<uint8_t> payload, io_plan &plan) const override {
    stop_media(plan);
    setOrientation(c, c.orient, plan);
    plan_write(plan, packet(kPreUpdateBitmap, sizeof(kPreUpdateBitmap)));
    plan_write(plan, packet(&kStartDisplayBitmap, 1, nullptr, 0, kStartDisplayBitmap));
    brightness(c, c.brightness, plan);
    // Size field is the native width squared, as the firmware expects.
    const uint32_t n = r.w * r.w;
    const uint8_t size[4] = { (uint8_t)(n >> 24), (uint8_t)(n >> 16), (uint8_t)(n >> 8), (uint8_t)n };
    plan_write(plan, packet(kDisplayBitmap, sizeof(kDisplayBitmap), size, sizeof(size)));
    plan_payload(plan, std::move(payload));
    plan_read(plan, kStatusLen, false, kStatusTimeoutMs);
    plan_write(plan, packet(kQueryStatus, sizeof(kQueryStatus)));
    plan_read(plan, kStatusLen, false, kStatusTimeoutMs);
  }

  // 249 data bytes per 250-byte packet, zero filled.
  void frameChunk(const uint8_t *data, size_t len, std::vector<uint8_t> &out) const override {
    out.insert(out.end(), data, data + len);
    pad_to_packet(out, kPacket);
  }
};

} // namespace

std::unique_ptr<LcdCodec> make_codec_rev_e() { return std::unique_ptr<LcdCodec>(new RevECodec()); }
