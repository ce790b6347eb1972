#pragma once
#include <stdint.h>
#include <memory>
#include <string>
#include <vector>
#include "capability_model.h"
#include "display_types.h"
#include "pixel_pack.h"

// One low-level action of a command sequence. The session executes the steps in order.
struct io_step {
  enum kind_t {
    WRITE = 0,          // bytes as-is
    WRITE_PAYLOAD = 1,  // bitmap data, sliced by max_payload, framed and checksummed per slice
    READ = 2,           // read_len bytes; a short read fails the step only if read_required
    DELAY = 3,
    REOPEN = 4,         // close the port, wait delay_ms, open it again
    DRAIN = 5,          // discard pending input
  } kind = WRITE;
  std::vector<uint8_t> bytes;
  size_t read_len = 0;
  bool read_required = false;
  int read_timeout_ms = 0;          // 0: session default
  uint32_t delay_ms = 0;
};
typedef std::vector<io_step> io_plan;

static inline void plan_write(io_plan &p, std::vector<uint8_t> b) {
  io_step s; s.kind = io_step::WRITE; s.bytes = std::move(b); p.push_back(std::move(s));
}
static inline void plan_payload(io_plan &p, std::vector<uint8_t> b) {
  io_step s; s.kind = io_step::WRITE_PAYLOAD; s.bytes = std::move(b); p.push_back(std::move(s));
}
static inline void plan_read(io_plan &p, size_t n, bool required, int timeout_ms = 0) {
  io_step s; s.kind = io_step::READ; s.read_len = n; s.read_required = required; s.read_timeout_ms = timeout_ms;
  p.push_back(std::move(s));
}
static inline void plan_delay(io_plan &p, uint32_t ms) {
  io_step s; s.kind = io_step::DELAY; s.delay_ms = ms; p.push_back(std::move(s));
}
static inline void plan_reopen(io_plan &p, uint32_t ms) {
  io_step s; s.kind = io_step::REOPEN; s.delay_ms = ms; p.push_back(std::move(s));
}
static inline void plan_drain(io_plan &p) {
  io_step s; s.kind = io_step::DRAIN; p.push_back(std::move(s));
}

// What the handshake learned about the attached panel.
struct device_info {
  std::string variant;
  uint8_t sub_revision = 0;
  uint32_t width = 0, height = 0;   // portrait size reported (or implied) by the device
  bool led = false;
  bool brightness_range = true;     // false: firmware only knows on/off
};

// Per-call view of the session state a codec may read.
struct lcd_ctx {
  const capability_model *cap = nullptr;
  device_info info;
  orientation orient = ORIENT_PORTRAIT;
  uint32_t lw = 0, lh = 0;           // logical canvas size for orient
  int brightness = 25;
};

// Where a canvas region lands on the panel and how its pixels must be turned.
struct region_xform {
  rect_u32 native;
  pixel_rotation rot = ROT_NONE;
};

// Stateless per-revision byte codec. Methods return false for operations the revision lacks.
class LcdCodec {
public:
  virtual ~LcdCodec() {}

  virtual const char *name() const = 0;

  virtual void hello(const lcd_ctx &c, io_plan &plan) const = 0;
  // Validates the bytes read by the last READ step of hello().
  virtual bool parseHello(const std::vector<uint8_t> &resp, const lcd_ctx &c, device_info *info, std::string *why) const = 0;

  virtual void reset(const lcd_ctx &c, io_plan &plan) const = 0;
  virtual bool brightness(const lcd_ctx &c, int level, io_plan &plan) const = 0;
  virtual bool led(const lcd_ctx &c, const rgb_u8 &color, io_plan &plan) const { (void)c; (void)color; (void)plan; return false; }
  virtual bool power(const lcd_ctx &c, bool on, io_plan &plan) const { (void)c; (void)on; (void)plan; return false; }
  virtual bool setOrientation(const lcd_ctx &c, orientation o, io_plan &plan) const = 0;

  virtual region_xform transform(const lcd_ctx &c, const rect_u32 &r) const;
  // payload is already packed in the capability's pixel format and rotated per transform().
  virtual void bitmap(const lcd_ctx &c, const rect_u32 &native, std::vector<uint8_t> payload, io_plan &plan) const = 0;
  // Framing of one max_payload-sized slice of bitmap data (before the checksum trailer).
  virtual void frameChunk(const uint8_t *data, size_t len, std::vector<uint8_t> &out) const;
};

std::unique_ptr<LcdCodec> lcd_codec_for(const capability_model &cap, std::string *err);

std::unique_ptr<LcdCodec> make_codec_rev_a();
std::unique_ptr<LcdCodec> make_codec_rev_b();
std::unique_ptr<LcdCodec> make_codec_rev_c();
std::unique_ptr<LcdCodec> make_codec_rev_d();
std::unique_ptr<LcdCodec> make_codec_rev_e();
std::unique_ptr<LcdCodec> make_codec_weact_b();
std::unique_ptr<LcdCodec> make_codec_simulated();

// Revisions C and E: command bytes plus an optional argument, padded with pad to a multiple of packet bytes.
std::vector<uint8_t> padded_command(const uint8_t *cmd, size_t n, const uint8_t *arg, size_t arg_n, uint8_t pad, size_t packet);
// Zero-fills out to a multiple of packet bytes.
void pad_to_packet(std::vector<uint8_t> &out, size_t packet);

static inline void put_be16(std::vector<uint8_t> &o, uint32_t v) { o.push_back((v>>8)&0xFF); o.push_back(v&0xFF); }
static inline void put_le16(std::vector<uint8_t> &o, uint32_t v) { o.push_back(v&0xFF); o.push_back((v>>8)&0xFF); }
