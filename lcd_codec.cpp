#include "lcd_codec.h"

region_xform LcdCodec::transform(const lcd_ctx &c, const rect_u32 &r) const {
  (void)c;
  region_xform x;
  x.native = r;
  x.rot = ROT_NONE;
  return x;
}

void LcdCodec::frameChunk(const uint8_t *data, size_t len, std::vector<uint8_t> &out) const {
  out.insert(out.end(), data, data + len);
}

void pad_to_packet(std::vector<uint8_t> &out, size_t packet) {
  size_t rem = out.size() % packet;
  if (rem) out.resize(out.size() + (packet - rem), 0x00);
}

std::vector<uint8_t> padded_command(const uint8_t *cmd, size_t n, const uint8_t *arg, size_t arg_n, uint8_t pad, size_t packet) {
  std::vector<uint8_t> o(cmd, cmd + n);
  if (arg) o.insert(o.end(), arg, arg + arg_n);
  size_t rem = o.size() % packet;
  if (rem) o.resize(o.size() + (packet - rem), pad);
  return o;
}

std::unique_ptr<LcdCodec> lcd_codec_for(const capability_model &cap, std::string *err) {
  const std::string &r = cap.revision;
  if (r == "A" || r == "A_5" || r == "A_7") return make_codec_rev_a();
  if (r == "B" || r == "B_FLAGSHIP") return make_codec_rev_b();
  if (r == "C") return make_codec_rev_c();
  if (r == "D") return make_codec_rev_d();
  if (r == "E") return make_codec_rev_e();
  if (r == "WEACT_B") return make_codec_weact_b();
  if (r == "SIMU") return make_codec_simulated();
  if (err) *err = "no codec for revision '" + r + "'";
  return nullptr;
}
