#include "protocol_session.h"
#include "checksum.h"
#include "serial_transport.h"
#include "sim_panel.h"
#include "sys_util.h"

const char *session_state_name(ProtocolSession::State s) {
  switch (s) {
    case ProtocolSession::State::DISCONNECTED:   return "disconnected";
    case ProtocolSession::State::HANDSHAKING:    return "handshaking";
    case ProtocolSession::State::READY:          return "ready";
    case ProtocolSession::State::SENDING:        return "sending";
    case ProtocolSession::State::ERROR_RECOVERY: return "error_recovery";
    default:                                     return "unknown";
  }
}

ProtocolSession::ProtocolSession(const capability_model &cap, std::unique_ptr<LcdCodec> codec,
                                 std::unique_ptr<ByteTransport> transport, const session_opts &opts)
  : cap_(cap), codec_(std::move(codec)), t_(std::move(transport)), opts_(opts) {
  if (opts_.write_attempts < 1) opts_.write_attempts = 1;
  ctx_.cap = &cap_;
  ctx_.orient = ORIENT_PORTRAIT;
  capability_logical_size(cap_, ctx_.orient, &ctx_.lw, &ctx_.lh);
}

ProtocolSession::~ProtocolSession() { close(); }

void ProtocolSession::setState(State s) {
  if (s == state_) return;
  state_ = s;
  if (listener_) listener_(s);
}

void ProtocolSession::pause(uint32_t ms) {
  if (opts_.sleep_fn) opts_.sleep_fn(ms);
  else sleep_ms(ms);
}

ByteTransport::Io ProtocolSession::writeWithRetry(const uint8_t *data, size_t len) {
  ByteTransport::Io r = ByteTransport::Io::ERROR;
  for (int attempt=0; attempt<opts_.write_attempts; attempt++) {
    r = t_->write(data, len, opts_.write_timeout_ms);
    if (r != ByteTransport::Io::TIMEOUT) return r;
    fprintf(stderr, "[session] write of %zu bytes timed out (attempt %d/%d)\n", len, attempt + 1, opts_.write_attempts);
  }
  return r;
}

LcdStatus ProtocolSession::runPlan(const io_plan &plan, int read_timeout_ms, std::string *err) {
  for (const io_step &s : plan) {
    switch (s.kind) {
      case io_step::WRITE: {
        ByteTransport::Io r = writeWithRetry(s.bytes.data(), s.bytes.size());
        if (r != ByteTransport::Io::OK) {
          if (err) *err = (r == ByteTransport::Io::TIMEOUT) ? "write timed out" : "write failed";
          return LcdStatus::TRANSPORT_ERROR;
        }
        break;
      }
      case io_step::WRITE_PAYLOAD: {
        const size_t slice = cap_.max_payload ? cap_.max_payload : s.bytes.size();
        std::vector<uint8_t> framed;
        for (size_t off=0; off<s.bytes.size(); off+=slice) {
          size_t n = s.bytes.size() - off;
          if (n > slice) n = slice;
          framed.clear();
          codec_->frameChunk(s.bytes.data() + off, n, framed);
          checksum_append(cap_.checksum, framed.data(), framed.size(), framed);
          ByteTransport::Io r = writeWithRetry(framed.data(), framed.size());
          if (r != ByteTransport::Io::OK) {
            if (err) *err = std::string("payload ") + ((r == ByteTransport::Io::TIMEOUT) ? "write timed out" : "write failed") +
                            " at offset " + std::to_string(off);
            return LcdStatus::TRANSPORT_ERROR;
          }
        }
        break;
      }
      case io_step::READ: {
        last_read_.assign(s.read_len, 0);
        size_t got = 0;
        int to = s.read_timeout_ms ? s.read_timeout_ms : read_timeout_ms;
        ByteTransport::Io r = t_->read(last_read_.data(), s.read_len, &got, to);
        last_read_.resize(got);
        if (r == ByteTransport::Io::ERROR) {
          if (err) *err = "read failed";
          return LcdStatus::TRANSPORT_ERROR;
        }
        if (s.read_required && got < s.read_len) {
          if (err) *err = "expected " + std::to_string(s.read_len) + " bytes, got " + std::to_string(got);
          return LcdStatus::TRANSPORT_ERROR;
        }
        break;
      }
      case io_step::DELAY:
        pause(s.delay_ms);
        break;
      case io_step::REOPEN: {
        t_->close();
        pause(s.delay_ms);
        std::string e;
        if (!t_->open(&e)) {
          if (err) *err = "reopen failed: " + e;
          return LcdStatus::TRANSPORT_ERROR;
        }
        break;
      }
      case io_step::DRAIN:
        t_->discardInput();
        break;
    }
  }
  return LcdStatus::OK;
}

LcdStatus ProtocolSession::connect(std::string *err) {
  if (state_ != State::DISCONNECTED) close();
  std::string e;
  if (!t_->isOpen() && !t_->open(&e)) {
    if (err) *err = e;
    return LcdStatus::TRANSPORT_ERROR;
  }
  setState(State::HANDSHAKING);

  io_plan hp;
  codec_->hello(ctx_, hp);
  last_read_.clear();
  LcdStatus st = runPlan(hp, opts_.handshake_timeout_ms, &e);

  device_info info;
  std::string why;
  if (st != LcdStatus::OK) {
    why = e;
  } else if (!codec_->parseHello(last_read_, ctx_, &info, &why)) {
    st = LcdStatus::HANDSHAKE_FAILED;
  } else if (cap_.width && (info.width != cap_.width || info.height != cap_.height)) {
    why = "device reports " + std::to_string(info.width) + "x" + std::to_string(info.height) +
          ", revision " + cap_.revision + " is " + std::to_string(cap_.width) + "x" + std::to_string(cap_.height);
    st = LcdStatus::HANDSHAKE_FAILED;
  }
  if (st != LcdStatus::OK) {
    t_->close();
    setState(State::DISCONNECTED);
    if (err) *err = "handshake with " + t_->describe() + " failed: " + why;
    return LcdStatus::HANDSHAKE_FAILED;
  }

  ctx_.info = info;
  if (cap_.led && !info.led) {
    fprintf(stderr, "[session] %s: device variant %s has no backplate LED\n", cap_.revision.c_str(), info.variant.c_str());
  }
  setState(State::READY);
  fprintf(stderr, "[session] connected to %s: revision %s (%s)\n", t_->describe().c_str(), cap_.revision.c_str(), info.variant.c_str());
  return LcdStatus::OK;
}

LcdStatus ProtocolSession::perform(const io_plan &plan, const char *what, std::string *err) {
  if (state_ != State::READY) return LcdStatus::NOT_CONNECTED;
  setState(State::SENDING);
  std::string e;
  LcdStatus st = runPlan(plan, opts_.read_timeout_ms, &e);
  if (st == LcdStatus::OK) {
    setState(State::READY);
    return LcdStatus::OK;
  }
  fprintf(stderr, "[session] %s failed: %s\n", what, e.c_str());
  return recover(what, err);
}

LcdStatus ProtocolSession::recover(const char *what, std::string *err) {
  setState(State::ERROR_RECOVERY);
  io_plan rp;
  codec_->reset(ctx_, rp);
  std::string e;
  if (runPlan(rp, opts_.read_timeout_ms, &e) == LcdStatus::OK) {
    recoveries_++;
    setState(State::READY);
    fprintf(stderr, "[session] device reset after failed %s\n", what);
    if (err) *err = std::string(what) + " not delivered, device was reset";
    return LcdStatus::RECOVERED;
  }
  fprintf(stderr, "[session] reset failed: %s\n", e.c_str());
  t_->close();
  setState(State::DISCONNECTED);
  if (err) *err = std::string(what) + " failed and reset failed: " + e;
  return LcdStatus::CONNECTION_LOST;
}

LcdStatus ProtocolSession::sendFrame(const rect_u32 &region, const uint32_t *px, std::string *err) {
  if (state_ != State::READY) return LcdStatus::NOT_CONNECTED;
  if (rect_empty(region) || !rect_inside(region, ctx_.lw, ctx_.lh)) {
    if (err) *err = "region outside the canvas";
    return LcdStatus::CONFIG_ERROR;
  }
  bool full = region.x == 0 && region.y == 0 && region.w == ctx_.lw && region.h == ctx_.lh;
  if (!full && !cap_.partial_update) {
    if (err) *err = "revision " + cap_.revision + " only accepts full frames";
    return LcdStatus::UNSUPPORTED_OPERATION;
  }
  region_xform x = codec_->transform(ctx_, region);
  std::vector<uint8_t> payload;
  pack_pixels(px, region.w, region.h, x.rot, cap_.pixfmt, payload);
  io_plan plan;
  codec_->bitmap(ctx_, x.native, std::move(payload), plan);
  return perform(plan, full ? "full frame" : "region", err);
}

LcdStatus ProtocolSession::sendFullFrame(const uint32_t *px, std::string *err) {
  rect_u32 r; r.w = ctx_.lw; r.h = ctx_.lh;
  return sendFrame(r, px, err);
}

LcdStatus ProtocolSession::setBrightness(int level, std::string *err) {
  if (level < 0 || level > 100) {
    if (err) *err = "brightness must be 0..100";
    return LcdStatus::CONFIG_ERROR;
  }
  io_plan plan;
  codec_->brightness(ctx_, level, plan);
  LcdStatus st = perform(plan, "brightness", err);
  if (st == LcdStatus::OK) ctx_.brightness = level;
  return st;
}

LcdStatus ProtocolSession::setLed(const rgb_u8 &color, std::string *err) {
  io_plan plan;
  if (!cap_.led || !codec_->led(ctx_, color, plan)) {
    if (err) *err = "no backplate LED on this device";
    return LcdStatus::UNSUPPORTED_OPERATION;
  }
  LcdStatus st = perform(plan, "led", err);
  if (st == LcdStatus::OK) led_ = color;
  return st;
}

LcdStatus ProtocolSession::power(bool on, std::string *err) {
  io_plan plan;
  if (!cap_.power_control || !codec_->power(ctx_, on, plan)) {
    if (err) *err = "no power control on this device";
    return LcdStatus::UNSUPPORTED_OPERATION;
  }
  LcdStatus st = perform(plan, on ? "power on" : "power off", err);
  if (st == LcdStatus::OK) powered_ = on;
  return st;
}

LcdStatus ProtocolSession::setOrientation(orientation o, std::string *err) {
  io_plan plan;
  if (!capability_supports_orientation(cap_, o) || !codec_->setOrientation(ctx_, o, plan)) {
    if (err) *err = std::string("orientation ") + orientation_to_string(o) + " not supported";
    return LcdStatus::UNSUPPORTED_OPERATION;
  }
  LcdStatus st = perform(plan, "orientation", err);
  if (st == LcdStatus::OK) {
    ctx_.orient = o;
    capability_logical_size(cap_, o, &ctx_.lw, &ctx_.lh);
  }
  return st;
}

LcdStatus ProtocolSession::reset(std::string *err) {
  if (state_ != State::READY) return LcdStatus::NOT_CONNECTED;
  setState(State::SENDING);
  io_plan rp;
  codec_->reset(ctx_, rp);
  std::string e;
  if (runPlan(rp, opts_.read_timeout_ms, &e) == LcdStatus::OK) {
    setState(State::READY);
    return LcdStatus::OK;
  }
  t_->close();
  setState(State::DISCONNECTED);
  if (err) *err = "reset failed: " + e;
  return LcdStatus::CONNECTION_LOST;
}

void ProtocolSession::close() {
  if (t_ && t_->isOpen()) t_->close();
  setState(State::DISCONNECTED);
}

std::unique_ptr<ProtocolSession> session_connect(const capability_model &cap, const std::string &port, int baud,
                                                 bool rtscts, const session_opts &opts,
                                                 std::shared_ptr<SimulatedPanel> sim_panel,
                                                 LcdStatus *st, std::string *err) {
  std::unique_ptr<LcdCodec> codec = lcd_codec_for(cap, err);
  if (!codec) {
    *st = LcdStatus::CONFIG_ERROR;
    return nullptr;
  }
  std::unique_ptr<ByteTransport> t;
  if (cap.revision == "SIMU") {
    if (!sim_panel) {
      if (err) *err = "no simulated panel";
      *st = LcdStatus::CONFIG_ERROR;
      return nullptr;
    }
    t.reset(new SimulatedTransport(sim_panel));
  } else {
    t.reset(new SerialTransport(port, baud, rtscts));
  }
  std::unique_ptr<ProtocolSession> s(new ProtocolSession(cap, std::move(codec), std::move(t), opts));
  *st = s->connect(err);
  if (*st != LcdStatus::OK) return nullptr;
  return s;
}
