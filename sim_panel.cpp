#include "sim_panel.h"
#include "checksum.h"
#include <algorithm>

static inline uint32_t be16_at(const std::vector<uint8_t> &b, size_t i) {
  return ((uint32_t)b[i] << 8) | b[i + 1];
}

SimulatedPanel::SimulatedPanel(uint32_t width, uint32_t height, uint32_t max_payload, checksum_kind checksum)
  : W(width), H(height), lw(width), lh(height), max_payload_(max_payload ? max_payload : 4096), checksum_(checksum) {
  screen.assign((size_t)lw * lh, 0xFF000000u);
}

void SimulatedPanel::feed(const uint8_t *data, size_t len) {
  std::lock_guard<std::mutex> lk(mtx);
  in.insert(in.end(), data, data + len);
  parseLocked();
}

void SimulatedPanel::parseLocked() {
  size_t pos = 0;
  for (;;) {
    size_t avail = in.size() - pos;
    if (avail == 0) break;

    if (in_payload) {
      size_t n = std::min((size_t)max_payload_, remaining);
      size_t need = n + checksum_size(checksum_);
      if (avail < need) break;
      if (!checksum_verify(checksum_, in.data() + pos, need)) {
        st.checksum_errors++;
        payload_bad = true;
      }
      staging.insert(staging.end(), in.begin() + pos, in.begin() + pos + n);
      pos += need;
      remaining -= n;
      if (remaining == 0) {
        in_payload = false;
        applyFrameLocked();
      }
      continue;
    }

    uint8_t op = in[pos];
    size_t need = 1;
    switch (op) {
      case SIM_HELLO:       need = 5; break;
      case SIM_ORIENTATION: need = 6; break;
      case SIM_BRIGHTNESS:  need = 2; break;
      case SIM_LED:         need = 4; break;
      case SIM_POWER:       need = 2; break;
      case SIM_RESET:       need = 1; break;
      case SIM_REGION:      need = 9; break;
      case SIM_FULL:        need = 1; break;
      default:
        st.protocol_errors++;
        pos++;
        continue;
    }
    if (avail < need) break;
    std::vector<uint8_t> c(in.begin() + pos, in.begin() + pos + need);
    pos += need;

    switch (op) {
      case SIM_HELLO: {
        st.hellos++;
        log.push_back("hello");
        if (!mute_) {
          const uint8_t r[8] = { 'S', 'I', 'M', 'U', (uint8_t)(W >> 8), (uint8_t)W, (uint8_t)(H >> 8), (uint8_t)H };
          reply.insert(reply.end(), r, r + 8);
        }
        break;
      }
      case SIM_ORIENTATION:
        st.orient = (orientation)(c[1] & 3);
        lw = be16_at(c, 2);
        lh = be16_at(c, 4);
        screen.assign((size_t)lw * lh, 0xFF000000u);
        log.push_back("orientation:" + std::to_string(c[1]));
        break;
      case SIM_BRIGHTNESS:
        st.brightness = c[1];
        log.push_back("brightness:" + std::to_string(c[1]));
        break;
      case SIM_LED:
        st.led.r = c[1]; st.led.g = c[2]; st.led.b = c[3];
        log.push_back("led:" + rgb_to_csv(st.led));
        break;
      case SIM_POWER:
        st.power = c[1] != 0;
        log.push_back(std::string("power:") + (st.power ? "1" : "0"));
        break;
      case SIM_RESET:
        st.resets++;
        std::fill(screen.begin(), screen.end(), 0xFF000000u);
        log.push_back("reset");
        break;
      case SIM_REGION:
      case SIM_FULL:
        if (op == SIM_FULL) {
          target.x = 0; target.y = 0; target.w = lw; target.h = lh;
        } else {
          target.x = be16_at(c, 1); target.y = be16_at(c, 3);
          target.w = be16_at(c, 5); target.h = be16_at(c, 7);
        }
        payload_full = (op == SIM_FULL);
        payload_bad = false;
        staging.clear();
        remaining = (size_t)target.w * target.h * 4;
        in_payload = remaining > 0;
        if (!in_payload) applyFrameLocked();
        break;
      default:
        break;
    }
  }
  in.erase(in.begin(), in.begin() + pos);
}

void SimulatedPanel::applyFrameLocked() {
  if (payload_full) st.full_frames++;
  else st.region_frames++;
  if (payload_full) {
    log.push_back("full");
  } else {
    log.push_back("region:" + std::to_string(target.x) + "," + std::to_string(target.y) + "," +
                  std::to_string(target.w) + "," + std::to_string(target.h));
  }
  if (payload_bad || !rect_inside(target, lw, lh)) {
    if (!payload_bad) st.protocol_errors++;
    return;
  }
  const uint8_t *s = staging.data();
  for (uint32_t y=0; y<target.h; y++) {
    uint32_t *d = screen.data() + (size_t)(target.y + y) * lw + target.x;
    for (uint32_t x=0; x<target.w; x++) {
      d[x] = pack_xrgb8888(s[2], s[1], s[0]);
      s += 4;
    }
  }
}

void SimulatedPanel::linkReset() {
  std::lock_guard<std::mutex> lk(mtx);
  in.clear();
  reply.clear();
  in_payload = false;
  staging.clear();
}

size_t SimulatedPanel::takeReply(uint8_t *out, size_t len) {
  std::lock_guard<std::mutex> lk(mtx);
  size_t n = std::min(len, reply.size());
  std::copy(reply.begin(), reply.begin() + n, out);
  reply.erase(reply.begin(), reply.begin() + n);
  return n;
}

sim_panel_stats SimulatedPanel::stats() const {
  std::lock_guard<std::mutex> lk(mtx);
  return st;
}

std::vector<std::string> SimulatedPanel::events() const {
  std::lock_guard<std::mutex> lk(mtx);
  return log;
}

void SimulatedPanel::clearEvents() {
  std::lock_guard<std::mutex> lk(mtx);
  log.clear();
}

void SimulatedPanel::mirror(std::vector<uint32_t> &px, uint32_t *w, uint32_t *h) const {
  std::lock_guard<std::mutex> lk(mtx);
  px = screen;
  *w = lw; *h = lh;
}

void SimulatedPanel::setUnplugged(bool v) {
  std::lock_guard<std::mutex> lk(mtx);
  unplugged_ = v;
}

bool SimulatedPanel::unplugged() const {
  std::lock_guard<std::mutex> lk(mtx);
  return unplugged_;
}

void SimulatedPanel::timeoutNextWrites(int n) {
  std::lock_guard<std::mutex> lk(mtx);
  pending_timeouts = n;
}

bool SimulatedPanel::consumeTimeout() {
  std::lock_guard<std::mutex> lk(mtx);
  if (pending_timeouts <= 0) return false;
  pending_timeouts--;
  return true;
}

void SimulatedPanel::setMute(bool v) {
  std::lock_guard<std::mutex> lk(mtx);
  mute_ = v;
}

void SimulatedPanel::setHelloOnly(bool v) {
  std::lock_guard<std::mutex> lk(mtx);
  hello_only_ = v;
}

bool SimulatedPanel::acceptsWrite(const uint8_t *data, size_t len) const {
  std::lock_guard<std::mutex> lk(mtx);
  return !hello_only_ || (len > 0 && data[0] == SIM_HELLO);
}

// ---------------- transport ----------------

SimulatedTransport::SimulatedTransport(std::shared_ptr<SimulatedPanel> panel) : panel_(std::move(panel)) {}

bool SimulatedTransport::open(std::string *err) {
  if (panel_->unplugged()) {
    if (err) *err = "simulated panel unplugged";
    return false;
  }
  panel_->linkReset();
  open_ = true;
  return true;
}

ByteTransport::Io SimulatedTransport::write(const uint8_t *data, size_t len, int timeout_ms) {
  (void)timeout_ms;
  if (!open_ || panel_->unplugged()) return Io::ERROR;
  if (panel_->consumeTimeout() || !panel_->acceptsWrite(data, len)) return Io::TIMEOUT;
  panel_->feed(data, len);
  return Io::OK;
}

ByteTransport::Io SimulatedTransport::read(uint8_t *data, size_t len, size_t *got, int timeout_ms) {
  (void)timeout_ms;
  *got = 0;
  if (!open_ || panel_->unplugged()) return Io::ERROR;
  *got = panel_->takeReply(data, len);
  return *got == len ? Io::OK : Io::TIMEOUT;
}

void SimulatedTransport::discardInput() {
  uint8_t tmp[256];
  while (panel_->takeReply(tmp, sizeof(tmp)) > 0) {}
}
