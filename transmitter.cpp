#include "transmitter.h"
#include "sim_panel.h"
#include "sys_util.h"

#include <algorithm>
#include <chrono>

std::vector<rect_u32> merge_rects(const std::vector<rect_u32> &rects) {
  std::vector<rect_u32> out;
  for (const rect_u32 &r : rects) {
    if (!rect_empty(r)) out.push_back(r);
  }
  bool changed = true;
  while (changed) {
    changed = false;
    for (size_t i=0; i<out.size() && !changed; i++) {
      for (size_t j=i+1; j<out.size(); j++) {
        if (!rect_touches(out[i], out[j])) continue;
        out[i] = rect_union(out[i], out[j]);
        out.erase(out.begin() + j);
        changed = true;
        break;
      }
    }
  }
  return out;
}

flush_batch build_flush_batch(const canvas &c, const std::vector<rect_u32> &dirty, bool full, bool merge) {
  flush_batch b;
  b.full = full;
  std::vector<rect_u32> rects;
  if (full) rects.push_back(c.bounds());
  else if (merge) rects = merge_rects(dirty);
  else rects = dirty;
  for (const rect_u32 &r : rects) {
    if (rect_empty(r) || !rect_inside(r, c.w, c.h)) continue;
    flush_region fr;
    fr.r = r;
    c.copyOut(r, fr.px);
    b.regions.push_back(std::move(fr));
  }
  return b;
}

// ---------------- Transmitter ----------------

Transmitter::Transmitter(const transmitter_cfg &cfg) : cfg_(cfg) {}

Transmitter::~Transmitter() { stop(); }

void Transmitter::start(const device_settings &s) {
  if (th_.joinable()) return;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    settings_ = s;
    stop_ = false;
  }
  th_ = std::thread([this]() { run(); });
}

void Transmitter::stop() {
  if (!th_.joinable()) return;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  th_.join();
}

bool Transmitter::submit(flush_batch b) {
  std::function<void(uint64_t)> fn;
  uint64_t g = 0;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected_ || b.generation != gen_ || (need_full_ && !b.full) || b.regions.empty()) {
      stats_.dropped_batches++;
      return false;
    }
    size_t queued = 0;
    for (const tx_job &j : queue_) if (j.kind == JOB_BATCH) queued++;
    if (queued < cfg_.max_queue || b.full) {
      if (b.full) need_full_ = false;
      tx_job j;
      j.kind = JOB_BATCH;
      j.batch = std::move(b);
      queue_.push_back(std::move(j));
      cv_.notify_all();
      return true;
    }
    // The device cannot keep up: drop the backlog and resync with one full frame.
    stats_.dropped_batches += queued + 1;
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(), [](const tx_job &j) { return j.kind == JOB_BATCH; }), queue_.end());
    gen_++;
    need_full_ = true;
    fn = resync_listener_;
    g = gen_;
  }
  fprintf(stderr, "[transmitter] backlog dropped, resyncing\n");
  if (fn) fn(g);
  return false;
}

uint64_t Transmitter::generation() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return gen_;
}

bool Transmitter::connected() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return connected_;
}

void Transmitter::enqueueSetting(job_kind k) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!connected_) return;              // applied on connect
  tx_job j;
  j.kind = k;
  queue_.push_back(std::move(j));
  cv_.notify_all();
}

void Transmitter::setBrightness(int level) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    settings_.brightness = level;
  }
  enqueueSetting(JOB_BRIGHTNESS);
}

void Transmitter::setLed(const rgb_u8 &c) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    settings_.led = c;
    settings_.led_set = true;
  }
  enqueueSetting(JOB_LED);
}

void Transmitter::setPower(bool on) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    settings_.power_on = on;
  }
  enqueueSetting(JOB_POWER);
}

void Transmitter::setOrientation(orientation o) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    settings_.orient = o;
  }
  enqueueSetting(JOB_ORIENTATION);
  bumpGeneration();
}

device_settings Transmitter::settings() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return settings_;
}

transmitter_stats Transmitter::stats() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stats_;
}

std::string Transmitter::lastError() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return last_error_;
}

std::string Transmitter::deviceVariant() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return variant_;
}

void Transmitter::setResyncListener(std::function<void(uint64_t)> fn) {
  std::lock_guard<std::mutex> lk(mtx_);
  resync_listener_ = std::move(fn);
}

bool Transmitter::waitIdle(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lk(mtx_);
  return idle_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return queue_.empty() && !busy_; });
}

bool Transmitter::waitConnected(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lk(mtx_);
  return idle_cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return connected_; });
}

void Transmitter::bumpGeneration() {
  std::function<void(uint64_t)> fn;
  uint64_t g = 0;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    gen_++;
    need_full_ = true;
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(), [](const tx_job &j) { return j.kind == JOB_BATCH; }), queue_.end());
    fn = resync_listener_;
    g = gen_;
  }
  idle_cv_.notify_all();
  if (fn) fn(g);
}

LcdStatus Transmitter::applyOne(job_kind k, const device_settings &s) {
  std::string err;
  LcdStatus st = LcdStatus::OK;
  switch (k) {
    case JOB_ORIENTATION:
      st = session_->setOrientation(s.orient, &err);
      break;
    case JOB_BRIGHTNESS:
      // Without power control, "off" is brightness 0 and brightness changes wait for "on".
      if (!cfg_.cap.power_control && !s.power_on) return LcdStatus::OK;
      st = session_->setBrightness(s.brightness, &err);
      break;
    case JOB_LED:
      if (!s.led_set) return LcdStatus::OK;
      st = session_->setLed(s.led, &err);
      break;
    case JOB_POWER:
      if (cfg_.cap.power_control) st = session_->power(s.power_on, &err);
      else st = session_->setBrightness(s.power_on ? s.brightness : 0, &err);
      break;
    default:
      return LcdStatus::OK;
  }
  if (st == LcdStatus::UNSUPPORTED_OPERATION) {
    fprintf(stderr, "[transmitter] %s\n", err.c_str());
    return LcdStatus::OK;
  }
  if (st != LcdStatus::OK) {
    std::lock_guard<std::mutex> lk(mtx_);
    last_error_ = err;
  }
  return st;
}

LcdStatus Transmitter::applyAll() {
  device_settings s = settings();
  const job_kind order[] = { JOB_ORIENTATION, JOB_BRIGHTNESS, JOB_LED, JOB_POWER };
  for (job_kind k : order) {
    if (k == JOB_ORIENTATION && !capability_supports_orientation(cfg_.cap, s.orient)) continue;
    LcdStatus st = applyOne(k, s);
    if (st != LcdStatus::OK) return st;
  }
  return LcdStatus::OK;
}

void Transmitter::connectionLost(const std::string &why) {
  if (session_) session_->close();
  session_.reset();
  bool report = false;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    // Once per transition: a panel that keeps failing right after the handshake stays silent.
    report = connected_ || !reported_down_;
    connected_ = false;
    if (report) stats_.connection_losses++;
    last_error_ = why;
    queue_.clear();
  }
  idle_cv_.notify_all();
  if (report) fprintf(stderr, "[transmitter] connection lost: %s\n", why.c_str());
  reported_down_ = true;
  next_attempt_ms_ = monotonic_ms() + cfg_.reconnect_ms;
}

void Transmitter::handle(LcdStatus st, const std::string &err, const char *what) {
  switch (st) {
    case LcdStatus::OK:
      return;
    case LcdStatus::RECOVERED: {
      {
        std::lock_guard<std::mutex> lk(mtx_);
        stats_.recoveries++;
        last_error_ = err;
      }
      fprintf(stderr, "[transmitter] %s: %s\n", what, err.c_str());
      // A reset may have reverted device settings.
      LcdStatus again = applyAll();
      if (again == LcdStatus::CONNECTION_LOST || again == LcdStatus::NOT_CONNECTED || again == LcdStatus::TRANSPORT_ERROR) {
        connectionLost(lastError());
        return;
      }
      bumpGeneration();
      return;
    }
    case LcdStatus::CONNECTION_LOST:
    case LcdStatus::NOT_CONNECTED:
    case LcdStatus::TRANSPORT_ERROR:
    case LcdStatus::HANDSHAKE_FAILED:
      connectionLost(err.empty() ? lcd_status_name(st) : err);
      return;
    default:
      {
        std::lock_guard<std::mutex> lk(mtx_);
        last_error_ = err;
      }
      fprintf(stderr, "[transmitter] %s: %s (%s)\n", what, err.c_str(), lcd_status_name(st));
      return;
  }
}

void Transmitter::tryConnect() {
  LcdStatus st = LcdStatus::OK;
  std::string err;
  std::unique_ptr<ProtocolSession> s = session_connect(cfg_.cap, cfg_.port, cfg_.baud, cfg_.rtscts, cfg_.sopts, cfg_.sim, &st, &err);
  if (!s) {
    if (!reported_down_) {
      fprintf(stderr, "[transmitter] cannot reach display (%s): %s, retrying every %u ms\n", lcd_status_name(st), err.c_str(), cfg_.reconnect_ms);
      reported_down_ = true;
    }
    {
      std::lock_guard<std::mutex> lk(mtx_);
      last_error_ = err;
    }
    next_attempt_ms_ = monotonic_ms() + cfg_.reconnect_ms;
    return;
  }
  session_ = std::move(s);

  LcdStatus ast = applyAll();
  if (ast == LcdStatus::RECOVERED) ast = applyAll();
  if (ast != LcdStatus::OK) {
    connectionLost(lastError());
    return;
  }

  reported_down_ = false;
  std::function<void(uint64_t)> fn;
  uint64_t g = 0;
  {
    // Connected and the new generation become visible together.
    std::lock_guard<std::mutex> lk(mtx_);
    connected_ = true;
    stats_.connects++;
    variant_ = session_->device().variant;
    last_error_.clear();
    gen_++;
    need_full_ = true;
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(), [](const tx_job &j) { return j.kind == JOB_BATCH; }), queue_.end());
    fn = resync_listener_;
    g = gen_;
  }
  idle_cv_.notify_all();
  fprintf(stderr, "[transmitter] display ready (%s, %s)\n", cfg_.cap.revision.c_str(), session_->device().variant.c_str());
  if (fn) fn(g);
}

void Transmitter::process(tx_job &job) {
  if (!session_) return;
  if (job.kind != JOB_BATCH) {
    const char *what = job.kind == JOB_ORIENTATION ? "orientation" : job.kind == JOB_BRIGHTNESS ? "brightness"
                     : job.kind == JOB_LED ? "led" : "power";
    LcdStatus st = applyOne(job.kind, settings());
    handle(st, lastError(), what);
    return;
  }

  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (job.batch.generation != gen_) {
      stats_.dropped_batches++;
      return;
    }
  }
  for (const flush_region &fr : job.batch.regions) {
    std::string err;
    LcdStatus st = session_->sendFrame(fr.r, fr.px.data(), &err);
    if (st != LcdStatus::OK) {
      handle(st, err, job.batch.full ? "full frame" : "region");
      return;
    }
  }
  std::lock_guard<std::mutex> lk(mtx_);
  if (job.batch.full) stats_.full_frames++;
  stats_.regions += job.batch.regions.size();
}

void Transmitter::run() {
  for (;;) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (stop_) break;
    }
    if (!session_) {
      uint64_t now = monotonic_ms();
      if (now < next_attempt_ms_) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, std::chrono::milliseconds(next_attempt_ms_ - now), [&] { return stop_; });
        continue;
      }
      tryConnect();
      continue;
    }

    tx_job job;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [&] { return stop_ || !queue_.empty(); });
      if (stop_) break;
      job = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }
    process(job);
    {
      std::lock_guard<std::mutex> lk(mtx_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }

  if (session_) {
    if (cfg_.screen_off_on_stop && session_->isReady()) {
      std::string err;
      LcdStatus st = cfg_.cap.power_control ? session_->power(false, &err) : session_->setBrightness(0, &err);
      if (st != LcdStatus::OK && st != LcdStatus::UNSUPPORTED_OPERATION) {
        fprintf(stderr, "[transmitter] screen off at shutdown: %s\n", err.c_str());
      }
    }
    session_->close();
    session_.reset();
  }
  {
    std::lock_guard<std::mutex> lk(mtx_);
    connected_ = false;
    queue_.clear();
  }
  idle_cv_.notify_all();
}
