#include "engine.h"
#include "compositor.h"
#include "engine_config.h"
#include "scheduler.h"
#include "sim_panel.h"
#include "sys_util.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>

using nlohmann::json;

engine_opts engine_opts_from_cfg(const engine_cfg &c) {
  engine_opts o;
  o.baud = c.baud;
  o.rtscts = c.rtscts;
  o.sopts.write_timeout_ms = c.write_timeout_ms;
  o.sopts.read_timeout_ms = c.write_timeout_ms;
  o.sopts.handshake_timeout_ms = c.handshake_timeout_ms;
  o.sopts.write_attempts = c.write_attempts;
  o.reconnect_ms = c.reconnect_ms;
  o.merge_regions = c.merge_regions;
  o.screen_off_on_stop = c.screen_off_on_stop;
  o.brightness = c.brightness;
  o.reverse_orientation = c.reverse_orientation;
  o.preview_fps = c.control_enable ? c.preview_fps : 0;
  o.poller_grace_ms = c.poller_grace_ms;
  return o;
}

std::string engine_status_to_json(const engine_status &s) {
  json j;
  j["running"] = s.running;
  j["connected"] = s.connected;
  j["revision"] = s.revision;
  j["variant"] = s.variant;
  j["port"] = s.port;
  j["theme"] = s.theme;
  j["width"] = s.width;
  j["height"] = s.height;
  j["orientation"] = orientation_to_string(s.orient);
  j["brightness"] = s.brightness;
  j["power"] = s.power_on;
  j["led"] = s.led_set ? rgb_to_csv(s.led) : std::string();
  j["generation"] = s.generation;
  j["ticks"] = s.ticks;
  j["connects"] = s.tx.connects;
  j["connectionLosses"] = s.tx.connection_losses;
  j["recoveries"] = s.tx.recoveries;
  j["fullFrames"] = s.tx.full_frames;
  j["regions"] = s.tx.regions;
  j["droppedBatches"] = s.tx.dropped_batches;
  j["lastError"] = s.last_error;
  return j.dump();
}

struct Engine::impl {
  std::shared_ptr<StatCache> cache = std::make_shared<StatCache>();
  std::vector<std::shared_ptr<StatSource>> sources;
  std::vector<std::unique_ptr<StatPoller>> pollers;
  std::shared_ptr<SimulatedPanel> sim;
  std::function<void(const std::vector<uint32_t>&, uint32_t, uint32_t)> frame_listener;

  theme t;
  capability_model cap;
  engine_opts opts;
  std::string port;
  std::unique_ptr<Compositor> comp;
  std::unique_ptr<Transmitter> tx;
  Scheduler sched;

  mutable std::mutex mtx;
  std::condition_variable cv;
  std::condition_variable tick_cv;
  bool running = false;
  bool stop = false;
  bool wake = false;
  uint64_t started = 0;                 // ticks begun
  uint64_t ticks = 0;                   // ticks completed
  std::thread th;

  void loop();
  void publishPreview(uint64_t now, uint64_t *last_ms, bool *pending);
};

void Engine::impl::publishPreview(uint64_t now, uint64_t *last_ms, bool *pending) {
  if (!*pending || opts.preview_fps <= 0) return;
  std::function<void(const std::vector<uint32_t>&, uint32_t, uint32_t)> fn;
  {
    std::lock_guard<std::mutex> lk(mtx);
    fn = frame_listener;
  }
  if (!fn) { *pending = false; return; }
  if (now - *last_ms < (uint64_t)(1000 / opts.preview_fps)) return;
  const canvas &c = comp->surface();
  fn(c.px, c.w, c.h);
  *last_ms = now;
  *pending = false;
}

void Engine::impl::loop() {
  canvas &c = comp->surface();
  comp->renderAll(cache->snapshot());
  c.takeDirty();

  uint64_t sent_gen = 0;
  uint64_t last_preview = 0;
  bool preview_pending = true;
  const uint64_t preview_ms = opts.preview_fps > 0 ? (uint64_t)(1000 / opts.preview_fps) : 0;

  for (;;) {
    {
      std::lock_guard<std::mutex> lk(mtx);
      if (stop) break;
      wake = false;
      started++;
    }
    const uint64_t now = monotonic_ms();
    std::vector<size_t> due = sched.tick(now);
    comp->renderDue(due, cache->snapshot());
    std::vector<rect_u32> dirty = c.takeDirty();
    if (!dirty.empty()) preview_pending = true;

    const uint64_t gen = tx->generation();
    if (gen != sent_gen) {
      // New link or lost frames: one full frame before anything partial.
      if (tx->connected()) {
        flush_batch b = build_flush_batch(c, std::vector<rect_u32>(), true, false);
        b.generation = gen;
        if (tx->submit(std::move(b))) sent_gen = gen;
      }
    } else if (!dirty.empty()) {
      flush_batch b = build_flush_batch(c, dirty, !cap.partial_update, opts.merge_regions);
      b.generation = gen;
      tx->submit(std::move(b));
    }
    publishPreview(now, &last_preview, &preview_pending);

    uint64_t next = sched.nextDue();
    if (preview_pending && preview_ms) next = std::min(next, last_preview + preview_ms);
    std::unique_lock<std::mutex> lk(mtx);
    ticks = started;
    tick_cv.notify_all();
    if (stop || wake) continue;
    if (next == Scheduler::kNever) {
      cv.wait(lk, [&] { return stop || wake; });
    } else {
      uint64_t n2 = monotonic_ms();
      uint64_t wait_ms = next > n2 ? next - n2 : 0;
      cv.wait_for(lk, std::chrono::milliseconds(wait_ms), [&] { return stop || wake; });
    }
  }
}

Engine::Engine() : p_(new impl()) {}

Engine::~Engine() { stop(); }

void Engine::addStatSource(std::shared_ptr<StatSource> src) {
  std::lock_guard<std::mutex> lk(p_->mtx);
  p_->sources.push_back(std::move(src));
}

std::shared_ptr<StatCache> Engine::statCache() const { return p_->cache; }

void Engine::setSimulatedPanel(std::shared_ptr<SimulatedPanel> panel) {
  std::lock_guard<std::mutex> lk(p_->mtx);
  p_->sim = std::move(panel);
}

std::shared_ptr<SimulatedPanel> Engine::simulatedPanel() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return p_->sim;
}

void Engine::setFrameListener(std::function<void(const std::vector<uint32_t>&, uint32_t, uint32_t)> fn) {
  std::lock_guard<std::mutex> lk(p_->mtx);
  p_->frame_listener = std::move(fn);
}

bool Engine::start(const theme &t, const capability_model &cap_in, const std::string &port, const engine_opts &o, std::string *err) {
  if (running()) {
    if (err) *err = "engine already running";
    return false;
  }
  if (!theme_validate(t, err)) return false;

  capability_model cap = cap_in;
  if (cap.revision == "SIMU") {
    cap.width = t.width;
    cap.height = t.height;
  } else if (t.width != cap.width || t.height != cap.height) {
    if (err) {
      *err = "theme is for " + std::to_string(t.width) + "x" + std::to_string(t.height) + " but revision " + cap.revision +
             " is " + std::to_string(cap.width) + "x" + std::to_string(cap.height);
    }
    return false;
  }

  orientation orient = t.orient;
  if (o.reverse_orientation) orient = (orientation)((int)orient ^ 1);
  if (!capability_supports_orientation(cap, orient)) {
    if (err) *err = std::string("revision ") + cap.revision + " cannot display " + orientation_to_string(orient);
    return false;
  }
  if (o.brightness < 0 || o.brightness > 100) {
    if (err) *err = "brightness must be 0..100";
    return false;
  }

  impl &p = *p_;
  p.t = t;
  p.cap = cap;
  p.opts = o;
  p.port = port;
  if (cap.revision == "SIMU" && !p.sim) {
    p.sim = std::make_shared<SimulatedPanel>(cap.width, cap.height, cap.max_payload, cap.checksum);
  }

  for (const std::shared_ptr<StatSource> &src : p.sources) {
    std::unique_ptr<StatPoller> poller(new StatPoller(src, p.cache));
    if (!poller->start(err)) {
      p.pollers.clear();
      return false;
    }
    p.pollers.push_back(std::move(poller));
  }

  if (t.has_led && !cap.led) {
    fprintf(stderr, "[engine] theme sets an LED colour but revision %s has no LED\n", cap.revision.c_str());
  }

  transmitter_cfg tc;
  tc.cap = cap;
  tc.port = port;
  tc.baud = o.baud ? o.baud : cap.baud;
  tc.rtscts = o.rtscts;
  tc.sopts = o.sopts;
  tc.reconnect_ms = o.reconnect_ms;
  tc.screen_off_on_stop = o.screen_off_on_stop;
  tc.sim = p.sim;

  device_settings ds;
  ds.orient = orient;
  ds.brightness = o.brightness;
  ds.led_set = t.has_led && cap.led;
  ds.led = t.led;
  ds.power_on = true;

  p.comp.reset(new Compositor(p.t));
  p.sched = Scheduler();
  const uint64_t now = monotonic_ms();
  for (size_t i=0; i<p.t.widgets.size(); i++) {
    p.sched.add(i, p.t.widgets[i].interval_ms, now + p.t.widgets[i].interval_ms);
  }

  p.tx.reset(new Transmitter(tc));
  impl *raw = p_.get();
  p.tx->setResyncListener([raw](uint64_t) {
    std::lock_guard<std::mutex> lk(raw->mtx);
    raw->wake = true;
    raw->cv.notify_all();
  });

  {
    std::lock_guard<std::mutex> lk(p.mtx);
    p.stop = false;
    p.wake = false;
    p.started = 0;
    p.ticks = 0;
    p.running = true;
  }
  p.tx->start(ds);
  p.th = std::thread([raw]() { raw->loop(); });

  fprintf(stderr, "[engine] started: theme '%s' %ux%u %s on %s (%s), %zu widgets, %zu stat sources\n",
          p.t.name.c_str(), p.t.logicalWidth(), p.t.logicalHeight(), orientation_to_string(orient), cap.revision.c_str(),
          cap.revision == "SIMU" ? "simulated" : port.c_str(), p.t.widgets.size(), p.pollers.size());
  return true;
}

void Engine::stop() {
  impl &p = *p_;
  {
    std::lock_guard<std::mutex> lk(p.mtx);
    if (!p.running) return;
    p.stop = true;
    p.cv.notify_all();
  }
  if (p.th.joinable()) p.th.join();
  for (std::unique_ptr<StatPoller> &poller : p.pollers) poller->stop(p.opts.poller_grace_ms);
  p.pollers.clear();
  if (p.tx) p.tx->stop();
  {
    std::lock_guard<std::mutex> lk(p.mtx);
    p.running = false;
  }
  fprintf(stderr, "[engine] stopped\n");
}

bool Engine::running() const {
  std::lock_guard<std::mutex> lk(p_->mtx);
  return p_->running;
}

LcdStatus Engine::setOrientation(orientation o, std::string *err) {
  if (!running()) {
    if (err) *err = "engine not running";
    return LcdStatus::NOT_CONNECTED;
  }
  impl &p = *p_;
  if (orientation_is_landscape(o) != orientation_is_landscape(p.t.orient)) {
    if (err) *err = std::string("theme is laid out for ") + (orientation_is_landscape(p.t.orient) ? "landscape" : "portrait");
    return LcdStatus::CONFIG_ERROR;
  }
  if (!capability_supports_orientation(p.cap, o)) {
    if (err) *err = std::string("revision ") + p.cap.revision + " cannot display " + orientation_to_string(o);
    return LcdStatus::UNSUPPORTED_OPERATION;
  }
  if (p.tx->settings().orient == o) return LcdStatus::OK;
  p.tx->setOrientation(o);
  fprintf(stderr, "[engine] orientation %s\n", orientation_to_string(o));
  return LcdStatus::OK;
}

LcdStatus Engine::setBrightness(int level, std::string *err) {
  if (!running()) {
    if (err) *err = "engine not running";
    return LcdStatus::NOT_CONNECTED;
  }
  if (level < 0 || level > 100) {
    if (err) *err = "brightness must be 0..100";
    return LcdStatus::CONFIG_ERROR;
  }
  p_->tx->setBrightness(level);
  return LcdStatus::OK;
}

LcdStatus Engine::setLed(const rgb_u8 &c, std::string *err) {
  if (!running()) {
    if (err) *err = "engine not running";
    return LcdStatus::NOT_CONNECTED;
  }
  if (!p_->cap.led) {
    if (err) *err = "revision " + p_->cap.revision + " has no LED";
    return LcdStatus::UNSUPPORTED_OPERATION;
  }
  p_->tx->setLed(c);
  return LcdStatus::OK;
}

LcdStatus Engine::power(bool on, std::string *err) {
  if (!running()) {
    if (err) *err = "engine not running";
    return LcdStatus::NOT_CONNECTED;
  }
  p_->tx->setPower(on);
  return LcdStatus::OK;
}

engine_status Engine::status() const {
  impl &p = *p_;
  engine_status s;
  {
    std::lock_guard<std::mutex> lk(p.mtx);
    s.running = p.running;
    s.ticks = p.ticks;
  }
  s.revision = p.cap.revision;
  s.port = p.cap.revision == "SIMU" ? std::string("simulated") : p.port;
  s.theme = p.t.name;
  s.width = p.t.logicalWidth();
  s.height = p.t.logicalHeight();
  if (!p.tx) return s;
  device_settings ds = p.tx->settings();
  s.connected = p.tx->connected();
  s.variant = p.tx->deviceVariant();
  s.orient = ds.orient;
  s.brightness = ds.brightness;
  s.power_on = ds.power_on;
  s.led_set = ds.led_set;
  s.led = ds.led;
  s.generation = p.tx->generation();
  s.tx = p.tx->stats();
  s.last_error = p.tx->lastError();
  return s;
}

bool Engine::waitConnected(uint32_t timeout_ms) {
  if (!p_->tx) return false;
  return p_->tx->waitConnected(timeout_ms);
}

bool Engine::waitIdle(uint32_t timeout_ms) {
  impl &p = *p_;
  if (!p.tx) return false;
  const uint64_t deadline = monotonic_ms() + timeout_ms;
  {
    std::unique_lock<std::mutex> lk(p.mtx);
    // A tick already under way may have read the cache before this call; wait for the next one.
    uint64_t s0 = p.started;
    p.wake = true;
    p.cv.notify_all();
    if (!p.tick_cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), [&] { return p.ticks > s0 || !p.running; })) return false;
  }
  uint64_t now = monotonic_ms();
  return p.tx->waitIdle(now < deadline ? (uint32_t)(deadline - now) : 0);
}
