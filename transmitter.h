#pragma once
#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "canvas.h"
#include "capability_model.h"
#include "protocol_session.h"

class SimulatedPanel;

struct flush_region {
  rect_u32 r;
  std::vector<uint32_t> px;             // r.w * r.h XRGB8888
};

// Regions of one compositor tick, sent in order as one unit.
struct flush_batch {
  bool full = false;
  uint64_t generation = 0;
  std::vector<flush_region> regions;
};

// Joins touching rectangles until none touch. Output covers every input pixel.
std::vector<rect_u32> merge_rects(const std::vector<rect_u32> &rects);

// full: the whole canvas as one region, regardless of dirty.
flush_batch build_flush_batch(const canvas &c, const std::vector<rect_u32> &dirty, bool full, bool merge);

// Desired device state, re-applied after every (re)connect.
struct device_settings {
  orientation orient = ORIENT_PORTRAIT;
  int brightness = 25;
  bool led_set = false;
  rgb_u8 led;
  bool power_on = true;
};

struct transmitter_cfg {
  capability_model cap;
  std::string port;
  int baud = 115200;
  bool rtscts = true;
  session_opts sopts;
  uint32_t reconnect_ms = 3000;
  size_t max_queue = 8;                 // batches; overflow forces a full resync
  bool screen_off_on_stop = true;
  std::shared_ptr<SimulatedPanel> sim;
};

struct transmitter_stats {
  uint64_t connects = 0;
  uint64_t connection_losses = 0;
  uint64_t recoveries = 0;
  uint64_t full_frames = 0;
  uint64_t regions = 0;
  uint64_t dropped_batches = 0;
};

// Owns the ProtocolSession on its own thread. Frames carry the resync generation they
// were produced for: the generation advances on every connect and every recovered write,
// and the first batch accepted for a new generation must be a full frame.
class Transmitter {
public:
  explicit Transmitter(const transmitter_cfg &cfg);
  ~Transmitter();

  Transmitter(const Transmitter&) = delete;
  Transmitter& operator=(const Transmitter&) = delete;

  void start(const device_settings &s);
  // Lets the in-flight command finish, optionally blanks the screen, closes the session.
  void stop();

  // false when dropped: not connected, stale generation, or partial while a full frame is owed.
  bool submit(flush_batch b);
  uint64_t generation() const;
  bool connected() const;

  void setBrightness(int level);
  void setLed(const rgb_u8 &c);
  void setPower(bool on);
  // Same-axis flips only; the caller re-sends a full frame for the new generation.
  void setOrientation(orientation o);

  device_settings settings() const;
  transmitter_stats stats() const;
  std::string lastError() const;
  std::string deviceVariant() const;

  // Called from the transmitter thread whenever the generation advances.
  void setResyncListener(std::function<void(uint64_t)> fn);

  bool waitIdle(uint32_t timeout_ms);
  bool waitConnected(uint32_t timeout_ms);

private:
  enum job_kind { JOB_BATCH, JOB_BRIGHTNESS, JOB_LED, JOB_POWER, JOB_ORIENTATION };
  struct tx_job {
    job_kind kind = JOB_BATCH;
    flush_batch batch;
  };

  void run();
  void tryConnect();
  void process(tx_job &job);
  LcdStatus applyAll();
  LcdStatus applyOne(job_kind k, const device_settings &s);
  void handle(LcdStatus st, const std::string &err, const char *what);
  void connectionLost(const std::string &why);
  void bumpGeneration();
  void enqueueSetting(job_kind k);

  transmitter_cfg cfg_;
  std::unique_ptr<ProtocolSession> session_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<tx_job> queue_;
  bool stop_ = false;
  bool busy_ = false;
  bool connected_ = false;
  bool need_full_ = true;
  uint64_t gen_ = 0;
  device_settings settings_;
  transmitter_stats stats_;
  std::string last_error_;
  std::string variant_;
  std::function<void(uint64_t)> resync_listener_;

  bool reported_down_ = false;
  uint64_t next_attempt_ms_ = 0;
  std::thread th_;
};
