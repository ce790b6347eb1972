#pragma once
#include <stdint.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "capability_model.h"
#include "display_types.h"
#include "protocol_session.h"
#include "stat_cache.h"
#include "theme.h"
#include "transmitter.h"

class SimulatedPanel;
struct engine_cfg;

struct engine_opts {
  int baud = 0;                          // 0: capability default
  bool rtscts = true;
  session_opts sopts;
  uint32_t reconnect_ms = 3000;
  bool merge_regions = true;
  bool screen_off_on_stop = true;
  int brightness = 25;
  bool reverse_orientation = false;      // start in the reverse of the theme orientation
  int preview_fps = 0;                   // frame listener rate, 0: off
  uint32_t poller_grace_ms = 500;
};

engine_opts engine_opts_from_cfg(const engine_cfg &c);

struct engine_status {
  bool running = false;
  bool connected = false;
  std::string revision;
  std::string variant;
  std::string port;
  std::string theme;
  uint32_t width = 0, height = 0;        // logical canvas
  orientation orient = ORIENT_PORTRAIT;
  int brightness = 0;
  bool power_on = true;
  bool led_set = false;
  rgb_u8 led;
  uint64_t generation = 0;
  uint64_t ticks = 0;
  transmitter_stats tx;
  std::string last_error;
};

std::string engine_status_to_json(const engine_status &s);

// Wires theme, stat pollers, scheduler/compositor thread and transmitter together.
class Engine {
public:
  Engine();
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Before start(). Each source gets its own poller thread.
  void addStatSource(std::shared_ptr<StatSource> src);
  std::shared_ptr<StatCache> statCache() const;

  // SIMU revision: the panel to talk to. One is created from the theme size when unset.
  void setSimulatedPanel(std::shared_ptr<SimulatedPanel> panel);
  std::shared_ptr<SimulatedPanel> simulatedPanel() const;

  // Canvas copies at most preview_fps times per second, from the compositor thread.
  void setFrameListener(std::function<void(const std::vector<uint32_t> &px, uint32_t w, uint32_t h)> fn);

  // Validates theme against capability; CONFIG_ERROR cases fail here and nothing starts.
  // The device itself is connected asynchronously and reconnected on loss.
  bool start(const theme &t, const capability_model &cap, const std::string &port, const engine_opts &o, std::string *err);
  void stop();
  bool running() const;

  // Flip between an orientation and its reverse. Switching axis would invalidate the theme
  // geometry and is a CONFIG_ERROR.
  LcdStatus setOrientation(orientation o, std::string *err);
  LcdStatus setBrightness(int level, std::string *err);
  LcdStatus setLed(const rgb_u8 &c, std::string *err);
  // Revisions without power control get brightness 0 instead.
  LcdStatus power(bool on, std::string *err);

  engine_status status() const;

  // Test hooks.
  bool waitConnected(uint32_t timeout_ms);
  bool waitIdle(uint32_t timeout_ms);

private:
  struct impl;
  std::unique_ptr<impl> p_;
};
