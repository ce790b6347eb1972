#pragma once
#include <stdint.h>
#include <map>
#include <string>
#include <vector>
#include "stat_cache.h"
#include "stat_sources.h"

struct engine_cfg {
  // Device
  std::string revision = "A";
  std::string port = "/dev/ttyACM0";
  int baud = 0;                          // 0: revision default
  bool rtscts = true;
  int brightness = 25;                   // 0..100
  bool reverse_orientation = false;      // flip the theme orientation by 180
  bool screen_off_on_stop = true;
  // Capability overrides for firmware variants (0 / empty: built-in)
  uint32_t max_payload = 0;
  std::string checksum;

  // Link timing
  int write_timeout_ms = 1000;
  int handshake_timeout_ms = 1000;
  int write_attempts = 2;
  uint32_t reconnect_ms = 3000;
  bool merge_regions = true;

  std::string theme_path;

  // Control server / preview
  bool control_enable = true;
  std::string listen_addr = "127.0.0.1";
  int control_port = 8090;
  int preview_fps = 5;
  int jpeg_quality = 85;

  // Stub stat sources
  std::map<std::string, stat_value> static_stats;
  uint32_t static_interval_ms = 5000;
  std::vector<random_stat_spec> random_stats;
  uint32_t random_interval_ms = 1000;
  uint32_t random_seed = 1;
  bool clock_stats = true;
  uint32_t poller_grace_ms = 500;
};

void engine_cfg_normalize(engine_cfg &c);
std::string engine_cfg_to_json(const engine_cfg &c);
// Unknown keys are ignored; a malformed document or value is an error.
bool engine_cfg_from_json_text(const std::string &text, engine_cfg &c, std::string *err);
bool engine_cfg_load(const std::string &path, engine_cfg &c, std::string *err);
