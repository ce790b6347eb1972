#include "engine_config.h"
#include "capability_model.h"
#include "checksum.h"
#include "sys_util.h"

#include <limits.h>
#include <stdint.h>
#include <algorithm>
#include <nlohmann/json.hpp>

using nlohmann::json;

void engine_cfg_normalize(engine_cfg &c) {
  c.brightness = std::clamp(c.brightness, 0, 100);
  if (c.baud < 0) c.baud = 0;
  if (c.write_timeout_ms < 10) c.write_timeout_ms = 10;
  if (c.handshake_timeout_ms < 10) c.handshake_timeout_ms = 10;
  c.write_attempts = std::clamp(c.write_attempts, 1, 10);
  if (c.reconnect_ms < 100) c.reconnect_ms = 100;
  if (c.control_port <= 0 || c.control_port > 65535) c.control_port = 8090;
  if (c.listen_addr.empty()) c.listen_addr = "127.0.0.1";
  c.preview_fps = std::clamp(c.preview_fps, 0, 30);
  c.jpeg_quality = std::clamp(c.jpeg_quality, 1, 100);
  if (c.static_interval_ms == 0) c.static_interval_ms = 5000;
  if (c.random_interval_ms == 0) c.random_interval_ms = 1000;

  std::vector<random_stat_spec> rnd;
  for (random_stat_spec s : c.random_stats) {
    if (s.key.empty()) continue;
    if (s.max < s.min) std::swap(s.min, s.max);
    rnd.push_back(s);
  }
  c.random_stats = rnd;
}

std::string engine_cfg_to_json(const engine_cfg &c_in) {
  engine_cfg c = c_in;
  engine_cfg_normalize(c);

  json j;
  j["revision"] = c.revision;
  j["port"] = c.port;
  j["baud"] = c.baud;
  j["rtscts"] = c.rtscts;
  j["brightness"] = c.brightness;
  j["reverseOrientation"] = c.reverse_orientation;
  j["screenOffOnStop"] = c.screen_off_on_stop;
  j["maxPayload"] = c.max_payload;
  j["checksum"] = c.checksum;
  j["writeTimeoutMs"] = c.write_timeout_ms;
  j["handshakeTimeoutMs"] = c.handshake_timeout_ms;
  j["writeAttempts"] = c.write_attempts;
  j["reconnectMs"] = c.reconnect_ms;
  j["mergeRegions"] = c.merge_regions;
  j["theme"] = c.theme_path;

  json ctl;
  ctl["enable"] = c.control_enable;
  ctl["listenAddr"] = c.listen_addr;
  ctl["port"] = c.control_port;
  ctl["previewFps"] = c.preview_fps;
  ctl["jpegQuality"] = c.jpeg_quality;
  j["control"] = ctl;

  json st;
  json stat_static = json::object();
  for (const auto &kv : c.static_stats) {
    const stat_value &v = kv.second;
    if (v.kind == STAT_TEXT) stat_static[kv.first] = v.text;
    else if (v.kind == STAT_NUMBER && v.unit.empty()) stat_static[kv.first] = v.number;
    else if (v.kind == STAT_NUMBER) stat_static[kv.first] = { {"value", v.number}, {"unit", v.unit} };
  }
  st["static"] = stat_static;
  st["staticIntervalMs"] = c.static_interval_ms;
  json rnd = json::array();
  for (const random_stat_spec &s : c.random_stats) {
    rnd.push_back({ {"key", s.key}, {"min", s.min}, {"max", s.max}, {"unit", s.unit} });
  }
  st["random"] = rnd;
  st["randomIntervalMs"] = c.random_interval_ms;
  st["seed"] = c.random_seed;
  st["clock"] = c.clock_stats;
  st["graceMs"] = c.poller_grace_ms;
  j["stats"] = st;

  return j.dump(2);
}

bool engine_cfg_from_json_text(const std::string &text, engine_cfg &c, std::string *err) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "config is not a JSON object";
    return false;
  }
  bool ok = true;
  std::string bad;

  auto get_str = [&](const json &o, const char *k, std::string &out) {
    if (!o.contains(k)) return;
    if (o[k].is_string()) out = o[k].get<std::string>();
    else { ok = false; bad = k; }
  };
  auto get_bool = [&](const json &o, const char *k, bool &out) {
    if (!o.contains(k)) return;
    if (o[k].is_boolean()) out = o[k].get<bool>();
    else { ok = false; bad = k; }
  };
  auto get_int = [&](const json &o, const char *k, int &out) {
    if (!o.contains(k)) return;
    if (o[k].is_number_integer() && o[k].get<long long>() >= INT_MIN && o[k].get<long long>() <= INT_MAX) out = (int)o[k].get<long long>();
    else { ok = false; bad = k; }
  };
  auto get_u32 = [&](const json &o, const char *k, uint32_t &out) {
    if (!o.contains(k)) return;
    if (o[k].is_number_integer() && o[k].get<long long>() >= 0 && o[k].get<long long>() <= UINT32_MAX) out = (uint32_t)o[k].get<long long>();
    else { ok = false; bad = k; }
  };
  auto get_num = [&](const json &o, const char *k, double &out, const std::string &name) {
    if (!o.contains(k)) return;
    if (o[k].is_number()) out = o[k].get<double>();
    else { ok = false; bad = name; }
  };

  get_str(j, "revision", c.revision);
  get_str(j, "port", c.port);
  get_int(j, "baud", c.baud);
  get_bool(j, "rtscts", c.rtscts);
  get_int(j, "brightness", c.brightness);
  get_bool(j, "reverseOrientation", c.reverse_orientation);
  get_bool(j, "screenOffOnStop", c.screen_off_on_stop);
  get_u32(j, "maxPayload", c.max_payload);
  get_str(j, "checksum", c.checksum);
  get_int(j, "writeTimeoutMs", c.write_timeout_ms);
  get_int(j, "handshakeTimeoutMs", c.handshake_timeout_ms);
  get_int(j, "writeAttempts", c.write_attempts);
  get_u32(j, "reconnectMs", c.reconnect_ms);
  get_bool(j, "mergeRegions", c.merge_regions);
  get_str(j, "theme", c.theme_path);

  if (j.contains("control") && j["control"].is_object()) {
    const json &ctl = j["control"];
    get_bool(ctl, "enable", c.control_enable);
    get_str(ctl, "listenAddr", c.listen_addr);
    get_int(ctl, "port", c.control_port);
    get_int(ctl, "previewFps", c.preview_fps);
    get_int(ctl, "jpegQuality", c.jpeg_quality);
  }

  if (j.contains("stats") && j["stats"].is_object()) {
    const json &st = j["stats"];
    if (st.contains("static") && st["static"].is_object()) {
      c.static_stats.clear();
      for (auto it = st["static"].begin(); it != st["static"].end(); ++it) {
        const json &v = it.value();
        if (v.is_number()) c.static_stats[it.key()] = stat_value::num(v.get<double>());
        else if (v.is_string()) c.static_stats[it.key()] = stat_value::str(v.get<std::string>());
        else if (v.is_object() && v.contains("value") && v["value"].is_number() &&
                 (!v.contains("unit") || v["unit"].is_string())) {
          c.static_stats[it.key()] = stat_value::num(v["value"].get<double>(), v.contains("unit") ? v["unit"].get<std::string>() : std::string());
        } else { ok = false; bad = "stats.static." + it.key(); }
      }
    }
    get_u32(st, "staticIntervalMs", c.static_interval_ms);
    if (st.contains("random") && st["random"].is_array()) {
      c.random_stats.clear();
      for (const auto &x : st["random"]) {
        if (!x.is_object() || !x.contains("key") || !x["key"].is_string()) { ok = false; bad = "stats.random"; continue; }
        random_stat_spec s;
        s.key = x["key"].get<std::string>();
        const std::string where = "stats.random." + s.key;
        get_num(x, "min", s.min, where + ".min");
        get_num(x, "max", s.max, where + ".max");
        if (x.contains("unit")) {
          if (x["unit"].is_string()) s.unit = x["unit"].get<std::string>();
          else { ok = false; bad = where + ".unit"; }
        }
        c.random_stats.push_back(s);
      }
    }
    get_u32(st, "randomIntervalMs", c.random_interval_ms);
    get_u32(st, "seed", c.random_seed);
    get_bool(st, "clock", c.clock_stats);
    get_u32(st, "graceMs", c.poller_grace_ms);
  }

  if (!ok) {
    if (err) *err = "bad value for '" + bad + "'";
    return false;
  }
  if (!c.checksum.empty()) {
    checksum_kind k;
    if (!checksum_kind_from_string(c.checksum, &k)) {
      if (err) *err = "unknown checksum '" + c.checksum + "'";
      return false;
    }
  }
  engine_cfg_normalize(c);
  return true;
}

bool engine_cfg_load(const std::string &path, engine_cfg &c, std::string *err) {
  std::string text = slurp_file(path);
  if (text.empty()) {
    if (err) *err = "cannot read config " + path;
    return false;
  }
  if (!engine_cfg_from_json_text(text, c, err)) return false;
  // A relative theme path is relative to the config file.
  if (!c.theme_path.empty() && c.theme_path[0] != '/') c.theme_path = dir_of(path) + "/" + c.theme_path;
  fprintf(stderr, "[config] loaded %s (revision %s on %s)\n", path.c_str(), c.revision.c_str(), c.port.c_str());
  return true;
}
