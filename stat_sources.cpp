#include "stat_sources.h"
#include <time.h>

std::vector<std::string> StaticStatSource::keys() const {
  std::vector<std::string> out;
  for (const auto &kv : values_) out.push_back(kv.first);
  return out;
}

stat_value StaticStatSource::read(const std::string &key) {
  auto it = values_.find(key);
  return it == values_.end() ? stat_value::unavailable() : it->second;
}

RandomStatSource::RandomStatSource(const std::vector<random_stat_spec> &specs, uint32_t interval_ms, uint32_t seed)
  : specs_(specs), interval_ms_(interval_ms), rng_(seed) {}

std::vector<std::string> RandomStatSource::keys() const {
  std::vector<std::string> out;
  for (const random_stat_spec &s : specs_) out.push_back(s.key);
  return out;
}

stat_value RandomStatSource::read(const std::string &key) {
  for (const random_stat_spec &s : specs_) {
    if (s.key != key) continue;
    std::uniform_real_distribution<double> dist(s.min, s.max);
    return stat_value::num(dist(rng_), s.unit);
  }
  return stat_value::unavailable();
}

stat_value ClockStatSource::read(const std::string &key) {
  time_t now = time(nullptr);
  struct tm tm;
  if (!localtime_r(&now, &tm)) return stat_value::unavailable();
  char buf[32];
  const char *fmt = nullptr;
  if (key == "clock.time") fmt = "%H:%M:%S";
  else if (key == "clock.date") fmt = "%Y-%m-%d";
  else return stat_value::unavailable();
  if (strftime(buf, sizeof(buf), fmt, &tm) == 0) return stat_value::unavailable();
  return stat_value::str(buf);
}
