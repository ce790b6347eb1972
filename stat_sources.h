#pragma once
#include <stdint.h>
#include <map>
#include <random>
#include <string>
#include <vector>
#include "stat_cache.h"

// Stand-ins for real metric acquisition.

class StaticStatSource : public StatSource {
public:
  StaticStatSource(const std::map<std::string, stat_value> &values, uint32_t interval_ms)
    : values_(values), interval_ms_(interval_ms) {}

  std::string name() const override { return "static"; }
  std::vector<std::string> keys() const override;
  uint32_t intervalMs() const override { return interval_ms_; }
  stat_value read(const std::string &key) override;

private:
  std::map<std::string, stat_value> values_;
  uint32_t interval_ms_;
};

struct random_stat_spec {
  std::string key;
  double min = 0.0, max = 100.0;
  std::string unit;
};

// Uniform values in [min, max] per key.
class RandomStatSource : public StatSource {
public:
  RandomStatSource(const std::vector<random_stat_spec> &specs, uint32_t interval_ms, uint32_t seed);

  std::string name() const override { return "random"; }
  std::vector<std::string> keys() const override;
  uint32_t intervalMs() const override { return interval_ms_; }
  stat_value read(const std::string &key) override;

private:
  std::vector<random_stat_spec> specs_;
  uint32_t interval_ms_;
  std::mt19937 rng_;
};

// "clock.time" (HH:MM:SS) and "clock.date" (YYYY-MM-DD), local time.
class ClockStatSource : public StatSource {
public:
  std::string name() const override { return "clock"; }
  std::vector<std::string> keys() const override { return { "clock.time", "clock.date" }; }
  uint32_t intervalMs() const override { return 1000; }
  stat_value read(const std::string &key) override;
};
