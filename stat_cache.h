#pragma once
#include <stdint.h>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum stat_kind { STAT_UNAVAILABLE=0, STAT_NUMBER=1, STAT_TEXT=2 };

// Unavailable is a normal value: widgets draw their fallback glyph for it.
struct stat_value {
  stat_kind kind = STAT_UNAVAILABLE;
  double number = 0.0;
  std::string unit;
  std::string text;

  static stat_value num(double v, const std::string &unit = std::string()) {
    stat_value s; s.kind = STAT_NUMBER; s.number = v; s.unit = unit; return s;
  }
  static stat_value str(const std::string &t) {
    stat_value s; s.kind = STAT_TEXT; s.text = t; return s;
  }
  static stat_value unavailable() { return stat_value(); }
};

static inline bool stat_value_equal(const stat_value &a, const stat_value &b) {
  if (a.kind != b.kind) return false;
  if (a.kind == STAT_NUMBER) return a.number == b.number && a.unit == b.unit;
  if (a.kind == STAT_TEXT) return a.text == b.text;
  return true;
}

struct stat_sample {
  stat_value value;
  uint64_t updated_ms = 0;
  uint64_t seq = 0;                     // per key, bumped on every write
};

typedef std::map<std::string, stat_sample> stat_map;
// Immutable once published; readers keep their copy as long as they like.
typedef std::shared_ptr<const stat_map> stat_snapshot;

// key -> last value. Each key has exactly one writer, registered with claim().
class StatCache {
public:
  StatCache();

  bool claim(const std::string &key, const std::string &owner, std::string *err);
  void put(const std::string &key, const stat_value &v, uint64_t now_ms);
  stat_snapshot snapshot() const;

private:
  mutable std::mutex mtx;
  stat_snapshot cur;
  std::map<std::string, std::string> owners;
};

// Returns null when key is absent.
const stat_sample *stat_find(const stat_snapshot &snap, const std::string &key);

class StatSource {
public:
  virtual ~StatSource() {}
  virtual std::string name() const = 0;
  virtual std::vector<std::string> keys() const = 0;
  virtual uint32_t intervalMs() const = 0;
  // May block. Failures come back as unavailable.
  virtual stat_value read(const std::string &key) = 0;
};

// One thread per source, writing into the cache on the source's interval.
class StatPoller {
public:
  StatPoller(std::shared_ptr<StatSource> src, std::shared_ptr<StatCache> cache);
  ~StatPoller();

  StatPoller(const StatPoller&) = delete;
  StatPoller& operator=(const StatPoller&) = delete;

  bool start(std::string *err);
  // Signals the thread and waits at most grace_ms; a thread stuck in read() is detached.
  void stop(uint32_t grace_ms);
  const std::string &name() const { return name_; }

private:
  struct shared_state {
    std::mutex mtx;
    std::condition_variable cv;
    bool stop = false;
    bool done = false;
  };
  static void run(std::shared_ptr<shared_state> st, std::shared_ptr<StatSource> src, std::shared_ptr<StatCache> cache);

  std::shared_ptr<StatSource> src_;
  std::shared_ptr<StatCache> cache_;
  std::shared_ptr<shared_state> st_;
  std::string name_;
  std::thread th_;
};
