#include "stat_cache.h"
#include "sys_util.h"

#include <chrono>

StatCache::StatCache() : cur(std::make_shared<stat_map>()) {}

bool StatCache::claim(const std::string &key, const std::string &owner, std::string *err) {
  std::lock_guard<std::mutex> lk(mtx);
  auto it = owners.find(key);
  if (it != owners.end() && it->second != owner) {
    if (err) *err = "stat '" + key + "' already provided by " + it->second;
    return false;
  }
  owners[key] = owner;
  return true;
}

void StatCache::put(const std::string &key, const stat_value &v, uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mtx);
  std::shared_ptr<stat_map> next = std::make_shared<stat_map>(*cur);
  stat_sample &s = (*next)[key];
  s.value = v;
  s.updated_ms = now_ms;
  s.seq++;
  cur = next;
}

stat_snapshot StatCache::snapshot() const {
  std::lock_guard<std::mutex> lk(mtx);
  return cur;
}

const stat_sample *stat_find(const stat_snapshot &snap, const std::string &key) {
  if (!snap) return nullptr;
  auto it = snap->find(key);
  return it == snap->end() ? nullptr : &it->second;
}

// ---------------- poller ----------------

StatPoller::StatPoller(std::shared_ptr<StatSource> src, std::shared_ptr<StatCache> cache)
  : src_(std::move(src)), cache_(std::move(cache)), st_(std::make_shared<shared_state>()), name_(src_->name()) {}

StatPoller::~StatPoller() { stop(200); }

bool StatPoller::start(std::string *err) {
  if (th_.joinable()) return true;
  for (const std::string &k : src_->keys()) {
    if (!cache_->claim(k, name_, err)) return false;
  }
  th_ = std::thread(run, st_, src_, cache_);
  fprintf(stderr, "[poller] %s: %zu keys every %u ms\n", name_.c_str(), src_->keys().size(), src_->intervalMs());
  return true;
}

void StatPoller::run(std::shared_ptr<shared_state> st, std::shared_ptr<StatSource> src, std::shared_ptr<StatCache> cache) {
  const std::vector<std::string> keys = src->keys();
  const uint32_t interval = src->intervalMs() ? src->intervalMs() : 1000;
  for (;;) {
    for (const std::string &k : keys) {
      {
        std::lock_guard<std::mutex> lk(st->mtx);
        if (st->stop) break;
      }
      cache->put(k, src->read(k), monotonic_ms());
    }
    std::unique_lock<std::mutex> lk(st->mtx);
    if (st->cv.wait_for(lk, std::chrono::milliseconds(interval), [&] { return st->stop; })) break;
  }
  std::lock_guard<std::mutex> lk(st->mtx);
  st->done = true;
  st->cv.notify_all();
}

void StatPoller::stop(uint32_t grace_ms) {
  if (!th_.joinable()) return;
  std::unique_lock<std::mutex> lk(st_->mtx);
  st_->stop = true;
  st_->cv.notify_all();
  bool done = st_->cv.wait_for(lk, std::chrono::milliseconds(grace_ms), [&] { return st_->done; });
  lk.unlock();
  if (done) {
    th_.join();
  } else {
    fprintf(stderr, "[poller] %s did not stop within %u ms, detaching\n", name_.c_str(), grace_ms);
    th_.detach();
  }
}
