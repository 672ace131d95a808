#pragma once

// swarm/cache.hpp - Bounded LRU cache with per-entry time-to-live.
//
// INVARIANTS:
//   - get() never returns an entry whose age has reached its TTL; an expired
//     entry found by get() is evicted on the spot and counts as a miss.
//   - size() <= capacity after every put(); the least recently used entry is
//     evicted first.
//   - All operations are serialized by one mutex; V is copied out, never
//     handed out by reference.
//
// Time comes from the injected Clock so TTL behaviour is testable.

#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "swarm/clock.hpp"

namespace swarm {

struct CacheStats {
  uint64_t hits{0};
  uint64_t misses{0};
  uint64_t evictions{0};
  uint64_t expirations{0};
  uint64_t size{0};
  uint64_t capacity{0};
};

template <typename V>
class TtlCache {
 public:
  TtlCache(size_t capacity, uint64_t ttl_ms, std::shared_ptr<Clock> clock)
      : capacity_(capacity == 0 ? 1 : capacity), ttl_ms_(ttl_ms), clock_(std::move(clock)) {}

  TtlCache(const TtlCache&) = delete;
  TtlCache& operator=(const TtlCache&) = delete;

  std::optional<V> get(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      ++misses_;
      return std::nullopt;
    }
    const uint64_t now = clock_->now_ms();
    if (expired(*it->second, now)) {
      order_.erase(it->second);
      index_.erase(it);
      ++expirations_;
      ++misses_;
      return std::nullopt;
    }
    order_.splice(order_.begin(), order_, it->second);
    ++hits_;
    return it->second->value;
  }

  // ttl_ms = 0 uses the cache default.
  void put(const std::string& key, V value, uint64_t ttl_ms = 0) {
    std::lock_guard<std::mutex> lk(mu_);
    const uint64_t now = clock_->now_ms();
    const uint64_t ttl = ttl_ms == 0 ? ttl_ms_ : ttl_ms;
    auto it = index_.find(key);
    if (it != index_.end()) {
      it->second->value       = std::move(value);
      it->second->inserted_ms = now;
      it->second->ttl_ms      = ttl;
      order_.splice(order_.begin(), order_, it->second);
      return;
    }
    order_.push_front(Entry{key, std::move(value), now, ttl});
    index_[key] = order_.begin();
    while (index_.size() > capacity_) {
      index_.erase(order_.back().key);
      order_.pop_back();
      ++evictions_;
    }
  }

  bool erase(const std::string& key) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return false;
    order_.erase(it->second);
    index_.erase(it);
    return true;
  }

  // Removes every entry whose key satisfies `pred`. Returns the count.
  size_t erase_if(const std::function<bool(const std::string&)>& pred) {
    std::lock_guard<std::mutex> lk(mu_);
    size_t n = 0;
    for (auto it = order_.begin(); it != order_.end();) {
      if (pred(it->key)) {
        index_.erase(it->key);
        it = order_.erase(it);
        ++n;
      } else {
        ++it;
      }
    }
    return n;
  }

  void clear() {
    std::lock_guard<std::mutex> lk(mu_);
    order_.clear();
    index_.clear();
  }

  // Drops expired entries. Run periodically by the maintenance task.
  size_t purge_expired() {
    std::lock_guard<std::mutex> lk(mu_);
    const uint64_t now = clock_->now_ms();
    size_t n = 0;
    for (auto it = order_.begin(); it != order_.end();) {
      if (expired(*it, now)) {
        index_.erase(it->key);
        it = order_.erase(it);
        ++n;
      } else {
        ++it;
      }
    }
    expirations_ += n;
    return n;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return index_.size();
  }

  CacheStats stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    CacheStats s;
    s.hits        = hits_;
    s.misses      = misses_;
    s.evictions   = evictions_;
    s.expirations = expirations_;
    s.size        = index_.size();
    s.capacity    = capacity_;
    return s;
  }

  uint64_t ttl_ms() const { return ttl_ms_; }

 private:
  struct Entry {
    std::string key;
    V           value;
    uint64_t    inserted_ms;
    uint64_t    ttl_ms;
  };

  static bool expired(const Entry& e, uint64_t now) { return now - e.inserted_ms >= e.ttl_ms; }

  const size_t           capacity_;
  const uint64_t         ttl_ms_;
  std::shared_ptr<Clock> clock_;

  mutable std::mutex                                                    mu_;
  std::list<Entry>                                                      order_;  // front = most recent
  std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;
  uint64_t hits_{0};
  uint64_t misses_{0};
  uint64_t evictions_{0};
  uint64_t expirations_{0};
};

}  // namespace swarm
