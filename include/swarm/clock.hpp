#pragma once

// swarm/clock.hpp - Time source shared by every time-dependent rule.
//
// Heartbeat staleness, circuit cool-downs, cache TTLs and the "new record"
// window all read time through a Clock so that tests and simulations can
// drive them deterministically with ManualClock.
//
// All values are milliseconds since the Unix epoch.

#include <atomic>
#include <cstdint>
#include <memory>

namespace swarm {

class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t now_ms() const = 0;
};

class SystemClock : public Clock {
 public:
  uint64_t now_ms() const override;
};

// Thread-safe settable clock. Never moves on its own.
class ManualClock : public Clock {
 public:
  explicit ManualClock(uint64_t start_ms = 1700000000000ULL) : now_(start_ms) {}

  uint64_t now_ms() const override { return now_.load(std::memory_order_acquire); }
  void advance(uint64_t delta_ms) { now_.fetch_add(delta_ms, std::memory_order_acq_rel); }
  void set(uint64_t now_ms) { now_.store(now_ms, std::memory_order_release); }

 private:
  std::atomic<uint64_t> now_;
};

// Process-wide SystemClock instance.
std::shared_ptr<Clock> system_clock();

}  // namespace swarm
