#pragma once

// swarm/circuit.hpp - Per-instance circuit breaker.
//
// STATE MACHINE:
//   closed    --(failures in window >= threshold)-->  open
//   open      --(now >= open_until)--------------->  half_open   (lazy, on read)
//   half_open --(trial succeeds)------------------>  closed      (count and cool-down reset)
//   half_open --(trial fails)--------------------->  open        (cool-down * multiplier, capped)
//
// INVARIANTS:
//   - While open, try_acquire() and is_selectable() are false.
//   - In half_open exactly one caller holds the trial; try_acquire() is false
//     for everyone else until that caller reports success, failure or
//     abandonment.
//   - A success while closed clears the failure history, so the threshold
//     counts consecutive failures inside the window.
//   - Abandoned (cancelled) calls never change the failure count.

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "swarm/clock.hpp"
#include "swarm/config.hpp"

namespace swarm {

enum class CircuitState {
  closed,
  open,
  half_open,
};

std::string to_string(CircuitState s);

struct CircuitSnapshot {
  CircuitState state{CircuitState::closed};
  uint32_t     failure_count{0};
  uint64_t     open_until_unix_ms{0};
  uint64_t     cooldown_ms{0};
  bool         trial_in_flight{false};
  uint64_t     times_opened{0};

  std::string to_json() const;
};

// Thread-safe.
class CircuitBreaker {
 public:
  CircuitBreaker(const SwarmConfig& config, std::shared_ptr<Clock> clock);

  // True when a call may be sent now. In half_open this reserves the trial.
  bool try_acquire();

  // Same answer as try_acquire() without reserving anything.
  bool is_selectable() const;

  void on_success();

  // Returns true when this failure moved the circuit to open.
  bool on_failure();

  // The call was cancelled before it completed; releases a held trial.
  void on_abandoned();

  CircuitState    state() const;
  CircuitSnapshot snapshot() const;

 private:
  // Must be called with mu_ held.
  void refresh_locked(uint64_t now) const;
  void prune_locked(uint64_t now);
  void open_locked(uint64_t now, uint64_t cooldown_ms);

  uint32_t               threshold_;
  uint64_t               window_ms_;
  uint64_t               base_cooldown_ms_;
  uint32_t               multiplier_;
  uint64_t               max_cooldown_ms_;
  std::shared_ptr<Clock> clock_;

  mutable std::mutex    mu_;
  mutable CircuitState  state_{CircuitState::closed};
  std::deque<uint64_t>  failures_;
  uint64_t              open_until_{0};
  uint64_t              cooldown_ms_;
  bool                  trial_in_flight_{false};
  uint64_t              times_opened_{0};
};

}  // namespace swarm
