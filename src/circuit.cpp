#include "swarm/circuit.hpp"

#include <algorithm>
#include <sstream>

namespace swarm {

std::string to_string(CircuitState s) {
  switch (s) {
    case CircuitState::closed: return "closed";
    case CircuitState::open: return "open";
    case CircuitState::half_open: return "half-open";
  }
  return "closed";
}

std::string CircuitSnapshot::to_json() const {
  std::ostringstream o;
  o << "{\"state\":\"" << to_string(state) << "\""
    << ",\"failure_count\":" << failure_count
    << ",\"open_until_unix_ms\":" << open_until_unix_ms
    << ",\"cooldown_ms\":" << cooldown_ms
    << ",\"trial_in_flight\":" << (trial_in_flight ? "true" : "false")
    << ",\"times_opened\":" << times_opened << "}";
  return o.str();
}

CircuitBreaker::CircuitBreaker(const SwarmConfig& config, std::shared_ptr<Clock> clock)
    : threshold_(config.circuit_failure_threshold),
      window_ms_(config.circuit_window_ms),
      base_cooldown_ms_(config.circuit_cooldown_ms),
      multiplier_(config.circuit_cooldown_multiplier),
      max_cooldown_ms_(config.circuit_cooldown_max_ms),
      clock_(std::move(clock)),
      cooldown_ms_(config.circuit_cooldown_ms) {}

void CircuitBreaker::refresh_locked(uint64_t now) const {
  if (state_ == CircuitState::open && now >= open_until_) {
    state_ = CircuitState::half_open;
  }
}

void CircuitBreaker::prune_locked(uint64_t now) {
  while (!failures_.empty() && now - failures_.front() > window_ms_) failures_.pop_front();
}

void CircuitBreaker::open_locked(uint64_t now, uint64_t cooldown_ms) {
  state_           = CircuitState::open;
  cooldown_ms_     = cooldown_ms;
  open_until_      = now + cooldown_ms;
  trial_in_flight_ = false;
  ++times_opened_;
}

bool CircuitBreaker::try_acquire() {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_locked(clock_->now_ms());
  switch (state_) {
    case CircuitState::closed: return true;
    case CircuitState::open: return false;
    case CircuitState::half_open:
      if (trial_in_flight_) return false;
      trial_in_flight_ = true;
      return true;
  }
  return false;
}

bool CircuitBreaker::is_selectable() const {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_locked(clock_->now_ms());
  if (state_ == CircuitState::closed) return true;
  return state_ == CircuitState::half_open && !trial_in_flight_;
}

void CircuitBreaker::on_success() {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_locked(clock_->now_ms());
  switch (state_) {
    case CircuitState::closed:
      failures_.clear();
      break;
    case CircuitState::half_open:
      state_           = CircuitState::closed;
      trial_in_flight_ = false;
      failures_.clear();
      cooldown_ms_ = base_cooldown_ms_;
      break;
    case CircuitState::open:
      // Late reply from a call dispatched before the circuit opened.
      break;
  }
}

bool CircuitBreaker::on_failure() {
  std::lock_guard<std::mutex> lk(mu_);
  const uint64_t now = clock_->now_ms();
  refresh_locked(now);
  switch (state_) {
    case CircuitState::closed:
      failures_.push_back(now);
      prune_locked(now);
      if (failures_.size() >= threshold_) {
        open_locked(now, base_cooldown_ms_);
        return true;
      }
      return false;
    case CircuitState::half_open: {
      const uint64_t extended =
          std::min<uint64_t>(cooldown_ms_ * std::max<uint32_t>(multiplier_, 1), max_cooldown_ms_);
      failures_.push_back(now);
      open_locked(now, extended);
      return true;
    }
    case CircuitState::open:
      return false;
  }
  return false;
}

void CircuitBreaker::on_abandoned() {
  std::lock_guard<std::mutex> lk(mu_);
  if (state_ == CircuitState::half_open) trial_in_flight_ = false;
}

CircuitState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_locked(clock_->now_ms());
  return state_;
}

CircuitSnapshot CircuitBreaker::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  refresh_locked(clock_->now_ms());
  CircuitSnapshot s;
  s.state              = state_;
  s.failure_count      = static_cast<uint32_t>(failures_.size());
  s.open_until_unix_ms = state_ == CircuitState::closed ? 0 : open_until_;
  s.cooldown_ms        = cooldown_ms_;
  s.trial_in_flight    = trial_in_flight_;
  s.times_opened       = times_opened_;
  return s;
}

}  // namespace swarm
