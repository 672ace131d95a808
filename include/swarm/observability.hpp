#pragma once

// swarm/observability.hpp - Structured events and process-wide statistics.
//
// DESIGN:
//   SwarmEvent is the observable unit. Routed calls, store operations and
//   registry transitions each emit one. emit_event():
//     1. records the event in global_swarm_stats() (always),
//     2. forwards it to the registered hook, if any,
//     3. otherwise appends one JSON line to $SWARM_EVENT_LOG when set.
//   Emission never fails the operation that produced the event.
//
// INVARIANTS:
//   - Counters only ever increase during a process lifetime (reset() is for
//     tests).
//   - The recent-event ring never holds more than kMaxRecentEvents entries.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "swarm/errors.hpp"

namespace swarm {

// ---------------------------------------------------------------------------
// SwarmEvent
// ---------------------------------------------------------------------------
struct SwarmEvent {
  std::string type;            // "route", "store.put", "registry.deregistered", ...
  std::string component;       // "router", "store", "registry", "cache", ...
  std::string subject_id;      // instance id or record id
  std::string correlation_id;
  bool        ok{true};
  std::string error_kind;      // empty when ok
  uint64_t    duration_ns{0};
  uint64_t    timestamp_unix_ms{0};
  std::string detail;

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// LatencyHistogram - power-of-two microsecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1) us, 2^i us); bucket 0 is [0, 1us).
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);

  // Approximate percentile in microseconds. p in [0.0, 1.0].
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  uint64_t sum_us() const { return sum_us_.load(std::memory_order_relaxed); }
  double mean_us() const;

  void reset();
  std::string to_json() const;

 private:
  alignas(64) std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  alignas(64) std::atomic<uint64_t> count_{0};
  alignas(64) std::atomic<uint64_t> sum_us_{0};
};

// ---------------------------------------------------------------------------
// SwarmStats
// ---------------------------------------------------------------------------
class SwarmStats {
 public:
  void record_event(const SwarmEvent& ev);
  void record_failure(ErrorKind kind);
  std::map<std::string, uint64_t> failure_counts() const;

  std::string to_json() const;
  void reset();

  // --- Router ---
  alignas(64) std::atomic<uint64_t> routes_total{0};
  alignas(64) std::atomic<uint64_t> routes_failed{0};
  alignas(64) std::atomic<uint64_t> retries{0};
  alignas(64) std::atomic<uint64_t> circuit_opens{0};

  // --- Store ---
  alignas(64) std::atomic<uint64_t> store_puts{0};
  alignas(64) std::atomic<uint64_t> store_gets{0};
  alignas(64) std::atomic<uint64_t> store_recoveries{0};
  alignas(64) std::atomic<uint64_t> store_corruptions{0};
  alignas(64) std::atomic<uint64_t> backups_taken{0};

  // --- Cache ---
  alignas(64) std::atomic<uint64_t> cache_hits{0};
  alignas(64) std::atomic<uint64_t> cache_misses{0};

  // --- Registry ---
  alignas(64) std::atomic<uint64_t> registrations{0};
  alignas(64) std::atomic<uint64_t> deregistrations{0};
  alignas(64) std::atomic<uint64_t> sweeps{0};

  LatencyHistogram route_latency;

  static constexpr size_t kMaxRecentEvents = 256;
  std::vector<SwarmEvent> recent_events_snapshot() const;

 private:
  mutable std::mutex failure_mu_;
  std::map<std::string, uint64_t> failures_by_kind_;

  mutable std::mutex ring_mu_;
  std::vector<SwarmEvent> ring_buffer_;
  size_t ring_head_{0};
};

SwarmStats& global_swarm_stats();

void emit_event(const SwarmEvent& ev);

using SwarmEventHook = void (*)(const SwarmEvent&);
void set_event_hook(SwarmEventHook hook);

// ---------------------------------------------------------------------------
// ScopeTimer - RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t& out_ns;
  explicit ScopeTimer(uint64_t& out) : out_ns(out) {}
  ~ScopeTimer() {
    out_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace swarm
