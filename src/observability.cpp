#include "swarm/observability.hpp"

#include <bit>
#include <chrono>
#include <cstdio>
#include <cstdlib>

#include "swarm/jsonlite.hpp"

namespace swarm {

namespace {

// bit_width(x) == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_us(uint64_t duration_us) {
  if (duration_us == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_us));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* fmt, double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += buf;
}

std::atomic<SwarmEventHook> g_event_hook{nullptr};

}  // namespace

// ---------------------------------------------------------------------------
// SwarmEvent
// ---------------------------------------------------------------------------

std::string SwarmEvent::to_json() const {
  std::string line;
  line.reserve(256);
  line += "{\"type\":\"";
  line += jsonlite::escape(type);
  line += "\",\"component\":\"";
  line += jsonlite::escape(component);
  line += "\",\"subject_id\":\"";
  line += jsonlite::escape(subject_id);
  line += "\",\"correlation_id\":\"";
  line += jsonlite::escape(correlation_id);
  line += "\",\"ok\":";
  line += ok ? "true" : "false";
  line += ",\"error_kind\":\"";
  line += error_kind;
  line += "\",\"duration_ns\":";
  line += std::to_string(duration_ns);
  line += ",\"timestamp_unix_ms\":";
  line += std::to_string(timestamp_unix_ms);
  line += ",\"detail\":\"";
  line += jsonlite::escape(detail);
  line += "\"}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_us_.store(0, std::memory_order_relaxed);
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_us\":";
  append_fixed(out, "%.2f", mean_us());
  out += ",\"p50_ms\":";
  append_fixed(out, "%.3f", percentile(0.50) / 1000.0);
  out += ",\"p95_ms\":";
  append_fixed(out, "%.3f", percentile(0.95) / 1000.0);
  out += ",\"p99_ms\":";
  append_fixed(out, "%.3f", percentile(0.99) / 1000.0);
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// SwarmStats
// ---------------------------------------------------------------------------

void SwarmStats::record_failure(ErrorKind kind) {
  std::lock_guard<std::mutex> lk(failure_mu_);
  ++failures_by_kind_[to_string(kind)];
}

std::map<std::string, uint64_t> SwarmStats::failure_counts() const {
  std::lock_guard<std::mutex> lk(failure_mu_);
  return failures_by_kind_;
}

void SwarmStats::record_event(const SwarmEvent& ev) {
  if (!ev.ok && !ev.error_kind.empty()) {
    std::lock_guard<std::mutex> lk(failure_mu_);
    ++failures_by_kind_[ev.error_kind];
  }
  if (ev.type == "route") route_latency.record(ev.duration_ns);

  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) {
    ring_buffer_.push_back(ev);
  } else {
    ring_buffer_[ring_head_] = ev;
  }
  ring_head_ = (ring_head_ + 1) % kMaxRecentEvents;
}

std::vector<SwarmEvent> SwarmStats::recent_events_snapshot() const {
  std::lock_guard<std::mutex> lk(ring_mu_);
  if (ring_buffer_.size() < kMaxRecentEvents) return ring_buffer_;
  // Full ring: oldest entry sits at ring_head_.
  std::vector<SwarmEvent> out;
  out.reserve(kMaxRecentEvents);
  for (size_t i = 0; i < kMaxRecentEvents; ++i) {
    out.push_back(ring_buffer_[(ring_head_ + i) % kMaxRecentEvents]);
  }
  return out;
}

void SwarmStats::reset() {
  for (auto* c : {&routes_total, &routes_failed, &retries, &circuit_opens,
                  &store_puts, &store_gets, &store_recoveries, &store_corruptions,
                  &backups_taken, &cache_hits, &cache_misses, &registrations,
                  &deregistrations, &sweeps}) {
    c->store(0, std::memory_order_relaxed);
  }
  route_latency.reset();
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    failures_by_kind_.clear();
  }
  std::lock_guard<std::mutex> lk(ring_mu_);
  ring_buffer_.clear();
  ring_head_ = 0;
}

std::string SwarmStats::to_json() const {
  auto n = [](const std::atomic<uint64_t>& a) {
    return std::to_string(a.load(std::memory_order_relaxed));
  };
  const uint64_t hits = cache_hits.load(std::memory_order_relaxed);
  const uint64_t misses = cache_misses.load(std::memory_order_relaxed);
  const double hit_rate = (hits + misses) > 0
      ? static_cast<double>(hits) / static_cast<double>(hits + misses)
      : 0.0;

  std::string out;
  out.reserve(768);
  out += "{\"router\":{\"routes_total\":" + n(routes_total);
  out += ",\"routes_failed\":" + n(routes_failed);
  out += ",\"retries\":" + n(retries);
  out += ",\"circuit_opens\":" + n(circuit_opens);
  out += ",\"latency\":" + route_latency.to_json();
  out += "},\"store\":{\"puts\":" + n(store_puts);
  out += ",\"gets\":" + n(store_gets);
  out += ",\"recoveries\":" + n(store_recoveries);
  out += ",\"corruptions\":" + n(store_corruptions);
  out += ",\"backups\":" + n(backups_taken);
  out += "},\"cache\":{\"hits\":" + n(cache_hits);
  out += ",\"misses\":" + n(cache_misses);
  out += ",\"hit_rate\":";
  append_fixed(out, "%.6f", hit_rate);
  out += "},\"registry\":{\"registrations\":" + n(registrations);
  out += ",\"deregistrations\":" + n(deregistrations);
  out += ",\"sweeps\":" + n(sweeps);
  out += "},\"failures\":{";
  {
    std::lock_guard<std::mutex> lk(failure_mu_);
    bool first = true;
    for (const auto& [kind, count] : failures_by_kind_) {
      if (!first) out += ",";
      first = false;
      out += "\"" + kind + "\":" + std::to_string(count);
    }
  }
  out += "}}";
  return out;
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

SwarmStats& global_swarm_stats() {
  static SwarmStats inst;
  return inst;
}

void set_event_hook(SwarmEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void emit_event(const SwarmEvent& ev) {
  global_swarm_stats().record_event(ev);

  SwarmEventHook hook = g_event_hook.load(std::memory_order_acquire);
  if (hook) {
    hook(ev);
    return;
  }

  // SWARM_EVENT_LOG=/path/to/events.jsonl, one object per line.
  const char* log_path = std::getenv("SWARM_EVENT_LOG");
  if (!log_path || !log_path[0]) return;

  const std::string line = ev.to_json() + "\n";
  // O_APPEND writes below PIPE_BUF are atomic on POSIX.
  if (FILE* f = std::fopen(log_path, "a")) {
    std::fwrite(line.data(), 1, line.size(), f);
    std::fclose(f);
  }
}

}  // namespace swarm
