#include "swarm/chaos.hpp"

#include <random>
#include <sstream>

#include "swarm/jsonlite.hpp"
#include "swarm/log.hpp"

namespace swarm {
namespace chaos {

namespace {

bool matches(const FaultSpec& f, FaultType type, const std::string& target) {
  if (f.type != type) return false;
  if (!f.target.empty() && f.target != target) return false;
  return f.max_inject_count == 0 || f.inject_count < f.max_inject_count;
}

}  // namespace

std::string fault_type_to_string(FaultType ft) {
  switch (ft) {
    case FaultType::none: return "none";
    case FaultType::store_write_failure: return "store_write_failure";
    case FaultType::store_partial_write: return "store_partial_write";
    case FaultType::backup_failure: return "backup_failure";
    case FaultType::network_partition: return "network_partition";
    case FaultType::worker_latency: return "worker_latency";
  }
  return "none";
}

FaultType fault_type_from_string(const std::string& s) {
  if (s == "store_write_failure") return FaultType::store_write_failure;
  if (s == "store_partial_write") return FaultType::store_partial_write;
  if (s == "backup_failure") return FaultType::backup_failure;
  if (s == "network_partition") return FaultType::network_partition;
  if (s == "worker_latency") return FaultType::worker_latency;
  return FaultType::none;
}

void ChaosController::activate(const std::string& activation_key) {
  if (activation_key != ACTIVATION_KEY) {
    log_warn("chaos", "invalid activation key, chaos mode not activated");
    return;
  }
  enabled_.store(true, std::memory_order_release);
  log_info("chaos", "chaos mode activated");
}

void ChaosController::deactivate() {
  enabled_.store(false, std::memory_order_release);
  std::lock_guard<std::mutex> lock(mu_);
  faults_.clear();
}

void ChaosController::register_fault(const FaultSpec& spec) {
  if (!is_enabled()) return;
  std::lock_guard<std::mutex> lock(mu_);
  faults_.push_back(spec);
}

void ChaosController::clear_faults() {
  std::lock_guard<std::mutex> lock(mu_);
  faults_.clear();
}

bool ChaosController::would_inject(FaultType fault_type, const std::string& target) const {
  if (!is_enabled()) return false;
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& f : faults_) {
    if (matches(f, fault_type, target)) return true;
  }
  return false;
}

ChaosResult ChaosController::inject(FaultType fault_type, const std::string& target) {
  ChaosResult result;
  result.fault_type = fault_type;
  if (!is_enabled()) return result;

  std::lock_guard<std::mutex> lock(mu_);
  for (auto& spec : faults_) {
    if (!matches(spec, fault_type, target)) continue;

    if (spec.probability < 1.0) {
      static thread_local std::mt19937 rng(std::random_device{}());
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      if (dist(rng) > spec.probability) return result;
    }

    ++spec.inject_count;
    total_injections_.fetch_add(1, std::memory_order_relaxed);
    result.injected   = true;
    result.latency_ms = spec.latency_ms;
    log_debug("chaos", "injected " + fault_type_to_string(fault_type) +
                           (target.empty() ? std::string() : " at " + target));
    return result;
  }
  return result;
}

std::string ChaosController::status_to_json() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream o;
  o << "{\"enabled\":" << (is_enabled() ? "true" : "false")
    << ",\"total_injections\":" << total_injections_.load(std::memory_order_relaxed)
    << ",\"faults\":[";
  for (size_t i = 0; i < faults_.size(); ++i) {
    const auto& f = faults_[i];
    if (i) o << ",";
    o << "{\"type\":\"" << fault_type_to_string(f.type) << "\""
      << ",\"target\":\"" << jsonlite::escape(f.target) << "\""
      << ",\"probability\":" << jsonlite::format_double(f.probability)
      << ",\"latency_ms\":" << f.latency_ms
      << ",\"max_inject_count\":" << f.max_inject_count
      << ",\"inject_count\":" << f.inject_count << "}";
  }
  o << "]}";
  return o.str();
}

ChaosController& global_chaos() {
  static ChaosController inst;
  return inst;
}

}  // namespace chaos
}  // namespace swarm
