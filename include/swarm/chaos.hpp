#pragma once

// swarm/chaos.hpp - Fault injection for resilience testing.
//
// DESIGN:
//   All faults are controlled through the ChaosController singleton. The
//   controller is compiled into every build but is a no-op until activate()
//   is called with the activation key (tests and `swarmctl simulate` only).
//
// INVARIANTS:
//   - Injected faults surface as ordinary StandardErrors at the component
//     that injects them. Nothing is silently dropped.
//   - store_partial_write truncates the temporary file only; the rename that
//     would publish it never happens, so the previous version stays intact.
//
// FAULT CATEGORIES:
//   store_write_failure  put/remove fails before any byte is written
//   store_partial_write  put writes half the payload then fails
//   backup_failure       backup() fails while staging the snapshot
//   network_partition    transport treats the target as unreachable
//   worker_latency       transport delays the call by latency_ms

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace swarm {
namespace chaos {

enum class FaultType : uint8_t {
  none                = 0,
  store_write_failure = 1,
  store_partial_write = 2,
  backup_failure      = 3,
  network_partition   = 4,
  worker_latency      = 5,
};

std::string fault_type_to_string(FaultType ft);
FaultType   fault_type_from_string(const std::string& s);

struct FaultSpec {
  FaultType   type{FaultType::none};
  std::string target;                 // address or record id; empty = any
  double      probability{1.0};       // 0.0-1.0; 1.0 = always inject
  uint64_t    latency_ms{0};          // worker_latency only
  uint32_t    max_inject_count{0};    // 0 = unlimited
  uint32_t    inject_count{0};
};

struct ChaosResult {
  bool      injected{false};
  FaultType fault_type{FaultType::none};
  uint64_t  latency_ms{0};
};

// Thread-safe. Every method is a no-op while the controller is disabled.
class ChaosController {
 public:
  bool is_enabled() const { return enabled_.load(std::memory_order_relaxed); }

  // Wrong keys are refused with a warning.
  void activate(const std::string& activation_key);
  void deactivate();

  void register_fault(const FaultSpec& spec);
  void clear_faults();

  // Fire the first matching fault for `target`, consuming one inject count.
  ChaosResult inject(FaultType fault_type, const std::string& target = "");

  // Same match rules as inject() but consumes nothing.
  bool would_inject(FaultType fault_type, const std::string& target = "") const;

  std::string status_to_json() const;
  uint64_t total_injections() const { return total_injections_.load(std::memory_order_relaxed); }

  static constexpr const char* ACTIVATION_KEY = "swarm-chaos-test-only";

 private:
  std::atomic<bool>      enabled_{false};
  mutable std::mutex     mu_;
  std::vector<FaultSpec> faults_;
  std::atomic<uint64_t>  total_injections_{0};
};

ChaosController& global_chaos();

}  // namespace chaos
}  // namespace swarm
