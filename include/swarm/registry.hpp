#pragma once

// swarm/registry.hpp - Service registry: who is alive, in which role.
//
// DESIGN:
//   ServiceRegistry owns every ServiceInstance. Instances enter through
//   register_instance(), change health through heartbeat() and sweep(), and
//   leave through deregister() or sweep(). Nothing else mutates them; callers
//   only ever receive copies.
//
//   Health policy (driven by sweep(), normally from HealthMonitor):
//     now - last_heartbeat >  stale_after_ms       -> unhealthy
//     now - last_heartbeat >  deregister_after_ms  -> deregistered
//
// CHANGE FEED:
//   subscribe() delivers registered / health_changed / deregistered events.
//   Listeners run on the mutating thread after the registry lock has been
//   released, so a listener may call back into the registry. generation()
//   increases by one on every delivered transition.
//
// INVARIANTS:
//   - At most one instance per id.
//   - A new instance starts with health = unknown and
//     last_heartbeat = registration time.
//   - routable() never returns an instance whose health is unhealthy.

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "swarm/clock.hpp"
#include "swarm/config.hpp"
#include "swarm/errors.hpp"

namespace swarm {

enum class HealthState {
  unknown,
  healthy,
  degraded,
  unhealthy,
};

std::string                to_string(HealthState h);
std::optional<HealthState> health_state_from_string(const std::string& s);

struct ServiceInstance {
  std::string              id;
  std::string              role;
  std::string              address;
  std::vector<std::string> capabilities;
  HealthState              health{HealthState::unknown};
  uint64_t                 last_heartbeat_unix_ms{0};
  uint64_t                 registered_at_unix_ms{0};

  std::string to_json() const;
};

enum class RegistryEventType {
  registered,
  health_changed,
  deregistered,
};

std::string to_string(RegistryEventType t);

struct RegistryEvent {
  RegistryEventType type{RegistryEventType::registered};
  ServiceInstance   instance;
  HealthState       previous{HealthState::unknown};
  std::string       reason;
  uint64_t          generation{0};
};

using RegistryListener = std::function<void(const RegistryEvent&)>;

struct SweepReport {
  std::vector<std::string> marked_unhealthy;
  std::vector<std::string> deregistered;
};

// Thread-safe.
class ServiceRegistry {
 public:
  explicit ServiceRegistry(const SwarmConfig& config,
                           std::shared_ptr<Clock> clock = system_clock());

  ServiceRegistry(const ServiceRegistry&) = delete;
  ServiceRegistry& operator=(const ServiceRegistry&) = delete;

  // missing-field when id, role or address is empty; invalid-input when the
  // id is already registered under a different address. Re-registering the
  // same id at the same address refreshes it (health back to unknown).
  Status register_instance(const ServiceInstance& descriptor,
                           const std::string& correlation_id = "");

  // Idempotent.
  void deregister(const std::string& id, const std::string& reason = "explicit");

  // Empty role = every role.
  std::vector<ServiceInstance> list(const std::string& role = "") const;

  // Instances of `role` whose health is not unhealthy, ordered by id.
  std::vector<ServiceInstance> routable(const std::string& role) const;

  std::optional<ServiceInstance> find(const std::string& id) const;

  // resource-not-found for an unknown id.
  Status heartbeat(const std::string& id, HealthState status,
                   const std::string& correlation_id = "");

  // One staleness pass against the clock.
  SweepReport sweep();

  uint64_t subscribe(RegistryListener listener);
  void     unsubscribe(uint64_t subscription_id);

  uint64_t generation() const;
  size_t   size() const;

  const SwarmConfig& config() const { return config_; }
  const std::shared_ptr<Clock>& clock() const { return clock_; }

  std::string to_json() const;

 private:
  // Must be called with mu_ held.
  int find_index(const std::string& id) const;

  // Delivers events to listeners. Must be called without mu_ held.
  void publish(const std::vector<RegistryEvent>& events);

  SwarmConfig            config_;
  std::shared_ptr<Clock> clock_;

  mutable std::mutex           mu_;
  std::vector<ServiceInstance> instances_;
  uint64_t                     generation_{0};

  mutable std::mutex                   listeners_mu_;
  std::map<uint64_t, RegistryListener> listeners_;
  uint64_t                             next_listener_id_{1};
};

}  // namespace swarm
