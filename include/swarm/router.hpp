#pragma once

// swarm/router.hpp - Health-aware, circuit-breaking request routing.
//
// route(role, payload, ctx):
//   1. Candidates = registry.routable(role) (health != unhealthy), by id.
//   2. Round-robin per role from the role's cursor, skipping instances
//      already tried for this request and instances whose circuit refuses
//      try_acquire().
//   3. No candidate on the first attempt -> service-unavailable, at once.
//   4. Transient failure (network-error, timeout, service-unavailable) ->
//      retry on a different instance, at most retry_budget more times; when
//      attempts or alternates run out -> dependency-failure.
//   5. Any other worker error is returned unchanged, without retry.
//
// Circuit accounting: network, timeout, service, dependency, internal and
// unknown categories count as failures. A worker that answers with a
// validation or resource error has behaved correctly and counts as success.
// Cancelled calls release a held half-open trial and count as neither.
//
// Circuits are created on first use and dropped when the registry reports
// the instance deregistered.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "swarm/circuit.hpp"
#include "swarm/context.hpp"
#include "swarm/errors.hpp"
#include "swarm/registry.hpp"
#include "swarm/transport.hpp"

namespace swarm {

struct RouteResponse {
  std::string              instance_id;
  std::string              body;
  uint32_t                 attempts{0};
  std::string              correlation_id;
  std::vector<std::string> failed_instances;
};

// True when an error of this kind should count against an instance's circuit.
bool counts_as_circuit_failure(ErrorKind kind);

class RequestRouter {
 public:
  RequestRouter(std::shared_ptr<ServiceRegistry> registry,
                std::shared_ptr<WorkerTransport> transport);
  ~RequestRouter();

  RequestRouter(const RequestRouter&) = delete;
  RequestRouter& operator=(const RequestRouter&) = delete;

  // Assigns a correlation id when ctx has none; every error returned carries it.
  Result<RouteResponse> route(const std::string& role, const std::string& payload,
                              RequestContext ctx = {});

  // Closed snapshot for instances that have no circuit yet.
  CircuitSnapshot circuit(const std::string& instance_id) const;

  std::string circuits_to_json() const;

 private:
  struct Selection {
    ServiceInstance                 instance;
    std::shared_ptr<CircuitBreaker> breaker;
  };

  // Picks the next eligible instance and reserves its circuit.
  std::optional<Selection> select(const std::string& role,
                                  const std::vector<ServiceInstance>& candidates,
                                  const std::set<std::string>& excluded);

  void on_registry_event(const RegistryEvent& ev);

  std::shared_ptr<ServiceRegistry> registry_;
  std::shared_ptr<WorkerTransport> transport_;
  SwarmConfig                      config_;
  std::shared_ptr<Clock>           clock_;
  uint64_t                         subscription_{0};

  mutable std::mutex                                     mu_;
  std::map<std::string, std::shared_ptr<CircuitBreaker>> circuits_;
  std::map<std::string, uint64_t>                        cursors_;
};

}  // namespace swarm
