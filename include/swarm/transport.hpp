#pragma once

// swarm/transport.hpp - How the control plane reaches a worker instance.
//
// DESIGN:
//   WorkerTransport is the only path from the Router or HealthMonitor to a
//   worker. Implementations must:
//     - bound every call by the supplied timeout (timeout error on expiry),
//     - honour the request's cancellation token (cancelled error),
//     - translate every transport-level failure into a StandardError carrying
//       the request's correlation id. Nothing else leaves call().
//
//   InProcessTransport binds addresses to handler functions and runs each
//   call on its own thread, so a stuck handler costs the caller no more than
//   its timeout. It is used by tests and by `swarmctl simulate`; a networked
//   transport would implement the same interface.
//
// INVARIANTS:
//   - The handler sees a per-attempt cancellation token. It fires when the
//     caller cancels, when the call times out, and when the transport is
//     destroyed, so an abandoned attempt can stop before it commits.
//   - Every worker thread is joined: finished ones on the next call, the
//     rest by ~InProcessTransport(). No thread outlives the transport.

#include <cstdint>
#include <atomic>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

#include "swarm/context.hpp"
#include "swarm/errors.hpp"
#include "swarm/registry.hpp"

namespace swarm {

struct WorkerRequest {
  std::string    role;
  std::string    payload;
  RequestContext ctx;
};

class WorkerTransport {
 public:
  virtual ~WorkerTransport() = default;

  // request.ctx carries the correlation id and the caller's cancellation
  // token; timeout_ms is the per-attempt bound chosen by the caller.
  virtual Result<std::string> call(const ServiceInstance& target,
                                   const WorkerRequest& request,
                                   uint64_t timeout_ms) = 0;

  // Liveness probe. A non-ok result is a missed heartbeat.
  virtual Result<HealthState> probe(const ServiceInstance& target, uint64_t timeout_ms) = 0;
};

// Handlers may throw; exceptions become internal-error. A handler can keep
// running after its call timed out (until the transport is destroyed), so it
// must own what it uses and should check request.ctx.cancelled() before
// committing side effects.
using WorkerHandler = std::function<Result<std::string>(const WorkerRequest&)>;
using ProbeHandler  = std::function<HealthState()>;

class InProcessTransport : public WorkerTransport {
 public:
  InProcessTransport() = default;
  // Cancels attempts still running and joins their threads.
  ~InProcessTransport() override;

  InProcessTransport(const InProcessTransport&)            = delete;
  InProcessTransport& operator=(const InProcessTransport&) = delete;

  // A null probe handler answers every probe with healthy.
  void bind(const std::string& address, WorkerHandler handler, ProbeHandler probe = nullptr);
  void unbind(const std::string& address);

  // Unreachable addresses fail calls and probes with network-error.
  void set_reachable(const std::string& address, bool reachable);

  Result<std::string> call(const ServiceInstance& target,
                           const WorkerRequest& request,
                           uint64_t timeout_ms) override;

  Result<HealthState> probe(const ServiceInstance& target, uint64_t timeout_ms) override;

  uint64_t calls_started() const;

  // Worker threads not yet joined, including finished ones awaiting reaping.
  size_t threads_outstanding() const;

 private:
  struct Endpoint {
    WorkerHandler handler;
    ProbeHandler  probe;
  };

  struct Attempt {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
    CancellationToken                  cancel;
  };

  // Runs fn on a tracked thread and waits at most timeout_ms for it. The
  // attempt token handed to fn is cancelled on timeout or caller cancel.
  template <typename T>
  Result<T> run_bounded(std::function<Result<T>(const CancellationToken&)> fn,
                        uint64_t timeout_ms, const CancellationToken& caller,
                        const std::string& correlation_id, const std::string& target_id,
                        const char* what);

  // Joins attempts whose thread has finished. attempts_mu_ must be held.
  void reap_finished_locked();

  // Returns network-error when the address is unbound, unreachable or
  // partitioned by chaos.
  Result<Endpoint> resolve(const ServiceInstance& target, const std::string& correlation_id) const;

  mutable std::mutex              mu_;
  std::map<std::string, Endpoint> endpoints_;
  std::set<std::string>           unreachable_;
  uint64_t                        calls_started_{0};

  mutable std::mutex  attempts_mu_;
  std::list<Attempt>  attempts_;
};

}  // namespace swarm
