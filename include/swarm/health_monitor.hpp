#pragma once

// swarm/health_monitor.hpp - Periodic liveness probing and staleness sweep.
//
// Each tick:
//   1. probes every registered instance through the transport (when
//      probe_on_sweep is set); a successful probe is a heartbeat carrying the
//      reported state, a failed probe is simply a missed heartbeat,
//   2. runs ServiceRegistry::sweep(),
//   3. runs registered maintenance tasks (cache expiry and the like).
//
// The background thread waits on a condition variable between ticks, so
// stop() returns within one probe timeout. run_once() performs a single tick
// on the caller's thread and is what tests drive.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "swarm/registry.hpp"
#include "swarm/transport.hpp"

namespace swarm {

struct HealthTickReport {
  uint32_t    probed{0};
  uint32_t    probe_failures{0};
  SweepReport sweep;
};

class HealthMonitor {
 public:
  // transport may be null: the monitor then relies on pushed heartbeats only.
  HealthMonitor(std::shared_ptr<ServiceRegistry> registry,
                std::shared_ptr<WorkerTransport> transport);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void add_maintenance(std::function<void()> task);

  HealthTickReport run_once();

  void start();
  void stop();
  bool running() const { return running_.load(std::memory_order_acquire); }

 private:
  void worker_loop();

  std::shared_ptr<ServiceRegistry>   registry_;
  std::shared_ptr<WorkerTransport>   transport_;
  std::chrono::milliseconds          interval_;

  std::mutex                         tasks_mu_;
  std::vector<std::function<void()>> tasks_;

  // Serializes start() and stop(); held across the join.
  std::mutex              lifecycle_mu_;
  std::thread             worker_;
  std::mutex              mu_;
  std::condition_variable cv_;
  std::atomic<bool>       stopping_{false};
  std::atomic<bool>       running_{false};
};

}  // namespace swarm
