#include "swarm/health_monitor.hpp"

#include "swarm/log.hpp"

namespace swarm {

HealthMonitor::HealthMonitor(std::shared_ptr<ServiceRegistry> registry,
                             std::shared_ptr<WorkerTransport> transport)
    : registry_(std::move(registry)),
      transport_(std::move(transport)),
      interval_(std::chrono::milliseconds(registry_->config().heartbeat_interval_ms)) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::add_maintenance(std::function<void()> task) {
  std::lock_guard<std::mutex> lk(tasks_mu_);
  tasks_.push_back(std::move(task));
}

HealthTickReport HealthMonitor::run_once() {
  HealthTickReport report;
  const SwarmConfig& cfg = registry_->config();

  if (transport_ && cfg.probe_on_sweep) {
    for (const auto& inst : registry_->list()) {
      if (stopping_.load(std::memory_order_acquire)) break;
      ++report.probed;
      auto probed = transport_->probe(inst, cfg.probe_timeout_ms);
      if (!probed) {
        ++report.probe_failures;
        log_debug("health", "probe of " + inst.id + " failed: " + probed.error().message);
        continue;
      }
      // The instance may have been deregistered while we probed it.
      if (auto st = registry_->heartbeat(inst.id, probed.value())) {
        log_debug("health", "dropping probe result for " + inst.id + ": " + st->message);
      }
    }
  }

  report.sweep = registry_->sweep();

  std::vector<std::function<void()>> tasks;
  {
    std::lock_guard<std::mutex> lk(tasks_mu_);
    tasks = tasks_;
  }
  for (const auto& t : tasks) t();
  return report;
}

void HealthMonitor::start() {
  std::lock_guard<std::mutex> life(lifecycle_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  running_  = true;
  worker_   = std::thread([this] { worker_loop(); });
}

void HealthMonitor::stop() {
  std::lock_guard<std::mutex> life(lifecycle_mu_);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!worker_.joinable()) return;
    stopping_ = true;
  }
  cv_.notify_all();
  // worker_loop only takes mu_, so joining under lifecycle_mu_ is safe.
  worker_.join();
  std::lock_guard<std::mutex> lock(mu_);
  running_  = false;
  stopping_ = false;
}

void HealthMonitor::worker_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, interval_, [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    const auto report = run_once();
    if (!report.sweep.deregistered.empty() || !report.sweep.marked_unhealthy.empty()) {
      log_info("health", "sweep: " + std::to_string(report.sweep.marked_unhealthy.size()) +
                             " unhealthy, " + std::to_string(report.sweep.deregistered.size()) +
                             " deregistered");
    }
  }
}

}  // namespace swarm
