#include "swarm/transport.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <thread>

#include "swarm/chaos.hpp"
#include "swarm/log.hpp"

namespace swarm {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(5);

// Sleeps for ms unless the token fires first.
void sleep_unless_cancelled(const CancellationToken& cancel, uint64_t ms) {
  const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (!cancel.cancelled()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= until) return;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kWaitSlice, until - now));
  }
}

}  // namespace

InProcessTransport::~InProcessTransport() {
  std::list<Attempt> pending;
  {
    std::lock_guard<std::mutex> lk(attempts_mu_);
    pending.swap(attempts_);
  }
  for (auto& a : pending) a.cancel.cancel();
  for (auto& a : pending) {
    if (a.thread.joinable()) a.thread.join();
  }
  if (!pending.empty()) {
    log_debug("transport", "joined " + std::to_string(pending.size()) + " worker threads on shutdown");
  }
}

void InProcessTransport::reap_finished_locked() {
  for (auto it = attempts_.begin(); it != attempts_.end();) {
    if (it->done->load(std::memory_order_acquire)) {
      if (it->thread.joinable()) it->thread.join();
      it = attempts_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t InProcessTransport::threads_outstanding() const {
  std::lock_guard<std::mutex> lk(attempts_mu_);
  return attempts_.size();
}

template <typename T>
Result<T> InProcessTransport::run_bounded(std::function<Result<T>(const CancellationToken&)> fn,
                                          uint64_t timeout_ms, const CancellationToken& caller,
                                          const std::string& correlation_id,
                                          const std::string& target_id, const char* what) {
  auto promise = std::make_shared<std::promise<Result<T>>>();
  std::future<Result<T>> fut = promise->get_future();
  CancellationToken attempt;
  {
    std::lock_guard<std::mutex> lk(attempts_mu_);
    reap_finished_locked();
    Attempt a;
    a.done   = std::make_shared<std::atomic<bool>>(false);
    a.cancel = attempt;
    a.thread = std::thread([promise, fn = std::move(fn), attempt, done = a.done, correlation_id,
                            target_id]() {
      try {
        promise->set_value(fn(attempt));
      } catch (const std::exception& e) {
        promise->set_value(Result<T>(make_error(ErrorKind::internal_error,
                                                std::string("worker raised: ") + e.what(),
                                                correlation_id, {{"instance", target_id}})));
      } catch (...) {
        promise->set_value(Result<T>(make_error(ErrorKind::internal_error,
                                                "worker raised a non-standard exception",
                                                correlation_id, {{"instance", target_id}})));
      }
      done->store(true, std::memory_order_release);
    });
    attempts_.push_back(std::move(a));
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  for (;;) {
    if (caller.cancelled()) {
      attempt.cancel();
      return make_error(ErrorKind::cancelled, std::string(what) + " cancelled by caller",
                        correlation_id, {{"instance", target_id}});
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      attempt.cancel();
      return make_error(ErrorKind::timeout, std::string(what) + " timed out", correlation_id,
                        {{"instance", target_id}, {"timeout_ms", std::to_string(timeout_ms)}});
    }
    const auto slice = std::min<std::chrono::steady_clock::duration>(kWaitSlice, deadline - now);
    if (fut.wait_for(slice) == std::future_status::ready) return fut.get();
  }
}

void InProcessTransport::bind(const std::string& address, WorkerHandler handler, ProbeHandler probe) {
  std::lock_guard<std::mutex> lk(mu_);
  endpoints_[address] = Endpoint{std::move(handler), std::move(probe)};
}

void InProcessTransport::unbind(const std::string& address) {
  std::lock_guard<std::mutex> lk(mu_);
  endpoints_.erase(address);
}

void InProcessTransport::set_reachable(const std::string& address, bool reachable) {
  std::lock_guard<std::mutex> lk(mu_);
  if (reachable) unreachable_.erase(address);
  else unreachable_.insert(address);
}

uint64_t InProcessTransport::calls_started() const {
  std::lock_guard<std::mutex> lk(mu_);
  return calls_started_;
}

Result<InProcessTransport::Endpoint> InProcessTransport::resolve(
    const ServiceInstance& target, const std::string& correlation_id) const {
  const std::map<std::string, std::string> details = {{"instance", target.id},
                                                      {"address", target.address}};
  if (chaos::global_chaos().inject(chaos::FaultType::network_partition, target.address).injected) {
    return make_error(ErrorKind::network_error, "network partition", correlation_id, details);
  }
  std::lock_guard<std::mutex> lk(mu_);
  if (unreachable_.count(target.address) != 0) {
    return make_error(ErrorKind::network_error, "address unreachable", correlation_id, details);
  }
  auto it = endpoints_.find(target.address);
  if (it == endpoints_.end()) {
    return make_error(ErrorKind::network_error, "connection refused", correlation_id, details);
  }
  return it->second;
}

Result<std::string> InProcessTransport::call(const ServiceInstance& target,
                                             const WorkerRequest& request,
                                             uint64_t timeout_ms) {
  const std::string& cid = request.ctx.correlation_id;
  auto ep = resolve(target, cid);
  if (!ep) return ep.error();
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++calls_started_;
  }

  const uint64_t latency =
      chaos::global_chaos().inject(chaos::FaultType::worker_latency, target.address).latency_ms;

  WorkerHandler handler = ep.value().handler;
  std::function<Result<std::string>(const CancellationToken&)> fn =
      [handler, request, latency](const CancellationToken& attempt) -> Result<std::string> {
    WorkerRequest scoped = request;
    scoped.ctx.cancel    = attempt;
    if (latency > 0) sleep_unless_cancelled(attempt, latency);
    if (attempt.cancelled()) {
      return make_error(ErrorKind::cancelled, "request cancelled before dispatch",
                        request.ctx.correlation_id);
    }
    return handler(scoped);
  };
  auto out = run_bounded<std::string>(std::move(fn), timeout_ms, request.ctx.cancel, cid,
                                      target.id, "worker call");
  if (!out) {
    // Errors produced by the worker keep their kind but must carry this
    // request's correlation id.
    if (out.error().correlation_id.empty()) out.error().correlation_id = cid;
    log_debug("transport", "call to " + target.id + " failed: " + to_string(out.error().kind));
  }
  return out;
}

Result<HealthState> InProcessTransport::probe(const ServiceInstance& target, uint64_t timeout_ms) {
  auto ep = resolve(target, "");
  if (!ep) return ep.error();
  ProbeHandler probe = ep.value().probe;
  if (!probe) return HealthState::healthy;

  std::function<Result<HealthState>(const CancellationToken&)> fn =
      [probe](const CancellationToken&) -> Result<HealthState> { return probe(); };
  return run_bounded<HealthState>(std::move(fn), timeout_ms, CancellationToken{}, "", target.id,
                                  "liveness probe");
}

}  // namespace swarm
