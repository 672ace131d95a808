#include "swarm/router.hpp"

#include <sstream>

#include "swarm/log.hpp"
#include "swarm/observability.hpp"

namespace swarm {

namespace {

void emit_route_event(const std::string& role, const std::string& instance_id,
                      const std::string& cid, const StandardError* err, uint64_t duration_ns,
                      uint64_t now, uint32_t attempts) {
  SwarmEvent e;
  e.type              = "route";
  e.component         = "router";
  e.subject_id        = instance_id;
  e.correlation_id    = cid;
  e.ok                = err == nullptr;
  e.error_kind        = err ? to_string(err->kind) : "";
  e.duration_ns       = duration_ns;
  e.timestamp_unix_ms = now;
  e.detail            = "role=" + role + " attempts=" + std::to_string(attempts);
  emit_event(e);
}

}  // namespace

bool counts_as_circuit_failure(ErrorKind kind) {
  switch (category_of(kind)) {
    case ErrorCategory::network:
    case ErrorCategory::service:
    case ErrorCategory::dependency:
    case ErrorCategory::internal:
    case ErrorCategory::unknown:
      return true;
    case ErrorCategory::timeout:
      return kind != ErrorKind::cancelled;
    default:
      return false;
  }
}

RequestRouter::RequestRouter(std::shared_ptr<ServiceRegistry> registry,
                             std::shared_ptr<WorkerTransport> transport)
    : registry_(std::move(registry)),
      transport_(std::move(transport)),
      config_(registry_->config()),
      clock_(registry_->clock()) {
  subscription_ = registry_->subscribe([this](const RegistryEvent& ev) { on_registry_event(ev); });
}

RequestRouter::~RequestRouter() { registry_->unsubscribe(subscription_); }

void RequestRouter::on_registry_event(const RegistryEvent& ev) {
  if (ev.type != RegistryEventType::deregistered) return;
  std::lock_guard<std::mutex> lk(mu_);
  circuits_.erase(ev.instance.id);
}

std::optional<RequestRouter::Selection> RequestRouter::select(
    const std::string& role, const std::vector<ServiceInstance>& candidates,
    const std::set<std::string>& excluded) {
  if (candidates.empty()) return std::nullopt;
  std::lock_guard<std::mutex> lk(mu_);
  uint64_t& cursor = cursors_[role];
  const size_t n = candidates.size();
  const size_t start = static_cast<size_t>(cursor % n);
  for (size_t i = 0; i < n; ++i) {
    const ServiceInstance& c = candidates[(start + i) % n];
    if (excluded.count(c.id) != 0) continue;
    auto& slot = circuits_[c.id];
    if (!slot) slot = std::make_shared<CircuitBreaker>(config_, clock_);
    if (!slot->try_acquire()) continue;
    cursor = start + i + 1;
    return Selection{c, slot};
  }
  return std::nullopt;
}

Result<RouteResponse> RequestRouter::route(const std::string& role, const std::string& payload,
                                           RequestContext ctx) {
  const std::string cid = ensure_correlation_id(ctx);
  auto& stats = global_swarm_stats();
  stats.routes_total.fetch_add(1, std::memory_order_relaxed);

  uint64_t elapsed_ns = 0;
  std::optional<StandardError> final_error;
  std::optional<RouteResponse> response;
  std::string last_instance;
  uint32_t attempts = 0;
  {
    ScopeTimer timer(elapsed_ns);
    const uint32_t max_attempts = 1 + config_.retry_budget;
    std::set<std::string> tried;
    std::optional<StandardError> last_error;

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
      if (ctx.cancelled()) {
        final_error = make_error(ErrorKind::cancelled, "request cancelled by caller", cid,
                                 {{"role", role}, {"attempts", std::to_string(attempts)}});
        break;
      }
      const uint64_t now = clock_->now_ms();
      if (ctx.expired(now)) {
        final_error = make_error(ErrorKind::timeout, "request deadline passed before dispatch", cid,
                                 {{"role", role}, {"attempts", std::to_string(attempts)}});
        break;
      }

      const auto candidates = registry_->routable(role);
      auto picked = select(role, candidates, tried);
      if (!picked) {
        if (attempt == 1) {
          final_error = make_error(
              ErrorKind::service_unavailable,
              candidates.empty() ? "no routable instance for role"
                                 : "every instance for role has an open circuit",
              cid, {{"role", role}, {"candidates", std::to_string(candidates.size())}});
        }
        break;
      }

      ++attempts;
      last_instance = picked->instance.id;
      WorkerRequest req{role, payload, ctx};
      const uint64_t timeout = ctx.remaining_ms(now, config_.call_timeout_ms);
      auto res = transport_->call(picked->instance, req, timeout);

      if (res) {
        picked->breaker->on_success();
        RouteResponse r;
        r.instance_id    = picked->instance.id;
        r.body           = std::move(res.value());
        r.attempts       = attempts;
        r.correlation_id = cid;
        r.failed_instances.assign(tried.begin(), tried.end());
        response = std::move(r);
        break;
      }

      StandardError err = res.error();
      err.correlation_id = cid;
      if (err.kind == ErrorKind::cancelled) {
        picked->breaker->on_abandoned();
        final_error = err;
        break;
      }
      if (counts_as_circuit_failure(err.kind)) {
        if (picked->breaker->on_failure()) {
          stats.circuit_opens.fetch_add(1, std::memory_order_relaxed);
          log_warn("router", "circuit opened for " + picked->instance.id + " after " +
                                 to_string(err.kind));
        }
      } else {
        picked->breaker->on_success();
      }

      if (!is_transient(err.kind)) {
        final_error = err;
        break;
      }

      log_debug("router", "attempt " + std::to_string(attempt) + " on " + picked->instance.id +
                              " failed (" + to_string(err.kind) + "), cid=" + cid);
      tried.insert(picked->instance.id);
      last_error = err;
      if (attempt < max_attempts) stats.retries.fetch_add(1, std::memory_order_relaxed);
    }

    if (!response && !final_error) {
      // Retries exhausted, or no untried alternate left.
      const StandardError cause = escalate(*last_error, Severity::error);
      final_error = make_error(ErrorKind::dependency_failure,
                               "all attempts for role failed: " + cause.message, cid,
                               {{"role", role},
                                {"attempts", std::to_string(attempts)},
                                {"last_instance", last_instance},
                                {"cause_kind", to_string(cause.kind)},
                                {"cause_severity", to_string(cause.severity)}});
    }
  }

  const uint64_t now = clock_->now_ms();
  if (response) {
    emit_route_event(role, response->instance_id, cid, nullptr, elapsed_ns, now, attempts);
    return std::move(*response);
  }
  stats.routes_failed.fetch_add(1, std::memory_order_relaxed);
  emit_route_event(role, last_instance, cid, &*final_error, elapsed_ns, now, attempts);
  return *final_error;
}

CircuitSnapshot RequestRouter::circuit(const std::string& instance_id) const {
  std::shared_ptr<CircuitBreaker> br;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = circuits_.find(instance_id);
    if (it != circuits_.end()) br = it->second;
  }
  if (!br) {
    CircuitSnapshot s;
    s.cooldown_ms = config_.circuit_cooldown_ms;
    return s;
  }
  return br->snapshot();
}

std::string RequestRouter::circuits_to_json() const {
  std::map<std::string, std::shared_ptr<CircuitBreaker>> copy;
  {
    std::lock_guard<std::mutex> lk(mu_);
    copy = circuits_;
  }
  std::ostringstream o;
  o << "{";
  bool first = true;
  for (const auto& [id, br] : copy) {
    if (!first) o << ",";
    first = false;
    o << "\"" << id << "\":" << br->snapshot().to_json();
  }
  o << "}";
  return o.str();
}

}  // namespace swarm
