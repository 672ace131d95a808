#include "swarm/registry.hpp"

#include <algorithm>
#include <sstream>

#include "swarm/jsonlite.hpp"
#include "swarm/log.hpp"
#include "swarm/observability.hpp"

namespace swarm {

namespace {

void emit_registry_event(const RegistryEvent& ev, uint64_t now) {
  SwarmEvent e;
  e.type              = "registry." + to_string(ev.type);
  e.component         = "registry";
  e.subject_id        = ev.instance.id;
  e.timestamp_unix_ms = now;
  e.detail            = ev.reason.empty() ? to_string(ev.instance.health) : ev.reason;
  emit_event(e);
}

}  // namespace

std::string to_string(HealthState h) {
  switch (h) {
    case HealthState::unknown: return "unknown";
    case HealthState::healthy: return "healthy";
    case HealthState::degraded: return "degraded";
    case HealthState::unhealthy: return "unhealthy";
  }
  return "unknown";
}

std::optional<HealthState> health_state_from_string(const std::string& s) {
  if (s == "unknown") return HealthState::unknown;
  if (s == "healthy") return HealthState::healthy;
  if (s == "degraded") return HealthState::degraded;
  if (s == "unhealthy") return HealthState::unhealthy;
  return std::nullopt;
}

std::string to_string(RegistryEventType t) {
  switch (t) {
    case RegistryEventType::registered: return "registered";
    case RegistryEventType::health_changed: return "health_changed";
    case RegistryEventType::deregistered: return "deregistered";
  }
  return "registered";
}

std::string ServiceInstance::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"id\":\"" << jsonlite::escape(id) << "\""
    << ",\"role\":\"" << jsonlite::escape(role) << "\""
    << ",\"address\":\"" << jsonlite::escape(address) << "\""
    << ",\"capabilities\":[";
  for (size_t i = 0; i < capabilities.size(); ++i) {
    if (i) o << ",";
    o << "\"" << jsonlite::escape(capabilities[i]) << "\"";
  }
  o << "]"
    << ",\"health\":\"" << to_string(health) << "\""
    << ",\"last_heartbeat_unix_ms\":" << last_heartbeat_unix_ms
    << ",\"registered_at_unix_ms\":" << registered_at_unix_ms
    << "}";
  return o.str();
}

// ---------------------------------------------------------------------------
// ServiceRegistry
// ---------------------------------------------------------------------------

ServiceRegistry::ServiceRegistry(const SwarmConfig& config, std::shared_ptr<Clock> clock)
    : config_(config), clock_(std::move(clock)) {}

int ServiceRegistry::find_index(const std::string& id) const {
  for (int i = 0; i < static_cast<int>(instances_.size()); ++i) {
    if (instances_[i].id == id) return i;
  }
  return -1;
}

Status ServiceRegistry::register_instance(const ServiceInstance& descriptor,
                                          const std::string& correlation_id) {
  const std::pair<const char*, const std::string*> required[] = {
      {"id", &descriptor.id}, {"role", &descriptor.role}, {"address", &descriptor.address}};
  for (const auto& [field, value] : required) {
    if (value->empty()) {
      return make_error(ErrorKind::missing_field,
                        std::string("service instance is missing required field '") + field + "'",
                        correlation_id, {{"field", field}});
    }
  }

  std::vector<RegistryEvent> events;
  const uint64_t now = clock_->now_ms();
  {
    std::lock_guard<std::mutex> lk(mu_);
    const int idx = find_index(descriptor.id);
    if (idx >= 0 && instances_[idx].address != descriptor.address) {
      return make_error(ErrorKind::invalid_input,
                        "instance id already registered with a different address", correlation_id,
                        {{"id", descriptor.id},
                         {"registered_address", instances_[idx].address},
                         {"requested_address", descriptor.address}});
    }

    ServiceInstance inst   = descriptor;
    inst.health            = HealthState::unknown;
    inst.last_heartbeat_unix_ms = now;
    RegistryEvent ev;
    ev.type = RegistryEventType::registered;
    if (idx < 0) {
      inst.registered_at_unix_ms = now;
      instances_.push_back(inst);
      ev.reason = "new";
    } else {
      ev.previous                = instances_[idx].health;
      inst.registered_at_unix_ms = instances_[idx].registered_at_unix_ms;
      instances_[idx]            = inst;
      ev.reason = "refresh";
    }
    ev.instance   = inst;
    ev.generation = ++generation_;
    events.push_back(std::move(ev));
  }

  global_swarm_stats().registrations.fetch_add(1, std::memory_order_relaxed);
  log_info("registry", "registered " + descriptor.id + " (" + descriptor.role + ") at " + descriptor.address);
  emit_registry_event(events.front(), now);
  publish(events);
  return std::nullopt;
}

void ServiceRegistry::deregister(const std::string& id, const std::string& reason) {
  std::vector<RegistryEvent> events;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const int idx = find_index(id);
    if (idx < 0) return;
    RegistryEvent ev;
    ev.type       = RegistryEventType::deregistered;
    ev.instance   = instances_[idx];
    ev.previous   = instances_[idx].health;
    ev.reason     = reason;
    ev.generation = ++generation_;
    instances_.erase(instances_.begin() + idx);
    events.push_back(std::move(ev));
  }
  global_swarm_stats().deregistrations.fetch_add(1, std::memory_order_relaxed);
  log_info("registry", "deregistered " + id + " (" + reason + ")");
  emit_registry_event(events.front(), clock_->now_ms());
  publish(events);
}

std::vector<ServiceInstance> ServiceRegistry::list(const std::string& role) const {
  std::lock_guard<std::mutex> lk(mu_);
  if (role.empty()) return instances_;
  std::vector<ServiceInstance> out;
  for (const auto& inst : instances_) {
    if (inst.role == role) out.push_back(inst);
  }
  return out;
}

std::vector<ServiceInstance> ServiceRegistry::routable(const std::string& role) const {
  std::vector<ServiceInstance> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& inst : instances_) {
      if (inst.role == role && inst.health != HealthState::unhealthy) out.push_back(inst);
    }
  }
  std::sort(out.begin(), out.end(),
            [](const ServiceInstance& a, const ServiceInstance& b) { return a.id < b.id; });
  return out;
}

std::optional<ServiceInstance> ServiceRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const int idx = find_index(id);
  if (idx < 0) return std::nullopt;
  return instances_[idx];
}

Status ServiceRegistry::heartbeat(const std::string& id, HealthState status,
                                  const std::string& correlation_id) {
  std::vector<RegistryEvent> events;
  const uint64_t now = clock_->now_ms();
  {
    std::lock_guard<std::mutex> lk(mu_);
    const int idx = find_index(id);
    if (idx < 0) {
      return make_error(ErrorKind::resource_not_found, "heartbeat for unregistered instance",
                        correlation_id, {{"id", id}});
    }
    ServiceInstance& inst       = instances_[idx];
    const HealthState previous  = inst.health;
    inst.health                 = status;
    inst.last_heartbeat_unix_ms = now;
    if (previous != status) {
      RegistryEvent ev;
      ev.type       = RegistryEventType::health_changed;
      ev.instance   = inst;
      ev.previous   = previous;
      ev.reason     = "heartbeat";
      ev.generation = ++generation_;
      events.push_back(std::move(ev));
    }
  }
  for (const auto& ev : events) emit_registry_event(ev, now);
  publish(events);
  return std::nullopt;
}

SweepReport ServiceRegistry::sweep() {
  SweepReport report;
  std::vector<RegistryEvent> events;
  const uint64_t now = clock_->now_ms();
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = instances_.begin(); it != instances_.end();) {
      const uint64_t age = now > it->last_heartbeat_unix_ms ? now - it->last_heartbeat_unix_ms : 0;
      if (age > config_.deregister_after_ms) {
        RegistryEvent ev;
        ev.type       = RegistryEventType::deregistered;
        ev.instance   = *it;
        ev.previous   = it->health;
        ev.reason     = "heartbeat_expired";
        ev.generation = ++generation_;
        report.deregistered.push_back(it->id);
        events.push_back(std::move(ev));
        it = instances_.erase(it);
        continue;
      }
      if (age > config_.stale_after_ms && it->health != HealthState::unhealthy) {
        RegistryEvent ev;
        ev.type       = RegistryEventType::health_changed;
        ev.previous   = it->health;
        it->health    = HealthState::unhealthy;
        ev.instance   = *it;
        ev.reason     = "heartbeat_stale";
        ev.generation = ++generation_;
        report.marked_unhealthy.push_back(it->id);
        events.push_back(std::move(ev));
      }
      ++it;
    }
  }

  auto& stats = global_swarm_stats();
  stats.sweeps.fetch_add(1, std::memory_order_relaxed);
  stats.deregistrations.fetch_add(report.deregistered.size(), std::memory_order_relaxed);
  for (const auto& id : report.marked_unhealthy) {
    log_warn("registry", "instance " + id + " missed heartbeats, marked unhealthy");
  }
  for (const auto& id : report.deregistered) {
    log_warn("registry", "instance " + id + " expired, deregistered");
  }
  for (const auto& ev : events) emit_registry_event(ev, now);
  publish(events);
  return report;
}

uint64_t ServiceRegistry::subscribe(RegistryListener listener) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  const uint64_t id = next_listener_id_++;
  listeners_[id] = std::move(listener);
  return id;
}

void ServiceRegistry::unsubscribe(uint64_t subscription_id) {
  std::lock_guard<std::mutex> lk(listeners_mu_);
  listeners_.erase(subscription_id);
}

void ServiceRegistry::publish(const std::vector<RegistryEvent>& events) {
  if (events.empty()) return;
  std::vector<RegistryListener> targets;
  {
    std::lock_guard<std::mutex> lk(listeners_mu_);
    for (const auto& [id, l] : listeners_) targets.push_back(l);
  }
  for (const auto& ev : events) {
    for (const auto& l : targets) l(ev);
  }
}

uint64_t ServiceRegistry::generation() const {
  std::lock_guard<std::mutex> lk(mu_);
  return generation_;
}

size_t ServiceRegistry::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return instances_.size();
}

std::string ServiceRegistry::to_json() const {
  const auto snapshot = list();
  std::ostringstream o;
  o << "{\"generation\":" << generation() << ",\"instances\":[";
  for (size_t i = 0; i < snapshot.size(); ++i) {
    if (i) o << ",";
    o << snapshot[i].to_json();
  }
  o << "]}";
  return o.str();
}

}  // namespace swarm
