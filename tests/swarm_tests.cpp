// swarm_tests.cpp - Unit and scenario tests for the swarm core.
//
// Every test that touches time drives a ManualClock. Store tests run against
// fresh directories under the system temp dir and remove them afterwards.

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "swarm/cache.hpp"
#include "swarm/chaos.hpp"
#include "swarm/circuit.hpp"
#include "swarm/clock.hpp"
#include "swarm/config.hpp"
#include "swarm/context.hpp"
#include "swarm/errors.hpp"
#include "swarm/hash.hpp"
#include "swarm/health_monitor.hpp"
#include "swarm/jsonlite.hpp"
#include "swarm/log.hpp"
#include "swarm/memory_service.hpp"
#include "swarm/observability.hpp"
#include "swarm/registry.hpp"
#include "swarm/retrieval.hpp"
#include "swarm/router.hpp"
#include "swarm/store.hpp"
#include "swarm/transport.hpp"
#include "swarm/version.hpp"

namespace fs = std::filesystem;

namespace {

int g_tests_run    = 0;
int g_tests_passed = 0;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

// ---------------------------------------------------------------------------
// Fixtures
// ---------------------------------------------------------------------------

class TempRoot {
 public:
  explicit TempRoot(const std::string& name)
      : path_((fs::temp_directory_path() /
               ("swarm_tests_" + name + "_" + std::to_string(static_cast<long>(::getpid()))))
                  .string()) {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  ~TempRoot() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

swarm::SwarmConfig store_config(const TempRoot& root, uint32_t retention = 5) {
  swarm::SwarmConfig cfg;
  cfg.store_root       = root.path();
  cfg.backup_retention = retention;
  return cfg;
}

std::shared_ptr<swarm::MemoryStore> open_store(const swarm::SwarmConfig& cfg,
                                               std::shared_ptr<swarm::Clock> clock) {
  auto s = swarm::MemoryStore::open(cfg, std::move(clock));
  expect(s.ok(), "store opens");
  return s.value();
}

swarm::MemoryRecord make_record(const std::string& id, const std::string& content) {
  swarm::MemoryRecord r;
  r.id      = id;
  r.content = content;
  return r;
}

void overwrite_file(const std::string& path, const std::string& bytes) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << bytes;
}

std::string read_whole(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

bool has_entry_with_prefix(const std::string& dir, const std::string& prefix) {
  std::error_code ec;
  for (const auto& e : fs::directory_iterator(dir, ec)) {
    if (e.path().filename().string().rfind(prefix, 0) == 0) return true;
  }
  return false;
}

swarm::ServiceInstance instance(const std::string& id, const std::string& role) {
  swarm::ServiceInstance inst;
  inst.id           = id;
  inst.role         = role;
  inst.address      = "inproc://" + id;
  inst.capabilities = {"read", "write"};
  return inst;
}

swarm::WorkerHandler echo_handler(const std::string& name) {
  return [name](const swarm::WorkerRequest&) -> swarm::Result<std::string> { return name; };
}

void arm_chaos(swarm::chaos::FaultType type, const std::string& target = "") {
  auto& chaos = swarm::chaos::global_chaos();
  chaos.activate(swarm::chaos::ChaosController::ACTIVATION_KEY);
  swarm::chaos::FaultSpec f;
  f.type   = type;
  f.target = target;
  chaos.register_fault(f);
}

void disarm_chaos() { swarm::chaos::global_chaos().deactivate(); }

}  // namespace

// ---------------------------------------------------------------------------
// Error taxonomy
// ---------------------------------------------------------------------------

void test_error_taxonomy() {
  using swarm::ErrorKind;
  auto corrupt = swarm::make_error(ErrorKind::resource_corrupted, "bad checksum", "cid-1");
  expect(corrupt.category == swarm::ErrorCategory::resource, "corrupted is a resource error");
  expect(corrupt.severity == swarm::Severity::critical, "corrupted is critical");
  expect(corrupt.http_status() == 500, "corrupted maps to 500");

  auto missing = swarm::make_error(ErrorKind::resource_not_found, "gone");
  expect(missing.http_status() == 404, "not-found maps to 404");
  expect(swarm::make_error(ErrorKind::missing_field, "x").http_status() == 400,
         "missing-field maps to 400");
  expect(swarm::make_error(ErrorKind::service_unavailable, "x").http_status() == 503,
         "service-unavailable maps to 503");
  expect(swarm::make_error(ErrorKind::timeout, "x").severity == swarm::Severity::warning,
         "timeout defaults to warning");

  expect(swarm::is_transient(ErrorKind::network_error), "network errors are transient");
  expect(swarm::is_transient(ErrorKind::timeout), "timeouts are transient");
  expect(!swarm::is_transient(ErrorKind::invalid_input), "validation errors are not transient");
  expect(!swarm::error_kind_from_string("no-such-kind").has_value(), "unknown kind rejected");
}

void test_error_wire_shape() {
  auto e = swarm::make_error(swarm::ErrorKind::storage_failure, "write \"failed\"", "cid-abc",
                             {{"path", "/tmp/x"}, {"reason", "disk_full"}});
  const std::string json = e.to_json();
  expect(json.find("\"kind\":\"storage-failure\"") != std::string::npos, "kind on the wire");
  expect(json.find("\"correlationId\":\"cid-abc\"") != std::string::npos, "cid on the wire");
  expect(json.find("\"category\":\"resource\"") != std::string::npos, "category on the wire");

  auto back = swarm::error_from_json(json);
  expect(back.has_value(), "wire shape parses back");
  expect(back->kind == e.kind, "kind survives");
  expect(back->message == e.message, "message survives escaping");
  expect(back->details == e.details, "details survive");
  expect(back->correlation_id == "cid-abc", "correlation id survives");
  expect(back->timestamp_unix_ms / 1000 == e.timestamp_unix_ms / 1000, "timestamp survives");

  expect(!swarm::error_from_json("{\"kind\":\"bogus\"}").has_value(), "bogus kind rejected");
  expect(!swarm::error_from_json("not json").has_value(), "garbage rejected");
}

void test_translate_errno() {
  auto full = swarm::translate_errno(ENOSPC, "write", "/data/x.rec", "cid-9");
  expect(full.kind == swarm::ErrorKind::storage_failure, "ENOSPC is a storage failure");
  expect(full.details["reason"] == "disk_full", "ENOSPC reason");
  expect(full.correlation_id == "cid-9", "cid kept");

  auto gone = swarm::translate_errno(ENOENT, "open", "/data/y.rec");
  expect(gone.kind == swarm::ErrorKind::resource_not_found, "ENOENT is not-found");
  expect(swarm::translate_errno(EACCES, "open", "/p").details["reason"] == "permission_denied",
         "EACCES reason");
}

void test_correlation_ids() {
  swarm::RequestContext ctx;
  const std::string cid = swarm::ensure_correlation_id(ctx);
  expect(cid.rfind("cid-", 0) == 0 && cid.size() == 20, "fresh cid shape");
  expect(swarm::ensure_correlation_id(ctx) == cid, "cid assigned once");

  swarm::RequestContext given;
  given.correlation_id = "caller-supplied";
  expect(swarm::ensure_correlation_id(given) == "caller-supplied", "caller cid kept");
  expect(swarm::new_correlation_id() != swarm::new_correlation_id(), "cids are unique");
}

// ---------------------------------------------------------------------------
// Config + JSON
// ---------------------------------------------------------------------------

void test_config_defaults_and_overlay() {
  swarm::SwarmConfig cfg;
  expect(!cfg.validate().has_value(), "defaults validate");

  auto st = swarm::apply_config_json(cfg, R"({"retry_budget":4,"store_root":"/tmp/swarm-x"})");
  expect(!st.has_value(), "overlay applies");
  expect(cfg.retry_budget == 4, "retry budget overlaid");
  expect(cfg.store_root == "/tmp/swarm-x", "store root overlaid");
  expect(cfg.circuit_failure_threshold == 5, "untouched keys keep defaults");

  auto bad = swarm::apply_config_json(cfg, R"({"retry_budget":"lots"})");
  expect(bad.has_value() && bad->kind == swarm::ErrorKind::invalid_input, "wrong type rejected");
  expect(bad->details["key"] == "retry_budget", "offending key reported");

  auto broken = swarm::apply_config_json(cfg, "{not json");
  expect(broken.has_value() && broken->kind == swarm::ErrorKind::invalid_input, "bad JSON rejected");
}

void test_config_validation() {
  swarm::SwarmConfig cfg;
  cfg.deregister_after_ms = cfg.stale_after_ms;
  auto st = cfg.validate();
  expect(st.has_value() && st->kind == swarm::ErrorKind::invalid_input, "thresholds must be ordered");
  expect(st->details["field"] == "deregister_after_ms", "field named");

  swarm::SwarmConfig zero;
  zero.backup_retention = 0;
  expect(zero.validate().has_value(), "zero retention rejected");

  swarm::SwarmConfig comp;
  comp.backup_compression = "lz4";
  expect(comp.validate().has_value(), "unknown compression rejected");
}

void test_config_env() {
  ::setenv("SWARM_RETRY_BUDGET", "7", 1);
  swarm::SwarmConfig cfg;
  expect(!swarm::apply_config_env(cfg).has_value(), "env overlay applies");
  expect(cfg.retry_budget == 7, "env retry budget");

  ::setenv("SWARM_RETRY_BUDGET", "seven", 1);
  auto st = swarm::apply_config_env(cfg);
  expect(st.has_value() && st->details["variable"] == "SWARM_RETRY_BUDGET", "bad env rejected");
  ::unsetenv("SWARM_RETRY_BUDGET");
}

void test_jsonlite() {
  std::optional<swarm::jsonlite::JsonError> err;
  auto o = swarm::jsonlite::parse(R"({"n":42,"s":"a\"b","arr":["x","y"],"ok":true})", &err);
  expect(!err.has_value(), "valid object parses");
  expect(swarm::jsonlite::get_u64(o, "n") == 42, "integer field");
  expect(swarm::jsonlite::get_string(o, "s") == "a\"b", "escaped string field");
  expect(swarm::jsonlite::get_string_array(o, "arr").size() == 2, "string array field");
  expect(swarm::jsonlite::get_bool(o, "ok", false), "bool field");

  std::optional<swarm::jsonlite::JsonError> dup;
  swarm::jsonlite::parse(R"({"a":1,"a":2})", &dup);
  expect(dup.has_value() && dup->code == "json_duplicate_key", "duplicate keys rejected");

  expect(swarm::jsonlite::escape("a\"b\n") == "a\\\"b\\n", "escape quotes and newlines");
}

// ---------------------------------------------------------------------------
// TTL cache
// ---------------------------------------------------------------------------

void test_cache_ttl() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::TtlCache<int> cache(8, 100, clock);
  cache.put("a", 1);
  cache.put("b", 2, 500);

  expect(cache.get("a").value_or(0) == 1, "fresh entry served");
  clock->advance(99);
  expect(cache.get("a").has_value(), "entry alive just before TTL");
  clock->advance(1);
  expect(!cache.get("a").has_value(), "entry expired at TTL");
  expect(cache.get("b").value_or(0) == 2, "per-entry TTL honoured");

  clock->advance(400);
  expect(cache.purge_expired() == 1, "purge drops expired entry");
  expect(cache.size() == 0, "cache empty after purge");

  const auto s = cache.stats();
  expect(s.hits == 3 && s.misses == 1, "hit and miss counts");
  expect(s.expirations == 2, "expirations counted");
}

void test_cache_lru_and_erase() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::TtlCache<std::string> cache(2, 10000, clock);
  cache.put("a", "A");
  cache.put("b", "B");
  expect(cache.get("a").has_value(), "a touched");
  cache.put("c", "C");
  expect(!cache.get("b").has_value(), "least recently used evicted");
  expect(cache.get("a").has_value() && cache.get("c").has_value(), "others kept");
  expect(cache.stats().evictions == 1, "eviction counted");

  cache.put("page:1", "x");
  expect(cache.erase_if([](const std::string& k) { return k.rfind("page:", 0) == 0; }) == 1,
         "erase_if by prefix");
  expect(cache.erase("a") || cache.erase("c"), "erase by key");
  cache.clear();
  expect(cache.size() == 0, "clear empties");
}

// ---------------------------------------------------------------------------
// Registry
// ---------------------------------------------------------------------------

void test_registry_register_and_validate() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::ServiceRegistry reg(swarm::SwarmConfig{}, clock);

  auto inst = instance("mem-a", "memory");
  expect(!reg.register_instance(inst).has_value(), "register succeeds");
  auto found = reg.find("mem-a");
  expect(found.has_value() && found->health == swarm::HealthState::unknown, "starts unknown");
  expect(found->registered_at_unix_ms == clock->now_ms(), "registration time recorded");

  swarm::ServiceInstance nameless = inst;
  nameless.id.clear();
  auto st = reg.register_instance(nameless, "cid-reg");
  expect(st.has_value() && st->kind == swarm::ErrorKind::missing_field, "id is required");
  expect(st->correlation_id == "cid-reg", "cid on registry error");

  swarm::ServiceInstance moved = inst;
  moved.address = "inproc://elsewhere";
  auto clash = reg.register_instance(moved);
  expect(clash.has_value() && clash->kind == swarm::ErrorKind::invalid_input,
         "same id at a different address rejected");

  auto hb = reg.heartbeat("nobody", swarm::HealthState::healthy);
  expect(hb.has_value() && hb->kind == swarm::ErrorKind::resource_not_found,
         "heartbeat for unknown instance rejected");
}

void test_registry_deregister_idempotent() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::ServiceRegistry reg(swarm::SwarmConfig{}, clock);
  reg.register_instance(instance("a", "memory"));
  reg.register_instance(instance("b", "memory"));

  reg.deregister("a");
  const auto once = reg.to_json();
  const uint64_t gen = reg.generation();
  reg.deregister("a");
  expect(reg.to_json() == once, "second deregister leaves state unchanged");
  expect(reg.generation() == gen, "second deregister publishes nothing");
  expect(reg.size() == 1, "one instance left");
}

void test_registry_staleness_sweep() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  swarm::ServiceRegistry reg(cfg, clock);
  reg.register_instance(instance("a", "memory"));
  reg.register_instance(instance("b", "memory"));
  reg.heartbeat("a", swarm::HealthState::healthy);
  reg.heartbeat("b", swarm::HealthState::healthy);

  std::vector<swarm::RegistryEvent> seen;
  const uint64_t sub = reg.subscribe([&seen](const swarm::RegistryEvent& ev) { seen.push_back(ev); });

  clock->advance(cfg.stale_after_ms / 2);
  reg.heartbeat("b", swarm::HealthState::healthy);
  clock->advance(cfg.stale_after_ms / 2 + 1);
  auto report = reg.sweep();
  expect(report.marked_unhealthy.size() == 1 && report.marked_unhealthy[0] == "a", "a went stale");
  expect(reg.find("a")->health == swarm::HealthState::unhealthy, "a marked unhealthy");
  expect(reg.routable("memory").size() == 1, "unhealthy instance not routable");
  expect(seen.size() == 1 && seen[0].type == swarm::RegistryEventType::health_changed,
         "subscriber saw the health change");

  clock->advance(cfg.deregister_after_ms);
  report = reg.sweep();
  expect(report.deregistered.size() == 2, "both expired");
  expect(reg.size() == 0, "registry empty");
  expect(seen.back().type == swarm::RegistryEventType::deregistered, "subscriber saw removal");
  reg.unsubscribe(sub);
}

// ---------------------------------------------------------------------------
// Circuit breaker
// ---------------------------------------------------------------------------

void test_circuit_opens_at_threshold() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  swarm::CircuitBreaker br(cfg, clock);

  for (uint32_t i = 1; i < cfg.circuit_failure_threshold; ++i) {
    expect(!br.on_failure(), "below threshold stays closed");
  }
  expect(br.state() == swarm::CircuitState::closed, "closed before threshold");
  expect(br.on_failure(), "threshold failure opens");
  expect(br.state() == swarm::CircuitState::open, "open");
  expect(!br.try_acquire() && !br.is_selectable(), "open circuit refuses calls");

  clock->advance(cfg.circuit_cooldown_ms - 1);
  expect(!br.try_acquire(), "still open before cool-down");
}

void test_circuit_single_half_open_trial() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  swarm::CircuitBreaker br(cfg, clock);
  for (uint32_t i = 0; i < cfg.circuit_failure_threshold; ++i) br.on_failure();

  clock->advance(cfg.circuit_cooldown_ms);
  expect(br.state() == swarm::CircuitState::half_open, "half-open after cool-down");
  expect(br.try_acquire(), "first caller gets the trial");
  expect(!br.try_acquire(), "second caller refused");

  expect(br.on_failure(), "failed trial reopens");
  auto snap = br.snapshot();
  expect(snap.state == swarm::CircuitState::open, "open again");
  expect(snap.cooldown_ms == cfg.circuit_cooldown_ms * cfg.circuit_cooldown_multiplier,
         "cool-down extended");

  clock->advance(snap.cooldown_ms);
  expect(br.try_acquire(), "trial after extended cool-down");
  br.on_success();
  snap = br.snapshot();
  expect(snap.state == swarm::CircuitState::closed, "successful trial closes");
  expect(snap.failure_count == 0 && snap.cooldown_ms == cfg.circuit_cooldown_ms,
         "count and cool-down reset");
}

void test_circuit_window_and_abandon() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  swarm::CircuitBreaker br(cfg, clock);
  for (uint32_t i = 1; i < cfg.circuit_failure_threshold; ++i) br.on_failure();
  clock->advance(cfg.circuit_window_ms + 1);
  expect(!br.on_failure(), "old failures fall out of the window");
  expect(br.snapshot().failure_count == 1, "only the recent failure counts");

  br.on_success();
  expect(br.snapshot().failure_count == 0, "success clears the count");

  for (uint32_t i = 0; i < cfg.circuit_failure_threshold; ++i) br.on_failure();
  clock->advance(cfg.circuit_cooldown_ms);
  expect(br.try_acquire(), "trial reserved");
  br.on_abandoned();
  expect(br.state() == swarm::CircuitState::half_open, "abandon keeps half-open");
  expect(br.try_acquire(), "abandoned trial is released");
}

// ---------------------------------------------------------------------------
// Router
// ---------------------------------------------------------------------------

void test_router_skips_stale_instance() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  auto transport = std::make_shared<swarm::InProcessTransport>();
  transport->bind("inproc://a", echo_handler("a"));
  transport->bind("inproc://b", echo_handler("b"));
  reg->register_instance(instance("a", "memory"));
  reg->register_instance(instance("b", "memory"));
  reg->heartbeat("a", swarm::HealthState::healthy);
  reg->heartbeat("b", swarm::HealthState::healthy);

  swarm::RequestRouter router(reg, transport);
  std::set<std::string> served;
  for (int i = 0; i < 10; ++i) {
    auto r = router.route("memory", "{}");
    expect(r.ok(), "request served");
    expect(r.value().instance_id == r.value().body, "served by the instance it reports");
    served.insert(r.value().instance_id);
  }
  expect(served == std::set<std::string>({"a", "b"}), "both instances used");

  clock->advance(cfg.stale_after_ms / 2);
  reg->heartbeat("b", swarm::HealthState::healthy);
  clock->advance(cfg.stale_after_ms / 2 + 1);
  reg->sweep();
  for (int i = 0; i < 3; ++i) {
    auto r = router.route("memory", "{}");
    expect(r.ok() && r.value().instance_id == "b", "stale instance never chosen");
  }
}

void test_router_circuit_scenario() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  cfg.retry_budget = 0;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  auto transport = std::make_shared<swarm::InProcessTransport>();

  auto calls = std::make_shared<std::atomic<int>>(0);
  auto failing = std::make_shared<std::atomic<bool>>(true);
  transport->bind("inproc://c", [calls, failing](const swarm::WorkerRequest& req)
                                    -> swarm::Result<std::string> {
    calls->fetch_add(1);
    if (failing->load()) {
      return swarm::make_error(swarm::ErrorKind::service_unavailable, "overloaded",
                               req.ctx.correlation_id);
    }
    return std::string("c");
  });
  reg->register_instance(instance("c", "memory"));

  swarm::RequestRouter router(reg, transport);
  for (uint32_t i = 0; i < cfg.circuit_failure_threshold; ++i) {
    auto r = router.route("memory", "{}");
    expect(!r.ok() && r.error().kind == swarm::ErrorKind::dependency_failure,
           "failure surfaces as dependency-failure");
  }
  expect(router.circuit("c").state == swarm::CircuitState::open, "circuit open after threshold");

  swarm::RequestContext ctx;
  ctx.correlation_id = "cid-sixth";
  auto sixth = router.route("memory", "{}", ctx);
  expect(!sixth.ok() && sixth.error().kind == swarm::ErrorKind::service_unavailable,
         "no instance left -> service-unavailable");
  expect(sixth.error().correlation_id == "cid-sixth", "cid threaded into the error");
  expect(calls->load() == static_cast<int>(cfg.circuit_failure_threshold),
         "open circuit receives no call");

  transport->bind("inproc://d", echo_handler("d"));
  reg->register_instance(instance("d", "memory"));
  auto served = router.route("memory", "{}");
  expect(served.ok() && served.value().instance_id == "d", "another instance takes over");

  failing->store(false);
  clock->advance(cfg.circuit_cooldown_ms);
  std::set<std::string> after;
  for (int i = 0; i < 4; ++i) {
    auto r = router.route("memory", "{}");
    expect(r.ok(), "served after cool-down");
    after.insert(r.value().instance_id);
  }
  expect(after.count("c") == 1, "recovered instance rejoins rotation");
  expect(router.circuit("c").state == swarm::CircuitState::closed, "trial success closed circuit");
}

void test_router_retry_and_exhaustion() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  auto transport = std::make_shared<swarm::InProcessTransport>();
  // "x" is registered but nothing listens at its address.
  transport->bind("inproc://y", echo_handler("y"));
  reg->register_instance(instance("x", "memory"));
  reg->register_instance(instance("y", "memory"));

  swarm::RequestRouter router(reg, transport);
  for (int i = 0; i < 4; ++i) {
    auto r = router.route("memory", "{}");
    expect(r.ok() && r.value().instance_id == "y", "retried onto the live instance");
    expect(r.value().attempts <= 2, "at most one retry needed");
  }

  transport->unbind("inproc://y");
  swarm::RequestContext ctx;
  ctx.correlation_id = "cid-exhaust";
  auto r = router.route("memory", "{}", ctx);
  expect(!r.ok() && r.error().kind == swarm::ErrorKind::dependency_failure, "all attempts failed");
  expect(r.error().details.at("cause_kind") == "network-error", "cause recorded");
  expect(r.error().details.at("attempts") == "2", "one attempt per distinct instance");
  expect(r.error().correlation_id == "cid-exhaust", "cid kept through retries");

  auto none = router.route("reasoning", "{}");
  expect(!none.ok() && none.error().kind == swarm::ErrorKind::service_unavailable,
         "unknown role -> service-unavailable");
}

void test_router_passes_worker_errors_through() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  auto transport = std::make_shared<swarm::InProcessTransport>();
  transport->bind("inproc://v", [](const swarm::WorkerRequest&) -> swarm::Result<std::string> {
    return swarm::make_error(swarm::ErrorKind::invalid_input, "bad payload");
  });
  reg->register_instance(instance("v", "memory"));

  swarm::RequestRouter router(reg, transport);
  for (uint32_t i = 0; i < cfg.circuit_failure_threshold + 1; ++i) {
    auto r = router.route("memory", "garbage");
    expect(!r.ok() && r.error().kind == swarm::ErrorKind::invalid_input, "worker error unchanged");
    expect(!r.error().correlation_id.empty(), "worker error carries a cid");
  }
  expect(router.circuit("v").state == swarm::CircuitState::closed,
         "validation errors do not trip the circuit");
  expect(!swarm::counts_as_circuit_failure(swarm::ErrorKind::cancelled), "cancel is not a failure");
  expect(swarm::counts_as_circuit_failure(swarm::ErrorKind::timeout), "timeout is a failure");
}

void test_router_cancelled_request() {
  auto clock = std::make_shared<swarm::ManualClock>();
  auto reg = std::make_shared<swarm::ServiceRegistry>(swarm::SwarmConfig{}, clock);
  auto transport = std::make_shared<swarm::InProcessTransport>();
  transport->bind("inproc://a", echo_handler("a"));
  reg->register_instance(instance("a", "memory"));

  swarm::RequestRouter router(reg, transport);
  swarm::RequestContext ctx;
  ctx.cancel.cancel();
  auto r = router.route("memory", "{}", ctx);
  expect(!r.ok() && r.error().kind == swarm::ErrorKind::cancelled, "cancelled before dispatch");
  expect(transport->calls_started() == 0, "nothing dispatched");
}

void test_transport_timeout_cancels_attempt() {
  auto committed = std::make_shared<std::atomic<int>>(0);
  auto abandoned = std::make_shared<std::atomic<int>>(0);
  swarm::WorkerRequest req;
  req.role               = "memory";
  req.payload            = "{}";
  req.ctx.correlation_id = "cid-slow";
  {
    swarm::InProcessTransport transport;
    transport.bind("inproc://slow", [committed, abandoned](const swarm::WorkerRequest& r)
                                        -> swarm::Result<std::string> {
      for (int i = 0; i < 400 && !r.ctx.cancelled(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      if (r.ctx.cancelled()) {
        abandoned->fetch_add(1);
        return swarm::make_error(swarm::ErrorKind::cancelled, "gave up", r.ctx.correlation_id);
      }
      committed->fetch_add(1);
      return std::string("late");
    });

    auto r = transport.call(instance("slow", "memory"), req, 20);
    expect(!r.ok() && r.error().kind == swarm::ErrorKind::timeout, "slow call times out");
    expect(r.error().correlation_id == "cid-slow", "timeout carries the cid");
    expect(!req.ctx.cancelled(), "caller token untouched by a timeout");
  }
  expect(abandoned->load() == 1, "timed-out handler saw its attempt cancelled");
  expect(committed->load() == 0, "timed-out handler never committed");
}

void test_transport_joins_worker_threads() {
  swarm::InProcessTransport transport;
  transport.bind("inproc://a", echo_handler("a"));
  swarm::WorkerRequest req;
  for (int i = 0; i < 8; ++i) {
    expect(transport.call(instance("a", "memory"), req, 1000).ok(), "echo call");
  }
  // Finished threads are joined on the next call, so only the last is left.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  expect(transport.call(instance("a", "memory"), req, 1000).ok(), "echo call");
  expect(transport.threads_outstanding() <= 1, "finished worker threads reaped");
}

void test_router_retry_after_timeout_commits_once() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  cfg.retry_budget    = 1;
  cfg.call_timeout_ms = 30;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  auto commits = std::make_shared<std::atomic<int>>(0);
  auto committing = [commits](const swarm::WorkerRequest& r) -> swarm::Result<std::string> {
    if (r.ctx.cancelled()) {
      return swarm::make_error(swarm::ErrorKind::cancelled, "abandoned", r.ctx.correlation_id);
    }
    commits->fetch_add(1);
    return std::string("stored");
  };
  reg->register_instance(instance("slow", "memory"));
  reg->register_instance(instance("fast", "memory"));

  auto& chaos = swarm::chaos::global_chaos();
  chaos.activate(swarm::chaos::ChaosController::ACTIVATION_KEY);
  swarm::chaos::FaultSpec lag;
  lag.type       = swarm::chaos::FaultType::worker_latency;
  lag.target     = "inproc://slow";
  lag.latency_ms = 300;
  chaos.register_fault(lag);

  uint64_t started = 0;
  {
    auto transport = std::make_shared<swarm::InProcessTransport>();
    transport->bind("inproc://slow", committing);
    transport->bind("inproc://fast", committing);
    swarm::RequestRouter router(reg, transport);
    for (int i = 0; i < 2; ++i) {
      auto r = router.route("memory", R"({"op":"put"})");
      expect(r.ok() && r.value().instance_id == "fast", "served by the fast instance");
    }
    started = transport->calls_started();
  }
  disarm_chaos();
  expect(started >= 3, "the slow instance was tried and timed out");
  expect(commits->load() == 2, "each request committed exactly once");
}

void test_router_concurrent_with_sweep_and_deregister() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  auto transport = std::make_shared<swarm::InProcessTransport>();
  for (const std::string id : {"a", "b", "c"}) {
    transport->bind("inproc://" + id, echo_handler(id));
    expect(!reg->register_instance(instance(id, "memory")).has_value(), "register " + id);
    expect(!reg->heartbeat(id, swarm::HealthState::healthy).has_value(), "heartbeat " + id);
  }
  swarm::RequestRouter router(reg, transport);

  std::atomic<bool> c_stale{false};
  std::atomic<bool> b_gone{false};
  std::atomic<bool> stop{false};
  std::atomic<int>  served{0};
  std::atomic<int>  failed{0};
  std::atomic<int>  violations{0};
  std::vector<std::thread> callers;
  for (int t = 0; t < 4; ++t) {
    callers.emplace_back([&] {
      while (!stop.load()) {
        // Flags read before routing: a change published earlier must hold.
        const bool c_out = c_stale.load();
        const bool b_out = b_gone.load();
        auto r = router.route("memory", "{}");
        if (!r.ok()) {
          failed.fetch_add(1);
          continue;
        }
        served.fetch_add(1);
        const std::string& id = r.value().instance_id;
        if ((c_out && id == "c") || (b_out && id == "b")) violations.fetch_add(1);
      }
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  clock->advance(cfg.stale_after_ms + 1);
  expect(!reg->heartbeat("a", swarm::HealthState::healthy).has_value(), "refresh a");
  expect(!reg->heartbeat("b", swarm::HealthState::healthy).has_value(), "refresh b");
  auto report = reg->sweep();
  c_stale.store(true);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  reg->deregister("b");
  b_gone.store(true);
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  stop.store(true);
  for (auto& t : callers) t.join();

  expect(report.marked_unhealthy == std::vector<std::string>({"c"}), "sweep marked c");
  expect(violations.load() == 0, "no unhealthy or deregistered instance selected");
  expect(failed.load() == 0, "a healthy instance always remained");
  expect(served.load() > 0, "requests were served");
}

// ---------------------------------------------------------------------------
// Health monitor
// ---------------------------------------------------------------------------

void test_health_monitor_tick() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  auto transport = std::make_shared<swarm::InProcessTransport>();
  transport->bind("inproc://a", echo_handler("a"),
                  [] { return swarm::HealthState::degraded; });
  reg->register_instance(instance("a", "memory"));
  reg->register_instance(instance("ghost", "memory"));

  swarm::HealthMonitor monitor(reg, transport);
  int maintenance_runs = 0;
  monitor.add_maintenance([&maintenance_runs] { ++maintenance_runs; });

  auto report = monitor.run_once();
  expect(report.probed == 2, "every instance probed");
  expect(report.probe_failures == 1, "unreachable instance missed its probe");
  expect(reg->find("a")->health == swarm::HealthState::degraded, "probe result recorded");
  expect(maintenance_runs == 1, "maintenance ran");

  clock->advance(cfg.stale_after_ms + 1);
  report = monitor.run_once();
  expect(report.sweep.marked_unhealthy.size() == 1 && report.sweep.marked_unhealthy[0] == "ghost",
         "silent instance marked unhealthy");
  expect(reg->find("a")->health == swarm::HealthState::degraded, "probed instance stays fresh");
}

void test_health_monitor_start_stop() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  cfg.heartbeat_interval_ms = 10;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  swarm::HealthMonitor monitor(reg, nullptr);
  monitor.start();
  expect(monitor.running(), "running after start");
  monitor.stop();
  expect(!monitor.running(), "stopped after stop");
  monitor.stop();
}

void test_health_monitor_concurrent_start_stop() {
  auto clock = std::make_shared<swarm::ManualClock>();
  swarm::SwarmConfig cfg;
  cfg.heartbeat_interval_ms = 1;
  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  swarm::HealthMonitor monitor(reg, nullptr);

  std::vector<std::thread> togglers;
  for (int t = 0; t < 4; ++t) {
    togglers.emplace_back([&monitor, t] {
      for (int i = 0; i < 50; ++i) {
        if ((i + t) % 2 == 0) monitor.start();
        else monitor.stop();
      }
    });
  }
  for (auto& t : togglers) t.join();

  monitor.start();
  expect(monitor.running(), "running after the final start");
  monitor.stop();
  expect(!monitor.running(), "stopped after the final stop");
}

// ---------------------------------------------------------------------------
// Store
// ---------------------------------------------------------------------------

void test_store_put_get_checksum() {
  TempRoot root("put_get");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto store = open_store(store_config(root), clock);

  auto rec = make_record("alpha", "hello world");
  rec.owner = "ava";
  rec.themes = {"greeting"};
  rec.emotions = {{"joy", 0.75}};
  auto id = store->put(rec);
  expect(id.ok() && id.value() == "alpha", "put returns the id");

  auto got = store->get("alpha");
  expect(got.ok(), "get succeeds");
  expect(got.value().content == "hello world", "content round-trips");
  expect(got.value().emotions.at("joy") == 0.75, "emotions round-trip");
  expect(got.value().created_at_unix_ms == clock->now_ms(), "created_at defaulted");
  expect(got.value().checksum == swarm::record_checksum(got.value().payload_json()),
         "checksum covers the payload");
  expect(swarm::is_hex_digest(got.value().checksum), "checksum is hex");

  const std::string bytes = read_whole(store->record_path("alpha"));
  expect(bytes.rfind("swarm-record v1 " + got.value().checksum + "\n", 0) == 0, "file header");

  auto generated = store->put(make_record("", "no id given"));
  expect(generated.ok() && generated.value().rfind("mem-", 0) == 0, "id generated");
  expect(store->list_ids().size() == 2, "two records listed");
}

void test_store_validation_errors() {
  TempRoot root("validation");
  auto store = open_store(store_config(root), std::make_shared<swarm::ManualClock>());

  auto empty = store->put(make_record("x", ""));
  expect(!empty.ok() && empty.error().kind == swarm::ErrorKind::missing_field, "empty content");
  auto traversal = store->put(make_record("../escape", "x"));
  expect(!traversal.ok() && traversal.error().kind == swarm::ErrorKind::invalid_input, "bad id");
  auto missing = store->get("absent", "cid-get");
  expect(!missing.ok() && missing.error().kind == swarm::ErrorKind::resource_not_found,
         "missing record");
  expect(missing.error().correlation_id == "cid-get", "cid on store error");
  auto gone = store->remove("absent");
  expect(gone.has_value() && gone->kind == swarm::ErrorKind::resource_not_found, "remove missing");
}

void test_store_recovers_from_backup() {
  TempRoot root("recover");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto store = open_store(store_config(root), clock);
  expect(store->put(make_record("alpha", "original text")).ok(), "put");
  expect(store->backup().ok(), "backup");

  overwrite_file(store->record_path("alpha"),
                 "swarm-record v1 " + std::string(64, '0') + "\n{\"content\":\"tampered\"}");
  auto& stats = swarm::global_swarm_stats();
  const uint64_t recoveries = stats.store_recoveries.load();

  auto got = store->get("alpha");
  expect(got.ok(), "corrupt record served from backup");
  expect(got.value().content == "original text", "last good version returned");
  expect(stats.store_recoveries.load() == recoveries + 1, "recovery counted");

  auto again = store->get("alpha");
  expect(again.ok() && stats.store_recoveries.load() == recoveries + 1, "live copy repaired");
}

void test_store_corruption_without_backup() {
  TempRoot root("corrupt");
  auto store = open_store(store_config(root), std::make_shared<swarm::ManualClock>());
  expect(store->put(make_record("alpha", "text")).ok(), "put");
  overwrite_file(store->record_path("alpha"), "garbage");

  auto got = store->get("alpha", "cid-corrupt");
  expect(!got.ok() && got.error().kind == swarm::ErrorKind::resource_corrupted,
         "corruption reported");
  expect(got.error().severity == swarm::Severity::critical, "corruption is critical");
  expect(got.error().details.at("recovery") == "no_good_backup", "recovery outcome in details");
  expect(got.error().correlation_id == "cid-corrupt", "cid on corruption");

  auto all = store->load_all();
  expect(all.records.empty() && all.unreadable_ids.size() == 1, "load_all reports unreadable id");
}

void test_store_partial_write_keeps_previous() {
  TempRoot root("partial");
  auto store = open_store(store_config(root), std::make_shared<swarm::ManualClock>());
  expect(store->put(make_record("alpha", "first version")).ok(), "first put");

  arm_chaos(swarm::chaos::FaultType::store_partial_write, "alpha");
  auto second = store->put(make_record("alpha", "second version that never lands"));
  disarm_chaos();
  expect(!second.ok() && second.error().kind == swarm::ErrorKind::storage_failure,
         "partial write reported");

  auto got = store->get("alpha");
  expect(got.ok() && got.value().content == "first version", "previous version intact");
  const std::string records = (fs::path(root.path()) / "records").string();
  expect(!has_entry_with_prefix(records, ".tmp-"), "no temp file left behind");
}

void test_store_backup_failure_isolated() {
  TempRoot root("backup_fail");
  auto store = open_store(store_config(root), std::make_shared<swarm::ManualClock>());
  expect(store->put(make_record("alpha", "keep me")).ok(), "put");

  arm_chaos(swarm::chaos::FaultType::backup_failure);
  auto bk = store->backup();
  expect(!bk.ok() && bk.error().kind == swarm::ErrorKind::storage_failure, "backup fails");
  expect(store->put(make_record("beta", "still writable")).ok(), "puts continue");

  auto rm = store->remove("alpha");
  expect(rm.has_value() && rm->details["aborted"] == "remove", "remove aborts without backup");
  disarm_chaos();

  expect(store->get("alpha").ok(), "aborted remove kept the record");
  expect(store->list_backups().empty(), "no backup published");
  const std::string backups = (fs::path(root.path()) / "backups").string();
  expect(!has_entry_with_prefix(backups, ".staging-"), "staging directory cleaned");
}

void test_store_backup_retention() {
  TempRoot root("retention");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto store = open_store(store_config(root, 2), clock);
  expect(store->put(make_record("alpha", "a")).ok(), "put");

  std::vector<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    auto bk = store->backup();
    expect(bk.ok(), "backup succeeds");
    expect(bk.value().record_count == 1, "backup holds the record");
    ids.push_back(bk.value().id);
    clock->advance(1000);
  }
  auto listed = store->list_backups();
  expect(listed.size() == 2, "retention keeps two");
  expect(listed[0].id == ids[2] && listed[1].id == ids[1], "newest first, oldest rotated out");
  expect(listed[0].digest.size() == 64, "manifest digest recorded");
}

void test_store_restore() {
  TempRoot root("restore");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto store = open_store(store_config(root), clock);
  expect(store->put(make_record("a", "apple")).ok(), "put a");
  expect(store->put(make_record("b", "banana")).ok(), "put b");
  auto snap = store->backup();
  expect(snap.ok(), "snapshot");

  clock->advance(1000);
  expect(store->put(make_record("a", "apricot")).ok(), "overwrite a");
  expect(store->put(make_record("c", "cherry")).ok(), "put c");
  expect(!store->remove("b").has_value(), "remove b");

  std::vector<swarm::StoreOp> ops;
  const uint64_t listener = store->add_listener([&ops](const swarm::StoreChange& c) { ops.push_back(c.op); });
  auto restored = store->restore(snap.value().id);
  store->remove_listener(listener);
  expect(restored.ok() && restored.value() == 2, "two records restored");
  expect(store->list_ids() == std::vector<std::string>({"a", "b"}), "record set replaced");
  expect(store->get("a").value().content == "apple", "old content back");
  expect(!ops.empty() && ops.back() == swarm::StoreOp::restore, "listeners told about restore");

  auto unknown = store->restore("bk-does-not-exist");
  expect(!unknown.ok() && unknown.error().kind == swarm::ErrorKind::resource_not_found,
         "unknown backup");
}

void test_store_restore_stopped_partway() {
  TempRoot root("restore_partway");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto store = open_store(cfg, clock);
  swarm::RetrievalEngine engine(store, cfg, clock);
  expect(engine.put(make_record("a", "apple")).ok(), "put a");
  expect(engine.put(make_record("b", "banana")).ok(), "put b");
  auto snap = store->backup();
  expect(snap.ok(), "snapshot");

  clock->advance(1000);
  expect(engine.put(make_record("a", "apricot")).ok(), "overwrite a");
  expect(engine.put(make_record("b", "blueberry")).ok(), "overwrite b");
  auto warm = engine.get_page(1, 10, swarm::SortKey::id_asc);
  expect(warm.ok() && warm.value().items[0].record.content == "apricot", "page cached");
  expect(engine.get("a", false).value().record.content == "apricot", "record cached");

  arm_chaos(swarm::chaos::FaultType::store_write_failure, "b");
  auto restored = store->restore(snap.value().id);
  disarm_chaos();
  expect(!restored.ok() && restored.error().kind == swarm::ErrorKind::storage_failure,
         "restore reports the failed write");
  expect(restored.error().details.at("restore_failure") == "write", "failing stage named");
  expect(restored.error().details.at("rewritten") == "a", "rewritten ids listed");

  expect(store->get("a").value().content == "apple", "a was rewritten on disk");
  auto page = engine.get_page(1, 10, swarm::SortKey::id_asc);
  expect(page.ok() && page.value().items.size() == 2, "both records listed");
  expect(page.value().items[0].record.content == "apple", "page reflects disk after failed restore");
  expect(page.value().items[1].record.content == "blueberry", "unrestored record unchanged");
  auto view = engine.get("a", false);
  expect(view.ok() && view.value().record.content == "apple", "record cache reflects disk");
}

void test_store_prune_and_reference() {
  TempRoot root("prune");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto store = open_store(store_config(root), clock);
  expect(store->put(make_record("old", "stale memory")).ok(), "put old");
  expect(store->put(make_record("kept", "referenced memory")).ok(), "put kept");

  clock->advance(10000);
  auto ref = store->reference("kept");
  expect(ref.ok() && ref.value().reference_count == 1, "reference increments");
  expect(ref.value().last_referenced_unix_ms == clock->now_ms(), "reference touches time");

  auto pruned = store->prune_older_than(5000);
  expect(pruned.ok() && pruned.value() == std::vector<std::string>({"old"}), "old record pruned");
  expect(store->list_ids() == std::vector<std::string>({"kept"}), "referenced record kept");
  expect(store->list_backups().size() == 1, "prune took a backup first");

  auto none = store->prune_older_than(5000);
  expect(none.ok() && none.value().empty(), "nothing left to prune");
}

void test_store_reopen_cleans_temp_files() {
  TempRoot root("reopen");
  auto cfg = store_config(root);
  {
    auto store = open_store(cfg, std::make_shared<swarm::ManualClock>());
    expect(store->put(make_record("alpha", "persisted")).ok(), "put");
  }
  const fs::path leftover = fs::path(root.path()) / "records" / ".tmp-crashed";
  overwrite_file(leftover.string(), "half a record");

  auto store = open_store(cfg, std::make_shared<swarm::ManualClock>());
  expect(!fs::exists(leftover), "temp file removed on open");
  expect(store->get("alpha").ok(), "record survives reopen");
}

void test_store_concurrent_writers_and_readers() {
  TempRoot root("concurrent");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto store = open_store(store_config(root), clock);
  expect(store->put(make_record("hot", "shared memory")).ok(), "seed hot");
  expect(store->put(make_record("shared", "version-seed")).ok(), "seed shared");
  const uint64_t recoveries_before = swarm::global_swarm_stats().store_recoveries.load();
  const std::string shared_path = (fs::path(root.path()) / "records" / "shared.rec").string();

  constexpr int kReferencers = 4;
  constexpr int kRefsEach    = 25;
  constexpr int kPutters     = 2;
  constexpr int kPutsEach    = 25;
  constexpr int kReaders     = 3;
  constexpr int kReadsEach   = 60;
  std::atomic<int> write_failures{0};
  std::atomic<int> bad_reads{0};
  std::vector<std::thread> threads;

  for (int t = 0; t < kReferencers; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kRefsEach; ++i) {
        if (!store->reference("hot").ok()) write_failures.fetch_add(1);
      }
    });
  }
  for (int t = 0; t < kPutters; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPutsEach; ++i) {
        const std::string tag = std::to_string(t) + "-" + std::to_string(i);
        if (!store->put(make_record("shared", "version-" + tag)).ok()) write_failures.fetch_add(1);
        if (!store->put(make_record("cold-" + tag, "elsewhere")).ok()) write_failures.fetch_add(1);
      }
    });
  }
  for (int t = 0; t < kReaders; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < kReadsEach; ++i) {
        auto hot = store->get("hot");
        if (!hot.ok() || hot.value().checksum != swarm::record_checksum(hot.value().payload_json())) {
          bad_reads.fetch_add(1);
        }
        auto shared = store->get("shared");
        if (!shared.ok() || shared.value().content.rfind("version-", 0) != 0) bad_reads.fetch_add(1);
        // Straight off disk, bypassing the record lock.
        if (!swarm::decode_record_file(read_whole(shared_path), "shared").ok()) bad_reads.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  expect(write_failures.load() == 0, "every write landed");
  expect(bad_reads.load() == 0, "no reader saw a partial or unverified record");
  auto hot = store->get("hot");
  expect(hot.ok() && hot.value().reference_count == kReferencers * kRefsEach,
         "reference count matches the number of reference calls");
  expect(store->list_ids().size() == 2 + kPutters * kPutsEach, "every record present");
  expect(swarm::global_swarm_stats().store_recoveries.load() == recoveries_before,
         "no recovery was needed");
}

// ---------------------------------------------------------------------------
// Retrieval
// ---------------------------------------------------------------------------

void test_page_info_math() {
  auto info = swarm::make_page_info(2, 20, 45);
  expect(info.total_pages == 3 && info.has_next && info.has_prev, "middle page");
  info = swarm::make_page_info(3, 20, 45);
  expect(!info.has_next && info.has_prev, "last page");
  info = swarm::make_page_info(1, 20, 0);
  expect(info.total_pages == 0 && !info.has_next && !info.has_prev, "empty result");
  info = swarm::make_page_info(1, 20, 40);
  expect(info.total_pages == 2, "exact multiple");
  expect(info.to_json().find("\"totalPages\":2") != std::string::npos, "wire key names");
}

void test_retrieval_pagination() {
  TempRoot root("pages");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto store = open_store(cfg, clock);
  swarm::RetrievalEngine engine(store, cfg, clock);

  const uint64_t base = clock->now_ms() - 100000;
  for (int i = 0; i < 45; ++i) {
    char id[16];
    std::snprintf(id, sizeof(id), "rec-%02d", i);
    auto r = make_record(id, "memory number " + std::to_string(i));
    r.created_at_unix_ms = base + static_cast<uint64_t>(i);
    expect(engine.put(r).ok(), "put record");
  }

  auto first = engine.get_page(1, 20);
  expect(first.ok() && first.value().items.size() == 20, "full first page");
  expect(first.value().info.total_count == 45 && first.value().info.total_pages == 3, "totals");
  expect(first.value().items[0].record.id == "rec-44", "newest first by default");

  auto last = engine.get_page(3, 20);
  expect(last.ok() && last.value().items.size() == 5, "remainder on last page");
  expect(!last.value().info.has_next && last.value().info.has_prev, "last page flags");

  auto beyond = engine.get_page(4, 20);
  expect(beyond.ok() && beyond.value().items.empty(), "page past the end is empty");
  expect(beyond.value().info.total_pages == 3, "totals still reported");

  auto asc = engine.get_page(1, 3, swarm::SortKey::id_asc);
  expect(asc.ok() && asc.value().items[0].record.id == "rec-00", "id ascending");

  auto zero = engine.get_page(0, 20, swarm::SortKey::created_desc, "cid-page");
  expect(!zero.ok() && zero.error().kind == swarm::ErrorKind::invalid_input, "page 0 rejected");
  expect(zero.error().correlation_id == "cid-page", "cid on paging error");
  auto empty = engine.get_page(1, 0);
  expect(!empty.ok() && empty.error().kind == swarm::ErrorKind::invalid_input, "size 0 rejected");
}

void test_retrieval_search_scenario() {
  TempRoot root("search");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto store = open_store(cfg, clock);
  swarm::RetrievalEngine engine(store, cfg, clock);

  auto id = engine.put(make_record("", "hello"));
  expect(id.ok(), "put hello");

  auto hit = engine.search("hello", swarm::SearchFilters{}, 1, 20);
  expect(hit.ok() && hit.value().info.total_count == 1, "exactly one match");
  expect(hit.value().items[0].record.id == id.value(), "the record just written");
  expect(hit.value().items[0].score > 0.0, "scored");

  auto miss = engine.search("zzz-no-match", swarm::SearchFilters{}, 1, 20);
  expect(miss.ok(), "no match is not an error");
  expect(miss.value().info.total_count == 0 && miss.value().items.empty(), "empty result");

  auto tokens = swarm::tokenize_query("Hello, WORLD! 42");
  expect(tokens == std::vector<std::string>({"hello", "world", "42"}), "query tokenized");
}

void test_retrieval_search_filters_and_ranking() {
  TempRoot root("rank");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto store = open_store(cfg, clock);
  swarm::RetrievalEngine engine(store, cfg, clock);

  auto work = make_record("work", "project deadline memory");
  work.themes = {"work"};
  work.emotions = {{"stress", 0.9}};
  work.owner = "ava";
  auto home = make_record("home", "quiet memory at home");
  home.themes = {"home"};
  home.emotions = {{"stress", 0.1}};
  home.owner = "ben";
  auto busy = make_record("busy", "memory memory memory of work");
  busy.themes = {"work"};
  busy.reference_count = 40;
  for (const auto& r : {work, home, busy}) expect(engine.put(r).ok(), "put");

  swarm::SearchFilters themes;
  themes.themes = {"work"};
  auto by_theme = engine.search("", themes, 1, 10);
  expect(by_theme.ok() && by_theme.value().info.total_count == 2, "theme filter");

  swarm::SearchFilters stressed;
  stressed.emotion = "stress";
  stressed.emotion_min = 0.5;
  auto by_emotion = engine.search("memory", stressed, 1, 10);
  expect(by_emotion.ok() && by_emotion.value().info.total_count == 1, "emotion range filter");
  expect(by_emotion.value().items[0].record.id == "work", "stressed record");

  swarm::SearchFilters owner;
  owner.owner = "ben";
  auto by_owner = engine.search("memory", owner, 1, 10);
  expect(by_owner.ok() && by_owner.value().items.size() == 1, "owner filter");

  swarm::SearchFilters inverted;
  inverted.emotion = "stress";
  inverted.emotion_min = 0.8;
  inverted.emotion_max = 0.2;
  auto bad = engine.search("memory", inverted, 1, 10);
  expect(!bad.ok() && bad.error().kind == swarm::ErrorKind::invalid_input, "empty range rejected");

  auto ranked = engine.search("memory", swarm::SearchFilters{}, 1, 10);
  expect(ranked.ok() && ranked.value().items.size() == 3, "all match");
  expect(ranked.value().items[0].record.id == "busy", "stronger match ranks first");
  for (size_t i = 1; i < ranked.value().items.size(); ++i) {
    expect(ranked.value().items[i - 1].score >= ranked.value().items[i].score, "descending score");
  }

  // A second engine recomputes without the first one's cache.
  swarm::RetrievalEngine other(store, cfg, clock);
  auto again = other.search("memory", swarm::SearchFilters{}, 1, 10);
  expect(again.ok(), "repeat search");
  for (size_t i = 0; i < ranked.value().items.size(); ++i) {
    expect(again.value().items[i].record.id == ranked.value().items[i].record.id,
           "identical search yields identical order");
  }
}

void test_retrieval_cache_invalidation() {
  TempRoot root("invalidate");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto store = open_store(cfg, clock);
  swarm::RetrievalEngine engine(store, cfg, clock);
  expect(engine.put(make_record("alpha", "first draft")).ok(), "put");

  auto page = engine.get_page(1, 10);
  expect(page.ok() && page.value().info.total_count == 1, "one record");
  auto cached = engine.get_page(1, 10);
  expect(cached.ok() && engine.long_cache_stats().hits == 1, "second page read hits the cache");

  expect(engine.put(make_record("beta", "another")).ok(), "second put");
  auto fresh = engine.get_page(1, 10);
  expect(fresh.ok() && fresh.value().info.total_count == 2, "write invalidates cached pages");

  auto v1 = engine.get("alpha", false);
  auto v2 = engine.get("alpha", false);
  expect(v1.ok() && v2.ok() && engine.short_cache_stats().hits >= 1, "record reads cached");
  expect(engine.put(make_record("alpha", "second draft")).ok(), "overwrite");
  auto v3 = engine.get("alpha", false);
  expect(v3.ok() && v3.value().record.content == "second draft", "overwrite visible at once");

  expect(!engine.remove("alpha").has_value(), "remove");
  auto v4 = engine.get("alpha", false);
  expect(!v4.ok() && v4.error().kind == swarm::ErrorKind::resource_not_found, "removed at once");

  clock->advance(cfg.long_cache_ttl_ms);
  expect(engine.purge_expired() >= 1, "expired entries purged");
}

void test_retrieval_record_flags() {
  TempRoot root("flags");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto store = open_store(cfg, clock);
  swarm::RetrievalEngine engine(store, cfg, clock);

  auto old_busy = make_record("old-busy", "well worn memory");
  old_busy.created_at_unix_ms = clock->now_ms() - 2 * cfg.recent_window_ms;
  old_busy.reference_count = cfg.frequent_access_threshold + 1;
  expect(engine.put(old_busy).ok(), "put old");
  expect(engine.put(make_record("fresh", "brand new memory")).ok(), "put fresh");

  auto o = engine.get("old-busy", false);
  expect(o.ok() && !o.value().is_new && o.value().frequently_accessed, "old and busy");
  auto f = engine.get("fresh", false);
  expect(f.ok() && f.value().is_new && !f.value().frequently_accessed, "new and quiet");

  auto referenced = engine.get("fresh");
  expect(referenced.ok() && referenced.value().record.reference_count == 1, "get references");
  expect(referenced.value().to_json().find("\"is_new\":true") != std::string::npos, "flags in JSON");
}

// ---------------------------------------------------------------------------
// Memory service
// ---------------------------------------------------------------------------

swarm::Result<std::string> call(swarm::MemoryService& svc, const std::string& payload,
                                const std::string& cid = "cid-svc") {
  swarm::WorkerRequest req;
  req.role               = "memory";
  req.payload            = payload;
  req.ctx.correlation_id = cid;
  return svc.handle(req);
}

void test_memory_service_ops() {
  TempRoot root("service");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto engine = std::make_shared<swarm::RetrievalEngine>(open_store(cfg, clock), cfg, clock);
  swarm::MemoryService svc(engine, "memory-0");

  auto put = call(svc, R"({"op":"put","record":{"content":"hello swarm","themes":["greeting"]}})");
  expect(put.ok(), "put op");
  std::optional<swarm::jsonlite::JsonError> err;
  const std::string id = swarm::jsonlite::get_string(swarm::jsonlite::parse(put.value(), &err), "id");
  expect(!err && !id.empty(), "put returns an id");

  auto got = call(svc, R"({"op":"get","id":")" + id + R"(","reference":false})");
  expect(got.ok() && got.value().find("hello swarm") != std::string::npos, "get op");

  auto search = call(svc, R"({"op":"search","query":"hello","filters":{"themes":["greeting"]}})");
  expect(search.ok() && search.value().find("\"totalCount\":1") != std::string::npos, "search op");

  auto page = call(svc, R"({"op":"page","page":1,"page_size":5,"sort":"id_asc"})");
  expect(page.ok() && page.value().find("\"pageSize\":5") != std::string::npos, "page op");

  auto health = call(svc, R"({"op":"health"})");
  expect(health.ok() && health.value().find("\"health\":\"healthy\"") != std::string::npos,
         "health op");

  auto del = call(svc, R"({"op":"delete","id":")" + id + R"("})");
  expect(del.ok(), "delete op");
  auto after = call(svc, R"({"op":"get","id":")" + id + R"("})", "cid-after");
  expect(!after.ok() && after.error().kind == swarm::ErrorKind::resource_not_found, "deleted");
  expect(after.error().correlation_id == "cid-after", "cid on service error");
  expect(after.error().details.at("instance") == "memory-0", "instance on service error");
  expect(svc.requests_handled() == 7, "requests counted");
}

void test_memory_service_rejects_bad_requests() {
  TempRoot root("service_bad");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto engine = std::make_shared<swarm::RetrievalEngine>(open_store(cfg, clock), cfg, clock);
  swarm::MemoryService svc(engine, "memory-1");

  auto garbage = call(svc, "not json");
  expect(!garbage.ok() && garbage.error().kind == swarm::ErrorKind::invalid_input, "bad JSON");
  auto no_op = call(svc, R"({"id":"x"})");
  expect(!no_op.ok() && no_op.error().kind == swarm::ErrorKind::missing_field, "missing op");
  auto unknown = call(svc, R"({"op":"explode"})");
  expect(!unknown.ok() && unknown.error().kind == swarm::ErrorKind::invalid_input, "unknown op");
  auto no_record = call(svc, R"({"op":"put"})");
  expect(!no_record.ok() && no_record.error().kind == swarm::ErrorKind::missing_field, "no record");
  auto page0 = call(svc, R"({"op":"page","page":0})");
  expect(!page0.ok() && page0.error().kind == swarm::ErrorKind::invalid_input, "page 0");
  auto negative = call(svc, R"({"op":"search","query":"x","page_size":-3})");
  expect(!negative.ok() && negative.error().kind == swarm::ErrorKind::invalid_input, "negative size");
  auto sort = call(svc, R"({"op":"page","sort":"sideways"})");
  expect(!sort.ok() && sort.error().kind == swarm::ErrorKind::invalid_input, "unknown sort");
}

void test_memory_service_behind_router() {
  TempRoot root("service_routed");
  auto clock = std::make_shared<swarm::ManualClock>();
  auto cfg = store_config(root);
  auto engine = std::make_shared<swarm::RetrievalEngine>(open_store(cfg, clock), cfg, clock);

  auto reg = std::make_shared<swarm::ServiceRegistry>(cfg, clock);
  auto transport = std::make_shared<swarm::InProcessTransport>();
  auto svc = std::make_shared<swarm::MemoryService>(engine, "memory-0");
  transport->bind("inproc://memory-0", swarm::make_memory_handler(svc),
                  swarm::make_memory_probe(svc));
  reg->register_instance(instance("memory-0", "memory"));

  swarm::HealthMonitor monitor(reg, transport);
  svc->set_health(swarm::HealthState::unhealthy);
  monitor.run_once();
  swarm::RequestRouter router(reg, transport);
  auto refused = router.route("memory", R"({"op":"health"})");
  expect(!refused.ok() && refused.error().kind == swarm::ErrorKind::service_unavailable,
         "unhealthy worker not routed to");

  svc->set_health(swarm::HealthState::healthy);
  monitor.run_once();
  auto put = router.route("memory", R"({"op":"put","record":{"id":"r1","content":"routed"}})");
  expect(put.ok() && put.value().instance_id == "memory-0", "routed put");
  auto search = router.route("memory", R"({"op":"search","query":"routed"})");
  expect(search.ok() && search.value().body.find("\"r1\"") != std::string::npos, "routed search");
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
  swarm::set_log_level(swarm::LogLevel::off);
  std::cout << "=== swarm test suite (" << swarm::version::current_manifest().semver << ") ===\n";

  std::cout << "\n[Errors]\n";
  run_test("error_taxonomy", test_error_taxonomy);
  run_test("error_wire_shape", test_error_wire_shape);
  run_test("translate_errno", test_translate_errno);
  run_test("correlation_ids", test_correlation_ids);

  std::cout << "\n[Config]\n";
  run_test("config_defaults_and_overlay", test_config_defaults_and_overlay);
  run_test("config_validation", test_config_validation);
  run_test("config_env", test_config_env);
  run_test("jsonlite", test_jsonlite);

  std::cout << "\n[Cache]\n";
  run_test("cache_ttl", test_cache_ttl);
  run_test("cache_lru_and_erase", test_cache_lru_and_erase);

  std::cout << "\n[Registry]\n";
  run_test("registry_register_and_validate", test_registry_register_and_validate);
  run_test("registry_deregister_idempotent", test_registry_deregister_idempotent);
  run_test("registry_staleness_sweep", test_registry_staleness_sweep);

  std::cout << "\n[Circuit]\n";
  run_test("circuit_opens_at_threshold", test_circuit_opens_at_threshold);
  run_test("circuit_single_half_open_trial", test_circuit_single_half_open_trial);
  run_test("circuit_window_and_abandon", test_circuit_window_and_abandon);

  std::cout << "\n[Router]\n";
  run_test("router_skips_stale_instance", test_router_skips_stale_instance);
  run_test("router_circuit_scenario", test_router_circuit_scenario);
  run_test("router_retry_and_exhaustion", test_router_retry_and_exhaustion);
  run_test("router_passes_worker_errors_through", test_router_passes_worker_errors_through);
  run_test("router_cancelled_request", test_router_cancelled_request);
  run_test("transport_timeout_cancels_attempt", test_transport_timeout_cancels_attempt);
  run_test("transport_joins_worker_threads", test_transport_joins_worker_threads);
  run_test("router_retry_after_timeout_commits_once", test_router_retry_after_timeout_commits_once);
  run_test("router_concurrent_with_sweep_and_deregister",
           test_router_concurrent_with_sweep_and_deregister);

  std::cout << "\n[Health]\n";
  run_test("health_monitor_tick", test_health_monitor_tick);
  run_test("health_monitor_start_stop", test_health_monitor_start_stop);
  run_test("health_monitor_concurrent_start_stop", test_health_monitor_concurrent_start_stop);

  std::cout << "\n[Store]\n";
  run_test("store_put_get_checksum", test_store_put_get_checksum);
  run_test("store_validation_errors", test_store_validation_errors);
  run_test("store_recovers_from_backup", test_store_recovers_from_backup);
  run_test("store_corruption_without_backup", test_store_corruption_without_backup);
  run_test("store_partial_write_keeps_previous", test_store_partial_write_keeps_previous);
  run_test("store_backup_failure_isolated", test_store_backup_failure_isolated);
  run_test("store_backup_retention", test_store_backup_retention);
  run_test("store_restore", test_store_restore);
  run_test("store_restore_stopped_partway", test_store_restore_stopped_partway);
  run_test("store_prune_and_reference", test_store_prune_and_reference);
  run_test("store_reopen_cleans_temp_files", test_store_reopen_cleans_temp_files);
  run_test("store_concurrent_writers_and_readers", test_store_concurrent_writers_and_readers);

  std::cout << "\n[Retrieval]\n";
  run_test("page_info_math", test_page_info_math);
  run_test("retrieval_pagination", test_retrieval_pagination);
  run_test("retrieval_search_scenario", test_retrieval_search_scenario);
  run_test("retrieval_search_filters_and_ranking", test_retrieval_search_filters_and_ranking);
  run_test("retrieval_cache_invalidation", test_retrieval_cache_invalidation);
  run_test("retrieval_record_flags", test_retrieval_record_flags);

  std::cout << "\n[Memory service]\n";
  run_test("memory_service_ops", test_memory_service_ops);
  run_test("memory_service_rejects_bad_requests", test_memory_service_rejects_bad_requests);
  run_test("memory_service_behind_router", test_memory_service_behind_router);

  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return g_tests_passed == g_tests_run ? 0 : 1;
}
