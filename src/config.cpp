#include "swarm/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "swarm/jsonlite.hpp"

namespace swarm {

namespace {

// Strict decimal parse: digits only, no sign, no trailing garbage.
bool parse_u64(const char* s, uint64_t& out) {
  if (!s || !s[0]) return false;
  for (const char* p = s; *p; ++p) {
    if (*p < '0' || *p > '9') return false;
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (errno == ERANGE || !end || *end != '\0') return false;
  out = static_cast<uint64_t>(v);
  return true;
}

template <typename T>
Status env_u64(const char* name, T& field) {
  const char* e = std::getenv(name);
  if (!e || !e[0]) return std::nullopt;
  uint64_t v = 0;
  if (!parse_u64(e, v)) {
    return make_error(ErrorKind::invalid_input,
                      std::string("environment variable ") + name + " is not a non-negative integer",
                      "", {{"variable", name}, {"value", e}});
  }
  field = static_cast<T>(v);
  return std::nullopt;
}

void env_string(const char* name, std::string& field) {
  const char* e = std::getenv(name);
  if (e && e[0]) field = e;
}

template <typename T>
Status json_u64(const jsonlite::Object& obj, const char* key, T& field) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (!std::holds_alternative<std::uint64_t>(it->second.v)) {
    return make_error(ErrorKind::invalid_input,
                      std::string("config key ") + key + " must be a non-negative integer",
                      "", {{"key", key}});
  }
  field = static_cast<T>(std::get<std::uint64_t>(it->second.v));
  return std::nullopt;
}

Status json_string(const jsonlite::Object& obj, const char* key, std::string& field) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (!it->second.is_string()) {
    return make_error(ErrorKind::invalid_input,
                      std::string("config key ") + key + " must be a string", "", {{"key", key}});
  }
  field = std::get<std::string>(it->second.v);
  return std::nullopt;
}

Status json_bool(const jsonlite::Object& obj, const char* key, bool& field) {
  auto it = obj.find(key);
  if (it == obj.end()) return std::nullopt;
  if (!std::holds_alternative<bool>(it->second.v)) {
    return make_error(ErrorKind::invalid_input,
                      std::string("config key ") + key + " must be a boolean", "", {{"key", key}});
  }
  field = std::get<bool>(it->second.v);
  return std::nullopt;
}

StandardError invalid(const std::string& msg, const std::string& field) {
  return make_error(ErrorKind::invalid_input, msg, "", {{"field", field}});
}

}  // namespace

Status SwarmConfig::validate() const {
  if (heartbeat_interval_ms == 0) return invalid("heartbeat interval must be positive", "heartbeat_interval_ms");
  if (stale_after_ms == 0) return invalid("staleness threshold must be positive", "stale_after_ms");
  if (deregister_after_ms <= stale_after_ms) {
    return invalid("deregistration threshold must exceed staleness threshold", "deregister_after_ms");
  }
  if (circuit_failure_threshold == 0) return invalid("circuit failure threshold must be positive", "circuit_failure_threshold");
  if (circuit_window_ms == 0) return invalid("circuit window must be positive", "circuit_window_ms");
  if (circuit_cooldown_ms == 0) return invalid("circuit cool-down must be positive", "circuit_cooldown_ms");
  if (circuit_cooldown_multiplier == 0) return invalid("cool-down multiplier must be positive", "circuit_cooldown_multiplier");
  if (circuit_cooldown_max_ms < circuit_cooldown_ms) {
    return invalid("maximum cool-down must be at least the base cool-down", "circuit_cooldown_max_ms");
  }
  if (call_timeout_ms == 0) return invalid("call timeout must be positive", "call_timeout_ms");
  if (probe_timeout_ms == 0) return invalid("probe timeout must be positive", "probe_timeout_ms");
  if (short_cache_capacity == 0) return invalid("short cache capacity must be positive", "short_cache_capacity");
  if (long_cache_capacity == 0) return invalid("long cache capacity must be positive", "long_cache_capacity");
  if (short_cache_ttl_ms == 0 || long_cache_ttl_ms == 0) return invalid("cache TTLs must be positive", "cache_ttl_ms");
  if (backup_retention == 0) return invalid("backup retention must be at least 1", "backup_retention");
  if (backup_compression != "off" && backup_compression != "zstd") {
    return invalid("backup compression must be \"off\" or \"zstd\"", "backup_compression");
  }
#if !defined(SWARM_WITH_ZSTD)
  if (backup_compression == "zstd") {
    return invalid("this build has no zstd support", "backup_compression");
  }
#endif
  if (store_root.empty()) return invalid("store root must not be empty", "store_root");
  return std::nullopt;
}

std::string SwarmConfig::to_json() const {
  jsonlite::Object o;
  o["heartbeat_interval_ms"]       = jsonlite::Value{heartbeat_interval_ms};
  o["stale_after_ms"]              = jsonlite::Value{stale_after_ms};
  o["deregister_after_ms"]         = jsonlite::Value{deregister_after_ms};
  o["probe_timeout_ms"]            = jsonlite::Value{probe_timeout_ms};
  o["probe_on_sweep"]              = jsonlite::Value{probe_on_sweep};
  o["circuit_failure_threshold"]   = jsonlite::Value{circuit_failure_threshold};
  o["circuit_window_ms"]           = jsonlite::Value{circuit_window_ms};
  o["circuit_cooldown_ms"]         = jsonlite::Value{circuit_cooldown_ms};
  o["circuit_cooldown_multiplier"] = jsonlite::Value{circuit_cooldown_multiplier};
  o["circuit_cooldown_max_ms"]     = jsonlite::Value{circuit_cooldown_max_ms};
  o["retry_budget"]                = jsonlite::Value{retry_budget};
  o["call_timeout_ms"]             = jsonlite::Value{call_timeout_ms};
  o["short_cache_ttl_ms"]          = jsonlite::Value{short_cache_ttl_ms};
  o["short_cache_capacity"]        = jsonlite::Value{short_cache_capacity};
  o["long_cache_ttl_ms"]           = jsonlite::Value{long_cache_ttl_ms};
  o["long_cache_capacity"]         = jsonlite::Value{long_cache_capacity};
  o["recent_window_ms"]            = jsonlite::Value{recent_window_ms};
  o["frequent_access_threshold"]   = jsonlite::Value{frequent_access_threshold};
  o["backup_retention"]            = jsonlite::Value{backup_retention};
  o["backup_compression"]          = jsonlite::Value{backup_compression};
  o["store_root"]                  = jsonlite::Value{store_root};
  return jsonlite::to_json(o);
}

Status apply_config_json(SwarmConfig& cfg, const std::string& json) {
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json, &err);
  if (err) {
    return make_error(ErrorKind::invalid_input, "config is not a valid JSON object: " + err->message,
                      "", {{"code", err->code}});
  }

  Status st;
  if ((st = json_u64(obj, "heartbeat_interval_ms", cfg.heartbeat_interval_ms))) return st;
  if ((st = json_u64(obj, "stale_after_ms", cfg.stale_after_ms))) return st;
  if ((st = json_u64(obj, "deregister_after_ms", cfg.deregister_after_ms))) return st;
  if ((st = json_u64(obj, "probe_timeout_ms", cfg.probe_timeout_ms))) return st;
  if ((st = json_bool(obj, "probe_on_sweep", cfg.probe_on_sweep))) return st;
  if ((st = json_u64(obj, "circuit_failure_threshold", cfg.circuit_failure_threshold))) return st;
  if ((st = json_u64(obj, "circuit_window_ms", cfg.circuit_window_ms))) return st;
  if ((st = json_u64(obj, "circuit_cooldown_ms", cfg.circuit_cooldown_ms))) return st;
  if ((st = json_u64(obj, "circuit_cooldown_multiplier", cfg.circuit_cooldown_multiplier))) return st;
  if ((st = json_u64(obj, "circuit_cooldown_max_ms", cfg.circuit_cooldown_max_ms))) return st;
  if ((st = json_u64(obj, "retry_budget", cfg.retry_budget))) return st;
  if ((st = json_u64(obj, "call_timeout_ms", cfg.call_timeout_ms))) return st;
  if ((st = json_u64(obj, "short_cache_ttl_ms", cfg.short_cache_ttl_ms))) return st;
  if ((st = json_u64(obj, "short_cache_capacity", cfg.short_cache_capacity))) return st;
  if ((st = json_u64(obj, "long_cache_ttl_ms", cfg.long_cache_ttl_ms))) return st;
  if ((st = json_u64(obj, "long_cache_capacity", cfg.long_cache_capacity))) return st;
  if ((st = json_u64(obj, "recent_window_ms", cfg.recent_window_ms))) return st;
  if ((st = json_u64(obj, "frequent_access_threshold", cfg.frequent_access_threshold))) return st;
  if ((st = json_u64(obj, "backup_retention", cfg.backup_retention))) return st;
  if ((st = json_string(obj, "backup_compression", cfg.backup_compression))) return st;
  if ((st = json_string(obj, "store_root", cfg.store_root))) return st;
  return std::nullopt;
}

Status apply_config_env(SwarmConfig& cfg) {
  Status st;
  if ((st = env_u64("SWARM_HEARTBEAT_INTERVAL_MS", cfg.heartbeat_interval_ms))) return st;
  if ((st = env_u64("SWARM_STALE_AFTER_MS", cfg.stale_after_ms))) return st;
  if ((st = env_u64("SWARM_DEREGISTER_AFTER_MS", cfg.deregister_after_ms))) return st;
  if ((st = env_u64("SWARM_PROBE_TIMEOUT_MS", cfg.probe_timeout_ms))) return st;
  if ((st = env_u64("SWARM_CIRCUIT_THRESHOLD", cfg.circuit_failure_threshold))) return st;
  if ((st = env_u64("SWARM_CIRCUIT_WINDOW_MS", cfg.circuit_window_ms))) return st;
  if ((st = env_u64("SWARM_CIRCUIT_COOLDOWN_MS", cfg.circuit_cooldown_ms))) return st;
  if ((st = env_u64("SWARM_RETRY_BUDGET", cfg.retry_budget))) return st;
  if ((st = env_u64("SWARM_CALL_TIMEOUT_MS", cfg.call_timeout_ms))) return st;
  if ((st = env_u64("SWARM_SHORT_TTL_MS", cfg.short_cache_ttl_ms))) return st;
  if ((st = env_u64("SWARM_LONG_TTL_MS", cfg.long_cache_ttl_ms))) return st;
  if ((st = env_u64("SWARM_RECENT_WINDOW_MS", cfg.recent_window_ms))) return st;
  if ((st = env_u64("SWARM_FREQUENT_THRESHOLD", cfg.frequent_access_threshold))) return st;
  if ((st = env_u64("SWARM_BACKUP_RETENTION", cfg.backup_retention))) return st;
  env_string("SWARM_BACKUP_COMPRESSION", cfg.backup_compression);
  env_string("SWARM_STORE_ROOT", cfg.store_root);
  return std::nullopt;
}

Result<SwarmConfig> load_config(const std::string& path) {
  SwarmConfig cfg;

  std::string file = path;
  if (file.empty()) {
    const char* e = std::getenv("SWARM_CONFIG");
    if (e && e[0]) file = e;
  }
  if (!file.empty()) {
    std::ifstream ifs(file, std::ios::binary);
    if (!ifs) {
      return make_error(ErrorKind::resource_not_found, "config file not readable", "",
                        {{"path", file}});
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    if (auto st = apply_config_json(cfg, ss.str())) {
      st->details["path"] = file;
      return *st;
    }
  }

  if (auto st = apply_config_env(cfg)) return *st;
  if (auto st = cfg.validate()) return *st;
  return cfg;
}

}  // namespace swarm
