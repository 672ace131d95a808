#pragma once

// swarm/config.hpp - Runtime configuration for every swarm component.
//
// Precedence, lowest to highest:
//   1. compiled defaults (below)
//   2. JSON config file (--config <path> or SWARM_CONFIG)
//   3. SWARM_* environment variables
//
// JSON keys are the field names below. Unknown keys are ignored; keys with
// the wrong JSON type are rejected as invalid-input.

#include <cstdint>
#include <string>

#include "swarm/errors.hpp"

namespace swarm {

struct SwarmConfig {
  // --- Registry & health sweep ---
  uint64_t heartbeat_interval_ms{1000};
  uint64_t stale_after_ms{5000};
  uint64_t deregister_after_ms{30000};
  uint64_t probe_timeout_ms{500};
  bool     probe_on_sweep{true};

  // --- Circuit breaker ---
  uint32_t circuit_failure_threshold{5};
  uint64_t circuit_window_ms{60000};
  uint64_t circuit_cooldown_ms{10000};
  uint32_t circuit_cooldown_multiplier{2};
  uint64_t circuit_cooldown_max_ms{80000};

  // --- Routing ---
  uint32_t retry_budget{2};
  uint64_t call_timeout_ms{2000};

  // --- Cache & retrieval ---
  uint64_t short_cache_ttl_ms{5000};
  uint32_t short_cache_capacity{256};
  uint64_t long_cache_ttl_ms{60000};
  uint32_t long_cache_capacity{1024};
  uint64_t recent_window_ms{24ULL * 60 * 60 * 1000};
  uint64_t frequent_access_threshold{5};

  // --- Store ---
  uint32_t    backup_retention{5};
  std::string backup_compression{"off"};  // "off" | "zstd"
  std::string store_root{".swarm/store"};

  // Rejects inconsistent settings with invalid-input.
  Status validate() const;

  std::string to_json() const;
};

// Overlay keys present in `json` onto `cfg`.
Status apply_config_json(SwarmConfig& cfg, const std::string& json);

// Overlay SWARM_* environment variables onto `cfg`.
Status apply_config_env(SwarmConfig& cfg);

// Defaults, then `path` (or $SWARM_CONFIG when `path` is empty), then env;
// the result is validated.
Result<SwarmConfig> load_config(const std::string& path = "");

}  // namespace swarm
