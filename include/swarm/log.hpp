#pragma once

// swarm/log.hpp - Leveled stderr logging.
//
// Lines look like "[swarm:router] WARN: instance mem-2 circuit opened".
// Minimum level comes from SWARM_LOG_LEVEL (debug|info|warn|error|off),
// default warn; set_log_level() overrides it at runtime.

#include <string>

namespace swarm {

enum class LogLevel {
  debug = 0,
  info  = 1,
  warn  = 2,
  error = 3,
  off   = 4,
};

void     set_log_level(LogLevel level);
LogLevel log_level();
bool     log_enabled(LogLevel level);

// Parses the SWARM_LOG_LEVEL vocabulary; unknown names give `fallback`.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::warn);

void log(LogLevel level, const char* component, const std::string& message);

inline void log_debug(const char* component, const std::string& m) { log(LogLevel::debug, component, m); }
inline void log_info(const char* component, const std::string& m) { log(LogLevel::info, component, m); }
inline void log_warn(const char* component, const std::string& m) { log(LogLevel::warn, component, m); }
inline void log_error(const char* component, const std::string& m) { log(LogLevel::error, component, m); }

}  // namespace swarm
