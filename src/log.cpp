#include "swarm/log.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace swarm {

namespace {

LogLevel initial_level() {
  const char* env = std::getenv("SWARM_LOG_LEVEL");
  if (!env || !env[0]) return LogLevel::warn;
  return parse_log_level(env, LogLevel::warn);
}

std::atomic<int>& level_slot() {
  static std::atomic<int> slot{static_cast<int>(initial_level())};
  return slot;
}

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info: return "INFO";
    case LogLevel::warn: return "WARN";
    case LogLevel::error: return "ERROR";
    case LogLevel::off: return "OFF";
  }
  return "INFO";
}

std::mutex g_write_mu;

}  // namespace

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
  if (name == "debug") return LogLevel::debug;
  if (name == "info") return LogLevel::info;
  if (name == "warn" || name == "warning") return LogLevel::warn;
  if (name == "error") return LogLevel::error;
  if (name == "off" || name == "none") return LogLevel::off;
  return fallback;
}

void set_log_level(LogLevel level) {
  level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
  return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level) {
  return level != LogLevel::off &&
         static_cast<int>(level) >= level_slot().load(std::memory_order_relaxed);
}

void log(LogLevel level, const char* component, const std::string& message) {
  if (!log_enabled(level)) return;
  // One fprintf per line; the mutex keeps lines from different threads whole.
  std::lock_guard<std::mutex> lk(g_write_mu);
  std::fprintf(stderr, "[swarm:%s] %s: %s\n", component, level_name(level), message.c_str());
}

}  // namespace swarm
