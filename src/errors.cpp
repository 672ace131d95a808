#include "swarm/errors.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <random>
#include <sstream>
#include <unistd.h>

#include "swarm/hash.hpp"
#include "swarm/jsonlite.hpp"

namespace swarm {

namespace {

uint64_t wall_clock_ms() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::system_clock::now().time_since_epoch())
                                   .count());
}

// Parse "YYYY-MM-DDTHH:MM:SS.mmmZ" back to unix ms. Returns 0 when malformed.
uint64_t parse_iso8601_ms(const std::string& s) {
  int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0, ms = 0;
  if (std::sscanf(s.c_str(), "%d-%d-%dT%d:%d:%d.%dZ", &y, &mo, &d, &h, &mi, &sec, &ms) < 6) {
    return 0;
  }
  std::tm tm{};
  tm.tm_year = y - 1900;
  tm.tm_mon  = mo - 1;
  tm.tm_mday = d;
  tm.tm_hour = h;
  tm.tm_min  = mi;
  tm.tm_sec  = sec;
  const time_t t = ::timegm(&tm);
  if (t < 0) return 0;
  return static_cast<uint64_t>(t) * 1000u + static_cast<uint64_t>(ms);
}

}  // namespace

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::invalid_input: return "invalid-input";
    case ErrorKind::missing_field: return "missing-field";
    case ErrorKind::authentication_failed: return "authentication-failed";
    case ErrorKind::permission_denied: return "permission-denied";
    case ErrorKind::resource_not_found: return "resource-not-found";
    case ErrorKind::resource_corrupted: return "resource-corrupted";
    case ErrorKind::storage_failure: return "storage-failure";
    case ErrorKind::service_unavailable: return "service-unavailable";
    case ErrorKind::dependency_failure: return "dependency-failure";
    case ErrorKind::network_error: return "network-error";
    case ErrorKind::timeout: return "timeout";
    case ErrorKind::cancelled: return "cancelled";
    case ErrorKind::internal_error: return "internal-error";
    case ErrorKind::unknown: return "unknown";
  }
  return "unknown";
}

std::string to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::validation: return "validation";
    case ErrorCategory::authentication: return "authentication";
    case ErrorCategory::authorization: return "authorization";
    case ErrorCategory::resource: return "resource";
    case ErrorCategory::service: return "service";
    case ErrorCategory::dependency: return "dependency";
    case ErrorCategory::network: return "network";
    case ErrorCategory::timeout: return "timeout";
    case ErrorCategory::internal: return "internal";
    case ErrorCategory::unknown: return "unknown";
  }
  return "unknown";
}

std::string to_string(Severity severity) {
  switch (severity) {
    case Severity::info: return "info";
    case Severity::warning: return "warning";
    case Severity::error: return "error";
    case Severity::critical: return "critical";
  }
  return "error";
}

std::optional<ErrorKind> error_kind_from_string(const std::string& s) {
  static const ErrorKind kAll[] = {
      ErrorKind::invalid_input,       ErrorKind::missing_field,
      ErrorKind::authentication_failed, ErrorKind::permission_denied,
      ErrorKind::resource_not_found,  ErrorKind::resource_corrupted,
      ErrorKind::storage_failure,     ErrorKind::service_unavailable,
      ErrorKind::dependency_failure,  ErrorKind::network_error,
      ErrorKind::timeout,             ErrorKind::cancelled,
      ErrorKind::internal_error,      ErrorKind::unknown,
  };
  for (ErrorKind k : kAll) {
    if (to_string(k) == s) return k;
  }
  return std::nullopt;
}

std::optional<ErrorCategory> error_category_from_string(const std::string& s) {
  static const ErrorCategory kAll[] = {
      ErrorCategory::validation, ErrorCategory::authentication,
      ErrorCategory::authorization, ErrorCategory::resource,
      ErrorCategory::service,    ErrorCategory::dependency,
      ErrorCategory::network,    ErrorCategory::timeout,
      ErrorCategory::internal,   ErrorCategory::unknown,
  };
  for (ErrorCategory c : kAll) {
    if (to_string(c) == s) return c;
  }
  return std::nullopt;
}

std::optional<Severity> severity_from_string(const std::string& s) {
  if (s == "info") return Severity::info;
  if (s == "warning") return Severity::warning;
  if (s == "error") return Severity::error;
  if (s == "critical") return Severity::critical;
  return std::nullopt;
}

ErrorCategory category_of(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::invalid_input:
    case ErrorKind::missing_field: return ErrorCategory::validation;
    case ErrorKind::authentication_failed: return ErrorCategory::authentication;
    case ErrorKind::permission_denied: return ErrorCategory::authorization;
    case ErrorKind::resource_not_found:
    case ErrorKind::resource_corrupted:
    case ErrorKind::storage_failure: return ErrorCategory::resource;
    case ErrorKind::service_unavailable: return ErrorCategory::service;
    case ErrorKind::dependency_failure: return ErrorCategory::dependency;
    case ErrorKind::network_error: return ErrorCategory::network;
    case ErrorKind::timeout:
    case ErrorKind::cancelled: return ErrorCategory::timeout;
    case ErrorKind::internal_error: return ErrorCategory::internal;
    case ErrorKind::unknown: return ErrorCategory::unknown;
  }
  return ErrorCategory::unknown;
}

Severity default_severity(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::resource_corrupted:
    case ErrorKind::internal_error: return Severity::critical;
    case ErrorKind::timeout:
    case ErrorKind::cancelled: return Severity::warning;
    default: return Severity::error;
  }
}

bool is_transient(ErrorKind kind) {
  return kind == ErrorKind::network_error || kind == ErrorKind::timeout ||
         kind == ErrorKind::service_unavailable;
}

// ---------------------------------------------------------------------------
// StandardError
// ---------------------------------------------------------------------------

std::string StandardError::timestamp_iso8601() const {
  const time_t secs = static_cast<time_t>(timestamp_unix_ms / 1000u);
  std::tm tm{};
  ::gmtime_r(&secs, &tm);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03uZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec,
                static_cast<unsigned>(timestamp_unix_ms % 1000u));
  return buf;
}

int StandardError::http_status() const {
  switch (category) {
    case ErrorCategory::validation: return 400;
    case ErrorCategory::authentication: return 401;
    case ErrorCategory::authorization: return 403;
    case ErrorCategory::resource:
      // Corruption and disk failures are server-side faults, not missing URLs.
      if (kind == ErrorKind::resource_not_found) return 404;
      return 500;
    case ErrorCategory::service: return 503;
    case ErrorCategory::dependency: return 502;
    case ErrorCategory::network: return 502;
    case ErrorCategory::timeout: return 504;
    case ErrorCategory::internal:
    case ErrorCategory::unknown: return 500;
  }
  return 500;
}

std::string StandardError::to_json() const {
  std::ostringstream o;
  o << "{"
    << "\"kind\":\"" << swarm::to_string(kind) << "\""
    << ",\"message\":\"" << jsonlite::escape(message) << "\""
    << ",\"details\":{";
  bool first = true;
  for (const auto& [k, v] : details) {
    if (!first) o << ",";
    first = false;
    o << "\"" << jsonlite::escape(k) << "\":\"" << jsonlite::escape(v) << "\"";
  }
  o << "}"
    << ",\"category\":\"" << swarm::to_string(category) << "\""
    << ",\"severity\":\"" << swarm::to_string(severity) << "\""
    << ",\"timestamp\":\"" << timestamp_iso8601() << "\""
    << ",\"correlationId\":\"" << jsonlite::escape(correlation_id) << "\""
    << "}";
  return o.str();
}

StandardError make_error(ErrorKind kind, std::string message,
                         std::string correlation_id,
                         std::map<std::string, std::string> details) {
  StandardError e;
  e.kind              = kind;
  e.message           = std::move(message);
  e.details           = std::move(details);
  e.category          = category_of(kind);
  e.severity          = default_severity(kind);
  e.timestamp_unix_ms = wall_clock_ms();
  e.correlation_id    = std::move(correlation_id);
  return e;
}

StandardError escalate(StandardError err, Severity floor) {
  if (static_cast<int>(err.severity) < static_cast<int>(floor)) err.severity = floor;
  return err;
}

std::optional<StandardError> error_from_json(const std::string& json) {
  std::optional<jsonlite::JsonError> perr;
  const auto obj = jsonlite::parse(json, &perr);
  if (perr) return std::nullopt;

  const auto kind = error_kind_from_string(jsonlite::get_string(obj, "kind"));
  if (!kind) return std::nullopt;

  StandardError e;
  e.kind    = *kind;
  e.message = jsonlite::get_string(obj, "message");
  e.details = jsonlite::get_string_map(obj, "details");
  const auto cat = error_category_from_string(jsonlite::get_string(obj, "category"));
  e.category = cat ? *cat : category_of(*kind);
  const auto sev = severity_from_string(jsonlite::get_string(obj, "severity"));
  e.severity = sev ? *sev : default_severity(*kind);
  e.timestamp_unix_ms = parse_iso8601_ms(jsonlite::get_string(obj, "timestamp"));
  e.correlation_id    = jsonlite::get_string(obj, "correlationId");
  return e;
}

StandardError translate_errno(int err, const std::string& operation,
                              const std::string& path,
                              const std::string& correlation_id) {
  const ErrorKind kind =
      (err == ENOENT) ? ErrorKind::resource_not_found : ErrorKind::storage_failure;
  std::string reason;
  switch (err) {
    case ENOSPC: reason = "disk_full"; break;
    case EDQUOT: reason = "quota_exceeded"; break;
    case EACCES:
    case EPERM: reason = "permission_denied"; break;
    case EROFS: reason = "read_only_filesystem"; break;
    case EIO: reason = "io_error"; break;
    case ENOENT: reason = "not_found"; break;
    default: reason = "errno_" + std::to_string(err); break;
  }
  return make_error(kind, operation + " failed: " + std::strerror(err), correlation_id,
                    {{"operation", operation}, {"path", path}, {"reason", reason}});
}

std::string new_correlation_id() {
  static std::atomic<uint64_t> counter{0};
  static const uint64_t seed = std::random_device{}();
  const uint64_t n = counter.fetch_add(1, std::memory_order_relaxed);
  const std::string material = std::to_string(seed) + ":" +
                               std::to_string(static_cast<long>(::getpid())) + ":" +
                               std::to_string(wall_clock_ms()) + ":" + std::to_string(n);
  return "cid-" + hash_domain("cid:", material).substr(0, 16);
}

}  // namespace swarm
