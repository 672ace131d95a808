#pragma once

// swarm/errors.hpp - Error taxonomy shared by every swarm component.
//
// DESIGN:
//   Every externally visible failure is exactly one StandardError. The set of
//   kinds is closed; each kind maps to one category and one default severity:
//
//     invalid-input         validation     error
//     missing-field         validation     error
//     authentication-failed authentication error
//     permission-denied     authorization  error
//     resource-not-found    resource       error
//     resource-corrupted    resource       critical
//     storage-failure       resource       error
//     service-unavailable   service        error
//     dependency-failure    dependency     error
//     network-error         network        error
//     timeout               timeout        warning  (escalated after retries)
//     cancelled             timeout        warning
//     internal-error        internal       critical
//     unknown               unknown        error
//
// PROPAGATION:
//   A component that catches a lower-level failure (errno, exception, a
//   worker's reply) translates it into the closest kind before it crosses its
//   own public boundary. The correlation id attached at system entry is copied
//   unchanged into every error produced on that request's path.
//
// RETURN CONVENTIONS:
//   Status     = std::optional<StandardError>; empty means success.
//   Result<T>  = value or StandardError.
//   No exception crosses a public boundary of this library.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace swarm {

enum class ErrorKind {
  invalid_input,
  missing_field,
  authentication_failed,
  permission_denied,
  resource_not_found,
  resource_corrupted,
  storage_failure,
  service_unavailable,
  dependency_failure,
  network_error,
  timeout,
  cancelled,
  internal_error,
  unknown,
};

enum class ErrorCategory {
  validation,
  authentication,
  authorization,
  resource,
  service,
  dependency,
  network,
  timeout,
  internal,
  unknown,
};

enum class Severity {
  info,
  warning,
  error,
  critical,
};

// Wire names ("invalid-input", "validation", "critical", ...).
std::string to_string(ErrorKind kind);
std::string to_string(ErrorCategory category);
std::string to_string(Severity severity);

std::optional<ErrorKind>     error_kind_from_string(const std::string& s);
std::optional<ErrorCategory> error_category_from_string(const std::string& s);
std::optional<Severity>      severity_from_string(const std::string& s);

ErrorCategory category_of(ErrorKind kind);
Severity      default_severity(ErrorKind kind);

// Transient kinds are worth retrying against another instance:
// network-error, timeout, service-unavailable.
bool is_transient(ErrorKind kind);

// ---------------------------------------------------------------------------
// StandardError
// ---------------------------------------------------------------------------
struct StandardError {
  ErrorKind                          kind{ErrorKind::unknown};
  std::string                        message;
  std::map<std::string, std::string> details;
  ErrorCategory                      category{ErrorCategory::unknown};
  Severity                           severity{Severity::error};
  uint64_t                           timestamp_unix_ms{0};
  std::string                        correlation_id;

  // ISO-8601 UTC with millisecond precision, e.g. "2024-05-01T12:00:00.000Z".
  std::string timestamp_iso8601() const;

  // validation 400, authentication 401, authorization 403, resource 404
  // (resource-corrupted and storage-failure 500), service 503, dependency 502,
  // network 502, timeout 504, internal/unknown 500.
  int http_status() const;

  // Compact JSON in the wire shape.
  std::string to_json() const;

  StandardError& with_detail(const std::string& key, const std::string& value) {
    details[key] = value;
    return *this;
  }
};

// The only way components construct errors. Category and severity come from
// the taxonomy table; the timestamp is the current wall-clock time.
StandardError make_error(ErrorKind kind, std::string message,
                         std::string correlation_id = "",
                         std::map<std::string, std::string> details = {});

// Raise severity to at least `floor` (used when a timeout exhausts retries).
StandardError escalate(StandardError err, Severity floor);

// Parse the wire shape. Returns nullopt if the text is not a StandardError.
std::optional<StandardError> error_from_json(const std::string& json);

// Map a POSIX errno from the storage layer. ENOENT becomes
// resource-not-found; everything else is storage-failure.
StandardError translate_errno(int err, const std::string& operation,
                              const std::string& path,
                              const std::string& correlation_id = "");

// "cid-" + 16 lowercase hex characters. Unique per process lifetime.
std::string new_correlation_id();

using Status = std::optional<StandardError>;

// ---------------------------------------------------------------------------
// Result<T> - a value or the StandardError explaining its absence.
// ---------------------------------------------------------------------------
template <typename T>
class Result {
 public:
  Result(T value) : v_(std::move(value)) {}
  Result(StandardError error) : v_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(v_); }
  explicit operator bool() const { return ok(); }

  T&       value() { return std::get<T>(v_); }
  const T& value() const { return std::get<T>(v_); }

  const StandardError& error() const { return std::get<StandardError>(v_); }
  StandardError&       error() { return std::get<StandardError>(v_); }

  Status status() const {
    if (ok()) return std::nullopt;
    return error();
  }

 private:
  std::variant<T, StandardError> v_;
};

}  // namespace swarm
