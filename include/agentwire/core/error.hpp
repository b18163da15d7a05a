#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace agentwire {

enum class ErrorKind {
  NetworkError,     // connection failure, timeout, 5xx, 408, overloaded
  RateLimited,      // 429 or a provider throttling payload
  ShapeMismatch,    // endpoint does not speak the requested api shape
  AuthError,        // 401/403, bad credential
  ConfigError,      // detected before any network call
  MalformedStream,  // stream violated its own grammar
  ProviderError,    // non-retryable rejection (400, refusal payload)
  ToolExecutionError,
};

std::string to_string(ErrorKind kind);

// Error value carried inside the event stream and turn results
struct Error {
  ErrorKind kind = ErrorKind::ProviderError;
  std::string message;
  int http_status = 0;
  std::optional<std::chrono::milliseconds> retry_after;

  static Error network(std::string message) {
    return Error{ErrorKind::NetworkError, std::move(message), 0, std::nullopt};
  }
  static Error malformed(std::string message) {
    return Error{ErrorKind::MalformedStream, std::move(message), 0, std::nullopt};
  }
  static Error config(std::string message) {
    return Error{ErrorKind::ConfigError, std::move(message), 0, std::nullopt};
  }

  std::string describe() const;
};

// Thrown at load/route time, converted into a Failed turn by the loop
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * Map a non-2xx HTTP response onto the error taxonomy.
 * `headers` must use lowercase names; `body` is the raw response body and may
 * carry a JSON error payload whose message is used when present.
 */
Error error_from_http(int status, const std::string& body, const std::map<std::string, std::string>& headers);

// Parse a Retry-After value given in (possibly fractional) seconds
std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& value);

}  // namespace agentwire
