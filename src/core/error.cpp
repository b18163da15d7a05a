#include "agentwire/core/error.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <nlohmann/json.hpp>

namespace agentwire {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NetworkError:
      return "NetworkError";
    case ErrorKind::RateLimited:
      return "RateLimited";
    case ErrorKind::ShapeMismatch:
      return "ShapeMismatch";
    case ErrorKind::AuthError:
      return "AuthError";
    case ErrorKind::ConfigError:
      return "ConfigError";
    case ErrorKind::MalformedStream:
      return "MalformedStream";
    case ErrorKind::ProviderError:
      return "ProviderError";
    case ErrorKind::ToolExecutionError:
      return "ToolExecutionError";
  }
  return "Unknown";
}

std::string Error::describe() const {
  std::string out = to_string(kind);
  if (http_status != 0) {
    out += " (HTTP " + std::to_string(http_status) + ")";
  }
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

std::optional<std::chrono::milliseconds> parse_retry_after(const std::string& value) {
  if (value.empty()) return std::nullopt;
  try {
    size_t consumed = 0;
    double seconds = std::stod(value, &consumed);
    if (consumed == 0 || seconds < 0 || !std::isfinite(seconds)) return std::nullopt;
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
  } catch (const std::exception&) {
    // HTTP-date form is not honored
    return std::nullopt;
  }
}

namespace {

// Pull a readable message out of the common provider error payloads:
// {"error": {"message": ..., "type"/"code": ...}} or {"message": ...}
std::string extract_error_message(const std::string& body, std::string& code) {
  if (body.empty()) return "";
  try {
    auto j = nlohmann::json::parse(body);
    if (j.contains("error") && j["error"].is_object()) {
      const auto& err = j["error"];
      if (err.contains("code") && err["code"].is_string()) {
        code = err["code"].get<std::string>();
      } else if (err.contains("type") && err["type"].is_string()) {
        code = err["type"].get<std::string>();
      }
      if (err.contains("message") && err["message"].is_string()) {
        return err["message"].get<std::string>();
      }
    } else if (j.contains("error") && j["error"].is_string()) {
      return j["error"].get<std::string>();
    }
    if (j.contains("message") && j["message"].is_string()) {
      return j["message"].get<std::string>();
    }
  } catch (const nlohmann::json::parse_error&) {
    // Plain-text body
  }
  return body.size() > 512 ? body.substr(0, 512) : body;
}

}  // namespace

Error error_from_http(int status, const std::string& body, const std::map<std::string, std::string>& headers) {
  Error error;
  error.http_status = status;

  std::string code;
  error.message = extract_error_message(body, code);
  if (error.message.empty()) {
    error.message = "HTTP " + std::to_string(status);
  }

  if (status == 401 || status == 403) {
    error.kind = ErrorKind::AuthError;
  } else if (status == 404 || status == 405 || status == 501) {
    error.kind = ErrorKind::ShapeMismatch;
  } else if (status == 429) {
    // Quota exhaustion is reported as 429 by some providers but never clears on retry
    if (code == "insufficient_quota" || code == "billing_hard_limit_reached") {
      error.kind = ErrorKind::ProviderError;
    } else {
      error.kind = ErrorKind::RateLimited;
      if (auto it = headers.find("retry-after-ms"); it != headers.end()) {
        if (auto seconds = parse_retry_after(it->second)) {
          error.retry_after = std::chrono::milliseconds(seconds->count() / 1000);
        }
      }
      if (!error.retry_after) {
        if (auto it = headers.find("retry-after"); it != headers.end()) {
          error.retry_after = parse_retry_after(it->second);
        }
      }
    }
  } else if (status == 408 || status >= 500 || status == 0) {
    error.kind = ErrorKind::NetworkError;
  } else {
    error.kind = ErrorKind::ProviderError;
  }

  spdlog::debug("HTTP {} classified as {} ({})", status, to_string(error.kind), error.message);
  return error;
}

}  // namespace agentwire
