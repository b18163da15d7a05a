#include "adapter_util.hpp"

namespace agentwire::llm::detail {

std::string string_field(const json& j, const char* key, const std::string& fallback) {
  if (!j.is_object()) return fallback;
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return fallback;
  return it->get<std::string>();
}

int64_t int_field(const json& j, const char* key, int64_t fallback) {
  if (!j.is_object()) return fallback;
  auto it = j.find(key);
  if (it == j.end()) return fallback;
  if (it->is_number_integer()) return it->get<int64_t>();
  if (it->is_number_float()) return static_cast<int64_t>(it->get<double>());
  return fallback;
}

const json& object_field(const json& j, const char* key) {
  static const json empty = json::object();
  if (!j.is_object()) return empty;
  auto it = j.find(key);
  if (it == j.end() || !it->is_object()) return empty;
  return *it;
}

net::HttpOptions make_http_options(const Endpoint& endpoint, const json& body, const std::string& accept) {
  net::HttpOptions options;
  options.method = "POST";
  options.body = body.dump(-1, ' ', false, json::error_handler_t::replace);
  options.headers = {{"Content-Type", "application/json"}, {"Accept", accept}};
  options.connect_timeout = endpoint.connect_timeout;
  options.read_timeout = endpoint.read_timeout;
  for (const auto& [key, value] : endpoint.headers) {
    options.headers[key] = value;
  }
  return options;
}

Error error_from_payload(const json& payload) {
  Error error;
  error.kind = ErrorKind::ProviderError;

  std::string code;
  if (payload.is_object()) {
    if (payload.contains("type") && payload["type"].is_string()) {
      code = payload["type"].get<std::string>();
    }
    if (payload.contains("code") && payload["code"].is_string()) {
      code = payload["code"].get<std::string>();
    }
    error.message = string_field(payload, "message");
  } else if (payload.is_string()) {
    error.message = payload.get<std::string>();
  }
  if (error.message.empty()) {
    error.message = code.empty() ? "provider reported an error" : code;
  }

  if (code == "rate_limit_exceeded" || code == "rate_limit_error" || code == "throttlingException") {
    error.kind = ErrorKind::RateLimited;
  } else if (code == "overloaded_error" || code == "server_error" || code == "api_error" || code == "internal_error" ||
             code == "service_unavailable" || code == "internalServerException" || code == "serviceUnavailableException" ||
             code == "modelStreamErrorException") {
    error.kind = ErrorKind::NetworkError;
  } else if (code == "authentication_error" || code == "permission_error" || code == "invalid_api_key" || code == "accessDeniedException") {
    error.kind = ErrorKind::AuthError;
  }
  return error;
}

std::string reasoning_effort(ThinkingLevel level) {
  return level == ThinkingLevel::Off ? std::string() : to_string(level);
}

int thinking_budget(ThinkingLevel level) {
  switch (level) {
    case ThinkingLevel::Off:
      return 0;
    case ThinkingLevel::Minimal:
      return 1024;
    case ThinkingLevel::Low:
      return 2048;
    case ThinkingLevel::Medium:
      return 8192;
    case ThinkingLevel::High:
      return 16384;
    case ThinkingLevel::Xhigh:
      return 32000;
  }
  return 0;
}

std::string arguments_string(const json& arguments) {
  if (arguments.is_string()) return arguments.get<std::string>();
  if (arguments.is_null()) return "{}";
  return arguments.dump(-1, ' ', false, json::error_handler_t::replace);
}

json arguments_object(const json& arguments) {
  if (arguments.is_object()) return arguments;
  if (arguments.is_string()) {
    auto parsed = json::parse(arguments.get<std::string>(), nullptr, false);
    if (parsed.is_object()) return parsed;
  }
  return json::object();
}

}  // namespace agentwire::llm::detail
