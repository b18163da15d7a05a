#pragma once

#include <cstdint>
#include <string>

#include "agentwire/core/error.hpp"
#include "agentwire/llm/request.hpp"
#include "agentwire/net/transport.hpp"

namespace agentwire::llm::detail {

// Field reads that fall back when the key is absent, null or of another type
std::string string_field(const json& j, const char* key, const std::string& fallback = "");
int64_t int_field(const json& j, const char* key, int64_t fallback = 0);
const json& object_field(const json& j, const char* key);

// JSON POST with the endpoint's timeouts and extra headers applied last.
// Invalid UTF-8 in the body is replaced with U+FFFD.
net::HttpOptions make_http_options(const Endpoint& endpoint, const json& body, const std::string& accept);

// Error payload embedded in a stream, {"type"|"code": ..., "message": ...}
Error error_from_payload(const json& payload);

// "low" | "medium" | ..., empty for Off
std::string reasoning_effort(ThinkingLevel level);

// Token budget for providers that take one instead of an effort level
int thinking_budget(ThinkingLevel level);

// Tool-call arguments serialized for providers that expect a JSON string
std::string arguments_string(const json& arguments);

// Tool-call arguments as an object for providers that expect structured input
json arguments_object(const json& arguments);

}  // namespace agentwire::llm::detail
