#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace agentwire {

using json = nlohmann::json;

using MessageId = std::string;
using TurnId = std::string;
using ToolCallId = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Wire protocol families understood by the adapter layer
namespace api {
inline constexpr const char* kOpenAICompletions = "openai-completions";
inline constexpr const char* kOpenAIResponses = "openai-responses";
inline constexpr const char* kAnthropicMessages = "anthropic-messages";
inline constexpr const char* kBedrockConverseStream = "bedrock-converse-stream";

bool is_known(const std::string& api);
}  // namespace api

// Result type for operations that can fail
template <typename T>
class Result {
 public:
  static Result success(T value) {
    Result r;
    r.value_ = std::move(value);
    return r;
  }

  static Result failure(std::string error) {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  bool ok() const {
    return value_.has_value();
  }
  explicit operator bool() const {
    return ok();
  }

  T& value() {
    return *value_;
  }
  const T& value() const {
    return *value_;
  }
  const std::string& error() const {
    return error_;
  }

 private:
  std::optional<T> value_;
  std::string error_;
};

// Token usage reported by a provider
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  int64_t cache_read_tokens = 0;
  int64_t cache_write_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage& operator+=(const TokenUsage& other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    cache_read_tokens += other.cache_read_tokens;
    cache_write_tokens += other.cache_write_tokens;
    return *this;
  }

  bool operator==(const TokenUsage&) const = default;
};

enum class FinishReason { Stop, ToolCalls, Length, ContentFilter, Error, Cancelled };

std::string to_string(FinishReason reason);
FinishReason finish_reason_from_string(const std::string& str);

// Reasoning effort requested from the model
enum class ThinkingLevel { Off, Minimal, Low, Medium, High, Xhigh };

std::string to_string(ThinkingLevel level);
std::optional<ThinkingLevel> thinking_level_from_string(const std::string& str);

}  // namespace agentwire
