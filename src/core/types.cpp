#include "agentwire/core/types.hpp"

namespace agentwire {

namespace api {

bool is_known(const std::string& api) {
  return api == kOpenAICompletions || api == kOpenAIResponses || api == kAnthropicMessages || api == kBedrockConverseStream;
}

}  // namespace api

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::ToolCalls:
      return "tool_calls";
    case FinishReason::Length:
      return "length";
    case FinishReason::ContentFilter:
      return "content_filter";
    case FinishReason::Error:
      return "error";
    case FinishReason::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

FinishReason finish_reason_from_string(const std::string& str) {
  if (str == "stop" || str == "end_turn" || str == "stop_sequence") return FinishReason::Stop;
  if (str == "tool_calls" || str == "tool_use" || str == "function_call") return FinishReason::ToolCalls;
  if (str == "length" || str == "max_tokens") return FinishReason::Length;
  if (str == "content_filter" || str == "refusal" || str == "guardrail_intervened" || str == "content_filtered") return FinishReason::ContentFilter;
  if (str == "error") return FinishReason::Error;
  if (str == "cancelled") return FinishReason::Cancelled;
  return FinishReason::Stop;
}

std::string to_string(ThinkingLevel level) {
  switch (level) {
    case ThinkingLevel::Off:
      return "off";
    case ThinkingLevel::Minimal:
      return "minimal";
    case ThinkingLevel::Low:
      return "low";
    case ThinkingLevel::Medium:
      return "medium";
    case ThinkingLevel::High:
      return "high";
    case ThinkingLevel::Xhigh:
      return "xhigh";
  }
  return "off";
}

std::optional<ThinkingLevel> thinking_level_from_string(const std::string& str) {
  if (str == "off" || str.empty()) return ThinkingLevel::Off;
  if (str == "minimal") return ThinkingLevel::Minimal;
  if (str == "low") return ThinkingLevel::Low;
  if (str == "medium") return ThinkingLevel::Medium;
  if (str == "high") return ThinkingLevel::High;
  if (str == "xhigh") return ThinkingLevel::Xhigh;
  return std::nullopt;
}

}  // namespace agentwire
