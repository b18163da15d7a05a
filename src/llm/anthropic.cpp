#include "agentwire/llm/anthropic.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "adapter_util.hpp"
#include "agentwire/net/http_client.hpp"

namespace agentwire::llm {

std::string AnthropicMessagesAdapter::url(const Request&, const Endpoint& endpoint) const {
  return net::join_url(endpoint.base_url.empty() ? kDefaultBaseUrl : endpoint.base_url, "messages");
}

net::HttpOptions AnthropicMessagesAdapter::http_options(const Request& request, const Endpoint& endpoint) const {
  auto options = detail::make_http_options(endpoint, build_body(request), "text/event-stream");
  options.headers["anthropic-version"] = kApiVersion;
  if (!endpoint.credential.empty()) {
    options.headers["x-api-key"] = endpoint.credential;
  }
  return options;
}

json AnthropicMessagesAdapter::build_body(const Request& request) {
  json body;
  body["model"] = request.model;
  body["stream"] = true;

  int max_tokens = request.max_tokens.value_or(kDefaultMaxTokens);
  int budget = detail::thinking_budget(request.reasoning);
  if (budget > 0) {
    // max_tokens must leave room for the answer after the thinking budget
    max_tokens = std::max(max_tokens, budget + 4096);
    body["thinking"] = {{"type", "enabled"}, {"budget_tokens", budget}};
  } else if (request.temperature) {
    body["temperature"] = *request.temperature;
  }
  body["max_tokens"] = max_tokens;

  std::string system = request.system_prompt;
  json msgs = json::array();
  for (const auto& msg : request.messages) {
    if (msg.role() == Role::System) {
      if (!system.empty()) system += "\n\n";
      system += msg.text();
      continue;
    }

    json content = json::array();
    for (const auto& part : msg.parts()) {
      if (auto* text = std::get_if<TextPart>(&part)) {
        if (!text->text.empty()) content.push_back({{"type", "text"}, {"text", text->text}});
      } else if (auto* r = std::get_if<ReasoningPart>(&part)) {
        // Only signed thinking can be sent back
        if (msg.role() == Role::Assistant && !r->signature.empty()) {
          content.push_back({{"type", "thinking"}, {"thinking", r->text}, {"signature", r->signature}});
        }
      } else if (auto* tc = std::get_if<ToolCallPart>(&part)) {
        content.push_back({{"type", "tool_use"}, {"id", tc->id}, {"name", tc->name}, {"input", detail::arguments_object(tc->arguments)}});
      } else if (auto* tr = std::get_if<ToolResultPart>(&part)) {
        content.push_back({{"type", "tool_result"}, {"tool_use_id", tr->tool_call_id}, {"content", tr->output}, {"is_error", tr->is_error}});
      }
    }
    if (content.empty()) continue;

    json m;
    m["role"] = msg.role() == Role::Assistant ? "assistant" : "user";
    if (content.size() == 1 && content[0]["type"] == "text") {
      m["content"] = content[0]["text"];
    } else {
      m["content"] = content;
    }
    msgs.push_back(m);
  }
  body["messages"] = msgs;

  if (!system.empty()) {
    body["system"] = system;
  }

  if (!request.tools.empty()) {
    json tools_json = json::array();
    for (const auto& tool : request.tools) {
      tools_json.push_back({{"name", tool.name}, {"description", tool.description}, {"input_schema", tool.parameters}});
    }
    body["tools"] = tools_json;
  }

  return body;
}

void AnthropicMessagesAdapter::Decoder::feed(std::string_view chunk) {
  for (const auto& event : sse_.feed(chunk)) {
    if (done()) return;
    json j = json::parse(event.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      spdlog::warn("Failed to parse Anthropic SSE event '{}': {}", event.event, event.data.substr(0, 200));
      continue;
    }
    guarded("anthropic-messages", [&] { handle(j); });
  }
}

void AnthropicMessagesAdapter::Decoder::finish() {
  for (const auto& event : sse_.finish()) {
    if (done()) break;
    json j = json::parse(event.data, nullptr, false);
    if (!j.is_discarded() && j.is_object()) guarded("anthropic-messages", [&] { handle(j); });
  }
  end_of_stream();
}

void AnthropicMessagesAdapter::Decoder::handle(const json& j) {
  const std::string type = detail::string_field(j, "type");

  if (type == "message_start") {
    const auto& message = detail::object_field(j, "message");
    if (message.contains("usage") && message["usage"].is_object()) {
      const auto& u = message["usage"];
      TokenUsage usage;
      usage.input_tokens = detail::int_field(u, "input_tokens");
      usage.cache_read_tokens = detail::int_field(u, "cache_read_input_tokens");
      usage.cache_write_tokens = detail::int_field(u, "cache_creation_input_tokens");
      emit(Usage{usage});
    }
  } else if (type == "content_block_start") {
    int index = static_cast<int>(detail::int_field(j, "index"));
    const auto& block = detail::object_field(j, "content_block");
    std::string block_type = detail::string_field(block, "type");
    if (block_type == "tool_use") {
      std::string id = detail::string_field(block, "id");
      std::string name = detail::string_field(block, "name");
      if (id.empty() || name.empty()) {
        fail(Error::malformed("tool_use block " + std::to_string(index) + " without id or name"));
        return;
      }
      tool_blocks_[index] = id;
      emit(ToolCallOpen{id, name});
      const auto& input = detail::object_field(block, "input");
      if (!input.empty()) emit(ToolCallArgDelta{id, input.dump(-1, ' ', false, json::error_handler_t::replace)});
    } else if (block_type == "text") {
      auto text = detail::string_field(block, "text");
      if (!text.empty()) emit(TextDelta{text});
    } else if (block_type == "thinking") {
      auto text = detail::string_field(block, "thinking");
      auto signature = detail::string_field(block, "signature");
      if (!text.empty() || !signature.empty()) emit(ReasoningDelta{text, signature});
    }
  } else if (type == "content_block_delta") {
    int index = static_cast<int>(detail::int_field(j, "index"));
    const auto& delta = detail::object_field(j, "delta");
    std::string delta_type = detail::string_field(delta, "type");
    if (delta_type == "text_delta") {
      auto text = detail::string_field(delta, "text");
      if (!text.empty()) emit(TextDelta{text});
    } else if (delta_type == "thinking_delta") {
      auto text = detail::string_field(delta, "thinking");
      if (!text.empty()) emit(ReasoningDelta{text});
    } else if (delta_type == "signature_delta") {
      auto signature = detail::string_field(delta, "signature");
      if (!signature.empty()) emit(ReasoningDelta{"", signature});
    } else if (delta_type == "input_json_delta") {
      auto it = tool_blocks_.find(index);
      if (it == tool_blocks_.end()) {
        fail(Error::malformed("input_json_delta for block " + std::to_string(index) + " which is not an open tool_use"));
        return;
      }
      auto fragment = detail::string_field(delta, "partial_json");
      if (!fragment.empty()) emit(ToolCallArgDelta{it->second, fragment});
    }
  } else if (type == "content_block_stop") {
    int index = static_cast<int>(detail::int_field(j, "index"));
    auto it = tool_blocks_.find(index);
    if (it != tool_blocks_.end()) {
      emit(ToolCallClose{it->second});
      tool_blocks_.erase(it);
    }
  } else if (type == "message_delta") {
    const auto& delta = detail::object_field(j, "delta");
    if (delta.contains("stop_reason") && delta["stop_reason"].is_string()) {
      stop_reason_ = finish_reason_from_string(delta["stop_reason"].get<std::string>());
    }
    if (j.contains("usage") && j["usage"].is_object()) {
      TokenUsage usage;
      usage.output_tokens = detail::int_field(j["usage"], "output_tokens");
      emit(Usage{usage});
    }
  } else if (type == "message_stop") {
    emit(Finish{stop_reason_.value_or(FinishReason::Stop)});
  } else if (type == "error") {
    fail(detail::error_from_payload(detail::object_field(j, "error")));
  }
}

}  // namespace agentwire::llm
