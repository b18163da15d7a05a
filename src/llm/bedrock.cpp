#include "agentwire/llm/bedrock.hpp"

#include <spdlog/spdlog.h>

#include "adapter_util.hpp"
#include "agentwire/net/http_client.hpp"

namespace agentwire::llm {

std::string BedrockConverseAdapter::url(const Request& request, const Endpoint& endpoint) const {
  return net::join_url(endpoint.base_url.empty() ? kDefaultBaseUrl : endpoint.base_url, "model/" + net::url_encode(request.model) + "/converse-stream");
}

net::HttpOptions BedrockConverseAdapter::http_options(const Request& request, const Endpoint& endpoint) const {
  auto options = detail::make_http_options(endpoint, build_body(request), "application/vnd.amazon.eventstream");
  if (!endpoint.credential.empty()) {
    options.headers["Authorization"] = "Bearer " + endpoint.credential;
  }
  return options;
}

json BedrockConverseAdapter::build_body(const Request& request) {
  json body;

  json system = json::array();
  if (!request.system_prompt.empty()) {
    system.push_back({{"text", request.system_prompt}});
  }

  json msgs = json::array();
  for (const auto& msg : request.messages) {
    if (msg.role() == Role::System) {
      system.push_back({{"text", msg.text()}});
      continue;
    }

    json content = json::array();
    for (const auto& part : msg.parts()) {
      if (auto* text = std::get_if<TextPart>(&part)) {
        if (!text->text.empty()) content.push_back({{"text", text->text}});
      } else if (auto* r = std::get_if<ReasoningPart>(&part)) {
        if (msg.role() == Role::Assistant && !r->signature.empty()) {
          content.push_back({{"reasoningContent", {{"reasoningText", {{"text", r->text}, {"signature", r->signature}}}}}});
        }
      } else if (auto* tc = std::get_if<ToolCallPart>(&part)) {
        content.push_back({{"toolUse", {{"toolUseId", tc->id}, {"name", tc->name}, {"input", detail::arguments_object(tc->arguments)}}}});
      } else if (auto* tr = std::get_if<ToolResultPart>(&part)) {
        content.push_back({{"toolResult",
                            {{"toolUseId", tr->tool_call_id},
                             {"content", json::array({{{"text", tr->output}}})},
                             {"status", tr->is_error ? "error" : "success"}}}});
      }
    }
    if (content.empty()) continue;
    msgs.push_back({{"role", msg.role() == Role::Assistant ? "assistant" : "user"}, {"content", content}});
  }
  body["messages"] = msgs;
  if (!system.empty()) {
    body["system"] = system;
  }

  json inference = json::object();
  if (request.max_tokens) inference["maxTokens"] = *request.max_tokens;
  if (request.temperature && request.reasoning == ThinkingLevel::Off) inference["temperature"] = *request.temperature;
  if (!inference.empty()) body["inferenceConfig"] = inference;

  if (int budget = detail::thinking_budget(request.reasoning); budget > 0) {
    body["additionalModelRequestFields"] = {{"thinking", {{"type", "enabled"}, {"budget_tokens", budget}}}};
  }

  if (!request.tools.empty()) {
    json tools_json = json::array();
    for (const auto& tool : request.tools) {
      tools_json.push_back({{"toolSpec", {{"name", tool.name}, {"description", tool.description}, {"inputSchema", {{"json", tool.parameters}}}}}});
    }
    body["toolConfig"] = {{"tools", tools_json}};
  }

  return body;
}

void BedrockConverseAdapter::Decoder::feed(std::string_view chunk) {
  if (done()) return;
  try {
    for (const auto& message : frames_.feed(chunk)) {
      if (done()) return;
      guarded("bedrock-converse-stream", [&] { handle(message); });
    }
  } catch (const net::EventStreamError& e) {
    fail(Error::malformed(e.what()));
  }
}

void BedrockConverseAdapter::Decoder::finish() {
  // metadata is optional after messageStop
  if (!done() && stop_reason_ && !frames_.has_partial()) {
    emit(Finish{*stop_reason_});
  }
  end_of_stream();
}

void BedrockConverseAdapter::Decoder::handle(const net::EventStreamMessage& message) {
  std::string message_type = message.header(":message-type");
  json payload = json::parse(message.payload.empty() ? std::string("{}") : message.payload, nullptr, false);

  if (message_type == "exception" || message_type == "error") {
    std::string code = message.header(message_type == "exception" ? ":exception-type" : ":error-code");
    json err = payload.is_object() ? payload : json::object();
    if (!err.contains("message")) err["message"] = message.header(":error-message");
    err["code"] = code;
    fail(detail::error_from_payload(err));
    return;
  }

  if (payload.is_discarded() || !payload.is_object()) {
    spdlog::warn("Failed to parse converse-stream payload for {}", message.header(":event-type"));
    return;
  }
  handle_event(message.header(":event-type"), payload);
}

void BedrockConverseAdapter::Decoder::handle_event(const std::string& event_type, const json& payload) {
  if (event_type == "contentBlockStart") {
    int index = static_cast<int>(detail::int_field(payload, "contentBlockIndex"));
    const auto& start = detail::object_field(payload, "start");
    if (start.contains("toolUse")) {
      const auto& tool = start["toolUse"];
      std::string id = detail::string_field(tool, "toolUseId");
      std::string name = detail::string_field(tool, "name");
      if (id.empty() || name.empty()) {
        fail(Error::malformed("toolUse block " + std::to_string(index) + " without toolUseId or name"));
        return;
      }
      tool_blocks_[index] = id;
      emit(ToolCallOpen{id, name});
    }
  } else if (event_type == "contentBlockDelta") {
    int index = static_cast<int>(detail::int_field(payload, "contentBlockIndex"));
    const auto& delta = detail::object_field(payload, "delta");
    if (delta.contains("text") && delta["text"].is_string()) {
      auto text = delta["text"].get<std::string>();
      if (!text.empty()) emit(TextDelta{text});
    } else if (delta.contains("toolUse")) {
      auto it = tool_blocks_.find(index);
      if (it == tool_blocks_.end()) {
        fail(Error::malformed("toolUse delta for block " + std::to_string(index) + " which is not open"));
        return;
      }
      auto fragment = detail::string_field(delta["toolUse"], "input");
      if (!fragment.empty()) emit(ToolCallArgDelta{it->second, fragment});
    } else if (delta.contains("reasoningContent")) {
      const auto& reasoning = delta["reasoningContent"];
      auto text = detail::string_field(reasoning, "text");
      auto signature = detail::string_field(reasoning, "signature");
      if (!text.empty() || !signature.empty()) emit(ReasoningDelta{text, signature});
    }
  } else if (event_type == "contentBlockStop") {
    int index = static_cast<int>(detail::int_field(payload, "contentBlockIndex"));
    auto it = tool_blocks_.find(index);
    if (it != tool_blocks_.end()) {
      emit(ToolCallClose{it->second});
      tool_blocks_.erase(it);
    }
  } else if (event_type == "messageStop") {
    stop_reason_ = finish_reason_from_string(detail::string_field(payload, "stopReason", "end_turn"));
  } else if (event_type == "metadata") {
    if (payload.contains("usage") && payload["usage"].is_object()) {
      const auto& u = payload["usage"];
      TokenUsage usage;
      usage.input_tokens = detail::int_field(u, "inputTokens");
      usage.output_tokens = detail::int_field(u, "outputTokens");
      usage.cache_read_tokens = detail::int_field(u, "cacheReadInputTokens");
      usage.cache_write_tokens = detail::int_field(u, "cacheWriteInputTokens");
      emit(Usage{usage});
    }
    if (stop_reason_) {
      emit(Finish{*stop_reason_});
    }
  }
}

}  // namespace agentwire::llm
