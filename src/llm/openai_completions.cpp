#include "agentwire/llm/openai_completions.hpp"

#include <spdlog/spdlog.h>

#include "adapter_util.hpp"
#include "agentwire/net/http_client.hpp"

namespace agentwire::llm {

std::string OpenAICompletionsAdapter::url(const Request&, const Endpoint& endpoint) const {
  return net::join_url(endpoint.base_url.empty() ? kDefaultBaseUrl : endpoint.base_url, "chat/completions");
}

net::HttpOptions OpenAICompletionsAdapter::http_options(const Request& request, const Endpoint& endpoint) const {
  auto options = detail::make_http_options(endpoint, build_body(request), "text/event-stream");
  if (!endpoint.credential.empty()) {
    options.headers["Authorization"] = "Bearer " + endpoint.credential;
  }
  return options;
}

json OpenAICompletionsAdapter::build_body(const Request& request) {
  json body;
  body["model"] = request.model;
  body["stream"] = true;
  body["stream_options"] = {{"include_usage", true}};

  if (request.max_tokens) {
    body["max_tokens"] = *request.max_tokens;
  }
  if (request.temperature) {
    body["temperature"] = *request.temperature;
  }
  if (request.reasoning != ThinkingLevel::Off) {
    body["reasoning_effort"] = request.reasoning == ThinkingLevel::Xhigh ? "high" : detail::reasoning_effort(request.reasoning);
  }

  json msgs = json::array();
  if (!request.system_prompt.empty()) {
    msgs.push_back({{"role", "system"}, {"content", request.system_prompt}});
  }

  for (const auto& msg : request.messages) {
    if (msg.role() == Role::System) {
      msgs.push_back({{"role", "system"}, {"content", msg.text()}});
      continue;
    }

    // Tool results become separate role="tool" messages
    auto tool_results = msg.tool_results();
    if (!tool_results.empty()) {
      for (const auto* tr : tool_results) {
        msgs.push_back({{"role", "tool"}, {"tool_call_id", tr->tool_call_id}, {"content", tr->output}});
      }
      auto text = msg.text();
      if (!text.empty()) {
        msgs.push_back({{"role", "user"}, {"content", text}});
      }
      continue;
    }

    json m;
    m["role"] = to_string(msg.role());
    auto text = msg.text();
    m["content"] = text.empty() && msg.role() == Role::Assistant ? json(nullptr) : json(text);

    auto calls = msg.tool_calls();
    if (!calls.empty()) {
      json tool_calls = json::array();
      for (const auto* tc : calls) {
        tool_calls.push_back(
            {{"id", tc->id}, {"type", "function"}, {"function", {{"name", tc->name}, {"arguments", detail::arguments_string(tc->arguments)}}}});
      }
      m["tool_calls"] = tool_calls;
    }
    msgs.push_back(m);
  }
  body["messages"] = msgs;

  if (!request.tools.empty()) {
    json tools_json = json::array();
    for (const auto& tool : request.tools) {
      tools_json.push_back(
          {{"type", "function"}, {"function", {{"name", tool.name}, {"description", tool.description}, {"parameters", tool.parameters}}}});
    }
    body["tools"] = tools_json;
  }

  return body;
}

void OpenAICompletionsAdapter::Decoder::feed(std::string_view chunk) {
  for (const auto& event : sse_.feed(chunk)) {
    if (done()) return;
    guarded("openai-completions", [&] { handle_data(event.data); });
  }
}

void OpenAICompletionsAdapter::Decoder::finish() {
  for (const auto& event : sse_.finish()) {
    if (done()) break;
    guarded("openai-completions", [&] { handle_data(event.data); });
  }
  // Some compatible servers end after finish_reason without sending [DONE]
  if (!done() && finish_reason_) {
    complete();
  }
  end_of_stream();
}

void OpenAICompletionsAdapter::Decoder::handle_data(const std::string& data) {
  if (data == "[DONE]") {
    complete();
    return;
  }

  json j = json::parse(data, nullptr, false);
  if (j.is_discarded()) {
    spdlog::warn("Failed to parse chat completions chunk: {}", data.substr(0, 200));
    return;
  }

  if (j.contains("error") && !j["error"].is_null()) {
    fail(detail::error_from_payload(j["error"]));
    return;
  }

  if (j.contains("usage") && j["usage"].is_object()) {
    const auto& u = j["usage"];
    TokenUsage usage;
    usage.input_tokens = detail::int_field(u, "prompt_tokens");
    usage.output_tokens = detail::int_field(u, "completion_tokens");
    usage.cache_read_tokens = detail::int_field(detail::object_field(u, "prompt_tokens_details"), "cached_tokens");
    emit(Usage{usage});
  }

  if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
    return;
  }

  const auto& choice = j["choices"][0];
  if (choice.contains("delta") && choice["delta"].is_object()) {
    const auto& delta = choice["delta"];

    if (delta.contains("content") && delta["content"].is_string()) {
      auto text = delta["content"].get<std::string>();
      if (!text.empty()) emit(TextDelta{text});
    }

    for (const char* key : {"reasoning_content", "reasoning"}) {
      if (delta.contains(key) && delta[key].is_string()) {
        auto text = delta[key].get<std::string>();
        if (!text.empty()) emit(ReasoningDelta{text});
        break;
      }
    }

    if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
      for (const auto& tc : delta["tool_calls"]) {
        handle_tool_delta(tc);
        if (done()) return;
      }
    }
  }

  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    finish_reason_ = finish_reason_from_string(choice["finish_reason"].get<std::string>());
    // Usage may still follow in a trailing chunk, Finish waits for [DONE]
    close_calls();
  }
}

void OpenAICompletionsAdapter::Decoder::handle_tool_delta(const json& tc) {
  int index = static_cast<int>(detail::int_field(tc, "index"));
  Slot& slot = slots_[index];
  if (slot.closed) {
    spdlog::warn("Ignoring delta for finished tool call at index {}", index);
    return;
  }

  if (tc.contains("id") && tc["id"].is_string() && slot.id.empty()) {
    slot.id = tc["id"].get<std::string>();
  }

  std::string fragment;
  if (tc.contains("function") && tc["function"].is_object()) {
    const auto& fn = tc["function"];
    if (fn.contains("name") && fn["name"].is_string() && slot.name.empty()) {
      slot.name = fn["name"].get<std::string>();
    }
    if (fn.contains("arguments") && fn["arguments"].is_string()) {
      fragment = fn["arguments"].get<std::string>();
    }
  }

  if (slot.opened) {
    if (!fragment.empty()) emit(ToolCallArgDelta{slot.id, fragment});
    return;
  }

  slot.pending_args += fragment;
  if (!slot.id.empty() && !slot.name.empty()) {
    slot.opened = true;
    emit(ToolCallOpen{slot.id, slot.name});
    if (!slot.pending_args.empty()) {
      emit(ToolCallArgDelta{slot.id, slot.pending_args});
      slot.pending_args.clear();
    }
  }
}

void OpenAICompletionsAdapter::Decoder::close_calls() {
  for (auto& [index, slot] : slots_) {
    if (slot.closed) continue;
    if (!slot.opened) {
      if (slot.name.empty()) {
        fail(Error::malformed("tool call at index " + std::to_string(index) + " finished without a name"));
        return;
      }
      if (slot.id.empty()) {
        slot.id = "call_" + std::to_string(index);
      }
      slot.opened = true;
      emit(ToolCallOpen{slot.id, slot.name});
      if (!slot.pending_args.empty()) {
        emit(ToolCallArgDelta{slot.id, slot.pending_args});
        slot.pending_args.clear();
      }
    }
    emit(ToolCallClose{slot.id});
    slot.closed = true;
  }
}

void OpenAICompletionsAdapter::Decoder::complete() {
  close_calls();
  if (done()) return;
  FinishReason reason = finish_reason_.value_or(slots_.empty() ? FinishReason::Stop : FinishReason::ToolCalls);
  emit(Finish{reason});
}

}  // namespace agentwire::llm
