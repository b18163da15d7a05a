#include "agentwire/llm/openai_responses.hpp"

#include <spdlog/spdlog.h>

#include "adapter_util.hpp"
#include "agentwire/net/http_client.hpp"

namespace agentwire::llm {

std::string OpenAIResponsesAdapter::url(const Request&, const Endpoint& endpoint) const {
  return net::join_url(endpoint.base_url.empty() ? kDefaultBaseUrl : endpoint.base_url, "responses");
}

net::HttpOptions OpenAIResponsesAdapter::http_options(const Request& request, const Endpoint& endpoint) const {
  auto options = detail::make_http_options(endpoint, build_body(request), "text/event-stream");
  if (!endpoint.credential.empty()) {
    options.headers["Authorization"] = "Bearer " + endpoint.credential;
  }
  return options;
}

json OpenAIResponsesAdapter::build_body(const Request& request) {
  json body;
  body["model"] = request.model;
  body["stream"] = true;
  body["store"] = false;

  if (!request.system_prompt.empty()) {
    body["instructions"] = request.system_prompt;
  }
  if (request.max_tokens) {
    body["max_output_tokens"] = *request.max_tokens;
  }
  if (request.temperature) {
    body["temperature"] = *request.temperature;
  }
  if (request.reasoning != ThinkingLevel::Off) {
    body["reasoning"] = {{"effort", detail::reasoning_effort(request.reasoning)}, {"summary", "auto"}};
  }

  json input = json::array();
  for (const auto& msg : request.messages) {
    if (msg.role() == Role::System) {
      input.push_back({{"role", "developer"}, {"content", msg.text()}});
      continue;
    }

    if (msg.role() == Role::User) {
      for (const auto* tr : msg.tool_results()) {
        input.push_back({{"type", "function_call_output"}, {"call_id", tr->tool_call_id}, {"output", tr->output}});
      }
      auto text = msg.text();
      if (!text.empty()) {
        input.push_back({{"role", "user"}, {"content", json::array({{{"type", "input_text"}, {"text", text}}})}});
      }
      continue;
    }

    auto text = msg.text();
    if (!text.empty()) {
      input.push_back({{"type", "message"}, {"role", "assistant"}, {"content", json::array({{{"type", "output_text"}, {"text", text}}})}});
    }
    for (const auto* tc : msg.tool_calls()) {
      input.push_back({{"type", "function_call"}, {"call_id", tc->id}, {"name", tc->name}, {"arguments", detail::arguments_string(tc->arguments)}});
    }
  }
  body["input"] = input;

  if (!request.tools.empty()) {
    json tools_json = json::array();
    for (const auto& tool : request.tools) {
      tools_json.push_back({{"type", "function"}, {"name", tool.name}, {"description", tool.description}, {"parameters", tool.parameters}});
    }
    body["tools"] = tools_json;
  }

  return body;
}

void OpenAIResponsesAdapter::Decoder::feed(std::string_view chunk) {
  for (const auto& event : sse_.feed(chunk)) {
    if (done()) return;
    json j = json::parse(event.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      spdlog::warn("Failed to parse responses event '{}': {}", event.event, event.data.substr(0, 200));
      continue;
    }
    guarded("openai-responses", [&] { handle(j); });
  }
}

void OpenAIResponsesAdapter::Decoder::finish() {
  for (const auto& event : sse_.finish()) {
    if (done()) break;
    json j = json::parse(event.data, nullptr, false);
    if (!j.is_discarded() && j.is_object()) guarded("openai-responses", [&] { handle(j); });
  }
  end_of_stream();
}

OpenAIResponsesAdapter::Decoder::Item* OpenAIResponsesAdapter::Decoder::item_for(const json& j) {
  if (j.contains("output_index") && j["output_index"].is_number_integer()) {
    auto it = items_.find(j["output_index"].get<int>());
    if (it != items_.end()) return &it->second;
  }
  if (j.contains("item_id") && j["item_id"].is_string()) {
    auto idx = index_by_item_id_.find(j["item_id"].get<std::string>());
    if (idx != index_by_item_id_.end()) return &items_[idx->second];
  }
  return nullptr;
}

void OpenAIResponsesAdapter::Decoder::open_item(Item& item) {
  if (item.opened || item.id.empty() || item.name.empty()) return;
  item.opened = true;
  emit(ToolCallOpen{item.id, item.name});
  if (!item.pending_args.empty()) {
    emit(ToolCallArgDelta{item.id, item.pending_args});
    item.pending_args.clear();
  }
}

void OpenAIResponsesAdapter::Decoder::close_item(Item& item, const json& done_item) {
  if (item.closed) return;
  if (item.id.empty()) item.id = detail::string_field(done_item, "call_id", detail::string_field(done_item, "id"));
  if (item.name.empty()) item.name = detail::string_field(done_item, "name");
  if (item.id.empty() || item.name.empty()) {
    fail(Error::malformed("function_call item finished without call_id or name"));
    return;
  }
  if (!item.streamed_args && done_item.contains("arguments") && done_item["arguments"].is_string()) {
    item.pending_args += done_item["arguments"].get<std::string>();
    item.streamed_args = true;
  }
  open_item(item);
  if (!item.pending_args.empty()) {
    emit(ToolCallArgDelta{item.id, item.pending_args});
    item.pending_args.clear();
  }
  emit(ToolCallClose{item.id});
  item.closed = true;
}

void OpenAIResponsesAdapter::Decoder::handle(const json& j) {
  const std::string type = detail::string_field(j, "type");

  if (type == "response.output_text.delta" || type == "response.refusal.delta") {
    auto text = detail::string_field(j, "delta");
    if (!text.empty()) emit(TextDelta{text});
  } else if (type == "response.reasoning_summary_text.delta" || type == "response.reasoning_text.delta") {
    auto text = detail::string_field(j, "delta");
    if (!text.empty()) emit(ReasoningDelta{text});
  } else if (type == "response.output_item.added") {
    const auto& item = detail::object_field(j, "item");
    if (detail::string_field(item, "type") != "function_call") return;
    int index = static_cast<int>(detail::int_field(j, "output_index", static_cast<int64_t>(items_.size())));
    Item& slot = items_[index];
    slot.id = detail::string_field(item, "call_id", detail::string_field(item, "id"));
    slot.name = detail::string_field(item, "name");
    if (item.contains("id") && item["id"].is_string()) {
      index_by_item_id_[item["id"].get<std::string>()] = index;
    }
    saw_tool_call_ = true;
    auto initial = detail::string_field(item, "arguments");
    if (!initial.empty()) {
      slot.pending_args += initial;
      slot.streamed_args = true;
    }
    open_item(slot);
  } else if (type == "response.function_call_arguments.delta") {
    Item* item = item_for(j);
    if (!item) {
      fail(Error::malformed("argument delta for an unknown output item"));
      return;
    }
    auto fragment = detail::string_field(j, "delta");
    item->streamed_args = true;
    if (fragment.empty()) return;
    if (item->opened) {
      emit(ToolCallArgDelta{item->id, fragment});
    } else {
      item->pending_args += fragment;
    }
  } else if (type == "response.function_call_arguments.done") {
    Item* item = item_for(j);
    if (item && !item->streamed_args) {
      item->pending_args += detail::string_field(j, "arguments");
      item->streamed_args = true;
      open_item(*item);
    }
  } else if (type == "response.output_item.done") {
    const auto& done_item = detail::object_field(j, "item");
    if (detail::string_field(done_item, "type") != "function_call") return;
    int index = static_cast<int>(detail::int_field(j, "output_index", static_cast<int64_t>(items_.size())));
    saw_tool_call_ = true;
    close_item(items_[index], done_item);
  } else if (type == "response.completed") {
    complete(detail::object_field(j, "response"), FinishReason::Stop);
  } else if (type == "response.incomplete") {
    complete(detail::object_field(j, "response"), FinishReason::Length);
  } else if (type == "response.failed") {
    const auto& response = detail::object_field(j, "response");
    fail(detail::error_from_payload(detail::object_field(response, "error")));
  } else if (type == "error") {
    fail(detail::error_from_payload(j.contains("error") ? j["error"] : j));
  }
}

void OpenAIResponsesAdapter::Decoder::complete(const json& response, FinishReason fallback) {
  if (response.contains("usage") && response["usage"].is_object()) {
    const auto& u = response["usage"];
    TokenUsage usage;
    usage.input_tokens = detail::int_field(u, "input_tokens");
    usage.output_tokens = detail::int_field(u, "output_tokens");
    if (u.contains("input_tokens_details") && u["input_tokens_details"].is_object()) {
      usage.cache_read_tokens = detail::int_field(u["input_tokens_details"], "cached_tokens");
    }
    emit(Usage{usage});
  }

  std::string incomplete_reason;
  if (response.contains("incomplete_details") && response["incomplete_details"].is_object()) {
    incomplete_reason = detail::string_field(response["incomplete_details"], "reason");
  }

  FinishReason reason = fallback;
  if (incomplete_reason == "max_output_tokens") {
    reason = FinishReason::Length;
  } else if (incomplete_reason == "content_filter") {
    reason = FinishReason::ContentFilter;
  } else if (saw_tool_call_) {
    reason = FinishReason::ToolCalls;
  }
  emit(Finish{reason});
}

}  // namespace agentwire::llm
