#include "agentwire/core/message.hpp"

namespace agentwire {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string& str) {
  if (str == "system") return Role::System;
  if (str == "assistant") return Role::Assistant;
  return Role::User;
}

Message::Message(Role role, const std::string& content) : role_(role) {
  if (!content.empty()) {
    parts_.push_back(TextPart{content});
  }
}

Message Message::system(const std::string& content) {
  return Message(Role::System, content);
}

Message Message::user(const std::string& content) {
  return Message(Role::User, content);
}

Message Message::assistant(const std::string& content) {
  return Message(Role::Assistant, content);
}

void Message::add_part(MessagePart part) {
  parts_.push_back(std::move(part));
}

void Message::add_text(const std::string& text) {
  // Streamed deltas extend the trailing text part
  if (!parts_.empty()) {
    if (auto* last = std::get_if<TextPart>(&parts_.back())) {
      last->text += text;
      return;
    }
  }
  parts_.push_back(TextPart{text});
}

void Message::add_reasoning(const std::string& text, const std::string& signature) {
  if (!parts_.empty()) {
    if (auto* last = std::get_if<ReasoningPart>(&parts_.back())) {
      last->text += text;
      if (!signature.empty()) last->signature = signature;
      return;
    }
  }
  parts_.push_back(ReasoningPart{text, signature});
}

void Message::add_tool_call(const std::string& id, const std::string& name, const json& args) {
  parts_.push_back(ToolCallPart{id, name, args});
}

void Message::add_tool_result(const std::string& call_id, const std::string& name, const std::string& output, bool is_error) {
  parts_.push_back(ToolResultPart{call_id, name, output, is_error});
}

namespace {

template <typename Part>
std::vector<const Part*> parts_of(const std::vector<MessagePart>& parts) {
  std::vector<const Part*> out;
  for (const auto& part : parts) {
    if (auto* p = std::get_if<Part>(&part)) {
      out.push_back(p);
    }
  }
  return out;
}

}  // namespace

std::string Message::text() const {
  std::string joined;
  for (const auto* part : parts_of<TextPart>(parts_)) {
    if (!joined.empty()) joined += "\n";
    joined += part->text;
  }
  return joined;
}

std::string Message::reasoning() const {
  std::string joined;
  for (const auto* part : parts_of<ReasoningPart>(parts_)) {
    joined += part->text;
  }
  return joined;
}

std::vector<const ToolCallPart*> Message::tool_calls() const {
  return parts_of<ToolCallPart>(parts_);
}

std::vector<const ToolResultPart*> Message::tool_results() const {
  return parts_of<ToolResultPart>(parts_);
}

json Message::to_json() const {
  json j;
  j["id"] = id_;
  j["role"] = to_string(role_);
  j["finished"] = finished_;
  j["finish_reason"] = to_string(finish_reason_);
  j["created_at"] = std::chrono::duration_cast<std::chrono::milliseconds>(created_at_.time_since_epoch()).count();

  json parts_json = json::array();
  for (const auto& part : parts_) {
    json part_json;
    if (auto* text = std::get_if<TextPart>(&part)) {
      part_json["type"] = "text";
      part_json["text"] = text->text;
    } else if (auto* r = std::get_if<ReasoningPart>(&part)) {
      part_json["type"] = "reasoning";
      part_json["text"] = r->text;
      if (!r->signature.empty()) part_json["signature"] = r->signature;
    } else if (auto* tc = std::get_if<ToolCallPart>(&part)) {
      part_json["type"] = "tool_call";
      part_json["id"] = tc->id;
      part_json["name"] = tc->name;
      part_json["arguments"] = tc->arguments;
    } else if (auto* tr = std::get_if<ToolResultPart>(&part)) {
      part_json["type"] = "tool_result";
      part_json["tool_call_id"] = tr->tool_call_id;
      part_json["tool_name"] = tr->tool_name;
      part_json["output"] = tr->output;
      part_json["is_error"] = tr->is_error;
    }
    parts_json.push_back(part_json);
  }
  j["parts"] = parts_json;

  j["usage"] = {{"input_tokens", usage_.input_tokens},
                {"output_tokens", usage_.output_tokens},
                {"cache_read_tokens", usage_.cache_read_tokens},
                {"cache_write_tokens", usage_.cache_write_tokens}};

  return j;
}

Message Message::from_json(const json& j) {
  Message msg;
  msg.id_ = j.value("id", ids::uuid_v4());
  msg.role_ = role_from_string(j.value("role", "user"));
  msg.finished_ = j.value("finished", false);
  msg.finish_reason_ = finish_reason_from_string(j.value("finish_reason", "stop"));
  if (j.contains("created_at") && j["created_at"].is_number_integer()) {
    msg.created_at_ = Timestamp(std::chrono::milliseconds(j["created_at"].get<int64_t>()));
  }

  if (j.contains("parts")) {
    for (const auto& part_json : j["parts"]) {
      std::string type = part_json.value("type", "");
      if (type == "text") {
        msg.parts_.push_back(TextPart{part_json.value("text", "")});
      } else if (type == "reasoning") {
        msg.parts_.push_back(ReasoningPart{part_json.value("text", ""), part_json.value("signature", "")});
      } else if (type == "tool_call") {
        msg.parts_.push_back(ToolCallPart{part_json.value("id", ""), part_json.value("name", ""), part_json.value("arguments", json::object())});
      } else if (type == "tool_result") {
        msg.parts_.push_back(ToolResultPart{part_json.value("tool_call_id", ""), part_json.value("tool_name", ""), part_json.value("output", ""),
                                            part_json.value("is_error", false)});
      }
    }
  }

  if (j.contains("usage")) {
    const auto& u = j["usage"];
    msg.usage_.input_tokens = u.value("input_tokens", int64_t{0});
    msg.usage_.output_tokens = u.value("output_tokens", int64_t{0});
    msg.usage_.cache_read_tokens = u.value("cache_read_tokens", int64_t{0});
    msg.usage_.cache_write_tokens = u.value("cache_write_tokens", int64_t{0});
  }

  return msg;
}

}  // namespace agentwire
