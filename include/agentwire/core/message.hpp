#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "agentwire/core/types.hpp"
#include "agentwire/core/uuid.hpp"

namespace agentwire {

struct TextPart {
  std::string text;
};

struct ReasoningPart {
  std::string text;
  std::string signature;
};

struct ToolCallPart {
  std::string id;
  std::string name;
  json arguments;
};

struct ToolResultPart {
  std::string tool_call_id;
  std::string tool_name;
  std::string output;
  bool is_error = false;
};

using MessagePart = std::variant<TextPart, ReasoningPart, ToolCallPart, ToolResultPart>;

enum class Role { System, User, Assistant };

std::string to_string(Role role);
Role role_from_string(const std::string& str);

// One entry of a conversation. Tool results travel in a user message.
class Message {
 public:
  Message() = default;
  Message(Role role, const std::string& content);

  static Message system(const std::string& content);
  static Message user(const std::string& content);
  static Message assistant(const std::string& content);

  const MessageId& id() const {
    return id_;
  }
  Role role() const {
    return role_;
  }
  const std::vector<MessagePart>& parts() const {
    return parts_;
  }

  bool is_finished() const {
    return finished_;
  }
  void set_finished(bool finished) {
    finished_ = finished;
  }

  FinishReason finish_reason() const {
    return finish_reason_;
  }
  void set_finish_reason(FinishReason reason) {
    finish_reason_ = reason;
  }

  const TokenUsage& usage() const {
    return usage_;
  }
  void set_usage(const TokenUsage& usage) {
    usage_ = usage;
  }

  Timestamp created_at() const {
    return created_at_;
  }

  void add_part(MessagePart part);
  void add_text(const std::string& text);
  // Extends the trailing reasoning part; a non-empty signature replaces the stored one
  void add_reasoning(const std::string& text, const std::string& signature = "");
  void add_tool_call(const std::string& id, const std::string& name, const json& args);
  void add_tool_result(const std::string& call_id, const std::string& name, const std::string& output, bool is_error = false);

  // Concatenated text parts
  std::string text() const;
  std::string reasoning() const;

  std::vector<const ToolCallPart*> tool_calls() const;
  std::vector<const ToolResultPart*> tool_results() const;

  bool empty() const {
    return parts_.empty();
  }

  json to_json() const;
  static Message from_json(const json& j);

 private:
  MessageId id_ = ids::uuid_v4();
  Role role_ = Role::User;
  std::vector<MessagePart> parts_;

  bool finished_ = false;
  FinishReason finish_reason_ = FinishReason::Stop;
  TokenUsage usage_;

  Timestamp created_at_ = std::chrono::system_clock::now();
};

}  // namespace agentwire
