#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "agentwire/core/message.hpp"
#include "agentwire/core/types.hpp"

namespace agentwire::llm {

struct ToolDeclaration {
  std::string name;
  std::string description;
  json parameters;  // JSON schema of the arguments object
};

// Canonical request, fixed for the duration of one attempt
struct Request {
  std::string provider;
  std::string api;
  std::string model;
  std::string system_prompt;
  std::vector<Message> messages;
  std::vector<ToolDeclaration> tools;
  ThinkingLevel reasoning = ThinkingLevel::Off;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
};

// Where and how an attempt is sent
struct Endpoint {
  std::string base_url;
  std::string credential;  // already resolved, empty for none
  std::map<std::string, std::string> headers;
  std::chrono::milliseconds connect_timeout{15000};
  std::chrono::milliseconds read_timeout{60000};
};

}  // namespace agentwire::llm
