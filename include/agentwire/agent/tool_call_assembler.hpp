#pragma once

#include <optional>
#include <string>
#include <vector>

#include "agentwire/core/error.hpp"
#include "agentwire/core/types.hpp"
#include "agentwire/llm/event.hpp"

namespace agentwire {

// A tool call assembled from Open/ArgDelta/Close
struct PendingCall {
  std::string id;
  std::string name;
  std::string args;
  bool closed = false;
  bool args_valid = true;
  json arguments = json::object();
  std::string parse_error;
};

/**
 * Assembles the tool calls of one attempt.
 *
 * Every call is opened once, receives fragments only while open and is
 * closed once; none may still be open at Finish. An event that breaks this
 * yields a MalformedStream error and the attempt must be abandoned.
 */
class ToolCallAssembler {
 public:
  std::optional<Error> apply(const llm::CanonicalEvent& event);

  const std::vector<PendingCall>& calls() const {
    return calls_;
  }

  std::vector<PendingCall> take_calls() {
    return std::move(calls_);
  }

 private:
  PendingCall* find(const std::string& id);

  std::vector<PendingCall> calls_;
};

}  // namespace agentwire
