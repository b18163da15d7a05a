#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <variant>

#include "agentwire/core/error.hpp"
#include "agentwire/core/types.hpp"

namespace agentwire::llm {

struct TextDelta {
  std::string text;
};

struct ReasoningDelta {
  std::string text;
  std::string signature;  // opaque token sealing the reasoning block, sent back on later requests
};

struct ToolCallOpen {
  std::string id;
  std::string name;
};

struct ToolCallArgDelta {
  std::string id;
  std::string fragment;  // not aligned to JSON token boundaries
};

struct ToolCallClose {
  std::string id;
};

struct Usage {
  TokenUsage usage;
};

struct Finish {
  FinishReason reason = FinishReason::Stop;
};

struct StreamError {
  Error error;
};

// Provider-independent stream vocabulary. Finish and StreamError are terminal.
using CanonicalEvent = std::variant<TextDelta, ReasoningDelta, ToolCallOpen, ToolCallArgDelta, ToolCallClose, Usage, Finish, StreamError>;

using EventCallback = std::function<void(CanonicalEvent)>;

bool is_terminal(const CanonicalEvent& event);

// Short rendering for logs
std::string describe(const CanonicalEvent& event);

/**
 * Queue between the transport thread (producer) and the loop (consumer) for
 * one attempt. Events pushed after close() are dropped.
 */
class EventStream {
 public:
  enum class WaitStatus { Event, Timeout, Closed };

  void push(CanonicalEvent event);
  void close();

  // Waits up to `timeout`; Closed only once the queue is drained
  WaitStatus next(CanonicalEvent& out, std::chrono::milliseconds timeout);

  bool closed() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<CanonicalEvent> queue_;
  bool closed_ = false;
};

}  // namespace agentwire::llm
