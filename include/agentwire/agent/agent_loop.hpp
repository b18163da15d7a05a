#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "agentwire/core/config.hpp"
#include "agentwire/core/error.hpp"
#include "agentwire/core/message.hpp"
#include "agentwire/llm/event.hpp"
#include "agentwire/llm/request.hpp"
#include "agentwire/llm/router.hpp"
#include "agentwire/metrics/metrics.hpp"
#include "agentwire/net/transport.hpp"
#include "agentwire/policy/retry_policy.hpp"
#include "agentwire/tool/tool.hpp"

namespace agentwire {

enum class TurnState { Idle, Sending, Streaming, ToolDispatch, Completed, Aborted, Failed };

std::string to_string(TurnState state);

enum class TurnOutcome { Completed, Aborted, Failed };

std::string to_string(TurnOutcome outcome);

struct GenerationSettings {
  ThinkingLevel reasoning = ThinkingLevel::Off;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
};

// Everything a turn needs; messages grow as the turn runs
struct ConversationState {
  std::string system_prompt;
  std::vector<Message> messages;
  std::vector<llm::ToolDeclaration> tools;
  llm::RouteTarget target;
  GenerationSettings settings;
};

struct TurnResult {
  TurnOutcome outcome = TurnOutcome::Completed;
  FinishReason finish_reason = FinishReason::Stop;
  std::optional<Error> error;  // Failed only
  TokenUsage usage;
  int retries = 0;
  int fallback_hops = 0;
  int steps = 0;
  std::vector<std::string> cancelled_tool_calls;
  std::vector<Message> appended;
};

// Callbacks run on the thread executing the turn; all are optional
struct TurnObserver {
  std::function<void(const llm::CanonicalEvent&)> on_event;
  // Events received since the last reset belong to a failed attempt
  std::function<void(const Error&)> on_attempt_reset;
  std::function<void(const ToolCallPart&)> on_tool_start;
  std::function<void(const ToolCallPart&, const ToolOutcome&)> on_tool_finish;
  std::function<void(TurnState)> on_state;
  std::function<void(const TurnResult&)> on_complete;
};

// Cooperative cancellation flag shared by a TurnHandle and the running turn
class AbortSignal {
 public:
  void trigger();
  bool triggered() const {
    return flag_.load();
  }

  // Sleeps up to `timeout`; true when woken by trigger()
  bool wait_for(std::chrono::milliseconds timeout);

 private:
  std::atomic<bool> flag_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};

class TurnHandle {
 public:
  TurnHandle() = default;

  // Blocks until the turn is terminal
  const TurnResult& wait() const;

  // Conversation including the messages appended by the turn; call after wait()
  const ConversationState& conversation() const;

  // Idempotent; no effect once the turn is terminal
  void abort();

  bool done() const;

 private:
  friend class AgentLoop;

  struct State {
    AbortSignal abort;
    ConversationState conversation;
  };

  std::shared_ptr<State> state_;
  std::shared_future<TurnResult> result_;
};

/**
 * Drives turns: routing, streaming, retry and fallback, tool dispatch and
 * cancellation. One turn per conversation at a time; the loop itself holds
 * no per-turn state and may serve independent conversations concurrently.
 */
class AgentLoop {
 public:
  AgentLoop(std::shared_ptr<const Config> config, std::shared_ptr<net::StreamTransport> transport, std::shared_ptr<ToolExecutor> tools = nullptr,
            std::shared_ptr<metrics::MetricsSink> metrics = nullptr, FallbackTable fallbacks = FallbackTable());

  // Runs the turn on its own thread. The loop must outlive the handle.
  TurnHandle begin_turn(ConversationState conversation, TurnObserver observer = {});

  // Synchronous form; `conversation` receives the appended messages
  TurnResult run_turn(ConversationState& conversation, const TurnObserver& observer, AbortSignal& abort);

  // Bound on how long the loop waits for an event before checking for abort
  void set_poll_interval(std::chrono::milliseconds interval) {
    poll_interval_ = interval;
  }

  const llm::Router& router() const {
    return router_;
  }

  const RetryPolicy& retry_policy() const {
    return retry_;
  }

 private:
  struct TurnContext;
  struct StepOutcome;
  struct AttemptOutcome;

  StepOutcome run_step(TurnContext& turn);
  AttemptOutcome run_attempt(TurnContext& turn, const llm::RoutingDecision& decision);
  bool dispatch_tools(TurnContext& turn, const StepOutcome& step);
  TurnResult finish_turn(TurnContext& turn, TurnOutcome outcome);
  void set_state(TurnContext& turn, TurnState state);
  llm::Request build_request(const ConversationState& conversation, const llm::RoutingDecision& decision) const;

  std::shared_ptr<const Config> config_;
  llm::Router router_;
  RetryPolicy retry_;
  std::shared_ptr<net::StreamTransport> transport_;
  std::shared_ptr<ToolExecutor> tools_;
  std::shared_ptr<metrics::MetricsSink> metrics_;
  std::chrono::milliseconds poll_interval_{50};
};

}  // namespace agentwire
