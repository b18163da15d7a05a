#include "agentwire/agent/agent_loop.hpp"

#include <spdlog/spdlog.h>

#include <random>

#include "agentwire/agent/tool_call_assembler.hpp"
#include "agentwire/core/uuid.hpp"
#include "agentwire/llm/adapter.hpp"

namespace agentwire {

using Clock = std::chrono::steady_clock;

namespace {

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::mt19937_64& backoff_rng() {
  thread_local std::mt19937_64 rng(std::random_device{}());
  return rng;
}

const char* kSkippedOutput = "Skipped due to abort signal.";

}  // namespace

std::string to_string(TurnState state) {
  switch (state) {
    case TurnState::Idle:
      return "idle";
    case TurnState::Sending:
      return "sending";
    case TurnState::Streaming:
      return "streaming";
    case TurnState::ToolDispatch:
      return "tool_dispatch";
    case TurnState::Completed:
      return "completed";
    case TurnState::Aborted:
      return "aborted";
    case TurnState::Failed:
      return "failed";
  }
  return "unknown";
}

std::string to_string(TurnOutcome outcome) {
  switch (outcome) {
    case TurnOutcome::Completed:
      return "completed";
    case TurnOutcome::Aborted:
      return "aborted";
    case TurnOutcome::Failed:
      return "failed";
  }
  return "unknown";
}

void AbortSignal::trigger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    flag_.store(true);
  }
  cv_.notify_all();
}

bool AbortSignal::wait_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return flag_.load(); });
}

const TurnResult& TurnHandle::wait() const {
  if (!result_.valid()) {
    throw std::logic_error("TurnHandle has no turn");
  }
  return result_.get();
}

const ConversationState& TurnHandle::conversation() const {
  wait();
  return state_->conversation;
}

void TurnHandle::abort() {
  if (state_) {
    state_->abort.trigger();
  }
}

bool TurnHandle::done() const {
  return result_.valid() && result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

// Per-turn bookkeeping, owned by run_turn()
struct AgentLoop::TurnContext {
  ConversationState& conversation;
  const TurnObserver& observer;
  AbortSignal& abort;

  std::string id = ids::short_id();
  Clock::time_point started = Clock::now();
  size_t initial_messages = 0;
  TurnState state = TurnState::Idle;
  TurnResult result;
};

struct AgentLoop::AttemptOutcome {
  enum class Status { Finished, Aborted, Failed };

  Status status = Status::Failed;
  Error error;
  FinishReason finish = FinishReason::Stop;
  std::string text;
  std::string reasoning;
  std::string reasoning_signature;
  std::vector<PendingCall> calls;
  TokenUsage usage;
};

struct AgentLoop::StepOutcome {
  AttemptOutcome::Status status = AttemptOutcome::Status::Failed;
  Error error;
  Message assistant;
  std::vector<PendingCall> calls;
};

AgentLoop::AgentLoop(std::shared_ptr<const Config> config, std::shared_ptr<net::StreamTransport> transport, std::shared_ptr<ToolExecutor> tools,
                     std::shared_ptr<metrics::MetricsSink> metrics, FallbackTable fallbacks)
    : config_(std::move(config)),
      router_(config_, std::move(fallbacks)),
      retry_(RetryPolicy::from(config_->retry)),
      transport_(std::move(transport)),
      tools_(std::move(tools)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<metrics::NullMetricsSink>()) {
  if (!transport_) {
    throw std::invalid_argument("AgentLoop requires a transport");
  }
}

TurnHandle AgentLoop::begin_turn(ConversationState conversation, TurnObserver observer) {
  TurnHandle handle;
  handle.state_ = std::make_shared<TurnHandle::State>();
  handle.state_->conversation = std::move(conversation);

  auto state = handle.state_;
  handle.result_ = std::async(std::launch::async, [this, state, observer = std::move(observer)]() {
                     return run_turn(state->conversation, observer, state->abort);
                   }).share();
  return handle;
}

void AgentLoop::set_state(TurnContext& turn, TurnState state) {
  if (turn.state == state) return;
  spdlog::debug("[Turn {}] {} -> {}", turn.id, to_string(turn.state), to_string(state));
  turn.state = state;
  if (turn.observer.on_state) {
    turn.observer.on_state(state);
  }
}

TurnResult AgentLoop::run_turn(ConversationState& conversation, const TurnObserver& observer, AbortSignal& abort) {
  TurnContext turn{conversation, observer, abort};
  turn.initial_messages = conversation.messages.size();

  spdlog::debug("[Turn {}] Starting turn, target={}, messages={}", turn.id, conversation.target.provider, conversation.messages.size());

  while (true) {
    if (abort.triggered()) {
      return finish_turn(turn, TurnOutcome::Aborted);
    }

    if (turn.result.steps >= config_->max_steps) {
      spdlog::warn("[Turn {}] Step limit {} reached", turn.id, config_->max_steps);
      turn.result.error = Error{ErrorKind::ProviderError, "step limit of " + std::to_string(config_->max_steps) + " reached", 0, std::nullopt};
      return finish_turn(turn, TurnOutcome::Failed);
    }
    turn.result.steps++;

    spdlog::debug("[Turn {}] Step {}", turn.id, turn.result.steps);
    StepOutcome step = run_step(turn);

    if (step.status == AttemptOutcome::Status::Failed) {
      turn.result.error = step.error;
      return finish_turn(turn, TurnOutcome::Failed);
    }

    if (step.status == AttemptOutcome::Status::Aborted) {
      // Calls seen during an aborted stream are never dispatched
      for (const auto& call : step.calls) {
        turn.result.cancelled_tool_calls.push_back(call.id);
      }
      if (!step.assistant.empty()) {
        conversation.messages.push_back(step.assistant);
      }
      return finish_turn(turn, TurnOutcome::Aborted);
    }

    conversation.messages.push_back(step.assistant);
    turn.result.finish_reason = step.assistant.finish_reason();

    if (step.calls.empty()) {
      return finish_turn(turn, TurnOutcome::Completed);
    }

    if (!dispatch_tools(turn, step)) {
      return finish_turn(turn, turn.result.error ? TurnOutcome::Failed : TurnOutcome::Aborted);
    }
  }
}

AgentLoop::StepOutcome AgentLoop::run_step(TurnContext& turn) {
  StepOutcome step;
  const int max_attempts = retry_.max_attempts;

  llm::RoutingDecision decision;
  try {
    decision = router_.route(turn.conversation.target);
  } catch (const ConfigError& e) {
    spdlog::error("[Turn {}] Routing failed: {}", turn.id, e.what());
    step.error = Error::config(e.what());
    return step;
  }

  int retries = 0;
  int attempt = 0;
  bool fallback_used = false;

  while (true) {
    if (turn.abort.triggered()) {
      step.status = AttemptOutcome::Status::Aborted;
      return step;
    }

    ++attempt;
    metrics_->emit(metrics::AttemptStarted{turn.id, decision.profile.name, decision.api, decision.model, attempt});
    spdlog::debug("[Turn {}] Attempt {} via {} ({}, model={})", turn.id, attempt, decision.profile.name, decision.api, decision.model);

    auto started = Clock::now();
    AttemptOutcome outcome = run_attempt(turn, decision);

    if (outcome.status != AttemptOutcome::Status::Failed) {
      step.status = outcome.status;
      step.assistant = Message::assistant("");
      if (!outcome.reasoning.empty() || !outcome.reasoning_signature.empty()) {
        step.assistant.add_reasoning(sanitize_utf8(outcome.reasoning), outcome.reasoning_signature);
      }
      if (!outcome.text.empty()) {
        step.assistant.add_text(sanitize_utf8(outcome.text));
      }
      step.assistant.set_usage(outcome.usage);
      turn.result.usage += outcome.usage;

      if (outcome.status == AttemptOutcome::Status::Aborted) {
        step.assistant.set_finish_reason(FinishReason::Cancelled);
        step.assistant.set_finished(true);
        step.calls = std::move(outcome.calls);
        return step;
      }

      for (const auto& call : outcome.calls) {
        step.assistant.add_tool_call(call.id, call.name, call.args_valid ? call.arguments : json(call.args));
      }
      step.assistant.set_finish_reason(outcome.finish);
      step.assistant.set_finished(true);
      step.calls = std::move(outcome.calls);

      metrics_->emit(metrics::RequestCompleted{turn.id, decision.profile.name, decision.api, decision.model, outcome.finish, outcome.usage,
                                               elapsed_since(started)});
      return step;
    }

    const Error& error = outcome.error;
    spdlog::warn("[Turn {}] Attempt {} failed: {}", turn.id, attempt, error.describe());
    metrics_->emit(metrics::AttemptFailed{turn.id, decision.profile.name, decision.api, error.kind, error.message, elapsed_since(started)});
    if (turn.observer.on_attempt_reset) {
      turn.observer.on_attempt_reset(error);
    }

    switch (classify(error)) {
      case ErrorClass::Fatal:
        step.error = error;
        return step;

      case ErrorClass::ShapeMismatch: {
        if (fallback_used) {
          step.error = error;
          return step;
        }
        std::optional<llm::RoutingDecision> next;
        try {
          next = router_.fallback(decision);
        } catch (const ConfigError& e) {
          step.error = Error::config(e.what());
          return step;
        }
        if (!next) {
          step.error = error;
          return step;
        }
        fallback_used = true;
        turn.result.fallback_hops++;
        spdlog::info("[Turn {}] {} does not speak {}, falling back to {}", turn.id, decision.profile.name, decision.api, next->api);
        metrics_->emit(metrics::FallbackHop{turn.id, decision.profile.name, decision.api, next->api});
        decision = std::move(*next);
        continue;
      }

      case ErrorClass::Transient:
        break;
    }

    if (retries + 1 >= max_attempts) {
      spdlog::warn("[Turn {}] Giving up after {} attempts", turn.id, retries + 1);
      step.error = error;
      return step;
    }

    auto delay = retry_.backoff.delay(retries, error, backoff_rng());
    metrics_->emit(metrics::RetryScheduled{turn.id, retries + 1, delay, error.kind});
    spdlog::debug("[Turn {}] Retry {} in {}ms", turn.id, retries + 1, delay.count());
    retries++;
    turn.result.retries++;

    if (turn.abort.wait_for(delay)) {
      step.status = AttemptOutcome::Status::Aborted;
      return step;
    }

    try {
      // A fallback shape stays in use; otherwise route again for a fresh draw
      decision = decision.is_fallback ? router_.refresh(decision) : router_.route(turn.conversation.target);
    } catch (const ConfigError& e) {
      step.error = Error::config(e.what());
      return step;
    }
  }
}

llm::Request AgentLoop::build_request(const ConversationState& conversation, const llm::RoutingDecision& decision) const {
  llm::Request request;
  request.provider = decision.profile.name;
  request.api = decision.api;
  request.model = decision.model;
  request.system_prompt = conversation.system_prompt;
  request.messages = conversation.messages;
  request.tools = conversation.tools;
  request.reasoning = conversation.settings.reasoning;
  request.max_tokens = conversation.settings.max_tokens;
  request.temperature = conversation.settings.temperature;
  return request;
}

AgentLoop::AttemptOutcome AgentLoop::run_attempt(TurnContext& turn, const llm::RoutingDecision& decision) {
  AttemptOutcome outcome;

  auto adapter = llm::adapter_for_api(decision.api);
  if (!adapter) {
    outcome.error = Error::config("no adapter for api '" + decision.api + "'");
    return outcome;
  }

  llm::Endpoint endpoint;
  endpoint.base_url = decision.profile.base_url;
  endpoint.credential = decision.credential;
  endpoint.headers = decision.profile.headers;
  endpoint.connect_timeout = config_->timeouts.connect;
  endpoint.read_timeout = config_->timeouts.read_idle;

  set_state(turn, TurnState::Sending);
  auto events = std::make_shared<llm::EventStream>();
  std::shared_ptr<net::StreamCall> call;
  try {
    call = llm::send(*adapter, *transport_, build_request(turn.conversation, decision), endpoint, events);
  } catch (const nlohmann::json::exception& e) {
    spdlog::error("[Turn {}] Could not encode request for {}: {}", turn.id, decision.api, e.what());
    outcome.error = Error{ErrorKind::ProviderError, std::string("could not encode request: ") + e.what(), 0, std::nullopt};
    return outcome;
  }

  ToolCallAssembler assembler;
  auto fail = [&](Error error) {
    call->cancel();
    outcome.status = AttemptOutcome::Status::Failed;
    outcome.error = std::move(error);
    return outcome;
  };

  while (true) {
    if (turn.abort.triggered()) {
      spdlog::debug("[Turn {}] Abort requested mid-stream", turn.id);
      call->cancel();
      outcome.status = AttemptOutcome::Status::Aborted;
      outcome.calls = assembler.take_calls();
      return outcome;
    }

    llm::CanonicalEvent event;
    auto status = events->next(event, poll_interval_);
    if (status == llm::EventStream::WaitStatus::Timeout) {
      continue;
    }
    if (status == llm::EventStream::WaitStatus::Closed) {
      return fail(Error::network("stream closed without a terminal event"));
    }

    set_state(turn, TurnState::Streaming);
    if (turn.observer.on_event) {
      turn.observer.on_event(event);
    }

    if (auto error = assembler.apply(event)) {
      return fail(std::move(*error));
    }

    if (auto* e = std::get_if<llm::TextDelta>(&event)) {
      outcome.text += e->text;
    } else if (auto* e = std::get_if<llm::ReasoningDelta>(&event)) {
      outcome.reasoning += e->text;
      if (!e->signature.empty()) outcome.reasoning_signature = e->signature;
    } else if (auto* e = std::get_if<llm::Usage>(&event)) {
      outcome.usage += e->usage;
    } else if (auto* e = std::get_if<llm::Finish>(&event)) {
      outcome.status = AttemptOutcome::Status::Finished;
      outcome.finish = e->reason;
      outcome.calls = assembler.take_calls();
      return outcome;
    } else if (auto* e = std::get_if<llm::StreamError>(&event)) {
      return fail(e->error);
    }
  }
}

bool AgentLoop::dispatch_tools(TurnContext& turn, const StepOutcome& step) {
  set_state(turn, TurnState::ToolDispatch);
  spdlog::debug("[Turn {}] Dispatching {} tool calls", turn.id, step.calls.size());

  // Results accumulate in one user message appended before the first call runs
  turn.conversation.messages.push_back(Message(Role::User, ""));
  const size_t results_index = turn.conversation.messages.size() - 1;

  for (size_t i = 0; i < step.calls.size(); ++i) {
    const PendingCall& call = step.calls[i];
    Message& results = turn.conversation.messages[results_index];

    if (turn.abort.triggered()) {
      for (size_t j = i; j < step.calls.size(); ++j) {
        results.add_tool_result(step.calls[j].id, step.calls[j].name, kSkippedOutput, true);
        turn.result.cancelled_tool_calls.push_back(step.calls[j].id);
      }
      return false;
    }

    ToolCallPart part{call.id, call.name, call.arguments};
    if (turn.observer.on_tool_start) {
      turn.observer.on_tool_start(part);
    }

    auto started = Clock::now();
    ToolOutcome outcome;
    if (!call.args_valid) {
      outcome = ToolOutcome::failure("Invalid arguments for tool '" + call.name + "': " + call.parse_error);
    } else if (!tools_) {
      outcome = ToolOutcome::failure("Tool not found: " + call.name);
    } else {
      try {
        outcome = tools_->execute(call.name, call.arguments);
      } catch (const std::exception& e) {
        outcome = ToolOutcome::failure(std::string("Tool raised an exception: ") + e.what());
      }
    }
    auto duration = elapsed_since(started);

    spdlog::debug("[Turn {}] Tool {} ({}) finished in {}ms, ok={}", turn.id, call.name, call.id, duration.count(), outcome.ok());
    metrics_->emit(metrics::ToolExecuted{turn.id, call.name, outcome.ok(), duration});

    results.add_tool_result(call.id, call.name, sanitize_utf8(outcome.output_text()), !outcome.ok());
    if (turn.observer.on_tool_finish) {
      turn.observer.on_tool_finish(part, outcome);
    }

    if (outcome.error && outcome.error->fatal) {
      spdlog::error("[Turn {}] Tool {} failed fatally: {}", turn.id, call.name, outcome.error->message);
      for (size_t j = i + 1; j < step.calls.size(); ++j) {
        results.add_tool_result(step.calls[j].id, step.calls[j].name, "Skipped after a fatal tool error.", true);
      }
      turn.result.error = Error{ErrorKind::ToolExecutionError, call.name + ": " + outcome.error->message, 0, std::nullopt};
      return false;
    }
  }
  return true;
}

TurnResult AgentLoop::finish_turn(TurnContext& turn, TurnOutcome outcome) {
  TurnResult& result = turn.result;
  result.outcome = outcome;

  switch (outcome) {
    case TurnOutcome::Completed:
      set_state(turn, TurnState::Completed);
      break;
    case TurnOutcome::Aborted:
      result.finish_reason = FinishReason::Cancelled;
      set_state(turn, TurnState::Aborted);
      break;
    case TurnOutcome::Failed:
      result.finish_reason = FinishReason::Error;
      set_state(turn, TurnState::Failed);
      break;
  }

  const auto& messages = turn.conversation.messages;
  result.appended.assign(messages.begin() + static_cast<std::ptrdiff_t>(turn.initial_messages), messages.end());

  auto latency = elapsed_since(turn.started);
  if (result.error) {
    spdlog::error("[Turn {}] Turn failed after {} steps: {}", turn.id, result.steps, result.error->describe());
  } else {
    spdlog::debug("[Turn {}] Turn {} after {} steps, {} retries, {} fallback hops", turn.id, to_string(outcome), result.steps, result.retries,
                  result.fallback_hops);
  }
  metrics_->emit(metrics::TurnFinished{turn.id, to_string(outcome), result.steps, result.retries, result.fallback_hops, result.usage, latency});

  if (turn.observer.on_complete) {
    turn.observer.on_complete(result);
  }
  return result;
}

}  // namespace agentwire
