#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>

#include "agentwire/agent/agent_loop.hpp"
#include "agentwire/agent/tool_call_assembler.hpp"
#include "test_support.hpp"

using namespace agentwire;
using namespace std::chrono_literals;

namespace {

using test::sse;

std::string completions_text(const std::string& text, const std::string& finish = "stop") {
  return sse(json{{"choices", {{{"index", 0}, {"delta", {{"content", text}}}}}}}.dump()) +
         sse(json{{"choices", {{{"index", 0}, {"delta", json::object()}, {"finish_reason", finish}}}}}.dump()) +
         sse(R"({"choices":[],"usage":{"prompt_tokens":10,"completion_tokens":5}})") + sse("[DONE]");
}

std::string completions_tool_calls(const std::vector<std::tuple<std::string, std::string, std::string>>& calls) {
  std::string body;
  int index = 0;
  for (const auto& [id, name, args] : calls) {
    body += sse(json{{"choices",
                      {{{"index", 0},
                        {"delta", {{"tool_calls", {{{"index", index}, {"id", id}, {"function", {{"name", name}, {"arguments", args}}}}}}}}}}}}
                    .dump());
    ++index;
  }
  body += sse(R"({"choices":[{"index":0,"delta":{},"finish_reason":"tool_calls"}]})");
  body += sse(R"({"choices":[],"usage":{"prompt_tokens":10,"completion_tokens":5}})");
  body += sse("[DONE]");
  return body;
}

std::string responses_text(const std::string& text) {
  return sse(json{{"type", "response.output_text.delta"}, {"output_index", 0}, {"delta", text}}.dump()) +
         sse(R"({"type":"response.completed","response":{"usage":{"input_tokens":7,"output_tokens":3}}})");
}

std::string anthropic_text(const std::string& text) {
  return sse(R"({"type":"message_start","message":{"usage":{"input_tokens":8,"output_tokens":1}}})") +
         sse(R"({"type":"content_block_start","index":0,"content_block":{"type":"text","text":""}})") +
         sse(json{{"type", "content_block_delta"}, {"index", 0}, {"delta", {{"type", "text_delta"}, {"text", text}}}}.dump()) +
         sse(R"({"type":"content_block_stop","index":0})") + sse(R"({"type":"message_delta","delta":{"stop_reason":"end_turn"},"usage":{"output_tokens":3}})") +
         sse(R"({"type":"message_stop"})");
}

test::ScriptedResponse ok(const std::string& body) {
  return test::ScriptedResponse::ok(test::split_every(body, 11));
}

ProviderProfile make_profile(const std::string& name, const std::string& api) {
  ProviderProfile p;
  p.name = name;
  p.api = api;
  p.base_url = "http://llm.test/v1";
  p.api_key = "sk-" + name;
  p.model = name + "-model";
  return p;
}

class RecordingMetrics : public metrics::MetricsSink {
 public:
  void emit(const metrics::MetricsEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    names_.push_back(metrics::event_name(event));
    if (auto* finished = std::get_if<metrics::TurnFinished>(&event)) {
      last_turn_ = *finished;
    }
  }

  size_t count(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count(names_.begin(), names_.end(), name));
  }

  metrics::TurnFinished last_turn() {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_turn_;
  }

 private:
  std::mutex mutex_;
  std::vector<std::string> names_;
  metrics::TurnFinished last_turn_;
};

// Executor that throws for every call
class ThrowingExecutor : public ToolExecutor {
 public:
  ToolOutcome execute(const std::string&, const json&) override {
    throw std::runtime_error("sandbox crashed");
  }
};

class AgentLoopTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = std::make_shared<Config>();
    config_->providers["completions"] = make_profile("completions", api::kOpenAICompletions);
    config_->providers["responses"] = make_profile("responses", api::kOpenAIResponses);
    config_->providers["claude"] = make_profile("claude", api::kAnthropicMessages);
    config_->retry.initial_backoff = 1ms;
    config_->retry.max_backoff = 4ms;
    config_->retry.jitter = 0.0;

    transport_ = std::make_shared<test::ScriptedTransport>();
    tools_ = std::make_shared<ToolRegistry>();
    metrics_ = std::make_shared<RecordingMetrics>();

    tools_->register_tool(std::make_shared<FunctionTool>(
        "read", "Read a file", std::vector<ParameterSchema>{{"path", "string", "File to read", true, std::nullopt, std::nullopt}},
        [this](const json& args) {
          read_calls_++;
          return ToolOutcome::success("contents of " + args["path"].get<std::string>());
        }));
  }

  std::unique_ptr<AgentLoop> make_loop(std::shared_ptr<ToolExecutor> tools = nullptr) {
    auto loop = std::make_unique<AgentLoop>(config_, transport_, tools ? tools : tools_, metrics_);
    loop->set_poll_interval(5ms);
    return loop;
  }

  ConversationState conversation(const std::string& target, const std::string& prompt = "read a.txt") {
    ConversationState state;
    state.system_prompt = "You are terse.";
    state.messages.push_back(Message::user(prompt));
    state.tools = tools_->declarations();
    state.target = llm::RouteTarget::parse(target);
    return state;
  }

  TurnResult run(ConversationState& state, const TurnObserver& observer = {}) {
    AbortSignal abort;
    return make_loop()->run_turn(state, observer, abort);
  }

  std::shared_ptr<Config> config_;
  std::shared_ptr<test::ScriptedTransport> transport_;
  std::shared_ptr<ToolRegistry> tools_;
  std::shared_ptr<RecordingMetrics> metrics_;
  std::atomic<int> read_calls_{0};
};

}  // namespace

TEST(TurnStateTest, Names) {
  EXPECT_EQ(to_string(TurnState::ToolDispatch), "tool_dispatch");
  EXPECT_EQ(to_string(TurnOutcome::Aborted), "aborted");
}

TEST_F(AgentLoopTest, TextOnlyTurnCompletes) {
  transport_->enqueue(ok(completions_text("Hello there")));

  auto state = conversation("completions");
  std::vector<TurnState> states;
  std::string streamed;
  TurnObserver observer;
  observer.on_state = [&states](TurnState s) { states.push_back(s); };
  observer.on_event = [&streamed](const llm::CanonicalEvent& e) {
    if (auto* t = std::get_if<llm::TextDelta>(&e)) streamed += t->text;
  };

  auto result = run(state, observer);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.finish_reason, FinishReason::Stop);
  EXPECT_FALSE(result.error.has_value());
  EXPECT_EQ(result.steps, 1);
  EXPECT_EQ(result.retries, 0);
  EXPECT_EQ(result.usage.input_tokens, 10);
  EXPECT_EQ(streamed, "Hello there");

  ASSERT_EQ(result.appended.size(), 1u);
  EXPECT_EQ(result.appended[0].role(), Role::Assistant);
  EXPECT_EQ(result.appended[0].text(), "Hello there");
  EXPECT_EQ(state.messages.size(), 2u);

  ASSERT_GE(states.size(), 3u);
  EXPECT_EQ(states.front(), TurnState::Sending);
  EXPECT_EQ(states[1], TurnState::Streaming);
  EXPECT_EQ(states.back(), TurnState::Completed);

  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url, "http://llm.test/v1/chat/completions");
  EXPECT_EQ(requests[0].options.headers["Authorization"], "Bearer sk-completions");
  EXPECT_EQ(metrics_->count("turn_finished"), 1u);
}

TEST_F(AgentLoopTest, ToolCallRoundTrip) {
  transport_->enqueue(ok(completions_tool_calls({{"call_1", "read", R"({"path":"a.txt"})"}})));
  transport_->enqueue(ok(completions_text("The file says hi.")));

  auto state = conversation("completions");
  std::vector<std::string> started;
  std::vector<std::string> finished;
  TurnObserver observer;
  observer.on_tool_start = [&started](const ToolCallPart& call) { started.push_back(call.id); };
  observer.on_tool_finish = [&finished](const ToolCallPart& call, const ToolOutcome& outcome) {
    if (outcome.ok()) finished.push_back(call.id);
  };

  auto result = run(state, observer);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.steps, 2);
  EXPECT_EQ(read_calls_.load(), 1);
  EXPECT_EQ(started, std::vector<std::string>{"call_1"});
  EXPECT_EQ(finished, std::vector<std::string>{"call_1"});

  ASSERT_EQ(result.appended.size(), 3u);
  ASSERT_EQ(result.appended[0].tool_calls().size(), 1u);
  EXPECT_EQ(result.appended[0].tool_calls()[0]->arguments["path"], "a.txt");
  EXPECT_EQ(result.appended[0].finish_reason(), FinishReason::ToolCalls);
  ASSERT_EQ(result.appended[1].tool_results().size(), 1u);
  EXPECT_EQ(result.appended[1].tool_results()[0]->output, "contents of a.txt");
  EXPECT_FALSE(result.appended[1].tool_results()[0]->is_error);
  EXPECT_EQ(result.appended[2].text(), "The file says hi.");

  // Usage summed over both steps
  EXPECT_EQ(result.usage.input_tokens, 20);

  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 2u);
  auto second = json::parse(requests[1].options.body);
  auto messages = second["messages"];
  EXPECT_EQ(messages.back()["role"], "tool");
  EXPECT_EQ(messages.back()["tool_call_id"], "call_1");
  EXPECT_EQ(metrics_->count("tool_executed"), 1u);
}

TEST_F(AgentLoopTest, SeveralToolResultsShareOneMessage) {
  transport_->enqueue(ok(completions_tool_calls({{"call_a", "read", R"({"path":"a"})"}, {"call_b", "read", R"({"path":"b"})"}})));
  transport_->enqueue(ok(completions_text("done")));

  auto state = conversation("completions");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(read_calls_.load(), 2);
  ASSERT_EQ(result.appended.size(), 3u);
  auto results = result.appended[1].tool_results();
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0]->tool_call_id, "call_a");
  EXPECT_EQ(results[1]->tool_call_id, "call_b");
}

TEST_F(AgentLoopTest, ShapeMismatchFallsBackOnce) {
  transport_->enqueue(test::ScriptedResponse::http_error(404, R"({"error":{"message":"Not Found"}})"));
  transport_->enqueue(ok(completions_text("fallback worked")));

  auto state = conversation("responses");
  int resets = 0;
  TurnObserver observer;
  observer.on_attempt_reset = [&resets](const Error& error) {
    EXPECT_EQ(error.kind, ErrorKind::ShapeMismatch);
    resets++;
  };

  auto result = run(state, observer);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.fallback_hops, 1);
  EXPECT_EQ(result.retries, 0);
  EXPECT_EQ(resets, 1);
  EXPECT_EQ(result.appended.back().text(), "fallback worked");

  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].url, "http://llm.test/v1/responses");
  EXPECT_EQ(requests[1].url, "http://llm.test/v1/chat/completions");
  EXPECT_EQ(metrics_->count("fallback_hop"), 1u);
  EXPECT_EQ(metrics_->last_turn().fallback_hops, 1);
}

TEST_F(AgentLoopTest, SecondShapeMismatchIsFatal) {
  transport_->enqueue(test::ScriptedResponse::http_error(404));
  transport_->enqueue(test::ScriptedResponse::http_error(404));
  transport_->enqueue(ok(completions_text("never reached")));

  auto state = conversation("responses");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ErrorKind::ShapeMismatch);
  EXPECT_EQ(result.fallback_hops, 1);
  EXPECT_EQ(transport_->requests().size(), 2u);
  EXPECT_EQ(result.finish_reason, FinishReason::Error);
}

TEST_F(AgentLoopTest, ShapeMismatchWithoutAlternativeIsFatal) {
  transport_->enqueue(test::ScriptedResponse::http_error(404));

  auto state = conversation("claude");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.error->kind, ErrorKind::ShapeMismatch);
  EXPECT_EQ(result.fallback_hops, 0);
  EXPECT_EQ(transport_->requests().size(), 1u);
}

TEST_F(AgentLoopTest, TransientErrorsAreRetried) {
  transport_->enqueue(test::ScriptedResponse::http_error(503));
  transport_->enqueue(test::ScriptedResponse::connection_refused());
  transport_->enqueue(test::ScriptedResponse::http_error(502));
  transport_->enqueue(ok(completions_text("finally")));

  auto state = conversation("completions");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.retries, 3);
  EXPECT_EQ(result.fallback_hops, 0);
  EXPECT_EQ(transport_->requests().size(), 4u);
  EXPECT_EQ(metrics_->count("retry_scheduled"), 3u);
  EXPECT_EQ(metrics_->count("attempt_failed"), 3u);
}

TEST_F(AgentLoopTest, RetriesNeverExceedCeiling) {
  for (int i = 0; i < 10; ++i) {
    transport_->enqueue(test::ScriptedResponse::http_error(503));
  }

  auto state = conversation("completions");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.error->kind, ErrorKind::NetworkError);
  EXPECT_EQ(result.retries, config_->retry.max_attempts - 1);
  EXPECT_EQ(transport_->requests().size(), static_cast<size_t>(config_->retry.max_attempts));
  EXPECT_TRUE(result.appended.empty());
}

TEST_F(AgentLoopTest, FallbackHopDoesNotConsumeRetry) {
  config_->retry.max_attempts = 2;
  transport_->enqueue(test::ScriptedResponse::http_error(404));
  transport_->enqueue(test::ScriptedResponse::http_error(500));
  transport_->enqueue(ok(completions_text("ok")));

  auto state = conversation("responses");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.fallback_hops, 1);
  EXPECT_EQ(result.retries, 1);

  // The retry stays on the fallback shape
  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[2].url, "http://llm.test/v1/chat/completions");
}

TEST_F(AgentLoopTest, RetryAfterHintIsHonored) {
  transport_->enqueue(test::ScriptedResponse::http_error(429, "", {{"retry-after-ms", "40"}}));
  transport_->enqueue(ok(completions_text("ok")));

  auto state = conversation("completions");
  auto started = std::chrono::steady_clock::now();
  auto result = run(state);
  auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.retries, 1);
  EXPECT_GE(elapsed, 35ms);
}

TEST_F(AgentLoopTest, FatalErrorsAreNotRetried) {
  transport_->enqueue(test::ScriptedResponse::http_error(401, R"({"error":{"message":"bad key"}})"));
  transport_->enqueue(ok(completions_text("never")));

  auto state = conversation("completions");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.error->kind, ErrorKind::AuthError);
  EXPECT_EQ(result.error->message, "bad key");
  EXPECT_EQ(transport_->requests().size(), 1u);
}

TEST_F(AgentLoopTest, PartialAttemptIsDiscardedOnRetry) {
  auto broken = test::ScriptedResponse::ok({sse(R"({"choices":[{"delta":{"content":"half an ans"}}]})")});
  broken.transport_error = "Read failed: connection reset by peer";
  transport_->enqueue(broken);
  transport_->enqueue(ok(completions_text("whole answer")));

  auto state = conversation("completions");
  std::string streamed;
  TurnObserver observer;
  observer.on_event = [&streamed](const llm::CanonicalEvent& e) {
    if (auto* t = std::get_if<llm::TextDelta>(&e)) streamed += t->text;
  };
  observer.on_attempt_reset = [&streamed](const Error& error) {
    EXPECT_EQ(error.kind, ErrorKind::NetworkError);
    streamed.clear();
  };

  auto result = run(state, observer);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.retries, 1);
  EXPECT_EQ(streamed, "whole answer");
  EXPECT_EQ(result.appended.back().text(), "whole answer");
}

TEST_F(AgentLoopTest, OpenToolCallAtFinishIsMalformed) {
  auto body = sse(R"({"type":"content_block_start","index":0,"content_block":{"type":"tool_use","id":"toolu_1","name":"read","input":{}}})") +
              sse(R"({"type":"message_delta","delta":{"stop_reason":"tool_use"}})") + sse(R"({"type":"message_stop"})");
  transport_->enqueue(ok(body));

  auto state = conversation("claude");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.error->kind, ErrorKind::MalformedStream);
  EXPECT_EQ(read_calls_.load(), 0);
  EXPECT_EQ(transport_->requests().size(), 1u);
}

TEST_F(AgentLoopTest, ToolCallOpenedTwiceIsMalformed) {
  auto body = sse(R"({"type":"content_block_start","index":0,"content_block":{"type":"tool_use","id":"toolu_1","name":"read","input":{}}})") +
              sse(R"({"type":"content_block_delta","index":0,"delta":{"type":"input_json_delta","partial_json":"{\"path\":\"a\"}"}})") +
              sse(R"({"type":"content_block_stop","index":0})") +
              sse(R"({"type":"content_block_start","index":1,"content_block":{"type":"tool_use","id":"toolu_1","name":"read","input":{}}})") +
              sse(R"({"type":"content_block_stop","index":1})") + sse(R"({"type":"message_delta","delta":{"stop_reason":"tool_use"}})") +
              sse(R"({"type":"message_stop"})");
  transport_->enqueue(ok(body));

  auto state = conversation("claude");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.error->kind, ErrorKind::MalformedStream);
  EXPECT_NE(result.error->message.find("opened twice"), std::string::npos);
  EXPECT_EQ(read_calls_.load(), 0);
  EXPECT_EQ(transport_->requests().size(), 1u);
}

TEST_F(AgentLoopTest, ArgumentFragmentAfterCloseIsMalformed) {
  auto body = sse(R"({"type":"response.output_item.added","output_index":0,"item":{"type":"function_call","id":"fc_1","call_id":"call_1","name":"read","arguments":""}})") +
              sse(R"({"type":"response.output_item.done","output_index":0,"item":{"type":"function_call","id":"fc_1","call_id":"call_1","name":"read","arguments":"{\"path\":\"a\"}"}})") +
              sse(R"({"type":"response.function_call_arguments.delta","output_index":0,"item_id":"fc_1","delta":"}"})") +
              sse(R"({"type":"response.completed","response":{"usage":{"input_tokens":7,"output_tokens":3}}})");
  transport_->enqueue(ok(body));

  auto state = conversation("responses");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.error->kind, ErrorKind::MalformedStream);
  EXPECT_NE(result.error->message.find("not open"), std::string::npos);
  EXPECT_EQ(read_calls_.load(), 0);
  EXPECT_EQ(transport_->requests().size(), 1u);
}

TEST_F(AgentLoopTest, NullUsageFieldsStillComplete) {
  auto body = sse(R"({"type":"message_start","message":{"usage":{"input_tokens":9,"cache_creation_input_tokens":null,"cache_read_input_tokens":null}}})") +
              sse(R"({"type":"content_block_start","index":0,"content_block":{"type":"text","text":""}})") +
              sse(R"({"type":"content_block_delta","index":0,"delta":{"type":"text_delta","text":"fine"}})") +
              sse(R"({"type":"content_block_stop","index":0})") + sse(R"({"type":"message_delta","delta":{"stop_reason":"end_turn"},"usage":null})") +
              sse(R"({"type":"message_stop"})");
  transport_->enqueue(ok(body));

  auto state = conversation("claude");
  TurnResult result;
  EXPECT_NO_THROW(result = run(state));

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.appended[0].text(), "fine");
  EXPECT_EQ(result.usage.input_tokens, 9);
  EXPECT_EQ(result.usage.cache_write_tokens, 0);
}

TEST_F(AgentLoopTest, InvalidUtf8IsReplacedInRequestBody) {
  transport_->enqueue(ok(completions_text("ok")));

  auto state = conversation("completions", "ab\xff\xfe");
  state.system_prompt = "terse\xc3";
  TurnResult result;
  EXPECT_NO_THROW(result = run(state));

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 1u);
  auto body = json::parse(requests[0].options.body);
  const std::string replacement = "\xef\xbf\xbd";
  EXPECT_EQ(body["messages"][0]["content"].get<std::string>().rfind("terse" + replacement, 0), 0u);
  EXPECT_EQ(body["messages"][1]["content"].get<std::string>().rfind("ab" + replacement, 0), 0u);
}

TEST_F(AgentLoopTest, SignedThinkingIsSentBackWithToolResults) {
  auto first = sse(R"({"type":"message_start","message":{"usage":{"input_tokens":12,"output_tokens":1}}})") +
               sse(R"({"type":"content_block_start","index":0,"content_block":{"type":"thinking","thinking":""}})") +
               sse(R"({"type":"content_block_delta","index":0,"delta":{"type":"thinking_delta","thinking":"Need the file."}})") +
               sse(R"({"type":"content_block_delta","index":0,"delta":{"type":"signature_delta","signature":"sig-1"}})") +
               sse(R"({"type":"content_block_stop","index":0})") +
               sse(R"({"type":"content_block_start","index":1,"content_block":{"type":"tool_use","id":"toolu_1","name":"read","input":{}}})") +
               sse(R"({"type":"content_block_delta","index":1,"delta":{"type":"input_json_delta","partial_json":"{\"path\":\"a.txt\"}"}})") +
               sse(R"({"type":"content_block_stop","index":1})") + sse(R"({"type":"message_delta","delta":{"stop_reason":"tool_use"}})") +
               sse(R"({"type":"message_stop"})");
  transport_->enqueue(ok(first));
  transport_->enqueue(ok(anthropic_text("It says hi.")));

  auto state = conversation("claude");
  state.settings.reasoning = ThinkingLevel::Medium;
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(read_calls_.load(), 1);
  ASSERT_TRUE(std::holds_alternative<ReasoningPart>(result.appended[0].parts()[0]));
  EXPECT_EQ(std::get<ReasoningPart>(result.appended[0].parts()[0]).signature, "sig-1");

  auto requests = transport_->requests();
  ASSERT_EQ(requests.size(), 2u);
  auto second = json::parse(requests[1].options.body);
  const auto& assistant = second["messages"][1];
  EXPECT_EQ(assistant["role"], "assistant");
  ASSERT_EQ(assistant["content"].size(), 2u);
  EXPECT_EQ(assistant["content"][0], json({{"type", "thinking"}, {"thinking", "Need the file."}, {"signature", "sig-1"}}));
  EXPECT_EQ(assistant["content"][1]["type"], "tool_use");
  EXPECT_EQ(assistant["content"][1]["input"]["path"], "a.txt");
}

TEST_F(AgentLoopTest, InvalidArgumentsBecomeToolError) {
  transport_->enqueue(ok(completions_tool_calls({{"call_1", "read", R"({"path": "a.t)"}})));
  transport_->enqueue(ok(completions_text("sorry")));

  auto state = conversation("completions");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(read_calls_.load(), 0);
  auto results = result.appended[1].tool_results();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0]->is_error);
  EXPECT_NE(results[0]->output.find("Invalid arguments"), std::string::npos);
}

TEST_F(AgentLoopTest, ToolExceptionBecomesErrorResult) {
  transport_->enqueue(ok(completions_tool_calls({{"call_1", "read", R"({"path":"a.txt"})"}})));
  transport_->enqueue(ok(completions_text("the tool broke")));

  auto state = conversation("completions");
  AbortSignal abort;
  auto result = make_loop(std::make_shared<ThrowingExecutor>())->run_turn(state, {}, abort);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  auto results = result.appended[1].tool_results();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0]->is_error);
  EXPECT_NE(results[0]->output.find("sandbox crashed"), std::string::npos);
}

TEST_F(AgentLoopTest, FatalToolErrorFailsTurn) {
  tools_->register_tool(std::make_shared<FunctionTool>("deploy", "Deploy", std::vector<ParameterSchema>{},
                                                       [](const json&) { return ToolOutcome::failure("credentials revoked", true); }));
  transport_->enqueue(ok(completions_tool_calls({{"call_1", "deploy", "{}"}, {"call_2", "read", R"({"path":"a"})"}})));

  auto state = conversation("completions");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.error->kind, ErrorKind::ToolExecutionError);
  EXPECT_EQ(read_calls_.load(), 0);
  // Every call still gets a result
  EXPECT_EQ(result.appended.back().tool_results().size(), 2u);
}

TEST_F(AgentLoopTest, StepLimitFailsTurn) {
  config_->max_steps = 2;
  for (int i = 0; i < 3; ++i) {
    transport_->enqueue(ok(completions_tool_calls({{"call_" + std::to_string(i), "read", R"({"path":"loop"})"}})));
  }

  auto state = conversation("completions");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.steps, 2);
  EXPECT_EQ(read_calls_.load(), 2);
  EXPECT_EQ(transport_->requests().size(), 2u);
}

TEST_F(AgentLoopTest, RoutingErrorFailsBeforeNetwork) {
  auto state = conversation("nobody");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Failed);
  EXPECT_EQ(result.error->kind, ErrorKind::ConfigError);
  EXPECT_TRUE(transport_->requests().empty());
}

TEST_F(AgentLoopTest, AbortMidStreamCancelsOpenCalls) {
  auto hanging = test::ScriptedResponse::ok(
      {sse(R"({"type":"message_start","message":{"usage":{"input_tokens":12,"output_tokens":1}}})"),
       sse(R"({"type":"content_block_start","index":0,"content_block":{"type":"text","text":""}})"),
       sse(R"({"type":"content_block_delta","index":0,"delta":{"type":"text_delta","text":"Reading now"}})"),
       sse(R"({"type":"content_block_stop","index":0})"),
       sse(R"({"type":"content_block_start","index":1,"content_block":{"type":"tool_use","id":"toolu_1","name":"read","input":{}}})"),
       sse(R"({"type":"content_block_delta","index":1,"delta":{"type":"input_json_delta","partial_json":"{\"path\":"}})")});
  hanging.hang = true;
  transport_->enqueue(hanging);

  std::promise<void> opened;
  std::atomic<bool> signalled{false};
  TurnObserver observer;
  observer.on_event = [&opened, &signalled](const llm::CanonicalEvent& e) {
    if (std::holds_alternative<llm::ToolCallArgDelta>(e) && !signalled.exchange(true)) opened.set_value();
  };

  auto loop = make_loop();
  auto handle = loop->begin_turn(conversation("claude"), observer);
  ASSERT_EQ(opened.get_future().wait_for(5s), std::future_status::ready);
  handle.abort();
  handle.abort();

  const auto& result = handle.wait();
  EXPECT_TRUE(handle.done());
  EXPECT_EQ(result.outcome, TurnOutcome::Aborted);
  EXPECT_EQ(result.finish_reason, FinishReason::Cancelled);
  EXPECT_EQ(result.cancelled_tool_calls, std::vector<std::string>{"toolu_1"});
  EXPECT_EQ(read_calls_.load(), 0);

  ASSERT_EQ(result.appended.size(), 1u);
  EXPECT_EQ(result.appended[0].text(), "Reading now");
  EXPECT_EQ(result.appended[0].finish_reason(), FinishReason::Cancelled);
  EXPECT_TRUE(result.appended[0].tool_calls().empty());
  EXPECT_EQ(handle.conversation().messages.size(), 2u);
}

TEST_F(AgentLoopTest, AbortDuringBackoff) {
  config_->retry.initial_backoff = 10s;
  config_->retry.max_backoff = 10s;
  transport_->enqueue(test::ScriptedResponse::http_error(503));

  std::promise<void> failed;
  TurnObserver observer;
  observer.on_attempt_reset = [&failed](const Error&) { failed.set_value(); };

  auto loop = make_loop();
  auto handle = loop->begin_turn(conversation("completions"), observer);
  ASSERT_EQ(failed.get_future().wait_for(5s), std::future_status::ready);

  auto started = std::chrono::steady_clock::now();
  handle.abort();
  const auto& result = handle.wait();

  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
  EXPECT_EQ(result.outcome, TurnOutcome::Aborted);
  EXPECT_EQ(transport_->requests().size(), 1u);
  EXPECT_TRUE(result.appended.empty());
}

TEST_F(AgentLoopTest, AbortDuringToolDispatchSkipsRemainingCalls) {
  AbortSignal abort;
  tools_->register_tool(std::make_shared<FunctionTool>("stop", "Requests an abort", std::vector<ParameterSchema>{}, [&abort](const json&) {
    abort.trigger();
    return ToolOutcome::success("stopping");
  }));
  transport_->enqueue(ok(completions_tool_calls({{"call_1", "stop", "{}"}, {"call_2", "read", R"({"path":"a"})"}})));

  auto state = conversation("completions");
  auto result = make_loop()->run_turn(state, {}, abort);

  EXPECT_EQ(result.outcome, TurnOutcome::Aborted);
  EXPECT_EQ(read_calls_.load(), 0);
  EXPECT_EQ(result.cancelled_tool_calls, std::vector<std::string>{"call_2"});

  auto results = result.appended.back().tool_results();
  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0]->output, "stopping");
  EXPECT_EQ(results[1]->output, "Skipped due to abort signal.");
  EXPECT_TRUE(results[1]->is_error);
}

TEST_F(AgentLoopTest, AbortAfterCompletionIsNoOp) {
  transport_->enqueue(ok(completions_text("done")));

  auto loop = make_loop();
  auto handle = loop->begin_turn(conversation("completions"));
  const auto& result = handle.wait();
  handle.abort();

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(handle.wait().outcome, TurnOutcome::Completed);
}

TEST_F(AgentLoopTest, WildcardRoutesByWeight) {
  config_->providers["completions"].weight = 1;
  config_->providers["responses"].weight = 0;
  config_->providers["claude"].weight = 0;
  transport_->enqueue(ok(completions_text("picked")));

  auto state = conversation("*");
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(transport_->requests()[0].url, "http://llm.test/v1/chat/completions");
}

TEST_F(AgentLoopTest, ResponsesShapeEndToEnd) {
  transport_->enqueue(ok(responses_text("via responses")));

  auto state = conversation("responses");
  state.settings.reasoning = ThinkingLevel::Medium;
  auto result = run(state);

  EXPECT_EQ(result.outcome, TurnOutcome::Completed);
  EXPECT_EQ(result.appended[0].text(), "via responses");
  auto body = json::parse(transport_->requests()[0].options.body);
  EXPECT_EQ(body["reasoning"]["effort"], "medium");
  EXPECT_EQ(body["model"], "responses-model");
}

// --- ToolCallAssemblerTest ---

TEST(ToolCallAssemblerTest, AssemblesFragments) {
  ToolCallAssembler assembler;
  EXPECT_FALSE(assembler.apply(llm::ToolCallOpen{"call_1", "read"}));
  EXPECT_FALSE(assembler.apply(llm::ToolCallArgDelta{"call_1", "{\"path\":"}));
  EXPECT_FALSE(assembler.apply(llm::ToolCallArgDelta{"call_1", "\"a.txt\"}"}));
  EXPECT_FALSE(assembler.apply(llm::ToolCallOpen{"call_2", "read"}));
  EXPECT_FALSE(assembler.apply(llm::ToolCallArgDelta{"call_2", "[1]"}));
  EXPECT_FALSE(assembler.apply(llm::ToolCallClose{"call_2"}));
  EXPECT_FALSE(assembler.apply(llm::ToolCallClose{"call_1"}));
  EXPECT_FALSE(assembler.apply(llm::Finish{FinishReason::ToolCalls}));

  auto calls = assembler.take_calls();
  ASSERT_EQ(calls.size(), 2u);
  EXPECT_EQ(calls[0].arguments["path"], "a.txt");
  EXPECT_TRUE(calls[0].args_valid);
  EXPECT_FALSE(calls[1].args_valid);
  EXPECT_EQ(calls[1].arguments, json::object());
}

TEST(ToolCallAssemblerTest, OpenedTwice) {
  ToolCallAssembler assembler;
  EXPECT_FALSE(assembler.apply(llm::ToolCallOpen{"call_1", "read"}));
  auto error = assembler.apply(llm::ToolCallOpen{"call_1", "read"});
  ASSERT_TRUE(error);
  EXPECT_EQ(error->kind, ErrorKind::MalformedStream);
}

TEST(ToolCallAssemblerTest, DeltaForUnknownOrClosedCall) {
  ToolCallAssembler assembler;
  auto unknown = assembler.apply(llm::ToolCallArgDelta{"call_9", "{}"});
  ASSERT_TRUE(unknown);
  EXPECT_EQ(unknown->kind, ErrorKind::MalformedStream);

  EXPECT_FALSE(assembler.apply(llm::ToolCallOpen{"call_1", "read"}));
  EXPECT_FALSE(assembler.apply(llm::ToolCallClose{"call_1"}));
  auto closed = assembler.apply(llm::ToolCallArgDelta{"call_1", "{}"});
  ASSERT_TRUE(closed);
  EXPECT_EQ(closed->kind, ErrorKind::MalformedStream);
}

TEST(ToolCallAssemblerTest, CloseForUnknownOrClosedCall) {
  ToolCallAssembler assembler;
  auto unknown = assembler.apply(llm::ToolCallClose{"call_9"});
  ASSERT_TRUE(unknown);
  EXPECT_EQ(unknown->kind, ErrorKind::MalformedStream);

  EXPECT_FALSE(assembler.apply(llm::ToolCallOpen{"call_1", "read"}));
  EXPECT_FALSE(assembler.apply(llm::ToolCallClose{"call_1"}));
  auto twice = assembler.apply(llm::ToolCallClose{"call_1"});
  ASSERT_TRUE(twice);
  EXPECT_EQ(twice->kind, ErrorKind::MalformedStream);
}

TEST(ToolCallAssemblerTest, OpenCallAtFinish) {
  ToolCallAssembler assembler;
  EXPECT_FALSE(assembler.apply(llm::ToolCallOpen{"call_1", "read"}));
  EXPECT_FALSE(assembler.apply(llm::TextDelta{"still typing"}));
  auto error = assembler.apply(llm::Finish{FinishReason::ToolCalls});
  ASSERT_TRUE(error);
  EXPECT_EQ(error->kind, ErrorKind::MalformedStream);
  EXPECT_NE(error->message.find("call_1"), std::string::npos);
}
