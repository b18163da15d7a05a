#include <asio.hpp>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "agentwire/agent/agent_loop.hpp"
#include "agentwire/log/log.h"
#include "agentwire/net/http_client.hpp"
#include "spdlog/cfg/env.h"

using namespace agentwire;

static std::atomic<bool> g_interrupted{false};

static void sigint_handler(int) {
  g_interrupted.store(true);
}

// Read-only file tool so the model has something to call
static std::shared_ptr<Tool> make_read_file_tool() {
  return std::make_shared<FunctionTool>(
      "read_file", "Read a UTF-8 text file from the working directory",
      std::vector<ParameterSchema>{{"path", "string", "Relative path of the file", true, std::nullopt, std::nullopt}}, [](const json& args) {
        std::filesystem::path path = args["path"].get<std::string>();
        std::ifstream in(path);
        if (!in) {
          return ToolOutcome::failure("Cannot open " + path.string());
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        auto content = ss.str();
        if (content.size() > 20000) {
          content = content.substr(0, 20000) + "\n... (truncated)";
        }
        return ToolOutcome::success(content);
      });
}

static void print_usage(const TurnResult& result) {
  std::cout << "\n[" << to_string(result.outcome) << " | steps " << result.steps << " | retries " << result.retries << " | fallback "
            << result.fallback_hops << " | tokens " << result.usage.total() << "]\n";
}

int main(int argc, char* argv[]) {
  std::cout << "agentwire chat\n";
  std::cout << "==============\n\n";

  Config loaded;
  try {
    loaded = Config::from_env();
    loaded.validate();
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  init_log(loaded.log_file ? loaded.log_file->string() : "", 10, loaded.log_level);
  spdlog::cfg::load_env_levels();

  if (loaded.chat_providers().empty()) {
    std::cerr << "Error: No provider configured. Set ANTHROPIC_API_KEY, OPENAI_API_KEY or AWS_BEARER_TOKEN_BEDROCK\n";
    return 1;
  }

  auto config = std::make_shared<const Config>(std::move(loaded));
  std::string target = argc > 1 ? argv[1] : config->default_provider;

  asio::io_context io_ctx;
  auto work = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx]() {
    io_ctx.run();
  });

  auto tools = std::make_shared<ToolRegistry>();
  tools->register_tool(make_read_file_tool());

  auto emitter = std::make_shared<metrics::AsyncMetricsEmitter>(std::make_shared<metrics::LogMetricsSink>(), config->metrics_queue_capacity);
  AgentLoop loop(config, std::make_shared<net::HttpClient>(io_ctx), tools, emitter);

  ConversationState conversation;
  conversation.system_prompt = "You are a helpful assistant. Use read_file when the user asks about a file.";
  conversation.tools = tools->declarations();
  conversation.target = llm::RouteTarget::parse(target);

  TurnObserver observer;
  observer.on_event = [](const llm::CanonicalEvent& event) {
    if (auto* text = std::get_if<llm::TextDelta>(&event)) {
      std::cout << text->text << std::flush;
    }
  };
  observer.on_attempt_reset = [](const Error& error) {
    std::cout << "\n[Retrying: " << error.describe() << "]\n";
  };
  observer.on_tool_start = [](const ToolCallPart& call) {
    std::cout << "\n[Calling tool: " << call.name << " " << call.arguments.dump() << "]\n";
  };
  observer.on_tool_finish = [](const ToolCallPart& call, const ToolOutcome& outcome) {
    std::cout << "[Tool " << call.name << " " << (outcome.ok() ? "completed" : "failed") << "]\n";
  };

  std::signal(SIGINT, sigint_handler);

  std::cout << "Target: " << (target.empty() ? "(default)" : target) << "\n";
  std::cout << "Type /q to quit, Ctrl+C to interrupt a reply.\n\n";

  std::string line;
  while (true) {
    std::cout << "> " << std::flush;
    g_interrupted.store(false);
    if (!std::getline(std::cin, line)) {
      break;
    }
    if (line == "/q" || line == "/quit") {
      break;
    }
    if (line.empty()) {
      continue;
    }

    conversation.messages.push_back(Message::user(line));
    auto handle = loop.begin_turn(conversation, observer);
    while (!handle.done()) {
      if (g_interrupted.exchange(false)) {
        handle.abort();
        std::cout << "\n[Interrupted]";
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    const auto& result = handle.wait();
    if (result.error) {
      std::cerr << "\n[Error: " << result.error->describe() << "]";
    }
    print_usage(result);
    conversation = handle.conversation();
    std::cout << "\n";
  }

  emitter->flush();
  work.reset();
  io_ctx.stop();
  io_thread.join();
  return 0;
}
