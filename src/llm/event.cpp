#include "agentwire/llm/event.hpp"

#include <spdlog/spdlog.h>

#include "agentwire/llm/decoder.hpp"

namespace agentwire::llm {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

bool is_terminal(const CanonicalEvent& event) {
  return std::holds_alternative<Finish>(event) || std::holds_alternative<StreamError>(event);
}

std::string describe(const CanonicalEvent& event) {
  return std::visit(overloaded{
                        [](const TextDelta& e) { return "text(" + std::to_string(e.text.size()) + ")"; },
                        [](const ReasoningDelta& e) { return "reasoning(" + std::to_string(e.text.size()) + ")"; },
                        [](const ToolCallOpen& e) { return "tool_open(" + e.id + ", " + e.name + ")"; },
                        [](const ToolCallArgDelta& e) { return "tool_args(" + e.id + ", " + std::to_string(e.fragment.size()) + ")"; },
                        [](const ToolCallClose& e) { return "tool_close(" + e.id + ")"; },
                        [](const Usage& e) {
                          return "usage(in=" + std::to_string(e.usage.input_tokens) + ", out=" + std::to_string(e.usage.output_tokens) + ")";
                        },
                        [](const Finish& e) { return "finish(" + to_string(e.reason) + ")"; },
                        [](const StreamError& e) { return "error(" + e.error.describe() + ")"; },
                    },
                    event);
}

void EventStream::push(CanonicalEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return;
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

void EventStream::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

EventStream::WaitStatus EventStream::next(CanonicalEvent& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
    return WaitStatus::Timeout;
  }
  if (queue_.empty()) {
    return WaitStatus::Closed;
  }
  out = std::move(queue_.front());
  queue_.pop_front();
  return WaitStatus::Event;
}

bool EventStream::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void StreamDecoder::payload_failed(const char* protocol, const nlohmann::json::exception& e) {
  spdlog::warn("Unexpected {} payload shape: {}", protocol, e.what());
  fail(Error::malformed(std::string("unexpected ") + protocol + " payload: " + e.what()));
}

}  // namespace agentwire::llm
