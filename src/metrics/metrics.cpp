#include "agentwire/metrics/metrics.hpp"

#include <spdlog/spdlog.h>

namespace agentwire::metrics {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string event_name(const MetricsEvent& event) {
  return std::visit(overloaded{
                        [](const AttemptStarted&) { return std::string("attempt_started"); },
                        [](const AttemptFailed&) { return std::string("attempt_failed"); },
                        [](const RetryScheduled&) { return std::string("retry_scheduled"); },
                        [](const FallbackHop&) { return std::string("fallback_hop"); },
                        [](const RequestCompleted&) { return std::string("request_completed"); },
                        [](const ToolExecuted&) { return std::string("tool_executed"); },
                        [](const TurnFinished&) { return std::string("turn_finished"); },
                    },
                    event);
}

void LogMetricsSink::emit(const MetricsEvent& event) {
  std::visit(overloaded{
                 [](const AttemptStarted& e) {
                   spdlog::debug("[metrics] [Turn {}] attempt {} -> {} ({}, {})", e.turn_id, e.attempt, e.provider, e.api, e.model);
                 },
                 [](const AttemptFailed& e) {
                   spdlog::debug("[metrics] [Turn {}] attempt failed on {} ({}): {} {} after {}ms", e.turn_id, e.provider, e.api, to_string(e.kind),
                                 e.message, e.latency.count());
                 },
                 [](const RetryScheduled& e) {
                   spdlog::debug("[metrics] [Turn {}] retry {} in {}ms after {}", e.turn_id, e.retry, e.delay.count(), to_string(e.kind));
                 },
                 [](const FallbackHop& e) {
                   spdlog::debug("[metrics] [Turn {}] fallback on {}: {} -> {}", e.turn_id, e.provider, e.from_api, e.to_api);
                 },
                 [](const RequestCompleted& e) {
                   spdlog::debug("[metrics] [Turn {}] {} {} finished {} in {}ms (in={}, out={})", e.turn_id, e.provider, e.model, to_string(e.finish),
                                 e.latency.count(), e.usage.input_tokens, e.usage.output_tokens);
                 },
                 [](const ToolExecuted& e) {
                   spdlog::debug("[metrics] [Turn {}] tool {} {} in {}ms", e.turn_id, e.tool, e.success ? "ok" : "failed", e.duration.count());
                 },
                 [](const TurnFinished& e) {
                   spdlog::debug("[metrics] [Turn {}] {} after {} steps, {} retries, {} fallback hops, {}ms", e.turn_id, e.outcome, e.steps, e.retries,
                                 e.fallback_hops, e.latency.count());
                 },
             },
             event);
}

AsyncMetricsEmitter::AsyncMetricsEmitter(std::shared_ptr<MetricsSink> downstream, size_t capacity)
    : downstream_(std::move(downstream)), capacity_(capacity == 0 ? 1 : capacity) {
  worker_ = std::thread([this] { run(); });
}

AsyncMetricsEmitter::~AsyncMetricsEmitter() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void AsyncMetricsEmitter::emit(const MetricsEvent& event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      dropped_.fetch_add(1);
    }
    queue_.push_back(event);
  }
  cv_.notify_one();
}

void AsyncMetricsEmitter::flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && !delivering_; });
}

void AsyncMetricsEmitter::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
    if (queue_.empty()) {
      if (stop_) break;
      continue;
    }

    MetricsEvent event = std::move(queue_.front());
    queue_.pop_front();
    delivering_ = true;
    lock.unlock();

    try {
      if (downstream_) downstream_->emit(event);
    } catch (const std::exception& e) {
      spdlog::warn("Metrics sink failed on {}: {}", event_name(event), e.what());
    }

    lock.lock();
    delivering_ = false;
    if (queue_.empty()) {
      idle_cv_.notify_all();
    }
  }
  idle_cv_.notify_all();
}

}  // namespace agentwire::metrics
