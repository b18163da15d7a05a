#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>

#include "agentwire/core/error.hpp"
#include "agentwire/core/types.hpp"

namespace agentwire::metrics {

struct AttemptStarted {
  std::string turn_id;
  std::string provider;
  std::string api;
  std::string model;
  int attempt = 0;  // 1-based within the turn step
};

struct AttemptFailed {
  std::string turn_id;
  std::string provider;
  std::string api;
  ErrorKind kind = ErrorKind::NetworkError;
  std::string message;
  std::chrono::milliseconds latency{0};
};

struct RetryScheduled {
  std::string turn_id;
  int retry = 0;
  std::chrono::milliseconds delay{0};
  ErrorKind kind = ErrorKind::NetworkError;
};

struct FallbackHop {
  std::string turn_id;
  std::string provider;
  std::string from_api;
  std::string to_api;
};

struct RequestCompleted {
  std::string turn_id;
  std::string provider;
  std::string api;
  std::string model;
  FinishReason finish = FinishReason::Stop;
  TokenUsage usage;
  std::chrono::milliseconds latency{0};
};

struct ToolExecuted {
  std::string turn_id;
  std::string tool;
  bool success = true;
  std::chrono::milliseconds duration{0};
};

struct TurnFinished {
  std::string turn_id;
  std::string outcome;  // completed | aborted | failed
  int steps = 0;
  int retries = 0;
  int fallback_hops = 0;
  TokenUsage usage;
  std::chrono::milliseconds latency{0};
};

using MetricsEvent = std::variant<AttemptStarted, AttemptFailed, RetryScheduled, FallbackHop, RequestCompleted, ToolExecuted, TurnFinished>;

std::string event_name(const MetricsEvent& event);

// Consumer of metrics events. emit() must not block the caller for long.
class MetricsSink {
 public:
  virtual ~MetricsSink() = default;

  virtual void emit(const MetricsEvent& event) = 0;
};

class NullMetricsSink : public MetricsSink {
 public:
  void emit(const MetricsEvent&) override {}
};

// Writes every event to the default spdlog logger at debug level
class LogMetricsSink : public MetricsSink {
 public:
  void emit(const MetricsEvent& event) override;
};

/**
 * Non-blocking front for a slower sink.
 *
 * Events are queued and delivered to `downstream` on a background thread.
 * When the queue holds `capacity` events the oldest one is dropped and
 * counted. Destruction delivers what is still queued.
 */
class AsyncMetricsEmitter : public MetricsSink {
 public:
  AsyncMetricsEmitter(std::shared_ptr<MetricsSink> downstream, size_t capacity);
  ~AsyncMetricsEmitter() override;

  AsyncMetricsEmitter(const AsyncMetricsEmitter&) = delete;
  AsyncMetricsEmitter& operator=(const AsyncMetricsEmitter&) = delete;

  void emit(const MetricsEvent& event) override;

  // Blocks until everything queued so far was handed to the downstream sink
  void flush();

  uint64_t dropped() const {
    return dropped_.load();
  }

  size_t capacity() const {
    return capacity_;
  }

 private:
  void run();

  std::shared_ptr<MetricsSink> downstream_;
  size_t capacity_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<MetricsEvent> queue_;
  bool delivering_ = false;
  bool stop_ = false;
  std::atomic<uint64_t> dropped_{0};

  std::thread worker_;
};

}  // namespace agentwire::metrics
