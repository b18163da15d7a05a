#include "agentwire/policy/retry_policy.hpp"

#include <algorithm>
#include <cmath>

namespace agentwire {

ErrorClass classify(const Error& error) {
  switch (error.kind) {
    case ErrorKind::NetworkError:
    case ErrorKind::RateLimited:
      return ErrorClass::Transient;
    case ErrorKind::ShapeMismatch:
      return ErrorClass::ShapeMismatch;
    case ErrorKind::AuthError:
    case ErrorKind::ConfigError:
    case ErrorKind::MalformedStream:
    case ErrorKind::ProviderError:
    case ErrorKind::ToolExecutionError:
      return ErrorClass::Fatal;
  }
  return ErrorClass::Fatal;
}

BackoffSchedule BackoffSchedule::from(const RetrySettings& settings) {
  BackoffSchedule schedule;
  schedule.initial = settings.initial_backoff;
  schedule.max = settings.max_backoff;
  schedule.multiplier = settings.multiplier;
  schedule.jitter = settings.jitter;
  schedule.max_hint = settings.max_retry_after;
  return schedule;
}

std::chrono::milliseconds BackoffSchedule::base_delay(int retry) const {
  double value = static_cast<double>(initial.count()) * std::pow(multiplier, std::max(retry, 0));
  value = std::min(value, static_cast<double>(max.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(value));
}

std::chrono::milliseconds BackoffSchedule::delay(int retry, const Error& error, std::mt19937_64& rng) const {
  if (error.retry_after) {
    return std::clamp(*error.retry_after, std::chrono::milliseconds(0), max_hint);
  }

  double base = static_cast<double>(base_delay(retry).count());
  if (jitter <= 0.0) {
    return std::chrono::milliseconds(static_cast<int64_t>(base));
  }
  std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(base * dist(rng))));
}

std::chrono::milliseconds BackoffSchedule::upper_bound() const {
  return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(static_cast<double>(max.count()) * (1.0 + std::max(jitter, 0.0)))));
}

FallbackTable::FallbackTable() {
  table_[api::kOpenAIResponses] = api::kOpenAICompletions;
}

void FallbackTable::set(const std::string& from, const std::string& to) {
  table_[from] = to;
}

std::optional<std::string> FallbackTable::fallback_for(const ProviderProfile& profile, const std::string& api) const {
  std::optional<std::string> target;
  if (profile.fallback_api) {
    target = profile.fallback_api;
  } else if (auto it = table_.find(api); it != table_.end()) {
    target = it->second;
  }
  if (!target || *target == api) {
    return std::nullopt;
  }
  return target;
}

RetryPolicy RetryPolicy::from(const RetrySettings& settings) {
  RetryPolicy policy;
  policy.max_attempts = std::max(settings.max_attempts, 1);
  policy.backoff = BackoffSchedule::from(settings);
  return policy;
}

}  // namespace agentwire
