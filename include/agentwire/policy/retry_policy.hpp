#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <random>
#include <string>

#include "agentwire/core/config.hpp"
#include "agentwire/core/error.hpp"

namespace agentwire {

enum class ErrorClass {
  Transient,      // retry after a backoff
  ShapeMismatch,  // one router fallback hop
  Fatal,          // surface immediately
};

ErrorClass classify(const Error& error);

// Bounded exponential backoff with symmetric jitter
struct BackoffSchedule {
  std::chrono::milliseconds initial{200};
  std::chrono::milliseconds max{2000};
  double multiplier = 2.0;
  double jitter = 0.2;
  std::chrono::milliseconds max_hint{60000};  // cap for Retry-After style hints

  static BackoffSchedule from(const RetrySettings& settings);

  // Delay before retry number `retry` (0-based), without jitter
  std::chrono::milliseconds base_delay(int retry) const;

  // Delay before retry number `retry`; a provider hint on `error` wins, capped by max_hint
  std::chrono::milliseconds delay(int retry, const Error& error, std::mt19937_64& rng) const;

  // Largest value delay() can return without a hint
  std::chrono::milliseconds upper_bound() const;
};

// api shape -> the shape to try once when an endpoint reports ShapeMismatch
class FallbackTable {
 public:
  FallbackTable();

  void set(const std::string& from, const std::string& to);

  // Profile fallback_api wins over the table; nullopt when there is nothing to try
  std::optional<std::string> fallback_for(const ProviderProfile& profile, const std::string& api) const;

 private:
  std::map<std::string, std::string> table_;
};

struct RetryPolicy {
  int max_attempts = 4;  // total attempts, first one included; fallback hops are not counted
  BackoffSchedule backoff;

  static RetryPolicy from(const RetrySettings& settings);
};

}  // namespace agentwire
