#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "agentwire/core/config.hpp"
#include "agentwire/policy/retry_policy.hpp"

namespace agentwire::llm {

// What the caller asked for
struct RouteTarget {
  std::string provider;  // name, alias, "*" or empty for the configured default
  std::string model;     // overrides the profile model when set
  std::string api;       // overrides the profile api when set

  // "provider", "provider/model", "alias" or "*"
  static RouteTarget parse(const std::string& text);
};

// Concrete destination of one attempt
struct RoutingDecision {
  ProviderProfile profile;
  std::string api;
  std::string model;
  std::string credential;
  bool is_fallback = false;
};

/**
 * Resolves route targets against an immutable Config.
 * All methods are const and safe to call from several threads.
 * Throws ConfigError for anything that cannot be routed.
 */
class Router {
 public:
  explicit Router(std::shared_ptr<const Config> config, FallbackTable fallbacks = FallbackTable());

  RoutingDecision route(const RouteTarget& target) const;

  // Same as route(), with the wildcard draw supplied by the caller
  RoutingDecision route(const RouteTarget& target, uint64_t draw) const;

  // Same profile with its fallback api shape, nullopt when none applies or
  // `decision` already is a fallback
  std::optional<RoutingDecision> fallback(const RoutingDecision& decision) const;

  // Re-resolve `decision` for a retry: fresh credential, same profile and api
  RoutingDecision refresh(const RoutingDecision& decision) const;

  // Cumulative-weight pick over chat profiles sorted by name
  const ProviderProfile& select_weighted(uint64_t draw) const;

  // "$NAME" against the config env overlay, then the process environment
  std::string resolve_credential(const std::string& reference) const;

  uint64_t total_weight() const {
    return total_weight_;
  }

  const Config& config() const {
    return *config_;
  }

 private:
  RoutingDecision decide(const ProviderProfile& profile, const std::string& model, const std::string& api) const;
  RouteTarget expand(const RouteTarget& target) const;

  std::shared_ptr<const Config> config_;
  FallbackTable fallbacks_;
  std::vector<const ProviderProfile*> weighted_;
  uint64_t total_weight_ = 0;
};

}  // namespace agentwire::llm
