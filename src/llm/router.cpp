#include "agentwire/llm/router.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <random>
#include <set>

#include "agentwire/core/error.hpp"

namespace agentwire::llm {

namespace {

constexpr int kMaxAliasDepth = 16;

std::string default_model_for(const std::string& api) {
  if (api == api::kAnthropicMessages) return "claude-sonnet-4-20250514";
  if (api == api::kBedrockConverseStream) return "anthropic.claude-3-5-sonnet-20241022-v2:0";
  return "gpt-4o";
}

uint64_t thread_draw() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  return gen();
}

}  // namespace

RouteTarget RouteTarget::parse(const std::string& text) {
  RouteTarget target;
  auto slash = text.find('/');
  if (slash == std::string::npos) {
    target.provider = text;
  } else {
    target.provider = text.substr(0, slash);
    target.model = text.substr(slash + 1);
  }
  return target;
}

Router::Router(std::shared_ptr<const Config> config, FallbackTable fallbacks) : config_(std::move(config)), fallbacks_(std::move(fallbacks)) {
  if (!config_) {
    throw ConfigError("router needs a configuration");
  }
  for (const auto* profile : config_->chat_providers()) {
    weighted_.push_back(profile);
    total_weight_ += static_cast<uint64_t>(std::max(profile->weight, 0));
  }
}

RoutingDecision Router::route(const RouteTarget& target) const {
  return route(target, thread_draw());
}

RouteTarget Router::expand(const RouteTarget& target) const {
  RouteTarget current = target;
  if (current.provider.empty()) {
    if (!config_->default_provider.empty()) {
      auto fallback_target = RouteTarget::parse(config_->default_provider);
      current.provider = fallback_target.provider;
      if (current.model.empty()) current.model = fallback_target.model;
    } else {
      auto chat = config_->chat_providers();
      if (chat.size() != 1) {
        throw ConfigError(chat.empty() ? "no chat provider configured" : "no provider requested and no default_provider configured");
      }
      current.provider = chat.front()->name;
    }
  }

  std::set<std::string> seen;
  for (int depth = 0; depth < kMaxAliasDepth; ++depth) {
    if (current.provider == "*" || config_->providers.count(current.provider)) {
      return current;
    }
    auto alias = config_->aliases.find(current.provider);
    if (alias == config_->aliases.end()) {
      throw ConfigError("unknown provider or alias '" + current.provider + "'");
    }
    if (!seen.insert(current.provider).second) {
      throw ConfigError("alias cycle through '" + current.provider + "'");
    }
    auto next = RouteTarget::parse(alias->second);
    current.provider = next.provider;
    if (current.model.empty()) current.model = next.model;
  }
  throw ConfigError("alias chain too deep at '" + current.provider + "'");
}

RoutingDecision Router::route(const RouteTarget& target, uint64_t draw) const {
  RouteTarget resolved = expand(target);

  const ProviderProfile* profile = nullptr;
  if (resolved.provider == "*") {
    profile = &select_weighted(draw);
  } else {
    profile = &config_->providers.at(resolved.provider);
    if (!profile->is_chat()) {
      throw ConfigError("provider '" + profile->name + "' is an " + profile->kind + " profile and cannot serve chat requests");
    }
  }

  std::string api = resolved.api.empty() ? profile->api : resolved.api;
  return decide(*profile, resolved.model, api);
}

const ProviderProfile& Router::select_weighted(uint64_t draw) const {
  if (total_weight_ == 0) {
    throw ConfigError("wildcard routing needs at least one chat provider with a non-zero weight");
  }
  uint64_t point = draw % total_weight_;
  uint64_t cumulative = 0;
  for (const auto* profile : weighted_) {
    cumulative += static_cast<uint64_t>(std::max(profile->weight, 0));
    if (point < cumulative) {
      return *profile;
    }
  }
  return *weighted_.back();
}

std::optional<RoutingDecision> Router::fallback(const RoutingDecision& decision) const {
  if (decision.is_fallback) {
    return std::nullopt;
  }
  auto api = fallbacks_.fallback_for(decision.profile, decision.api);
  if (!api) {
    return std::nullopt;
  }
  spdlog::debug("Provider {} does not speak {}, falling back to {}", decision.profile.name, decision.api, *api);
  RoutingDecision next = decide(decision.profile, decision.model, *api);
  next.is_fallback = true;
  return next;
}

RoutingDecision Router::refresh(const RoutingDecision& decision) const {
  RoutingDecision next = decide(decision.profile, decision.model, decision.api);
  next.is_fallback = decision.is_fallback;
  return next;
}

RoutingDecision Router::decide(const ProviderProfile& profile, const std::string& model, const std::string& api) const {
  if (!api::is_known(api)) {
    throw ConfigError("provider '" + profile.name + "' requests unknown api '" + api + "'");
  }

  RoutingDecision decision;
  decision.profile = profile;
  decision.api = api;
  decision.model = !model.empty() ? model : (!profile.model.empty() ? profile.model : default_model_for(api));
  decision.credential = resolve_credential(profile.api_key);
  return decision;
}

std::string Router::resolve_credential(const std::string& reference) const {
  if (reference.empty() || reference.front() != '$') {
    return reference;
  }
  std::string name = reference.substr(1);
  if (name.empty()) {
    throw ConfigError("empty credential reference '$'");
  }
  if (auto it = config_->env.find(name); it != config_->env.end()) {
    return it->second;
  }
  if (const char* value = std::getenv(name.c_str())) {
    return value;
  }
  throw ConfigError("credential variable " + name + " is not set");
}

}  // namespace agentwire::llm
