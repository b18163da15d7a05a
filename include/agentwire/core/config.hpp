#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "agentwire/core/types.hpp"

namespace agentwire {

// One configured backend
struct ProviderProfile {
  std::string name;
  std::string kind = "chat";  // "chat" or "embedding"
  std::string api;            // wire protocol family, see api::
  std::optional<std::string> fallback_api;
  std::string base_url;
  std::string api_key;  // literal, or "$NAME" resolved at route time
  std::string model;
  int weight = 1;  // 0 <= weight < 100, 0 = never picked by "*"
  std::map<std::string, std::string> headers;

  bool is_chat() const {
    return kind == "chat";
  }
};

struct RetrySettings {
  int max_attempts = 4;
  std::chrono::milliseconds initial_backoff{200};
  std::chrono::milliseconds max_backoff{2000};
  double multiplier = 2.0;
  double jitter = 0.2;
  std::chrono::milliseconds max_retry_after{60000};
};

struct TimeoutSettings {
  std::chrono::milliseconds connect{15000};
  std::chrono::milliseconds read_idle{60000};
};

// Application configuration, immutable once handed to Router/AgentLoop
struct Config {
  std::map<std::string, ProviderProfile> providers;

  // Empty, a provider name, an alias, "provider/model" or "*"
  std::string default_provider;

  // Overlay consulted before the process environment for "$NAME" credentials
  std::map<std::string, std::string> env;

  // alias -> target ("provider", "provider/model", "*" or another alias)
  std::map<std::string, std::string> aliases;

  RetrySettings retry;
  TimeoutSettings timeouts;

  size_t metrics_queue_capacity = 1024;
  int max_steps = 50;

  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file; a missing file yields the defaults. Throws ConfigError.
  static Config load(const std::filesystem::path& path);

  // Parse an already decoded document. Throws ConfigError.
  static Config parse(const json& j);

  // Project config first, then global
  static Config load_default();

  // load_default() with provider profiles layered from the environment:
  //   OPENAI_API_KEY, OPENAI_BASE_URL, OPENAI_MODEL
  //   ANTHROPIC_API_KEY / ANTHROPIC_AUTH_TOKEN, ANTHROPIC_BASE_URL, ANTHROPIC_MODEL
  //   AWS_BEARER_TOKEN_BEDROCK, BEDROCK_BASE_URL, BEDROCK_MODEL
  //   AGENTWIRE_PROVIDER overrides default_provider
  static Config from_env();

  json to_json() const;
  void save(const std::filesystem::path& path) const;

  // Throws ConfigError on the first invalid entry
  void validate() const;

  std::optional<ProviderProfile> get_provider(const std::string& name) const;
  std::vector<const ProviderProfile*> chat_providers() const;
};

namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

std::filesystem::path default_log_file();
}  // namespace config_paths

}  // namespace agentwire
