#include "agentwire/core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <fstream>

#include "agentwire/core/error.hpp"

namespace agentwire {

namespace fs = std::filesystem;

namespace {

ProviderProfile parse_profile(const std::string& name, const json& p) {
  if (!p.is_object()) {
    throw ConfigError("provider '" + name + "' must be an object");
  }
  ProviderProfile profile;
  profile.name = name;
  profile.kind = p.value("kind", "chat");
  profile.api = p.value("api", "");
  if (p.contains("fallback_api") && p["fallback_api"].is_string()) {
    profile.fallback_api = p["fallback_api"].get<std::string>();
  }
  profile.base_url = p.value("base_url", "");
  profile.api_key = p.value("api_key", "");
  profile.model = p.value("model", "");
  profile.weight = p.value("weight", 1);
  if (p.contains("headers")) {
    for (auto& [k, v] : p["headers"].items()) {
      profile.headers[k] = v.get<std::string>();
    }
  }
  return profile;
}

std::chrono::milliseconds ms_value(const json& j, const char* key, std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(j.value(key, static_cast<int64_t>(fallback.count())));
}

}  // namespace

Config Config::parse(const json& j) {
  Config config;
  if (!j.is_object()) {
    throw ConfigError("config root must be an object");
  }

  try {
    if (j.contains("providers")) {
      for (auto& [name, provider_json] : j["providers"].items()) {
        config.providers[name] = parse_profile(name, provider_json);
      }
    }

    config.default_provider = j.value("default_provider", "");

    if (j.contains("env")) {
      for (auto& [k, v] : j["env"].items()) {
        config.env[k] = v.get<std::string>();
      }
    }
    if (j.contains("aliases")) {
      for (auto& [k, v] : j["aliases"].items()) {
        config.aliases[k] = v.get<std::string>();
      }
    }

    if (j.contains("retry")) {
      const auto& r = j["retry"];
      config.retry.max_attempts = r.value("max_attempts", config.retry.max_attempts);
      config.retry.initial_backoff = ms_value(r, "initial_backoff_ms", config.retry.initial_backoff);
      config.retry.max_backoff = ms_value(r, "max_backoff_ms", config.retry.max_backoff);
      config.retry.multiplier = r.value("multiplier", config.retry.multiplier);
      config.retry.jitter = r.value("jitter", config.retry.jitter);
      config.retry.max_retry_after = ms_value(r, "max_retry_after_ms", config.retry.max_retry_after);
    }

    if (j.contains("timeouts")) {
      const auto& t = j["timeouts"];
      config.timeouts.connect = ms_value(t, "connect_ms", config.timeouts.connect);
      config.timeouts.read_idle = ms_value(t, "read_idle_ms", config.timeouts.read_idle);
    }

    if (j.contains("metrics")) {
      auto capacity = j["metrics"].value("queue_capacity", static_cast<int64_t>(config.metrics_queue_capacity));
      if (capacity < 0) {
        throw ConfigError("metrics.queue_capacity must not be negative, got " + std::to_string(capacity));
      }
      config.metrics_queue_capacity = static_cast<size_t>(capacity);
    }

    config.max_steps = j.value("max_steps", config.max_steps);
    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const json::type_error& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }

  config.validate();
  return config;
}

Config Config::load(const fs::path& path) {
  if (!fs::exists(path)) {
    return Config{};
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open config file " + path.string());
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error& e) {
    throw ConfigError("failed to parse " + path.string() + ": " + e.what());
  }

  spdlog::debug("Loading config from {}", path.string());
  return parse(j);
}

Config Config::load_default() {
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  const char* anthropic_key = std::getenv("ANTHROPIC_API_KEY");
  const char* anthropic_key_name = "ANTHROPIC_API_KEY";
  if (!anthropic_key) {
    anthropic_key = std::getenv("ANTHROPIC_AUTH_TOKEN");
    anthropic_key_name = "ANTHROPIC_AUTH_TOKEN";
  }
  if (anthropic_key && !config.providers.count("anthropic")) {
    const char* base_url = std::getenv("ANTHROPIC_BASE_URL");
    const char* model = std::getenv("ANTHROPIC_MODEL");

    ProviderProfile provider;
    provider.name = "anthropic";
    provider.api = api::kAnthropicMessages;
    provider.api_key = std::string("$") + anthropic_key_name;
    provider.base_url = base_url ? base_url : "https://api.anthropic.com/v1";
    provider.model = model ? model : "claude-sonnet-4-20250514";
    config.providers["anthropic"] = provider;
  }

  if (std::getenv("OPENAI_API_KEY") && !config.providers.count("openai")) {
    const char* base_url = std::getenv("OPENAI_BASE_URL");
    const char* model = std::getenv("OPENAI_MODEL");

    ProviderProfile provider;
    provider.name = "openai";
    provider.api = api::kOpenAIResponses;
    provider.api_key = "$OPENAI_API_KEY";
    provider.base_url = base_url ? base_url : "https://api.openai.com/v1";
    provider.model = model ? model : "gpt-4o";
    config.providers["openai"] = provider;
  }

  if (std::getenv("AWS_BEARER_TOKEN_BEDROCK") && !config.providers.count("bedrock")) {
    const char* base_url = std::getenv("BEDROCK_BASE_URL");
    const char* model = std::getenv("BEDROCK_MODEL");

    ProviderProfile provider;
    provider.name = "bedrock";
    provider.api = api::kBedrockConverseStream;
    provider.api_key = "$AWS_BEARER_TOKEN_BEDROCK";
    provider.base_url = base_url ? base_url : "https://bedrock-runtime.us-east-1.amazonaws.com";
    provider.model = model ? model : "anthropic.claude-3-5-sonnet-20241022-v2:0";
    config.providers["bedrock"] = provider;
  }

  if (const char* provider = std::getenv("AGENTWIRE_PROVIDER")) {
    config.default_provider = provider;
  }

  config.validate();
  return config;
}

json Config::to_json() const {
  json j;

  json providers_json = json::object();
  for (const auto& [name, provider] : providers) {
    json p;
    p["kind"] = provider.kind;
    p["api"] = provider.api;
    if (provider.fallback_api) {
      p["fallback_api"] = *provider.fallback_api;
    }
    p["base_url"] = provider.base_url;
    p["api_key"] = provider.api_key;
    p["model"] = provider.model;
    p["weight"] = provider.weight;
    if (!provider.headers.empty()) {
      p["headers"] = provider.headers;
    }
    providers_json[name] = p;
  }
  j["providers"] = providers_json;

  j["default_provider"] = default_provider;
  j["env"] = env;
  j["aliases"] = aliases;

  j["retry"] = {{"max_attempts", retry.max_attempts},
                {"initial_backoff_ms", retry.initial_backoff.count()},
                {"max_backoff_ms", retry.max_backoff.count()},
                {"multiplier", retry.multiplier},
                {"jitter", retry.jitter},
                {"max_retry_after_ms", retry.max_retry_after.count()}};
  j["timeouts"] = {{"connect_ms", timeouts.connect.count()}, {"read_idle_ms", timeouts.read_idle.count()}};
  j["metrics"] = {{"queue_capacity", metrics_queue_capacity}};
  j["max_steps"] = max_steps;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  return j;
}

void Config::save(const fs::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot write config file " + path.string());
  }
  file << to_json().dump(2);
}

void Config::validate() const {
  for (const auto& [name, profile] : providers) {
    if (profile.kind != "chat" && profile.kind != "embedding") {
      throw ConfigError("provider '" + name + "' has unknown kind '" + profile.kind + "'");
    }
    if (profile.weight < 0 || profile.weight >= 100) {
      throw ConfigError("provider '" + name + "' weight must be in [0, 100), got " + std::to_string(profile.weight));
    }
    if (!profile.is_chat()) continue;
    if (!api::is_known(profile.api)) {
      throw ConfigError("provider '" + name + "' has unknown api '" + profile.api + "'");
    }
    if (profile.fallback_api && !api::is_known(*profile.fallback_api)) {
      throw ConfigError("provider '" + name + "' has unknown fallback_api '" + *profile.fallback_api + "'");
    }
  }
  if (retry.max_attempts < 1) {
    throw ConfigError("retry.max_attempts must be at least 1");
  }
  if (retry.multiplier < 1.0 || retry.jitter < 0.0 || retry.jitter >= 1.0) {
    throw ConfigError("retry.multiplier must be >= 1 and retry.jitter in [0, 1)");
  }
  if (max_steps < 1) {
    throw ConfigError("max_steps must be at least 1");
  }
  if (timeouts.connect.count() < 0 || timeouts.read_idle.count() < 0) {
    throw ConfigError("timeouts.connect_ms and timeouts.read_idle_ms must not be negative");
  }
  if (retry.initial_backoff.count() < 0 || retry.max_backoff.count() < 0 || retry.max_retry_after.count() < 0) {
    throw ConfigError("retry backoff durations must not be negative");
  }
}

std::optional<ProviderProfile> Config::get_provider(const std::string& name) const {
  auto it = providers.find(name);
  if (it != providers.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::vector<const ProviderProfile*> Config::chat_providers() const {
  // std::map iteration keeps them sorted by name
  std::vector<const ProviderProfile*> result;
  for (const auto& [name, profile] : providers) {
    if (profile.is_chat()) {
      result.push_back(&profile);
    }
  }
  return result;
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "agentwire";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".agentwire" / "config.json";
}

fs::path default_log_file() {
  return config_dir() / "log" / "agentwire.log";
}

}  // namespace config_paths

}  // namespace agentwire
