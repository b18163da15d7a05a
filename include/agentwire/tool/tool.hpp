#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "agentwire/core/types.hpp"
#include "agentwire/llm/request.hpp"

namespace agentwire {

struct ToolExecutionError {
  std::string message;
  bool fatal = false;  // fatal errors end the turn instead of being reported to the model
};

struct ToolOutcome {
  std::optional<json> value;
  std::optional<ToolExecutionError> error;

  static ToolOutcome success(json value) {
    return ToolOutcome{std::move(value), std::nullopt};
  }

  static ToolOutcome failure(std::string message, bool fatal = false) {
    return ToolOutcome{std::nullopt, ToolExecutionError{std::move(message), fatal}};
  }

  bool ok() const {
    return !error.has_value();
  }

  // Text handed back to the model as the tool result
  std::string output_text() const;
};

// Executes tool calls on behalf of the agent loop
class ToolExecutor {
 public:
  virtual ~ToolExecutor() = default;

  virtual ToolOutcome execute(const std::string& name, const json& args) = 0;
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "integer", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;

  json to_json_schema() const;
};

class Tool {
 public:
  virtual ~Tool() = default;

  virtual std::string id() const = 0;

  virtual std::string description() const = 0;

  virtual std::vector<ParameterSchema> parameters() const = 0;

  virtual ToolOutcome execute(const json& args) = 0;

  // JSON schema of the arguments object
  json to_json_schema() const;

  llm::ToolDeclaration declaration() const;

  Result<json> validate_args(const json& args) const;
};

// Tool backed by a callable
class FunctionTool : public Tool {
 public:
  using Handler = std::function<ToolOutcome(const json& args)>;

  FunctionTool(std::string id, std::string description, std::vector<ParameterSchema> parameters, Handler handler);

  std::string id() const override {
    return id_;
  }

  std::string description() const override {
    return description_;
  }

  std::vector<ParameterSchema> parameters() const override {
    return parameters_;
  }

  ToolOutcome execute(const json& args) override;

 private:
  std::string id_;
  std::string description_;
  std::vector<ParameterSchema> parameters_;
  Handler handler_;
};

// Name -> tool map usable as the loop's ToolExecutor
class ToolRegistry : public ToolExecutor {
 public:
  void register_tool(std::shared_ptr<Tool> tool);

  void unregister_tool(const std::string& id);

  std::shared_ptr<Tool> get(const std::string& id) const;

  std::vector<std::shared_ptr<Tool>> all() const;

  // Declarations for a request, sorted by name
  std::vector<llm::ToolDeclaration> declarations() const;

  // Unknown tools, invalid arguments and exceptions become non-fatal failures
  ToolOutcome execute(const std::string& name, const json& args) override;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
};

// Replace invalid UTF-8 sequences with U+FFFD so the text can be embedded in JSON
std::string sanitize_utf8(const std::string& input);

}  // namespace agentwire
