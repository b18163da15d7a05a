#include "agentwire/tool/tool.hpp"

#include <spdlog/spdlog.h>

namespace agentwire {

namespace {

constexpr const char* kReplacement = "\xEF\xBF\xBD";  // U+FFFD

bool is_continuation(const std::string& s, size_t i) {
  return i < s.size() && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80;
}

}  // namespace

std::string sanitize_utf8(const std::string& input) {
  std::string output;
  output.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;

    if (c <= 0x7F) {
      output.push_back(static_cast<char>(c));
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      output.append(kReplacement);
      ++i;
      continue;
    }

    bool complete = true;
    for (size_t k = 1; k < len; ++k) {
      if (!is_continuation(input, i + k)) {
        complete = false;
        break;
      }
      cp = (cp << 6) | (static_cast<unsigned char>(input[i + k]) & 0x3F);
    }
    if (!complete) {
      output.append(kReplacement);
      ++i;
      continue;
    }

    // Overlong forms, surrogates and out-of-range code points
    if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      output.append(kReplacement);
    } else {
      output.append(input, i, len);
    }
    i += len;
  }

  return output;
}

std::string ToolOutcome::output_text() const {
  if (error) {
    return sanitize_utf8(error->message);
  }
  if (!value || value->is_null()) {
    return "";
  }
  if (value->is_string()) {
    return sanitize_utf8(value->get<std::string>());
  }
  return value->dump(-1, ' ', false, json::error_handler_t::replace);
}

json ParameterSchema::to_json_schema() const {
  json schema;
  schema["type"] = type;
  schema["description"] = description;

  if (default_value) {
    schema["default"] = *default_value;
  }

  if (enum_values && !enum_values->empty()) {
    schema["enum"] = *enum_values;
  }

  return schema;
}

json Tool::to_json_schema() const {
  json properties = json::object();
  json required_props = json::array();

  for (const auto& param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  return {{"type", "object"}, {"properties", properties}, {"required", required_props}};
}

llm::ToolDeclaration Tool::declaration() const {
  return llm::ToolDeclaration{id(), description(), to_json_schema()};
}

Result<json> Tool::validate_args(const json& args) const {
  if (!args.is_object()) {
    return Result<json>::failure("Arguments must be a JSON object");
  }

  for (const auto& param : parameters()) {
    if (param.required && !args.contains(param.name)) {
      return Result<json>::failure("Missing required parameter: " + param.name);
    }
  }

  return Result<json>::success(args);
}

FunctionTool::FunctionTool(std::string id, std::string description, std::vector<ParameterSchema> parameters, Handler handler)
    : id_(std::move(id)), description_(std::move(description)), parameters_(std::move(parameters)), handler_(std::move(handler)) {}

ToolOutcome FunctionTool::execute(const json& args) {
  if (!handler_) {
    return ToolOutcome::failure("Tool " + id_ + " has no handler");
  }
  return handler_(args);
}

void ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
  std::lock_guard lock(mutex_);
  tools_[tool->id()] = std::move(tool);
}

void ToolRegistry::unregister_tool(const std::string& id) {
  std::lock_guard lock(mutex_);
  tools_.erase(id);
}

std::shared_ptr<Tool> ToolRegistry::get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  auto it = tools_.find(id);
  if (it != tools_.end()) {
    return it->second;
  }
  return nullptr;
}

std::vector<std::shared_ptr<Tool>> ToolRegistry::all() const {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<Tool>> result;
  result.reserve(tools_.size());
  for (const auto& [id, tool] : tools_) {
    result.push_back(tool);
  }
  return result;
}

std::vector<llm::ToolDeclaration> ToolRegistry::declarations() const {
  std::vector<llm::ToolDeclaration> result;
  for (const auto& tool : all()) {
    result.push_back(tool->declaration());
  }
  return result;
}

ToolOutcome ToolRegistry::execute(const std::string& name, const json& args) {
  auto tool = get(name);
  if (!tool) {
    return ToolOutcome::failure("Tool not found: " + name);
  }

  auto validated = tool->validate_args(args);
  if (!validated) {
    return ToolOutcome::failure(validated.error());
  }

  try {
    return tool->execute(validated.value());
  } catch (const std::exception& e) {
    spdlog::warn("Tool {} threw: {}", name, e.what());
    return ToolOutcome::failure(std::string("Tool execution failed: ") + e.what());
  }
}

}  // namespace agentwire
