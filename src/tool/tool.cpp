#include "skillpack/tool/tool.hpp"

#include <algorithm>
#include <cctype>

namespace skillpack {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

// Parameter schema to JSON
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

// Tool to JSON schema
json Tool::to_json_schema() const {
  json schema;
  schema["name"] = id();
  schema["description"] = description();

  json properties = json::object();
  json required_props = json::array();

  for (const auto& param : parameters()) {
    properties[param.name] = param.to_json_schema();
    if (param.required) {
      required_props.push_back(param.name);
    }
  }

  schema["input_schema"] = {{"type", "object"}, {"properties", properties}, {"required", required_props}};

  return schema;
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

// SimpleTool implementation
SimpleTool::SimpleTool(std::string id, std::string description) : id_(std::move(id)), description_(std::move(description)) {}

// Tool Registry
ToolRegistry& ToolRegistry::instance() {
  static ToolRegistry instance;
  return instance;
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

std::vector<std::shared_ptr<Tool>> ToolRegistry::for_skill(const skill::Skill& skill) const {
  auto all_tools = all();
  if (skill.allowed_tools().empty()) {
    return all_tools;
  }

  std::vector<std::shared_ptr<Tool>> result;
  for (const auto& tool : all_tools) {
    auto id = to_lower(tool->id());
    for (const auto& allowed : skill.allowed_tools()) {
      if (to_lower(allowed) == id) {
        result.push_back(tool);
        break;
      }
    }
  }

  return result;
}

}  // namespace skillpack
