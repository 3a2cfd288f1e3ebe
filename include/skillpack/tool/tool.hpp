#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "skillpack/core/types.hpp"
#include "skillpack/skill/skill.hpp"

namespace skillpack {

// Tool execution context
struct ToolContext {
  std::string working_dir;
};

// Tool execution result
struct ToolResult {
  std::string output;
  std::optional<std::string> title;
  json metadata;
  bool is_error = false;

  // Factory methods
  static ToolResult success(const std::string& output) {
    return ToolResult{output, std::nullopt, json::object(), false};
  }

  static ToolResult error(const std::string& message) {
    return ToolResult{message, std::nullopt, json::object(), true};
  }

  static ToolResult with_title(const std::string& output, const std::string& title) {
    return ToolResult{output, title, json::object(), false};
  }
};

// Parameter schema (simplified JSON Schema)
struct ParameterSchema {
  std::string name;
  std::string type;  // "string", "number", "boolean", "object", "array"
  std::string description;
  bool required = true;
  std::optional<json> default_value;
  std::optional<std::vector<std::string>> enum_values;

  json to_json_schema() const;
};

// Tool definition: name / description / input schema / execute
class Tool {
 public:
  virtual ~Tool() = default;

  // Tool identification
  virtual std::string id() const = 0;

  virtual std::string description() const = 0;

  // Parameter schema
  virtual std::vector<ParameterSchema> parameters() const = 0;

  // Execution
  virtual std::future<ToolResult> execute(const json& args, const ToolContext& ctx) = 0;

  // Generate JSON Schema for tool
  json to_json_schema() const;

  // Validate arguments
  Result<json> validate_args(const json& args) const;
};

// Base class for simpler tool implementation
class SimpleTool : public Tool {
 public:
  SimpleTool(std::string id, std::string description);

  std::string id() const override {
    return id_;
  }

  std::string description() const override {
    return description_;
  }

 protected:
  std::string id_;
  std::string description_;
};

// Tool registry
class ToolRegistry {
 public:
  static ToolRegistry& instance();

  // Register a tool
  void register_tool(std::shared_ptr<Tool> tool);

  // Unregister a tool
  void unregister_tool(const std::string& id);

  // Get a tool by ID
  std::shared_ptr<Tool> get(const std::string& id) const;

  // Get all tools
  std::vector<std::shared_ptr<Tool>> all() const;

  // Tools a skill is scoped to (all tools when it declares no allowed-tools).
  // Matching is case-insensitive: "Bash" selects the "bash" tool.
  std::vector<std::shared_ptr<Tool>> for_skill(const skill::Skill& skill) const;

 private:
  ToolRegistry() = default;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Tool>> tools_;
};

}  // namespace skillpack
