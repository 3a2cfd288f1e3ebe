#include <spdlog/spdlog.h>

#include <filesystem>

#include "skillpack/tool/builtin/builtins.hpp"

namespace skillpack::tools {

// ============================================================================
// SkillTool - load a skill's instructions on demand
// ============================================================================

SkillTool::SkillTool(skill::SkillRegistry& registry, size_t catalog_char_budget)
    : SimpleTool("skill", "Load a specialized skill that provides domain-specific instructions and workflows."),
      registry_(registry),
      catalog_char_budget_(catalog_char_budget) {}

std::string SkillTool::description() const {
  // Build dynamic description that lists available skills
  if (registry_.empty()) {
    return "Load a specialized skill. No skills are currently available.";
  }

  std::string desc =
      "Load a specialized skill that provides domain-specific instructions and workflows.\n"
      "When you recognize that a task matches one of the available skills listed below, "
      "use this tool to load the full skill instructions.\n\n";
  desc += registry_.generate_catalog(catalog_char_budget_);
  return desc;
}

std::vector<ParameterSchema> SkillTool::parameters() const {
  return {{"name", "string", "The name of the skill to load (from available_skills)", true, std::nullopt, std::nullopt}};
}

Result<skill::Skill> SkillTool::validate_skill(const std::string& name) const {
  if (name.empty()) {
    return Result<skill::Skill>::failure("Skill name is required");
  }

  auto found = registry_.get(name);
  if (!found) {
    // List available skills in error message
    std::string available;
    for (const auto& s : registry_.all()) {
      if (!available.empty()) available += ", ";
      available += s.name();
    }
    return Result<skill::Skill>::failure("Skill '" + name + "' not found. Available skills: " + (available.empty() ? "(none)" : available));
  }

  return Result<skill::Skill>::success(std::move(*found));
}

std::future<ToolResult> SkillTool::execute(const json& args, const ToolContext& ctx) {
  std::promise<ToolResult> promise;

  auto checked = validate_args(args);
  if (!checked.ok()) {
    promise.set_value(ToolResult::error(checked.error.value_or("Invalid arguments")));
    return promise.get_future();
  }

  const auto& name_arg = args["name"];
  auto resolved = validate_skill(name_arg.is_string() ? name_arg.get<std::string>() : "");
  if (!resolved.ok()) {
    spdlog::debug("[SkillTool] {}", resolved.error.value_or(""));
    promise.set_value(ToolResult::error(resolved.error.value_or("Unknown skill")));
    return promise.get_future();
  }

  const auto& skill = *resolved.value;
  spdlog::debug("[SkillTool] Loading skill '{}' from {} (working dir: {})", skill.name(), skill.path().string(), ctx.working_dir);
  std::string output = skill.to_prompt_block();

  // Point the model at bundled helper scripts, if any
  std::error_code ec;
  auto scripts_dir = skill.path() / "scripts";
  if (std::filesystem::is_directory(scripts_dir, ec)) {
    output += "\n\nScripts directory: " + scripts_dir.string();
  }

  auto result = ToolResult::with_title(output, "Loaded skill: " + skill.name());
  result.metadata["location"] = to_string(skill.location());
  result.metadata["allowed_tools"] = skill.allowed_tools();
  promise.set_value(std::move(result));
  return promise.get_future();
}

void register_builtins(skill::SkillRegistry& registry, size_t catalog_char_budget) {
  spdlog::debug("[ToolRegistry] Initializing built-in tools");
  ToolRegistry::instance().register_tool(std::make_shared<SkillTool>(registry, catalog_char_budget));
}

}  // namespace skillpack::tools
