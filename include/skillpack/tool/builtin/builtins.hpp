#pragma once

#include <cstddef>

#include "skillpack/skill/registry.hpp"
#include "skillpack/tool/tool.hpp"

namespace skillpack::tools {

// Skill tool - load a skill's instructions on demand
class SkillTool : public SimpleTool {
 public:
  explicit SkillTool(skill::SkillRegistry& registry = skill::SkillRegistry::instance(), size_t catalog_char_budget = 15000);

  // Preamble followed by the <available_skills> catalog
  std::string description() const override;

  std::vector<ParameterSchema> parameters() const override;

  std::future<ToolResult> execute(const json& args, const ToolContext& ctx) override;

  // Resolve a skill by name; the failure message lists the available skills
  Result<skill::Skill> validate_skill(const std::string& name) const;

 private:
  skill::SkillRegistry& registry_;
  size_t catalog_char_budget_;
};

// Register built-in tools with ToolRegistry::instance()
void register_builtins(skill::SkillRegistry& registry = skill::SkillRegistry::instance(), size_t catalog_char_budget = 15000);

}  // namespace skillpack::tools
