#pragma once

#include <string>
#include <vector>

#include "skillpack/skill/registry.hpp"

namespace skillpack::skill {

// A skill exposed as a "/name" slash command. Expanding the command yields
// the prompt that hands the skill to the model.
struct SkillCommand {
  std::string name;
  std::string description;
  std::string usage;
  Skill skill;

  static SkillCommand from_skill(const Skill& skill);

  std::string expand(const std::string& args = "") const;
};

// One command per registered skill, in registry order
std::vector<SkillCommand> skill_commands(const SkillRegistry& registry);

}  // namespace skillpack::skill
