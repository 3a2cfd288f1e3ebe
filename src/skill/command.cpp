#include "skillpack/skill/command.hpp"

namespace skillpack::skill {

SkillCommand SkillCommand::from_skill(const Skill& skill) {
  return SkillCommand{skill.name(), skill.description(), "/" + skill.name(), skill};
}

std::string SkillCommand::expand(const std::string& args) const {
  std::string prompt = "<command-message>The \"" + name + "\" skill is loading</command-message>\n\n";
  prompt += skill.to_prompt_block();
  if (!args.empty()) {
    prompt += "\n\nARGUMENTS: " + args;
  }
  return prompt;
}

std::vector<SkillCommand> skill_commands(const SkillRegistry& registry) {
  std::vector<SkillCommand> commands;
  for (const auto& skill : registry.all()) {
    commands.push_back(SkillCommand::from_skill(skill));
  }
  return commands;
}

}  // namespace skillpack::skill
