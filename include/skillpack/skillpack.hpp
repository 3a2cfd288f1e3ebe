#pragma once

// Core types
#include "skillpack/core/config.hpp"
#include "skillpack/core/types.hpp"

// Skills
#include "skillpack/skill/command.hpp"
#include "skillpack/skill/frontmatter.hpp"
#include "skillpack/skill/loader.hpp"
#include "skillpack/skill/registry.hpp"
#include "skillpack/skill/skill.hpp"

// Tool system
#include "skillpack/tool/builtin/builtins.hpp"
#include "skillpack/tool/tool.hpp"

namespace skillpack {

// Initialize logging, load all skills into the default registry and register
// the built-in tools
skill::SkillRegistry& init(const Config& config = Config::from_env());

// Drop all loaded skills and registered tools
void shutdown();

// Get version string
std::string version();

}  // namespace skillpack
