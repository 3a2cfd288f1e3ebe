// Library initialization
#include "skillpack/skillpack.hpp"

#include <spdlog/spdlog.h>

#include "skillpack/core/version.hpp"
#include "skillpack/log/log.h"

namespace skillpack {

skill::SkillRegistry& init(const Config& config) {
  init_log(config.log_file ? config.log_file->string() : "", 10 * 1024 * 1024, 10, config.log_level);

  // Discover skills from the project and standard user locations
  skill::SkillLoader loader(config.working_dir, nullptr, config.skill_paths);
  auto& registry = loader.load_all();

  tools::register_builtins(registry, config.catalog_char_budget);
  return registry;
}

void shutdown() {
  ToolRegistry::instance().unregister_tool("skill");
  skill::reset_skill_registry();
}

std::string version() {
  return SKILLPACK_VERSION_STRING;
}

}  // namespace skillpack
