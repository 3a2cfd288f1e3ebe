#pragma once

#include <filesystem>
#include <vector>

#include "skillpack/core/types.hpp"
#include "skillpack/skill/registry.hpp"

namespace skillpack::skill {

// A directory scanned for skills, tagged with its provenance tier
struct SearchRoot {
  std::filesystem::path path;
  SkillLocation location;
};

// Walks the project and user skill roots and feeds every valid SKILL.md into
// a registry.
class SkillLoader {
 public:
  // registry == nullptr targets SkillRegistry::instance().
  // extra_roots are scanned last, as user skills.
  explicit SkillLoader(std::filesystem::path project_root = std::filesystem::current_path(), SkillRegistry* registry = nullptr,
                       std::vector<std::filesystem::path> extra_roots = {});

  // Fixed search order: project .claude, user .claude, project .skillpack,
  // user .skillpack, then extra roots
  const std::vector<SearchRoot>& search_roots() const {
    return roots_;
  }

  // Every SKILL.md below root at any depth, sorted by path. Missing or
  // unreadable roots yield an empty list.
  static std::vector<std::filesystem::path> discover(const std::filesystem::path& root);

  // Load every root into the target registry and return it
  SkillRegistry& load_all();

  // Clear the target registry, then load_all()
  SkillRegistry& reload();

  SkillRegistry& registry() const {
    return *registry_;
  }

 private:
  std::filesystem::path project_root_;
  SkillRegistry* registry_;
  std::vector<SearchRoot> roots_;
};

}  // namespace skillpack::skill
