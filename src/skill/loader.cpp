#include "skillpack/skill/loader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "skillpack/core/config.hpp"

namespace skillpack::skill {

namespace fs = std::filesystem;

namespace {

// Hidden directory conventions, each holding a "skills" subdirectory
constexpr const char* SKILL_DIR_CONVENTIONS[] = {
    ".claude",
    ".skillpack",
};

std::vector<SearchRoot> build_search_roots(const fs::path& project_root, const std::vector<fs::path>& extra_roots) {
  std::vector<SearchRoot> roots;
  auto home = config_paths::home_dir();

  for (const auto* convention : SKILL_DIR_CONVENTIONS) {
    roots.push_back({project_root / convention / "skills", SkillLocation::Project});
    roots.push_back({home / convention / "skills", SkillLocation::User});
  }

  for (const auto& extra : extra_roots) {
    roots.push_back({extra, SkillLocation::User});
  }
  return roots;
}

}  // namespace

SkillLoader::SkillLoader(fs::path project_root, SkillRegistry* registry, std::vector<fs::path> extra_roots)
    : project_root_(std::move(project_root)),
      registry_(registry ? registry : &SkillRegistry::instance()),
      roots_(build_search_roots(project_root_, extra_roots)) {}

std::vector<fs::path> SkillLoader::discover(const fs::path& root) {
  std::vector<fs::path> found;

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return found;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    spdlog::debug("Cannot scan skill root {}: {}", root.string(), ec.message());
    return found;
  }

  for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      spdlog::debug("Stopped scanning {}: {}", root.string(), ec.message());
      break;
    }
    const auto& entry = *it;
    if (entry.path().filename() == SKILL_FILENAME && entry.is_regular_file(ec)) {
      found.push_back(entry.path());
    }
  }

  std::sort(found.begin(), found.end());
  return found;
}

SkillRegistry& SkillLoader::load_all() {
  size_t discovered = 0;
  size_t registered = 0;

  for (const auto& root : roots_) {
    auto documents = discover(root.path);
    discovered += documents.size();

    for (const auto& document : documents) {
      auto skill = Skill::from_file(document, root.location);
      if (!skill) {
        continue;
      }
      if (registry_->register_skill(std::move(*skill))) {
        ++registered;
      }
    }
  }

  spdlog::info("Skill discovery complete: {} documents found, {} registered, {} skills available", discovered, registered,
               registry_->size());
  return *registry_;
}

SkillRegistry& SkillLoader::reload() {
  registry_->clear();
  return load_all();
}

}  // namespace skillpack::skill
