#include "skillpack/skill/registry.hpp"

#include <spdlog/spdlog.h>

#include <cstring>

namespace skillpack::skill {

SkillRegistry& SkillRegistry::instance() {
  static SkillRegistry registry;
  return registry;
}

bool SkillRegistry::register_skill(Skill skill) {
  auto it = index_.find(skill.name());
  if (it == index_.end()) {
    spdlog::debug("Registered skill '{}' ({}) from {}", skill.name(), to_string(skill.location()), skill.path().string());
    index_.emplace(skill.name(), skills_.size());
    skills_.push_back(std::move(skill));
    return true;
  }

  auto& existing = skills_[it->second];
  if (!has_priority_over(skill.location(), existing.location())) {
    spdlog::debug("Skill '{}' already registered ({}, {}), skipping {} from {}", skill.name(), to_string(existing.location()),
                  existing.path().string(), to_string(skill.location()), skill.path().string());
    return false;
  }

  spdlog::debug("Skill '{}' from {} overrides {} skill from {}", skill.name(), skill.path().string(), to_string(existing.location()),
                existing.path().string());
  existing = std::move(skill);
  return true;
}

std::optional<Skill> SkillRegistry::get(const std::string& name) const {
  auto it = index_.find(name);
  if (it != index_.end()) {
    return skills_[it->second];
  }
  return std::nullopt;
}

bool SkillRegistry::exists(const std::string& name) const {
  return index_.count(name) > 0;
}

std::vector<Skill> SkillRegistry::all() const {
  return skills_;
}

void SkillRegistry::clear() {
  skills_.clear();
  index_.clear();
}

std::string SkillRegistry::generate_catalog(size_t char_budget) const {
  const size_t close_len = std::strlen(CATALOG_CLOSE_TAG);

  std::string catalog = CATALOG_OPEN_TAG;
  size_t included = 0;
  for (const auto& skill : skills_) {
    auto fragment = skill.to_summary_fragment();
    // Whole fragments only, and always leave room for the closing tag
    if (catalog.size() + fragment.size() + close_len > char_budget) {
      break;
    }
    catalog += fragment;
    ++included;
  }
  catalog += CATALOG_CLOSE_TAG;

  if (included < skills_.size()) {
    spdlog::debug("Skill catalog budget {} reached: {} of {} skills omitted", char_budget, skills_.size() - included, skills_.size());
  }
  return catalog;
}

void reset_skill_registry() {
  SkillRegistry::instance().clear();
}

}  // namespace skillpack::skill
