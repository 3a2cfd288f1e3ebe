#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "skillpack/skill/skill.hpp"

namespace skillpack::skill {

// Priority-aware store of skills keyed by name.
//
// Project skills always win over user skills, independent of registration
// order. Enumeration follows first-registration order; an override replaces
// the stored skill in place. No internal locking: callers serialize writers
// against readers.
class SkillRegistry {
 public:
  SkillRegistry() = default;

  // Process-wide default registry
  static SkillRegistry& instance();

  // Returns false when an equal or higher priority skill with the same name
  // is already stored; the registry is left unchanged in that case.
  bool register_skill(Skill skill);

  std::optional<Skill> get(const std::string& name) const;

  bool exists(const std::string& name) const;

  // All skills in registration order
  std::vector<Skill> all() const;

  size_t size() const {
    return skills_.size();
  }

  bool empty() const {
    return skills_.empty();
  }

  void clear();

  // <available_skills> catalog holding as many whole summary fragments as fit
  // in char_budget. The wrapper tags are always present, so the result never
  // exceeds max(char_budget, wrapper length).
  std::string generate_catalog(size_t char_budget) const;

 private:
  std::vector<Skill> skills_;
  std::unordered_map<std::string, size_t> index_;
};

inline constexpr const char* CATALOG_OPEN_TAG = "<available_skills>\n";
inline constexpr const char* CATALOG_CLOSE_TAG = "</available_skills>";

// Clear the default registry (test isolation / explicit reload)
void reset_skill_registry();

}  // namespace skillpack::skill
