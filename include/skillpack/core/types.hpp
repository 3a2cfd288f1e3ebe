#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace skillpack {

using json = nlohmann::json;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Provenance tier of a skill, determines override rights
enum class SkillLocation {
  Project,  // <project>/.claude/skills, <project>/.skillpack/skills
  User      // ~/.claude/skills, ~/.skillpack/skills, configured extra paths
};

std::string to_string(SkillLocation location);

std::optional<SkillLocation> skill_location_from_string(const std::string &str);

// Strict priority order: project > user
bool has_priority_over(SkillLocation incoming, SkillLocation existing);

}  // namespace skillpack
