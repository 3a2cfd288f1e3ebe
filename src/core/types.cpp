#include "skillpack/core/types.hpp"

namespace skillpack {

namespace {

int priority(SkillLocation location) {
  switch (location) {
    case SkillLocation::Project:
      return 1;
    case SkillLocation::User:
      return 0;
  }
  return 0;
}

}  // namespace

std::string to_string(SkillLocation location) {
  switch (location) {
    case SkillLocation::Project:
      return "project";
    case SkillLocation::User:
      return "user";
  }
  return "user";
}

std::optional<SkillLocation> skill_location_from_string(const std::string &str) {
  if (str == "project") return SkillLocation::Project;
  if (str == "user") return SkillLocation::User;
  return std::nullopt;
}

bool has_priority_over(SkillLocation incoming, SkillLocation existing) {
  return priority(incoming) > priority(existing);
}

}  // namespace skillpack
