#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "skillpack/core/types.hpp"

namespace skillpack::skill {

// Reserved file name of a skill definition document
inline constexpr const char* SKILL_FILENAME = "SKILL.md";

// A named, described bundle of instructions loaded from a SKILL.md file.
// Immutable once constructed; use the factories below.
class Skill {
 public:
  // Build a skill from a parsed document. Returns nullopt when the header
  // lacks a non-empty string "name" or "description".
  static std::optional<Skill> from_document(const std::filesystem::path& document_path, const json& header, const std::string& body,
                                            SkillLocation location);

  // Read and parse a SKILL.md file. Returns nullopt when the file cannot be
  // read or the document is incomplete.
  static std::optional<Skill> from_file(const std::filesystem::path& document_path, SkillLocation location);

  // Programmatic construction, same required-field rule as from_document
  static std::optional<Skill> create(std::string name, std::string description, std::string content, std::filesystem::path path,
                                     SkillLocation location, std::vector<std::string> allowed_tools = {},
                                     std::optional<std::string> license = std::nullopt, json metadata = nullptr);

  const std::string& name() const {
    return name_;
  }

  const std::string& description() const {
    return description_;
  }

  const std::string& content() const {
    return content_;
  }

  // Directory that holds the SKILL.md file
  const std::filesystem::path& path() const {
    return path_;
  }

  SkillLocation location() const {
    return location_;
  }

  const std::vector<std::string>& allowed_tools() const {
    return allowed_tools_;
  }

  const std::optional<std::string>& license() const {
    return license_;
  }

  // Uninterpreted "metadata" mapping, null when absent
  const json& metadata() const {
    return metadata_;
  }

  // <skill> catalog entry with name, description and location (no content)
  std::string to_summary_fragment() const;

  // Loading header, base directory line and the full instructions
  std::string to_prompt_block() const;

  json to_json() const;

 private:
  Skill() = default;

  std::string name_;
  std::string description_;
  std::string content_;
  std::filesystem::path path_;
  SkillLocation location_ = SkillLocation::User;
  std::vector<std::string> allowed_tools_;
  std::optional<std::string> license_;
  json metadata_;
};

// Strip leading and trailing blank lines, keeping inner formatting intact
std::string trim_blank_lines(const std::string& text);

}  // namespace skillpack::skill
