#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "skillpack/core/types.hpp"

namespace skillpack {

// Application configuration
struct Config {
  // Project root used for project-tier search roots
  std::filesystem::path working_dir = std::filesystem::current_path();

  // Additional skill roots, scanned after the built-in ones (user tier)
  std::vector<std::filesystem::path> skill_paths;

  // Character budget for the <available_skills> catalog
  size_t catalog_char_budget = 15000;

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config: <project_root>/.skillpack/config.json, then the
  // global config file
  static Config load_default(const std::filesystem::path& project_root = std::filesystem::current_path());

  // Load config from environment variables, with file config as base
  // Reads: SKILLPACK_LOG_LEVEL, SKILLPACK_CATALOG_BUDGET,
  //        SKILLPACK_SKILL_PATHS (':' separated)
  static Config from_env(const std::filesystem::path& project_root = std::filesystem::current_path());

  // Save to file
  void save(const std::filesystem::path& path) const;
};

// Parse a catalog character budget; negative or non-numeric text is rejected
std::optional<size_t> parse_char_budget(const std::string& text);

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file(const std::filesystem::path& project_root = std::filesystem::current_path());
}  // namespace config_paths

}  // namespace skillpack
