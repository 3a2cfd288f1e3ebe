#include "skillpack/core/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace skillpack {

namespace fs = std::filesystem;

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return config;
  }

  try {
    json j = json::parse(file);

    if (j.contains("working_dir")) {
      config.working_dir = j["working_dir"].get<std::string>();
    }

    // Load skill paths
    if (j.contains("skill_paths")) {
      for (const auto& p : j["skill_paths"]) {
        config.skill_paths.push_back(p.get<std::string>());
      }
    }

    if (j.contains("catalog_char_budget")) {
      const auto& budget = j["catalog_char_budget"];
      if (budget.is_number_unsigned() || (budget.is_number_integer() && budget.get<int64_t>() >= 0)) {
        config.catalog_char_budget = budget.get<size_t>();
      } else {
        spdlog::warn("Ignoring invalid catalog_char_budget in {}: {}", path.string(), budget.dump());
      }
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
  } catch (const json::exception& e) {
    spdlog::warn("Ignoring malformed config {}: {}", path.string(), e.what());
    return Config{};
  }

  return config;
}

Config Config::load_default(const fs::path& project_root) {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file(project_root);
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env(const fs::path& project_root) {
  Config config = load_default(project_root);

  if (const char* level = std::getenv("SKILLPACK_LOG_LEVEL")) {
    config.log_level = level;
  }

  if (const char* budget = std::getenv("SKILLPACK_CATALOG_BUDGET")) {
    if (auto parsed = parse_char_budget(budget)) {
      config.catalog_char_budget = *parsed;
    } else {
      spdlog::warn("Ignoring invalid SKILLPACK_CATALOG_BUDGET '{}'", budget);
    }
  }

  if (const char* paths = std::getenv("SKILLPACK_SKILL_PATHS")) {
    std::istringstream stream(paths);
    std::string item;
    while (std::getline(stream, item, ':')) {
      if (!item.empty()) {
        config.skill_paths.emplace_back(item);
      }
    }
  }

  return config;
}

void Config::save(const fs::path& path) const {
  json j;

  j["working_dir"] = working_dir.string();

  json skill_paths_json = json::array();
  for (const auto& p : skill_paths) {
    skill_paths_json.push_back(p.string());
  }
  j["skill_paths"] = skill_paths_json;

  j["catalog_char_budget"] = catalog_char_budget;

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }

  // Write to file
  std::ofstream file(path);
  if (file.is_open()) {
    file << j.dump(2);
  } else {
    spdlog::warn("Cannot write config file {}", path.string());
  }
}

std::optional<size_t> parse_char_budget(const std::string& text) {
  if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  try {
    return static_cast<size_t>(std::stoull(text));
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

namespace config_paths {

fs::path home_dir() {
  const char* home = std::getenv("HOME");
  if (home) {
    return fs::path(home);
  }
#ifdef _WIN32
  const char* userprofile = std::getenv("USERPROFILE");
  if (userprofile) {
    return fs::path(userprofile);
  }
#endif
  return fs::current_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "skillpack";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file(const fs::path& project_root) {
  return project_root / ".skillpack" / "config.json";
}

}  // namespace config_paths

}  // namespace skillpack
