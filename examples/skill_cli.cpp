// Skill inspection CLI
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "skillpack/skillpack.hpp"

using namespace skillpack;

namespace {

void print_usage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [--project DIR] [--budget N] [--location project|user] [--json] <command>\n"
            << "\n"
            << "Commands:\n"
            << "  roots                 Show the skill search roots\n"
            << "  list                  List loaded skills\n"
            << "  catalog               Print the <available_skills> catalog\n"
            << "  show NAME             Print a skill's prompt block\n"
            << "  command NAME [ARGS]   Expand /NAME as a slash command\n";
}

int run_roots(const skill::SkillLoader& loader, bool as_json) {
  json out = json::array();
  for (const auto& root : loader.search_roots()) {
    std::error_code ec;
    bool exists = std::filesystem::is_directory(root.path, ec);
    if (as_json) {
      out.push_back({{"path", root.path.string()}, {"location", to_string(root.location)}, {"exists", exists}});
    } else {
      std::cout << "[" << (exists ? "x" : " ") << "] " << to_string(root.location) << ": " << root.path.string() << "\n";
    }
  }
  if (as_json) std::cout << out.dump(2) << "\n";
  return 0;
}

int run_list(const skill::SkillRegistry& registry, std::optional<SkillLocation> only, bool as_json) {
  json out = json::array();
  for (const auto& s : registry.all()) {
    if (only && s.location() != *only) continue;
    if (as_json) {
      out.push_back(s.to_json());
    } else {
      std::cout << s.name() << " (" << to_string(s.location()) << ") - " << s.description() << "\n";
    }
  }
  if (as_json) std::cout << out.dump(2) << "\n";
  return 0;
}

int run(const Config& config, const std::vector<std::string>& positional, std::optional<SkillLocation> only, bool as_json) {
  const auto& command = positional[0];

  if (command == "roots") {
    skill::SkillLoader loader(config.working_dir, nullptr, config.skill_paths);
    return run_roots(loader, as_json);
  }

  auto& registry = skillpack::init(config);

  if (command == "list") {
    return run_list(registry, only, as_json);
  }

  if (command == "catalog") {
    std::cout << registry.generate_catalog(config.catalog_char_budget) << "\n";
    return 0;
  }

  if ((command == "show" || command == "command") && positional.size() >= 2) {
    auto found = registry.get(positional[1]);
    if (!found) {
      spdlog::warn("Unknown skill requested: {}", positional[1]);
      std::cerr << "Unknown skill: " << positional[1] << "\n";
      return 1;
    }

    if (command == "show") {
      std::cout << (as_json ? found->to_json().dump(2) : found->to_prompt_block()) << "\n";
      return 0;
    }

    std::string args;
    for (size_t i = 2; i < positional.size(); ++i) {
      if (!args.empty()) args += " ";
      args += positional[i];
    }
    std::cout << skill::SkillCommand::from_skill(*found).expand(args) << "\n";
    return 0;
  }

  return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::optional<std::filesystem::path> project;
  std::optional<std::string> budget;
  std::optional<SkillLocation> only;
  bool as_json = false;

  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--project" && i + 1 < argc) {
      project = argv[++i];
    } else if (arg == "--budget" && i + 1 < argc) {
      budget = argv[++i];
    } else if (arg == "--location" && i + 1 < argc) {
      only = skill_location_from_string(argv[++i]);
      if (!only) {
        std::cerr << "Invalid location: " << argv[i] << " (expected project or user)\n";
        return 2;
      }
    } else if (arg == "--json") {
      as_json = true;
    } else if (arg == "--version") {
      std::cout << "skill_cli " << skillpack::version() << "\n";
      return 0;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    print_usage(argv[0]);
    return 2;
  }

  // Project config is looked up under --project, not the current directory
  Config config = Config::from_env(project.value_or(std::filesystem::current_path()));
  if (project) {
    config.working_dir = *project;
  }
  if (budget) {
    auto parsed = parse_char_budget(*budget);
    if (!parsed) {
      std::cerr << "Invalid budget: " << *budget << "\n";
      return 2;
    }
    config.catalog_char_budget = *parsed;
  }

  int code = run(config, positional, only, as_json);
  skillpack::shutdown();
  if (code == 2) {
    print_usage(argv[0]);
  }
  return code;
}
