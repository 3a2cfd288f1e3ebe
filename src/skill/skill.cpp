#include "skillpack/skill/skill.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

#include "skillpack/skill/frontmatter.hpp"

namespace skillpack::skill {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> string_field(const json& header, const char* key) {
  auto it = header.find(key);
  if (it == header.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::string xml_escape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      default:
        out += c;
        break;
    }
  }
  return out;
}

// "allowed-tools" accepts a list, a single name or a comma separated string
std::vector<std::string> tool_list(const json& value) {
  std::vector<std::string> tools;
  if (value.is_array()) {
    for (const auto& item : value) {
      if (item.is_string() && !item.get<std::string>().empty()) {
        tools.push_back(item.get<std::string>());
      }
    }
  } else if (value.is_string()) {
    std::istringstream stream(value.get<std::string>());
    std::string item;
    while (std::getline(stream, item, ',')) {
      size_t start = item.find_first_not_of(" \t");
      size_t end = item.find_last_not_of(" \t");
      if (start != std::string::npos) {
        tools.push_back(item.substr(start, end - start + 1));
      }
    }
  }
  return tools;
}

bool is_blank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

std::string trim_blank_lines(const std::string& text) {
  // Drop leading blank lines
  size_t start = 0;
  while (start < text.size()) {
    size_t eol = text.find('\n', start);
    std::string line = text.substr(start, eol == std::string::npos ? std::string::npos : eol - start);
    if (!is_blank(line)) break;
    if (eol == std::string::npos) return "";
    start = eol + 1;
  }

  // Drop trailing blank lines (and the final newline)
  size_t end = text.size();
  while (end > start) {
    size_t bol = text.rfind('\n', end - 1);
    size_t line_start = (bol == std::string::npos || bol < start) ? start : bol + 1;
    if (!is_blank(text.substr(line_start, end - line_start))) break;
    if (line_start == start) return "";
    end = line_start - 1;
  }

  return text.substr(start, end - start);
}

std::optional<Skill> Skill::from_document(const fs::path& document_path, const json& header, const std::string& body, SkillLocation location) {
  if (!header.is_object()) {
    return std::nullopt;
  }

  auto name = string_field(header, "name");
  auto description = string_field(header, "description");
  if (!name || name->empty() || !description || description->empty()) {
    return std::nullopt;
  }

  Skill skill;
  skill.name_ = std::move(*name);
  skill.description_ = std::move(*description);
  skill.content_ = trim_blank_lines(body);
  skill.path_ = document_path.parent_path();
  skill.location_ = location;

  if (auto it = header.find("allowed-tools"); it != header.end()) {
    skill.allowed_tools_ = tool_list(*it);
  }
  skill.license_ = string_field(header, "license");
  if (auto it = header.find("metadata"); it != header.end() && it->is_object()) {
    skill.metadata_ = *it;
  }

  return skill;
}

std::optional<Skill> Skill::from_file(const fs::path& document_path, SkillLocation location) {
  std::string raw;
  {
    std::ifstream file(document_path, std::ios::binary);
    if (!file.is_open()) {
      spdlog::debug("Cannot open skill file {}", document_path.string());
      return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
      spdlog::debug("Failed reading skill file {}", document_path.string());
      return std::nullopt;
    }
    raw = ss.str();
  }

  auto doc = parse_document(raw);
  auto skill = from_document(document_path, doc.header, doc.body, location);
  if (!skill) {
    spdlog::debug("Skipping {}: missing 'name' or 'description'", document_path.string());
  }
  return skill;
}

std::optional<Skill> Skill::create(std::string name, std::string description, std::string content, fs::path path, SkillLocation location,
                                   std::vector<std::string> allowed_tools, std::optional<std::string> license, json metadata) {
  if (name.empty() || description.empty()) {
    return std::nullopt;
  }

  Skill skill;
  skill.name_ = std::move(name);
  skill.description_ = std::move(description);
  skill.content_ = std::move(content);
  skill.path_ = std::move(path);
  skill.location_ = location;
  skill.allowed_tools_ = std::move(allowed_tools);
  skill.license_ = std::move(license);
  skill.metadata_ = std::move(metadata);
  return skill;
}

std::string Skill::to_summary_fragment() const {
  std::string out = "<skill>\n";
  out += "  <name>" + xml_escape(name_) + "</name>\n";
  out += "  <description>" + xml_escape(description_) + "</description>\n";
  out += "  <location>" + to_string(location_) + "</location>\n";
  out += "</skill>\n";
  return out;
}

std::string Skill::to_prompt_block() const {
  std::string out = "Loading: " + name_ + "\n";
  out += "Base directory: " + path_.string() + "\n\n";
  out += content_;
  return out;
}

json Skill::to_json() const {
  json j;
  j["name"] = name_;
  j["description"] = description_;
  j["location"] = to_string(location_);
  j["path"] = path_.string();
  j["allowed_tools"] = allowed_tools_;
  if (license_) {
    j["license"] = *license_;
  }
  if (!metadata_.is_null()) {
    j["metadata"] = metadata_;
  }
  return j;
}

}  // namespace skillpack::skill
