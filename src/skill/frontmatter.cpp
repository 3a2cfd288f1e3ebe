#include "skillpack/skill/frontmatter.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace skillpack::skill {

namespace {

constexpr const char* kDelimiter = "---";
constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

std::string trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  size_t end = s.find_last_not_of(" \t\r\n");
  return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

std::string rtrim(const std::string& s) {
  size_t end = s.find_last_not_of(" \t\r\n");
  return (end == std::string::npos) ? "" : s.substr(0, end + 1);
}

class YamlError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

bool is_sequence_entry(const std::string& text) {
  return text == "-" || (text.size() >= 2 && text[0] == '-' && (text[1] == ' ' || text[1] == '\t'));
}

// Position of the ':' that separates a plain key from its value
size_t find_key_separator(const std::string& text) {
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == ':' && (i + 1 == text.size() || text[i + 1] == ' ' || text[i + 1] == '\t')) {
      return i;
    }
  }
  return std::string::npos;
}

// "key: value" or "key:" line, with a plain or quoted key
bool is_mapping_entry(const std::string& text) {
  if (text.empty()) return false;

  const char first = text[0];
  if (first == '"' || first == '\'') {
    for (size_t i = 1; i < text.size(); ++i) {
      if (first == '"' && text[i] == '\\') {
        ++i;
        continue;
      }
      if (text[i] != first) continue;
      if (first == '\'' && i + 1 < text.size() && text[i + 1] == '\'') {
        ++i;
        continue;
      }
      size_t after = i + 1;
      return after < text.size() && text[after] == ':' &&
             (after + 1 == text.size() || text[after + 1] == ' ' || text[after + 1] == '\t');
    }
    return false;
  }

  if (first == '[' || first == '{' || first == '|' || first == '>' || first == '#') return false;
  return find_key_separator(text) != std::string::npos;
}

// Strip a trailing " # comment" from a plain scalar
std::string strip_comment(const std::string& text) {
  if (!text.empty() && text[0] == '#') return "";
  for (size_t i = 1; i < text.size(); ++i) {
    if (text[i] == '#' && (text[i - 1] == ' ' || text[i - 1] == '\t')) {
      return rtrim(text.substr(0, i));
    }
  }
  return text;
}

std::string plain_scalar(const std::string& text) {
  if (text == "~" || text == "null") return "";
  return text;
}

// ============================================================================
// YAML subset decoder
// ============================================================================

class YamlSubsetParser {
 public:
  explicit YamlSubsetParser(const std::string& text) {
    std::istringstream stream(text);
    std::string raw;
    while (std::getline(stream, raw)) {
      if (!raw.empty() && raw.back() == '\r') raw.pop_back();

      Line line;
      line.indent = raw.find_first_not_of(" \t\r");
      if (line.indent == std::string::npos) {
        line.indent = raw.size();
        line.blank = true;
      } else {
        line.text = rtrim(raw.substr(line.indent));
      }
      line.raw = std::move(raw);
      lines_.push_back(std::move(line));
    }
  }

  json parse() {
    skip_ignorable();
    if (pos_ >= lines_.size()) return json::object();

    current_ = pos_;
    if (is_sequence_entry(lines_[pos_].text)) {
      fail("header must be a mapping");
    }
    json root = parse_mapping(lines_[pos_].indent);

    skip_ignorable();
    if (pos_ < lines_.size()) {
      current_ = pos_;
      fail("unexpected de-indented content");
    }
    return root;
  }

 private:
  struct Line {
    std::string raw;
    std::string text;  // without indentation and trailing whitespace
    size_t indent = 0;
    bool blank = false;
  };

  std::vector<Line> lines_;
  size_t pos_ = 0;
  size_t current_ = 0;

  [[noreturn]] void fail(const std::string& what) const {
    throw YamlError("line " + std::to_string(current_ + 1) + ": " + what);
  }

  bool is_ignorable(const Line& line) const {
    return line.blank || line.text[0] == '#';
  }

  void skip_ignorable() {
    while (pos_ < lines_.size() && is_ignorable(lines_[pos_])) ++pos_;
  }

  size_t peek_significant() const {
    size_t i = pos_;
    while (i < lines_.size() && is_ignorable(lines_[i])) ++i;
    return i;
  }

  json parse_mapping(size_t indent) {
    json mapping = json::object();
    while (true) {
      skip_ignorable();
      if (pos_ >= lines_.size()) break;

      const auto& line = lines_[pos_];
      current_ = pos_;
      if (line.indent < indent) break;
      if (line.indent > indent) fail("unexpected indentation");
      if (is_sequence_entry(line.text)) fail("sequence entry where a key was expected");

      auto [key, rest] = split_key(line.text);
      if (mapping.contains(key)) {
        spdlog::debug("line {}: duplicate key '{}', last value wins", current_ + 1, key);
      }
      ++pos_;
      mapping[key] = parse_value(rest, indent, true);
    }
    return mapping;
  }

  json parse_sequence(size_t indent) {
    json sequence = json::array();
    while (true) {
      skip_ignorable();
      if (pos_ >= lines_.size()) break;

      auto& line = lines_[pos_];
      current_ = pos_;
      if (line.indent < indent) break;
      if (line.indent > indent) fail("unexpected indentation");
      if (!is_sequence_entry(line.text)) break;

      std::string rest = trim(line.text.substr(1));
      bool compact_mapping = !rest.empty() && rest[0] != '"' && rest[0] != '\'' && rest[0] != '[' && rest[0] != '{' &&
                             rest[0] != '#' && find_key_separator(rest) != std::string::npos;
      if (compact_mapping) {
        // "- key: value" opens a mapping aligned with the first key
        size_t column = line.indent + (line.text.size() - rest.size());
        line.indent = column;
        line.text = rest;
        sequence.push_back(parse_mapping(column));
        continue;
      }

      ++pos_;
      sequence.push_back(parse_value(rest, indent, false));
    }
    return sequence;
  }

  // Value following "key:" or "-"; indent is the indentation of that line
  json parse_value(const std::string& rest, size_t indent, bool in_mapping) {
    if (rest.empty() || rest[0] == '#') {
      size_t next = peek_significant();
      if (next < lines_.size()) {
        const auto& child = lines_[next];
        if (child.indent > indent) {
          pos_ = next;
          if (is_sequence_entry(child.text)) return parse_sequence(child.indent);
          if (is_mapping_entry(child.text)) return parse_mapping(child.indent);

          // Scalar starting on the line below its key
          current_ = next;
          ++pos_;
          return parse_scalar(child.text, indent);
        }
        // Block sequences may sit at the same indentation as their key
        if (in_mapping && child.indent == indent && is_sequence_entry(child.text)) {
          pos_ = next;
          return parse_sequence(indent);
        }
      }
      return "";
    }

    if (rest[0] == '|' || rest[0] == '>') {
      return parse_block_scalar(rest, indent);
    }
    return parse_scalar(rest, indent);
  }

  // Flow, quoted or plain scalar; plain scalars continue on lines indented past indent
  json parse_scalar(const std::string& text, size_t indent) {
    if (text[0] == '[' || text[0] == '{') {
      return parse_flow(text);
    }
    if (text[0] == '"' || text[0] == '\'') {
      size_t end = 0;
      std::string value = parse_quoted(text, end);
      auto tail = trim(text.substr(end));
      if (!tail.empty() && tail[0] != '#') fail("unexpected text after quoted scalar");
      return value;
    }
    return parse_plain(strip_comment(text), indent);
  }

  std::pair<std::string, std::string> split_key(const std::string& text) {
    std::string key;
    size_t after = 0;
    if (text[0] == '"' || text[0] == '\'') {
      size_t end = 0;
      key = parse_quoted(text, end);
      if (end >= text.size() || text[end] != ':') fail("expected ':' after quoted key");
      after = end + 1;
    } else {
      size_t colon = find_key_separator(text);
      if (colon == std::string::npos) fail("expected 'key: value'");
      key = trim(text.substr(0, colon));
      after = colon + 1;
    }
    if (key.empty()) fail("empty key");
    return {key, trim(text.substr(after))};
  }

  // Quoted scalar starting at text[0]; end receives the index past the closing quote
  std::string parse_quoted(const std::string& text, size_t& end) {
    const char quote = text[0];
    std::string out;
    for (size_t i = 1; i < text.size(); ++i) {
      char c = text[i];
      if (quote == '\'') {
        if (c == '\'') {
          if (i + 1 < text.size() && text[i + 1] == '\'') {
            out += '\'';
            ++i;
            continue;
          }
          end = i + 1;
          return out;
        }
        out += c;
        continue;
      }

      if (c == '\\' && i + 1 < text.size()) {
        char next = text[++i];
        switch (next) {
          case 'n':
            out += '\n';
            break;
          case 't':
            out += '\t';
            break;
          case 'r':
            out += '\r';
            break;
          case '0':
            out += '\0';
            break;
          default:
            out += next;
            break;
        }
        continue;
      }
      if (c == '"') {
        end = i + 1;
        return out;
      }
      out += c;
    }
    fail("unterminated quoted scalar");
  }

  std::string flow_scalar(const std::string& item) {
    if (!item.empty() && (item[0] == '"' || item[0] == '\'')) {
      size_t end = 0;
      std::string value = parse_quoted(item, end);
      if (end != item.size()) fail("unexpected text after quoted scalar");
      return value;
    }
    return plain_scalar(item);
  }

  // Single-line flow collection: [a, "b"] or {k: v}
  json parse_flow(const std::string& text) {
    const char open = text[0];
    const char close = open == '[' ? ']' : '}';

    std::vector<std::string> items;
    std::string current;
    char in_quote = 0;
    bool closed = false;
    size_t i = 1;
    for (; i < text.size(); ++i) {
      char c = text[i];
      if (in_quote) {
        current += c;
        if (in_quote == '"' && c == '\\' && i + 1 < text.size()) {
          current += text[++i];
        } else if (c == in_quote) {
          if (in_quote == '\'' && i + 1 < text.size() && text[i + 1] == '\'') {
            current += text[++i];
          } else {
            in_quote = 0;
          }
        }
        continue;
      }
      if (c == '"' || c == '\'') {
        in_quote = c;
        current += c;
        continue;
      }
      if (c == close) {
        closed = true;
        break;
      }
      if (c == '[' || c == '{' || c == ']' || c == '}') fail("nested flow collections are not supported");
      if (c == ',') {
        items.push_back(current);
        current.clear();
        continue;
      }
      current += c;
    }
    if (!closed) fail("unterminated flow collection");

    auto tail = trim(text.substr(i + 1));
    if (!tail.empty() && tail[0] != '#') fail("unexpected text after flow collection");
    items.push_back(current);

    json result = open == '[' ? json::array() : json::object();
    for (size_t n = 0; n < items.size(); ++n) {
      auto item = trim(items[n]);
      if (item.empty()) {
        // "[]" and a trailing comma are fine, an empty item in between is not
        if (n + 1 == items.size()) continue;
        fail("empty flow collection entry");
      }
      if (open == '[') {
        result.push_back(flow_scalar(item));
      } else {
        auto [key, value] = split_key(item);
        result[key] = flow_scalar(value);
      }
    }
    return result;
  }

  // Literal (|) or folded (>) block scalar with optional chomping indicator
  std::string parse_block_scalar(const std::string& header, size_t indent) {
    const char style = header[0];
    char chomp = 'c';
    for (size_t i = 1; i < header.size(); ++i) {
      char c = header[i];
      if (c == '-' || c == '+') {
        chomp = c;
      } else if (std::isdigit(static_cast<unsigned char>(c))) {
        continue;
      } else if (c == ' ' || c == '\t') {
        auto tail = trim(header.substr(i));
        if (!tail.empty() && tail[0] != '#') fail("invalid block scalar header");
        break;
      } else {
        fail("invalid block scalar header");
      }
    }

    std::vector<std::string> content;
    size_t block_indent = 0;
    bool found = false;
    while (pos_ < lines_.size()) {
      const auto& line = lines_[pos_];
      if (line.blank) {
        content.emplace_back();
        ++pos_;
        continue;
      }
      if (line.indent <= indent) break;

      current_ = pos_;
      if (!found) {
        block_indent = line.indent;
        found = true;
      }
      if (line.indent < block_indent) fail("inconsistent block scalar indentation");
      content.push_back(rtrim(line.raw.substr(block_indent)));
      ++pos_;
    }

    size_t last = content.size();
    while (last > 0 && content[last - 1].empty()) --last;
    if (last == 0) return "";
    size_t trailing = content.size() - last;

    std::string value;
    if (style == '|') {
      for (size_t i = 0; i < last; ++i) {
        if (i > 0) value += '\n';
        value += content[i];
      }
    } else {
      // Single line breaks fold into spaces, empty lines become newlines
      bool after_break = true;
      for (size_t i = 0; i < last; ++i) {
        if (content[i].empty()) {
          value += '\n';
          after_break = true;
          continue;
        }
        if (!after_break) value += ' ';
        value += content[i];
        after_break = false;
      }
    }

    if (chomp == 'c') {
      value += '\n';
    } else if (chomp == '+') {
      value += std::string(trailing + 1, '\n');
    }
    return value;
  }

  // Plain scalar, possibly continued on more-indented lines
  std::string parse_plain(const std::string& first, size_t indent) {
    std::string value = first;
    while (true) {
      size_t next = pos_;
      size_t blanks = 0;
      while (next < lines_.size() && lines_[next].blank) {
        ++blanks;
        ++next;
      }
      if (next >= lines_.size()) break;

      const auto& line = lines_[next];
      if (line.indent <= indent || line.text[0] == '#') break;

      current_ = next;
      if (find_key_separator(line.text) != std::string::npos) fail("mapping values are not allowed in a multi-line scalar");
      value += blanks > 0 ? std::string(blanks, '\n') : " ";
      value += strip_comment(line.text);
      pos_ = next + 1;
    }
    return plain_scalar(value);
  }
};

}  // namespace

Result<json> parse_yaml_subset(const std::string& text) {
  try {
    YamlSubsetParser parser(text);
    return Result<json>::success(parser.parse());
  } catch (const YamlError& e) {
    return Result<json>::failure(e.what());
  }
}

// ============================================================================
// Header / body split
// ============================================================================

Document parse_document(const std::string& raw) {
  Document doc;
  doc.body = raw;

  size_t start = raw.compare(0, 3, kUtf8Bom) == 0 ? 3 : 0;
  size_t first_end = raw.find('\n', start);
  if (first_end == std::string::npos || rtrim(raw.substr(start, first_end - start)) != kDelimiter) {
    return doc;
  }

  // Find the closing delimiter line
  size_t header_start = first_end + 1;
  size_t pos = header_start;
  while (pos <= raw.size()) {
    size_t end = raw.find('\n', pos);
    std::string line = raw.substr(pos, end == std::string::npos ? std::string::npos : end - pos);

    if (rtrim(line) == kDelimiter) {
      auto header = parse_yaml_subset(raw.substr(header_start, pos - header_start));
      if (!header.ok()) {
        spdlog::debug("Discarding malformed skill header: {}", header.error.value_or("unknown error"));
        return doc;
      }
      doc.header = std::move(*header.value);
      doc.body = (end == std::string::npos) ? "" : raw.substr(end + 1);
      return doc;
    }

    if (end == std::string::npos) break;
    pos = end + 1;
  }

  return doc;
}

}  // namespace skillpack::skill
