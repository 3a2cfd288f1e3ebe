#pragma once

#include <string>

#include "skillpack/core/types.hpp"

namespace skillpack::skill {

// Parsed SKILL.md document: structured header + opaque body.
// Header values are strings, arrays of strings or nested objects.
struct Document {
  json header = json::object();
  std::string body;
};

// Split a document into its header block and body.
//
// A header block exists only when the first line is exactly "---" and a later
// line is exactly "---" as well. When there is no such pair, or the header
// fails to decode, the header is empty and the body is the whole input.
// Never throws.
Document parse_document(const std::string& raw);

// Decode the YAML subset used by SKILL.md headers into a JSON object.
// Supports plain/quoted scalars, block and flow lists, nested mappings,
// literal (|) and folded (>) block scalars and comments.
Result<json> parse_yaml_subset(const std::string& text);

}  // namespace skillpack::skill
