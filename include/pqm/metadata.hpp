#pragma once

#include "pqm/types.hpp"

#include <string>
#include <vector>

namespace pqm {

// ============================================================================
// Metadata Codec
// ============================================================================
//
// A script file is a YAML front matter block followed by the body:
//
//   ---
//   name: "fn_A"
//   category: "Helpers"
//   tags: ["date"]
//   dependencies: []
//   description: "Formats dates"
//   version: "1.0"
//   ---
//
//   <body>
//
// Exactly one blank line after the closing delimiter is consumed; the rest
// is the body verbatim.

constexpr const char* kFrontMatterDelimiter = "---";

struct MetadataParseResult {
    bool ok = false;
    std::string error;
    ScriptMetadata metadata;
    std::string body;
    std::vector<std::string> warnings;
};

// Parse header + body. Fails when the header block is absent or unterminated,
// when the YAML is not a mapping, when name is missing or empty, when tags or
// dependencies are not lists of scalars, or when a scalar field is not a scalar.
MetadataParseResult parse_script_text(const std::string& raw_text);

// Serialize header + body. parse_script_text(serialize_script(m, b)) yields (m, b)
// for any metadata validate_metadata accepts. An empty category reads back
// as the default category.
std::string serialize_script(const ScriptMetadata& metadata, const std::string& body);

// Replace CR/LF with spaces and trim, as applied to scalar fields at parse time
std::string normalize_scalar(const std::string& value);

} // namespace pqm
