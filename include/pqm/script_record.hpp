#pragma once

#include "pqm/error.hpp"
#include "pqm/types.hpp"

#include <string>
#include <vector>

namespace pqm {

// ============================================================================
// Script Files
// ============================================================================

struct ScriptLoadResult {
    bool ok = false;
    ErrorCode error_code = ErrorCode::MALFORMED_METADATA;  // IO_ERROR when unreadable
    std::string error;
    ScriptRecord record;
    std::string sha256;  // digest of the raw file content
    std::vector<std::string> warnings;
};

// Read and parse one script file. record.path is set to `path`.
ScriptLoadResult load_script_file(const std::string& path);

// Serialized file content (header + body)
std::string script_file_content(const ScriptRecord& record);

// Metadata projection for the index; path made relative to `root`.
// `sha256` is the digest of the file content as it sits on disk.
IndexEntry to_index_entry(const ScriptRecord& record, const std::string& root,
                          const std::string& sha256);

// ============================================================================
// Storage Layout
// ============================================================================

// Keep alphanumerics, space, '_' and '-'; trailing spaces dropped
std::string sanitize_path_component(const std::string& text);

// Folder name for a category (default category when nothing survives sanitizing)
std::string category_folder(const std::string& category);

// <root>/<category folder>/<sanitized name><extension>
Result<std::string> script_path_for(const std::string& root,
                                    const std::string& category,
                                    const std::string& name,
                                    const std::string& extension = kDefaultExtension);

// Basic shape checks applied before any create/rewrite
Result<void> validate_metadata(const ScriptMetadata& metadata);

} // namespace pqm
