#pragma once

#include <string>
#include <vector>

namespace pqm {

// ============================================================================
// Defaults
// ============================================================================

constexpr const char* kDefaultCategory = "Uncategorized";
constexpr const char* kDefaultVersion = "1.0";
constexpr const char* kDefaultExtension = ".pq";
constexpr const char* kDefaultIndexFile = "index.jsonl";

// ============================================================================
// Script Metadata (the header block of a script file)
// ============================================================================

struct ScriptMetadata {
    std::string name;                       // REQUIRED, unique (case-insensitive)
    std::string category = kDefaultCategory;
    std::vector<std::string> tags;
    std::vector<std::string> dependencies;  // names of scripts required first
    std::string description;
    std::string version = kDefaultVersion;  // opaque
};

bool operator==(const ScriptMetadata& a, const ScriptMetadata& b);
inline bool operator!=(const ScriptMetadata& a, const ScriptMetadata& b) { return !(a == b); }

// ============================================================================
// Script Record (one managed file)
// ============================================================================

struct ScriptRecord {
    ScriptMetadata meta;
    std::string body;   // script text after the header block
    std::string path;   // current on-disk location
};

// ============================================================================
// Index Entry (metadata-only projection persisted in the index snapshot)
// ============================================================================

struct IndexEntry {
    ScriptMetadata meta;
    std::string path;    // relative to the repository root, '/' separated
    std::string sha256;  // digest of the file content at index time
};

bool operator==(const IndexEntry& a, const IndexEntry& b);
inline bool operator!=(const IndexEntry& a, const IndexEntry& b) { return !(a == b); }

// ============================================================================
// Name Helpers
// ============================================================================

// ASCII lowercase; script names compare case-insensitively everywhere
std::string fold_name(const std::string& name);

// Case-insensitive equality of two script names
bool same_name(const std::string& a, const std::string& b);

} // namespace pqm
