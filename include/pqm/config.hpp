#pragma once

#include "pqm/types.hpp"

#include <string>
#include <vector>

namespace pqm {

// ============================================================================
// Repository Configuration (<root>/pqm.json, optional)
// ============================================================================

constexpr const char* kConfigFileName = "pqm.json";
constexpr const char* kConfigSchema = "pqm.config.v1";

struct RepositoryConfig {
    std::string index_file = kDefaultIndexFile;
    std::string script_extension = kDefaultExtension;
    std::string default_category = kDefaultCategory;
    int lock_timeout_ms = 5000;
    bool use_file_lock = true;
    std::string log_level = "info";

    // Source path for trace; empty for built-in defaults
    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    RepositoryConfig config;
    std::vector<std::string> warnings;
};

// Parse a configuration document. Unknown or ill-typed fields are warnings
// and keep their defaults; a document that is not a JSON object is an error.
ConfigParseResult parse_repository_config(const std::string& json_str,
                                          const std::string& source_path = "");

// Load <root>/pqm.json and apply environment overrides
// (PQM_LOG_LEVEL, PQM_LOCK_TIMEOUT_MS). A missing file yields defaults;
// an invalid one yields defaults plus a warning.
ConfigParseResult load_repository_config(const std::string& root);

// Serialize for `pqm init`-style scaffolding and tests
std::string serialize_repository_config(const RepositoryConfig& config);

} // namespace pqm
