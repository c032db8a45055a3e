#include "pqm/config.hpp"
#include "pqm/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace pqm {

namespace {

const std::vector<std::string> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

const std::vector<std::string> kKnownKeys = {
    "$schema", "index_file", "script_extension", "default_category",
    "lock_timeout_ms", "use_file_lock", "log_level"
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_known_level(const std::string& level) {
    return std::find(kLogLevels.begin(), kLogLevels.end(), level) != kLogLevels.end();
}

// A bare file name: no separators, not hidden-dot-only
bool is_plain_file_name(const std::string& name) {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

std::optional<int> parse_positive_int(const std::string& text) {
    std::string t = trim(text);
    if (t.empty() || t.size() > 9) return std::nullopt;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    return std::stoi(t);
}

} // namespace

ConfigParseResult parse_repository_config(const std::string& json_str,
                                          const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (j.contains("$schema")) {
            if (!j["$schema"].is_string() || trim(j["$schema"].get<std::string>()) != kConfigSchema) {
                result.warnings.push_back(std::string("$schema mismatch: expected ") + kConfigSchema);
            }
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (std::find(kKnownKeys.begin(), kKnownKeys.end(), it.key()) == kKnownKeys.end()) {
                result.warnings.push_back("unknown key: " + it.key());
            }
        }

        auto& cfg = result.config;

        if (j.contains("index_file")) {
            const auto& v = j["index_file"];
            if (v.is_string() && is_plain_file_name(trim(v.get<std::string>()))) {
                cfg.index_file = trim(v.get<std::string>());
            } else {
                result.warnings.push_back("index_file must be a plain file name");
            }
        }

        if (j.contains("script_extension")) {
            const auto& v = j["script_extension"];
            if (v.is_string() && v.get<std::string>().size() > 1 &&
                v.get<std::string>()[0] == '.') {
                cfg.script_extension = v.get<std::string>();
            } else {
                result.warnings.push_back("script_extension must start with '.'");
            }
        }

        if (j.contains("default_category")) {
            const auto& v = j["default_category"];
            if (v.is_string() && !trim(v.get<std::string>()).empty()) {
                cfg.default_category = trim(v.get<std::string>());
            } else {
                result.warnings.push_back("default_category must be a non-empty string");
            }
        }

        if (j.contains("lock_timeout_ms")) {
            const auto& v = j["lock_timeout_ms"];
            if (v.is_number_integer() && v.get<int>() >= 0) {
                cfg.lock_timeout_ms = v.get<int>();
            } else {
                result.warnings.push_back("lock_timeout_ms must be a non-negative integer");
            }
        }

        if (j.contains("use_file_lock")) {
            const auto& v = j["use_file_lock"];
            if (v.is_boolean()) {
                cfg.use_file_lock = v.get<bool>();
            } else {
                result.warnings.push_back("use_file_lock must be a boolean");
            }
        }

        if (j.contains("log_level")) {
            const auto& v = j["log_level"];
            if (v.is_string() && is_known_level(to_lower(trim(v.get<std::string>())))) {
                cfg.log_level = to_lower(trim(v.get<std::string>()));
            } else {
                result.warnings.push_back("log_level must be one of trace, debug, info, warn, error, critical, off");
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_repository_config(const std::string& root) {
    ConfigParseResult result;
    std::string config_path = join_path(root, kConfigFileName);

    if (path_exists(config_path)) {
        auto content = read_file(config_path);
        if (!content) {
            result.warnings.push_back("cannot read " + config_path + "; using defaults");
        } else {
            auto parsed = parse_repository_config(*content, config_path);
            if (parsed.ok) {
                result = std::move(parsed);
            } else {
                result.warnings.push_back("invalid " + config_path + " (" + parsed.error +
                                          "); using defaults");
            }
        }
    }

    // Environment overrides
    if (auto level = get_env("PQM_LOG_LEVEL")) {
        std::string lowered = to_lower(trim(*level));
        if (is_known_level(lowered)) {
            result.config.log_level = lowered;
        } else {
            result.warnings.push_back("PQM_LOG_LEVEL ignored: unknown level " + *level);
        }
    }
    if (auto timeout = get_env("PQM_LOCK_TIMEOUT_MS")) {
        if (auto ms = parse_positive_int(*timeout)) {
            result.config.lock_timeout_ms = *ms;
        } else {
            result.warnings.push_back("PQM_LOCK_TIMEOUT_MS ignored: not an integer");
        }
    }

    result.ok = true;
    return result;
}

std::string serialize_repository_config(const RepositoryConfig& config) {
    nlohmann::json j;
    j["$schema"] = kConfigSchema;
    j["index_file"] = config.index_file;
    j["script_extension"] = config.script_extension;
    j["default_category"] = config.default_category;
    j["lock_timeout_ms"] = config.lock_timeout_ms;
    j["use_file_lock"] = config.use_file_lock;
    j["log_level"] = config.log_level;
    return j.dump(2) + "\n";
}

} // namespace pqm
