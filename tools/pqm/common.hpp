/**
 * pqm CLI - Common utilities and types
 */

#pragma once

#include <pqm/log.hpp>
#include <pqm/manager.hpp>
#include <pqm/platform.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pqm::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the repository root.
 * Priority: --root flag > PQM_ROOT env > current directory
 */
inline std::string resolve_repository_root(const std::string& override_root) {
    if (!override_root.empty()) {
        return override_root;
    }

    auto env_root = get_env("PQM_ROOT");
    if (env_root && !env_root->empty()) {
        return *env_root;
    }

    return ".";
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline nlohmann::json error_to_json(const Error& error) {
    nlohmann::json j;
    j["code"] = error_code_to_string(error.code());
    j["message"] = error.message();
    if (!error.subject().empty()) j["subject"] = error.subject();
    if (!error.related().empty()) j["related"] = error.related();
    return j;
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error_to_json(error);
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
        return;
    }

    std::cerr << "Error: " << error.toString() << std::endl;
    if (!error.related().empty()) {
        std::cerr << "  involves:";
        for (const auto& name : error.related()) std::cerr << " " << name;
        std::cerr << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline nlohmann::json entry_to_json(const IndexEntry& entry) {
    nlohmann::json j;
    j["name"] = entry.meta.name;
    j["category"] = entry.meta.category;
    j["tags"] = entry.meta.tags;
    j["dependencies"] = entry.meta.dependencies;
    j["description"] = entry.meta.description;
    j["version"] = entry.meta.version;
    j["path"] = entry.path;
    return j;
}

inline nlohmann::json failures_to_json(const std::vector<FileFailure>& failures) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : failures) {
        arr.push_back({{"path", f.path}, {"error", error_to_json(f.error)}});
    }
    return arr;
}

/**
 * Split a comma-separated option value ("a, b,c") into trimmed items.
 */
inline std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::string current;
    auto flush = [&]() {
        size_t b = current.find_first_not_of(" \t");
        size_t e = current.find_last_not_of(" \t");
        if (b != std::string::npos) items.push_back(current.substr(b, e - b + 1));
        current.clear();
    };
    for (char c : value) {
        if (c == ',') {
            flush();
        } else {
            current.push_back(c);
        }
    }
    flush();
    return items;
}

/**
 * Open the repository selected by the global options and apply the log level.
 * Prints the error and returns nullptr on failure.
 */
inline std::unique_ptr<Manager> open_manager(const GlobalOptions& opts,
                                             bool warn_unbuilt_index = true) {
    init_warning_collector(opts.json, opts.quiet);
    log_to_stderr();

    std::string root = resolve_repository_root(opts.root);
    auto loaded = load_repository_config(root);

    std::string level = loaded.config.log_level;
    if (opts.verbose) level = "debug";
    if (opts.quiet) level = "error";
    configure_logging(level);

    for (const auto& w : loaded.warnings) {
        print_warning(w);
    }

    auto manager = Manager::create(root, loaded.config);
    if (manager.isErr()) {
        print_error(manager.error(), opts.json);
        return nullptr;
    }

    if (warn_unbuilt_index && manager.value()->index_status() != IndexLoadStatus::Loaded) {
        print_warning(manager.value()->index_diagnostic());
    }
    return std::move(manager.value());
}

} // namespace pqm::cli
