/**
 * pqm CLI - resolve and suggest commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <algorithm>

namespace pqm::cli::commands {

namespace {

struct ResolveCommandOptions {
    std::vector<std::string> names;
    bool partial = false;
    bool names_only = false;
};

struct SuggestOptions {
    std::string name;
    bool apply = false;
};

nlohmann::json unresolved_to_json(const std::vector<UnresolvedName>& unresolved) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& u : unresolved) {
        arr.push_back({{"name", u.name}, {"missing_from", u.missing_from}});
    }
    return arr;
}

int cmd_resolve(const GlobalOptions& opts, const ResolveCommandOptions& resolve_opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    ResolveOptions options;
    options.allow_partial = resolve_opts.partial;

    auto resolved = manager->resolve(resolve_opts.names, options);
    if (resolved.isErr()) {
        print_error(resolved.error(), opts.json);
        return 1;
    }

    const auto& resolution = resolved.value();
    for (const auto& u : resolution.unresolved) {
        std::string from;
        for (const auto& m : u.missing_from) from += (from.empty() ? "" : ", ") + m;
        print_warning("unresolved '" + u.name + "'" + (from.empty() ? "" : " required by " + from));
    }

    if (opts.json) {
        nlohmann::json j;
        j["scripts"] = nlohmann::json::array();
        for (const auto& s : resolution.scripts) {
            j["scripts"].push_back({{"name", s.name}, {"body", s.body}});
        }
        j["unresolved"] = unresolved_to_json(resolution.unresolved);
        output_json(j);
        return 0;
    }

    for (const auto& s : resolution.scripts) {
        if (resolve_opts.names_only) {
            std::cout << s.name << std::endl;
            continue;
        }
        std::cout << "// ---- " << s.name << " ----" << std::endl;
        std::cout << s.body;
        if (!s.body.empty() && s.body.back() != '\n') std::cout << std::endl;
    }
    return 0;
}

int cmd_suggest(const GlobalOptions& opts, const SuggestOptions& suggest_opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    auto script = manager->get_script(suggest_opts.name);
    if (script.isErr()) {
        print_error(script.error(), opts.json);
        return 1;
    }
    auto suggested = manager->suggest_dependencies(suggest_opts.name);
    if (suggested.isErr()) {
        print_error(suggested.error(), opts.json);
        return 1;
    }

    const auto& declared = script.value().meta.dependencies;
    auto is_declared = [&](const std::string& name) {
        return std::any_of(declared.begin(), declared.end(),
                           [&](const std::string& d) { return same_name(d, name); });
    };

    std::vector<std::string> added;
    for (const auto& s : suggested.value()) {
        if (!is_declared(s)) added.push_back(s);
    }

    if (suggest_opts.apply && !added.empty()) {
        ScriptMetadata meta = script.value().meta;
        meta.dependencies.insert(meta.dependencies.end(), added.begin(), added.end());
        auto edited = manager->apply_metadata_edit(suggest_opts.name, meta);
        if (edited.isErr()) {
            print_error(edited.error(), opts.json);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["name"] = script.value().meta.name;
        j["suggested"] = suggested.value();
        j["undeclared"] = added;
        j["applied"] = suggest_opts.apply && !added.empty();
        output_json(j);
        return 0;
    }

    if (suggested.value().empty()) {
        std::cout << "No dependencies detected." << std::endl;
        return 0;
    }
    for (const auto& s : suggested.value()) {
        std::cout << "  " << s << (is_declared(s) ? "" : "  (not declared)") << std::endl;
    }
    if (suggest_opts.apply && !added.empty()) {
        std::cout << "Added " << added.size() << " dependencies to " << script.value().meta.name
                  << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_resolve(CLI::App* app, GlobalOptions& opts) {
    static ResolveCommandOptions resolve_opts;

    app->add_option("names", resolve_opts.names, "Scripts to resolve")->required();
    app->add_flag("--partial", resolve_opts.partial, "Skip missing dependencies instead of failing");
    app->add_flag("--names-only", resolve_opts.names_only, "Print only the order");

    app->callback([&opts]() {
        std::exit(cmd_resolve(opts, resolve_opts));
    });
}

void setup_suggest(CLI::App* app, GlobalOptions& opts) {
    static SuggestOptions suggest_opts;

    app->add_option("name", suggest_opts.name, "Script name")->required();
    app->add_flag("--apply", suggest_opts.apply, "Append undeclared suggestions to the dependencies");

    app->callback([&opts]() {
        std::exit(cmd_suggest(opts, suggest_opts));
    });
}

} // namespace pqm::cli::commands
