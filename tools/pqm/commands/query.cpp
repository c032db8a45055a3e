/**
 * pqm CLI - search, show, categories and tree commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pqm::cli::commands {

namespace {

struct SearchOptions {
    std::string query;
    std::string category;
};

struct ShowOptions {
    std::string name;
    bool body_only = false;
};

struct TreeOptions {
    std::string name;
    bool dependents = false;
};

int cmd_search(const GlobalOptions& opts, const SearchOptions& search_opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    std::vector<IndexEntry> matches;
    for (auto& entry : manager->search(search_opts.query)) {
        if (!search_opts.category.empty() && !same_name(entry.meta.category, search_opts.category)) {
            continue;
        }
        matches.push_back(std::move(entry));
    }

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& e : matches) j.push_back(entry_to_json(e));
        output_json(j);
        return 0;
    }

    if (matches.empty()) {
        std::cout << "No scripts found." << std::endl;
        return 0;
    }
    for (const auto& e : matches) {
        std::cout << e.meta.name << "  [" << e.meta.category << "]";
        if (!e.meta.description.empty()) std::cout << "  " << e.meta.description;
        std::cout << std::endl;
    }
    return 0;
}

int cmd_show(const GlobalOptions& opts, const ShowOptions& show_opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    auto script = manager->get_script(show_opts.name);
    if (script.isErr()) {
        print_error(script.error(), opts.json);
        return 1;
    }
    const auto& record = script.value();

    if (opts.json) {
        auto entry = manager->get(show_opts.name);
        nlohmann::json j = entry ? entry_to_json(*entry) : nlohmann::json::object();
        j["body"] = record.body;
        output_json(j);
        return 0;
    }

    if (show_opts.body_only) {
        std::cout << record.body;
        return 0;
    }

    const auto& m = record.meta;
    std::cout << m.name << std::endl;
    std::cout << "  Category:     " << m.category << std::endl;
    std::cout << "  Version:      " << m.version << std::endl;
    if (!m.description.empty()) std::cout << "  Description:  " << m.description << std::endl;
    if (!m.tags.empty()) {
        std::cout << "  Tags:        ";
        for (const auto& t : m.tags) std::cout << " " << t;
        std::cout << std::endl;
    }
    if (!m.dependencies.empty()) {
        std::cout << "  Requires:    ";
        for (const auto& d : m.dependencies) std::cout << " " << d;
        std::cout << std::endl;
    }
    std::cout << "  Path:         " << record.path << std::endl;
    std::cout << std::endl << record.body;
    if (!record.body.empty() && record.body.back() != '\n') std::cout << std::endl;
    return 0;
}

int cmd_categories(const GlobalOptions& opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    auto categories = manager->list_categories();
    if (opts.json) {
        output_json(nlohmann::json(categories));
    } else {
        for (const auto& c : categories) std::cout << c << std::endl;
    }
    return 0;
}

nlohmann::json tree_to_json(const DependencyTreeNode& node) {
    nlohmann::json j;
    j["name"] = node.name;
    j["resolved"] = node.resolved;
    j["requires"] = nlohmann::json::array();
    for (const auto& child : node.children) j["requires"].push_back(tree_to_json(child));
    return j;
}

void print_tree(const DependencyTreeNode& node, const std::string& prefix, bool last, bool root) {
    if (root) {
        std::cout << node.name;
    } else {
        std::cout << prefix << (last ? "`-- " : "|-- ") << node.name;
    }
    if (!node.resolved) std::cout << " (missing)";
    std::cout << std::endl;

    std::string child_prefix = root ? "" : prefix + (last ? "    " : "|   ");
    for (size_t i = 0; i < node.children.size(); ++i) {
        print_tree(node.children[i], child_prefix, i + 1 == node.children.size(), false);
    }
}

int cmd_tree(const GlobalOptions& opts, const TreeOptions& tree_opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    if (tree_opts.dependents) {
        auto dependents = manager->dependents_of(tree_opts.name);
        if (dependents.isErr()) {
            print_error(dependents.error(), opts.json);
            return 1;
        }
        if (opts.json) {
            output_json(nlohmann::json(dependents.value()));
        } else {
            for (const auto& d : dependents.value()) std::cout << d << std::endl;
        }
        return 0;
    }

    auto tree = manager->dependency_tree(tree_opts.name);
    if (tree.isErr()) {
        print_error(tree.error(), opts.json);
        return 1;
    }
    if (opts.json) {
        output_json(tree_to_json(tree.value()));
    } else {
        print_tree(tree.value(), "", true, true);
    }
    return 0;
}

} // anonymous namespace

void setup_search(CLI::App* app, GlobalOptions& opts) {
    static SearchOptions search_opts;

    app->add_option("query", search_opts.query, "Text to look for (empty lists everything)");
    app->add_option("-c,--category", search_opts.category, "Only this category");

    app->callback([&opts]() {
        std::exit(cmd_search(opts, search_opts));
    });
}

void setup_show(CLI::App* app, GlobalOptions& opts) {
    static ShowOptions show_opts;

    app->add_option("name", show_opts.name, "Script name")->required();
    app->add_flag("--body", show_opts.body_only, "Print only the script body");

    app->callback([&opts]() {
        std::exit(cmd_show(opts, show_opts));
    });
}

void setup_categories(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_categories(opts));
    });
}

void setup_tree(CLI::App* app, GlobalOptions& opts) {
    static TreeOptions tree_opts;

    app->add_option("name", tree_opts.name, "Script name")->required();
    app->add_flag("--dependents", tree_opts.dependents, "List scripts that require it instead");

    app->callback([&opts]() {
        std::exit(cmd_tree(opts, tree_opts));
    });
}

} // namespace pqm::cli::commands
