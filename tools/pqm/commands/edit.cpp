/**
 * pqm CLI - create, move, edit and delete commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <iterator>

namespace pqm::cli::commands {

namespace {

struct ScriptFields {
    std::string name;
    std::string category;
    std::string tags;
    std::string dependencies;
    std::string description;
    std::string version;
    std::string body_file;

    // Set by setup_edit; tells which fields were given on the command line
    CLI::Option* name_opt = nullptr;
    CLI::Option* category_opt = nullptr;
    CLI::Option* tags_opt = nullptr;
    CLI::Option* dependencies_opt = nullptr;
    CLI::Option* description_opt = nullptr;
    CLI::Option* version_opt = nullptr;
    CLI::Option* body_opt = nullptr;
};

struct MoveOptions {
    std::string name;
    std::string category;
};

struct DeleteOptions {
    std::string name;
};

bool given(const CLI::Option* opt) {
    return opt != nullptr && opt->count() > 0;
}

// "-" reads standard input
std::optional<std::string> read_body(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    return read_file(source);
}

int report_entry(const GlobalOptions& opts, const IndexEntry& entry, const std::string& verb) {
    if (opts.json) {
        nlohmann::json j = entry_to_json(entry);
        j["ok"] = true;
        output_json(j);
    } else {
        print_success(verb + " " + entry.meta.name + " (" + entry.path + ")", opts.json);
    }
    return 0;
}

int cmd_create(const GlobalOptions& opts, const ScriptFields& fields) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    std::string body;
    if (!fields.body_file.empty()) {
        auto content = read_body(fields.body_file);
        if (!content) {
            print_error("Cannot read body from " + fields.body_file, opts.json);
            return 1;
        }
        body = *content;
    }

    ScriptMetadata meta;
    meta.name = fields.name;
    meta.category = fields.category.empty() ? manager->config().default_category : fields.category;
    meta.tags = split_list(fields.tags);
    meta.dependencies = split_list(fields.dependencies);
    meta.description = fields.description;
    meta.version = fields.version.empty() ? kDefaultVersion : fields.version;

    auto created = manager->create_script(meta, body);
    if (created.isErr()) {
        print_error(created.error(), opts.json);
        return 1;
    }
    return report_entry(opts, created.value(), "Created");
}

int cmd_move(const GlobalOptions& opts, const MoveOptions& move_opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    auto moved = manager->relocate(move_opts.name, move_opts.category);
    if (moved.isErr()) {
        print_error(moved.error(), opts.json);
        return 1;
    }
    return report_entry(opts, moved.value(), "Moved");
}

int cmd_edit(const GlobalOptions& opts, const std::string& target, const ScriptFields& fields) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    auto script = manager->get_script(target);
    if (script.isErr()) {
        print_error(script.error(), opts.json);
        return 1;
    }

    ScriptMetadata meta = script.value().meta;
    if (given(fields.name_opt)) meta.name = fields.name;
    if (given(fields.category_opt)) meta.category = fields.category;
    if (given(fields.tags_opt)) meta.tags = split_list(fields.tags);
    if (given(fields.dependencies_opt)) meta.dependencies = split_list(fields.dependencies);
    if (given(fields.description_opt)) meta.description = fields.description;
    if (given(fields.version_opt)) meta.version = fields.version;

    std::optional<std::string> body;
    if (given(fields.body_opt)) {
        body = read_body(fields.body_file);
        if (!body) {
            print_error("Cannot read body from " + fields.body_file, opts.json);
            return 1;
        }
    }

    auto edited = body ? manager->rewrite_script(target, meta, *body)
                       : manager->apply_metadata_edit(target, meta);
    if (edited.isErr()) {
        print_error(edited.error(), opts.json);
        return 1;
    }
    return report_entry(opts, edited.value(), "Updated");
}

int cmd_delete(const GlobalOptions& opts, const DeleteOptions& delete_opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    auto dependents = manager->dependents_of(delete_opts.name);
    if (dependents.isOk()) {
        for (const auto& d : dependents.value()) {
            print_warning(d + " still requires " + delete_opts.name);
        }
    }

    auto removed = manager->delete_script(delete_opts.name);
    if (removed.isErr()) {
        print_error(removed.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["deleted"] = delete_opts.name;
        output_json(j);
    } else {
        print_success("Deleted " + delete_opts.name, opts.json);
    }
    return 0;
}

} // anonymous namespace

void setup_create(CLI::App* app, GlobalOptions& opts) {
    static ScriptFields fields;

    app->add_option("name", fields.name, "Script name")->required();
    app->add_option("-c,--category", fields.category, "Category (folder)");
    app->add_option("-t,--tags", fields.tags, "Comma-separated tags");
    app->add_option("-d,--depends", fields.dependencies, "Comma-separated dependencies");
    app->add_option("--description", fields.description, "One-line description");
    app->add_option("--script-version", fields.version, "Version label");
    app->add_option("-b,--body", fields.body_file, "Body file ('-' for stdin)");

    app->callback([&opts]() {
        std::exit(cmd_create(opts, fields));
    });
}

void setup_move(CLI::App* app, GlobalOptions& opts) {
    static MoveOptions move_opts;

    app->add_option("name", move_opts.name, "Script name")->required();
    app->add_option("category", move_opts.category, "Target category")->required();

    app->callback([&opts]() {
        std::exit(cmd_move(opts, move_opts));
    });
}

void setup_edit(CLI::App* app, GlobalOptions& opts) {
    static std::string target;
    static ScriptFields fields;

    app->add_option("target", target, "Script to edit")->required();
    fields.name_opt = app->add_option("--name", fields.name, "Rename");
    fields.category_opt = app->add_option("-c,--category", fields.category, "Move to category");
    fields.tags_opt = app->add_option("-t,--tags", fields.tags, "Replace tags (comma-separated)");
    fields.dependencies_opt =
        app->add_option("-d,--depends", fields.dependencies, "Replace dependencies (comma-separated)");
    fields.description_opt = app->add_option("--description", fields.description, "Description");
    fields.version_opt = app->add_option("--script-version", fields.version, "Version label");
    fields.body_opt = app->add_option("-b,--body", fields.body_file, "Replace body ('-' for stdin)");

    app->callback([&opts]() {
        std::exit(cmd_edit(opts, target, fields));
    });
}

void setup_delete(CLI::App* app, GlobalOptions& opts) {
    static DeleteOptions delete_opts;

    app->add_option("name", delete_opts.name, "Script name")->required();

    app->callback([&opts]() {
        std::exit(cmd_delete(opts, delete_opts));
    });
}

} // namespace pqm::cli::commands
