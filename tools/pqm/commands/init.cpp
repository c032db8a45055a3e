/**
 * pqm CLI - init command
 *
 * Scaffold a repository: default pqm.json plus a first index build.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pqm::cli::commands {

namespace {

struct InitOptions {
    bool force = false;
};

int cmd_init(const GlobalOptions& opts, const InitOptions& init_opts) {
    init_warning_collector(opts.json, opts.quiet);

    std::string root = resolve_repository_root(opts.root);
    if (!create_directories(root)) {
        print_error("Cannot create repository root: " + root, opts.json);
        return 1;
    }

    std::string config_path = join_path(root, kConfigFileName);
    if (path_exists(config_path) && !init_opts.force) {
        print_error(std::string(kConfigFileName) + " already exists in " + root, opts.json);
        return 1;
    }

    auto written = atomic_write_file(config_path, serialize_repository_config(RepositoryConfig{}));
    if (!written.ok) {
        print_error("Failed to write " + config_path + ": " + written.error, opts.json);
        return 1;
    }

    auto manager = open_manager(opts, false);
    if (!manager) return 1;

    auto built = manager->build_index();
    if (built.isErr()) {
        print_error(built.error(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["root"] = manager->root();
        j["config"] = config_path;
        j["indexed"] = built.value().indexed;
        j["skipped"] = failures_to_json(built.value().skipped);
        output_json(j);
    } else {
        print_success("Initialized repository in " + manager->root(), opts.json);
        std::cout << "  Config: " << config_path << std::endl;
        std::cout << "  Indexed: " << built.value().indexed << " scripts" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_init(CLI::App* app, GlobalOptions& opts) {
    static InitOptions init_opts;

    app->add_flag("-f,--force", init_opts.force, "Overwrite an existing pqm.json");

    app->callback([&opts]() {
        std::exit(cmd_init(opts, init_opts));
    });
}

} // namespace pqm::cli::commands
