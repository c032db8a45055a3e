/**
 * pqm CLI - Entry Point
 *
 * Script repository manager command-line interface.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace pqm::cli::commands {
    void setup_init(CLI::App* app, GlobalOptions& opts);
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_refresh(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_search(CLI::App* app, GlobalOptions& opts);
    void setup_show(CLI::App* app, GlobalOptions& opts);
    void setup_categories(CLI::App* app, GlobalOptions& opts);
    void setup_tree(CLI::App* app, GlobalOptions& opts);
    void setup_resolve(CLI::App* app, GlobalOptions& opts);
    void setup_suggest(CLI::App* app, GlobalOptions& opts);
    void setup_create(CLI::App* app, GlobalOptions& opts);
    void setup_move(CLI::App* app, GlobalOptions& opts);
    void setup_edit(CLI::App* app, GlobalOptions& opts);
    void setup_delete(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace pqm::cli;

    CLI::App app{"pqm - script repository manager"};
    app.set_version_flag("-V,--version", PQM_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Repository root (default: $PQM_ROOT or current directory)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Repository
    commands::setup_init(app.add_subcommand("init", "Write a default pqm.json and an empty index"), opts);

    // Index
    commands::setup_build(app.add_subcommand("build", "Rebuild the index from the script files"), opts);
    commands::setup_refresh(app.add_subcommand("refresh", "Reconcile the index with the script files"), opts);
    commands::setup_check(app.add_subcommand("check", "Compare the index with the files on disk"), opts);

    // Queries
    commands::setup_search(app.add_subcommand("search", "Search names, tags and descriptions"), opts);
    commands::setup_show(app.add_subcommand("show", "Print one script"), opts);
    commands::setup_categories(app.add_subcommand("categories", "List categories"), opts);
    commands::setup_tree(app.add_subcommand("tree", "Show the dependency tree of a script"), opts);

    // Dependencies
    commands::setup_resolve(app.add_subcommand("resolve", "Print scripts in insertion order"), opts);
    commands::setup_suggest(app.add_subcommand("suggest", "Detect dependencies from a script body"), opts);

    // Edits
    commands::setup_create(app.add_subcommand("create", "Create a script"), opts);
    commands::setup_move(app.add_subcommand("move", "Move a script to another category"), opts);
    commands::setup_edit(app.add_subcommand("edit", "Edit metadata or body of a script"), opts);
    commands::setup_delete(app.add_subcommand("delete", "Delete a script"), opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
