/**
 * pqm CLI - build, refresh and check commands
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace pqm::cli::commands {

namespace {

void print_skipped(const std::vector<FileFailure>& skipped) {
    for (const auto& f : skipped) {
        print_warning("skipped " + f.path + ": " + f.error.message());
    }
}

int cmd_build(const GlobalOptions& opts) {
    auto manager = open_manager(opts, false);
    if (!manager) return 1;

    auto built = manager->build_index();
    if (built.isErr()) {
        print_error(built.error(), opts.json);
        return 1;
    }

    const auto& report = built.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["indexed"] = report.indexed;
        j["skipped"] = failures_to_json(report.skipped);
        output_json(j);
    } else {
        print_skipped(report.skipped);
        print_success("Indexed " + std::to_string(report.indexed) + " scripts (" +
                          std::to_string(report.skipped.size()) + " skipped)",
                      opts.json);
    }
    return 0;
}

int cmd_refresh(const GlobalOptions& opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    auto refreshed = manager->refresh_index();
    if (refreshed.isErr()) {
        print_error(refreshed.error(), opts.json);
        return 1;
    }

    const auto& summary = refreshed.value().summary;
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["added"] = summary.added;
        j["removed"] = summary.removed;
        j["updated"] = summary.updated;
        j["unchanged"] = summary.unchanged.size();
        j["skipped"] = failures_to_json(refreshed.value().skipped);
        output_json(j);
        return 0;
    }

    print_skipped(refreshed.value().skipped);
    if (!summary.changed()) {
        std::cout << "Index up to date (" << summary.unchanged.size() << " scripts)" << std::endl;
        return 0;
    }
    for (const auto& n : summary.added) std::cout << "  + " << n << std::endl;
    for (const auto& n : summary.removed) std::cout << "  - " << n << std::endl;
    for (const auto& n : summary.updated) std::cout << "  ~ " << n << std::endl;
    return 0;
}

int cmd_check(const GlobalOptions& opts) {
    auto manager = open_manager(opts);
    if (!manager) return 1;

    auto checked = manager->check_consistency();
    if (checked.isErr()) {
        print_error(checked.error(), opts.json);
        return 1;
    }

    const auto& report = checked.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.consistent();
        j["missing_files"] = report.missing_files;
        j["stale_entries"] = report.stale_entries;
        j["unindexed_files"] = report.unindexed_files;
        output_json(j);
    } else if (report.consistent()) {
        std::cout << "Index is consistent with the repository" << std::endl;
    } else {
        for (const auto& n : report.missing_files) std::cout << "  missing file: " << n << std::endl;
        for (const auto& n : report.stale_entries) std::cout << "  stale entry:  " << n << std::endl;
        for (const auto& p : report.unindexed_files) std::cout << "  not indexed:  " << p << std::endl;
        std::cout << "Run 'pqm refresh' to reconcile." << std::endl;
    }
    return report.consistent() ? 0 : 2;
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_build(opts));
    });
}

void setup_refresh(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_refresh(opts));
    });
}

void setup_check(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_check(opts));
    });
}

} // namespace pqm::cli::commands
