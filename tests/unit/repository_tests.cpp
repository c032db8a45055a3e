#include <doctest/doctest.h>
#include <pqm/digest.hpp>
#include <pqm/repository.hpp>
#include <pqm/script_record.hpp>

#include "test_helpers.hpp"

#include <future>
#include <optional>

using namespace pqm;

namespace {

std::shared_ptr<RepositoryContext> open_context(const std::string& root) {
    auto opened = RepositoryContext::open(root, test_config());
    REQUIRE(opened.isOk());
    return opened.value();
}

} // namespace

TEST_CASE("context rejects a missing root") {
    TempTestDir dir;
    auto opened = RepositoryContext::open(dir.path + "/nope", test_config());
    REQUIRE(opened.isErr());
    CHECK(opened.error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE("context normalizes the root") {
    TempTestDir dir;
    create_directories(dir.path + "/sub");
    auto ctx = open_context(dir.path + "/sub/../");
    CHECK(ctx->root() == dir.path);
    CHECK(ctx->index_path() == dir.path + "/index.jsonl");
    CHECK(ctx->lock_path() == dir.path + "/.pqm.lock");
}

// ============================================================================
// Scan
// ============================================================================

TEST_CASE("scan reads category folders in sorted order") {
    TempTestDir dir;
    write_script(dir.path, make_meta("Final", "Reports", {"Q1"}), "Q1(1)");
    write_script(dir.path, make_meta("fn_A", "Helpers"), "1");
    write_script(dir.path, make_meta("Q1", "Helpers", {"fn_A"}), "fn_A(1)");

    auto ctx = open_context(dir.path);
    auto scanned = scan_repository(*ctx);
    REQUIRE(scanned.isOk());

    const auto& scripts = scanned.value().scripts;
    REQUIRE(scripts.size() == 3);
    CHECK(scripts[0].record.meta.name == "Q1");
    CHECK(scripts[1].record.meta.name == "fn_A");
    CHECK(scripts[2].record.meta.name == "Final");
    CHECK(scripts[2].record.body == "Q1(1)");
    CHECK(scripts[2].sha256 == compute_file_sha256(scripts[2].record.path).hex_digest);
    CHECK(scanned.value().skipped.empty());
}

TEST_CASE("scan ignores hidden folders, root files and other extensions") {
    TempTestDir dir;
    write_script(dir.path, make_meta("Kept", "Helpers"), "1");
    write_script(dir.path, make_meta("Hidden", ".trash"), "1");
    write_text(dir.path + "/Stray.pq", serialize_script(make_meta("Stray", ""), "1"));
    write_text(dir.path + "/Helpers/notes.txt", "not a script");
    write_text(dir.path + "/Helpers/.draft.pq", serialize_script(make_meta("Draft", ""), "1"));

    auto ctx = open_context(dir.path);
    auto files = list_script_files(*ctx);
    REQUIRE(files.size() == 1);
    CHECK(files[0] == dir.path + "/Helpers/Kept.pq");
}

TEST_CASE("scan collects malformed files without failing") {
    TempTestDir dir;
    write_script(dir.path, make_meta("Good", "Helpers"), "1");
    write_text(dir.path + "/Helpers/Bad.pq", "no header here");

    auto ctx = open_context(dir.path);
    auto scanned = scan_repository(*ctx);
    REQUIRE(scanned.isOk());
    CHECK(scanned.value().scripts.size() == 1);
    REQUIRE(scanned.value().skipped.size() == 1);
    CHECK(scanned.value().skipped[0].path == dir.path + "/Helpers/Bad.pq");
    CHECK(scanned.value().skipped[0].error.code() == ErrorCode::MALFORMED_METADATA);
}

TEST_CASE("scan honours cancellation") {
    TempTestDir dir;
    write_script(dir.path, make_meta("A", "Helpers"), "1");

    auto ctx = open_context(dir.path);
    CancellationToken cancel;
    CancellationToken copy = cancel;
    copy.cancel();
    CHECK(cancel.cancelled());

    auto scanned = scan_repository(*ctx, cancel);
    REQUIRE(scanned.isErr());
    CHECK(scanned.error().code() == ErrorCode::CANCELLED);
}

TEST_CASE("index entries use root-relative paths") {
    TempTestDir dir;
    write_script(dir.path, make_meta("fn_A", "Helpers"), "1");

    auto ctx = open_context(dir.path);
    auto scanned = scan_repository(*ctx);
    REQUIRE(scanned.isOk());
    auto entries = to_index_entries(*ctx, scanned.value().scripts);
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].path == "Helpers/fn_A.pq");
    CHECK(entries[0].meta.name == "fn_A");
}

// ============================================================================
// Storage Layout
// ============================================================================

TEST_CASE("script paths are sanitized") {
    auto path = script_path_for("/repo", "Sales/Reports: 2024", "Q1 total?");
    REQUIRE(path.isOk());
    CHECK(path.value() == "/repo/SalesReports 2024/Q1 total.pq");

    auto fallback = script_path_for("/repo", "///", "x", ".m");
    REQUIRE(fallback.isOk());
    CHECK(fallback.value() == "/repo/Uncategorized/x.m");

    auto unusable = script_path_for("/repo", "Helpers", "***");
    REQUIRE(unusable.isErr());
    CHECK(unusable.error().code() == ErrorCode::INVALID_ARGUMENT);
}

TEST_CASE("metadata validation") {
    CHECK(validate_metadata(make_meta("A", "Helpers", {"B"})).isOk());
    CHECK(validate_metadata(make_meta("", "Helpers")).isErr());
    CHECK(validate_metadata(make_meta("two\nlines", "Helpers")).isErr());
    CHECK(validate_metadata(make_meta("A", "Helpers", {"a"})).isErr());
    CHECK(validate_metadata(make_meta("A", "Helpers", {""})).isErr());
    CHECK(validate_metadata(make_meta("A", "")).isErr());
}

// ============================================================================
// Access
// ============================================================================

TEST_CASE("exclusive access times out while held") {
    TempTestDir dir;
    auto ctx = open_context(dir.path);

    auto held = ctx->acquire_exclusive();
    REQUIRE(held.isOk());
    std::optional<ExclusiveAccess> access(std::move(held.value()));

    auto waiting = std::async(std::launch::async, [&] {
        auto second = ctx->acquire_exclusive(std::chrono::milliseconds(50));
        return second.isErr() ? second.error().code() : ErrorCode::IO_ERROR;
    });
    CHECK(waiting.get() == ErrorCode::LOCK_TIMEOUT);

    access.reset();
    CHECK(ctx->acquire_exclusive(std::chrono::milliseconds(50)).isOk());
}

TEST_CASE("shared access waits for exclusive access") {
    TempTestDir dir;
    auto ctx = open_context(dir.path);

    auto held = ctx->acquire_exclusive();
    REQUIRE(held.isOk());
    std::optional<ExclusiveAccess> access(std::move(held.value()));

    auto reader = std::async(std::launch::async, [&] {
        auto shared = ctx->acquire_shared();
        return true;
    });
    CHECK(reader.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);

    access.reset();
    CHECK(reader.get());
}

TEST_CASE("two contexts on one root exclude each other through the lock file") {
    TempTestDir dir;
    auto first = open_context(dir.path);
    auto second = open_context(dir.path);

    auto held = first->acquire_exclusive();
    REQUIRE(held.isOk());

    auto blocked = second->acquire_exclusive(std::chrono::milliseconds(50));
    REQUIRE(blocked.isErr());
    CHECK(blocked.error().code() == ErrorCode::LOCK_TIMEOUT);
}

TEST_CASE("readers in another context wait for the lock file") {
    TempTestDir dir;
    auto first = open_context(dir.path);
    auto second = open_context(dir.path);

    {
        auto held = first->acquire_exclusive();
        REQUIRE(held.isOk());

        auto blocked = second->try_acquire_shared(std::chrono::milliseconds(50));
        REQUIRE(blocked.isErr());
        CHECK(blocked.error().code() == ErrorCode::LOCK_TIMEOUT);
    }

    auto reader = first->try_acquire_shared(std::chrono::milliseconds(50));
    REQUIRE(reader.isOk());
    CHECK(second->try_acquire_shared(std::chrono::milliseconds(50)).isOk());

    auto writer = second->acquire_exclusive(std::chrono::milliseconds(50));
    REQUIRE(writer.isErr());
    CHECK(writer.error().code() == ErrorCode::LOCK_TIMEOUT);
}
