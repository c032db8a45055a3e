#include <doctest/doctest.h>
#include <pqm/digest.hpp>
#include <pqm/platform.hpp>

#include "test_helpers.hpp"

using namespace pqm;

TEST_CASE("atomic write creates and overwrites without leftovers") {
    TempTestDir dir;
    std::string path = dir.path + "/index.jsonl";

    auto first = atomic_write_file(path, "one");
    REQUIRE(first.ok);
    CHECK(read_text(path) == "one");

    auto second = atomic_write_file(path, "two");
    REQUIRE(second.ok);
    CHECK(read_text(path) == "two");

    CHECK(list_directory(dir.path) == std::vector<std::string>{"index.jsonl"});
}

TEST_CASE("atomic write into a missing directory fails") {
    TempTestDir dir;
    auto result = atomic_write_file(dir.path + "/absent/file.txt", "data");
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("read_file returns nullopt for missing files") {
    TempTestDir dir;
    CHECK_FALSE(read_file(dir.path + "/nope").has_value());

    write_text(dir.path + "/yes", "content");
    auto content = read_file(dir.path + "/yes");
    REQUIRE(content.has_value());
    CHECK(*content == "content");
}

TEST_CASE("path helpers") {
    CHECK(relative_path("/repo/Helpers/fn_A.pq", "/repo") == "Helpers/fn_A.pq");
    CHECK(join_path("/repo", "pqm.json") == "/repo/pqm.json");
    CHECK(get_filename("/repo/Helpers/fn_A.pq") == "fn_A.pq");
    CHECK(to_portable_path("a\\b\\c") == "a/b/c");
}

TEST_CASE("list_directory is sorted") {
    TempTestDir dir;
    write_text(dir.path + "/b.pq", "");
    write_text(dir.path + "/a.pq", "");
    create_directories(dir.path + "/C");

    CHECK(list_directory(dir.path) == std::vector<std::string>{"C", "a.pq", "b.pq"});
    CHECK(list_directory(dir.path + "/missing").empty());
}

TEST_CASE("remove_empty_directory leaves populated folders") {
    TempTestDir dir;
    create_directories(dir.path + "/empty");
    write_text(dir.path + "/full/x.pq", "x");

    CHECK(remove_empty_directory(dir.path + "/empty"));
    CHECK_FALSE(path_exists(dir.path + "/empty"));
    CHECK_FALSE(remove_empty_directory(dir.path + "/full"));
    CHECK(path_exists(dir.path + "/full/x.pq"));
}

TEST_CASE("remove_file reports missing files") {
    TempTestDir dir;
    write_text(dir.path + "/x", "x");
    CHECK(remove_file(dir.path + "/x"));
    CHECK_FALSE(remove_file(dir.path + "/x"));
}

// ============================================================================
// File Lock
// ============================================================================

TEST_CASE("file lock excludes a second holder until released") {
    TempTestDir dir;
    std::string lock_path = dir.path + "/.pqm.lock";
    std::string error;

    FileLock first;
    REQUIRE(first.acquire(lock_path, std::chrono::milliseconds(100), error) ==
            FileLock::Outcome::Acquired);
    CHECK(first.held());

    FileLock second;
    CHECK(second.acquire(lock_path, std::chrono::milliseconds(50), error) ==
          FileLock::Outcome::TimedOut);
    CHECK_FALSE(second.held());
    CHECK(error.find("timed out") != std::string::npos);

    first.release();
    CHECK(second.acquire(lock_path, std::chrono::milliseconds(100), error) ==
          FileLock::Outcome::Acquired);
}

TEST_CASE("shared file locks coexist and keep out an exclusive holder") {
    TempTestDir dir;
    std::string lock_path = dir.path + "/.pqm.lock";
    std::string error;

    FileLock reader;
    REQUIRE(reader.acquire_blocking(lock_path, FileLock::Mode::Shared, error) ==
            FileLock::Outcome::Acquired);

    FileLock other_reader;
    CHECK(other_reader.acquire(lock_path, std::chrono::milliseconds(50), error,
                               FileLock::Mode::Shared) == FileLock::Outcome::Acquired);

    FileLock writer;
    CHECK(writer.acquire(lock_path, std::chrono::milliseconds(50), error) ==
          FileLock::Outcome::TimedOut);

    reader.release();
    other_reader.release();
    CHECK(writer.acquire(lock_path, std::chrono::milliseconds(100), error) ==
          FileLock::Outcome::Acquired);
}

TEST_CASE("file lock fails when the lock file cannot be created") {
    TempTestDir dir;
    std::string error;
    FileLock lock;
    CHECK(lock.acquire(dir.path + "/missing/.pqm.lock", std::chrono::milliseconds(10), error) ==
          FileLock::Outcome::Failed);
    CHECK_FALSE(error.empty());
}

// ============================================================================
// Digests
// ============================================================================

TEST_CASE("sha256 of a known vector") {
    auto result = compute_sha256("abc");
    REQUIRE(result.ok);
    CHECK(result.hex_digest ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("file digest matches the buffer digest") {
    TempTestDir dir;
    std::string content = "let x = 1 in x\n";
    write_text(dir.path + "/s.pq", content);

    auto file = compute_file_sha256(dir.path + "/s.pq");
    REQUIRE(file.ok);
    CHECK(file.hex_digest == compute_sha256(content).hex_digest);

    CHECK_FALSE(compute_file_sha256(dir.path + "/none").ok);
}
