#include <doctest/doctest.h>
#include <pqm/digest.hpp>
#include <pqm/storage_manager.hpp>

#include "test_helpers.hpp"

#include <filesystem>
#include <functional>
#include <future>

using namespace pqm;

namespace {

// Empty repository with a built (empty) index
struct StorageFixture {
    TempTestDir dir;
    std::shared_ptr<RepositoryContext> context;
    std::shared_ptr<IndexStore> index;
    std::unique_ptr<StorageManager> storage;
    std::vector<std::string> states;

    StorageFixture() {
        auto opened = RepositoryContext::open(dir.path, test_config());
        REQUIRE(opened.isOk());
        context = opened.value();
        index = std::make_shared<IndexStore>(context);
        {
            auto access = context->acquire_exclusive();
            REQUIRE(access.isOk());
            REQUIRE(index->build(access.value(), {}).isOk());
        }
        storage = std::make_unique<StorageManager>(context, index);
    }

    void record_states() {
        storage->set_transition_observer([this](const MutationTransition& t) {
            states.push_back(mutation_state_to_string(t.state));
        });
    }

    Result<IndexEntry> add(const std::string& name, const std::string& category,
                           const std::vector<std::string>& deps = {},
                           const std::string& body = "let x = 1 in x\n") {
        return storage->create(ScriptRecord{make_meta(name, category, deps), body, ""});
    }

    std::string file(const std::string& rel) const { return dir.path + "/" + rel; }

    // At FileMoved a non-empty directory takes the snapshot's place, so the
    // index rename fails. `also` runs right after, to break the rollback too.
    void block_index_at_file_moved(std::function<void()> also = {}) {
        storage->set_transition_observer([this, also](const MutationTransition& t) {
            states.push_back(mutation_state_to_string(t.state));
            if (t.state == MutationState::FileMoved) {
                std::string index_path = context->index_path();
                snapshot = read_text(index_path);
                std::filesystem::remove(index_path);
                write_text(index_path + "/blocker", "x");
                if (also) also();
            }
        });
    }

    // Put the snapshot saved by block_index_at_file_moved() back
    void unblock_index() {
        std::filesystem::remove_all(context->index_path());
        write_text(context->index_path(), snapshot);
    }

    std::string snapshot;
};

} // namespace

// ============================================================================
// Create
// ============================================================================

TEST_CASE_FIXTURE(StorageFixture, "create writes the file and the index entry") {
    auto created = add("fn_A", "Helpers");
    REQUIRE(created.isOk());
    CHECK(created.value().path == "Helpers/fn_A.pq");

    std::string content = read_text(file("Helpers/fn_A.pq"));
    auto parsed = parse_script_text(content);
    REQUIRE(parsed.ok);
    CHECK(parsed.metadata.name == "fn_A");
    CHECK(parsed.body == "let x = 1 in x\n");

    auto entry = index->get("FN_A");
    REQUIRE(entry.has_value());
    CHECK(entry->sha256 == compute_sha256(content).hex_digest);
}

TEST_CASE_FIXTURE(StorageFixture, "create fills in the default category") {
    auto created = add("Loose", "");
    REQUIRE(created.isOk());
    CHECK(created.value().path == "Uncategorized/Loose.pq");
    CHECK(created.value().meta.category == kDefaultCategory);
}

TEST_CASE_FIXTURE(StorageFixture, "create refuses a duplicate name") {
    REQUIRE(add("fn_A", "Helpers").isOk());
    auto again = add("FN_A", "Other");
    REQUIRE(again.isErr());
    CHECK(again.error().code() == ErrorCode::DUPLICATE_NAME);
    CHECK_FALSE(file_exists(file("Other/FN_A.pq")));
    CHECK_FALSE(file_exists(file("Other")));
}

TEST_CASE_FIXTURE(StorageFixture, "create refuses to overwrite an unindexed file") {
    write_text(file("Helpers/fn_A.pq"), "hand written");
    auto created = add("fn_A", "Helpers");
    REQUIRE(created.isErr());
    CHECK(created.error().code() == ErrorCode::ALREADY_EXISTS);
    CHECK(read_text(file("Helpers/fn_A.pq")) == "hand written");
}

TEST_CASE_FIXTURE(StorageFixture, "create rejects a self dependency") {
    auto created = add("Loop", "Helpers", {"loop"});
    REQUIRE(created.isErr());
    CHECK(created.error().code() == ErrorCode::INVALID_ARGUMENT);
    CHECK_FALSE(index->get("Loop").has_value());
}

// ============================================================================
// Relocate
// ============================================================================

TEST_CASE_FIXTURE(StorageFixture, "relocate moves the file and rewrites its category") {
    REQUIRE(add("Q1", "Staging", {}, "let\n    Source = 1\nin\n    Source\n").isOk());
    record_states();

    auto moved = storage->relocate_on_category_change("q1", "Reports");
    REQUIRE(moved.isOk());
    CHECK(moved.value().path == "Reports/Q1.pq");

    CHECK_FALSE(file_exists(file("Staging/Q1.pq")));
    CHECK_FALSE(file_exists(file("Staging")));
    REQUIRE(file_exists(file("Reports/Q1.pq")));

    auto parsed = parse_script_text(read_text(file("Reports/Q1.pq")));
    REQUIRE(parsed.ok);
    CHECK(parsed.metadata.category == "Reports");
    CHECK(parsed.body == "let\n    Source = 1\nin\n    Source\n");

    auto entry = index->get("Q1");
    REQUIRE(entry.has_value());
    CHECK(entry->path == "Reports/Q1.pq");
    CHECK(entry->meta.category == "Reports");

    CHECK(states == std::vector<std::string>{"requested", "locked", "file_moved",
                                             "index_updated", "released"});
}

TEST_CASE_FIXTURE(StorageFixture, "relocate keeps a shared folder") {
    REQUIRE(add("A", "Shared").isOk());
    REQUIRE(add("B", "Shared").isOk());
    REQUIRE(storage->relocate_on_category_change("A", "Other").isOk());
    CHECK(file_exists(file("Shared/B.pq")));
}

TEST_CASE_FIXTURE(StorageFixture, "relocate of an unknown script") {
    record_states();
    auto moved = storage->relocate_on_category_change("Ghost", "Reports");
    REQUIRE(moved.isErr());
    CHECK(moved.error().code() == ErrorCode::NOT_FOUND);
    CHECK(states == std::vector<std::string>{"requested", "locked", "released"});
}

TEST_CASE_FIXTURE(StorageFixture, "relocate rolls the file back when the index write fails") {
    REQUIRE(add("Q1", "Staging").isOk());
    std::string original = read_text(file("Staging/Q1.pq"));
    block_index_at_file_moved();

    auto moved = storage->relocate_on_category_change("Q1", "Reports");
    REQUIRE(moved.isErr());
    CHECK(moved.error().code() == ErrorCode::IO_ERROR);

    CHECK(read_text(file("Staging/Q1.pq")) == original);
    CHECK_FALSE(file_exists(file("Reports/Q1.pq")));
    CHECK_FALSE(file_exists(file("Reports")));
    CHECK(states == std::vector<std::string>{"requested", "locked", "file_moved",
                                             "rollback_move", "released"});

    unblock_index();
    CHECK(index->get("Q1")->path == "Staging/Q1.pq");
}

TEST_CASE_FIXTURE(StorageFixture, "relocate reports a rollback that could not restore the file") {
    REQUIRE(add("Q1", "Staging").isOk());
    // The emptied source folder becomes a plain file, so the restore has nowhere to go
    block_index_at_file_moved([this] {
        std::filesystem::remove_all(file("Staging"));
        write_text(file("Staging"), "x");
    });

    auto moved = storage->relocate_on_category_change("Q1", "Reports");
    REQUIRE(moved.isErr());
    CHECK(moved.error().code() == ErrorCode::ROLLBACK_FAILED);
    CHECK(moved.error().subject() == "Q1");
    CHECK(moved.error().related() ==
          std::vector<std::string>{file("Staging/Q1.pq"), file("Reports/Q1.pq")});
    CHECK(moved.error().message().find("refresh") != std::string::npos);
    CHECK(file_exists(file("Reports/Q1.pq")));
    CHECK(states == std::vector<std::string>{"requested", "locked", "file_moved",
                                             "rollback_move", "released"});
}

TEST_CASE_FIXTURE(StorageFixture, "readers wait for an in-flight relocation") {
    REQUIRE(add("Q1", "Staging").isOk());

    std::future<std::optional<IndexEntry>> reader;
    bool blocked = false;
    storage->set_transition_observer([&](const MutationTransition& t) {
        if (t.state == MutationState::FileMoved) {
            reader = std::async(std::launch::async, [&] { return index->get("Q1"); });
            blocked = reader.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout;
        }
    });

    REQUIRE(storage->relocate_on_category_change("Q1", "Reports").isOk());
    CHECK(blocked);

    auto seen = reader.get();
    REQUIRE(seen.has_value());
    CHECK(seen->path == "Reports/Q1.pq");
    CHECK(seen->meta.category == "Reports");
}

// ============================================================================
// Rewrite / Rename
// ============================================================================

TEST_CASE_FIXTURE(StorageFixture, "rename is refused while other scripts depend on it") {
    REQUIRE(add("fn_A", "Helpers").isOk());
    REQUIRE(add("Q1", "Staging", {"fn_A"}).isOk());
    REQUIRE(add("Q2", "Staging", {"FN_A"}).isOk());

    auto renamed = storage->update_metadata("fn_A", make_meta("fn_B", "Helpers"));
    REQUIRE(renamed.isErr());
    CHECK(renamed.error().code() == ErrorCode::NAME_REFERENCED);
    CHECK(renamed.error().related() == std::vector<std::string>{"Q1", "Q2"});
    CHECK(file_exists(file("Helpers/fn_A.pq")));
}

TEST_CASE_FIXTURE(StorageFixture, "rename onto an existing name is refused") {
    REQUIRE(add("A", "Helpers").isOk());
    REQUIRE(add("B", "Helpers").isOk());

    auto renamed = storage->update_metadata("A", make_meta("b", "Helpers"));
    REQUIRE(renamed.isErr());
    CHECK(renamed.error().code() == ErrorCode::DUPLICATE_NAME);
}

TEST_CASE_FIXTURE(StorageFixture, "rename moves the file and re-keys the index") {
    REQUIRE(add("Old", "Helpers", {}, "body\n").isOk());

    auto renamed = storage->update_metadata("Old", make_meta("New", "Helpers"));
    REQUIRE(renamed.isOk());
    CHECK(renamed.value().path == "Helpers/New.pq");
    CHECK_FALSE(file_exists(file("Helpers/Old.pq")));
    CHECK_FALSE(index->get("Old").has_value());

    auto parsed = parse_script_text(read_text(file("Helpers/New.pq")));
    REQUIRE(parsed.ok);
    CHECK(parsed.body == "body\n");
}

TEST_CASE_FIXTURE(StorageFixture, "case-only rename keeps the entry") {
    REQUIRE(add("report", "Reports").isOk());
    auto renamed = storage->update_metadata("report", make_meta("Report", "Reports"));
    REQUIRE(renamed.isOk());
    CHECK(index->get("REPORT")->meta.name == "Report");
    CHECK(index->entries().size() == 1);
}

TEST_CASE_FIXTURE(StorageFixture, "update_body keeps metadata and updates the digest") {
    REQUIRE(add("fn_A", "Helpers", {}, "old\n").isOk());
    std::string before = index->get("fn_A")->sha256;

    auto updated = storage->update_body("fn_A", "new\n");
    REQUIRE(updated.isOk());
    CHECK(updated.value().sha256 != before);

    auto parsed = parse_script_text(read_text(file("Helpers/fn_A.pq")));
    REQUIRE(parsed.ok);
    CHECK(parsed.metadata.category == "Helpers");
    CHECK(parsed.body == "new\n");
}

TEST_CASE_FIXTURE(StorageFixture, "rewrite replaces metadata and body together") {
    REQUIRE(add("fn_A", "Helpers").isOk());
    ScriptMetadata meta = make_meta("fn_A", "Shared");
    meta.tags = {"util"};

    auto rewritten = storage->rewrite("fn_A", meta, "1\n");
    REQUIRE(rewritten.isOk());
    CHECK(rewritten.value().path == "Shared/fn_A.pq");
    CHECK(rewritten.value().meta.tags == std::vector<std::string>{"util"});
    CHECK(parse_script_text(read_text(file("Shared/fn_A.pq"))).body == "1\n");
}

TEST_CASE_FIXTURE(StorageFixture, "update_body restores the old content when the index write fails") {
    REQUIRE(add("fn_A", "Helpers", {}, "old\n").isOk());
    std::string original = read_text(file("Helpers/fn_A.pq"));
    block_index_at_file_moved();

    auto updated = storage->update_body("fn_A", "new\n");
    REQUIRE(updated.isErr());
    CHECK(updated.error().code() == ErrorCode::IO_ERROR);
    CHECK(read_text(file("Helpers/fn_A.pq")) == original);
    CHECK(states == std::vector<std::string>{"requested", "locked", "file_moved",
                                             "rollback_move", "released"});

    unblock_index();
    CHECK(index->get("fn_A")->sha256 == compute_sha256(original).hex_digest);
}

TEST_CASE_FIXTURE(StorageFixture, "edit reports a file missing from disk") {
    REQUIRE(add("fn_A", "Helpers").isOk());
    std::filesystem::remove(file("Helpers/fn_A.pq"));

    auto updated = storage->update_body("fn_A", "x");
    REQUIRE(updated.isErr());
    CHECK(updated.error().code() == ErrorCode::NOT_FOUND);
}

// ============================================================================
// Delete
// ============================================================================

TEST_CASE_FIXTURE(StorageFixture, "remove deletes the file, folder and entry") {
    REQUIRE(add("fn_A", "Helpers").isOk());
    record_states();

    REQUIRE(storage->remove("FN_A").isOk());
    CHECK_FALSE(file_exists(file("Helpers/fn_A.pq")));
    CHECK_FALSE(file_exists(file("Helpers")));
    CHECK_FALSE(index->get("fn_A").has_value());
    CHECK(states.back() == "released");

    auto again = storage->remove("fn_A");
    REQUIRE(again.isErr());
    CHECK(again.error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE_FIXTURE(StorageFixture, "remove drops the entry when the file is already gone") {
    REQUIRE(add("fn_A", "Helpers").isOk());
    std::filesystem::remove(file("Helpers/fn_A.pq"));

    REQUIRE(storage->remove("fn_A").isOk());
    CHECK_FALSE(index->get("fn_A").has_value());
}

TEST_CASE_FIXTURE(StorageFixture, "remove restores the file when the index write fails") {
    REQUIRE(add("fn_A", "Helpers").isOk());
    std::string original = read_text(file("Helpers/fn_A.pq"));
    block_index_at_file_moved();

    auto removed = storage->remove("fn_A");
    REQUIRE(removed.isErr());
    CHECK(removed.error().code() == ErrorCode::IO_ERROR);
    CHECK(read_text(file("Helpers/fn_A.pq")) == original);
    CHECK(states == std::vector<std::string>{"requested", "locked", "file_moved",
                                             "rollback_move", "released"});

    unblock_index();
    CHECK(index->get("fn_A").has_value());
}

TEST_CASE_FIXTURE(StorageFixture, "remove keeps the entry when the file cannot be read") {
    REQUIRE(add("fn_A", "Helpers").isOk());
    std::filesystem::remove(file("Helpers/fn_A.pq"));
    write_text(file("Helpers/fn_A.pq/inner"), "x");

    auto removed = storage->remove("fn_A");
    REQUIRE(removed.isErr());
    CHECK(removed.error().code() == ErrorCode::IO_ERROR);
    CHECK(file_exists(file("Helpers/fn_A.pq/inner")));
    CHECK(index->get("fn_A").has_value());
}

TEST_CASE("storage commits need a built index") {
    TempTestDir dir;
    auto opened = RepositoryContext::open(dir.path, test_config());
    REQUIRE(opened.isOk());
    auto index = std::make_shared<IndexStore>(opened.value());
    StorageManager storage(opened.value(), index);

    auto created = storage.create(ScriptRecord{make_meta("A", "Helpers"), "1", ""});
    REQUIRE(created.isErr());
    CHECK(created.error().code() == ErrorCode::INDEX_NOT_READY);
    CHECK_FALSE(file_exists(dir.path + "/Helpers/A.pq"));
    CHECK_FALSE(file_exists(dir.path + "/Helpers"));
}
