#include <doctest/doctest.h>
#include <pqm/manager.hpp>

#include "test_helpers.hpp"

#include <map>

using namespace pqm;

namespace {

// In-memory document host
class FakeDocument : public DocumentAdapter {
public:
    Result<std::vector<ExtractedScript>> read_scripts(const std::string&) override {
        if (fail_read) {
            return Result<std::vector<ExtractedScript>>::err(
                Error(ErrorCode::ADAPTER_ERROR, "document locked"));
        }
        return Result<std::vector<ExtractedScript>>::ok(scripts);
    }

    Result<void> write_script(const std::string&, const std::string& name,
                              const std::string& body, const std::string&) override {
        if (name == reject) {
            return Result<void>::err(Error(ErrorCode::ADAPTER_ERROR, "host refused", name));
        }
        written.push_back(name);
        bodies[name] = body;
        return Result<void>::ok();
    }

    std::vector<ExtractedScript> scripts;
    std::vector<std::string> written;
    std::map<std::string, std::string> bodies;
    std::string reject;
    bool fail_read = false;
};

// Helpers/fn_A <- Staging/Q1 <- Reports/Final, index built
struct ManagerFixture {
    TempTestDir dir;
    std::unique_ptr<Manager> manager;

    ManagerFixture() {
        write_script(dir.path, make_meta("fn_A", "Helpers"), "(x) => x + 1");
        write_script(dir.path, make_meta("Q1", "Staging", {"fn_A"}), "let a = fn_A(1) in a");
        write_script(dir.path, make_meta("Final", "Reports", {"Q1"}), "Q1");

        auto opened = Manager::create(dir.path, test_config());
        REQUIRE(opened.isOk());
        manager = std::move(opened.value());
        REQUIRE(manager->build_index().isOk());
    }
};

std::vector<std::string> names_of(const std::vector<ResolvedScript>& scripts) {
    std::vector<std::string> names;
    for (const auto& s : scripts) names.push_back(s.name);
    return names;
}

} // namespace

// ============================================================================
// Open / Index
// ============================================================================

TEST_CASE("manager reports a missing index on open") {
    TempTestDir dir;
    auto opened = Manager::open(dir.path);
    REQUIRE(opened.isOk());
    CHECK(opened.value()->index_status() == IndexLoadStatus::Missing);
    CHECK_FALSE(opened.value()->index_diagnostic().empty());
}

TEST_CASE("manager open reads pqm.json") {
    TempTestDir dir;
    write_text(dir.path + "/pqm.json", R"({"default_category": "Inbox", "lock_timeout_ms": 10})");
    auto opened = Manager::open(dir.path);
    REQUIRE(opened.isOk());
    CHECK(opened.value()->config().default_category == "Inbox");
    CHECK(opened.value()->config().lock_timeout_ms == 10);
}

TEST_CASE("manager open fails for a missing root") {
    TempTestDir dir;
    auto opened = Manager::open(dir.path + "/absent");
    REQUIRE(opened.isErr());
    CHECK(opened.error().code() == ErrorCode::NOT_FOUND);
}

TEST_CASE_FIXTURE(ManagerFixture, "build report lists skipped files") {
    write_text(dir.path + "/Helpers/Broken.pq", "---\nname: [\n---\n");
    auto built = manager->build_index();
    REQUIRE(built.isOk());
    CHECK(built.value().indexed == 3);
    REQUIRE(built.value().skipped.size() == 1);
    CHECK(built.value().skipped[0].error.code() == ErrorCode::MALFORMED_METADATA);
}

TEST_CASE_FIXTURE(ManagerFixture, "build with duplicate names keeps the previous index") {
    write_script(dir.path, make_meta("FN_A", "Other"), "2");
    auto built = manager->build_index();
    REQUIRE(built.isErr());
    CHECK(built.error().code() == ErrorCode::DUPLICATE_NAME);
    CHECK(manager->entries().size() == 3);
    CHECK(manager->get("fn_a")->path == "Helpers/fn_A.pq");
}

TEST_CASE_FIXTURE(ManagerFixture, "refresh picks up files changed outside the manager") {
    write_script(dir.path, make_meta("Extra", "Helpers"), "1");
    auto refreshed = manager->refresh_index();
    REQUIRE(refreshed.isOk());
    CHECK(refreshed.value().summary.added == std::vector<std::string>{"Extra"});
    CHECK(manager->get("extra").has_value());
}

TEST_CASE_FIXTURE(ManagerFixture, "consistency check finds drift") {
    auto clean = manager->check_consistency();
    REQUIRE(clean.isOk());
    CHECK(clean.value().consistent());

    write_script(dir.path, make_meta("fn_A", "Helpers"), "changed body");
    std::filesystem::remove(dir.path + "/Reports/Final.pq");
    write_script(dir.path, make_meta("Loose", "Helpers"), "1");

    auto report = manager->check_consistency();
    REQUIRE(report.isOk());
    CHECK_FALSE(report.value().consistent());
    CHECK(report.value().stale_entries == std::vector<std::string>{"fn_A"});
    CHECK(report.value().missing_files == std::vector<std::string>{"Final"});
    CHECK(report.value().unindexed_files == std::vector<std::string>{"Helpers/Loose.pq"});
}

// ============================================================================
// Queries
// ============================================================================

TEST_CASE_FIXTURE(ManagerFixture, "queries read from the index") {
    CHECK(manager->list_categories() == std::vector<std::string>{"Helpers", "Reports", "Staging"});
    CHECK(manager->search("q1").size() == 1);

    auto script = manager->get_script("FINAL");
    REQUIRE(script.isOk());
    CHECK(script.value().body == "Q1");
    CHECK(script.value().meta.dependencies == std::vector<std::string>{"Q1"});

    auto missing = manager->get_script("Nope");
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::NOT_FOUND);
}

// ============================================================================
// Dependencies
// ============================================================================

TEST_CASE_FIXTURE(ManagerFixture, "resolve returns bodies in insertion order") {
    auto resolved = manager->resolve({"Final"});
    REQUIRE(resolved.isOk());
    const auto& scripts = resolved.value().scripts;
    CHECK(names_of(scripts) == std::vector<std::string>{"fn_A", "Q1", "Final"});
    CHECK(scripts[0].body == "(x) => x + 1");
    CHECK(scripts[1].body == "let a = fn_A(1) in a");
}

TEST_CASE_FIXTURE(ManagerFixture, "resolve reports what is missing") {
    REQUIRE(manager->create_script(make_meta("Orphan", "Reports", {"Ghost"}), "Ghost").isOk());

    auto strict = manager->resolve({"Orphan"});
    REQUIRE(strict.isErr());
    CHECK(strict.error().code() == ErrorCode::UNRESOLVED_DEPENDENCY);
    CHECK(strict.error().subject() == "Ghost");

    ResolveOptions partial;
    partial.allow_partial = true;
    auto lenient = manager->resolve({"Orphan"}, partial);
    REQUIRE(lenient.isOk());
    CHECK(names_of(lenient.value().scripts) == std::vector<std::string>{"Orphan"});
    REQUIRE(lenient.value().unresolved.size() == 1);
    CHECK(lenient.value().unresolved[0].name == "Ghost");
}

TEST_CASE_FIXTURE(ManagerFixture, "dependency graph follows edits") {
    CHECK(manager->dependents_of("fn_A").value() == std::vector<std::string>{"Q1"});

    ScriptMetadata meta = make_meta("Final", "Reports", {"Q1", "fn_A"});
    REQUIRE(manager->apply_metadata_edit("Final", meta).isOk());
    CHECK(manager->dependents_of("fn_A").value() == std::vector<std::string>{"Final", "Q1"});

    auto tree = manager->dependency_tree("Final");
    REQUIRE(tree.isOk());
    CHECK(tree.value().children.size() == 2);

    CHECK(manager->dependents_of("Nope").isErr());
}

TEST_CASE_FIXTURE(ManagerFixture, "suggestions come from the body") {
    auto suggested = manager->suggest_dependencies("Q1");
    REQUIRE(suggested.isOk());
    CHECK(suggested.value() == std::vector<std::string>{"fn_A"});

    REQUIRE(manager->update_body("Final", "fn_A(Q1(1))").isOk());
    suggested = manager->suggest_dependencies("Final");
    REQUIRE(suggested.isOk());
    CHECK(suggested.value() == std::vector<std::string>{"fn_A", "Q1"});

    CHECK(manager->suggest_dependencies("Nope").isErr());
}

// ============================================================================
// Edits
// ============================================================================

TEST_CASE_FIXTURE(ManagerFixture, "relocate then resolve sees the new path") {
    std::vector<MutationState> states;
    manager->set_transition_observer([&](const MutationTransition& t) { states.push_back(t.state); });

    auto moved = manager->relocate("Q1", "Reports");
    REQUIRE(moved.isOk());
    CHECK(moved.value().path == "Reports/Q1.pq");
    CHECK_FALSE(file_exists(dir.path + "/Staging"));
    CHECK(states.back() == MutationState::Released);

    auto resolved = manager->resolve({"Final"});
    REQUIRE(resolved.isOk());
    CHECK(resolved.value().scripts[1].body == "let a = fn_A(1) in a");
}

TEST_CASE_FIXTURE(ManagerFixture, "a second manager on the same root sees a relocation") {
    auto opened = Manager::create(dir.path, test_config());
    REQUIRE(opened.isOk());
    auto other = std::move(opened.value());
    CHECK(other->get("Q1")->path == "Staging/Q1.pq");

    REQUIRE(manager->relocate("Q1", "Production").isOk());

    auto seen = other->get("Q1");
    REQUIRE(seen.has_value());
    CHECK(seen->path == "Production/Q1.pq");
    CHECK(seen->meta.category == "Production");

    auto resolved = other->resolve({"Final"});
    REQUIRE(resolved.isOk());
    CHECK(names_of(resolved.value().scripts) == std::vector<std::string>{"fn_A", "Q1", "Final"});
    CHECK(resolved.value().scripts[1].body == "let a = fn_A(1) in a");
}

TEST_CASE_FIXTURE(ManagerFixture, "rewrite and delete") {
    ScriptMetadata meta = make_meta("Final", "Archive", {"Q1"});
    auto rewritten = manager->rewrite_script("Final", meta, "Q1 + 1");
    REQUIRE(rewritten.isOk());
    CHECK(rewritten.value().path == "Archive/Final.pq");
    CHECK(manager->get_script("Final").value().body == "Q1 + 1");

    REQUIRE(manager->delete_script("Final").isOk());
    CHECK_FALSE(manager->get("Final").has_value());
    CHECK_FALSE(file_exists(dir.path + "/Archive"));
}

// ============================================================================
// Documents
// ============================================================================

TEST_CASE_FIXTURE(ManagerFixture, "extract saves new scripts and reports existing ones") {
    FakeDocument doc;
    doc.scripts = {
        {"Sales", "let s = 1 in s", "Monthly\nsales"},
        {"fn_A", "(x) => x * 2", ""},
    };

    auto extracted = manager->extract_from_document(doc, "book.xlsx");
    REQUIRE(extracted.isOk());
    CHECK(extracted.value().created == std::vector<std::string>{"Sales"});
    REQUIRE(extracted.value().failed.size() == 1);
    CHECK(extracted.value().failed[0].name == "fn_A");
    CHECK(extracted.value().failed[0].error.code() == ErrorCode::ALREADY_EXISTS);

    auto sales = manager->get("sales");
    REQUIRE(sales.has_value());
    CHECK(sales->path == "Extracted/Sales.pq");
    CHECK(sales->meta.tags == std::vector<std::string>{"extracted"});
    CHECK(sales->meta.description == "Monthly sales");
    CHECK(manager->get_script("fn_A").value().body == "(x) => x + 1");
}

TEST_CASE_FIXTURE(ManagerFixture, "extract with overwrite replaces bodies in place") {
    FakeDocument doc;
    doc.scripts = {{"fn_A", "(x) => x * 2", ""}};

    ExtractOptions options;
    options.overwrite = true;
    auto extracted = manager->extract_from_document(doc, "book.xlsx", options);
    REQUIRE(extracted.isOk());
    CHECK(extracted.value().overwritten == std::vector<std::string>{"fn_A"});
    CHECK(manager->get("fn_A")->path == "Helpers/fn_A.pq");
    CHECK(manager->get_script("fn_A").value().body == "(x) => x * 2");
}

TEST_CASE_FIXTURE(ManagerFixture, "extract trims names before looking them up") {
    FakeDocument doc;
    doc.scripts = {{"fn_A  ", "(x) => x * 3", ""}};

    auto refused = manager->extract_from_document(doc, "book.xlsx");
    REQUIRE(refused.isOk());
    REQUIRE(refused.value().failed.size() == 1);
    CHECK(refused.value().failed[0].name == "fn_A");
    CHECK(refused.value().failed[0].error.code() == ErrorCode::ALREADY_EXISTS);

    ExtractOptions options;
    options.overwrite = true;
    auto extracted = manager->extract_from_document(doc, "book.xlsx", options);
    REQUIRE(extracted.isOk());
    CHECK(extracted.value().overwritten == std::vector<std::string>{"fn_A"});
    CHECK(extracted.value().failed.empty());
    CHECK(manager->get_script("fn_A").value().body == "(x) => x * 3");
}

TEST_CASE_FIXTURE(ManagerFixture, "extract stops when cancelled") {
    FakeDocument doc;
    doc.scripts = {{"One", "1", ""}, {"Two", "2", ""}};

    CancellationToken cancel;
    cancel.cancel();
    auto extracted = manager->extract_from_document(doc, "book.xlsx", {}, cancel);
    REQUIRE(extracted.isOk());
    CHECK(extracted.value().cancelled);
    CHECK(extracted.value().created.empty());
    CHECK_FALSE(manager->get("One").has_value());
}

TEST_CASE_FIXTURE(ManagerFixture, "extract surfaces adapter failures") {
    FakeDocument doc;
    doc.fail_read = true;
    auto extracted = manager->extract_from_document(doc, "book.xlsx");
    REQUIRE(extracted.isErr());
    CHECK(extracted.error().code() == ErrorCode::ADAPTER_ERROR);
}

TEST_CASE_FIXTURE(ManagerFixture, "insert writes dependencies first") {
    FakeDocument doc;
    auto inserted = manager->insert_into_document(doc, "book.xlsx", {"Final"});
    REQUIRE(inserted.isOk());
    CHECK(doc.written == std::vector<std::string>{"fn_A", "Q1", "Final"});
    CHECK(doc.bodies["Q1"] == "let a = fn_A(1) in a");
    for (const auto& outcome : inserted.value().outcomes) {
        CHECK(outcome.ok());
    }
}

TEST_CASE_FIXTURE(ManagerFixture, "insert records per-script adapter failures") {
    FakeDocument doc;
    doc.reject = "Q1";
    auto inserted = manager->insert_into_document(doc, "book.xlsx", {"Final"});
    REQUIRE(inserted.isOk());

    const auto& outcomes = inserted.value().outcomes;
    REQUIRE(outcomes.size() == 3);
    CHECK(outcomes[0].ok());
    CHECK_FALSE(outcomes[1].ok());
    CHECK(outcomes[1].error->code() == ErrorCode::ADAPTER_ERROR);
    CHECK(outcomes[2].ok());
    CHECK(doc.written == std::vector<std::string>{"fn_A", "Final"});
}

TEST_CASE_FIXTURE(ManagerFixture, "insert writes nothing when resolution fails") {
    write_script(dir.path, make_meta("A", "Loop", {"B"}), "B");
    write_script(dir.path, make_meta("B", "Loop", {"A"}), "A");
    REQUIRE(manager->refresh_index().isOk());

    FakeDocument doc;
    auto inserted = manager->insert_into_document(doc, "book.xlsx", {"A"});
    REQUIRE(inserted.isErr());
    CHECK(inserted.error().code() == ErrorCode::CYCLE_DETECTED);
    CHECK(doc.written.empty());
}
