#include <doctest/doctest.h>
#include <pqm/dependency_resolver.hpp>

using namespace pqm;

namespace {

const std::vector<std::string> kKnown = {"fn_A", "Q1", "Helper.Tool", "Sales Total", "Final"};

} // namespace

TEST_CASE("suggest finds plain calls") {
    auto found = suggest_dependencies("let x = fn_A(1), y = Q1 (x) in y", kKnown);
    CHECK(found == std::vector<std::string>{"fn_A", "Q1"});
}

TEST_CASE("suggest finds quoted and dotted names") {
    auto found = suggest_dependencies(
        "let a = #\"Sales Total\"(1), b = Helper.Tool(a) in b", kKnown);
    CHECK(found == std::vector<std::string>{"Helper.Tool", "Sales Total"});
}

TEST_CASE("suggest ignores comments and string literals") {
    const char* body =
        "// fn_A(1)\n"
        "/* Q1(2) */\n"
        "let s = \"Final(3) \"\"fn_A(4)\"\" \" in s";
    CHECK(suggest_dependencies(body, kKnown).empty());
}

TEST_CASE("suggest matches names case-insensitively and reports the declared name") {
    auto found = suggest_dependencies("FN_a(1) + q1(2)", kKnown);
    CHECK(found == std::vector<std::string>{"fn_A", "Q1"});
}

TEST_CASE("suggest never proposes the script itself") {
    auto found = suggest_dependencies("Final(fn_A(1))", kKnown, "final");
    CHECK(found == std::vector<std::string>{"fn_A"});
}

TEST_CASE("suggest skips references that are not calls") {
    CHECK(suggest_dependencies("let x = fn_A, y = Q1 in y", kKnown).empty());
    CHECK(suggest_dependencies("Unknown(1)", kKnown).empty());
}

TEST_CASE("suggest reports each name once") {
    auto found = suggest_dependencies("fn_A(1) + fn_A(2) + FN_A(3)", kKnown);
    CHECK(found == std::vector<std::string>{"fn_A"});
}
