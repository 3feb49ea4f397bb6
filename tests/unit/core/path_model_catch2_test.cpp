// Catch2 tests for slugs, category paths and memory paths

#include <catch2/catch_test_macros.hpp>

#include <strata/core/category_path.h>
#include <strata/core/memory_path.h>
#include <strata/core/slug.h>

#include <unordered_set>

using namespace strata;

TEST_CASE("Slug validation", "[core][slug][catch2]") {
    SECTION("accepts lowercase alphanumerics with single hyphens") {
        CHECK(isValidSlug("notes"));
        CHECK(isValidSlug("project-x"));
        CHECK(isValidSlug("v2"));
        CHECK(isValidSlug("a-b-c-1"));
    }

    SECTION("rejects everything else") {
        CHECK_FALSE(isValidSlug(""));
        CHECK_FALSE(isValidSlug("-leading"));
        CHECK_FALSE(isValidSlug("trailing-"));
        CHECK_FALSE(isValidSlug("double--hyphen"));
        CHECK_FALSE(isValidSlug("Upper"));
        CHECK_FALSE(isValidSlug("under_score"));
        CHECK_FALSE(isValidSlug("with space"));
        CHECK_FALSE(isValidSlug("dot.ted"));
    }
}

TEST_CASE("Slug normalization", "[core][slug][catch2]") {
    CHECK(normalizeSlug("My Notes") == "my-notes");
    CHECK(normalizeSlug("snake_case_name") == "snake-case-name");
    CHECK(normalizeSlug("  --Weird__  spacing--  ") == "weird-spacing");
    CHECK(normalizeSlug("Caf\xc3\xa9 & Bar!") == "caf-bar");
    CHECK(normalizeSlug("already-ok") == "already-ok");
    CHECK(normalizeSlug("!!!").empty());
    CHECK(normalizeSlug("").empty());

    // Normalizing a valid slug is the identity
    CHECK(isValidSlug(normalizeSlug("Some Title 2")));
}

TEST_CASE("CategoryPath parsing", "[core][path][catch2]") {
    SECTION("empty and slash are root") {
        auto empty = CategoryPath::parse("");
        REQUIRE(empty);
        CHECK(empty.value().isRoot());
        CHECK(empty.value().toString().empty());

        auto slash = CategoryPath::parse("/");
        REQUIRE(slash);
        CHECK(slash.value().isRoot());
    }

    SECTION("nested segments") {
        auto path = CategoryPath::parse("work/projects/alpha");
        REQUIRE(path);
        CHECK(path.value().depth() == 3);
        CHECK(path.value().segments() ==
              std::vector<std::string>{"work", "projects", "alpha"});
        CHECK(path.value().toString() == "work/projects/alpha");
    }

    SECTION("empty segments are rejected") {
        CHECK(CategoryPath::parse("a//b").error().code == ErrorCode::InvalidPath);
        CHECK(CategoryPath::parse("/a").error().code == ErrorCode::InvalidPath);
        CHECK(CategoryPath::parse("a/").error().code == ErrorCode::InvalidPath);
    }

    SECTION("invalid segments are rejected") {
        auto bad = CategoryPath::parse("work/Bad Name");
        REQUIRE_FALSE(bad);
        CHECK(bad.error().code == ErrorCode::InvalidPath);
        CHECK(bad.error().path == "work/Bad Name");
        CHECK_FALSE(CategoryPath::parse("..").has_value());
    }
}

TEST_CASE("CategoryPath navigation", "[core][path][catch2]") {
    auto path = CategoryPath::parse("a/b/c").value();

    SECTION("parent walks up to root and stays there") {
        CHECK(path.parent().toString() == "a/b");
        CHECK(path.parent().parent().parent().isRoot());
        CHECK(CategoryPath::root().parent().isRoot());
    }

    SECTION("prefix clamps to depth") {
        CHECK(path.prefix(0).isRoot());
        CHECK(path.prefix(2).toString() == "a/b");
        CHECK(path.prefix(10) == path);
    }

    SECTION("ancestors run from root to parent") {
        auto ancestors = path.ancestors();
        REQUIRE(ancestors.size() == 3);
        CHECK(ancestors[0].isRoot());
        CHECK(ancestors[1].toString() == "a");
        CHECK(ancestors[2].toString() == "a/b");
        CHECK(CategoryPath::root().ancestors().empty());
    }

    SECTION("child validates the new segment") {
        auto child = path.child("d");
        REQUIRE(child);
        CHECK(child.value().toString() == "a/b/c/d");
        CHECK(child.value().parent() == path);
        CHECK(path.child("Not Valid").error().code == ErrorCode::InvalidPath);
    }

    SECTION("scope containment") {
        CHECK(path.isWithin(CategoryPath::root()));
        CHECK(path.isWithin(CategoryPath::parse("a").value()));
        CHECK(path.isWithin(path));
        CHECK_FALSE(path.isWithin(CategoryPath::parse("a/bc").value()));
        CHECK_FALSE(CategoryPath::parse("a").value().isWithin(path));
    }

    SECTION("ordering and hashing follow the string form") {
        auto a = CategoryPath::parse("a").value();
        auto ab = CategoryPath::parse("a/b").value();
        CHECK(CategoryPath::root() < a);
        CHECK(a < ab);

        std::unordered_set<CategoryPath> set{a, ab, CategoryPath::parse("a").value()};
        CHECK(set.size() == 2);
    }
}

TEST_CASE("MemoryPath parsing", "[core][path][catch2]") {
    SECTION("category and slug split on the last slash") {
        auto path = MemoryPath::parse("work/projects/kickoff");
        REQUIRE(path);
        CHECK(path.value().category().toString() == "work/projects");
        CHECK(path.value().slug() == "kickoff");
        CHECK(path.value().toString() == "work/projects/kickoff");
    }

    SECTION("a bare slug lives in the root category") {
        auto path = MemoryPath::parse("standalone");
        REQUIRE(path);
        CHECK(path.value().category().isRoot());
        CHECK(path.value().toString() == "standalone");
    }

    SECTION("invalid input") {
        CHECK(MemoryPath::parse("").error().code == ErrorCode::InvalidPath);
        CHECK(MemoryPath::parse("/slug").error().code == ErrorCode::InvalidPath);
        CHECK(MemoryPath::parse("a//slug").error().code == ErrorCode::InvalidPath);
        CHECK(MemoryPath::parse("work/").error().code == ErrorCode::InvalidSlug);
        CHECK(MemoryPath::parse("work/Bad_Slug").error().code == ErrorCode::InvalidSlug);
    }

    SECTION("from validates the slug") {
        auto category = CategoryPath::parse("notes").value();
        auto ok = MemoryPath::from(category, "today");
        REQUIRE(ok);
        CHECK(ok.value().toString() == "notes/today");
        CHECK(MemoryPath::from(category, "To Day").error().code == ErrorCode::InvalidSlug);
    }

    SECTION("equality") {
        CHECK(MemoryPath::parse("a/b").value() ==
              MemoryPath::from(CategoryPath::parse("a").value(), "b").value());
        CHECK(MemoryPath::parse("a/b").value() != MemoryPath::parse("a/c").value());
    }
}
