// Catch2 tests for incremental index maintenance, full reindex and prune

#include <catch2/catch_test_macros.hpp>

#include <strata/core/time_format.h>
#include <strata/core/tokens.h>
#include <strata/indexing/index_updater.h>
#include <strata/indexing/prune.h>
#include <strata/indexing/reindexer.h>
#include <strata/storage/store_handle.h>

#include "../../support/temp_dir_scope.hpp"

#include <algorithm>
#include <filesystem>
#include <map>

using namespace strata;
using namespace strata::indexing;
using strata::storage::FilesystemContext;
using strata::storage::StoreHandle;
using strata::test_support::memoryFile;
using strata::test_support::TempDirScope;

namespace fs = std::filesystem;

namespace {

MemoryPath mem(std::string_view text) {
    return MemoryPath::parse(text).value();
}

CategoryPath cat(std::string_view text) {
    return CategoryPath::parse(text).value();
}

struct ReindexFixture {
    ReindexFixture()
        : dir(TempDirScope::unique_under("strata_reindex_test")),
          store("test", FilesystemContext(dir.path())) {}

    ReindexReport reindex() const {
        auto report = Reindexer(store.indexes()).run();
        REQUIRE(report);
        return report.value();
    }

    index::CategoryIndex indexOf(std::string_view category) const {
        auto loaded = store.indexes().read(cat(category));
        REQUIRE(loaded);
        return loaded.value();
    }

    // Every index file in the store keyed by relative path
    std::map<std::string, std::string> snapshotIndexes() const {
        std::map<std::string, std::string> files;
        for (const auto& entry : fs::recursive_directory_iterator(dir.path())) {
            if (entry.is_regular_file() && entry.path().filename() == "index.yaml") {
                auto relative = entry.path().lexically_relative(dir.path()).generic_string();
                files[relative] = dir.read(relative);
            }
        }
        return files;
    }

    bool hasWarning(const ReindexReport& report, std::string_view prefix) const {
        return std::any_of(report.warnings.begin(), report.warnings.end(),
                           [&](const std::string& w) { return w.starts_with(prefix); });
    }

    TempDirScope dir;
    StoreHandle store;
};

} // namespace

TEST_CASE("makeMemoryEntry reads size and timestamp", "[indexing][catch2]") {
    auto contents = memoryFile("Some body text", "2024-04-04T04:04:04.000Z");
    auto entry = makeMemoryEntry(mem("a/b"), contents);
    CHECK(entry.path.toString() == "a/b");
    CHECK(entry.tokenEstimate == estimateTokenCount(contents));
    CHECK_FALSE(entry.summary.has_value());
    REQUIRE(entry.updatedAt.has_value());
    CHECK(*entry.updatedAt == *TimeFormat::parseISO8601("2024-04-04T04:04:04.000Z"));

    auto plain = makeMemoryEntry(mem("loose"), "no front matter at all");
    CHECK_FALSE(plain.updatedAt.has_value());
    CHECK(plain.tokenEstimate > 0);
}

TEST_CASE_METHOD(ReindexFixture, "IndexUpdater maintains ancestor counts",
                 "[indexing][catch2]") {
    IndexUpdater updater(store.indexes());
    dir.write("a/one.md", memoryFile("1"));
    dir.write("a/b/two.md", memoryFile("2"));
    REQUIRE(updater.updateAfterWrite(mem("a/one"), memoryFile("1")));
    REQUIRE(updater.updateAfterWrite(mem("a/b/two"), memoryFile("2")));

    CHECK(indexOf("").findSubcategory(cat("a"))->memoryCount == 1);
    CHECK(indexOf("a").findSubcategory(cat("a/b"))->memoryCount == 1);
    CHECK(indexOf("a").findMemory(mem("a/one")) != nullptr);
    CHECK(indexOf("a/b").findMemory(mem("a/b/two")) != nullptr);
}

TEST_CASE_METHOD(ReindexFixture, "Reindex builds indexes from files", "[indexing][catch2]") {
    dir.write("work/plan.md", memoryFile("plan", "2024-02-02T00:00:00.000Z"));
    dir.write("work/meetings/monday.md", memoryFile("monday"));
    dir.write("work/meetings/tuesday.md", memoryFile("tuesday"));
    dir.write("top.md", memoryFile("top"));
    dir.write("work/notes.txt", "not a memory");

    auto report = reindex();
    CHECK(report.memoriesIndexed == 4);
    CHECK(report.indexesWritten == 3);
    CHECK(report.indexesRemoved == 0);
    CHECK(report.filesRenamed == 0);
    CHECK(report.warnings.empty());

    auto root = indexOf("");
    REQUIRE(root.memories.size() == 1);
    CHECK(root.memories[0].path.toString() == "top");
    REQUIRE(root.subcategories.size() == 1);
    CHECK(root.subcategories[0].memoryCount == 1);

    auto work = indexOf("work");
    REQUIRE(work.memories.size() == 1);
    REQUIRE(work.memories[0].updatedAt.has_value());
    CHECK(TimeFormat::formatISO8601(*work.memories[0].updatedAt) == "2024-02-02T00:00:00.000Z");
    REQUIRE(work.subcategories.size() == 1);
    CHECK(work.subcategories[0].path.toString() == "work/meetings");
    CHECK(work.subcategories[0].memoryCount == 2);

    auto meetings = indexOf("work/meetings");
    REQUIRE(meetings.memories.size() == 2);
    CHECK(meetings.memories[0].path.toString() == "work/meetings/monday");
    CHECK(meetings.subcategories.empty());
}

TEST_CASE_METHOD(ReindexFixture, "Reindex is idempotent", "[indexing][catch2]") {
    dir.write("a/b/c/deep.md", memoryFile("deep"));
    dir.write("a/shallow.md", memoryFile("shallow"));
    dir.write("x/y.md", memoryFile("y"));

    reindex();
    auto first = snapshotIndexes();
    auto second = reindex();
    CHECK(second.warnings.empty());
    CHECK(second.indexesRemoved == 0);
    CHECK(snapshotIndexes() == first);
}

TEST_CASE_METHOD(ReindexFixture, "Incremental writes match a full rebuild",
                 "[indexing][catch2]") {
    const auto& memories = store.memories();
    REQUIRE(memories.write(mem("a/b/c/deep"), memoryFile("deep", "2024-03-01T00:00:00.000Z")));
    REQUIRE(memories.write(mem("a/shallow"), memoryFile("shallow text")));
    REQUIRE(memories.write(mem("root-note"), memoryFile("root")));
    REQUIRE(memories.write(mem("x/y"), memoryFile("y")));

    auto incremental = snapshotIndexes();
    auto report = reindex();
    CHECK(report.warnings.empty());
    CHECK(snapshotIndexes() == incremental);
}

TEST_CASE_METHOD(ReindexFixture, "Reindex normalizes file names", "[indexing][catch2]") {
    dir.write("My Notes/Daily Log.md", memoryFile("log"));

    auto report = reindex();
    CHECK(report.filesRenamed == 1);
    CHECK(hasWarning(report, "Renamed: My Notes/Daily Log.md to my-notes/daily-log.md"));
    CHECK(dir.exists("my-notes/daily-log.md"));
    CHECK_FALSE(dir.exists("My Notes/Daily Log.md"));
    CHECK(indexOf("my-notes").findMemory(mem("my-notes/daily-log")) != nullptr);
    CHECK(indexOf("").findSubcategory(cat("my-notes")) != nullptr);

    auto again = reindex();
    CHECK(again.warnings.empty());
    CHECK(again.filesRenamed == 0);
}

TEST_CASE_METHOD(ReindexFixture, "Reindex resolves collisions with suffixes",
                 "[indexing][catch2]") {
    dir.write("notes/Idea.md", memoryFile("upper"));
    dir.write("notes/idea.md", memoryFile("lower"));
    dir.write("notes/IDEA!.md", memoryFile("shout"));

    auto report = reindex();
    CHECK(report.memoriesIndexed == 3);
    CHECK(report.filesRenamed == 2);
    CHECK(hasWarning(report, "Collision: notes/IDEA!.md indexed as notes/idea-2"));
    CHECK(hasWarning(report, "Collision: notes/Idea.md indexed as notes/idea-3"));

    // The already canonical file keeps its name
    CHECK(dir.read("notes/idea.md") == memoryFile("lower"));
    CHECK(dir.read("notes/idea-2.md") == memoryFile("shout"));
    CHECK(dir.read("notes/idea-3.md") == memoryFile("upper"));

    auto notes = indexOf("notes");
    REQUIRE(notes.memories.size() == 3);

    auto again = reindex();
    CHECK(again.warnings.empty());
    CHECK(again.filesRenamed == 0);
    CHECK(again.memoriesIndexed == 3);
}

TEST_CASE_METHOD(ReindexFixture, "Reindex skips names with nothing usable",
                 "[indexing][catch2]") {
    dir.write("!!!.md", memoryFile("x"));
    dir.write("ok.md", memoryFile("ok"));

    auto report = reindex();
    CHECK(report.memoriesIndexed == 1);
    CHECK(hasWarning(report, "Skipped: !!!.md (path segment normalizes to empty)"));
    CHECK(dir.exists("!!!.md"));
}

TEST_CASE_METHOD(ReindexFixture, "Reindex ignores hidden entries", "[indexing][catch2]") {
    dir.write(".git/objects/blob.md", memoryFile("x"));
    dir.write("notes/.draft.md", memoryFile("x"));
    dir.write("notes/kept.md", memoryFile("kept"));

    auto report = reindex();
    CHECK(report.memoriesIndexed == 1);
    CHECK(report.warnings.empty());
    CHECK_FALSE(dir.exists(".git/objects/index.yaml"));
}

TEST_CASE_METHOD(ReindexFixture, "Reindex preserves category descriptions",
                 "[indexing][catch2]") {
    REQUIRE(store.memories().write(mem("projects/alpha/spec"), memoryFile("spec")));
    REQUIRE(store.categories().setDescription(cat("projects"), std::string("All projects")));
    REQUIRE(store.categories().setDescription(cat("projects/alpha"), std::string("Alpha")));

    auto report = reindex();
    CHECK(report.warnings.empty());
    CHECK(indexOf("").findSubcategory(cat("projects"))->description == "All projects");
    CHECK(indexOf("projects").findSubcategory(cat("projects/alpha"))->description == "Alpha");
    CHECK(indexOf("projects").findSubcategory(cat("projects/alpha"))->memoryCount == 1);
}

TEST_CASE_METHOD(ReindexFixture, "Reindex removes stale indexes", "[indexing][catch2]") {
    REQUIRE(store.memories().write(mem("keep/me"), memoryFile("keep")));
    REQUIRE(store.memories().write(mem("drop/me"), memoryFile("drop")));
    REQUIRE(store.memories().remove(mem("drop/me")));

    // Removal leaves the entry behind until a rebuild
    CHECK(indexOf("drop").findMemory(mem("drop/me")) != nullptr);

    auto report = reindex();
    CHECK(report.indexesRemoved == 1);
    CHECK_FALSE(dir.exists("drop/index.yaml"));
    CHECK(indexOf("").findSubcategory(cat("drop")) == nullptr);
    CHECK(indexOf("").findSubcategory(cat("keep")) != nullptr);

    SECTION("an emptied store loses every index") {
        REQUIRE(store.memories().remove(mem("keep/me")));
        auto emptied = reindex();
        CHECK(emptied.indexesWritten == 0);
        CHECK(snapshotIndexes().empty());
    }
}

TEST_CASE_METHOD(ReindexFixture, "Reindex removes a stale nested index and keeps its ancestors",
                 "[indexing][catch2]") {
    REQUIRE(store.memories().write(mem("a/b/c/x"), memoryFile("x")));
    REQUIRE(store.memories().write(mem("a/b/d/y"), memoryFile("y")));
    REQUIRE(store.memories().remove(mem("a/b/c/x")));

    auto report = reindex();
    CHECK(report.indexesRemoved == 1);
    CHECK_FALSE(dir.exists("a/b/c/index.yaml"));
    CHECK(dir.exists("a/b/index.yaml"));
    CHECK(dir.exists("a/index.yaml"));

    auto b = indexOf("a/b");
    REQUIRE(b.subcategories.size() == 1);
    CHECK(b.subcategories[0].path.toString() == "a/b/d");
    CHECK(b.subcategories[0].memoryCount == 1);
    CHECK(b.memories.empty());
    CHECK(indexOf("a").findSubcategory(cat("a/b"))->memoryCount == 1);
}

TEST_CASE_METHOD(ReindexFixture, "Reindex prefers descriptions from the parent's own index",
                 "[indexing][catch2]") {
    dir.write("notes/daily/today.md", memoryFile("today"));
    // Sorts before notes/index.yaml and lists the same child
    dir.write("Notes/index.yaml", "memories: []
"
                                  "subcategories:
"
                                  "  - path: notes/daily
"
                                  "    memory_count: 1
"
                                  "    description: Leftover
");
    dir.write("notes/index.yaml", "memories: []
"
                                  "subcategories:
"
                                  "  - path: notes/daily
"
                                  "    memory_count: 1
"
                                  "    description: Daily log
");

    auto report = reindex();
    CHECK(indexOf("notes").findSubcategory(cat("notes/daily"))->description == "Daily log");
    CHECK_FALSE(dir.exists("Notes/index.yaml"));
    CHECK(report.indexesRemoved == 1);
}

TEST_CASE_METHOD(ReindexFixture, "Reindex reports unreadable indexes", "[indexing][catch2]") {
    dir.write("notes/keep.md", memoryFile("keep"));
    dir.write("notes/index.yaml", "memories: [broken");

    auto report = reindex();
    CHECK(hasWarning(report, "Unreadable index: "));
    auto notes = indexOf("notes");
    CHECK(notes.memories.size() == 1);
}

TEST_CASE("Reindex of a missing store root is empty", "[indexing][catch2]") {
    auto dir = TempDirScope::unique_under("strata_reindex_missing");
    StoreHandle store("ghost", FilesystemContext(dir.path() / "does-not-exist"));
    auto report = Reindexer(store.indexes()).run();
    REQUIRE(report);
    CHECK(report.value().memoriesIndexed == 0);
    CHECK(report.value().indexesWritten == 0);
}

TEST_CASE_METHOD(ReindexFixture, "Prune removes expired memories", "[indexing][prune][catch2]") {
    const auto now = *TimeFormat::parseISO8601("2024-06-01T00:00:00.000Z");
    REQUIRE(store.memories().write(
        mem("temp/old"), memoryFile("old", "2024-01-01T00:00:00.000Z", "2024-05-01T00:00:00.000Z")));
    REQUIRE(store.memories().write(
        mem("temp/edge"),
        memoryFile("edge", "2024-01-01T00:00:00.000Z", "2024-06-01T00:00:00.000Z")));
    REQUIRE(store.memories().write(
        mem("temp/future"),
        memoryFile("future", "2024-01-01T00:00:00.000Z", "2024-12-01T00:00:00.000Z")));
    REQUIRE(store.memories().write(mem("forever"), memoryFile("no expiry")));

    SECTION("dry run reports without deleting") {
        auto report = pruneExpired(store, {now, true});
        REQUIRE(report);
        REQUIRE(report.value().pruned.size() == 2);
        CHECK(report.value().pruned[0].path.toString() == "temp/edge");
        CHECK(report.value().pruned[1].path.toString() == "temp/old");
        CHECK_FALSE(report.value().reindex.has_value());
        CHECK(dir.exists("temp/old.md"));
        CHECK(indexOf("temp").memories.size() == 3);
    }

    SECTION("prune deletes and reindexes") {
        auto report = pruneExpired(store, {now, false});
        REQUIRE(report);
        CHECK(report.value().pruned.size() == 2);
        REQUIRE(report.value().reindex.has_value());
        CHECK(report.value().reindex->memoriesIndexed == 2);

        CHECK_FALSE(dir.exists("temp/old.md"));
        CHECK_FALSE(dir.exists("temp/edge.md"));
        CHECK(dir.exists("temp/future.md"));

        auto temp = indexOf("temp");
        REQUIRE(temp.memories.size() == 1);
        CHECK(temp.memories[0].path.toString() == "temp/future");
        CHECK(indexOf("").findSubcategory(cat("temp"))->memoryCount == 1);
    }

    SECTION("nothing expired leaves the store alone") {
        auto early = *TimeFormat::parseISO8601("2024-01-01T00:00:00.000Z");
        auto report = pruneExpired(store, {early, false});
        REQUIRE(report);
        CHECK(report.value().pruned.empty());
        CHECK_FALSE(report.value().reindex.has_value());
    }
}
