// Catch2 tests for the filesystem layout, index store, category store and memory store

#include <catch2/catch_test_macros.hpp>

#include <strata/index/index_codec.h>
#include <strata/storage/file_io.h>
#include <strata/storage/store_handle.h>

#include "../../support/temp_dir_scope.hpp"

#include <filesystem>

using namespace strata;
using namespace strata::storage;
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

struct StoreFixture {
    StoreFixture()
        : dir(TempDirScope::unique_under("strata_store_test")),
          store("test", FilesystemContext(dir.path())) {}

    index::CategoryIndex indexOf(std::string_view category) const {
        auto loaded = store.indexes().read(cat(category));
        REQUIRE(loaded);
        return loaded.value();
    }

    TempDirScope dir;
    StoreHandle store;
};

} // namespace

TEST_CASE("FilesystemContext layout", "[storage][catch2]") {
    auto dir = TempDirScope::unique_under("strata_layout_test");
    FilesystemContext context(dir.path());

    CHECK(context.memoryExtension() == ".md");
    CHECK(context.indexFileName() == "index.yaml");
    CHECK(context.indexFile(CategoryPath::root()) == context.storeRoot() / "index.yaml");
    CHECK(context.indexFile(cat("a/b")) == context.storeRoot() / "a" / "b" / "index.yaml");
    CHECK(context.memoryFile(mem("a/b/note")) == context.storeRoot() / "a" / "b" / "note.md");
    CHECK(context.memoryFile(mem("top")) == context.storeRoot() / "top.md");

    CHECK(context.isMemoryFileName("note.md"));
    CHECK_FALSE(context.isMemoryFileName("note.txt"));
    CHECK_FALSE(context.isMemoryFileName(".md"));
    CHECK_FALSE(context.isMemoryFileName("index.yaml"));

    SECTION("custom extensions gain a leading dot") {
        FilesystemContext custom(dir.path(), StorageOptions{"txt", " .yml "});
        CHECK(custom.memoryExtension() == ".txt");
        CHECK(custom.indexFileName() == "index.yml");
        CHECK(custom.isMemoryFileName("note.txt"));
    }

    SECTION("blank extensions fall back to defaults") {
        FilesystemContext blank(dir.path(), StorageOptions{"", "  "});
        CHECK(blank.memoryExtension() == ".md");
        CHECK(blank.indexExtension() == ".yaml");
    }

    SECTION("trailing separator is dropped from the root") {
        FilesystemContext trailing(dir.path() / "");
        CHECK(trailing.storeRoot() == context.storeRoot());
    }
}

TEST_CASE("File helpers", "[storage][catch2]") {
    auto dir = TempDirScope::unique_under("strata_file_io_test");

    SECTION("missing file reads as empty optional") {
        auto text = readTextFile(dir.path() / "missing.txt");
        REQUIRE(text);
        CHECK_FALSE(text.value().has_value());
    }

    SECTION("atomic write creates parents and replaces contents") {
        auto target = dir.path() / "deep" / "nested" / "file.txt";
        REQUIRE(atomicWriteText(target, "first"));
        REQUIRE(atomicWriteText(target, "second"));
        CHECK(dir.read("deep/nested/file.txt") == "second");

        size_t entries = 0;
        for (const auto& entry : fs::directory_iterator(target.parent_path())) {
            (void)entry;
            ++entries;
        }
        CHECK(entries == 1);
    }

    SECTION("removing a missing file succeeds") {
        CHECK(removeFile(dir.path() / "nothing-here"));
        dir.write("present.txt", "x");
        CHECK(removeFile(dir.path() / "present.txt"));
        CHECK_FALSE(dir.exists("present.txt"));
    }
}

TEST_CASE_METHOD(StoreFixture, "IndexStore read and write", "[storage][index][catch2]") {
    SECTION("missing index is NotFound unless asked to create") {
        auto missing = store.indexes().read(cat("nowhere"));
        REQUIRE_FALSE(missing);
        CHECK(missing.error().code == ErrorCode::NotFound);

        auto created = store.indexes().read(cat("nowhere"), {.createWhenMissing = true});
        REQUIRE(created);
        CHECK(created.value().empty());

        auto loaded = store.indexes().load(cat("nowhere"));
        REQUIRE(loaded);
        CHECK_FALSE(loaded.value().has_value());
        CHECK_FALSE(dir.exists("nowhere/index.yaml"));
    }

    SECTION("write sorts entries") {
        index::CategoryIndex index;
        index.memories.push_back({mem("b"), 1, std::nullopt, std::nullopt});
        index.memories.push_back({mem("a"), 2, std::nullopt, std::nullopt});
        REQUIRE(store.indexes().write(CategoryPath::root(), index));

        auto exists = store.indexes().exists(CategoryPath::root());
        REQUIRE(exists);
        CHECK(exists.value());

        auto back = indexOf("");
        REQUIRE(back.memories.size() == 2);
        CHECK(back.memories[0].path.toString() == "a");
    }

    SECTION("corrupt index reports the category") {
        dir.write("broken/index.yaml", "memories: [oops");
        auto result = store.indexes().read(cat("broken"));
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::ParseFailed);
        CHECK(result.error().path == "broken");
        CHECK(result.error().message.find("index.yaml") != std::string::npos);
    }

    SECTION("subcategory upsert keeps descriptions and checks parentage") {
        REQUIRE(store.categories().setDescription(cat("a/b"), std::string("Keep me")));
        REQUIRE(store.indexes().upsertSubcategoryEntry(cat("a"), cat("a/b"), 7));

        auto parent = indexOf("a");
        REQUIRE(parent.subcategories.size() == 1);
        CHECK(parent.subcategories[0].memoryCount == 7);
        CHECK(parent.subcategories[0].description == "Keep me");

        auto wrong = store.indexes().upsertSubcategoryEntry(cat("a"), cat("a/b/c"), 1);
        REQUIRE_FALSE(wrong);
        CHECK(wrong.error().code == ErrorCode::InvalidArgument);
        CHECK(store.indexes()
                  .upsertSubcategoryEntry(CategoryPath::root(), CategoryPath::root(), 0)
                  .error()
                  .code == ErrorCode::InvalidArgument);
    }

    SECTION("removing a subcategory entry tolerates absence") {
        CHECK(store.indexes().removeSubcategoryEntry(cat("x"), cat("x/y")));
        CHECK_FALSE(dir.exists("x/index.yaml"));

        REQUIRE(store.indexes().upsertSubcategoryEntry(cat("x"), cat("x/y"), 1));
        REQUIRE(store.indexes().removeSubcategoryEntry(cat("x"), cat("x/y")));
        CHECK(indexOf("x").subcategories.empty());
    }
}

TEST_CASE_METHOD(StoreFixture, "CategoryStore", "[storage][category][catch2]") {
    const auto& categories = store.categories();

    SECTION("ensure and remove directories") {
        REQUIRE(categories.ensure(cat("a/b/c")));
        CHECK(categories.exists(cat("a/b/c")).value());
        REQUIRE(categories.ensure(cat("a/b/c")));

        dir.write("a/b/c/note.md", memoryFile("x"));
        REQUIRE(categories.remove(cat("a/b")));
        CHECK_FALSE(categories.exists(cat("a/b")).value());
        CHECK(categories.exists(cat("a")).value());

        CHECK(categories.remove(cat("never/existed")));
        CHECK(categories.remove(CategoryPath::root()).error().code ==
              ErrorCode::InvalidArgument);
    }

    SECTION("descriptions are trimmed, bounded and clearable") {
        REQUIRE(categories.setDescription(cat("topics"), std::string("  Things I know  ")));
        auto root = indexOf("");
        REQUIRE(root.subcategories.size() == 1);
        CHECK(root.subcategories[0].path.toString() == "topics");
        CHECK(root.subcategories[0].memoryCount == 0);
        CHECK(root.subcategories[0].description == "Things I know");

        REQUIRE(categories.setDescription(cat("topics"), std::string("   ")));
        CHECK_FALSE(indexOf("").subcategories[0].description.has_value());

        REQUIRE(categories.setDescription(cat("topics"), std::string("again")));
        REQUIRE(categories.setDescription(cat("topics"), std::nullopt));
        CHECK_FALSE(indexOf("").subcategories[0].description.has_value());

        auto tooLong = categories.setDescription(cat("topics"), std::string(501, 'x'));
        REQUIRE_FALSE(tooLong);
        CHECK(tooLong.error().code == ErrorCode::InvalidArgument);
        CHECK(categories.setDescription(cat("topics"), std::string(500, 'x')));

        CHECK(categories.setDescription(CategoryPath::root(), std::string("no")).error().code ==
              ErrorCode::InvalidArgument);
    }

    SECTION("description keeps the recorded count") {
        REQUIRE(store.memories().write(mem("topics/one"), memoryFile("one")));
        REQUIRE(categories.setDescription(cat("topics"), std::string("Described")));
        auto root = indexOf("");
        const auto* entry = root.findSubcategory(cat("topics"));
        REQUIRE(entry != nullptr);
        CHECK(entry->memoryCount == 1);
        CHECK(entry->description == "Described");
    }

    SECTION("removeSubcategoryEntry detaches from the parent") {
        REQUIRE_FALSE(dir.exists("a/index.yaml"));
        REQUIRE(categories.setDescription(cat("a/b"), std::string("child")));
        REQUIRE(dir.exists("a/index.yaml"));
        auto parent = indexOf("a");
        REQUIRE(parent.subcategories.size() == 1);
        CHECK(parent.subcategories[0].path.toString() == "a/b");
        CHECK(parent.subcategories[0].description == "child");

        REQUIRE(categories.removeSubcategoryEntry(cat("a/b")));
        CHECK(indexOf("a").subcategories.empty());
    }
}

TEST_CASE_METHOD(StoreFixture, "MemoryStore", "[storage][memory][catch2]") {
    const auto& memories = store.memories();

    SECTION("write then read") {
        REQUIRE(memories.write(mem("notes/today"), memoryFile("hello")));
        auto read = memories.read(mem("notes/today"));
        REQUIRE(read);
        REQUIRE(read.value().has_value());
        CHECK(*read.value() == memoryFile("hello"));

        auto missing = memories.read(mem("notes/none"));
        REQUIRE(missing);
        CHECK_FALSE(missing.value().has_value());
    }

    SECTION("write updates the whole index chain") {
        REQUIRE(memories.write(mem("a/b/c/deep"), memoryFile("deep body")));

        auto leaf = indexOf("a/b/c");
        REQUIRE(leaf.memories.size() == 1);
        CHECK(leaf.memories[0].path.toString() == "a/b/c/deep");
        CHECK(leaf.memories[0].tokenEstimate > 0);
        CHECK(leaf.memories[0].updatedAt.has_value());

        CHECK(indexOf("").findSubcategory(cat("a"))->memoryCount == 0);
        CHECK(indexOf("a").findSubcategory(cat("a/b"))->memoryCount == 0);
        CHECK(indexOf("a/b").findSubcategory(cat("a/b/c"))->memoryCount == 1);

        REQUIRE(memories.write(mem("a/b/c/second"), memoryFile("more")));
        CHECK(indexOf("a/b").findSubcategory(cat("a/b/c"))->memoryCount == 2);

        // Rewrite keeps a single entry
        REQUIRE(memories.write(mem("a/b/c/second"), memoryFile("changed body text")));
        CHECK(indexOf("a/b/c").memories.size() == 2);
        CHECK(indexOf("a/b").findSubcategory(cat("a/b/c"))->memoryCount == 2);
    }

    SECTION("root memories only touch the root index") {
        REQUIRE(memories.write(mem("loose"), memoryFile("top level")));
        auto root = indexOf("");
        REQUIRE(root.memories.size() == 1);
        CHECK(root.subcategories.empty());
    }

    SECTION("an unreadable index surfaces as IndexError after the file is written") {
        dir.write("bad/index.yaml", "memories: [");
        auto result = memories.write(mem("bad/note"), memoryFile("x"));
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::IndexError);
        CHECK(result.error().path == "bad/note");
        CHECK(dir.exists("bad/note.md"));
    }

    SECTION("remove") {
        REQUIRE(memories.write(mem("notes/gone"), memoryFile("x")));
        REQUIRE(memories.remove(mem("notes/gone")));
        CHECK_FALSE(dir.exists("notes/gone.md"));
        CHECK(memories.remove(mem("notes/gone")));
    }

    SECTION("move renames and indexes the destination") {
        REQUIRE(memories.write(mem("inbox/item"), memoryFile("moving")));
        REQUIRE(store.categories().ensure(cat("archive")));
        REQUIRE(memories.move(mem("inbox/item"), mem("archive/item")));

        CHECK_FALSE(dir.exists("inbox/item.md"));
        CHECK(dir.read("archive/item.md") == memoryFile("moving"));
        CHECK(indexOf("archive").findMemory(mem("archive/item")) != nullptr);
        CHECK(indexOf("").findSubcategory(cat("archive"))->memoryCount == 1);
    }

    SECTION("move failures") {
        CHECK(memories.move(mem("inbox/none"), mem("inbox/other")).error().code ==
              ErrorCode::NotFound);

        REQUIRE(memories.write(mem("inbox/item"), memoryFile("x")));
        auto noDir = memories.move(mem("inbox/item"), mem("missing/item"));
        REQUIRE_FALSE(noDir);
        CHECK(noDir.error().code == ErrorCode::NotFound);
        CHECK(dir.exists("inbox/item.md"));
    }

    SECTION("list returns canonical memory files only") {
        REQUIRE(memories.write(mem("notes/b"), memoryFile("b")));
        REQUIRE(memories.write(mem("notes/a"), memoryFile("a")));
        dir.write("notes/Not Canonical.md", memoryFile("x"));
        dir.write("notes/.hidden.md", memoryFile("x"));
        dir.write("notes/readme.txt", "x");
        REQUIRE(store.categories().ensure(cat("notes/sub")));

        auto listed = memories.list(cat("notes"));
        REQUIRE(listed);
        REQUIRE(listed.value().size() == 2);
        CHECK(listed.value()[0].toString() == "notes/a");
        CHECK(listed.value()[1].toString() == "notes/b");

        auto none = memories.list(cat("missing"));
        REQUIRE(none);
        CHECK(none.value().empty());
    }
}
