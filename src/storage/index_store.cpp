#include <strata/index/index_codec.h>
#include <strata/storage/file_io.h>
#include <strata/storage/index_store.h>

#include <spdlog/spdlog.h>

#include <format>

namespace strata::storage {

Result<std::optional<index::CategoryIndex>>
IndexStore::load(const CategoryPath& category) const {
    auto file = context_.indexFile(category);
    auto text = readTextFile(file);
    if (!text)
        return text.error();
    if (!text.value()) {
        return std::optional<index::CategoryIndex>{};
    }

    auto decoded = index::decodeIndex(*text.value());
    if (!decoded) {
        auto error = decoded.error();
        error.message = std::format("{} ({})", error.message, file.string());
        error.path = category.toString();
        return error;
    }
    return std::optional<index::CategoryIndex>{std::move(decoded).value()};
}

Result<index::CategoryIndex> IndexStore::read(const CategoryPath& category,
                                              IndexReadOptions options) const {
    auto loaded = load(category);
    if (!loaded)
        return loaded.error();
    if (!loaded.value()) {
        if (options.createWhenMissing) {
            return index::CategoryIndex{};
        }
        return Error{ErrorCode::NotFound,
                     std::format("No index for category '{}'", category.toString()),
                     category.toString()};
    }
    return std::move(*std::move(loaded).value());
}

Result<void> IndexStore::write(const CategoryPath& category,
                               const index::CategoryIndex& index) const {
    auto sorted = index;
    sorted.sort();
    auto text = index::encodeIndex(sorted);
    if (!text)
        return text.error();

    auto file = context_.indexFile(category);
    spdlog::debug("Writing index {} ({} memories, {} subcategories)", file.string(),
                  sorted.memories.size(), sorted.subcategories.size());
    return atomicWriteText(file, text.value());
}

Result<bool> IndexStore::exists(const CategoryPath& category) const {
    std::error_code ec;
    bool present = std::filesystem::is_regular_file(context_.indexFile(category), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IoReadError, ec.message(), category.toString()};
    }
    return present;
}

Result<void> IndexStore::upsertMemoryEntry(const CategoryPath& category,
                                           index::IndexMemoryEntry entry) const {
    auto current = read(category, {.createWhenMissing = true});
    if (!current)
        return current.error();
    auto index = std::move(current).value();
    index.upsertMemory(std::move(entry));
    return write(category, index);
}

Result<void> IndexStore::upsertSubcategoryEntry(const CategoryPath& parent,
                                                const CategoryPath& child,
                                                uint64_t memoryCount) const {
    if (child.isRoot() || child.parent() != parent) {
        return Error{ErrorCode::InvalidArgument,
                     std::format("'{}' is not a direct child of '{}'", child.toString(),
                                 parent.toString()),
                     child.toString()};
    }

    auto current = read(parent, {.createWhenMissing = true});
    if (!current)
        return current.error();
    auto index = std::move(current).value();

    index::IndexSubcategoryEntry entry{child, memoryCount, std::nullopt};
    if (const auto* existing = index.findSubcategory(child)) {
        entry.description = existing->description;
    }
    index.upsertSubcategory(std::move(entry));
    return write(parent, index);
}

Result<void> IndexStore::removeSubcategoryEntry(const CategoryPath& parent,
                                                const CategoryPath& child) const {
    auto loaded = load(parent);
    if (!loaded)
        return loaded.error();
    if (!loaded.value()) {
        return {};
    }
    auto index = std::move(*std::move(loaded).value());
    if (!index.removeSubcategory(child)) {
        return {};
    }
    return write(parent, index);
}

} // namespace strata::storage
