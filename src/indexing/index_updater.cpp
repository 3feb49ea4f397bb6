#include <strata/core/tokens.h>
#include <strata/indexing/index_updater.h>
#include <strata/memory/memory_file.h>

#include <spdlog/spdlog.h>

#include <format>

namespace strata::indexing {

index::IndexMemoryEntry makeMemoryEntry(const MemoryPath& path, std::string_view contents) {
    auto facts = memory::inspectMemory(contents);
    return index::IndexMemoryEntry{path, estimateTokenCount(contents), std::nullopt,
                                   facts.updatedAt};
}

Result<void> IndexUpdater::updateAfterWrite(const MemoryPath& path,
                                            std::string_view contents) const {
    const auto& category = path.category();

    auto result = indexes_.upsertMemoryEntry(category, makeMemoryEntry(path, contents));
    if (result) {
        result = updateAncestors(category);
    }
    if (!result) {
        spdlog::warn("Index update for {} failed: {}", path.toString(), result.error().message);
        return Error{ErrorCode::IndexError,
                     std::format("Failed to update indexes for '{}': {}", path.toString(),
                                 result.error().message),
                     path.toString()};
    }
    spdlog::debug("Updated index chain for {}", path.toString());
    return {};
}

Result<void> IndexUpdater::updateAncestors(const CategoryPath& category) const {
    // Root gets the top-level entry, then each intermediate level gets its child's entry.
    // Counts are the child's own direct memories.
    for (size_t depth = 1; depth <= category.depth(); ++depth) {
        auto child = category.prefix(depth);
        auto childIndex = indexes_.read(child, {.createWhenMissing = true});
        if (!childIndex)
            return childIndex.error();

        auto written = indexes_.upsertSubcategoryEntry(child.parent(), child,
                                                       childIndex.value().memories.size());
        if (!written)
            return written;
    }
    return {};
}

} // namespace strata::indexing
