#pragma once

#include <strata/core/category_path.h>
#include <strata/core/types.h>
#include <strata/index/category_index.h>
#include <strata/storage/filesystem_context.h>

#include <optional>

namespace strata::storage {

struct IndexReadOptions {
    // Treat a missing index file as an empty index instead of NotFound
    bool createWhenMissing = false;
};

/**
 * Reads and writes per-category index files.
 *
 * Every mutation is a read-modify-write of a single file; writes replace the
 * file atomically so a reader never observes a partial index.
 */
class IndexStore {
public:
    explicit IndexStore(FilesystemContext context) : context_(std::move(context)) {}

    Result<index::CategoryIndex> read(const CategoryPath& category,
                                      IndexReadOptions options = {}) const;

    // Empty optional when the index file does not exist
    Result<std::optional<index::CategoryIndex>> load(const CategoryPath& category) const;

    Result<void> write(const CategoryPath& category, const index::CategoryIndex& index) const;

    Result<bool> exists(const CategoryPath& category) const;

    // Replace-or-insert by memory path; creates the index when missing
    Result<void> upsertMemoryEntry(const CategoryPath& category,
                                   index::IndexMemoryEntry entry) const;

    /**
     * Replace-or-insert `child` in `parent`'s index with the given count.
     * A description already stored on the entry is kept.
     *
     * @return InvalidArgument when `child` is not a direct child of `parent`
     */
    Result<void> upsertSubcategoryEntry(const CategoryPath& parent, const CategoryPath& child,
                                        uint64_t memoryCount) const;

    // No-op when the parent index or the entry is absent
    Result<void> removeSubcategoryEntry(const CategoryPath& parent,
                                        const CategoryPath& child) const;

    const FilesystemContext& context() const noexcept { return context_; }

private:
    FilesystemContext context_;
};

} // namespace strata::storage
