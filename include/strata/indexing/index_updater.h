#pragma once

#include <strata/core/memory_path.h>
#include <strata/core/types.h>
#include <strata/index/category_index.h>
#include <strata/storage/index_store.h>

#include <string_view>

namespace strata::indexing {

// Index entry for a memory file's contents. Shared by the incremental and full rebuild
// paths so both produce identical entries.
index::IndexMemoryEntry makeMemoryEntry(const MemoryPath& path, std::string_view contents);

/**
 * Keeps the index chain of a single memory current after it has been written.
 *
 * Updates the owning category's index, then every ancestor's subcategory entry
 * from the root down to the owning category's parent. Each file is written as
 * it is updated; a failure part way leaves the earlier writes in place and is
 * repaired by a full reindex.
 */
class IndexUpdater {
public:
    explicit IndexUpdater(storage::IndexStore indexes) : indexes_(std::move(indexes)) {}

    // All failures come back as IndexError with the memory path attached
    Result<void> updateAfterWrite(const MemoryPath& path, std::string_view contents) const;

private:
    Result<void> updateAncestors(const CategoryPath& category) const;

    storage::IndexStore indexes_;
};

} // namespace strata::indexing
