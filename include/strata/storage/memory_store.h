#pragma once

#include <strata/core/category_path.h>
#include <strata/core/memory_path.h>
#include <strata/core/types.h>
#include <strata/indexing/index_updater.h>
#include <strata/storage/filesystem_context.h>
#include <strata/storage/index_store.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::storage {

/**
 * Memory files of one store.
 *
 * Writes and moves keep the destination's index chain current. Removal leaves
 * index entries behind; `strata reindex` drops them.
 */
class MemoryStore {
public:
    MemoryStore(FilesystemContext context, IndexStore indexes)
        : context_(std::move(context)), updater_(std::move(indexes)) {}

    // Empty optional when the memory does not exist
    Result<std::optional<std::string>> read(const MemoryPath& path) const;

    // Writes the file then updates indexes. An IndexError leaves the file written.
    Result<void> write(const MemoryPath& path, std::string_view contents) const;

    // Missing file is success
    Result<void> remove(const MemoryPath& path) const;

    // NotFound when the source or the destination category directory is missing
    Result<void> move(const MemoryPath& from, const MemoryPath& to) const;

    // Memories stored directly in `category`, sorted by path
    Result<std::vector<MemoryPath>> list(const CategoryPath& category) const;

private:
    FilesystemContext context_;
    indexing::IndexUpdater updater_;
};

} // namespace strata::storage
