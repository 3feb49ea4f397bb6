#pragma once

#include <strata/core/memory_path.h>
#include <strata/core/types.h>
#include <strata/indexing/reindexer.h>
#include <strata/storage/store_handle.h>

#include <optional>
#include <vector>

namespace strata::indexing {

struct PruneOptions {
    Timestamp now;
    // Report what would be removed without touching the store
    bool dryRun = false;
};

struct PrunedMemory {
    MemoryPath path;
    Timestamp expiresAt;
};

struct PruneReport {
    std::vector<PrunedMemory> pruned;
    // Present when memories were removed and the store was reindexed
    std::optional<ReindexReport> reindex;
};

/**
 * Removes every memory whose `expires_at` is at or before `options.now`, then
 * rebuilds the store's indexes so removed entries and emptied categories
 * disappear from them.
 *
 * Front matter is read leniently: files without a readable expiry are kept.
 */
Result<PruneReport> pruneExpired(const storage::StoreHandle& store, const PruneOptions& options);

} // namespace strata::indexing
