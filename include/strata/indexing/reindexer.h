#pragma once

#include <strata/core/types.h>
#include <strata/storage/index_store.h>

#include <cstddef>
#include <string>
#include <vector>

namespace strata::indexing {

struct ReindexReport {
    // Skipped files, collisions and renames, in processing order
    std::vector<std::string> warnings;
    size_t indexesWritten = 0;
    size_t indexesRemoved = 0;
    size_t memoriesIndexed = 0;
    size_t filesRenamed = 0;
};

/**
 * Rebuilds every category index of a store from the memory files on disk.
 *
 * File names are normalized to slugs segment by segment. A file whose
 * normalized location differs from where it sits is renamed on disk, with
 * numeric suffixes (-2, -3, ...) resolving clashes, so that a second run
 * finds nothing to change. Descriptions from the previous indexes are carried
 * over for categories that still hold memories. Index files for categories
 * left without content are deleted.
 *
 * Running twice on an unchanged store produces byte-identical index files.
 */
class Reindexer {
public:
    explicit Reindexer(storage::IndexStore indexes) : indexes_(std::move(indexes)) {}

    // The first I/O error aborts the run; earlier writes stay in place.
    Result<ReindexReport> run() const;

private:
    storage::IndexStore indexes_;
};

} // namespace strata::indexing
