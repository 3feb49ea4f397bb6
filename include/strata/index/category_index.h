#pragma once

#include <strata/core/category_path.h>
#include <strata/core/memory_path.h>
#include <strata/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strata::index {

struct IndexMemoryEntry {
    MemoryPath path;
    uint64_t tokenEstimate = 0;
    std::optional<std::string> summary;
    std::optional<Timestamp> updatedAt;

    bool operator==(const IndexMemoryEntry&) const = default;
};

struct IndexSubcategoryEntry {
    CategoryPath path;
    uint64_t memoryCount = 0;
    std::optional<std::string> description;

    bool operator==(const IndexSubcategoryEntry&) const = default;
};

// Per-category sidecar listing direct memories and child categories.
struct CategoryIndex {
    std::vector<IndexMemoryEntry> memories;
    std::vector<IndexSubcategoryEntry> subcategories;

    bool empty() const noexcept { return memories.empty() && subcategories.empty(); }

    // Orders both lists by path string
    void sort();

    const IndexMemoryEntry* findMemory(const MemoryPath& path) const;
    const IndexSubcategoryEntry* findSubcategory(const CategoryPath& path) const;

    // Replace-or-insert keyed by path; leaves the lists sorted
    void upsertMemory(IndexMemoryEntry entry);
    void upsertSubcategory(IndexSubcategoryEntry entry);

    // Returns true when an entry was removed
    bool removeSubcategory(const CategoryPath& path);

    bool operator==(const CategoryIndex&) const = default;
};

} // namespace strata::index
