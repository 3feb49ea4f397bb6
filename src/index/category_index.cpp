#include <strata/index/category_index.h>

#include <algorithm>

namespace strata::index {

void CategoryIndex::sort() {
    std::sort(memories.begin(), memories.end(),
              [](const auto& a, const auto& b) { return a.path.toString() < b.path.toString(); });
    std::sort(subcategories.begin(), subcategories.end(),
              [](const auto& a, const auto& b) { return a.path.toString() < b.path.toString(); });
}

const IndexMemoryEntry* CategoryIndex::findMemory(const MemoryPath& path) const {
    auto it = std::find_if(memories.begin(), memories.end(),
                           [&](const auto& entry) { return entry.path == path; });
    return it == memories.end() ? nullptr : &*it;
}

const IndexSubcategoryEntry* CategoryIndex::findSubcategory(const CategoryPath& path) const {
    auto it = std::find_if(subcategories.begin(), subcategories.end(),
                           [&](const auto& entry) { return entry.path == path; });
    return it == subcategories.end() ? nullptr : &*it;
}

void CategoryIndex::upsertMemory(IndexMemoryEntry entry) {
    std::erase_if(memories, [&](const auto& existing) { return existing.path == entry.path; });
    memories.push_back(std::move(entry));
    sort();
}

void CategoryIndex::upsertSubcategory(IndexSubcategoryEntry entry) {
    std::erase_if(subcategories,
                  [&](const auto& existing) { return existing.path == entry.path; });
    subcategories.push_back(std::move(entry));
    sort();
}

bool CategoryIndex::removeSubcategory(const CategoryPath& path) {
    return std::erase_if(subcategories,
                         [&](const auto& existing) { return existing.path == path; }) > 0;
}

} // namespace strata::index
