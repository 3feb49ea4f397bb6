#pragma once

#include <strata/core/category_path.h>
#include <strata/core/types.h>
#include <strata/storage/filesystem_context.h>
#include <strata/storage/index_store.h>

#include <optional>
#include <string>

namespace strata::storage {

// Category directories and the descriptions kept in their parents' indexes
class CategoryStore {
public:
    CategoryStore(FilesystemContext context, IndexStore indexes)
        : context_(std::move(context)), indexes_(std::move(indexes)) {}

    Result<bool> exists(const CategoryPath& category) const;

    // mkdir -p; succeeds when the directory is already there
    Result<void> ensure(const CategoryPath& category) const;

    // Recursive delete. A missing directory is success; root is refused.
    Result<void> remove(const CategoryPath& category) const;

    /**
     * Set or clear the description stored for `category` in its parent's index.
     *
     * The parent index and the entry are created when missing (count 0). The value
     * is trimmed; an empty result clears the description.
     *
     * @return InvalidArgument for root or a description longer than
     *         MAX_DESCRIPTION_LENGTH characters
     */
    Result<void> setDescription(const CategoryPath& category,
                                const std::optional<std::string>& description) const;

    Result<void> removeSubcategoryEntry(const CategoryPath& category) const;

private:
    FilesystemContext context_;
    IndexStore indexes_;
};

} // namespace strata::storage
