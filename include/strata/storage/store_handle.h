#pragma once

#include <strata/storage/category_store.h>
#include <strata/storage/filesystem_context.h>
#include <strata/storage/index_store.h>
#include <strata/storage/memory_store.h>

#include <string>

namespace strata::storage {

// Storage bundles bound to one store root. Obtained from LoadedRegistry::getStore()
// or built directly for a known directory.
class StoreHandle {
public:
    StoreHandle(std::string name, FilesystemContext context)
        : name_(std::move(name)),
          context_(context),
          indexes_(context),
          categories_(context, indexes_),
          memories_(context, indexes_) {}

    const std::string& name() const noexcept { return name_; }
    const FilesystemContext& context() const noexcept { return context_; }

    const IndexStore& indexes() const noexcept { return indexes_; }
    const CategoryStore& categories() const noexcept { return categories_; }
    const MemoryStore& memories() const noexcept { return memories_; }

private:
    std::string name_;
    FilesystemContext context_;
    IndexStore indexes_;
    CategoryStore categories_;
    MemoryStore memories_;
};

} // namespace strata::storage
