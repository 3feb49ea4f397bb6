#pragma once

#include <strata/core/category_path.h>
#include <strata/core/memory_path.h>
#include <strata/core/types.h>

#include <filesystem>
#include <string>

namespace strata::storage {

// File naming options shared by every store
struct StorageOptions {
    std::string memoryExtension = DEFAULT_MEMORY_EXTENSION;
    std::string indexExtension = DEFAULT_INDEX_EXTENSION;
};

// Ensures a leading dot; blank input falls back to `fallback`
std::string normalizeExtension(std::string_view value, std::string_view fallback);

/**
 * Resolved layout of one store on disk.
 *
 * Memory:   {root}/{category}/{slug}{memoryExtension}
 * Index:    {root}/{category}/index{indexExtension}, root index at {root}/index{ext}
 *
 * Paths are built from validated slugs only, so they cannot escape the root.
 */
class FilesystemContext {
public:
    FilesystemContext(std::filesystem::path storeRoot, const StorageOptions& options = {});

    const std::filesystem::path& storeRoot() const noexcept { return storeRoot_; }
    const std::string& memoryExtension() const noexcept { return memoryExtension_; }
    const std::string& indexExtension() const noexcept { return indexExtension_; }

    // "index.yaml" with the configured extension
    std::string indexFileName() const { return std::string(INDEX_FILE_STEM) + indexExtension_; }

    std::filesystem::path categoryDirectory(const CategoryPath& category) const;
    std::filesystem::path indexFile(const CategoryPath& category) const;
    std::filesystem::path memoryFile(const MemoryPath& memory) const;

    // True for a regular memory file name (right extension, not the index file)
    bool isMemoryFileName(const std::string& fileName) const;

private:
    std::filesystem::path storeRoot_;
    std::string memoryExtension_;
    std::string indexExtension_;
};

} // namespace strata::storage
