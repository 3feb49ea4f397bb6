#include <strata/storage/filesystem_context.h>

namespace strata::storage {

std::string normalizeExtension(std::string_view value, std::string_view fallback) {
    auto first = value.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return std::string(fallback);
    }
    auto last = value.find_last_not_of(" \t");
    std::string ext(value.substr(first, last - first + 1));
    if (ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

FilesystemContext::FilesystemContext(std::filesystem::path storeRoot,
                                     const StorageOptions& options)
    : storeRoot_(std::filesystem::absolute(storeRoot).lexically_normal()),
      memoryExtension_(normalizeExtension(options.memoryExtension, DEFAULT_MEMORY_EXTENSION)),
      indexExtension_(normalizeExtension(options.indexExtension, DEFAULT_INDEX_EXTENSION)) {
    // lexically_normal keeps a trailing separator on "dir/"; drop it so paths compare equal
    if (!storeRoot_.has_filename() && storeRoot_.has_parent_path() &&
        storeRoot_ != storeRoot_.root_path()) {
        storeRoot_ = storeRoot_.parent_path();
    }
}

std::filesystem::path FilesystemContext::categoryDirectory(const CategoryPath& category) const {
    auto dir = storeRoot_;
    for (const auto& segment : category.segments()) {
        dir /= segment;
    }
    return dir;
}

std::filesystem::path FilesystemContext::indexFile(const CategoryPath& category) const {
    return categoryDirectory(category) / indexFileName();
}

std::filesystem::path FilesystemContext::memoryFile(const MemoryPath& memory) const {
    return categoryDirectory(memory.category()) / (memory.slug() + memoryExtension_);
}

bool FilesystemContext::isMemoryFileName(const std::string& fileName) const {
    if (fileName == indexFileName()) {
        return false;
    }
    if (fileName.size() <= memoryExtension_.size()) {
        return false;
    }
    return fileName.compare(fileName.size() - memoryExtension_.size(), memoryExtension_.size(),
                            memoryExtension_) == 0;
}

} // namespace strata::storage
