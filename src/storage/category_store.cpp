#include <strata/storage/category_store.h>
#include <strata/storage/file_io.h>

#include <spdlog/spdlog.h>

#include <format>

namespace strata::storage {

namespace {

std::string trimmed(std::string_view value) {
    auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(first, last - first + 1));
}

} // namespace

Result<bool> CategoryStore::exists(const CategoryPath& category) const {
    std::error_code ec;
    bool present = std::filesystem::is_directory(context_.categoryDirectory(category), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IoReadError, ec.message(), category.toString()};
    }
    return present;
}

Result<void> CategoryStore::ensure(const CategoryPath& category) const {
    auto result = ensureDirectory(context_.categoryDirectory(category));
    if (!result) {
        return Error{result.error().code,
                     std::format("Failed to create category directory: {}", category.toString()),
                     category.toString()};
    }
    return {};
}

Result<void> CategoryStore::remove(const CategoryPath& category) const {
    if (category.isRoot()) {
        return Error{ErrorCode::InvalidArgument, "Cannot delete the root category"};
    }
    std::error_code ec;
    std::filesystem::remove_all(context_.categoryDirectory(category), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IoWriteError,
                     std::format("Failed to delete category directory {}: {}",
                                 category.toString(), ec.message()),
                     category.toString()};
    }
    spdlog::debug("Removed category directory {}", category.toString());
    return {};
}

Result<void> CategoryStore::setDescription(const CategoryPath& category,
                                           const std::optional<std::string>& description) const {
    if (category.isRoot()) {
        return Error{ErrorCode::InvalidArgument, "The root category has no description"};
    }

    std::optional<std::string> value;
    if (description) {
        auto text = trimmed(*description);
        if (text.size() > MAX_DESCRIPTION_LENGTH) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("Description exceeds {} characters", MAX_DESCRIPTION_LENGTH),
                         category.toString()};
        }
        if (!text.empty()) {
            value = std::move(text);
        }
    }

    auto parent = category.parent();
    auto current = indexes_.read(parent, {.createWhenMissing = true});
    if (!current) {
        return Error{current.error().code,
                     std::format("Failed to read parent index '{}': {}", parent.toString(),
                                 current.error().message),
                     parent.toString()};
    }
    auto index = std::move(current).value();

    index::IndexSubcategoryEntry entry{category, 0, value};
    if (const auto* existing = index.findSubcategory(category)) {
        entry.memoryCount = existing->memoryCount;
    }
    index.upsertSubcategory(std::move(entry));

    auto written = indexes_.write(parent, index);
    if (!written) {
        return Error{written.error().code,
                     std::format("Failed to write parent index '{}': {}", parent.toString(),
                                 written.error().message),
                     parent.toString()};
    }
    return {};
}

Result<void> CategoryStore::removeSubcategoryEntry(const CategoryPath& category) const {
    if (category.isRoot()) {
        return Error{ErrorCode::InvalidArgument, "The root category has no parent entry"};
    }
    return indexes_.removeSubcategoryEntry(category.parent(), category);
}

} // namespace strata::storage
