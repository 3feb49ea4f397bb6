#include <strata/core/memory_path.h>
#include <strata/core/slug.h>

#include <format>

namespace strata {

Result<MemoryPath> MemoryPath::parse(std::string_view text) {
    if (text.empty()) {
        return Error{ErrorCode::InvalidPath, "Memory path cannot be empty"};
    }

    auto slash = text.rfind('/');
    std::string_view categoryText =
        slash == std::string_view::npos ? std::string_view{} : text.substr(0, slash);
    std::string_view slug = slash == std::string_view::npos ? text : text.substr(slash + 1);

    // "/slug" would otherwise silently land in root
    if (slash != std::string_view::npos && categoryText.empty()) {
        return Error{ErrorCode::InvalidPath, "Memory path contains an empty segment",
                     std::string(text)};
    }

    auto category = CategoryPath::parse(categoryText);
    if (!category) {
        return Error{ErrorCode::InvalidPath, category.error().message, std::string(text)};
    }

    if (!isValidSlug(slug)) {
        return Error{ErrorCode::InvalidSlug, std::format("Invalid memory slug '{}'", slug),
                     std::string(text)};
    }
    return MemoryPath(std::move(category).value(), std::string(slug));
}

Result<MemoryPath> MemoryPath::from(CategoryPath category, std::string_view slug) {
    if (!isValidSlug(slug)) {
        return Error{ErrorCode::InvalidSlug, std::format("Invalid memory slug '{}'", slug),
                     std::string(slug)};
    }
    return MemoryPath(std::move(category), std::string(slug));
}

std::string MemoryPath::toString() const {
    if (category_.isRoot()) {
        return slug_;
    }
    return category_.toString() + "/" + slug_;
}

} // namespace strata
