#pragma once

#include <strata/core/category_path.h>
#include <strata/core/types.h>

#include <compare>
#include <string>
#include <string_view>

namespace strata {

// A memory's identity: the owning category plus its own slug.
class MemoryPath {
public:
    // Splits on the last '/'; a bare slug belongs to the root category.
    static Result<MemoryPath> parse(std::string_view text);
    static Result<MemoryPath> from(CategoryPath category, std::string_view slug);

    const CategoryPath& category() const noexcept { return category_; }
    const std::string& slug() const noexcept { return slug_; }

    // "category/slug", or "slug" for root memories
    std::string toString() const;

    bool operator==(const MemoryPath& other) const = default;
    std::strong_ordering operator<=>(const MemoryPath& other) const {
        return toString() <=> other.toString();
    }

private:
    MemoryPath(CategoryPath category, std::string slug)
        : category_(std::move(category)), slug_(std::move(slug)) {}

    CategoryPath category_;
    std::string slug_;
};

} // namespace strata

template <> struct std::hash<strata::MemoryPath> {
    size_t operator()(const strata::MemoryPath& path) const noexcept {
        return std::hash<std::string>{}(path.toString());
    }
};
