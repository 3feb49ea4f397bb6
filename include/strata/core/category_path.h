#pragma once

#include <strata/core/types.h>

#include <compare>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

/**
 * Identifies a node in the category tree.
 *
 * An ordered sequence of slug segments; the empty sequence is the root.
 * Instances can only be obtained through parse()/root()/child(), so every
 * segment is known to be a valid slug.
 */
class CategoryPath {
public:
    // Root category
    CategoryPath() = default;

    static CategoryPath root() { return CategoryPath(); }

    // "" and "/" parse to root. Any empty or malformed segment is InvalidPath.
    static Result<CategoryPath> parse(std::string_view text);
    static Result<CategoryPath> fromSegments(const std::vector<std::string>& segments);

    bool isRoot() const noexcept { return segments_.empty(); }
    size_t depth() const noexcept { return segments_.size(); }
    const std::vector<std::string>& segments() const noexcept { return segments_; }

    // Parent of root is root
    CategoryPath parent() const;

    // First `depth` segments (clamped)
    CategoryPath prefix(size_t depth) const;

    // Appends a slug; fails with InvalidPath when `slug` is not a valid slug
    Result<CategoryPath> child(std::string_view slug) const;

    // Every proper ancestor from root down to the parent, in that order
    std::vector<CategoryPath> ancestors() const;

    // True when this path equals `scope` or lies below it. Root scope contains everything.
    bool isWithin(const CategoryPath& scope) const noexcept;

    std::string toString() const;

    bool operator==(const CategoryPath& other) const = default;
    std::strong_ordering operator<=>(const CategoryPath& other) const {
        return toString() <=> other.toString();
    }

private:
    explicit CategoryPath(std::vector<std::string> segments) : segments_(std::move(segments)) {}

    std::vector<std::string> segments_;
};

} // namespace strata

template <> struct std::hash<strata::CategoryPath> {
    size_t operator()(const strata::CategoryPath& path) const noexcept {
        return std::hash<std::string>{}(path.toString());
    }
};
