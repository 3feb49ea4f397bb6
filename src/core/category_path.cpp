#include <strata/core/category_path.h>
#include <strata/core/slug.h>

#include <format>

namespace strata {

Result<CategoryPath> CategoryPath::parse(std::string_view text) {
    if (text.empty() || text == "/") {
        return CategoryPath::root();
    }

    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        auto slash = text.find('/', start);
        auto segment = text.substr(start, slash == std::string_view::npos ? std::string_view::npos
                                                                          : slash - start);
        segments.emplace_back(segment);
        if (slash == std::string_view::npos) {
            break;
        }
        start = slash + 1;
    }

    auto result = fromSegments(segments);
    if (!result) {
        return Error{ErrorCode::InvalidPath, result.error().message, std::string(text)};
    }
    return result;
}

Result<CategoryPath> CategoryPath::fromSegments(const std::vector<std::string>& segments) {
    for (const auto& segment : segments) {
        if (segment.empty()) {
            return Error{ErrorCode::InvalidPath, "Category path contains an empty segment"};
        }
        if (!isValidSlug(segment)) {
            return Error{ErrorCode::InvalidPath,
                         std::format("Invalid category segment '{}'", segment), segment};
        }
    }
    return CategoryPath(segments);
}

CategoryPath CategoryPath::parent() const {
    if (segments_.size() <= 1) {
        return CategoryPath::root();
    }
    return prefix(segments_.size() - 1);
}

CategoryPath CategoryPath::prefix(size_t depth) const {
    if (depth >= segments_.size()) {
        return *this;
    }
    return CategoryPath(std::vector<std::string>(segments_.begin(),
                                                 segments_.begin() + static_cast<long>(depth)));
}

Result<CategoryPath> CategoryPath::child(std::string_view slug) const {
    if (!isValidSlug(slug)) {
        return Error{ErrorCode::InvalidPath, std::format("Invalid category segment '{}'", slug),
                     std::string(slug)};
    }
    auto segments = segments_;
    segments.emplace_back(slug);
    return CategoryPath(std::move(segments));
}

std::vector<CategoryPath> CategoryPath::ancestors() const {
    std::vector<CategoryPath> out;
    out.reserve(segments_.size());
    for (size_t depth = 0; depth < segments_.size(); ++depth) {
        out.push_back(prefix(depth));
    }
    return out;
}

bool CategoryPath::isWithin(const CategoryPath& scope) const noexcept {
    if (scope.segments_.size() > segments_.size()) {
        return false;
    }
    for (size_t i = 0; i < scope.segments_.size(); ++i) {
        if (segments_[i] != scope.segments_[i]) {
            return false;
        }
    }
    return true;
}

std::string CategoryPath::toString() const {
    std::string out;
    for (const auto& segment : segments_) {
        if (!out.empty()) {
            out.push_back('/');
        }
        out += segment;
    }
    return out;
}

} // namespace strata
