#include <strata/core/slug.h>

#include <cctype>

namespace strata {

namespace {

bool isSlugChar(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

} // namespace

bool isValidSlug(std::string_view value) noexcept {
    if (value.empty() || value.front() == '-' || value.back() == '-') {
        return false;
    }
    char previous = '\0';
    for (char c : value) {
        if (c == '-') {
            if (previous == '-') {
                return false;
            }
        } else if (!isSlugChar(c)) {
            return false;
        }
        previous = c;
    }
    return true;
}

std::string normalizeSlug(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char ch : raw) {
        char c = static_cast<char>(std::tolower(ch));
        if (std::isspace(ch) || c == '_' || c == '-') {
            if (!out.empty() && out.back() != '-') {
                out.push_back('-');
            }
            continue;
        }
        if (isSlugChar(c)) {
            out.push_back(c);
        }
    }
    while (!out.empty() && out.back() == '-') {
        out.pop_back();
    }
    return out;
}

} // namespace strata
