#include <strata/core/tokens.h>

#include <algorithm>
#include <cctype>

namespace strata {

namespace {
constexpr uint64_t CHARS_PER_TOKEN = 4;

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}
} // namespace

uint64_t estimateTokenCount(std::string_view content) noexcept {
    auto first = std::find_if_not(content.begin(), content.end(), isSpace);
    auto last = std::find_if_not(content.rbegin(), content.rend(), isSpace).base();
    if (first >= last) {
        return 0;
    }
    auto length = static_cast<uint64_t>(last - first);
    return std::max<uint64_t>(1, (length + CHARS_PER_TOKEN - 1) / CHARS_PER_TOKEN);
}

} // namespace strata
