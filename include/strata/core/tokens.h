#pragma once

#include <cstdint>
#include <string_view>

namespace strata {

// Simple estimation: ~4 characters per token over the trimmed text.
// Empty or whitespace-only content is 0; anything else is at least 1.
uint64_t estimateTokenCount(std::string_view content) noexcept;

} // namespace strata
