#pragma once

#include <string>
#include <string_view>

namespace strata {

// A slug is one path segment: lowercase alphanumerics with single interior hyphens.
bool isValidSlug(std::string_view value) noexcept;

/**
 * Map free-form text toward the slug grammar: lowercase, whitespace and
 * underscores become hyphens, other characters are dropped, hyphen runs
 * collapse, and leading/trailing hyphens are trimmed.
 *
 * The result may be empty when nothing usable remains.
 */
std::string normalizeSlug(std::string_view raw);

} // namespace strata
