#pragma once

#include <strata/core/types.h>
#include <strata/index/category_index.h>

#include <string>
#include <string_view>

namespace strata::index {

/**
 * Decode index YAML into a CategoryIndex.
 *
 * Errors:
 * - ParseFailed: text is not YAML
 * - ValidationFailed: missing `memories`/`subcategories`, non-list values, missing or
 *   malformed `path`, negative or non-integer counts, unparseable `updated_at`
 *
 * An empty document decodes as an empty index.
 */
Result<CategoryIndex> decodeIndex(std::string_view text);

// Encode in a fixed key order, omitting absent optional fields. SerializeFailed on
// emitter errors.
Result<std::string> encodeIndex(const CategoryIndex& index);

} // namespace strata::index
