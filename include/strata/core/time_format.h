#pragma once

#include <strata/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace strata {

/**
 * @brief ISO 8601 timestamps as stored in memory front matter and index files
 *
 * Values are UTC with millisecond precision, e.g. "2024-01-01T00:00:00.000Z".
 */
class TimeFormat {
public:
    /**
     * @brief Parse an ISO 8601 date/time string
     *
     * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM:SS" with optional fractional
     * seconds, and a trailing "Z" or "+HH:MM"/"-HH:MM" offset. A missing offset
     * is read as UTC.
     *
     * @return Parsed timestamp or nullopt if invalid format
     */
    static std::optional<Timestamp> parseISO8601(std::string_view isoStr);

    // Always "YYYY-MM-DDTHH:MM:SS.mmmZ"
    static std::string formatISO8601(Timestamp tp);

    static Timestamp now();
};

} // namespace strata
