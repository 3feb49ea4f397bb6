#pragma once

#include <strata/core/types.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::memory {

struct MemoryMetadata {
    Timestamp createdAt;
    Timestamp updatedAt;
    std::vector<std::string> tags;
    std::string source;
    std::optional<Timestamp> expiresAt;
    std::vector<std::string> citations;

    bool operator==(const MemoryMetadata&) const = default;
};

struct Memory {
    MemoryMetadata metadata;
    std::string content;

    bool operator==(const Memory&) const = default;

    bool isExpired(Timestamp now) const noexcept {
        return metadata.expiresAt.has_value() && *metadata.expiresAt <= now;
    }
};

// The subset of a memory file the indexer cares about
struct MemoryFacts {
    std::optional<Timestamp> updatedAt;
    std::optional<Timestamp> expiresAt;
};

/**
 * Parse a memory file: a `---` delimited YAML front matter block followed by the body.
 *
 * Errors:
 * - ParseFailed: front matter missing/unterminated or not valid YAML
 * - ValidationFailed: required field missing or malformed (created_at, updated_at,
 *   source, tags, optional expires_at/citations)
 */
Result<Memory> parseMemory(std::string_view raw);

// Inverse of parseMemory; citations/expires_at are omitted when empty
Result<std::string> serializeMemory(const Memory& memory);

// Best-effort extraction that never fails; unreadable fields come back empty.
MemoryFacts inspectMemory(std::string_view raw) noexcept;

} // namespace strata::memory
