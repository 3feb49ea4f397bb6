#pragma once

#include <strata/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace strata::storage {

// Whole-file read. A missing file is an empty optional, anything else unreadable is IoReadError.
Result<std::optional<std::string>> readTextFile(const std::filesystem::path& path);

// Write through a sibling temp file and rename, creating parent directories first.
Result<void> atomicWriteText(const std::filesystem::path& path, std::string_view contents);

// Removes a regular file; a missing file is success
Result<void> removeFile(const std::filesystem::path& path);

Result<void> ensureDirectory(const std::filesystem::path& path);

} // namespace strata::storage
