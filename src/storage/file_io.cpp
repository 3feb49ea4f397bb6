#include <strata/storage/file_io.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <format>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace strata::storage {

namespace {

std::filesystem::path tempPathFor(const std::filesystem::path& target) {
    static std::atomic<uint64_t> counter{0};
    auto name = std::format(".{}.tmp.{}.{}", target.filename().string(),
                            static_cast<long>(::getpid()), counter.fetch_add(1));
    return target.parent_path() / name;
}

} // namespace

Result<std::optional<std::string>> readTextFile(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        return std::optional<std::string>{};
    }
    if (ec) {
        return Error{ErrorCode::IoReadError,
                     std::format("Failed to stat {}: {}", path.string(), ec.message()),
                     path.string()};
    }
    if (!std::filesystem::is_regular_file(status)) {
        return Error{ErrorCode::IoReadError, std::format("Not a regular file: {}", path.string()),
                     path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IoReadError, std::format("Failed to open {}", path.string()),
                     path.string()};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::IoReadError, std::format("Failed to read {}", path.string()),
                     path.string()};
    }
    return std::optional<std::string>{buffer.str()};
}

Result<void> ensureDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        spdlog::error("Failed to create directory {}: {}", path.string(), ec.message());
        return Error{ErrorCode::IoWriteError,
                     std::format("Failed to create directory {}: {}", path.string(), ec.message()),
                     path.string()};
    }
    return {};
}

Result<void> atomicWriteText(const std::filesystem::path& path, std::string_view contents) {
    // Ensure parent directory exists
    if (path.has_parent_path()) {
        if (auto result = ensureDirectory(path.parent_path()); !result) {
            return result;
        }
    }

    auto tempPath = tempPathFor(path);
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::IoWriteError,
                         std::format("Failed to create temp file {}", tempPath.string()),
                         path.string()};
        }
        file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            return Error{ErrorCode::IoWriteError, std::format("Failed to write {}", path.string()),
                         path.string()};
        }
    }

    // Atomic rename
    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        spdlog::error("Failed to rename {} to {}: {}", tempPath.string(), path.string(),
                      ec.message());
        return Error{ErrorCode::IoWriteError,
                     std::format("Failed to replace {}: {}", path.string(), ec.message()),
                     path.string()};
    }
    return {};
}

Result<void> removeFile(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error{ErrorCode::IoWriteError,
                     std::format("Failed to remove {}: {}", path.string(), ec.message()),
                     path.string()};
    }
    return {};
}

} // namespace strata::storage
