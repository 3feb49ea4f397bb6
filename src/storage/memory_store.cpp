#include <strata/core/slug.h>
#include <strata/storage/file_io.h>
#include <strata/storage/memory_store.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>

namespace strata::storage {

Result<std::optional<std::string>> MemoryStore::read(const MemoryPath& path) const {
    return readTextFile(context_.memoryFile(path));
}

Result<void> MemoryStore::write(const MemoryPath& path, std::string_view contents) const {
    auto file = context_.memoryFile(path);
    if (auto written = atomicWriteText(file, contents); !written) {
        return Error{ErrorCode::IoWriteError,
                     std::format("Failed to write memory {}: {}", path.toString(),
                                 written.error().message),
                     path.toString()};
    }
    spdlog::debug("Wrote memory {} ({} bytes)", path.toString(), contents.size());
    return updater_.updateAfterWrite(path, contents);
}

Result<void> MemoryStore::remove(const MemoryPath& path) const {
    auto removed = removeFile(context_.memoryFile(path));
    if (!removed) {
        return Error{removed.error().code, removed.error().message, path.toString()};
    }
    return {};
}

Result<void> MemoryStore::move(const MemoryPath& from, const MemoryPath& to) const {
    auto source = context_.memoryFile(from);
    auto destination = context_.memoryFile(to);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return Error{ErrorCode::NotFound, std::format("Memory not found: {}", from.toString()),
                     from.toString()};
    }
    if (!std::filesystem::is_directory(destination.parent_path(), ec)) {
        return Error{ErrorCode::NotFound,
                     std::format("Destination category does not exist for {}", to.toString()),
                     to.category().toString()};
    }

    std::filesystem::rename(source, destination, ec);
    if (ec) {
        return Error{ErrorCode::IoWriteError,
                     std::format("Failed to move memory from {} to {}: {}", from.toString(),
                                 to.toString(), ec.message()),
                     to.toString()};
    }
    spdlog::debug("Moved memory {} -> {}", from.toString(), to.toString());

    auto contents = readTextFile(destination);
    if (!contents)
        return contents.error();
    if (!contents.value()) {
        return Error{ErrorCode::IoReadError,
                     std::format("Moved memory vanished: {}", to.toString()), to.toString()};
    }
    return updater_.updateAfterWrite(to, *contents.value());
}

Result<std::vector<MemoryPath>> MemoryStore::list(const CategoryPath& category) const {
    std::vector<MemoryPath> paths;
    auto directory = context_.categoryDirectory(category);

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        return paths;
    }

    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return Error{ErrorCode::IoReadError,
                     std::format("Failed to list {}: {}", directory.string(), ec.message()),
                     category.toString()};
    }
    try {
        for (const auto& entry : it) {
            auto name = entry.path().filename().string();
            if (name.starts_with(".") || !entry.is_regular_file(ec) ||
                !context_.isMemoryFileName(name)) {
                continue;
            }
            auto slug = name.substr(0, name.size() - context_.memoryExtension().size());
            if (!isValidSlug(slug)) {
                spdlog::debug("Ignoring non-canonical memory file {}", entry.path().string());
                continue;
            }
            auto path = MemoryPath::from(category, slug);
            if (path) {
                paths.push_back(std::move(path).value());
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        return Error{ErrorCode::IoReadError,
                     std::format("Failed to list {}: {}", directory.string(), e.what()),
                     category.toString()};
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace strata::storage
