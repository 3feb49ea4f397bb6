#include <strata/core/time_format.h>
#include <strata/indexing/prune.h>
#include <strata/memory/memory_file.h>
#include <strata/storage/file_io.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>

namespace strata::indexing {

namespace fs = std::filesystem;

namespace {

// Canonically named memory files of the store, sorted by path
Result<std::vector<MemoryPath>> collectMemories(const storage::FilesystemContext& context) {
    std::vector<MemoryPath> paths;
    const auto& root = context.storeRoot();

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return paths;
    }
    try {
        for (auto it = fs::recursive_directory_iterator(root);
             it != fs::recursive_directory_iterator(); ++it) {
            auto name = it->path().filename().string();
            if (name.starts_with(".")) {
                if (it->is_directory()) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (!it->is_regular_file() || !context.isMemoryFileName(name)) {
                continue;
            }
            auto relative = it->path().lexically_relative(root).generic_string();
            relative.resize(relative.size() - context.memoryExtension().size());
            auto path = MemoryPath::parse(relative);
            if (!path) {
                spdlog::debug("Prune skips non-canonical file {}", it->path().string());
                continue;
            }
            paths.push_back(std::move(path).value());
        }
    } catch (const fs::filesystem_error& e) {
        return Error{ErrorCode::IoReadError,
                     std::format("Failed to walk store {}: {}", root.string(), e.what()),
                     root.string()};
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace

Result<PruneReport> pruneExpired(const storage::StoreHandle& store, const PruneOptions& options) {
    auto memories = collectMemories(store.context());
    if (!memories)
        return memories.error();

    PruneReport report;
    for (const auto& path : memories.value()) {
        auto contents = store.memories().read(path);
        if (!contents)
            return contents.error();
        if (!contents.value()) {
            continue;
        }
        auto facts = memory::inspectMemory(*contents.value());
        if (facts.expiresAt && *facts.expiresAt <= options.now) {
            report.pruned.push_back(PrunedMemory{path, *facts.expiresAt});
        }
    }

    if (options.dryRun || report.pruned.empty()) {
        spdlog::info("Prune found {} expired memories{}", report.pruned.size(),
                     options.dryRun ? " (dry run)" : "");
        return report;
    }

    for (const auto& entry : report.pruned) {
        if (auto removed = store.memories().remove(entry.path); !removed) {
            return removed.error();
        }
        spdlog::info("Pruned {} (expired {})", entry.path.toString(),
                     TimeFormat::formatISO8601(entry.expiresAt));
    }

    auto reindexed = Reindexer(store.indexes()).run();
    if (!reindexed)
        return reindexed.error();
    report.reindex = std::move(reindexed).value();
    return report;
}

} // namespace strata::indexing
