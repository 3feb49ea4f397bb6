#include <strata/core/slug.h>
#include <strata/index/index_codec.h>
#include <strata/indexing/index_updater.h>
#include <strata/indexing/reindexer.h>
#include <strata/storage/file_io.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <map>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace strata::indexing {

namespace fs = std::filesystem;

namespace {

struct StoreScan {
    std::vector<fs::path> indexFiles;
    // Relative to the store root, sorted
    std::vector<fs::path> memoryFiles;
};

struct BuildState {
    std::map<CategoryPath, index::CategoryIndex> indexes;
    std::map<CategoryPath, std::set<CategoryPath>> children;
    std::unordered_set<std::string> usedPaths;
};

Result<StoreScan> scanStore(const storage::FilesystemContext& context) {
    StoreScan scan;
    const auto& root = context.storeRoot();

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return scan;
    }

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        return Error{ErrorCode::IoReadError,
                     std::format("Failed to walk store {}: {}", root.string(), ec.message()),
                     root.string()};
    }
    const auto indexName = context.indexFileName();
    fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            return Error{ErrorCode::IoReadError,
                         std::format("Failed to walk store {}: {}", root.string(), ec.message()),
                         root.string()};
        }
        const auto& entry = *it;
        auto name = entry.path().filename().string();
        if (name.starts_with(".")) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (name == indexName) {
            scan.indexFiles.push_back(entry.path().lexically_normal());
        } else if (context.isMemoryFileName(name)) {
            scan.memoryFiles.push_back(entry.path().lexically_relative(root));
        }
    }
    if (ec) {
        return Error{ErrorCode::IoReadError,
                     std::format("Failed to walk store {}: {}", root.string(), ec.message()),
                     root.string()};
    }

    auto byGenericPath = [](const fs::path& a, const fs::path& b) {
        return a.generic_string() < b.generic_string();
    };
    std::sort(scan.memoryFiles.begin(), scan.memoryFiles.end(), byGenericPath);
    std::sort(scan.indexFiles.begin(), scan.indexFiles.end(), byGenericPath);
    return scan;
}

// Descriptions recorded in the current indexes, keyed by subcategory path.
// The index at the parent's canonical location wins; among other files the first in
// path order does. Unreadable indexes are reported and otherwise ignored; they get
// rewritten or removed.
std::unordered_map<CategoryPath, std::string>
captureDescriptions(const storage::FilesystemContext& context,
                    const std::vector<fs::path>& indexFiles, std::vector<std::string>& warnings) {
    std::unordered_map<CategoryPath, std::string> descriptions;
    std::unordered_set<CategoryPath> fromCanonical;
    for (const auto& file : indexFiles) {
        auto text = storage::readTextFile(file);
        if (!text || !text.value()) {
            continue;
        }
        auto decoded = index::decodeIndex(*text.value());
        if (!decoded) {
            warnings.push_back(
                std::format("Unreadable index: {} ({})", file.string(), decoded.error().message));
            continue;
        }
        for (const auto& entry : decoded.value().subcategories) {
            if (!entry.description || fromCanonical.contains(entry.path)) {
                continue;
            }
            if (context.indexFile(entry.path.parent()).lexically_normal() == file) {
                descriptions.insert_or_assign(entry.path, *entry.description);
                fromCanonical.insert(entry.path);
            } else {
                descriptions.emplace(entry.path, *entry.description);
            }
        }
    }
    return descriptions;
}

// Normalized slug segments for a relative memory file path; empty when any segment
// normalizes to nothing.
std::vector<std::string> normalizedSegments(const fs::path& relative,
                                            const std::string& extension) {
    std::vector<std::string> segments;
    for (const auto& part : relative.parent_path()) {
        segments.push_back(normalizeSlug(part.string()));
    }
    auto fileName = relative.filename().string();
    segments.push_back(normalizeSlug(fileName.substr(0, fileName.size() - extension.size())));

    if (std::any_of(segments.begin(), segments.end(),
                    [](const std::string& s) { return s.empty(); })) {
        return {};
    }
    return segments;
}

bool occupiedByOther(const fs::path& candidate, const fs::path& actual) {
    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return false;
    }
    return !fs::equivalent(candidate, actual, ec);
}

void recordAncestors(BuildState& state, const CategoryPath& category) {
    state.indexes.try_emplace(category);
    for (size_t depth = 1; depth <= category.depth(); ++depth) {
        auto child = category.prefix(depth);
        auto parent = child.parent();
        state.indexes.try_emplace(parent);
        state.children[parent].insert(child);
    }
}

} // namespace

Result<ReindexReport> Reindexer::run() const {
    const auto& context = indexes_.context();
    ReindexReport report;

    auto scanned = scanStore(context);
    if (!scanned)
        return scanned.error();
    const auto& scan = scanned.value();
    spdlog::debug("Reindexing {}: {} memory files, {} existing indexes",
                  context.storeRoot().string(), scan.memoryFiles.size(), scan.indexFiles.size());

    auto descriptions = captureDescriptions(context, scan.indexFiles, report.warnings);

    BuildState state;
    for (const auto& relative : scan.memoryFiles) {
        auto actual = context.storeRoot() / relative;
        auto segments = normalizedSegments(relative, context.memoryExtension());
        if (segments.empty()) {
            report.warnings.push_back(std::format("Skipped: {} (path segment normalizes to empty)",
                                                  relative.generic_string()));
            continue;
        }

        std::string slug = segments.back();
        segments.pop_back();
        auto category = CategoryPath::fromSegments(segments);
        if (!category) {
            report.warnings.push_back(std::format("Skipped: {} ({})", relative.generic_string(),
                                                  category.error().message));
            continue;
        }

        // First candidate that no earlier file claimed and no other file occupies
        auto candidate = MemoryPath::from(category.value(), slug);
        for (int suffix = 2; candidate; ++suffix) {
            bool taken = state.usedPaths.contains(candidate.value().toString()) ||
                         occupiedByOther(context.memoryFile(candidate.value()), actual);
            if (!taken) {
                break;
            }
            candidate = MemoryPath::from(category.value(), std::format("{}-{}", slug, suffix));
        }
        if (!candidate) {
            report.warnings.push_back(std::format("Skipped: {} ({})", relative.generic_string(),
                                                  candidate.error().message));
            continue;
        }
        auto path = std::move(candidate).value();
        auto canonical = context.memoryFile(path);

        if (canonical != actual) {
            if (auto dir = storage::ensureDirectory(canonical.parent_path()); !dir) {
                return dir.error();
            }
            std::error_code ec;
            fs::rename(actual, canonical, ec);
            if (ec) {
                return Error{ErrorCode::IoWriteError,
                             std::format("Failed to rename {} to {}: {}", actual.string(),
                                         canonical.string(), ec.message()),
                             relative.generic_string()};
            }
            ++report.filesRenamed;
            auto canonicalRelative = canonical.lexically_relative(context.storeRoot());
            if (path.slug() != slug) {
                report.warnings.push_back(std::format("Collision: {} indexed as {}",
                                                      relative.generic_string(),
                                                      path.toString()));
            } else {
                report.warnings.push_back(std::format("Renamed: {} to {}",
                                                      relative.generic_string(),
                                                      canonicalRelative.generic_string()));
            }
        }
        state.usedPaths.insert(path.toString());

        auto contents = storage::readTextFile(canonical);
        if (!contents)
            return contents.error();
        if (!contents.value()) {
            return Error{ErrorCode::IoReadError,
                         std::format("Memory file disappeared during reindex: {}",
                                     canonical.string()),
                         path.toString()};
        }

        recordAncestors(state, path.category());
        state.indexes[path.category()].memories.push_back(
            makeMemoryEntry(path, *contents.value()));
        ++report.memoriesIndexed;
    }

    // Parent entries count each child's own memories
    for (const auto& [parent, children] : state.children) {
        auto& parentIndex = state.indexes[parent];
        for (const auto& child : children) {
            index::IndexSubcategoryEntry entry{child, state.indexes[child].memories.size(),
                                               std::nullopt};
            if (auto found = descriptions.find(child); found != descriptions.end()) {
                entry.description = found->second;
            }
            parentIndex.subcategories.push_back(std::move(entry));
        }
    }

    std::set<fs::path> written;
    for (auto& [category, index] : state.indexes) {
        index.sort();
        if (auto result = indexes_.write(category, index); !result) {
            return result.error();
        }
        written.insert(context.indexFile(category).lexically_normal());
        ++report.indexesWritten;
    }

    for (const auto& file : scan.indexFiles) {
        if (written.contains(file)) {
            continue;
        }
        if (auto removed = storage::removeFile(file); !removed) {
            return removed.error();
        }
        spdlog::debug("Removed stale index {}", file.string());
        ++report.indexesRemoved;
    }

    for (const auto& warning : report.warnings) {
        spdlog::warn("{}", warning);
    }
    spdlog::info("Reindexed {}: {} memories, {} indexes written, {} removed",
                 context.storeRoot().string(), report.memoriesIndexed, report.indexesWritten,
                 report.indexesRemoved);
    return report;
}

} // namespace strata::indexing
