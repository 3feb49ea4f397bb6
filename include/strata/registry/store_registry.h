#pragma once

#include <strata/core/types.h>
#include <strata/storage/filesystem_context.h>
#include <strata/storage/store_handle.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace strata::registry {

struct StoreDefinition {
    // Absolute store root
    std::filesystem::path path;
    std::optional<std::string> description;

    bool operator==(const StoreDefinition&) const = default;
};

// Store name (a slug) to definition
using StoreRegistry = std::map<std::string, StoreDefinition>;

bool isValidStoreName(std::string_view name) noexcept;

/**
 * Parse registry YAML.
 *
 * The top level maps store names to `{path, description?}`. A single `stores:`
 * wrapper key is also accepted. Paths go through tilde expansion and must then
 * be absolute. An empty document is an empty registry.
 *
 * Every failure is RegistryParseFailed.
 */
Result<StoreRegistry> parseStoreRegistry(std::string_view text);

// Inverse of parseStoreRegistry; an empty registry is written as "{}"
Result<std::string> serializeStoreRegistry(const StoreRegistry& registry);

/**
 * Snapshot of a successfully loaded registry.
 *
 * Only FilesystemRegistry creates these, so holding one means the registry
 * file was read and validated.
 */
class LoadedRegistry {
public:
    const StoreRegistry& stores() const noexcept { return stores_; }

    bool contains(const std::string& name) const { return stores_.contains(name); }

    // StoreNotFound for names not in the registry
    Result<storage::StoreHandle> getStore(const std::string& name) const;

private:
    friend class FilesystemRegistry;

    LoadedRegistry(StoreRegistry stores, storage::StorageOptions options)
        : stores_(std::move(stores)), options_(std::move(options)) {}

    StoreRegistry stores_;
    storage::StorageOptions options_;
};

// Registry persisted as a YAML file
class FilesystemRegistry {
public:
    explicit FilesystemRegistry(std::filesystem::path registryPath,
                                storage::StorageOptions options = {})
        : registryPath_(std::move(registryPath)), options_(std::move(options)) {}

    const std::filesystem::path& path() const noexcept { return registryPath_; }

    // Creates parent directories and an empty registry when the file is absent
    Result<void> initialize();

    /**
     * Read, validate and cache the registry.
     *
     * Errors: RegistryMissing, RegistryReadFailed, RegistryParseFailed
     */
    Result<LoadedRegistry> load();

    // Validate and overwrite the file, refreshing the cache. RegistryWriteFailed on I/O errors.
    Result<LoadedRegistry> save(const StoreRegistry& registry);

    // Last snapshot produced by load() or save()
    std::optional<LoadedRegistry> cached() const { return cache_; }

private:
    std::filesystem::path registryPath_;
    storage::StorageOptions options_;
    std::optional<LoadedRegistry> cache_;
};

} // namespace strata::registry
