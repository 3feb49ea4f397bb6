#include <strata/config/config_helpers.h>
#include <strata/core/slug.h>
#include <strata/registry/store_registry.h>
#include <strata/storage/file_io.h>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <format>

namespace strata::registry {

namespace {

Error parseError(std::string message, std::string path = {}) {
    return Error{ErrorCode::RegistryParseFailed, std::move(message), std::move(path)};
}

Result<StoreDefinition> decodeDefinition(const std::string& name, const YAML::Node& node) {
    if (!node.IsMap()) {
        return parseError(std::format("Store '{}' must be a mapping", name), name);
    }
    auto pathNode = node["path"];
    if (!pathNode || !pathNode.IsScalar() || pathNode.Scalar().empty()) {
        return parseError(std::format("Store '{}' must include a path", name), name);
    }
    auto path = config::expand_tilde(pathNode.Scalar());
    if (!path.is_absolute()) {
        return parseError(
            std::format("Store '{}' path must be absolute: {}", name, pathNode.Scalar()), name);
    }

    StoreDefinition definition{path.lexically_normal(), std::nullopt};
    auto description = node["description"];
    if (description && !description.IsNull()) {
        if (!description.IsScalar()) {
            return parseError(std::format("Store '{}' description must be a string", name), name);
        }
        definition.description = description.Scalar();
    }
    return definition;
}

Result<StoreRegistry> decodeStores(const YAML::Node& stores) {
    StoreRegistry registry;
    for (const auto& item : stores) {
        if (!item.first.IsScalar()) {
            return parseError("Store names must be strings");
        }
        const auto& name = item.first.Scalar();
        if (!isValidSlug(name)) {
            return parseError(std::format("Invalid store name '{}': names must be lowercase slugs",
                                          name),
                              name);
        }
        auto definition = decodeDefinition(name, item.second);
        if (!definition)
            return definition.error();
        registry.emplace(name, std::move(definition).value());
    }
    return registry;
}

} // namespace

bool isValidStoreName(std::string_view name) noexcept {
    return isValidSlug(name);
}

Result<StoreRegistry> parseStoreRegistry(std::string_view text) {
    YAML::Node document;
    try {
        document = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return parseError(std::format("Failed to parse store registry: {}", e.what()));
    }

    const YAML::Node& root = document;
    if (root.IsNull()) {
        return StoreRegistry{};
    }
    if (!root.IsMap()) {
        return parseError("Store registry must be a mapping of store names");
    }

    // Older files nest the stores under a `stores:` key. A store that is itself
    // named "stores" has a scalar `path` directly beneath it.
    const auto wrapped = root["stores"];
    if (root.size() == 1 && wrapped && !(wrapped.IsMap() && wrapped["path"] &&
                                         wrapped["path"].IsScalar())) {
        if (wrapped.IsNull()) {
            return StoreRegistry{};
        }
        if (!wrapped.IsMap()) {
            return parseError("'stores' must be a mapping of store names");
        }
        return decodeStores(wrapped);
    }
    return decodeStores(root);
}

Result<std::string> serializeStoreRegistry(const StoreRegistry& registry) {
    if (registry.empty()) {
        return std::string("{}\n");
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [name, definition] : registry) {
        if (!isValidStoreName(name)) {
            return Error{ErrorCode::InvalidArgument, std::format("Invalid store name '{}'", name),
                         name};
        }
        if (!definition.path.is_absolute()) {
            return Error{ErrorCode::InvalidArgument,
                         std::format("Store '{}' path must be absolute", name), name};
        }
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << definition.path.string();
        if (definition.description) {
            out << YAML::Key << "description" << YAML::Value << YAML::DoubleQuoted
                << *definition.description;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        return Error{ErrorCode::SerializeFailed,
                     std::format("Failed to serialize store registry: {}", out.GetLastError())};
    }
    std::string text = out.c_str();
    text.push_back('\n');
    return text;
}

Result<storage::StoreHandle> LoadedRegistry::getStore(const std::string& name) const {
    auto it = stores_.find(name);
    if (it == stores_.end()) {
        return Error{ErrorCode::StoreNotFound, std::format("Store '{}' is not registered", name),
                     name};
    }
    return storage::StoreHandle(name, storage::FilesystemContext(it->second.path, options_));
}

Result<void> FilesystemRegistry::initialize() {
    std::error_code ec;
    if (std::filesystem::exists(registryPath_, ec)) {
        return {};
    }
    if (ec) {
        return Error{ErrorCode::RegistryReadFailed,
                     std::format("Failed to check registry at {}: {}", registryPath_.string(),
                                 ec.message()),
                     registryPath_.string()};
    }

    auto written = storage::atomicWriteText(registryPath_, "{}\n");
    if (!written) {
        return Error{ErrorCode::RegistryWriteFailed,
                     std::format("Failed to initialize registry at {}: {}",
                                 registryPath_.string(), written.error().message),
                     registryPath_.string()};
    }
    spdlog::info("Created store registry at {}", registryPath_.string());
    return {};
}

Result<LoadedRegistry> FilesystemRegistry::load() {
    auto text = storage::readTextFile(registryPath_);
    if (!text) {
        return Error{ErrorCode::RegistryReadFailed, text.error().message, registryPath_.string()};
    }
    if (!text.value()) {
        return Error{ErrorCode::RegistryMissing,
                     std::format("Store registry not found at {}", registryPath_.string()),
                     registryPath_.string()};
    }

    auto parsed = parseStoreRegistry(*text.value());
    if (!parsed) {
        auto error = parsed.error();
        error.message = std::format("{} ({})", error.message, registryPath_.string());
        return error;
    }

    LoadedRegistry loaded(std::move(parsed).value(), options_);
    cache_ = loaded;
    spdlog::debug("Loaded {} stores from {}", loaded.stores().size(), registryPath_.string());
    return loaded;
}

Result<LoadedRegistry> FilesystemRegistry::save(const StoreRegistry& registry) {
    auto text = serializeStoreRegistry(registry);
    if (!text)
        return text.error();

    auto written = storage::atomicWriteText(registryPath_, text.value());
    if (!written) {
        return Error{ErrorCode::RegistryWriteFailed,
                     std::format("Failed to write registry at {}: {}", registryPath_.string(),
                                 written.error().message),
                     registryPath_.string()};
    }

    LoadedRegistry loaded(registry, options_);
    cache_ = loaded;
    return loaded;
}

} // namespace strata::registry
