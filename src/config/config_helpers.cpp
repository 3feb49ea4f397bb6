#include <strata/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <fstream>

namespace strata::config {

std::string parse_config_value(const std::filesystem::path& config_path, const std::string& section,
                               const std::string& key) {
    std::ifstream file(config_path);
    if (!file) {
        return "";
    }

    std::string line;
    std::string currentSection;
    bool in_target_section = section.empty();

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
                in_target_section = (section.empty() || currentSection == section);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quotes
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (v.size() >= 2) {
            size_t close = v.find(v.front(), 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        // Support both "storage.registry" and "[storage] registry"
        if ((in_target_section && k == key) || (!section.empty() && k == section + "." + key)) {
            return unquote(v);
        }
    }

    return "";
}

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "strata";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "strata";
    }
    return std::filesystem::current_path() / ".strata";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("STRATA_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

StrataConfig load_config(const std::string& override_path) {
    StrataConfig config;
    config.configPath = get_config_path(override_path);

    std::error_code ec;
    if (!std::filesystem::exists(config.configPath, ec)) {
        spdlog::debug("No config at {}, using defaults", config.configPath.string());
    }

    auto memoryExt = parse_config_value(config.configPath, "storage", "memory_extension");
    auto indexExt = parse_config_value(config.configPath, "storage", "index_extension");
    config.storage.memoryExtension =
        storage::normalizeExtension(memoryExt, DEFAULT_MEMORY_EXTENSION);
    config.storage.indexExtension = storage::normalizeExtension(indexExt, DEFAULT_INDEX_EXTENSION);

    auto registry = parse_config_value(config.configPath, "storage", "registry");
    if (!registry.empty()) {
        auto path = expand_tilde(registry);
        config.registryPath =
            path.is_absolute() ? path : config.configPath.parent_path() / path;
    } else {
        config.registryPath = config.configPath.parent_path() / "stores.yaml";
    }

    if (auto level = parse_config_value(config.configPath, "logging", "level"); !level.empty()) {
        config.logLevel = level;
    }
    if (const char* env = std::getenv("STRATA_LOG_LEVEL"); env && *env) {
        config.logLevel = env;
    }
    return config;
}

} // namespace strata::config
