#include <spdlog/spdlog.h>
#include <cctype>
#include <iostream>
#include <strata/cli/command_registry.h>
#include <strata/cli/strata_cli.h>

#ifndef STRATA_VERSION_STRING
#define STRATA_VERSION_STRING "0.0.0-dev"
#endif

namespace strata::cli {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& s) {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical" || v == "crit")
        return spdlog::level::critical;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

StrataCLI::StrataCLI() {
    app_ = std::make_unique<CLI::App>("Strata hierarchical memory store", "strata");
    app_->set_version_flag("--version", STRATA_VERSION_STRING);
    app_->require_subcommand(1);

    // Global options
    app_->add_option("--config", configPath_, "Config file (default: $STRATA_CONFIG or "
                                              "$XDG_CONFIG_HOME/strata/config.toml)");
    app_->add_option("--registry", registryPath_, "Store registry file (overrides config)");
    app_->add_option("-s,--store", storeName_, "Registered store to operate on")
        ->default_val("default");
    app_->add_option("--store-path", storePath_,
                     "Operate on this directory directly instead of a registered store");
    app_->add_flag("-v,--verbose", verbose_, "Enable verbose output");
    app_->add_flag("-q,--quiet", quiet_, "Only log errors");
    app_->add_flag("--json", jsonOutput_, "Output in JSON format");
}

StrataCLI::~StrataCLI() = default;

void StrataCLI::registerCommand(std::unique_ptr<ICommand> command) {
    command->registerCommand(*app_, this);
    commands_.push_back(std::move(command));
}

void StrataCLI::applyLogLevel() {
    // Precedence: --verbose/--quiet > STRATA_LOG_LEVEL > config [logging] level > warn
    if (verbose_) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet_) {
        spdlog::set_level(spdlog::level::err);
    } else if (auto lvl = parseLevel(config_.logLevel)) {
        spdlog::set_level(*lvl);
    } else {
        spdlog::warn("Unknown log level '{}', using warn", config_.logLevel);
        spdlog::set_level(spdlog::level::warn);
    }
}

registry::FilesystemRegistry& StrataCLI::getRegistry() {
    if (!registry_) {
        auto path = registryPath_.empty() ? config_.registryPath
                                          : config::expand_tilde(registryPath_);
        registry_ = std::make_unique<registry::FilesystemRegistry>(path, config_.storage);
    }
    return *registry_;
}

Result<storage::StoreHandle> StrataCLI::openStore() {
    if (!storePath_.empty()) {
        auto root = std::filesystem::absolute(config::expand_tilde(storePath_));
        return storage::StoreHandle(root.filename().string(),
                                    storage::FilesystemContext(root, config_.storage));
    }

    auto& reg = getRegistry();
    auto loaded = reg.load();
    if (!loaded) {
        if (loaded.error().code == ErrorCode::RegistryMissing) {
            return Error{ErrorCode::RegistryMissing,
                         loaded.error().message + " (hint: run 'strata init')",
                         loaded.error().path};
        }
        return loaded.error();
    }
    return loaded.value().getStore(storeName_);
}

void StrataCLI::printJson(const nlohmann::json& document) const {
    std::cout << document.dump(2) << std::endl;
}

void StrataCLI::reportError(const Error& error) const {
    if (jsonOutput_) {
        nlohmann::json output;
        output["error"]["code"] = errorCodeName(error.code);
        output["error"]["message"] = error.message;
        if (!error.path.empty()) {
            output["error"]["path"] = error.path;
        }
        printJson(output);
        return;
    }
    std::cerr << "[FAIL] " << error.message;
    if (!error.path.empty() && error.message.find(error.path) == std::string::npos) {
        std::cerr << " (" << error.path << ")";
    }
    std::cerr << "\n";
}

int StrataCLI::run(int argc, char* argv[]) {
    try {
        CommandRegistry::registerAllCommands(this);

        app_->parse(argc, argv);

        config_ = config::load_config(configPath_);
        applyLogLevel();
        spdlog::debug("Config: {}, registry: {}", config_.configPath.string(),
                      config_.registryPath.string());

        if (pendingCommand_) {
            auto result = pendingCommand_->execute();
            if (!result) {
                spdlog::debug("{} failed: {} ({})", pendingCommand_->getName(),
                              errorCodeName(result.error().code), result.error().message);
                reportError(result.error());
                return 1;
            }
        }
        return 0;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        // Always provide a user-facing error even if logging is off
        std::cerr << "[FAIL] Unexpected error: " << e.what() << "\n";
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}

} // namespace strata::cli
