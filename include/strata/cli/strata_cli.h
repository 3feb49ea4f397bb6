#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <strata/cli/command.h>
#include <strata/config/config_helpers.h>
#include <strata/registry/store_registry.h>
#include <strata/storage/store_handle.h>

namespace strata::cli {

/**
 * Main CLI application class
 */
class StrataCLI {
public:
    StrataCLI();
    ~StrataCLI();

    /**
     * Run the CLI with given arguments
     */
    int run(int argc, char* argv[]);

    /**
     * Register a command
     */
    void registerCommand(std::unique_ptr<ICommand> command);

    /**
     * Defer execution of a command until parsing and logging setup are done
     */
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    bool getVerbose() const { return verbose_; }
    bool getJsonOutput() const { return jsonOutput_; }

    /**
     * Settings resolved from --config / STRATA_CONFIG / the XDG config directory
     */
    const config::StrataConfig& getConfig() const { return config_; }

    /**
     * Registry at the configured path (or --registry)
     */
    registry::FilesystemRegistry& getRegistry();

    /**
     * Resolve the store selected with --store (default "default").
     * --store-path bypasses the registry and opens a directory directly.
     */
    Result<storage::StoreHandle> openStore();

    /**
     * Print a JSON document (pretty, trailing newline)
     */
    void printJson(const nlohmann::json& document) const;

private:
    void applyLogLevel();
    void reportError(const Error& error) const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;
    std::unique_ptr<registry::FilesystemRegistry> registry_;

    config::StrataConfig config_;
    std::string configPath_;
    std::string registryPath_;
    std::string storeName_ = "default";
    std::string storePath_;
    bool verbose_ = false;
    bool quiet_ = false;
    bool jsonOutput_ = false;

    // Deferred execution: a single command to run post-parse
    ICommand* pendingCommand_ = nullptr;
};

} // namespace strata::cli
