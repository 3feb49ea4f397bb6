#pragma once

#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <strata/core/types.h>

namespace strata::cli {

// Forward declarations
class StrataCLI;

/**
 * Base interface for CLI commands
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * Get the command name (e.g., "memory", "reindex")
     */
    virtual std::string getName() const = 0;

    /**
     * Get the command description for help text
     */
    virtual std::string getDescription() const = 0;

    /**
     * Register this command with the CLI11 app
     */
    virtual void registerCommand(CLI::App& app, StrataCLI* cli) = 0;

    /**
     * Execute the command
     */
    virtual Result<void> execute() = 0;
};

} // namespace strata::cli
