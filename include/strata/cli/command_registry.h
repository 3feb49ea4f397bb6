#pragma once

#include <memory>
#include <vector>
#include <strata/cli/command.h>

namespace strata::cli {

// Forward declaration
class StrataCLI;

// Factories, one per command source file
std::unique_ptr<ICommand> createInitCommand();
std::unique_ptr<ICommand> createStoreCommand();
std::unique_ptr<ICommand> createMemoryCommand();
std::unique_ptr<ICommand> createCategoryCommand();
std::unique_ptr<ICommand> createReindexCommand();
std::unique_ptr<ICommand> createPruneCommand();

/**
 * Registry of all available CLI commands
 */
class CommandRegistry {
public:
    /**
     * Register all built-in commands with the CLI
     */
    static void registerAllCommands(StrataCLI* cli);
};

} // namespace strata::cli
