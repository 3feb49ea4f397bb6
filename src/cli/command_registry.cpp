#include <strata/cli/command_registry.h>
#include <strata/cli/strata_cli.h>

namespace strata::cli {

void CommandRegistry::registerAllCommands(StrataCLI* cli) {
    cli->registerCommand(createInitCommand());
    cli->registerCommand(createStoreCommand());
    cli->registerCommand(createMemoryCommand());
    cli->registerCommand(createCategoryCommand());
    cli->registerCommand(createReindexCommand());
    cli->registerCommand(createPruneCommand());
}

} // namespace strata::cli
