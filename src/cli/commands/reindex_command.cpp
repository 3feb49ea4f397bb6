#include <spdlog/spdlog.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <strata/cli/command.h>
#include <strata/cli/strata_cli.h>
#include <strata/indexing/reindexer.h>

namespace strata::cli {

using json = nlohmann::json;

// Rebuilds every index of the selected store from the files on disk
class ReindexCommand : public ICommand {
public:
    std::string getName() const override { return "reindex"; }

    std::string getDescription() const override {
        return "Rebuild category indexes from the memory files on disk";
    }

    void registerCommand(CLI::App& app, StrataCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("reindex", getDescription());
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto store = cli_->openStore();
        if (!store)
            return store.error();

        auto result = indexing::Reindexer(store.value().indexes()).run();
        if (!result)
            return result.error();
        const auto& report = result.value();

        if (cli_->getJsonOutput()) {
            json output;
            output["store"] = store.value().name();
            output["memories_indexed"] = report.memoriesIndexed;
            output["indexes_written"] = report.indexesWritten;
            output["indexes_removed"] = report.indexesRemoved;
            output["files_renamed"] = report.filesRenamed;
            output["warnings"] = report.warnings;
            cli_->printJson(output);
            return Result<void>();
        }

        std::cout << "Reindexed " << report.memoriesIndexed << " memories: "
                  << report.indexesWritten << " indexes written, " << report.indexesRemoved
                  << " removed";
        if (report.filesRenamed > 0) {
            std::cout << ", " << report.filesRenamed << " files renamed";
        }
        std::cout << "\n";
        for (const auto& warning : report.warnings) {
            std::cout << "  " << warning << "\n";
        }
        return Result<void>();
    }

private:
    StrataCLI* cli_ = nullptr;
};

std::unique_ptr<ICommand> createReindexCommand() {
    return std::make_unique<ReindexCommand>();
}

} // namespace strata::cli
