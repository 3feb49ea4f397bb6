#include <spdlog/spdlog.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <strata/cli/command.h>
#include <strata/cli/strata_cli.h>
#include <strata/core/time_format.h>
#include <strata/indexing/prune.h>

namespace strata::cli {

using json = nlohmann::json;

class PruneCommand : public ICommand {
public:
    std::string getName() const override { return "prune"; }

    std::string getDescription() const override {
        return "Delete expired memories and rebuild indexes";
    }

    void registerCommand(CLI::App& app, StrataCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("prune", getDescription());
        cmd->add_flag("--dry-run", dryRun_, "List what would be pruned without deleting");
        cmd->add_option("--now", now_, "Reference time (ISO 8601, default: current time)");
        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        indexing::PruneOptions options{TimeFormat::now(), dryRun_};
        if (!now_.empty()) {
            auto parsed = TimeFormat::parseISO8601(now_);
            if (!parsed) {
                return Error{ErrorCode::InvalidArgument, "Invalid --now timestamp: " + now_};
            }
            options.now = *parsed;
        }

        auto store = cli_->openStore();
        if (!store)
            return store.error();

        auto result = indexing::pruneExpired(store.value(), options);
        if (!result)
            return result.error();
        const auto& report = result.value();

        if (cli_->getJsonOutput()) {
            json entries = json::array();
            for (const auto& pruned : report.pruned) {
                json entry;
                entry["path"] = pruned.path.toString();
                entry["expires_at"] = TimeFormat::formatISO8601(pruned.expiresAt);
                entries.push_back(entry);
            }
            json output;
            if (dryRun_) {
                output["dry_run"] = true;
                output["would_prune_count"] = report.pruned.size();
                output["would_prune"] = entries;
            } else {
                output["pruned_count"] = report.pruned.size();
                output["pruned"] = entries;
            }
            cli_->printJson(output);
            return Result<void>();
        }

        if (report.pruned.empty()) {
            std::cout << "No expired memories.\n";
            return Result<void>();
        }
        std::cout << (dryRun_ ? "Would prune " : "Pruned ") << report.pruned.size()
                  << " memories:\n";
        for (const auto& pruned : report.pruned) {
            std::cout << "  " << pruned.path.toString() << " (expired "
                      << TimeFormat::formatISO8601(pruned.expiresAt) << ")\n";
        }
        return Result<void>();
    }

private:
    StrataCLI* cli_ = nullptr;
    bool dryRun_ = false;
    std::string now_;
};

std::unique_ptr<ICommand> createPruneCommand() {
    return std::make_unique<PruneCommand>();
}

} // namespace strata::cli
