#include <spdlog/spdlog.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <strata/cli/command.h>
#include <strata/cli/strata_cli.h>
#include <strata/storage/file_io.h>

namespace strata::cli {

using json = nlohmann::json;

/**
 * Creates the store registry and registers a first store.
 *
 *   strata init                      # "default" store under the config directory
 *   strata init --name work --path ~/notes/work
 */
class InitCommand : public ICommand {
public:
    std::string getName() const override { return "init"; }

    std::string getDescription() const override {
        return "Create the store registry and register a store";
    }

    void registerCommand(CLI::App& app, StrataCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("init", getDescription());
        cmd->add_option("--name", name_, "Store name")->default_val("default");
        cmd->add_option("--path", path_, "Store directory (default: <config dir>/stores/<name>)");
        cmd->add_option("--description", description_, "Store description");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        if (!registry::isValidStoreName(name_)) {
            return Error{ErrorCode::InvalidArgument,
                         "Store names must be lowercase slugs: '" + name_ + "'", name_};
        }

        auto& reg = cli_->getRegistry();
        if (auto initialized = reg.initialize(); !initialized) {
            return initialized;
        }
        auto loaded = reg.load();
        if (!loaded)
            return loaded.error();

        std::filesystem::path root = path_.empty()
                                         ? cli_->getConfig().configPath.parent_path() / "stores" /
                                               name_
                                         : config::expand_tilde(path_);
        root = std::filesystem::absolute(root).lexically_normal();

        auto stores = loaded.value().stores();
        bool created = false;
        if (auto it = stores.find(name_); it != stores.end()) {
            if (it->second.path != root) {
                return Error{ErrorCode::InvalidArgument,
                             "Store '" + name_ + "' is already registered at " +
                                 it->second.path.string(),
                             name_};
            }
        } else {
            registry::StoreDefinition definition{root, std::nullopt};
            if (!description_.empty()) {
                definition.description = description_;
            }
            stores.emplace(name_, std::move(definition));
            auto saved = reg.save(stores);
            if (!saved)
                return saved.error();
            created = true;
        }

        if (auto dir = storage::ensureDirectory(root); !dir) {
            return dir;
        }
        spdlog::info("Store '{}' at {}", name_, root.string());

        if (cli_->getJsonOutput()) {
            json output;
            output["registry"] = reg.path().string();
            output["store"] = name_;
            output["path"] = root.string();
            output["created"] = created;
            cli_->printJson(output);
        } else if (created) {
            std::cout << "Initialized store '" << name_ << "' at " << root.string() << "\n";
            std::cout << "Registry: " << reg.path().string() << "\n";
        } else {
            std::cout << "Store '" << name_ << "' already initialized at " << root.string()
                      << "\n";
        }
        return Result<void>();
    }

private:
    StrataCLI* cli_ = nullptr;
    std::string name_ = "default";
    std::string path_;
    std::string description_;
};

std::unique_ptr<ICommand> createInitCommand() {
    return std::make_unique<InitCommand>();
}

} // namespace strata::cli
