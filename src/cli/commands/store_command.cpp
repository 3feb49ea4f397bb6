#include <spdlog/spdlog.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <strata/cli/command.h>
#include <strata/cli/strata_cli.h>

namespace strata::cli {

using json = nlohmann::json;

// Registry management: strata store list|add|remove
class StoreCommand : public ICommand {
public:
    std::string getName() const override { return "store"; }

    std::string getDescription() const override { return "Manage registered stores"; }

    void registerCommand(CLI::App& app, StrataCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("store", getDescription());
        cmd->require_subcommand(1);

        auto* list = cmd->add_subcommand("list", "List registered stores");
        list->callback([this]() {
            action_ = Action::List;
            cli_->setPendingCommand(this);
        });

        auto* add = cmd->add_subcommand("add", "Register a store directory");
        add->add_option("name", name_, "Store name (lowercase slug)")->required();
        add->add_option("path", path_, "Store directory")->required();
        add->add_option("--description", description_, "Store description");
        add->callback([this]() {
            action_ = Action::Add;
            cli_->setPendingCommand(this);
        });

        auto* remove = cmd->add_subcommand("remove", "Unregister a store (files are kept)");
        remove->alias("rm");
        remove->add_option("name", name_, "Store name")->required();
        remove->callback([this]() {
            action_ = Action::Remove;
            cli_->setPendingCommand(this);
        });
    }

    Result<void> execute() override {
        auto& reg = cli_->getRegistry();
        if (action_ == Action::Add) {
            if (auto initialized = reg.initialize(); !initialized) {
                return initialized;
            }
        }
        auto loaded = reg.load();
        if (!loaded)
            return loaded.error();

        switch (action_) {
            case Action::List:
                return list(loaded.value());
            case Action::Add:
                return add(reg, loaded.value());
            case Action::Remove:
                return remove(reg, loaded.value());
        }
        return Error{ErrorCode::InternalError, "Unknown store action"};
    }

private:
    enum class Action { List, Add, Remove };

    Result<void> list(const registry::LoadedRegistry& loaded) {
        if (cli_->getJsonOutput()) {
            json stores = json::array();
            for (const auto& [name, definition] : loaded.stores()) {
                json entry;
                entry["name"] = name;
                entry["path"] = definition.path.string();
                if (definition.description) {
                    entry["description"] = *definition.description;
                }
                stores.push_back(entry);
            }
            json output;
            output["stores"] = stores;
            cli_->printJson(output);
            return Result<void>();
        }

        if (loaded.stores().empty()) {
            std::cout << "No stores registered.\n";
            return Result<void>();
        }
        for (const auto& [name, definition] : loaded.stores()) {
            std::cout << name << "\t" << definition.path.string();
            if (definition.description) {
                std::cout << "\t" << *definition.description;
            }
            std::cout << "\n";
        }
        return Result<void>();
    }

    Result<void> add(registry::FilesystemRegistry& reg, const registry::LoadedRegistry& loaded) {
        if (!registry::isValidStoreName(name_)) {
            return Error{ErrorCode::InvalidArgument,
                         "Store names must be lowercase slugs: '" + name_ + "'", name_};
        }
        auto stores = loaded.stores();
        if (stores.contains(name_)) {
            return Error{ErrorCode::InvalidArgument, "Store '" + name_ + "' already exists",
                         name_};
        }
        auto root = std::filesystem::absolute(config::expand_tilde(path_)).lexically_normal();
        registry::StoreDefinition definition{root, std::nullopt};
        if (!description_.empty()) {
            definition.description = description_;
        }
        stores.emplace(name_, std::move(definition));

        auto saved = reg.save(stores);
        if (!saved)
            return saved.error();
        spdlog::info("Registered store '{}' at {}", name_, root.string());

        if (cli_->getJsonOutput()) {
            json output;
            output["store"] = name_;
            output["path"] = root.string();
            cli_->printJson(output);
        } else {
            std::cout << "Added store '" << name_ << "' at " << root.string() << "\n";
        }
        return Result<void>();
    }

    Result<void> remove(registry::FilesystemRegistry& reg,
                        const registry::LoadedRegistry& loaded) {
        auto stores = loaded.stores();
        if (stores.erase(name_) == 0) {
            return Error{ErrorCode::StoreNotFound, "Store '" + name_ + "' is not registered",
                         name_};
        }
        auto saved = reg.save(stores);
        if (!saved)
            return saved.error();

        if (cli_->getJsonOutput()) {
            json output;
            output["removed"] = name_;
            cli_->printJson(output);
        } else {
            std::cout << "Removed store '" << name_ << "' from the registry\n";
        }
        return Result<void>();
    }

    StrataCLI* cli_ = nullptr;
    Action action_ = Action::List;
    std::string name_;
    std::string path_;
    std::string description_;
};

std::unique_ptr<ICommand> createStoreCommand() {
    return std::make_unique<StoreCommand>();
}

} // namespace strata::cli
