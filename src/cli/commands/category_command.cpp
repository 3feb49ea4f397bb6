#include <spdlog/spdlog.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <strata/cli/command.h>
#include <strata/cli/strata_cli.h>

namespace strata::cli {

using json = nlohmann::json;

// strata category create|describe|remove
class CategoryCommand : public ICommand {
public:
    std::string getName() const override { return "category"; }

    std::string getDescription() const override {
        return "Create, describe and remove categories";
    }

    void registerCommand(CLI::App& app, StrataCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("category", getDescription());
        cmd->require_subcommand(1);

        auto* create = cmd->add_subcommand("create", "Create a category directory");
        create->add_option("path", path_, "Category path")->required();
        create->add_option("--description", description_, "Description stored in the parent");
        create->callback([this]() {
            action_ = Action::Create;
            cli_->setPendingCommand(this);
        });

        auto* describe = cmd->add_subcommand("describe", "Set or clear a category description");
        describe->add_option("path", path_, "Category path")->required();
        auto* text = describe->add_option("description", description_, "New description");
        describe->add_flag("--clear", clear_, "Remove the description")->excludes(text);
        describe->callback([this]() {
            action_ = Action::Describe;
            cli_->setPendingCommand(this);
        });

        auto* remove = cmd->add_subcommand("remove", "Delete a category and its memories");
        remove->alias("rm");
        remove->add_option("path", path_, "Category path")->required();
        remove->callback([this]() {
            action_ = Action::Remove;
            cli_->setPendingCommand(this);
        });
    }

    Result<void> execute() override {
        auto store = cli_->openStore();
        if (!store)
            return store.error();
        auto category = CategoryPath::parse(path_);
        if (!category)
            return category.error();

        const auto& categories = store.value().categories();
        const auto& path = category.value();

        switch (action_) {
            case Action::Create: {
                if (auto ensured = categories.ensure(path); !ensured) {
                    return ensured;
                }
                if (!description_.empty() && !path.isRoot()) {
                    if (auto described = categories.setDescription(path, description_);
                        !described) {
                        return described;
                    }
                }
                return report("created", path);
            }
            case Action::Describe: {
                if (!clear_ && description_.empty()) {
                    return Error{ErrorCode::InvalidArgument,
                                 "Pass a description or --clear to remove it"};
                }
                std::optional<std::string> value;
                if (!clear_) {
                    value = description_;
                }
                if (auto described = categories.setDescription(path, value); !described) {
                    return described;
                }
                return report("described", path);
            }
            case Action::Remove: {
                if (auto removed = categories.remove(path); !removed) {
                    return removed;
                }
                if (auto detached = categories.removeSubcategoryEntry(path); !detached) {
                    return detached;
                }
                spdlog::info("Removed category {}", path.toString());
                return report("removed", path);
            }
        }
        return Error{ErrorCode::InternalError, "Unknown category action"};
    }

private:
    enum class Action { Create, Describe, Remove };

    Result<void> report(const char* verb, const CategoryPath& path) {
        if (cli_->getJsonOutput()) {
            json output;
            output[verb] = path.toString();
            cli_->printJson(output);
        } else {
            std::cout << "Category " << (path.isRoot() ? "/" : path.toString()) << " " << verb
                      << "\n";
        }
        return Result<void>();
    }

    StrataCLI* cli_ = nullptr;
    Action action_ = Action::Create;
    std::string path_;
    std::string description_;
    bool clear_ = false;
};

std::unique_ptr<ICommand> createCategoryCommand() {
    return std::make_unique<CategoryCommand>();
}

} // namespace strata::cli
