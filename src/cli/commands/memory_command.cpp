#include <spdlog/spdlog.h>
#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <nlohmann/json.hpp>
#include <strata/cli/command.h>
#include <strata/cli/strata_cli.h>
#include <strata/core/time_format.h>
#include <strata/core/tokens.h>
#include <strata/memory/memory_file.h>

namespace strata::cli {

using json = nlohmann::json;

namespace {

json memoryToJson(const MemoryPath& path, const memory::Memory& memory) {
    json output;
    output["path"] = path.toString();
    output["created_at"] = TimeFormat::formatISO8601(memory.metadata.createdAt);
    output["updated_at"] = TimeFormat::formatISO8601(memory.metadata.updatedAt);
    output["tags"] = memory.metadata.tags;
    output["source"] = memory.metadata.source;
    if (memory.metadata.expiresAt) {
        output["expires_at"] = TimeFormat::formatISO8601(*memory.metadata.expiresAt);
    }
    if (!memory.metadata.citations.empty()) {
        output["citations"] = memory.metadata.citations;
    }
    output["content"] = memory.content;
    output["token_estimate"] = estimateTokenCount(memory.content);
    return output;
}

Result<std::optional<Timestamp>> parseExpiry(const std::string& raw) {
    if (raw.empty()) {
        return std::optional<Timestamp>{};
    }
    auto parsed = TimeFormat::parseISO8601(raw);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument, "Invalid --expires-at timestamp: " + raw};
    }
    return std::optional<Timestamp>{*parsed};
}

} // namespace

/**
 * Memory operations on the selected store:
 *
 *   strata memory add <path> (--content TEXT | --file FILE | stdin) [--tags a,b]
 *   strata memory show <path>
 *   strata memory update <path> [--content TEXT | --file FILE] [--tags a,b] [--expires-at TS]
 *   strata memory remove <path>
 *   strata memory move <from> <to>
 *   strata memory list [category]
 */
class MemoryCommand : public ICommand {
public:
    std::string getName() const override { return "memory"; }

    std::string getDescription() const override { return "Add, show, update and move memories"; }

    void registerCommand(CLI::App& app, StrataCLI* cli) override {
        cli_ = cli;

        auto* cmd = app.add_subcommand("memory", getDescription());
        cmd->require_subcommand(1);

        auto defer = [this](Action action) {
            return [this, action]() {
                action_ = action;
                cli_->setPendingCommand(this);
            };
        };

        auto* add = cmd->add_subcommand("add", "Create a memory");
        add->add_option("path", path_, "Memory path (category/slug)")->required();
        addContentOptions(add);
        add->add_option("--source", source_, "Origin of the memory")->default_val("user");
        add->callback(defer(Action::Add));

        auto* show = cmd->add_subcommand("show", "Print a memory");
        show->add_option("path", path_, "Memory path")->required();
        show->callback(defer(Action::Show));

        auto* update = cmd->add_subcommand("update", "Change a memory's content or metadata");
        update->add_option("path", path_, "Memory path")->required();
        addContentOptions(update);
        update->add_flag("--clear-expiry", clearExpiry_, "Remove the expiry date");
        update->callback(defer(Action::Update));

        auto* remove = cmd->add_subcommand("remove", "Delete a memory");
        remove->alias("rm");
        remove->add_option("path", path_, "Memory path")->required();
        remove->callback(defer(Action::Remove));

        auto* move = cmd->add_subcommand("move", "Move a memory to another path");
        move->alias("mv");
        move->add_option("from", path_, "Current memory path")->required();
        move->add_option("to", destination_, "New memory path")->required();
        move->callback(defer(Action::Move));

        auto* list = cmd->add_subcommand("list", "List memories in a category");
        list->alias("ls");
        list->add_option("category", category_, "Category path (default: root)");
        list->callback(defer(Action::List));
    }

    Result<void> execute() override {
        auto store = cli_->openStore();
        if (!store)
            return store.error();

        if (action_ == Action::List) {
            return list(store.value());
        }

        auto path = MemoryPath::parse(path_);
        if (!path)
            return path.error();

        switch (action_) {
            case Action::Add:
                return add(store.value(), path.value());
            case Action::Show:
                return show(store.value(), path.value());
            case Action::Update:
                return update(store.value(), path.value());
            case Action::Remove:
                return remove(store.value(), path.value());
            case Action::Move:
                return move(store.value(), path.value());
            case Action::List:
                break;
        }
        return Error{ErrorCode::InternalError, "Unknown memory action"};
    }

private:
    enum class Action { Add, Show, Update, Remove, Move, List };

    void addContentOptions(CLI::App* sub) {
        auto* content = sub->add_option("-c,--content", content_, "Memory body");
        sub->add_option("-f,--file", file_, "Read the body from a file ('-' for stdin)")
            ->excludes(content);
        sub->add_option("--tags", tags_, "Tags (comma-separated)")->delimiter(',');
        sub->add_option("--expires-at", expiresAt_, "Expiry timestamp (ISO 8601)");
        sub->add_option("--citation", citations_, "Citation (repeatable)");
    }

    // Body from --content, --file or stdin; empty optional when none was given
    Result<std::optional<std::string>> readBody(bool stdinFallback) const {
        if (!content_.empty()) {
            return std::optional<std::string>{content_};
        }
        if (file_ == "-" || (file_.empty() && stdinFallback)) {
            std::string body{std::istreambuf_iterator<char>(std::cin),
                             std::istreambuf_iterator<char>()};
            return std::optional<std::string>{std::move(body)};
        }
        if (!file_.empty()) {
            std::ifstream in(file_, std::ios::binary);
            if (!in) {
                return Error{ErrorCode::IoReadError, "Cannot read " + file_, file_};
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            return std::optional<std::string>{buffer.str()};
        }
        return std::optional<std::string>{};
    }

    Result<void> writeMemory(const storage::StoreHandle& store, const MemoryPath& path,
                             const memory::Memory& memory) {
        auto serialized = memory::serializeMemory(memory);
        if (!serialized)
            return serialized.error();
        return store.memories().write(path, serialized.value());
    }

    Result<memory::Memory> readMemory(const storage::StoreHandle& store, const MemoryPath& path) {
        auto raw = store.memories().read(path);
        if (!raw)
            return raw.error();
        if (!raw.value()) {
            return Error{ErrorCode::NotFound, "Memory not found: " + path.toString(),
                         path.toString()};
        }
        auto parsed = memory::parseMemory(*raw.value());
        if (!parsed) {
            return Error{parsed.error().code,
                         "Invalid memory file " + path.toString() + ": " + parsed.error().message,
                         path.toString()};
        }
        return std::move(parsed).value();
    }

    Result<void> add(const storage::StoreHandle& store, const MemoryPath& path) {
        auto existing = store.memories().read(path);
        if (!existing)
            return existing.error();
        if (existing.value()) {
            return Error{ErrorCode::InvalidArgument, "Memory already exists: " + path.toString(),
                         path.toString()};
        }

        auto body = readBody(true);
        if (!body)
            return body.error();
        auto expiry = parseExpiry(expiresAt_);
        if (!expiry)
            return expiry.error();

        auto now = TimeFormat::now();
        memory::Memory memory;
        memory.metadata.createdAt = now;
        memory.metadata.updatedAt = now;
        memory.metadata.tags = tags_;
        memory.metadata.source = source_;
        memory.metadata.expiresAt = expiry.value();
        memory.metadata.citations = citations_;
        memory.content = body.value().value_or("");

        if (auto written = writeMemory(store, path, memory); !written) {
            return written;
        }
        return report("added", path);
    }

    Result<void> show(const storage::StoreHandle& store, const MemoryPath& path) {
        auto memory = readMemory(store, path);
        if (!memory)
            return memory.error();

        if (cli_->getJsonOutput()) {
            cli_->printJson(memoryToJson(path, memory.value()));
            return Result<void>();
        }
        auto raw = memory::serializeMemory(memory.value());
        if (!raw)
            return raw.error();
        std::cout << raw.value();
        if (!raw.value().ends_with('\n')) {
            std::cout << "\n";
        }
        return Result<void>();
    }

    Result<void> update(const storage::StoreHandle& store, const MemoryPath& path) {
        auto current = readMemory(store, path);
        if (!current)
            return current.error();
        auto memory = std::move(current).value();

        auto body = readBody(false);
        if (!body)
            return body.error();
        auto expiry = parseExpiry(expiresAt_);
        if (!expiry)
            return expiry.error();

        bool changed = false;
        if (body.value()) {
            memory.content = *body.value();
            changed = true;
        }
        if (!tags_.empty()) {
            memory.metadata.tags = tags_;
            changed = true;
        }
        if (!citations_.empty()) {
            memory.metadata.citations = citations_;
            changed = true;
        }
        if (expiry.value()) {
            memory.metadata.expiresAt = expiry.value();
            changed = true;
        } else if (clearExpiry_) {
            memory.metadata.expiresAt.reset();
            changed = true;
        }
        if (!changed) {
            return Error{ErrorCode::InvalidArgument,
                         "Nothing to update: pass --content, --file, --tags, --citation, "
                         "--expires-at or --clear-expiry"};
        }

        memory.metadata.updatedAt = TimeFormat::now();
        if (auto written = writeMemory(store, path, memory); !written) {
            return written;
        }
        return report("updated", path);
    }

    Result<void> remove(const storage::StoreHandle& store, const MemoryPath& path) {
        auto existing = store.memories().read(path);
        if (!existing)
            return existing.error();
        if (!existing.value()) {
            return Error{ErrorCode::NotFound, "Memory not found: " + path.toString(),
                         path.toString()};
        }
        if (auto removed = store.memories().remove(path); !removed) {
            return removed;
        }
        return report("removed", path);
    }

    Result<void> move(const storage::StoreHandle& store, const MemoryPath& from) {
        auto to = MemoryPath::parse(destination_);
        if (!to)
            return to.error();
        if (from == to.value()) {
            return Error{ErrorCode::InvalidArgument, "Source and destination are the same",
                         from.toString()};
        }
        auto occupied = store.memories().read(to.value());
        if (!occupied)
            return occupied.error();
        if (occupied.value()) {
            return Error{ErrorCode::InvalidArgument,
                         "Destination already exists: " + to.value().toString(),
                         to.value().toString()};
        }
        if (auto moved = store.memories().move(from, to.value()); !moved) {
            return moved;
        }

        if (cli_->getJsonOutput()) {
            json output;
            output["moved"] = from.toString();
            output["to"] = to.value().toString();
            cli_->printJson(output);
        } else {
            std::cout << "Moved " << from.toString() << " -> " << to.value().toString() << "\n";
        }
        return Result<void>();
    }

    Result<void> list(const storage::StoreHandle& store) {
        auto category = CategoryPath::parse(category_);
        if (!category)
            return category.error();

        auto paths = store.memories().list(category.value());
        if (!paths)
            return paths.error();
        auto loaded = store.indexes().load(category.value());
        if (!loaded)
            return loaded.error();
        const auto& index = loaded.value();

        if (cli_->getJsonOutput()) {
            json memories = json::array();
            for (const auto& path : paths.value()) {
                json entry;
                entry["path"] = path.toString();
                if (index) {
                    if (const auto* indexed = index->findMemory(path)) {
                        entry["token_estimate"] = indexed->tokenEstimate;
                        if (indexed->updatedAt) {
                            entry["updated_at"] = TimeFormat::formatISO8601(*indexed->updatedAt);
                        }
                    }
                }
                memories.push_back(entry);
            }
            json subcategories = json::array();
            if (index) {
                for (const auto& sub : index->subcategories) {
                    json entry;
                    entry["path"] = sub.path.toString();
                    entry["memory_count"] = sub.memoryCount;
                    if (sub.description) {
                        entry["description"] = *sub.description;
                    }
                    subcategories.push_back(entry);
                }
            }
            json output;
            output["category"] = category.value().toString();
            output["memories"] = memories;
            output["subcategories"] = subcategories;
            cli_->printJson(output);
            return Result<void>();
        }

        for (const auto& path : paths.value()) {
            std::cout << path.toString() << "\n";
        }
        if (index) {
            for (const auto& sub : index->subcategories) {
                std::cout << sub.path.toString() << "/ (" << sub.memoryCount << ")";
                if (sub.description) {
                    std::cout << "  " << *sub.description;
                }
                std::cout << "\n";
            }
        }
        return Result<void>();
    }

    Result<void> report(const char* verb, const MemoryPath& path) {
        if (cli_->getJsonOutput()) {
            json output;
            output[verb] = path.toString();
            cli_->printJson(output);
        } else {
            std::string text = verb;
            text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
            std::cout << text << " " << path.toString() << "\n";
        }
        return Result<void>();
    }

    StrataCLI* cli_ = nullptr;
    Action action_ = Action::Show;
    std::string path_;
    std::string destination_;
    std::string category_;
    std::string content_;
    std::string file_;
    std::string source_ = "user";
    std::string expiresAt_;
    std::vector<std::string> tags_;
    std::vector<std::string> citations_;
    bool clearExpiry_ = false;
};

std::unique_ptr<ICommand> createMemoryCommand() {
    return std::make_unique<MemoryCommand>();
}

} // namespace strata::cli
