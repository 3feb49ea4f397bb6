#include <strata/core/time_format.h>
#include <strata/index/index_codec.h>

#include <yaml-cpp/yaml.h>

#include <format>

namespace strata::index {

namespace {

Error validationError(std::string message, std::string path = {}) {
    return Error{ErrorCode::ValidationFailed, std::move(message), std::move(path)};
}

Result<uint64_t> readCount(const YAML::Node& entry, const char* field, size_t position) {
    auto node = entry[field];
    if (!node || !node.IsScalar()) {
        return validationError(std::format("Entry {} is missing integer '{}'", position, field));
    }
    const auto& scalar = node.Scalar();
    if (scalar.starts_with('-')) {
        return validationError(
            std::format("Entry {} has negative '{}': {}", position, field, scalar));
    }
    try {
        return node.as<uint64_t>();
    } catch (const YAML::Exception&) {
        return validationError(
            std::format("Entry {} has non-integer '{}': {}", position, field, scalar));
    }
}

Result<std::string> readPath(const YAML::Node& entry, size_t position) {
    auto node = entry["path"];
    if (!node || !node.IsScalar() || node.Scalar().empty()) {
        return validationError(std::format("Entry {} is missing 'path'", position));
    }
    return node.Scalar();
}

Result<std::optional<std::string>> readOptionalString(const YAML::Node& entry, const char* field,
                                                      size_t position) {
    auto node = entry[field];
    if (!node || node.IsNull()) {
        return std::optional<std::string>{};
    }
    if (!node.IsScalar()) {
        return validationError(std::format("Entry {} has non-string '{}'", position, field));
    }
    return std::optional<std::string>{node.Scalar()};
}

Result<IndexMemoryEntry> decodeMemoryEntry(const YAML::Node& node, size_t position) {
    if (!node.IsMap()) {
        return validationError(std::format("Memory entry {} must be a mapping", position));
    }
    auto rawPath = readPath(node, position);
    if (!rawPath)
        return rawPath.error();
    auto path = MemoryPath::parse(rawPath.value());
    if (!path) {
        return validationError(std::format("Memory entry {} has invalid path: {}", position,
                                           path.error().message),
                               rawPath.value());
    }
    auto tokens = readCount(node, "token_estimate", position);
    if (!tokens)
        return tokens.error();
    auto summary = readOptionalString(node, "summary", position);
    if (!summary)
        return summary.error();

    IndexMemoryEntry entry{std::move(path).value(), tokens.value(), std::move(summary).value(),
                           std::nullopt};

    auto updated = readOptionalString(node, "updated_at", position);
    if (!updated)
        return updated.error();
    if (updated.value()) {
        auto parsed = TimeFormat::parseISO8601(*updated.value());
        if (!parsed) {
            return validationError(std::format("Memory entry {} has invalid updated_at: {}",
                                               position, *updated.value()),
                                   rawPath.value());
        }
        entry.updatedAt = *parsed;
    }
    return entry;
}

Result<IndexSubcategoryEntry> decodeSubcategoryEntry(const YAML::Node& node, size_t position) {
    if (!node.IsMap()) {
        return validationError(std::format("Subcategory entry {} must be a mapping", position));
    }
    auto rawPath = readPath(node, position);
    if (!rawPath)
        return rawPath.error();
    auto path = CategoryPath::parse(rawPath.value());
    if (!path || path.value().isRoot()) {
        return validationError(std::format("Subcategory entry {} has invalid path", position),
                               rawPath.value());
    }
    auto count = readCount(node, "memory_count", position);
    if (!count)
        return count.error();
    auto description = readOptionalString(node, "description", position);
    if (!description)
        return description.error();

    return IndexSubcategoryEntry{std::move(path).value(), count.value(),
                                 std::move(description).value()};
}

} // namespace

Result<CategoryIndex> decodeIndex(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ParseFailed,
                     std::format("Failed to parse YAML for category index: {}", e.what())};
    }

    CategoryIndex index;
    if (root.IsNull()) {
        return index;
    }
    if (!root.IsMap()) {
        return validationError("Category index must be a mapping");
    }

    auto memories = root["memories"];
    auto subcategories = root["subcategories"];
    if (!memories || !memories.IsSequence()) {
        return validationError("Category index requires a 'memories' list");
    }
    if (!subcategories || !subcategories.IsSequence()) {
        return validationError("Category index requires a 'subcategories' list");
    }

    size_t position = 0;
    for (const auto& node : memories) {
        auto entry = decodeMemoryEntry(node, position++);
        if (!entry)
            return entry.error();
        index.memories.push_back(std::move(entry).value());
    }
    position = 0;
    for (const auto& node : subcategories) {
        auto entry = decodeSubcategoryEntry(node, position++);
        if (!entry)
            return entry.error();
        index.subcategories.push_back(std::move(entry).value());
    }
    return index;
}

Result<std::string> encodeIndex(const CategoryIndex& index) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "memories" << YAML::Value << YAML::BeginSeq;
    for (const auto& memory : index.memories) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << memory.path.toString();
        out << YAML::Key << "token_estimate" << YAML::Value << memory.tokenEstimate;
        if (memory.summary) {
            out << YAML::Key << "summary" << YAML::Value << YAML::DoubleQuoted << *memory.summary;
        }
        if (memory.updatedAt) {
            out << YAML::Key << "updated_at" << YAML::Value
                << TimeFormat::formatISO8601(*memory.updatedAt);
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "subcategories" << YAML::Value << YAML::BeginSeq;
    for (const auto& subcategory : index.subcategories) {
        out << YAML::BeginMap;
        out << YAML::Key << "path" << YAML::Value << subcategory.path.toString();
        out << YAML::Key << "memory_count" << YAML::Value << subcategory.memoryCount;
        if (subcategory.description) {
            out << YAML::Key << "description" << YAML::Value << YAML::DoubleQuoted
                << *subcategory.description;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    if (!out.good()) {
        return Error{ErrorCode::SerializeFailed,
                     std::format("Failed to serialize category index: {}", out.GetLastError())};
    }
    std::string text = out.c_str();
    text.push_back('\n');
    return text;
}

} // namespace strata::index
