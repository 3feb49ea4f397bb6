#include <strata/core/time_format.h>
#include <strata/memory/memory_file.h>

#include <yaml-cpp/yaml.h>

#include <format>
#include <sstream>

namespace strata::memory {

namespace {

struct FrontmatterSplit {
    std::string frontmatter;
    std::string body;
};

std::string trimCopy(std::string_view s) {
    size_t first = 0;
    size_t last = s.size();
    while (first < last && (s[first] == ' ' || s[first] == '\t' || s[first] == '\r'))
        ++first;
    while (last > first && (s[last - 1] == ' ' || s[last - 1] == '\t' || s[last - 1] == '\r'))
        --last;
    return std::string(s.substr(first, last - first));
}

Result<FrontmatterSplit> splitFrontmatter(std::string_view raw) {
    std::string normalized;
    normalized.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') {
            continue;
        }
        normalized.push_back(raw[i]);
    }

    std::vector<std::string_view> lines;
    std::string_view view(normalized);
    size_t start = 0;
    while (true) {
        auto nl = view.find('\n', start);
        lines.push_back(view.substr(start, nl == std::string_view::npos ? view.npos : nl - start));
        if (nl == std::string_view::npos)
            break;
        start = nl + 1;
    }

    if (lines.empty() || trimCopy(lines.front()) != "---") {
        return Error{ErrorCode::ParseFailed, "Memory file must start with YAML frontmatter"};
    }

    size_t endIndex = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (trimCopy(lines[i]) == "---") {
            endIndex = i;
            break;
        }
    }
    if (endIndex == 0) {
        return Error{ErrorCode::ParseFailed, "Memory file frontmatter must be closed with '---'"};
    }

    FrontmatterSplit split;
    for (size_t i = 1; i < endIndex; ++i) {
        split.frontmatter.append(lines[i]);
        split.frontmatter.push_back('\n');
    }
    for (size_t i = endIndex + 1; i < lines.size(); ++i) {
        if (i > endIndex + 1)
            split.body.push_back('\n');
        split.body.append(lines[i]);
    }
    return split;
}

Result<Timestamp> readTimestamp(const YAML::Node& node, const char* field) {
    auto value = node[field];
    if (!value || value.IsNull()) {
        return Error{ErrorCode::ValidationFailed, std::format("Missing field '{}'", field),
                     field};
    }
    if (!value.IsScalar()) {
        return Error{ErrorCode::ValidationFailed, std::format("Invalid timestamp for '{}'", field),
                     field};
    }
    auto parsed = TimeFormat::parseISO8601(value.Scalar());
    if (!parsed) {
        return Error{ErrorCode::ValidationFailed,
                     std::format("Invalid timestamp for '{}': {}", field, value.Scalar()), field};
    }
    return *parsed;
}

Result<std::vector<std::string>> readStringList(const YAML::Node& node, const char* field) {
    std::vector<std::string> out;
    auto value = node[field];
    if (!value || value.IsNull()) {
        return out;
    }
    if (!value.IsSequence()) {
        return Error{ErrorCode::ValidationFailed, std::format("'{}' must be a list", field),
                     field};
    }
    for (const auto& item : value) {
        if (!item.IsScalar() || trimCopy(item.Scalar()).empty()) {
            return Error{ErrorCode::ValidationFailed,
                         std::format("'{}' entries must be non-empty strings", field), field};
        }
        out.push_back(item.Scalar());
    }
    return out;
}

std::optional<Timestamp> lenientTimestamp(const YAML::Node& node, const char* field) {
    auto value = node[field];
    if (!value || !value.IsScalar()) {
        return std::nullopt;
    }
    return TimeFormat::parseISO8601(value.Scalar());
}

} // namespace

Result<Memory> parseMemory(std::string_view raw) {
    auto split = splitFrontmatter(raw);
    if (!split) {
        return split.error();
    }

    YAML::Node root;
    try {
        root = YAML::Load(split.value().frontmatter);
    } catch (const YAML::Exception& e) {
        return Error{ErrorCode::ParseFailed, std::format("Invalid frontmatter YAML: {}", e.what())};
    }
    if (!root.IsMap()) {
        return Error{ErrorCode::ValidationFailed, "Frontmatter must be a mapping"};
    }

    Memory memory;
    auto created = readTimestamp(root, "created_at");
    if (!created)
        return created.error();
    auto updated = readTimestamp(root, "updated_at");
    if (!updated)
        return updated.error();
    memory.metadata.createdAt = created.value();
    memory.metadata.updatedAt = updated.value();

    auto source = root["source"];
    if (!source || !source.IsScalar() || trimCopy(source.Scalar()).empty()) {
        return Error{ErrorCode::ValidationFailed, "Missing or empty field 'source'", "source"};
    }
    memory.metadata.source = trimCopy(source.Scalar());

    auto tags = readStringList(root, "tags");
    if (!tags)
        return tags.error();
    memory.metadata.tags = std::move(tags).value();

    auto citations = readStringList(root, "citations");
    if (!citations)
        return citations.error();
    memory.metadata.citations = std::move(citations).value();

    if (auto expires = root["expires_at"]; expires && !expires.IsNull()) {
        auto parsed = readTimestamp(root, "expires_at");
        if (!parsed)
            return parsed.error();
        memory.metadata.expiresAt = parsed.value();
    }

    memory.content = std::move(split.value().body);
    return memory;
}

Result<std::string> serializeMemory(const Memory& memory) {
    const auto& meta = memory.metadata;
    if (trimCopy(meta.source).empty()) {
        return Error{ErrorCode::SerializeFailed, "Memory source cannot be empty", "source"};
    }
    for (const auto& tag : meta.tags) {
        if (trimCopy(tag).empty()) {
            return Error{ErrorCode::SerializeFailed, "Memory tags cannot be empty", "tags"};
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "created_at" << YAML::Value << TimeFormat::formatISO8601(meta.createdAt);
    out << YAML::Key << "updated_at" << YAML::Value << TimeFormat::formatISO8601(meta.updatedAt);
    out << YAML::Key << "tags" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& tag : meta.tags) {
        out << tag;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "source" << YAML::Value << meta.source;
    if (meta.expiresAt) {
        out << YAML::Key << "expires_at" << YAML::Value
            << TimeFormat::formatISO8601(*meta.expiresAt);
    }
    if (!meta.citations.empty()) {
        out << YAML::Key << "citations" << YAML::Value << YAML::BeginSeq;
        for (const auto& citation : meta.citations) {
            out << citation;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        return Error{ErrorCode::SerializeFailed,
                     std::format("Failed to emit frontmatter: {}", out.GetLastError())};
    }

    std::ostringstream ss;
    ss << "---\n" << out.c_str() << "\n---";
    if (!memory.content.empty() && memory.content.front() != '\n') {
        ss << '\n';
    }
    ss << memory.content;
    return ss.str();
}

MemoryFacts inspectMemory(std::string_view raw) noexcept {
    MemoryFacts facts;
    try {
        auto split = splitFrontmatter(raw);
        if (!split) {
            return facts;
        }
        auto root = YAML::Load(split.value().frontmatter);
        if (!root.IsMap()) {
            return facts;
        }
        facts.updatedAt = lenientTimestamp(root, "updated_at");
        facts.expiresAt = lenientTimestamp(root, "expires_at");
    } catch (const std::exception&) {
        return MemoryFacts{};
    }
    return facts;
}

} // namespace strata::memory
