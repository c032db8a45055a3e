#include "pqm/metadata.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>

#include <yaml-cpp/yaml.h>

namespace pqm {

namespace {

const std::set<std::string> kKnownKeys = {
    "name", "category", "tags", "dependencies", "description", "version"
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Returns the line starting at `pos` without its terminator, and advances
// `next` past the terminator (or to npos when the text ends).
std::string read_line(const std::string& text, size_t pos, size_t& next) {
    size_t nl = text.find('\n', pos);
    std::string line;
    if (nl == std::string::npos) {
        line = text.substr(pos);
        next = std::string::npos;
    } else {
        line = text.substr(pos, nl - pos);
        next = nl + 1;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

bool is_delimiter_line(const std::string& line) {
    return trim(line) == kFrontMatterDelimiter;
}

// Scalar field: absent or null gives nullopt, a non-scalar sets error
std::optional<std::string> get_scalar(const YAML::Node& root, const char* key,
                                      std::string& error) {
    const YAML::Node node = root[key];
    if (!node.IsDefined() || node.IsNull()) return std::nullopt;
    if (!node.IsScalar()) {
        error = std::string(key) + " must be a scalar";
        return std::nullopt;
    }
    return normalize_scalar(node.Scalar());
}

// List field: absent or null gives empty, anything but a list of scalars sets error
std::vector<std::string> get_scalar_list(const YAML::Node& root, const char* key,
                                         std::string& error,
                                         std::vector<std::string>& warnings) {
    std::vector<std::string> result;
    const YAML::Node node = root[key];
    if (!node.IsDefined() || node.IsNull()) return result;
    if (!node.IsSequence()) {
        error = std::string(key) + " must be a list";
        return result;
    }
    for (const auto& elem : node) {
        if (!elem.IsScalar()) {
            error = std::string(key) + " must contain only scalar values";
            return {};
        }
        std::string value = normalize_scalar(elem.Scalar());
        if (value.empty()) {
            warnings.push_back(std::string("empty entry ignored in ") + key);
            continue;
        }
        result.push_back(std::move(value));
    }
    return result;
}

void emit_list(YAML::Emitter& out, const char* key, const std::vector<std::string>& values) {
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& v : values) {
        out << YAML::DoubleQuoted << v;
    }
    out << YAML::EndSeq;
}

} // namespace

std::string normalize_scalar(const std::string& value) {
    std::string result = value;
    std::replace(result.begin(), result.end(), '\r', ' ');
    std::replace(result.begin(), result.end(), '\n', ' ');
    return trim(result);
}

MetadataParseResult parse_script_text(const std::string& raw_text) {
    MetadataParseResult result;

    // Opening delimiter (leading whitespace tolerated)
    size_t pos = 0;
    while (pos < raw_text.size() && std::isspace(static_cast<unsigned char>(raw_text[pos]))) ++pos;
    if (pos >= raw_text.size()) {
        result.error = "metadata header missing: file is empty";
        return result;
    }

    size_t next = 0;
    if (!is_delimiter_line(read_line(raw_text, pos, next))) {
        result.error = "metadata header missing: expected '---' on the first line";
        return result;
    }
    if (next == std::string::npos) {
        result.error = "metadata header unterminated";
        return result;
    }

    // Closing delimiter
    size_t header_begin = next;
    size_t header_end = std::string::npos;
    size_t body_begin = std::string::npos;
    size_t cursor = header_begin;
    while (cursor != std::string::npos && cursor < raw_text.size()) {
        size_t after = 0;
        std::string line = read_line(raw_text, cursor, after);
        if (is_delimiter_line(line)) {
            header_end = cursor;
            body_begin = (after == std::string::npos) ? raw_text.size() : after;
            break;
        }
        cursor = after;
    }
    if (header_end == std::string::npos) {
        result.error = "metadata header unterminated: closing '---' not found";
        return result;
    }

    // One separator blank line belongs to the header block
    if (raw_text.compare(body_begin, 2, "\r\n") == 0) {
        body_begin += 2;
    } else if (raw_text.compare(body_begin, 1, "\n") == 0) {
        body_begin += 1;
    }
    result.body = raw_text.substr(body_begin);

    std::string header = raw_text.substr(header_begin, header_end - header_begin);

    try {
        const YAML::Node root = YAML::Load(header);
        if (!root.IsMap()) {
            result.error = "metadata header must be a key/value mapping";
            return result;
        }

        for (const auto& kv : root) {
            if (!kv.first.IsScalar()) {
                result.error = "metadata keys must be scalars";
                return result;
            }
            if (kKnownKeys.count(kv.first.Scalar()) == 0) {
                result.warnings.push_back("unknown metadata key ignored: " + kv.first.Scalar());
            }
        }

        std::string field_error;
        auto& meta = result.metadata;

        auto name = get_scalar(root, "name", field_error);
        if (!field_error.empty()) {
            result.error = field_error;
            return result;
        }
        if (!name || name->empty()) {
            result.error = "name missing";
            return result;
        }
        meta.name = *name;

        if (auto category = get_scalar(root, "category", field_error)) {
            meta.category = category->empty() ? kDefaultCategory : *category;
        }
        if (auto description = get_scalar(root, "description", field_error)) {
            meta.description = *description;
        }
        if (auto version = get_scalar(root, "version", field_error)) {
            meta.version = *version;
        }
        if (!field_error.empty()) {
            result.error = field_error;
            return result;
        }

        meta.tags = get_scalar_list(root, "tags", field_error, result.warnings);
        if (!field_error.empty()) {
            result.error = field_error;
            return result;
        }
        meta.dependencies = get_scalar_list(root, "dependencies", field_error, result.warnings);
        if (!field_error.empty()) {
            result.error = field_error;
            return result;
        }
    } catch (const YAML::Exception& e) {
        result.error = std::string("YAML error: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

std::string serialize_script(const ScriptMetadata& metadata, const std::string& body) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << YAML::DoubleQuoted << metadata.name;
    out << YAML::Key << "category" << YAML::Value << YAML::DoubleQuoted << metadata.category;
    emit_list(out, "tags", metadata.tags);
    emit_list(out, "dependencies", metadata.dependencies);
    out << YAML::Key << "description" << YAML::Value << YAML::DoubleQuoted << metadata.description;
    out << YAML::Key << "version" << YAML::Value << YAML::DoubleQuoted << metadata.version;
    out << YAML::EndMap;

    std::string text;
    text.reserve(body.size() + 256);
    text += kFrontMatterDelimiter;
    text += "\n";
    text += out.c_str();
    text += "\n";
    text += kFrontMatterDelimiter;
    text += "\n\n";
    text += body;
    return text;
}

} // namespace pqm
