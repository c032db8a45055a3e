#include "pqm/script_record.hpp"
#include "pqm/digest.hpp"
#include "pqm/metadata.hpp"
#include "pqm/platform.hpp"

#include <cctype>

namespace pqm {

namespace {

bool is_single_line(const std::string& s) {
    return normalize_scalar(s) == s;
}

bool check_list(const std::vector<std::string>& values, const char* field, std::string& error) {
    for (const auto& v : values) {
        if (v.empty() || !is_single_line(v)) {
            error = std::string(field) + " entries must be non-empty single-line values";
            return false;
        }
    }
    return true;
}

} // namespace

ScriptLoadResult load_script_file(const std::string& path) {
    ScriptLoadResult result;
    result.record.path = path;

    auto content = read_file(path);
    if (!content) {
        result.error_code = ErrorCode::IO_ERROR;
        result.error = "failed to read file";
        return result;
    }

    auto parsed = parse_script_text(*content);
    result.warnings = std::move(parsed.warnings);
    if (!parsed.ok) {
        result.error = parsed.error;
        return result;
    }

    auto digest = compute_sha256(*content);
    if (!digest.ok) {
        result.error_code = ErrorCode::IO_ERROR;
        result.error = digest.error;
        return result;
    }

    result.record.meta = std::move(parsed.metadata);
    result.record.body = std::move(parsed.body);
    result.sha256 = digest.hex_digest;
    result.ok = true;
    return result;
}

std::string script_file_content(const ScriptRecord& record) {
    return serialize_script(record.meta, record.body);
}

IndexEntry to_index_entry(const ScriptRecord& record, const std::string& root,
                          const std::string& sha256) {
    IndexEntry entry;
    entry.meta = record.meta;
    entry.path = relative_path(record.path, root);
    entry.sha256 = sha256;
    return entry;
}

std::string sanitize_path_component(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == ' ' || c == '_' || c == '-') {
            result.push_back(c);
        }
    }
    while (!result.empty() && result.back() == ' ') result.pop_back();
    return result;
}

std::string category_folder(const std::string& category) {
    std::string folder = sanitize_path_component(category);
    if (folder.empty()) return kDefaultCategory;
    return folder;
}

Result<std::string> script_path_for(const std::string& root,
                                    const std::string& category,
                                    const std::string& name,
                                    const std::string& extension) {
    std::string file_stem = sanitize_path_component(name);
    if (file_stem.empty()) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                              "name has no characters usable in a file name",
                                              name));
    }
    return Result<std::string>::ok(
        join_path(join_path(root, category_folder(category)), file_stem + extension));
}

Result<void> validate_metadata(const ScriptMetadata& metadata) {
    auto invalid = [&](const std::string& message) {
        return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT, message, metadata.name));
    };

    if (metadata.name.empty()) return invalid("name is required");
    if (!is_single_line(metadata.name)) return invalid("name must be a single trimmed line");
    if (sanitize_path_component(metadata.name).empty()) {
        return invalid("name has no characters usable in a file name");
    }
    if (metadata.category.empty()) return invalid("category is required");
    if (!is_single_line(metadata.category) || !is_single_line(metadata.description) ||
        !is_single_line(metadata.version)) {
        return invalid("category, description and version must be single trimmed lines");
    }

    std::string error;
    if (!check_list(metadata.tags, "tags", error)) return invalid(error);
    if (!check_list(metadata.dependencies, "dependencies", error)) return invalid(error);

    for (const auto& dep : metadata.dependencies) {
        if (same_name(dep, metadata.name)) {
            return invalid("a script cannot depend on itself");
        }
    }
    return Result<void>::ok();
}

} // namespace pqm
