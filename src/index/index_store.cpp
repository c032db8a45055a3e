#include "pqm/index_store.hpp"
#include "pqm/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace pqm {

namespace fs = std::filesystem;

namespace {

bool entry_less(const IndexEntry& a, const IndexEntry& b) {
    std::string fa = fold_name(a.meta.name);
    std::string fb = fold_name(b.meta.name);
    if (fa != fb) return fa < fb;
    return a.meta.name < b.meta.name;
}

bool read_string(const nlohmann::json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key) || !j[key].is_string()) {
        error = std::string(key) + " missing or not a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_string_array(const nlohmann::json& j, const char* key, std::vector<std::string>& out,
                       std::string& error) {
    if (!j.contains(key) || !j[key].is_array()) {
        error = std::string(key) + " missing or not an array";
        return false;
    }
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) {
            error = std::string(key) + " must contain only strings";
            return false;
        }
        out.push_back(elem.get<std::string>());
    }
    return true;
}

bool contains_folded(const std::string& haystack, const std::string& folded_needle) {
    return fold_name(haystack).find(folded_needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Snapshot Codec
// ============================================================================

IndexSnapshotParseResult parse_index_snapshot(const std::string& text) {
    IndexSnapshotParseResult result;

    std::istringstream stream(text);
    std::string line;
    size_t line_no = 0;
    bool saw_schema = false;

    try {
        while (std::getline(stream, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            auto j = nlohmann::json::parse(line);
            if (!j.is_object()) {
                result.error = "line " + std::to_string(line_no) + ": expected a JSON object";
                return result;
            }

            if (!saw_schema) {
                if (!j.contains("$schema") || !j["$schema"].is_string() ||
                    j["$schema"].get<std::string>() != kIndexSchema) {
                    result.error = std::string("line 1: $schema mismatch: expected ") + kIndexSchema;
                    return result;
                }
                saw_schema = true;
                continue;
            }

            IndexEntry entry;
            std::string error;
            bool ok = read_string(j, "name", entry.meta.name, error) &&
                      read_string(j, "category", entry.meta.category, error) &&
                      read_string_array(j, "tags", entry.meta.tags, error) &&
                      read_string_array(j, "dependencies", entry.meta.dependencies, error) &&
                      read_string(j, "description", entry.meta.description, error) &&
                      read_string(j, "version", entry.meta.version, error) &&
                      read_string(j, "path", entry.path, error) &&
                      read_string(j, "sha256", entry.sha256, error);
            if (ok && entry.meta.name.empty()) {
                ok = false;
                error = "name empty";
            }
            if (!ok) {
                result.error = "line " + std::to_string(line_no) + ": " + error;
                return result;
            }
            result.entries.push_back(std::move(entry));
        }
    } catch (const nlohmann::json::parse_error& e) {
        result.error = "line " + std::to_string(line_no) + ": parse error: " + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = "line " + std::to_string(line_no) + ": JSON error: " + e.what();
        return result;
    }

    if (!saw_schema) {
        result.error = "snapshot is empty";
        return result;
    }

    result.ok = true;
    return result;
}

std::string serialize_index_snapshot(const std::vector<IndexEntry>& entries) {
    std::vector<IndexEntry> sorted = entries;
    std::sort(sorted.begin(), sorted.end(), entry_less);

    std::string out;
    nlohmann::ordered_json header;
    header["$schema"] = kIndexSchema;
    out += header.dump() + "\n";

    for (const auto& e : sorted) {
        nlohmann::ordered_json j;
        j["name"] = e.meta.name;
        j["category"] = e.meta.category;
        j["tags"] = e.meta.tags;
        j["dependencies"] = e.meta.dependencies;
        j["description"] = e.meta.description;
        j["version"] = e.meta.version;
        j["path"] = e.path;
        j["sha256"] = e.sha256;
        out += j.dump() + "\n";
    }
    return out;
}

// ============================================================================
// Index Store
// ============================================================================

IndexStore::IndexStore(std::shared_ptr<const RepositoryContext> context)
    : context_(std::move(context)) {
    load_from_disk();
}

void IndexStore::load_from_disk() const {
    std::string path = context_->index_path();
    entries_.clear();
    load_diagnostic_.clear();

    if (!path_exists(path)) {
        status_ = IndexLoadStatus::Missing;
        load_diagnostic_ = "no index snapshot at " + path + "; run build";
        disk_stamp_.clear();
        spdlog::info("Index snapshot not found at {}", path);
        return;
    }

    remember_disk_stamp();

    auto content = read_file(path);
    if (!content) {
        status_ = IndexLoadStatus::Corrupt;
        load_diagnostic_ = "cannot read index snapshot " + path + "; rebuild required";
        spdlog::warn("{}", load_diagnostic_);
        return;
    }

    auto parsed = parse_index_snapshot(*content);
    if (!parsed.ok) {
        status_ = IndexLoadStatus::Corrupt;
        load_diagnostic_ = "index snapshot " + path + " is corrupt (" + parsed.error +
                           "); rebuild required";
        spdlog::warn("{}", load_diagnostic_);
        return;
    }

    auto map = make_map(parsed.entries);
    if (map.isErr()) {
        status_ = IndexLoadStatus::Corrupt;
        load_diagnostic_ = "index snapshot " + path + " is corrupt (" + map.error().message() +
                           "); rebuild required";
        spdlog::warn("{}", load_diagnostic_);
        return;
    }

    entries_ = std::move(map.value());
    status_ = IndexLoadStatus::Loaded;
    spdlog::debug("Loaded {} index entries from {}", entries_.size(), path);
}

void IndexStore::remember_disk_stamp() const {
    disk_stamp_.clear();
    std::error_code ec;
    auto size = fs::file_size(context_->index_path(), ec);
    if (ec) return;
    auto mtime = fs::last_write_time(context_->index_path(), ec);
    if (ec) return;
    disk_stamp_ = std::to_string(size) + ":" +
                  std::to_string(mtime.time_since_epoch().count());
}

bool IndexStore::disk_changed() const {
    std::string current;
    std::error_code ec;
    auto size = fs::file_size(context_->index_path(), ec);
    if (!ec) {
        auto mtime = fs::last_write_time(context_->index_path(), ec);
        if (!ec) {
            current = std::to_string(size) + ":" +
                      std::to_string(mtime.time_since_epoch().count());
        }
    }
    return current != disk_stamp_;
}

void IndexStore::reload_if_changed() const {
    if (!disk_changed()) return;

    spdlog::info("Index snapshot changed on disk; reloading");
    load_from_disk();
    ++generation_;
}

Result<IndexStore::EntryMap> IndexStore::make_map(const std::vector<IndexEntry>& entries) {
    EntryMap map;
    for (const auto& entry : entries) {
        std::string key = fold_name(entry.meta.name);
        auto [it, inserted] = map.emplace(key, entry);
        if (!inserted) {
            return Result<EntryMap>::err(
                Error(ErrorCode::DUPLICATE_NAME,
                      "duplicate script name '" + entry.meta.name + "' in " + it->second.path +
                          " and " + entry.path,
                      entry.meta.name, {it->second.path, entry.path}));
        }
    }
    return Result<EntryMap>::ok(std::move(map));
}

std::vector<IndexEntry> IndexStore::collect() const {
    std::vector<IndexEntry> result;
    result.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        result.push_back(entry);
    }
    return result;
}

Result<void> IndexStore::write_and_swap(EntryMap next) {
    std::vector<IndexEntry> ordered;
    ordered.reserve(next.size());
    for (const auto& [key, entry] : next) ordered.push_back(entry);

    std::string path = context_->index_path();
    auto written = atomic_write_file(path, serialize_index_snapshot(ordered));
    if (!written.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR,
                                       "failed to write index snapshot: " + written.error, path));
    }

    entries_ = std::move(next);
    ++generation_;
    status_ = IndexLoadStatus::Loaded;
    load_diagnostic_.clear();
    remember_disk_stamp();
    return Result<void>::ok();
}

// ----------------------------------------------------------------------------
// Reads
// ----------------------------------------------------------------------------

IndexLoadStatus IndexStore::load_status() const {
    auto shared = context_->acquire_shared();
    std::lock_guard<std::mutex> guard(reload_mutex_);
    reload_if_changed();
    return status_;
}

std::string IndexStore::load_diagnostic() const {
    auto shared = context_->acquire_shared();
    std::lock_guard<std::mutex> guard(reload_mutex_);
    reload_if_changed();
    return load_diagnostic_;
}

std::optional<IndexEntry> IndexStore::get(const std::string& name) const {
    auto shared = context_->acquire_shared();
    return get(shared, name);
}

std::optional<IndexEntry> IndexStore::get(const SharedAccess&, const std::string& name) const {
    std::lock_guard<std::mutex> guard(reload_mutex_);
    reload_if_changed();
    auto it = entries_.find(fold_name(name));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::optional<IndexEntry> IndexStore::get(const ExclusiveAccess&, const std::string& name) const {
    auto it = entries_.find(fold_name(name));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::vector<IndexEntry> IndexStore::search(const std::string& query) const {
    auto shared = context_->acquire_shared();
    std::lock_guard<std::mutex> guard(reload_mutex_);
    reload_if_changed();
    std::string needle = fold_name(query);

    std::vector<IndexEntry> result;
    for (const auto& [key, entry] : entries_) {
        bool match = needle.empty() ||
                     key.find(needle) != std::string::npos ||
                     contains_folded(entry.meta.description, needle) ||
                     std::any_of(entry.meta.tags.begin(), entry.meta.tags.end(),
                                 [&](const std::string& t) { return contains_folded(t, needle); });
        if (match) result.push_back(entry);
    }
    return result;
}

std::vector<IndexEntry> IndexStore::entries() const {
    auto shared = context_->acquire_shared();
    std::lock_guard<std::mutex> guard(reload_mutex_);
    reload_if_changed();
    return collect();
}

std::vector<IndexEntry> IndexStore::entries(const ExclusiveAccess&) const {
    return collect();
}

std::vector<std::string> IndexStore::list_categories() const {
    auto shared = context_->acquire_shared();
    std::lock_guard<std::mutex> guard(reload_mutex_);
    reload_if_changed();
    std::set<std::string> categories;
    for (const auto& [key, entry] : entries_) {
        categories.insert(entry.meta.category);
    }
    return {categories.begin(), categories.end()};
}

uint64_t IndexStore::generation() const {
    auto shared = context_->acquire_shared();
    std::lock_guard<std::mutex> guard(reload_mutex_);
    reload_if_changed();
    return generation_;
}

IndexView IndexStore::view() const {
    auto shared = context_->acquire_shared();
    return view(shared);
}

IndexView IndexStore::view(const SharedAccess&) const {
    std::lock_guard<std::mutex> guard(reload_mutex_);
    reload_if_changed();
    return IndexView{generation_, collect()};
}

// ----------------------------------------------------------------------------
// Mutations
// ----------------------------------------------------------------------------

Result<void> IndexStore::build(const ExclusiveAccess&, const std::vector<IndexEntry>& entries) {
    auto map = make_map(entries);
    if (map.isErr()) {
        spdlog::error("Index build aborted: {}", map.error().message());
        return Result<void>::err(map.error());
    }

    auto written = write_and_swap(std::move(map.value()));
    if (written.isErr()) return written;

    spdlog::info("Index built: {} entries", entries_.size());
    return Result<void>::ok();
}

Result<RefreshSummary> IndexStore::refresh(const ExclusiveAccess&,
                                           const std::vector<IndexEntry>& entries) {
    auto map = make_map(entries);
    if (map.isErr()) {
        spdlog::error("Index refresh aborted: {}", map.error().message());
        return Result<RefreshSummary>::err(map.error());
    }
    EntryMap& next = map.value();

    RefreshSummary summary;
    for (const auto& [key, entry] : next) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            summary.added.push_back(entry.meta.name);
        } else if (it->second != entry) {
            summary.updated.push_back(entry.meta.name);
        } else {
            summary.unchanged.push_back(entry.meta.name);
        }
    }
    for (const auto& [key, entry] : entries_) {
        if (next.count(key) == 0) summary.removed.push_back(entry.meta.name);
    }

    if (!summary.changed() && status_ == IndexLoadStatus::Loaded && !disk_changed()) {
        spdlog::debug("Index refresh: no changes");
        return Result<RefreshSummary>::ok(std::move(summary));
    }

    auto written = write_and_swap(std::move(next));
    if (written.isErr()) return Result<RefreshSummary>::err(written.error());

    spdlog::info("Index refreshed: {} added, {} removed, {} updated", summary.added.size(),
                 summary.removed.size(), summary.updated.size());
    return Result<RefreshSummary>::ok(std::move(summary));
}

Result<void> IndexStore::commit_put(const ExclusiveAccess&, const IndexEntry& entry,
                                    const std::string& previous_name) {
    if (status_ != IndexLoadStatus::Loaded) {
        return Result<void>::err(Error(ErrorCode::INDEX_NOT_READY,
                                       "index not available (" + load_diagnostic_ + ")",
                                       context_->index_path()));
    }

    std::string key = fold_name(entry.meta.name);
    std::string previous_key = previous_name.empty() ? key : fold_name(previous_name);

    auto existing = entries_.find(key);
    if (existing != entries_.end() && key != previous_key) {
        return Result<void>::err(Error(ErrorCode::DUPLICATE_NAME,
                                       "script name '" + entry.meta.name + "' already used by " +
                                           existing->second.path,
                                       entry.meta.name, {existing->second.path}));
    }

    EntryMap next = entries_;
    next.erase(previous_key);
    next[key] = entry;
    return write_and_swap(std::move(next));
}

Result<void> IndexStore::commit_erase(const ExclusiveAccess&, const std::string& name) {
    if (status_ != IndexLoadStatus::Loaded) {
        return Result<void>::err(Error(ErrorCode::INDEX_NOT_READY,
                                       "index not available (" + load_diagnostic_ + ")",
                                       context_->index_path()));
    }

    std::string key = fold_name(name);
    if (entries_.count(key) == 0) {
        return Result<void>::err(Error(ErrorCode::NOT_FOUND, "script not in index: " + name, name));
    }

    EntryMap next = entries_;
    next.erase(key);
    return write_and_swap(std::move(next));
}

Result<void> IndexStore::sync(const ExclusiveAccess&) {
    reload_if_changed();
    return Result<void>::ok();
}

} // namespace pqm
