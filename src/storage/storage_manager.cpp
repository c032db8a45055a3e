#include "pqm/storage_manager.hpp"
#include "pqm/digest.hpp"
#include "pqm/metadata.hpp"
#include "pqm/platform.hpp"
#include "pqm/script_record.hpp"

#include <algorithm>
#include <optional>

#include <spdlog/spdlog.h>

namespace pqm {

const char* mutation_state_to_string(MutationState state) {
    switch (state) {
        case MutationState::Requested: return "requested";
        case MutationState::Locked: return "locked";
        case MutationState::FileMoved: return "file_moved";
        case MutationState::IndexUpdated: return "index_updated";
        case MutationState::RollbackMove: return "rollback_move";
        case MutationState::Released: return "released";
        default: return "unknown";
    }
}

namespace {

// Reports transitions; Released is emitted on scope exit, after any access
// token declared later in the same scope has been dropped.
class MutationTrace {
public:
    MutationTrace(const TransitionObserver& observer, const char* operation, std::string subject)
        : observer_(observer), operation_(operation), subject_(std::move(subject)) {
        enter(MutationState::Requested);
    }

    ~MutationTrace() { enter(MutationState::Released); }

    MutationTrace(const MutationTrace&) = delete;
    MutationTrace& operator=(const MutationTrace&) = delete;

    void enter(MutationState state) {
        spdlog::debug("{} '{}': {}", operation_, subject_, mutation_state_to_string(state));
        if (observer_) observer_(MutationTransition{operation_, subject_, state});
    }

private:
    const TransitionObserver& observer_;
    std::string operation_;
    std::string subject_;
};

std::string digest_of(const std::string& content) {
    auto digest = compute_sha256(content);
    return digest.ok ? digest.hex_digest : std::string();
}

void drop_folder_if_empty(const std::string& root, const std::string& file_path) {
    std::string folder = get_parent_directory(file_path);
    if (folder.empty() || folder == root) return;
    if (remove_empty_directory(folder)) {
        spdlog::debug("Removed empty category folder {}", folder);
    }
}

// The mutation failed with `cause` and undoing its file change failed too
Error rollback_failed(const std::string& operation, const std::string& name, const Error& cause,
                      const std::string& detail, std::vector<std::string> paths) {
    spdlog::error("{} '{}': rollback failed: {}", operation, name, detail);
    return Error(ErrorCode::ROLLBACK_FAILED,
                 operation + " '" + name + "' failed (" + cause.message() +
                     ") and could not be undone (" + detail + "); run refresh",
                 name, std::move(paths));
}

std::vector<std::string> dependents_in(const std::vector<IndexEntry>& entries,
                                       const std::string& name) {
    std::vector<std::string> dependents;
    for (const auto& entry : entries) {
        if (same_name(entry.meta.name, name)) continue;
        for (const auto& dep : entry.meta.dependencies) {
            if (same_name(dep, name)) {
                dependents.push_back(entry.meta.name);
                break;
            }
        }
    }
    std::sort(dependents.begin(), dependents.end(),
              [](const std::string& a, const std::string& b) { return fold_name(a) < fold_name(b); });
    return dependents;
}

} // namespace

StorageManager::StorageManager(std::shared_ptr<const RepositoryContext> context,
                               std::shared_ptr<IndexStore> index)
    : context_(std::move(context)), index_(std::move(index)) {}

void StorageManager::set_transition_observer(TransitionObserver observer) {
    observer_ = std::move(observer);
}

ScriptMetadata StorageManager::with_defaults(ScriptMetadata metadata) const {
    if (metadata.category.empty()) metadata.category = context_->config().default_category;
    if (metadata.version.empty()) metadata.version = kDefaultVersion;
    return metadata;
}

// ============================================================================
// Create
// ============================================================================

Result<IndexEntry> StorageManager::create(const ScriptRecord& record) {
    using R = Result<IndexEntry>;
    MutationTrace trace(observer_, "create", record.meta.name);

    ScriptMetadata meta = with_defaults(record.meta);
    auto valid = validate_metadata(meta);
    if (valid.isErr()) return R::err(valid.error());

    auto access = context_->acquire_exclusive();
    if (access.isErr()) return R::err(access.error());
    trace.enter(MutationState::Locked);

    auto synced = index_->sync(access.value());
    if (synced.isErr()) return R::err(synced.error());

    if (auto existing = index_->get(access.value(), meta.name)) {
        return R::err(Error(ErrorCode::DUPLICATE_NAME,
                            "script name '" + meta.name + "' already used by " + existing->path,
                            meta.name, {existing->path}));
    }

    auto target = script_path_for(context_->root(), meta.category, meta.name,
                                  context_->config().script_extension);
    if (target.isErr()) return R::err(target.error());
    const std::string& path = target.value();

    if (path_exists(path)) {
        return R::err(Error(ErrorCode::ALREADY_EXISTS, "file already exists: " + path, path));
    }
    if (!create_directories(get_parent_directory(path))) {
        return R::err(Error(ErrorCode::IO_ERROR, "cannot create category folder", path));
    }

    ScriptRecord stored{meta, record.body, path};
    std::string content = script_file_content(stored);
    auto written = atomic_write_file(path, content);
    if (!written.ok) {
        return R::err(Error(ErrorCode::IO_ERROR, written.error, path));
    }
    trace.enter(MutationState::FileMoved);

    IndexEntry entry = to_index_entry(stored, context_->root(), digest_of(content));
    auto committed = index_->commit_put(access.value(), entry);
    if (committed.isErr()) {
        trace.enter(MutationState::RollbackMove);
        spdlog::error("create '{}': index commit failed ({}); removing {}", meta.name,
                      committed.error().message(), path);
        if (!remove_file(path)) {
            return R::err(rollback_failed("create", meta.name, committed.error(),
                                          "cannot remove " + path, {path}));
        }
        drop_folder_if_empty(context_->root(), path);
        return R::err(committed.error());
    }
    trace.enter(MutationState::IndexUpdated);

    spdlog::info("Created '{}' at {}", meta.name, entry.path);
    return R::ok(std::move(entry));
}

// ============================================================================
// Edits
// ============================================================================

Result<IndexEntry> StorageManager::relocate_on_category_change(const std::string& name,
                                                               const std::string& new_category) {
    std::string category = new_category.empty() ? context_->config().default_category
                                                : new_category;
    return edit("relocate", name, [&](const ScriptRecord& current) {
        ScriptRecord next = current;
        next.meta.category = category;
        auto valid = validate_metadata(next.meta);
        if (valid.isErr()) return Result<ScriptRecord>::err(valid.error());
        return Result<ScriptRecord>::ok(std::move(next));
    });
}

Result<IndexEntry> StorageManager::rewrite(const std::string& name, const ScriptMetadata& metadata,
                                           const std::string& body) {
    ScriptMetadata meta = with_defaults(metadata);
    auto valid = validate_metadata(meta);
    if (valid.isErr()) return Result<IndexEntry>::err(valid.error());

    return edit("rewrite", name, [&](const ScriptRecord& current) {
        return Result<ScriptRecord>::ok(ScriptRecord{meta, body, current.path});
    });
}

Result<IndexEntry> StorageManager::update_metadata(const std::string& name,
                                                   const ScriptMetadata& metadata) {
    ScriptMetadata meta = with_defaults(metadata);
    auto valid = validate_metadata(meta);
    if (valid.isErr()) return Result<IndexEntry>::err(valid.error());

    return edit("rewrite", name, [&](const ScriptRecord& current) {
        return Result<ScriptRecord>::ok(ScriptRecord{meta, current.body, current.path});
    });
}

Result<IndexEntry> StorageManager::update_body(const std::string& name, const std::string& body) {
    return edit("rewrite", name, [&](const ScriptRecord& current) {
        ScriptRecord next = current;
        next.body = body;
        return Result<ScriptRecord>::ok(std::move(next));
    });
}

Result<IndexEntry> StorageManager::edit(const char* operation, const std::string& name,
                                        const Transform& transform) {
    using R = Result<IndexEntry>;
    MutationTrace trace(observer_, operation, name);

    auto access = context_->acquire_exclusive();
    if (access.isErr()) return R::err(access.error());
    trace.enter(MutationState::Locked);

    auto synced = index_->sync(access.value());
    if (synced.isErr()) return R::err(synced.error());

    auto entry = index_->get(access.value(), name);
    if (!entry) {
        return R::err(Error(ErrorCode::NOT_FOUND, "script not in index: " + name, name));
    }

    std::string old_path = join_path(context_->root(), entry->path);
    auto old_content = read_file(old_path);
    if (!old_content) {
        return R::err(Error(ErrorCode::NOT_FOUND,
                            "script file missing (refresh the index): " + old_path, name));
    }
    auto parsed = parse_script_text(*old_content);
    if (!parsed.ok) {
        return R::err(Error(ErrorCode::MALFORMED_METADATA, parsed.error, old_path));
    }

    auto transformed = transform(ScriptRecord{parsed.metadata, parsed.body, old_path});
    if (transformed.isErr()) return R::err(transformed.error());
    ScriptRecord next = std::move(transformed.value());

    const std::string& old_name = entry->meta.name;
    if (!same_name(next.meta.name, old_name)) {
        if (auto clash = index_->get(access.value(), next.meta.name)) {
            return R::err(Error(ErrorCode::DUPLICATE_NAME,
                                "script name '" + next.meta.name + "' already used by " + clash->path,
                                next.meta.name, {clash->path}));
        }
        auto dependents = dependents_in(index_->entries(access.value()), old_name);
        if (!dependents.empty()) {
            return R::err(Error(ErrorCode::NAME_REFERENCED,
                                "cannot rename '" + old_name + "': other scripts depend on it",
                                old_name, dependents));
        }
    }

    auto target = script_path_for(context_->root(), next.meta.category, next.meta.name,
                                  context_->config().script_extension);
    if (target.isErr()) return R::err(target.error());
    next.path = target.value();
    const bool moving = next.path != old_path;

    if (moving) {
        if (path_exists(next.path)) {
            return R::err(Error(ErrorCode::ALREADY_EXISTS, "file already exists: " + next.path,
                                next.path));
        }
        if (!create_directories(get_parent_directory(next.path))) {
            return R::err(Error(ErrorCode::IO_ERROR, "cannot create category folder", next.path));
        }
    }

    std::string content = script_file_content(next);
    auto written = atomic_write_file(next.path, content);
    if (!written.ok) {
        return R::err(Error(ErrorCode::IO_ERROR, written.error, next.path));
    }
    if (moving && !remove_file(old_path)) {
        Error cause(ErrorCode::IO_ERROR, "cannot remove " + old_path, old_path);
        if (!remove_file(next.path)) {
            return R::err(rollback_failed(operation, name, cause, "cannot remove " + next.path,
                                          {old_path, next.path}));
        }
        return R::err(cause);
    }
    trace.enter(MutationState::FileMoved);

    IndexEntry updated = to_index_entry(next, context_->root(), digest_of(content));
    auto committed = index_->commit_put(access.value(), updated, old_name);
    if (committed.isErr()) {
        trace.enter(MutationState::RollbackMove);
        spdlog::error("{} '{}': index commit failed ({}); restoring {}", operation, name,
                      committed.error().message(), old_path);
        std::vector<std::string> paths{old_path};
        if (moving) paths.push_back(next.path);

        auto restored = atomic_write_file(old_path, *old_content);
        if (!restored.ok) {
            return R::err(rollback_failed(operation, name, committed.error(),
                                          "cannot restore " + old_path + ": " + restored.error,
                                          paths));
        }
        if (moving) {
            if (!remove_file(next.path)) {
                return R::err(rollback_failed(operation, name, committed.error(),
                                              "cannot remove " + next.path, paths));
            }
            drop_folder_if_empty(context_->root(), next.path);
        }
        return R::err(committed.error());
    }
    trace.enter(MutationState::IndexUpdated);

    if (moving) {
        drop_folder_if_empty(context_->root(), old_path);
        spdlog::info("Moved '{}' to {}", next.meta.name, updated.path);
    } else {
        spdlog::info("Updated '{}'", next.meta.name);
    }
    return R::ok(std::move(updated));
}

// ============================================================================
// Delete
// ============================================================================

Result<void> StorageManager::remove(const std::string& name) {
    using R = Result<void>;
    MutationTrace trace(observer_, "delete", name);

    auto access = context_->acquire_exclusive();
    if (access.isErr()) return R::err(access.error());
    trace.enter(MutationState::Locked);

    auto synced = index_->sync(access.value());
    if (synced.isErr()) return synced;

    auto entry = index_->get(access.value(), name);
    if (!entry) {
        return R::err(Error(ErrorCode::NOT_FOUND, "script not in index: " + name, name));
    }

    std::string path = join_path(context_->root(), entry->path);
    std::optional<std::string> old_content;
    if (path_exists(path)) {
        old_content = read_file(path);
        if (!old_content) {
            return R::err(Error(ErrorCode::IO_ERROR, "cannot read " + path, path));
        }
        if (!remove_file(path)) {
            return R::err(Error(ErrorCode::IO_ERROR, "cannot remove " + path, path));
        }
    } else {
        spdlog::warn("delete '{}': file already gone, dropping index entry", name);
    }
    trace.enter(MutationState::FileMoved);

    auto committed = index_->commit_erase(access.value(), entry->meta.name);
    if (committed.isErr()) {
        trace.enter(MutationState::RollbackMove);
        spdlog::error("delete '{}': index commit failed ({}); restoring {}", name,
                      committed.error().message(), path);
        if (old_content) {
            auto restored = atomic_write_file(path, *old_content);
            if (!restored.ok) {
                return R::err(rollback_failed("delete", name, committed.error(),
                                              "cannot restore " + path + ": " + restored.error,
                                              {path}));
            }
        }
        return committed;
    }
    trace.enter(MutationState::IndexUpdated);

    drop_folder_if_empty(context_->root(), path);
    spdlog::info("Deleted '{}' ({})", entry->meta.name, entry->path);
    return R::ok();
}

} // namespace pqm
