#pragma once

#include "pqm/error.hpp"
#include "pqm/index_store.hpp"
#include "pqm/repository.hpp"
#include "pqm/types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace pqm {

// ============================================================================
// Mutation Protocol
// ============================================================================
//
// Requested -> Locked -> FileMoved -> IndexUpdated -> Released
// Requested -> Locked -> FileMoved -> RollbackMove -> Released
//
// A request that fails before touching the filesystem goes straight to Released.

enum class MutationState {
    Requested,
    Locked,
    FileMoved,
    IndexUpdated,
    RollbackMove,
    Released
};

const char* mutation_state_to_string(MutationState state);

struct MutationTransition {
    std::string operation;  // "create", "relocate", "rewrite", "delete"
    std::string subject;    // script name as requested
    MutationState state;
};

// Called synchronously on the mutating thread. Transitions between Locked and
// Released are reported while exclusive access is held.
using TransitionObserver = std::function<void(const MutationTransition&)>;

/**
 * @brief Sole owner of filesystem mutation inside a repository
 *
 * Every operation runs under exclusive repository access, writes the file
 * change first and commits the index entry second. When the index commit
 * fails the file change is undone, so the filesystem and the index never
 * disagree once the lock is released.
 */
class StorageManager {
public:
    StorageManager(std::shared_ptr<const RepositoryContext> context,
                   std::shared_ptr<IndexStore> index);

    void set_transition_observer(TransitionObserver observer);

    /// New script at <category folder>/<name><ext>.
    /// ALREADY_EXISTS if the file exists, DUPLICATE_NAME if the index has the name.
    Result<IndexEntry> create(const ScriptRecord& record);

    /// Move the script to the folder of `new_category`, rewriting the header's
    /// category. Everything else in the file is preserved.
    Result<IndexEntry> relocate_on_category_change(const std::string& name,
                                                   const std::string& new_category);

    /// Replace metadata and body. A changed name or category relocates the file.
    /// NAME_REFERENCED when renaming a script others depend on.
    Result<IndexEntry> rewrite(const std::string& name, const ScriptMetadata& metadata,
                               const std::string& body);

    /// Replace metadata only; the body on disk is kept
    Result<IndexEntry> update_metadata(const std::string& name, const ScriptMetadata& metadata);

    Result<IndexEntry> update_body(const std::string& name, const std::string& body);

    /// Delete file and index entry together
    Result<void> remove(const std::string& name);

private:
    using Transform = std::function<Result<ScriptRecord>(const ScriptRecord& current)>;

    Result<IndexEntry> edit(const char* operation, const std::string& name,
                            const Transform& transform);
    ScriptMetadata with_defaults(ScriptMetadata metadata) const;

    std::shared_ptr<const RepositoryContext> context_;
    std::shared_ptr<IndexStore> index_;
    TransitionObserver observer_;
};

} // namespace pqm
