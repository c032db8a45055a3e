#pragma once

/**
 * @file manager.hpp
 * @brief Facade over one script repository
 *
 * The Manager ties together the repository context, the index store, the
 * storage manager and the dependency graph. Front ends (the `pqm` tool, a
 * GUI, a document add-in) talk to this class only.
 *
 * @example
 * ```cpp
 * auto opened = pqm::Manager::open("/data/queries");
 * if (opened.isErr()) return 1;
 * auto& manager = *opened.value();
 * manager.build_index();
 * auto order = manager.resolve({"Final"});
 * if (order.isOk()) {
 *     for (const auto& script : order.value().scripts) {
 *         // script.name, script.body in insertion order
 *     }
 * }
 * ```
 */

#include "pqm/config.hpp"
#include "pqm/dependency_resolver.hpp"
#include "pqm/document_adapter.hpp"
#include "pqm/error.hpp"
#include "pqm/index_store.hpp"
#include "pqm/repository.hpp"
#include "pqm/storage_manager.hpp"
#include "pqm/types.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pqm {

// ============================================================================
// Reports
// ============================================================================

struct BuildReport {
    size_t indexed = 0;
    std::vector<FileFailure> skipped;
};

struct RefreshReport {
    RefreshSummary summary;
    std::vector<FileFailure> skipped;
};

struct ConsistencyReport {
    std::vector<std::string> missing_files;    // indexed names whose file is gone
    std::vector<std::string> stale_entries;    // indexed names whose file changed
    std::vector<std::string> unindexed_files;  // relative paths not in the index

    bool consistent() const {
        return missing_files.empty() && stale_entries.empty() && unindexed_files.empty();
    }
};

struct ResolvedScript {
    std::string name;
    std::string body;
    std::string description;
};

struct Resolution {
    std::vector<ResolvedScript> scripts;     // insertion order
    std::vector<UnresolvedName> unresolved;  // only with allow_partial
};

struct ScriptFailure {
    std::string name;
    Error error;
};

struct ExtractOptions {
    std::string category = "Extracted";
    bool overwrite = false;
};

struct ExtractionReport {
    std::vector<std::string> created;
    std::vector<std::string> overwritten;
    std::vector<ScriptFailure> failed;
    bool cancelled = false;
};

struct InsertOptions {
    ResolveOptions resolve;
};

struct InsertionOutcome {
    std::string name;
    std::optional<Error> error;  // empty on success

    bool ok() const { return !error.has_value(); }
};

struct InsertionReport {
    std::vector<InsertionOutcome> outcomes;  // insertion order
    std::vector<UnresolvedName> unresolved;
};

// ============================================================================
// Manager
// ============================================================================

class Manager {
public:
    /// Open a repository with <root>/pqm.json (or defaults) and environment overrides
    static Result<std::unique_ptr<Manager>> open(const std::string& root);

    /// Open with an explicit configuration
    static Result<std::unique_ptr<Manager>> create(const std::string& root,
                                                   const RepositoryConfig& config);

    const std::string& root() const { return context_->root(); }
    const RepositoryConfig& config() const { return context_->config(); }
    std::shared_ptr<const RepositoryContext> context() const { return context_; }

    // Snapshot load state; the index is never built implicitly
    IndexLoadStatus index_status() const;
    std::string index_diagnostic() const;

    // ------------------------------------------------------------------------
    // Index
    // ------------------------------------------------------------------------

    /// Scan only; nothing is written
    Result<ScanReport> scan(const CancellationToken& cancel = {}) const;

    Result<BuildReport> build_index(const CancellationToken& cancel = {});
    Result<RefreshReport> refresh_index(const CancellationToken& cancel = {});
    Result<ConsistencyReport> check_consistency() const;

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    std::vector<IndexEntry> search(const std::string& query) const;
    std::optional<IndexEntry> get(const std::string& name) const;
    std::vector<std::string> list_categories() const;
    std::vector<IndexEntry> entries() const;

    /// Full record read from disk. NOT_FOUND if not indexed or the file is gone.
    Result<ScriptRecord> get_script(const std::string& name) const;

    // ------------------------------------------------------------------------
    // Dependencies
    // ------------------------------------------------------------------------

    /// Bodies in insertion order for `names` and everything they require
    Result<Resolution> resolve(const std::vector<std::string>& names,
                               const ResolveOptions& options = {}) const;

    /// Indexed names the script's body appears to call, declared or not
    Result<std::vector<std::string>> suggest_dependencies(const std::string& name) const;

    Result<std::vector<std::string>> dependents_of(const std::string& name) const;
    Result<DependencyTreeNode> dependency_tree(const std::string& name) const;

    // ------------------------------------------------------------------------
    // Edits
    // ------------------------------------------------------------------------

    Result<IndexEntry> create_script(const ScriptMetadata& metadata, const std::string& body);
    Result<IndexEntry> apply_metadata_edit(const std::string& name, const ScriptMetadata& metadata);
    Result<IndexEntry> rewrite_script(const std::string& name, const ScriptMetadata& metadata,
                                      const std::string& body);
    Result<IndexEntry> update_body(const std::string& name, const std::string& body);
    Result<IndexEntry> relocate(const std::string& name, const std::string& category);
    Result<void> delete_script(const std::string& name);

    void set_transition_observer(TransitionObserver observer);

    // ------------------------------------------------------------------------
    // Documents
    // ------------------------------------------------------------------------

    /// Save every script found in `document`. Failures are collected per
    /// script; cancellation stops the batch, keeping what was already saved.
    Result<ExtractionReport> extract_from_document(DocumentAdapter& adapter,
                                                   const std::string& document,
                                                   const ExtractOptions& options = {},
                                                   const CancellationToken& cancel = {});

    /// Resolve `names` and write each body to `document` in insertion order.
    /// Adapter failures are recorded per name; nothing is retried.
    Result<InsertionReport> insert_into_document(DocumentAdapter& adapter,
                                                 const std::string& document,
                                                 const std::vector<std::string>& names,
                                                 const InsertOptions& options = {}) const;

private:
    explicit Manager(std::shared_ptr<RepositoryContext> context);

    std::shared_ptr<const DependencyGraph> graph_for(const IndexView& view) const;
    Result<ScriptRecord> read_indexed(const IndexEntry& entry) const;

    std::shared_ptr<const RepositoryContext> context_;
    std::shared_ptr<IndexStore> index_;
    std::unique_ptr<StorageManager> storage_;

    mutable std::mutex graph_mutex_;
    mutable std::shared_ptr<const DependencyGraph> graph_;
    mutable uint64_t graph_generation_ = 0;
};

} // namespace pqm
