#pragma once

#include "pqm/error.hpp"
#include "pqm/repository.hpp"
#include "pqm/types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pqm {

constexpr const char* kIndexSchema = "pqm.index.v1";

// ============================================================================
// Snapshot Codec (JSON Lines)
// ============================================================================
//
// Line 1: {"$schema":"pqm.index.v1"}
// Then one entry per line, sorted by folded name:
// {"name":..,"category":..,"tags":[..],"dependencies":[..],
//  "description":..,"version":..,"path":..,"sha256":..}

struct IndexSnapshotParseResult {
    bool ok = false;
    std::string error;
    std::vector<IndexEntry> entries;
};

IndexSnapshotParseResult parse_index_snapshot(const std::string& text);

// Byte-deterministic for a given entry set
std::string serialize_index_snapshot(const std::vector<IndexEntry>& entries);

// ============================================================================
// Index Store
// ============================================================================

enum class IndexLoadStatus {
    Loaded,
    Missing,  // no snapshot yet; build required
    Corrupt   // unreadable snapshot; treated as empty until rebuilt
};

struct RefreshSummary {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> updated;
    std::vector<std::string> unchanged;

    bool changed() const { return !added.empty() || !removed.empty() || !updated.empty(); }
};

struct IndexView {
    uint64_t generation = 0;
    std::vector<IndexEntry> entries;
};

/**
 * @brief Persisted metadata-only cache over the repository's scripts
 *
 * Reads take shared repository access and reload the snapshot first when
 * another process rewrote it. Every mutation requires an ExclusiveAccess
 * token and writes the snapshot atomically before the in-memory view is
 * swapped, so a failed write leaves both untouched.
 */
class IndexStore {
public:
    // Loads the snapshot; never fails. Inspect load_status() for diagnostics.
    explicit IndexStore(std::shared_ptr<const RepositoryContext> context);

    IndexLoadStatus load_status() const;
    std::string load_diagnostic() const;

    // ------------------------------------------------------------------------
    // Reads (shared access)
    // ------------------------------------------------------------------------

    std::optional<IndexEntry> get(const std::string& name) const;

    // Case-insensitive substring over name, tags and description, ordered by name.
    // An empty query matches everything.
    std::vector<IndexEntry> search(const std::string& query) const;

    std::vector<IndexEntry> entries() const;
    std::vector<std::string> list_categories() const;
    uint64_t generation() const;
    IndexView view() const;

    // Same reads for a caller already holding shared access across several steps
    std::optional<IndexEntry> get(const SharedAccess& access, const std::string& name) const;
    IndexView view(const SharedAccess& access) const;

    // ------------------------------------------------------------------------
    // Reads under a held exclusive access
    // ------------------------------------------------------------------------

    std::optional<IndexEntry> get(const ExclusiveAccess& access, const std::string& name) const;
    std::vector<IndexEntry> entries(const ExclusiveAccess& access) const;

    // ------------------------------------------------------------------------
    // Mutations (exclusive access)
    // ------------------------------------------------------------------------

    // Replace the whole index. DUPLICATE_NAME aborts with nothing written.
    Result<void> build(const ExclusiveAccess& access, const std::vector<IndexEntry>& entries);

    // Reconcile with the current file set: same guarantees as build, plus a
    // summary of what changed. Repeating with the same input is a no-op.
    Result<RefreshSummary> refresh(const ExclusiveAccess& access,
                                   const std::vector<IndexEntry>& entries);

    // Per-entry commits need a loaded snapshot (INDEX_NOT_READY otherwise).

    // Insert or replace one entry; `previous_name` is dropped first (renames).
    // DUPLICATE_NAME if another entry already owns the name.
    Result<void> commit_put(const ExclusiveAccess& access, const IndexEntry& entry,
                            const std::string& previous_name = "");

    // Remove one entry. NOT_FOUND if absent.
    Result<void> commit_erase(const ExclusiveAccess& access, const std::string& name);

    // Reload from disk when another process rewrote the snapshot
    Result<void> sync(const ExclusiveAccess& access);

private:
    using EntryMap = std::map<std::string, IndexEntry>;  // folded name -> entry

    void load_from_disk() const;
    void reload_if_changed() const;
    Result<void> write_and_swap(EntryMap next);
    static Result<EntryMap> make_map(const std::vector<IndexEntry>& entries);
    std::vector<IndexEntry> collect() const;
    void remember_disk_stamp() const;
    bool disk_changed() const;

    std::shared_ptr<const RepositoryContext> context_;

    // The cached snapshot. Readers under shared access may reload it, so
    // they serialize on reload_mutex_; mutations own it through exclusive access.
    mutable std::mutex reload_mutex_;
    mutable EntryMap entries_;
    mutable uint64_t generation_ = 0;
    mutable IndexLoadStatus status_ = IndexLoadStatus::Missing;
    mutable std::string load_diagnostic_;
    mutable std::string disk_stamp_;  // size:mtime of the snapshot as last seen
};

} // namespace pqm
