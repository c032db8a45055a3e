#pragma once

#include "pqm/config.hpp"
#include "pqm/error.hpp"
#include "pqm/platform.hpp"
#include "pqm/types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace pqm {

class RepositoryContext;

// ============================================================================
// Cancellation
// ============================================================================

// Shared flag checked by long operations between per-file steps.
// Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// ============================================================================
// Access Tokens
// ============================================================================

// Proof of exclusive access to a repository: the in-process writer lock and,
// when configured, the inter-process lock file. Released on destruction.
class ExclusiveAccess {
public:
    ExclusiveAccess(ExclusiveAccess&&) = default;
    ExclusiveAccess& operator=(ExclusiveAccess&&) = default;

    const RepositoryContext& context() const { return *context_; }

private:
    friend class RepositoryContext;
    ExclusiveAccess(const RepositoryContext* context,
                    std::unique_lock<std::shared_timed_mutex> lock,
                    FileLock file_lock)
        : context_(context), lock_(std::move(lock)), file_lock_(std::move(file_lock)) {}

    const RepositoryContext* context_;
    std::unique_lock<std::shared_timed_mutex> lock_;
    FileLock file_lock_;
};

// Shared (reader) access; any number may coexist, never with ExclusiveAccess.
// With the lock file enabled this also holds a shared flock, so readers in
// other processes wait out a mutation in progress.
class SharedAccess {
public:
    SharedAccess(SharedAccess&&) = default;
    SharedAccess& operator=(SharedAccess&&) = default;

private:
    friend class RepositoryContext;
    SharedAccess(std::shared_lock<std::shared_timed_mutex> lock, FileLock file_lock)
        : lock_(std::move(lock)), file_lock_(std::move(file_lock)) {}

    std::shared_lock<std::shared_timed_mutex> lock_;
    FileLock file_lock_;
};

// ============================================================================
// Repository Context
// ============================================================================

/**
 * @brief Explicit handle to one repository: root path, configuration and lock
 *
 * Every component (IndexStore, StorageManager, Manager) is constructed with
 * the context it operates on; there is no process-wide instance.
 */
class RepositoryContext {
public:
    /// Root is made absolute and normalized; the directory must exist
    static Result<std::shared_ptr<RepositoryContext>> open(const std::string& root,
                                                           const RepositoryConfig& config);

    const std::string& root() const { return root_; }
    const RepositoryConfig& config() const { return config_; }

    std::string index_path() const;
    std::string lock_path() const;

    /// Exclusive access with the configured bounded wait; LOCK_TIMEOUT on expiry
    Result<ExclusiveAccess> acquire_exclusive() const;
    Result<ExclusiveAccess> acquire_exclusive(std::chrono::milliseconds timeout) const;

    /// Shared access with the configured bounded wait; LOCK_TIMEOUT on expiry
    Result<SharedAccess> try_acquire_shared() const;
    Result<SharedAccess> try_acquire_shared(std::chrono::milliseconds timeout) const;

    /// Shared access; blocks while a mutation holds exclusive access, in this
    /// process or another
    SharedAccess acquire_shared() const;

private:
    RepositoryContext(std::string root, RepositoryConfig config)
        : root_(std::move(root)), config_(std::move(config)) {}

    std::string root_;
    RepositoryConfig config_;
    mutable std::shared_timed_mutex mutex_;
};

// ============================================================================
// Repository Scan
// ============================================================================

struct ScannedScript {
    ScriptRecord record;
    std::string sha256;
};

struct FileFailure {
    std::string path;
    Error error;
};

struct ScanReport {
    std::vector<ScannedScript> scripts;
    std::vector<FileFailure> skipped;   // malformed or unreadable files
};

// Script files on disk: one level of non-hidden category folders below the
// root, files with the configured extension, sorted by path
std::vector<std::string> list_script_files(const RepositoryContext& context);

// Walk the category folders (one level below the root, hidden folders
// excluded) and parse every file with the configured extension, in sorted
// path order. Per-file failures are collected, never fatal.
// CANCELLED when `cancel` fires between files.
Result<ScanReport> scan_repository(const RepositoryContext& context,
                                   const CancellationToken& cancel = {});

// Index entries for the scanned scripts
std::vector<IndexEntry> to_index_entries(const RepositoryContext& context,
                                         const std::vector<ScannedScript>& scripts);

} // namespace pqm
