#include "pqm/repository.hpp"
#include "pqm/script_record.hpp"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace pqm {

namespace fs = std::filesystem;

namespace {

constexpr const char* kLockFileName = ".pqm.lock";

bool has_extension(const std::string& filename, const std::string& extension) {
    return filename.size() > extension.size() &&
           filename.compare(filename.size() - extension.size(), extension.size(), extension) == 0;
}

} // namespace

// ============================================================================
// Context
// ============================================================================

Result<std::shared_ptr<RepositoryContext>> RepositoryContext::open(const std::string& root,
                                                                   const RepositoryConfig& config) {
    using R = Result<std::shared_ptr<RepositoryContext>>;

    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    if (ec) {
        return R::err(Error(ErrorCode::IO_ERROR, "cannot resolve repository root: " + ec.message(),
                            root));
    }
    std::string normalized = absolute.lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/') normalized.pop_back();

    if (!is_directory(normalized)) {
        return R::err(Error(ErrorCode::NOT_FOUND, "repository root is not a directory", normalized));
    }

    return R::ok(std::shared_ptr<RepositoryContext>(new RepositoryContext(normalized, config)));
}

std::string RepositoryContext::index_path() const {
    return join_path(root_, config_.index_file);
}

std::string RepositoryContext::lock_path() const {
    return join_path(root_, kLockFileName);
}

Result<ExclusiveAccess> RepositoryContext::acquire_exclusive() const {
    return acquire_exclusive(std::chrono::milliseconds(config_.lock_timeout_ms));
}

Result<ExclusiveAccess> RepositoryContext::acquire_exclusive(std::chrono::milliseconds timeout) const {
    auto started = std::chrono::steady_clock::now();

    std::unique_lock<std::shared_timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(timeout)) {
        return Result<ExclusiveAccess>::err(
            Error(ErrorCode::LOCK_TIMEOUT, "repository is busy: exclusive access not granted within " +
                                               std::to_string(timeout.count()) + "ms",
                  root_));
    }

    FileLock file_lock;
    if (config_.use_file_lock) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        auto remaining = timeout > elapsed ? timeout - elapsed : std::chrono::milliseconds(0);

        std::string error;
        switch (file_lock.acquire(lock_path(), remaining, error)) {
            case FileLock::Outcome::Acquired:
                break;
            case FileLock::Outcome::TimedOut:
                return Result<ExclusiveAccess>::err(
                    Error(ErrorCode::LOCK_TIMEOUT, "repository is locked by another process: " + error,
                          lock_path()));
            case FileLock::Outcome::Failed:
                return Result<ExclusiveAccess>::err(Error(ErrorCode::IO_ERROR, error, lock_path()));
        }
    }

    return Result<ExclusiveAccess>::ok(ExclusiveAccess(this, std::move(lock), std::move(file_lock)));
}

Result<SharedAccess> RepositoryContext::try_acquire_shared() const {
    return try_acquire_shared(std::chrono::milliseconds(config_.lock_timeout_ms));
}

Result<SharedAccess> RepositoryContext::try_acquire_shared(std::chrono::milliseconds timeout) const {
    auto started = std::chrono::steady_clock::now();

    std::shared_lock<std::shared_timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(timeout)) {
        return Result<SharedAccess>::err(
            Error(ErrorCode::LOCK_TIMEOUT, "repository is busy: shared access not granted within " +
                                               std::to_string(timeout.count()) + "ms",
                  root_));
    }

    FileLock file_lock;
    if (config_.use_file_lock) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        auto remaining = timeout > elapsed ? timeout - elapsed : std::chrono::milliseconds(0);

        std::string error;
        switch (file_lock.acquire(lock_path(), remaining, error, FileLock::Mode::Shared)) {
            case FileLock::Outcome::Acquired:
                break;
            case FileLock::Outcome::TimedOut:
                return Result<SharedAccess>::err(
                    Error(ErrorCode::LOCK_TIMEOUT, "repository is locked by another process: " + error,
                          lock_path()));
            case FileLock::Outcome::Failed:
                return Result<SharedAccess>::err(Error(ErrorCode::IO_ERROR, error, lock_path()));
        }
    }

    return Result<SharedAccess>::ok(SharedAccess(std::move(lock), std::move(file_lock)));
}

SharedAccess RepositoryContext::acquire_shared() const {
    std::shared_lock<std::shared_timed_mutex> lock(mutex_);

    FileLock file_lock;
    if (config_.use_file_lock) {
        std::string error;
        if (file_lock.acquire_blocking(lock_path(), FileLock::Mode::Shared, error) !=
            FileLock::Outcome::Acquired) {
            // Reads go on under the in-process lock only; writers in other
            // processes are not excluded
            spdlog::warn("Reading {} without the lock file: {}", root_, error);
        }
    }
    return SharedAccess(std::move(lock), std::move(file_lock));
}

// ============================================================================
// Scan
// ============================================================================

std::vector<std::string> list_script_files(const RepositoryContext& context) {
    std::vector<std::string> files;
    const auto& extension = context.config().script_extension;

    for (const auto& folder : list_directory(context.root())) {
        if (folder.empty() || folder[0] == '.') continue;
        std::string folder_path = join_path(context.root(), folder);
        if (!is_directory(folder_path)) continue;

        for (const auto& filename : list_directory(folder_path)) {
            if (filename[0] == '.' || !has_extension(filename, extension)) continue;
            std::string file_path = join_path(folder_path, filename);
            if (is_regular_file(file_path)) files.push_back(file_path);
        }
    }
    return files;
}

Result<ScanReport> scan_repository(const RepositoryContext& context,
                                   const CancellationToken& cancel) {
    ScanReport report;

    for (const auto& file_path : list_script_files(context)) {
        if (cancel.cancelled()) {
            return Result<ScanReport>::err(
                Error(ErrorCode::CANCELLED, "scan cancelled", file_path));
        }

        auto loaded = load_script_file(file_path);
        for (const auto& w : loaded.warnings) {
            spdlog::warn("{}: {}", file_path, w);
        }
        if (!loaded.ok) {
            spdlog::warn("Skipping {}: {}", file_path, loaded.error);
            report.skipped.push_back(
                FileFailure{file_path, Error(loaded.error_code, loaded.error, file_path)});
            continue;
        }

        report.scripts.push_back(ScannedScript{std::move(loaded.record), std::move(loaded.sha256)});
    }

    spdlog::debug("Scanned {}: {} scripts, {} skipped", context.root(), report.scripts.size(),
                  report.skipped.size());
    return Result<ScanReport>::ok(std::move(report));
}

std::vector<IndexEntry> to_index_entries(const RepositoryContext& context,
                                         const std::vector<ScannedScript>& scripts) {
    std::vector<IndexEntry> entries;
    entries.reserve(scripts.size());
    for (const auto& script : scripts) {
        entries.push_back(to_index_entry(script.record, context.root(), script.sha256));
    }
    return entries;
}

} // namespace pqm
