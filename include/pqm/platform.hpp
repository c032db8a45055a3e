#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pqm {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The temporary lives beside the target and is removed on any failure.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Create a directory (and parents) with fsync on the parent
AtomicWriteResult atomic_create_directory(const std::string& path);

// Read a whole file; nullopt when it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Path of `path` relative to `base`, portable separators
std::string relative_path(const std::string& path, const std::string& base);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// List directory entry names (not full paths), sorted
std::vector<std::string> list_directory(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a file; false if it did not exist or could not be removed
bool remove_file(const std::string& path);

// Remove a directory only when it is empty
bool remove_empty_directory(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// ============================================================================
// Inter-process Lock
// ============================================================================

// Advisory lock on a lock file (flock), exclusive for writers and shared for
// readers. Released on destruction.
class FileLock {
public:
    FileLock() = default;
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    enum class Mode {
        Exclusive,
        Shared
    };

    enum class Outcome {
        Acquired,
        TimedOut,
        Failed
    };

    // Poll for the lock until `timeout` elapses. Creates the lock file if needed.
    Outcome acquire(const std::string& lock_path, std::chrono::milliseconds timeout,
                    std::string& error, Mode mode = Mode::Exclusive);

    // Block until the lock is granted
    Outcome acquire_blocking(const std::string& lock_path, Mode mode, std::string& error);

    void release();

    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};

} // namespace pqm
