#include "pqm/platform.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace pqm {

namespace {

constexpr std::chrono::milliseconds kPollInterval{10};

int lock_operation(FileLock::Mode mode) {
    return mode == FileLock::Mode::Shared ? LOCK_SH : LOCK_EX;
}

// Readers of a read-only tree still need the lock file, opened read-only
int open_lock_file(const std::string& lock_path, std::string& error) {
    int fd = open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0 && (errno == EACCES || errno == EROFS)) {
        fd = open(lock_path.c_str(), O_RDONLY | O_CLOEXEC);
    }
    if (fd < 0) {
        error = "failed to open lock file " + lock_path + ": " + strerror(errno);
    }
    return fd;
}

} // namespace

FileLock::~FileLock() {
    release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

FileLock::Outcome FileLock::acquire(const std::string& lock_path,
                                    std::chrono::milliseconds timeout,
                                    std::string& error,
                                    Mode mode) {
    release();

    int fd = open_lock_file(lock_path, error);
    if (fd < 0) return Outcome::Failed;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (flock(fd, lock_operation(mode) | LOCK_NB) == 0) {
            fd_ = fd;
            return Outcome::Acquired;
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            error = "flock failed on " + lock_path + ": " + strerror(errno);
            close(fd);
            return Outcome::Failed;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            error = "timed out waiting for " + lock_path;
            close(fd);
            return Outcome::TimedOut;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

FileLock::Outcome FileLock::acquire_blocking(const std::string& lock_path, Mode mode,
                                             std::string& error) {
    release();

    int fd = open_lock_file(lock_path, error);
    if (fd < 0) return Outcome::Failed;

    while (flock(fd, lock_operation(mode)) != 0) {
        if (errno != EINTR) {
            error = "flock failed on " + lock_path + ": " + strerror(errno);
            close(fd);
            return Outcome::Failed;
        }
    }
    fd_ = fd;
    return Outcome::Acquired;
}

void FileLock::release() {
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
        fd_ = -1;
    }
}

} // namespace pqm
