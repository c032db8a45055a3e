#include "pqm/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace pqm {

namespace fs = std::filesystem;

namespace {

// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Temporary name beside the target; hidden so repository scans skip it
std::string make_temp_filename(const std::string& path) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    fs::path p(path);
    return (p.parent_path() / ("." + p.filename().string() + ".tmp." + suffix)).string();
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    // temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    size_t total = 0;
    while (total < content.size()) {
        ssize_t written = write(fd, content.data() + total, content.size() - total);
        if (written < 0) {
            if (errno == EINTR) continue;
            std::string reason = strerror(errno);
            close(fd);
            unlink(temp_path.c_str());
            result.error = "failed to write content: " + reason;
            return result;
        }
        total += static_cast<size_t>(written);
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        std::string reason = strerror(errno);
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + reason;
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

AtomicWriteResult atomic_create_directory(const std::string& path) {
    AtomicWriteResult result;

    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }

    std::string parent = get_parent_directory(path);
    if (!parent.empty()) {
        fsync_directory(parent);
    }

    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

std::string relative_path(const std::string& path, const std::string& base) {
    fs::path rel = fs::path(path).lexically_relative(fs::path(base));
    if (rel.empty()) return to_portable_path(path);
    return to_portable_path(rel.generic_string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}

bool remove_empty_directory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec) || !fs::is_empty(path, ec)) return false;
    return fs::remove(path, ec) && !ec;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

} // namespace pqm
