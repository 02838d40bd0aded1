#include "hive/file_lock.h"
#include "hive/config.h"
#include "hive/log.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace hive {

int default_lock_timeout_ms() {
    int v = env_int("HIVE_LOCK_TIMEOUT_MS", 10000);
    return v > 0 ? v : 10000;
}

FileLock::FileLock(std::filesystem::path lock_path) : path_(std::move(lock_path)) {}

FileLock::~FileLock() {
    unlock();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool FileLock::try_lock_for(int timeout_ms, std::string* err) {
    if (held_) return true;

    if (fd_ < 0) {
        std::error_code ec;
        if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path(), ec);
        fd_ = ::open(path_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            if (err) *err = std::string("open ") + path_.string() + ": " + std::strerror(errno);
            return false;
        }
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            held_ = true;
            return true;
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            if (err) *err = std::string("flock ") + path_.string() + ": " + std::strerror(errno);
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void FileLock::unlock() {
    if (!held_ || fd_ < 0) return;
    (void)::flock(fd_, LOCK_UN);
    held_ = false;
}

ScopedFileLock::ScopedFileLock(const std::filesystem::path& lock_path, const std::string& component,
                               int timeout_ms)
    : lock_(lock_path) {
    int attempt = 0;
    while (true) {
        std::string err;
        if (lock_.try_lock_for(timeout_ms, &err)) return;
        if (!err.empty()) {
            throw std::runtime_error("lock unavailable: " + err);
        }
        attempt++;
        log_warn(component, "lock " + lock_path.filename().string() + " busy after " +
                 std::to_string(timeout_ms) + "ms (attempt " + std::to_string(attempt) + "), retrying");
    }
}

} // namespace hive
