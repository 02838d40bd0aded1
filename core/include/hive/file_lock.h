#pragma once

#include <filesystem>
#include <string>

namespace hive {

// Default bounded wait for one acquisition attempt, from HIVE_LOCK_TIMEOUT_MS
// (default 10000).
int default_lock_timeout_ms();

// FileLock: exclusive advisory lock (flock) on a dedicated lock file.
//
// Each FileLock opens its own descriptor, so two FileLocks on the same path
// exclude each other across processes and across threads of one process.
// The kernel drops the lock when the holder exits, so a crashed holder never
// leaves a stale lock behind.
class FileLock {
public:
    explicit FileLock(std::filesystem::path lock_path);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Polls for the lock for up to timeout_ms. Returns true once held.
    // On open failure returns false and sets *err.
    bool try_lock_for(int timeout_ms, std::string* err = nullptr);

    void unlock();
    bool held() const { return held_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
    bool held_ = false;
};

// ScopedFileLock: blocks until the lock is held.
//
// Every timeout window that passes without the lock logs a [WARN] line for
// `component` and tries again. Throws std::runtime_error only when the lock
// file itself cannot be created.
class ScopedFileLock {
public:
    ScopedFileLock(const std::filesystem::path& lock_path, const std::string& component,
                   int timeout_ms = default_lock_timeout_ms());
    ~ScopedFileLock() = default;

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

private:
    FileLock lock_;
};

} // namespace hive
