#include "hive/audit_log.h"
#include "hive/ids.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <fstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace hive {

static bool audit_fsync_enabled() {
    const char* e = std::getenv("HIVE_AUDIT_FSYNC");
    return e && std::string(e) == "1";
}

AuditLog::AuditLog(std::filesystem::path path) : path_(std::move(path)), fsync_(audit_fsync_enabled()) {}

AuditLog::~AuditLog() {
    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void AuditLog::set_policy(const AuditLogPolicy& policy) {
    std::lock_guard<std::mutex> lk(mu_);
    policy_ = policy;
}

std::string AuditLog::open_locked() {
    if (fd_ >= 0) return "";
    std::error_code ec;
    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) return std::string("create_directories: ") + ec.message();
    }
    fd_ = ::open(path_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) return std::string("open: ") + std::strerror(errno);

    struct stat st{};
    current_size_ = (::fstat(fd_, &st) == 0) ? st.st_size : 0;
    return "";
}

std::string AuditLog::append_json_line(const std::string& json) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string err = open_locked();
    if (!err.empty()) return err;

    if (policy_.max_segment_bytes > 0 && current_size_ >= policy_.max_segment_bytes) {
        // A failed rotation keeps writing to the current segment.
        (void)rotate_locked();
    }

    std::string line = json;
    if (line.empty() || line.back() != '\n') line.push_back('\n');

    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, line.data() + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return std::string("write: ") + std::strerror(errno);
        }
        off += static_cast<size_t>(w);
    }
    current_size_ += static_cast<int64_t>(line.size());

    if (fsync_ && ::fsync(fd_) != 0) {
        return std::string("fsync: ") + std::strerror(errno);
    }
    return "";
}

std::string AuditLog::rotate_locked() {
    if (fd_ < 0) return "";
    ::close(fd_);
    fd_ = -1;

    auto parent = path_.parent_path();
    const std::string base = path_.stem().string() + "." + std::to_string(now_ms());
    std::error_code ec;
    std::filesystem::path rotated;
    for (int seq = 0; seq < 1000; seq++) {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "-%03d.jsonl", seq);
        rotated = parent / (base + suffix);
        if (!std::filesystem::exists(rotated, ec)) break;
    }
    std::filesystem::rename(path_, rotated, ec);
    std::string err = open_locked();
    if (ec) return std::string("rotate rename: ") + ec.message();
    if (!err.empty()) return err;

    enforce_retention_locked();
    return "";
}

std::vector<std::filesystem::path> AuditLog::list_segments() const {
    std::vector<std::filesystem::path> rotated;
    std::filesystem::path active;

    auto parent = path_.parent_path();
    if (parent.empty()) parent = ".";
    const auto stem = path_.stem().string();

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(parent, ec)) {
        if (!entry.is_regular_file()) continue;
        auto fname = entry.path().filename().string();
        if (fname == path_.filename().string()) {
            active = entry.path();
        } else if (fname.starts_with(stem + ".") && fname.ends_with(".jsonl")) {
            rotated.push_back(entry.path());
        }
    }
    std::sort(rotated.begin(), rotated.end());
    if (!active.empty()) rotated.push_back(active);
    return rotated;
}

void AuditLog::enforce_retention_locked() {
    auto segs = list_segments();
    std::error_code ec;
    // The last entry is the active file and is never removed.
    size_t removable = segs.empty() ? 0 : segs.size() - 1;
    size_t i = 0;
    while (policy_.max_segments > 0 && removable > 0 &&
           (removable + 1) > static_cast<size_t>(policy_.max_segments)) {
        std::filesystem::remove(segs[i++], ec);
        removable--;
    }
}

std::vector<std::string> AuditLog::tail(size_t n) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::deque<std::string> keep;
    std::ifstream f(path_);
    std::string line;
    while (std::getline(f, line)) {
        if (line.empty()) continue;
        keep.push_back(line);
        if (keep.size() > n) keep.pop_front();
    }
    return {keep.begin(), keep.end()};
}

} // namespace hive
