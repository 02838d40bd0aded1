#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace hive {

// Rotation and retention limits for one audit trail.
struct AuditLogPolicy {
    int64_t max_segment_bytes{8 * 1024 * 1024};  // rotate the active file past 8 MB
    int max_segments{5};                          // keep the active file plus 4 rotated
};

// AuditLog: append-only JSONL trail (score updates, evolution plans).
//
// Each append is a single write() of "<json>\n" on an O_APPEND descriptor,
// so lines from several worker processes never interleave. A full segment is
// renamed to <stem>.<epoch_ms>-<seq>.jsonl and a fresh one is opened.
// fsync per append follows HIVE_AUDIT_FSYNC (default off).
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path path);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    void set_policy(const AuditLogPolicy& policy);

    // Returns empty string on success.
    std::string append_json_line(const std::string& json);

    // Last `n` records of the active segment, oldest first.
    std::vector<std::string> tail(size_t n) const;

    // Active segment plus rotated ones, oldest first.
    std::vector<std::filesystem::path> list_segments() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::string open_locked();
    std::string rotate_locked();
    void enforce_retention_locked();

    std::filesystem::path path_;
    int fd_ = -1;
    bool fsync_ = false;
    int64_t current_size_{0};
    AuditLogPolicy policy_;
    mutable std::mutex mu_;
};

} // namespace hive
