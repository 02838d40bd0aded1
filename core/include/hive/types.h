#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hive {

enum class TaskStatus {
    PENDING,
    CLAIMED,
    REVIEW,
    COMPLETED,
    FAILED,
    BLOCKED,
    PAUSED,
    CANCELLED,
};

const char* task_status_name(TaskStatus s);
std::optional<TaskStatus> parse_task_status(const std::string& s);

// completed, failed and cancelled.
bool is_terminal(TaskStatus s);

struct Review {
    std::string reviewer;
    double score{0.0};
    std::string comment;
    int64_t ts{0};
};

struct Task {
    std::string id;
    std::string description;
    TaskStatus status{TaskStatus::PENDING};
    std::optional<std::string> agent_id;
    std::optional<std::string> required_role;
    std::vector<std::string> blocked_by;

    int64_t created_at{0};
    int64_t seq{0};
    std::optional<int64_t> claimed_at;
    std::optional<int64_t> review_submitted_at;
    std::optional<int64_t> completed_at;
    std::optional<double> claim_reputation;

    std::optional<std::string> result;
    std::vector<std::string> evolution_flags;
    std::vector<Review> reviews;
    std::vector<std::string> assignees;
    int retry_count{0};

    bool has_flag_prefix(const std::string& prefix) const;
    bool reviewed_by(const std::string& reviewer) const;
    double average_review_score() const;  // 0 when there are no reviews
};

// Evolution flag vocabulary.
//   failed:<class>               task execution error
//   timeout_recovered:<status>   lease expired and the task was reset
//   rework:<reason>              sent back by an explicit review decision
// The legacy bare "review_failed" tag matches none of these.
bool is_failure_flag(const std::string& flag);
bool is_rework_flag(const std::string& flag);
bool task_has_failure(const Task& t);
bool task_has_rework_signal(const Task& t);

// Normalizes free error text to a flag-safe class: the leading token,
// lowercased, [a-z0-9_] only, at most 40 chars; "unknown" if nothing is left.
std::string error_class(const std::string& error);

// Case-insensitive containment of `required_role` in the worker's role
// description or id. An empty keyword matches every worker.
bool role_matches(const std::string& required_role, const std::string& agent_role,
                  const std::string& agent_id = "");

struct WorkerDef {
    std::string id;
    std::string role;
    std::string model;
    std::vector<std::string> fallback_models;
    std::string exec_cmd;
};

struct MailboxMessage {
    std::string from;
    std::string type;
    std::string content;
    int64_t ts{0};
};

} // namespace hive
