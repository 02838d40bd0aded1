#include "hive/types.h"

#include <algorithm>
#include <cctype>

namespace hive {

const char* task_status_name(TaskStatus s) {
    switch (s) {
        case TaskStatus::PENDING:   return "pending";
        case TaskStatus::CLAIMED:   return "claimed";
        case TaskStatus::REVIEW:    return "review";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED:    return "failed";
        case TaskStatus::BLOCKED:   return "blocked";
        case TaskStatus::PAUSED:    return "paused";
        case TaskStatus::CANCELLED: return "cancelled";
    }
    return "pending";
}

std::optional<TaskStatus> parse_task_status(const std::string& s) {
    if (s == "pending")   return TaskStatus::PENDING;
    if (s == "claimed")   return TaskStatus::CLAIMED;
    if (s == "review")    return TaskStatus::REVIEW;
    if (s == "completed") return TaskStatus::COMPLETED;
    if (s == "failed")    return TaskStatus::FAILED;
    if (s == "blocked")   return TaskStatus::BLOCKED;
    if (s == "paused")    return TaskStatus::PAUSED;
    if (s == "cancelled") return TaskStatus::CANCELLED;
    return std::nullopt;
}

bool is_terminal(TaskStatus s) {
    return s == TaskStatus::COMPLETED || s == TaskStatus::FAILED || s == TaskStatus::CANCELLED;
}

bool Task::has_flag_prefix(const std::string& prefix) const {
    for (const auto& f : evolution_flags) {
        if (f.starts_with(prefix)) return true;
    }
    return false;
}

bool Task::reviewed_by(const std::string& reviewer) const {
    for (const auto& r : reviews) {
        if (r.reviewer == reviewer) return true;
    }
    return false;
}

double Task::average_review_score() const {
    if (reviews.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& r : reviews) sum += r.score;
    return sum / static_cast<double>(reviews.size());
}

bool is_failure_flag(const std::string& flag) {
    return flag.starts_with("failed:");
}

bool is_rework_flag(const std::string& flag) {
    return flag.starts_with("failed:") || flag.starts_with("timeout_recovered:") ||
           flag.starts_with("rework:");
}

bool task_has_failure(const Task& t) {
    return std::any_of(t.evolution_flags.begin(), t.evolution_flags.end(), is_failure_flag);
}

bool task_has_rework_signal(const Task& t) {
    return std::any_of(t.evolution_flags.begin(), t.evolution_flags.end(), is_rework_flag);
}

std::string error_class(const std::string& error) {
    std::string out;
    for (char c : error) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '_') {
            out.push_back(static_cast<char>(std::tolower(u)));
        } else if (c == '-' || c == '.') {
            out.push_back('_');
        } else if (!out.empty()) {
            break;
        }
        if (out.size() >= 40) break;
    }
    return out.empty() ? "unknown" : out;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool role_matches(const std::string& required_role, const std::string& agent_role,
                  const std::string& agent_id) {
    if (required_role.empty()) return true;
    const std::string key = lower(required_role);
    if (lower(agent_role).find(key) != std::string::npos) return true;
    return !agent_id.empty() && lower(agent_id).find(key) != std::string::npos;
}

} // namespace hive
