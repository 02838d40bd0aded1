#pragma once

#include "hive/ids.h"
#include "hive/types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct json_object;

namespace hive {

struct LeaseSettings {
    int64_t claim_timeout_ms{600 * 1000};
    int64_t review_timeout_ms{1800 * 1000};
};

// WorkQueue: the shared task collection.
//
// Persisted as one JSON object (task id -> task) in `path`. Every operation
// takes the advisory lock `<path>.lock`, reads the whole document, mutates it
// and writes it back atomically, so claims are exclusive across threads and
// processes alike. The object itself holds no task state and may be shared
// freely between threads.
//
// Operations on an unknown task id are no-ops (nullopt / false).
class WorkQueue {
public:
    explicit WorkQueue(std::filesystem::path path, LeaseSettings lease = {},
                       Clock clock = system_clock_ms());

    // New task in `pending`, or `blocked` when blocked_by is non-empty.
    Task create(const std::string& description,
                const std::vector<std::string>& blocked_by = {},
                const std::optional<std::string>& required_role = std::nullopt);

    // Oldest eligible task: pending, every blocker completed, and role match
    // when the task names one. reputation_score is recorded on the task but
    // never affects eligibility.
    std::optional<Task> claim_next(const std::string& agent_id, double reputation_score,
                                   const std::string& agent_role);

    // claimed -> review. False when the task is not claimed, or is claimed by
    // someone other than agent_id (its lease expired and was reclaimed).
    bool submit_for_review(const std::string& task_id, const std::string& agent_id,
                           const std::string& result);

    // Appends a review; a repeat from the same reviewer is ignored.
    bool add_review(const std::string& task_id, const std::string& reviewer,
                    double score, const std::string& comment);

    // claimed/review -> completed. With a rework reason the task goes back to
    // pending instead, unassigned, flagged "rework:<reason>". actor must be
    // the holder, or a reviewer of the current review round; otherwise nullopt.
    std::optional<Task> complete(const std::string& task_id, const std::string& actor,
                                 const std::optional<std::string>& rework_reason = std::nullopt);

    // -> failed, flagged "failed:<error-class>". nullopt when agent_id does not
    // hold the task.
    std::optional<Task> fail(const std::string& task_id, const std::string& agent_id,
                             const std::string& error);

    // Resets claimed/review tasks whose lease expired. Returns them.
    std::vector<Task> recover_stale_tasks();

    bool cancel(const std::string& task_id);
    bool pause(const std::string& task_id);
    bool resume(const std::string& task_id);
    bool retry(const std::string& task_id);
    int cancel_all();

    // Removes every task. Returns -1 (and removes nothing) while tasks are
    // claimed or in review, unless force is set.
    int clear(bool force = false);

    bool flag(const std::string& task_id, const std::string& tag);

    std::optional<Task> get(const std::string& task_id) const;
    std::vector<Task> list() const;                     // creation order
    std::vector<Task> list_by_agent(const std::string& agent_id) const;
    int pending_count() const;

    // Tasks the agent ever claimed, most recent first.
    std::vector<Task> history(const std::string& agent_id, size_t last = 50) const;

    // Results of the completed tasks in root's tree (root plus every task
    // blocked, directly or not, by it), in creation order, each headed
    // "[agent:<id>]" and separated by "\n\n---\n\n". Results from workers
    // whose id contains "planner" are used only when no other worker produced
    // one. "" for an unknown root or a tree without results.
    std::string collect_results(const std::string& root_task_id) const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::vector<Task> load_locked() const;
    void store_locked(const std::vector<Task>& tasks) const;
    std::filesystem::path lock_path() const;

    std::filesystem::path path_;
    LeaseSettings lease_;
    Clock clock_;
};

// Task <-> JSON record.
json_object* task_to_json(const Task& t);
Task task_from_json(const std::string& id, json_object* o);

} // namespace hive
