#include "hive/work_queue.h"
#include "hive/file_lock.h"
#include "hive/json_util.h"
#include "hive/log.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace hive {

static const char* kComponent = "work_queue";

json_object* task_to_json(const Task& t) {
    json_object* o = json_object_new_object();
    json::put_string(o, "task_id", t.id);
    json::put_string(o, "description", t.description);
    json::put_string(o, "status", task_status_name(t.status));
    json::put_opt_string(o, "agent_id", t.agent_id);
    json::put_opt_string(o, "required_role", t.required_role);
    json::put_string_array(o, "blocked_by", t.blocked_by);
    json::put_int(o, "created_at", t.created_at);
    json::put_int(o, "seq", t.seq);
    json::put_opt_int(o, "claimed_at", t.claimed_at);
    json::put_opt_int(o, "review_submitted_at", t.review_submitted_at);
    json::put_opt_int(o, "completed_at", t.completed_at);
    if (t.claim_reputation) json::put_double(o, "claim_reputation", *t.claim_reputation);
    json::put_opt_string(o, "result", t.result);
    json::put_string_array(o, "evolution_flags", t.evolution_flags);

    json_object* reviews = json_object_new_array();
    for (const auto& r : t.reviews) {
        json_object* ro = json_object_new_object();
        json::put_string(ro, "reviewer", r.reviewer);
        json::put_double(ro, "score", r.score);
        json::put_string(ro, "comment", r.comment);
        json::put_int(ro, "ts", r.ts);
        json_object_array_add(reviews, ro);
    }
    json_object_object_add(o, "reviews", reviews);

    json::put_string_array(o, "assignees", t.assignees);
    json::put_int(o, "retry_count", t.retry_count);
    return o;
}

Task task_from_json(const std::string& id, json_object* o) {
    Task t;
    t.id = json::get_string(o, "task_id", id);
    t.description = json::get_string(o, "description");
    auto st = parse_task_status(json::get_string(o, "status", "pending"));
    if (!st) {
        log_warn(kComponent, "task " + id + " has unknown status, treating as pending");
    }
    t.status = st.value_or(TaskStatus::PENDING);
    t.agent_id = json::get_opt_string(o, "agent_id");
    t.required_role = json::get_opt_string(o, "required_role");
    t.blocked_by = json::get_string_array(o, "blocked_by");
    t.created_at = json::get_int(o, "created_at");
    t.seq = json::get_int(o, "seq");
    t.claimed_at = json::get_opt_int(o, "claimed_at");
    t.review_submitted_at = json::get_opt_int(o, "review_submitted_at");
    t.completed_at = json::get_opt_int(o, "completed_at");
    if (json::member(o, "claim_reputation")) t.claim_reputation = json::get_double(o, "claim_reputation");
    t.result = json::get_opt_string(o, "result");
    t.evolution_flags = json::get_string_array(o, "evolution_flags");

    json_object* reviews = json::member(o, "reviews");
    if (reviews && json_object_is_type(reviews, json_type_array)) {
        const size_t n = json_object_array_length(reviews);
        for (size_t i = 0; i < n; i++) {
            json_object* ro = json_object_array_get_idx(reviews, i);
            if (!json::is_object(ro)) continue;
            Review r;
            r.reviewer = json::get_string(ro, "reviewer");
            r.score = json::get_double(ro, "score");
            r.comment = json::get_string(ro, "comment");
            r.ts = json::get_int(ro, "ts");
            t.reviews.push_back(std::move(r));
        }
    }

    t.assignees = json::get_string_array(o, "assignees");
    t.retry_count = (int)json::get_int(o, "retry_count");
    return t;
}

WorkQueue::WorkQueue(std::filesystem::path path, LeaseSettings lease, Clock clock)
    : path_(std::move(path)), lease_(lease), clock_(std::move(clock)) {}

std::filesystem::path WorkQueue::lock_path() const {
    auto p = path_;
    p += ".lock";
    return p;
}

std::vector<Task> WorkQueue::load_locked() const {
    std::vector<Task> tasks;
    bool missing = false;
    json::Doc d = json::load_file(path_, &missing);
    if (missing) return tasks;

    if (!d || !json::is_object(d.root)) {
        auto aside = path_;
        aside += ".corrupt." + std::to_string(clock_());
        std::error_code ec;
        std::filesystem::rename(path_, aside, ec);
        log_error(kComponent, "unparsable " + path_.string() + " moved to " + aside.string() +
                  (ec ? " (rename failed: " + ec.message() + ")" : "") + "; starting empty");
        return tasks;
    }

    json_object_iter it;
    json_object_object_foreachC(d.root, it) {
        if (!json::is_object(it.val)) {
            log_warn(kComponent, std::string("skipping non-object task record ") + it.key);
            continue;
        }
        tasks.push_back(task_from_json(it.key, it.val));
    }
    std::sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
        if (a.seq != b.seq) return a.seq < b.seq;
        return a.created_at < b.created_at;
    });
    return tasks;
}

void WorkQueue::store_locked(const std::vector<Task>& tasks) const {
    json::Doc d = json::new_object();
    for (const auto& t : tasks) {
        json_object_object_add(d.root, t.id.c_str(), task_to_json(t));
    }
    std::string err = json::write_atomic(path_, json::dump(d.root, true) + "\n");
    if (!err.empty()) {
        throw std::runtime_error("work_queue: cannot write " + path_.string() + ": " + err);
    }
}

static Task* find_task(std::vector<Task>& tasks, const std::string& id) {
    for (auto& t : tasks) {
        if (t.id == id) return &t;
    }
    return nullptr;
}

static bool blockers_done(const Task& t, const std::unordered_map<std::string, TaskStatus>& status_by_id) {
    for (const auto& dep : t.blocked_by) {
        auto it = status_by_id.find(dep);
        if (it == status_by_id.end() || it->second != TaskStatus::COMPLETED) return false;
    }
    return true;
}

static std::unordered_map<std::string, TaskStatus> status_index(const std::vector<Task>& tasks) {
    std::unordered_map<std::string, TaskStatus> idx;
    for (const auto& t : tasks) idx[t.id] = t.status;
    return idx;
}

// blocked -> pending for every task whose blockers are all completed.
static bool promote_unblocked(std::vector<Task>& tasks) {
    auto idx = status_index(tasks);
    bool changed = false;
    for (auto& t : tasks) {
        if (t.status == TaskStatus::BLOCKED && blockers_done(t, idx)) {
            t.status = TaskStatus::PENDING;
            changed = true;
        }
    }
    return changed;
}

static void release_assignment(Task& t) {
    t.agent_id.reset();
    t.claimed_at.reset();
    t.review_submitted_at.reset();
    t.reviews.clear();
}

Task WorkQueue::create(const std::string& description,
                       const std::vector<std::string>& blocked_by,
                       const std::optional<std::string>& required_role) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();

    Task t;
    t.id = gen_task_id();
    t.description = description;
    t.blocked_by = blocked_by;
    if (required_role && !required_role->empty()) t.required_role = required_role;
    t.status = blocked_by.empty() ? TaskStatus::PENDING : TaskStatus::BLOCKED;
    t.created_at = clock_();
    int64_t max_seq = 0;
    for (const auto& x : tasks) max_seq = std::max(max_seq, x.seq);
    t.seq = max_seq + 1;

    tasks.push_back(t);
    store_locked(tasks);
    log_debug(kComponent, "created " + t.id + " (" + task_status_name(t.status) + ")");
    return t;
}

std::optional<Task> WorkQueue::claim_next(const std::string& agent_id, double reputation_score,
                                          const std::string& agent_role) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    bool changed = promote_unblocked(tasks);
    auto idx = status_index(tasks);

    for (auto& t : tasks) {
        if (t.status != TaskStatus::PENDING) continue;
        if (!blockers_done(t, idx)) continue;
        if (t.required_role && !role_matches(*t.required_role, agent_role, agent_id)) continue;

        t.status = TaskStatus::CLAIMED;
        t.agent_id = agent_id;
        t.claimed_at = clock_();
        t.claim_reputation = reputation_score;
        if (t.assignees.empty() || t.assignees.back() != agent_id) t.assignees.push_back(agent_id);
        store_locked(tasks);
        log_debug(kComponent, agent_id + " claimed " + t.id);
        return t;
    }

    if (changed) store_locked(tasks);
    return std::nullopt;
}

bool WorkQueue::submit_for_review(const std::string& task_id, const std::string& agent_id,
                                  const std::string& result) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t) return false;
    if (t->status != TaskStatus::CLAIMED) {
        log_warn(kComponent, "submit_for_review on " + task_id + " in status " +
                 task_status_name(t->status) + " ignored");
        return false;
    }
    if (t->agent_id != agent_id) {
        log_warn(kComponent, agent_id + " no longer holds " + task_id + ", submit ignored");
        return false;
    }
    t->status = TaskStatus::REVIEW;
    t->result = result;
    t->review_submitted_at = clock_();
    store_locked(tasks);
    return true;
}

bool WorkQueue::add_review(const std::string& task_id, const std::string& reviewer,
                           double score, const std::string& comment) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t) return false;
    if (t->reviewed_by(reviewer)) return false;
    t->reviews.push_back(Review{reviewer, score, comment, clock_()});
    store_locked(tasks);
    return true;
}

std::optional<Task> WorkQueue::complete(const std::string& task_id, const std::string& actor,
                                        const std::optional<std::string>& rework_reason) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t) return std::nullopt;
    if (t->status != TaskStatus::CLAIMED && t->status != TaskStatus::REVIEW) {
        log_debug(kComponent, "complete on " + task_id + " in status " +
                  task_status_name(t->status) + " ignored");
        return *t;
    }
    // The holder may complete; in review so may a peer that reviewed this round.
    const bool holder = t->agent_id == actor;
    const bool reviewer = t->status == TaskStatus::REVIEW && t->reviewed_by(actor);
    if (!holder && !reviewer) {
        log_warn(kComponent, actor + " does not hold " + task_id + ", complete ignored");
        return std::nullopt;
    }

    if (rework_reason) {
        t->status = TaskStatus::PENDING;
        release_assignment(*t);
        t->retry_count += 1;
        t->evolution_flags.push_back("rework:" + *rework_reason);
        Task out = *t;
        store_locked(tasks);
        log_info(kComponent, "sent " + task_id + " back for rework: " + *rework_reason);
        return out;
    }

    t->status = TaskStatus::COMPLETED;
    t->completed_at = clock_();
    Task out = *t;
    promote_unblocked(tasks);
    store_locked(tasks);
    return out;
}

std::optional<Task> WorkQueue::fail(const std::string& task_id, const std::string& agent_id,
                                    const std::string& error) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t) return std::nullopt;
    if (is_terminal(t->status)) return *t;
    if (t->agent_id != agent_id) {
        log_warn(kComponent, agent_id + " no longer holds " + task_id + ", fail ignored");
        return std::nullopt;
    }
    t->status = TaskStatus::FAILED;
    t->evolution_flags.push_back("failed:" + error_class(error));
    Task out = *t;
    store_locked(tasks);
    return out;
}

std::vector<Task> WorkQueue::recover_stale_tasks() {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    const int64_t now = clock_();
    std::vector<Task> recovered;

    for (auto& t : tasks) {
        bool stale = false;
        if (t.status == TaskStatus::CLAIMED) {
            stale = t.claimed_at && (now - *t.claimed_at) > lease_.claim_timeout_ms;
        } else if (t.status == TaskStatus::REVIEW) {
            auto since = t.review_submitted_at ? t.review_submitted_at : t.claimed_at;
            stale = since && (now - *since) > lease_.review_timeout_ms;
        }
        if (!stale) continue;

        const std::string prev = task_status_name(t.status);
        t.status = TaskStatus::PENDING;
        release_assignment(t);
        t.retry_count += 1;
        t.evolution_flags.push_back("timeout_recovered:" + prev);
        recovered.push_back(t);
    }

    if (!recovered.empty()) {
        store_locked(tasks);
        log_warn(kComponent, "recovered " + std::to_string(recovered.size()) + " stale task(s)");
    }
    return recovered;
}

bool WorkQueue::cancel(const std::string& task_id) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t || is_terminal(t->status)) return false;
    t->status = TaskStatus::CANCELLED;
    store_locked(tasks);
    return true;
}

bool WorkQueue::pause(const std::string& task_id) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t) return false;
    if (t->status != TaskStatus::PENDING && t->status != TaskStatus::BLOCKED) return false;
    t->status = TaskStatus::PAUSED;
    store_locked(tasks);
    return true;
}

bool WorkQueue::resume(const std::string& task_id) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t || t->status != TaskStatus::PAUSED) return false;
    t->status = blockers_done(*t, status_index(tasks)) ? TaskStatus::PENDING : TaskStatus::BLOCKED;
    store_locked(tasks);
    return true;
}

bool WorkQueue::retry(const std::string& task_id) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t) return false;
    if (t->status != TaskStatus::FAILED && t->status != TaskStatus::CANCELLED) return false;
    t->status = blockers_done(*t, status_index(tasks)) ? TaskStatus::PENDING : TaskStatus::BLOCKED;
    release_assignment(*t);
    t->completed_at.reset();
    t->result.reset();
    t->retry_count += 1;
    store_locked(tasks);
    return true;
}

int WorkQueue::cancel_all() {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    int n = 0;
    for (auto& t : tasks) {
        if (is_terminal(t.status)) continue;
        t.status = TaskStatus::CANCELLED;
        n++;
    }
    if (n > 0) store_locked(tasks);
    return n;
}

int WorkQueue::clear(bool force) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    if (!force) {
        for (const auto& t : tasks) {
            if (t.status == TaskStatus::CLAIMED || t.status == TaskStatus::REVIEW) return -1;
        }
    }
    int n = (int)tasks.size();
    store_locked({});
    return n;
}

bool WorkQueue::flag(const std::string& task_id, const std::string& tag) {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    Task* t = find_task(tasks, task_id);
    if (!t) return false;
    t->evolution_flags.push_back(tag);
    store_locked(tasks);
    return true;
}

std::optional<Task> WorkQueue::get(const std::string& task_id) const {
    ScopedFileLock lock(lock_path(), kComponent);
    auto tasks = load_locked();
    for (auto& t : tasks) {
        if (t.id == task_id) return t;
    }
    return std::nullopt;
}

std::vector<Task> WorkQueue::list() const {
    ScopedFileLock lock(lock_path(), kComponent);
    return load_locked();
}

std::vector<Task> WorkQueue::list_by_agent(const std::string& agent_id) const {
    std::vector<Task> out;
    for (auto& t : list()) {
        if (t.agent_id && *t.agent_id == agent_id) out.push_back(std::move(t));
    }
    return out;
}

int WorkQueue::pending_count() const {
    int n = 0;
    for (const auto& t : list()) {
        if (t.status == TaskStatus::PENDING) n++;
    }
    return n;
}

std::vector<Task> WorkQueue::history(const std::string& agent_id, size_t last) const {
    std::vector<Task> out;
    for (auto& t : list()) {
        if (std::find(t.assignees.begin(), t.assignees.end(), agent_id) != t.assignees.end()) {
            out.push_back(std::move(t));
        }
    }
    std::sort(out.begin(), out.end(), [](const Task& a, const Task& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.seq > b.seq;
    });
    if (out.size() > last) out.resize(last);
    return out;
}

std::string WorkQueue::collect_results(const std::string& root_task_id) const {
    const auto tasks = list();
    std::set<std::string> tree{root_task_id};
    bool root_found = false;
    // Creation order puts dependents after their blockers, but a resumed or
    // retried chain may not be; iterate until the tree stops growing.
    for (bool grew = true; grew;) {
        grew = false;
        for (const auto& t : tasks) {
            if (t.id == root_task_id) root_found = true;
            if (tree.count(t.id)) continue;
            for (const auto& b : t.blocked_by) {
                if (tree.count(b)) {
                    tree.insert(t.id);
                    grew = true;
                    break;
                }
            }
        }
    }
    if (!root_found) return "";

    std::vector<std::string> workers, planners;
    for (const auto& t : tasks) {
        if (!tree.count(t.id) || t.status != TaskStatus::COMPLETED || !t.result || t.result->empty()) continue;
        std::string agent = t.agent_id.value_or(t.assignees.empty() ? "unknown" : t.assignees.back());
        std::string block = "[agent:" + agent + "]\n" + *t.result;
        if (role_matches("planner", "", agent)) planners.push_back(std::move(block));
        else workers.push_back(std::move(block));
    }
    const auto& chosen = workers.empty() ? planners : workers;
    std::string out;
    for (size_t i = 0; i < chosen.size(); i++) {
        if (i) out += "\n\n---\n\n";
        out += chosen[i];
    }
    return out;
}

} // namespace hive
