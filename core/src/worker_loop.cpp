#include "hive/worker_loop.h"
#include "hive/heartbeat.h"
#include "hive/log.h"

#include <chrono>
#include <cmath>
#include <thread>

namespace hive {

static const char* kComponent = "worker";

const char* tick_result_name(TickResult r) {
    switch (r) {
        case TickResult::WORKED: return "worked";
        case TickResult::IDLE:   return "idle";
        case TickResult::EXIT:   return "exit";
    }
    return "idle";
}

WorkerLoopSettings loop_settings_from(const SwarmConfig& cfg) {
    WorkerLoopSettings s;
    s.recovery_interval_ms = static_cast<int64_t>(cfg.queue.recovery_interval_sec) * 1000;
    s.max_idle_cycles = cfg.queue.max_idle_cycles;
    s.min_claim_reputation = cfg.reputation.min_claim_reputation;
    s.review_pass_score = cfg.reputation.review_pass_score;
    s.peer_reviewers = cfg.reputation.peer_review_agents;
    return s;
}

WorkerLoop::WorkerLoop(WorkerDef def, WorkerLoopSettings settings, WorkerServices services, bool offload)
    : def_(std::move(def)), settings_(std::move(settings)), svc_(std::move(services)), offload_(offload) {}

WorkerLoop::~WorkerLoop() {
    // A pending std::async future joins its thread here.
    if (inflight_.valid()) inflight_.wait();
}

void WorkerLoop::heartbeat(const char* state) {
    std::string err = write_heartbeat(svc_.heartbeat_dir, def_.id, state, svc_.clock());
    if (!err.empty()) log_warn(kComponent, def_.id + ": heartbeat write failed: " + err);
}

void WorkerLoop::maybe_recover() {
    const int64_t now = svc_.clock();
    if (last_recovery_ms_ != 0 && now - last_recovery_ms_ < settings_.recovery_interval_ms) return;
    last_recovery_ms_ = now;
    auto recovered = svc_.queue.recover_stale_tasks();
    if (!recovered.empty()) {
        log_info(kComponent, def_.id + " recovered " + std::to_string(recovered.size()) + " stale task(s)");
    }
}

// Review requests are handled even after a shutdown in the same batch: the
// drain removed them from the mailbox, so nobody else will see them.
bool WorkerLoop::drain_mailbox() {
    bool keep_running = true;
    for (const auto& msg : svc_.mailbox.read_and_drain(def_.id)) {
        if (msg.type == kMsgShutdown) {
            log_info(kComponent, def_.id + " received shutdown from " + msg.from);
            keep_running = false;
        } else if (msg.type == kMsgReviewRequest) {
            handle_review_request(msg);
        } else {
            log_info(kComponent, def_.id + " message from " + msg.from + ": " + msg.content);
        }
    }
    return keep_running;
}

void WorkerLoop::handle_review_request(const MailboxMessage& msg) {
    auto task = svc_.queue.get(msg.content);
    if (!task || task->status != TaskStatus::REVIEW || task->reviewed_by(def_.id)) {
        log_debug(kComponent, def_.id + " skipping stale review request for " + msg.content);
        return;
    }

    heartbeat("reviewing");
    ReviewVerdict verdict;
    try {
        verdict = svc_.reviewer.review(*task, def_);
    } catch (const std::exception& e) {
        log_warn(kComponent, def_.id + " could not review " + task->id + ": " + e.what());
        heartbeat("idle");
        return;
    }

    if (!svc_.queue.add_review(task->id, def_.id, verdict.score, verdict.comment)) {
        heartbeat("idle");
        return;
    }
    if (task->agent_id) svc_.scheduler.on_review(def_.id, *task->agent_id, verdict.score);

    if (verdict.score < settings_.review_pass_score) {
        const std::string reason = "review_score_" + std::to_string(static_cast<int>(std::lround(verdict.score)));
        svc_.queue.complete(task->id, def_.id, reason);
        log_info(kComponent, def_.id + " sent " + task->id + " back for rework (" + reason + ")");
    } else {
        svc_.queue.complete(task->id, def_.id);
        log_info(kComponent, def_.id + " approved " + task->id);
    }
    heartbeat("idle");
}

void WorkerLoop::finish(const Task& task, const std::string& result) {
    if (!svc_.queue.submit_for_review(task.id, def_.id, result)) {
        log_warn(kComponent, def_.id + ": task " + task.id + " is no longer claimed, dropping its result");
        heartbeat("idle");
        return;
    }

    std::vector<std::string> peers;
    for (const auto& p : settings_.peer_reviewers) {
        if (p != def_.id) peers.push_back(p);
    }
    if (peers.empty()) {
        svc_.queue.complete(task.id, def_.id);
    } else {
        for (const auto& p : peers) {
            std::string err = svc_.mailbox.send(p, task.id, kMsgReviewRequest, def_.id);
            if (!err.empty()) log_warn(kComponent, def_.id + ": review request to " + p + " failed: " + err);
        }
    }

    svc_.scheduler.on_task_complete(def_.id, svc_.queue.get(task.id).value_or(task), result);
    heartbeat("idle");
}

void WorkerLoop::fail(const Task& task, const std::string& error) {
    log_warn(kComponent, def_.id + ": task " + task.id + " failed: " + error);
    svc_.queue.fail(task.id, def_.id, error);
    svc_.scheduler.on_error(def_.id, task.id, error);
    heartbeat("idle");
}

void WorkerLoop::collect_inflight() {
    Task task = *inflight_task_;
    inflight_task_.reset();
    std::string result;
    try {
        result = inflight_.get();
    } catch (const std::exception& e) {
        fail(task, e.what());
        return;
    }
    finish(task, result);
}

bool WorkerLoop::drain_for_cancel() {
    if (!inflight_.valid()) return true;
    if (inflight_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
    collect_inflight();
    return true;
}

TickResult WorkerLoop::tick() {
    if (inflight_.valid()) {
        if (inflight_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return TickResult::WORKED;
        collect_inflight();
        return TickResult::WORKED;
    }

    maybe_recover();
    if (!drain_mailbox()) return TickResult::EXIT;

    const double rep = svc_.scheduler.reputation(def_.id);
    if (settings_.min_claim_reputation > 0.0 && rep < settings_.min_claim_reputation) {
        log_debug(kComponent, def_.id + " below claim reputation (" + std::to_string(rep) + ")");
        return TickResult::IDLE;
    }

    auto task = svc_.queue.claim_next(def_.id, rep, def_.role);
    if (!task) {
        idle_cycles_++;
        if (settings_.max_idle_cycles > 0 && idle_cycles_ >= settings_.max_idle_cycles) {
            log_info(kComponent, def_.id + " idle for " + std::to_string(idle_cycles_) + " cycles, exiting");
            return TickResult::EXIT;
        }
        return TickResult::IDLE;
    }
    idle_cycles_ = 0;
    heartbeat("working");
    log_info(kComponent, def_.id + " claimed " + task->id);

    if (offload_) {
        ITaskExecutor& exec = svc_.executor;
        inflight_task_ = *task;
        inflight_ = std::async(std::launch::async,
                               [&exec, t = *task, d = def_] { return exec.execute(t, d); });
        return TickResult::WORKED;
    }

    std::string result;
    try {
        result = svc_.executor.execute(*task, def_);
    } catch (const std::exception& e) {
        fail(*task, e.what());
        return TickResult::WORKED;
    }
    finish(*task, result);
    return TickResult::WORKED;
}

void WorkerLoop::run_blocking(const std::atomic<bool>& stop, int poll_ms) {
    log_info(kComponent, def_.id + " started (role: " + def_.role + ")");
    heartbeat("idle");
    while (!stop.load()) {
        TickResult r = TickResult::IDLE;
        try {
            r = tick();
        } catch (const std::exception& e) {
            log_error(kComponent, def_.id + " tick failed: " + e.what());
        }
        if (r == TickResult::EXIT) break;
        if (r == TickResult::WORKED) continue;
        for (int waited = 0; waited < poll_ms && !stop.load(); waited += 50) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    heartbeat("stopped");
    log_info(kComponent, def_.id + " stopped");
}

} // namespace hive
