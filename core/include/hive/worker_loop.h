#pragma once

#include "hive/config.h"
#include "hive/executor.h"
#include "hive/ids.h"
#include "hive/mailbox.h"
#include "hive/reputation_scheduler.h"
#include "hive/work_queue.h"

#include <atomic>
#include <filesystem>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace hive {

enum class TickResult { WORKED, IDLE, EXIT };

const char* tick_result_name(TickResult r);

// Shared services a worker loop runs against. All referenced objects must
// outlive the loop.
struct WorkerServices {
    WorkQueue& queue;
    Mailbox& mailbox;
    ReputationScheduler& scheduler;
    ITaskExecutor& executor;
    IReviewer& reviewer;
    std::filesystem::path heartbeat_dir;
    Clock clock;
};

struct WorkerLoopSettings {
    int64_t recovery_interval_ms{30 * 1000};
    int max_idle_cycles{0};
    double min_claim_reputation{0.0};
    double review_pass_score{60.0};
    std::vector<std::string> peer_reviewers;
};

WorkerLoopSettings loop_settings_from(const SwarmConfig& cfg);

// WorkerLoop: one worker's claim / execute / review / score cycle.
//
// tick() does one iteration. In offload mode execution runs on a helper
// thread; later ticks poll it and finish the task once it is ready, so the
// caller's thread never blocks on a task.
class WorkerLoop {
public:
    WorkerLoop(WorkerDef def, WorkerLoopSettings settings, WorkerServices services, bool offload = false);
    ~WorkerLoop();

    WorkerLoop(const WorkerLoop&) = delete;
    WorkerLoop& operator=(const WorkerLoop&) = delete;

    TickResult tick();

    // Ticks until EXIT or `stop` is set, sleeping poll_ms while idle.
    // Exceptions from a tick are logged and the next tick retries.
    void run_blocking(const std::atomic<bool>& stop, int poll_ms);

    // Offload mode: an execution is in flight.
    bool busy() const { return inflight_.valid(); }

    // Finishes a ready in-flight execution. True once nothing is in flight.
    bool drain_for_cancel();

    const WorkerDef& def() const { return def_; }

private:
    void maybe_recover();
    bool drain_mailbox();  // false on shutdown
    void handle_review_request(const MailboxMessage& msg);
    void finish(const Task& task, const std::string& result);
    void fail(const Task& task, const std::string& error);
    void collect_inflight();
    void heartbeat(const char* state);

    WorkerDef def_;
    WorkerLoopSettings settings_;
    WorkerServices svc_;
    bool offload_;

    int64_t last_recovery_ms_{0};
    int idle_cycles_{0};

    std::future<std::string> inflight_;
    std::optional<Task> inflight_task_;
};

} // namespace hive
