#include "cmd_run.h"
#include "runner_utils.h"

#include "hive/log.h"
#include "hive/runtime.h"
#include "hive/swarm.h"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>

using namespace hive;

static std::atomic<bool> g_run_running{true};

static const char* kComponent = "run";
static constexpr int kSupervisePollMs = 1000;

// Nothing pending, claimed, blocked or in review.
static bool queue_settled(WorkQueue& q) {
    for (const auto& t : q.list()) {
        switch (t.status) {
            case TaskStatus::PENDING:
            case TaskStatus::CLAIMED:
            case TaskStatus::REVIEW:
            case TaskStatus::BLOCKED:
                return false;
            default:
                break;
        }
    }
    return true;
}

int cmd_run(int argc, char** argv) {
    g_run_running.store(true);
    std::signal(SIGTERM, [](int) { g_run_running.store(false); });
    std::signal(SIGINT,  [](int) { g_run_running.store(false); });

    auto cfg = load_config_or_report(argc, argv, 2);
    if (!cfg) return 2;
    if (cfg->workers.empty()) {
        std::cerr << "[ERROR] config has no workers\n";
        return 2;
    }
    const bool until_idle = has_flag(argc, argv, 2, "--until-idle");

    Swarm swarm(*cfg);
    std::unique_ptr<AgentRuntime> runtime;
    try {
        runtime = make_runtime(swarm.config(), swarm.runtime_deps());
        runtime->start_all(swarm.config());
    } catch (const std::exception& e) {
        log_error(kComponent, e.what());
        if (runtime) runtime->stop_all();
        return 1;
    }
    log_info(kComponent, std::string("runtime=") + runtime->name() + " profile=" + profile_name(detect_profile()) +
             " workers=" + std::to_string(swarm.config().workers.size()) +
             " state=" + swarm.config().state_dir.string());

    const bool lazy = swarm.config().runtime.mode == RuntimeMode::LAZY;
    const auto& always_on = swarm.config().runtime.always_on;
    const int64_t recovery_ms = static_cast<int64_t>(swarm.config().queue.recovery_interval_sec) * 1000;
    int64_t last_recovery = 0;

    while (g_run_running.load()) {
        sleep_ms(kSupervisePollMs);
        if (!g_run_running.load()) break;

        // A lazy swarm may have no live worker to run recovery.
        const int64_t now = now_ms();
        if (now - last_recovery >= recovery_ms) {
            last_recovery = now;
            auto recovered = swarm.queue().recover_stale_tasks();
            if (!recovered.empty()) {
                log_info(kComponent, "recovered " + std::to_string(recovered.size()) + " stale task(s)");
            }
        }

        for (const auto& id : runtime->prune_dead()) {
            const WorkerDef* def = swarm.config().find_worker(id);
            if (!def) continue;
            if (lazy && std::find(always_on.begin(), always_on.end(), id) == always_on.end()) {
                log_info(kComponent, id + " exited; it restarts on demand");
                continue;
            }
            log_warn(kComponent, id + " exited unexpectedly, restarting");
            try {
                runtime->start(*def, swarm.config());
            } catch (const std::exception& e) {
                log_error(kComponent, "restart of " + id + " failed: " + e.what());
            }
        }

        if (until_idle && queue_settled(swarm.queue())) {
            log_info(kComponent, "queue settled, shutting down");
            break;
        }
    }

    runtime->stop_all();
    log_info(kComponent, "all workers stopped");
    return 0;
}
