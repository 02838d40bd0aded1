#pragma once

#include "hive/runtime.h"

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <thread>

namespace hive {

// LazyRuntime: starts workers on demand and stops them when idle.
//
// Wraps a process or cooperative delegate. start_all() registers every
// configured worker but starts only runtime.always_on. A monitor thread
// calls tick_monitor() every monitor_interval_ms:
//   - a pending task whose required_role no running worker serves starts a
//     registered worker whose role matches
//   - pending tasks without a role start one registered worker when none runs
//   - a worker outside always_on with no activity for idle_shutdown_sec is
//     stopped
// Every recovery_interval_ms the pass also resets stale claims and reviews, so
// a crashed holder cannot leave work stuck while no worker is running.
// Activity is the newest of touch(), the worker's heartbeat file and any
// claimed/review task it holds. Idle decisions use the injected clock.
class LazyRuntime final : public AgentRuntime {
public:
    LazyRuntime(std::unique_ptr<AgentRuntime> delegate, RuntimeSettings settings, WorkQueue& queue,
                std::filesystem::path heartbeat_dir, Clock clock = system_clock_ms(),
                int64_t recovery_interval_ms = 30 * 1000);
    ~LazyRuntime() override;

    const char* name() const override { return "lazy"; }

    void start(const WorkerDef& def, const SwarmConfig& config) override;
    void start_all(const SwarmConfig& config) override;
    bool is_alive(const std::string& id) override;
    std::vector<std::string> agent_ids() const override;
    void stop(const std::string& id) override;
    void stop_all() override;
    void ensure_running(const std::string& id, const SwarmConfig& config) override;
    std::vector<std::string> prune_dead() override;

    // Every registered worker is accounted for even while it sleeps.
    bool all_alive() override;

    void touch(const std::string& id);

    // One demand/idle pass. Returns the number of workers started or stopped.
    int tick_monitor();

    AgentRuntime& delegate() { return *delegate_; }

private:
    void monitor_main();
    bool is_always_on(const std::string& id) const;
    int64_t last_activity(const std::string& id, const std::vector<Task>& tasks) const;
    void maybe_recover();

    std::unique_ptr<AgentRuntime> delegate_;
    RuntimeSettings settings_;
    WorkQueue& queue_;
    std::filesystem::path heartbeat_dir_;
    Clock clock_;
    int64_t recovery_interval_ms_;
    int64_t last_recovery_ms_{0};

    mutable std::mutex mu_;
    std::map<std::string, WorkerDef> registered_;
    std::map<std::string, int64_t> touched_;
    SwarmConfig config_;

    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    bool stopping_{false};
    std::thread monitor_;
};

} // namespace hive
