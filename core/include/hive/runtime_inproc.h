#pragma once

#include "hive/runtime.h"
#include "hive/timer_queue.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace hive {

// CooperativeRuntime: every worker runs inside this process on one owned
// event-loop thread.
//
// Each worker is a slot in a due-time queue; the loop pops the next due slot,
// runs one WorkerLoop::tick() and schedules it again (poll_interval_ms when
// idle). Task execution is offloaded, so a tick never blocks on a task.
// stop() cancels a worker and returns once any in-flight execution has
// drained. An exception escaping a tick finishes only that worker.
class CooperativeRuntime final : public AgentRuntime {
public:
    CooperativeRuntime(WorkerServices services, int poll_interval_ms = 1000);
    ~CooperativeRuntime() override;

    const char* name() const override { return "in_process"; }

    void start(const WorkerDef& def, const SwarmConfig& config) override;
    bool is_alive(const std::string& id) override;
    std::vector<std::string> agent_ids() const override;
    void stop(const std::string& id) override;
    void stop_all() override;
    void ensure_running(const std::string& id, const SwarmConfig& config) override;
    std::vector<std::string> prune_dead() override;

private:
    struct Slot {
        WorkerDef def;
        std::unique_ptr<WorkerLoop> loop;
        std::atomic<bool> cancel{false};
        std::atomic<bool> finished{false};
    };

    void loop_main();
    void run_slot(const std::shared_ptr<Slot>& slot);
    void finish_slot(const std::shared_ptr<Slot>& slot, const char* why);
    void wait_finished(const std::vector<std::shared_ptr<Slot>>& slots);

    WorkerServices services_;
    int poll_interval_ms_;

    mutable std::mutex mu_;
    std::condition_variable finished_cv_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;

    TimerQueue<std::shared_ptr<Slot>> timers_;
    std::thread thread_;
};

} // namespace hive
