#pragma once

#include "hive/runtime.h"

#include <map>
#include <mutex>

#include <sys/types.h>

namespace hive {

// ProcessRuntime: one child process per worker, each in its own process
// group and bound to the parent's lifetime.
//
// stop(): mailbox "shutdown", then up to stop_grace_ms for a clean exit
// (polled every 500 ms), SIGTERM to the group, 3 s more, SIGKILL.
class ProcessRuntime final : public AgentRuntime {
public:
    ProcessRuntime(ArgvBuilder argv_builder, Mailbox* mailbox, int stop_grace_ms = 5000);

    const char* name() const override { return "process"; }

    void start(const WorkerDef& def, const SwarmConfig& config) override;
    bool is_alive(const std::string& id) override;
    std::vector<std::string> agent_ids() const override;
    void stop(const std::string& id) override;
    void stop_all() override;
    void ensure_running(const std::string& id, const SwarmConfig& config) override;
    std::vector<std::string> prune_dead() override;

    std::optional<pid_t> pid_of(const std::string& id) const;

private:
    void stop_children(const std::map<std::string, pid_t>& children);

    ArgvBuilder argv_builder_;
    Mailbox* mailbox_;
    int stop_grace_ms_;

    mutable std::mutex mu_;
    std::map<std::string, pid_t> children_;
};

} // namespace hive
