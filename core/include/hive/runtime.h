#pragma once

#include "hive/config.h"
#include "hive/ids.h"
#include "hive/mailbox.h"
#include "hive/work_queue.h"
#include "hive/worker_loop.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hive {

// AgentRuntime: owns worker lifecycles. Claiming is left to the WorkQueue.
class AgentRuntime {
public:
    virtual ~AgentRuntime() = default;

    virtual const char* name() const = 0;

    virtual void start(const WorkerDef& def, const SwarmConfig& config) = 0;
    virtual void start_all(const SwarmConfig& config) {
        for (const auto& w : config.workers) start(w, config);
    }

    virtual bool is_alive(const std::string& id) = 0;
    virtual std::vector<std::string> agent_ids() const = 0;

    virtual void stop(const std::string& id) = 0;
    virtual void stop_all() = 0;

    // Restarts a finished worker. Throws std::runtime_error where the backend
    // cannot do that.
    virtual void ensure_running(const std::string& id, const SwarmConfig& config) = 0;

    // True when at least one worker is known and every one of them is alive.
    virtual bool all_alive() {
        auto ids = agent_ids();
        if (ids.empty()) return false;
        for (const auto& id : ids) {
            if (!is_alive(id)) return false;
        }
        return true;
    }

    // Forgets workers that have finished. Returns their ids.
    virtual std::vector<std::string> prune_dead() = 0;
};

using ArgvBuilder = std::function<std::vector<std::string>(const WorkerDef&)>;

// `<worker_bin> worker --config <config_path> --id <id>`; an empty worker_bin
// means the running executable.
ArgvBuilder default_argv_builder(const std::string& worker_bin, const std::filesystem::path& config_path);

// What the backends need besides the config. Referenced objects must outlive
// the runtime.
struct RuntimeDeps {
    WorkQueue* queue{nullptr};                // lazy: demand and activity
    Mailbox* mailbox{nullptr};                // process: shutdown requests
    std::optional<WorkerServices> services;   // in_process
    ArgvBuilder argv_builder;                 // process; default_argv_builder when empty
    std::filesystem::path heartbeat_dir;      // lazy: activity
    Clock clock{system_clock_ms()};
};

// Builds the backend named by config.runtime.mode. Throws std::runtime_error
// when a dependency the backend needs is missing.
std::unique_ptr<AgentRuntime> make_runtime(const SwarmConfig& config, RuntimeDeps deps);

} // namespace hive
