#include "hive/runtime.h"
#include "hive/runtime_inproc.h"
#include "hive/runtime_lazy.h"
#include "hive/runtime_process.h"

#include <stdexcept>

namespace hive {

static std::unique_ptr<AgentRuntime> make_backend(RuntimeMode mode, const SwarmConfig& config,
                                                  RuntimeDeps& deps) {
    switch (mode) {
        case RuntimeMode::PROCESS: {
            ArgvBuilder argv = deps.argv_builder
                ? deps.argv_builder
                : default_argv_builder(config.runtime.worker_bin, config.path);
            return std::make_unique<ProcessRuntime>(std::move(argv), deps.mailbox, config.runtime.stop_grace_ms);
        }
        case RuntimeMode::IN_PROCESS:
            if (!deps.services) throw std::runtime_error("in_process runtime needs worker services");
            return std::make_unique<CooperativeRuntime>(*deps.services, config.queue.poll_interval_ms);
        case RuntimeMode::LAZY: {
            if (config.runtime.delegate == RuntimeMode::LAZY) {
                throw std::runtime_error("lazy runtime cannot delegate to itself");
            }
            if (!deps.queue) throw std::runtime_error("lazy runtime needs the work queue");
            auto delegate = make_backend(config.runtime.delegate, config, deps);
            return std::make_unique<LazyRuntime>(
                std::move(delegate), config.runtime, *deps.queue, deps.heartbeat_dir, deps.clock,
                static_cast<int64_t>(config.queue.recovery_interval_sec) * 1000);
        }
    }
    throw std::runtime_error("unknown runtime mode");
}

std::unique_ptr<AgentRuntime> make_runtime(const SwarmConfig& config, RuntimeDeps deps) {
    return make_backend(config.runtime.mode, config, deps);
}

} // namespace hive
