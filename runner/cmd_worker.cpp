#include "cmd_worker.h"
#include "runner_utils.h"

#include "hive/log.h"
#include "hive/swarm.h"
#include "hive/worker_loop.h"

#include <atomic>
#include <csignal>
#include <iostream>

using namespace hive;

static std::atomic<bool> g_worker_stop{false};

int cmd_worker(int argc, char** argv) {
    g_worker_stop.store(false);
    std::signal(SIGTERM, [](int) { g_worker_stop.store(true); });
    std::signal(SIGINT,  [](int) { g_worker_stop.store(true); });

    auto id = arg_value(argc, argv, 2, "--id");
    if (!id) {
        std::cerr << "usage: hive_cli worker --id <id> [--config <path>]\n";
        return 2;
    }
    auto cfg = load_config_or_report(argc, argv, 2);
    if (!cfg) return 2;
    const WorkerDef* def = cfg->find_worker(*id);
    if (!def) {
        std::cerr << "[ERROR] worker '" << *id << "' is not in the config\n";
        return 2;
    }
    const WorkerDef worker = *def;

    Swarm swarm(*cfg);
    WorkerLoop loop(worker, loop_settings_from(swarm.config()), swarm.services());
    loop.run_blocking(g_worker_stop, swarm.config().queue.poll_interval_ms);
    return 0;
}
