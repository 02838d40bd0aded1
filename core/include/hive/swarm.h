#pragma once

#include "hive/chat.h"
#include "hive/config.h"
#include "hive/evolution.h"
#include "hive/executor.h"
#include "hive/mailbox.h"
#include "hive/reputation_scheduler.h"
#include "hive/runtime.h"
#include "hive/score_aggregator.h"
#include "hive/work_queue.h"

#include <memory>

namespace hive {

// Swarm: every shared service wired from one config.
//
// Executor and reviewer default to CommandExecutor and ChatReviewer (or
// HeuristicReviewer without chat). Replace them before handing services()
// to a worker loop or runtime.
class Swarm {
public:
    explicit Swarm(SwarmConfig config, Clock clock = system_clock_ms());

    Swarm(const Swarm&) = delete;
    Swarm& operator=(const Swarm&) = delete;

    void set_executor(std::unique_ptr<ITaskExecutor> e) { executor_ = std::move(e); }
    void set_reviewer(std::unique_ptr<IReviewer> r) { reviewer_ = std::move(r); }

    WorkerServices services();
    RuntimeDeps runtime_deps();

    const SwarmConfig& config() const { return config_; }
    const StatePaths& paths() const { return paths_; }
    WorkQueue& queue() { return queue_; }
    Mailbox& mailbox() { return mailbox_; }
    ScoreAggregator& scores() { return scores_; }
    EvolutionEngine& evolution() { return evolution_; }
    ReputationScheduler& scheduler() { return scheduler_; }

private:
    SwarmConfig config_;
    StatePaths paths_;
    Clock clock_;
    WorkQueue queue_;
    Mailbox mailbox_;
    ScoreAggregator scores_;
    std::unique_ptr<IChat> chat_;
    EvolutionEngine evolution_;
    ReputationScheduler scheduler_;
    std::unique_ptr<ITaskExecutor> executor_;
    std::unique_ptr<IReviewer> reviewer_;
};

} // namespace hive
