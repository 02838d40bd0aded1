#pragma once

#include "hive/evolution.h"
#include "hive/score_aggregator.h"
#include "hive/types.h"

#include <string>

namespace hive {

// Output-quality signal for a result text (20..95).
double output_quality_heuristic(const std::string& result);

// ReputationScheduler: turns task events into score updates, then checks the
// worker's threshold. warning/evolve hands off to the evolution engine;
// healthy clears any remediation left from an earlier dip.
class ReputationScheduler {
public:
    ReputationScheduler(ScoreAggregator& scores, EvolutionEngine& evolution)
        : scores_(scores), evolution_(evolution) {}

    void on_task_complete(const std::string& agent_id, const Task& task, const std::string& result);
    void on_error(const std::string& agent_id, const std::string& task_id, const std::string& error);
    void on_review(const std::string& reviewer_id, const std::string& reviewed_id, double score);

    double reputation(const std::string& agent_id) const { return scores_.get(agent_id); }

private:
    void check_threshold(const std::string& agent_id);

    ScoreAggregator& scores_;
    EvolutionEngine& evolution_;
};

} // namespace hive
