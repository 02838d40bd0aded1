#include "hive/reputation_scheduler.h"
#include "hive/log.h"

#include <algorithm>

namespace hive {

static const char* kComponent = "scheduler";

double output_quality_heuristic(const std::string& result) {
    size_t b = result.find_first_not_of(" \t\r\n");
    size_t e = result.find_last_not_of(" \t\r\n");
    const size_t trimmed = b == std::string::npos ? 0 : e - b + 1;
    if (trimmed < 10) return 20.0;

    double score = 60.0;
    if (result.size() > 200) score += 10.0;
    if (result.size() > 500) score += 5.0;
    for (const char* marker : {"#", "- ", "```", "1."}) {
        if (result.find(marker) != std::string::npos) {
            score += 10.0;
            break;
        }
    }
    return std::min(score, 95.0);
}

void ReputationScheduler::on_task_complete(const std::string& agent_id, const Task& task,
                                           const std::string& result) {
    const bool reworked = task_has_rework_signal(task);
    scores_.update(agent_id, Dimension::TASK_COMPLETION, reworked ? 70.0 : 100.0, "task " + task.id + " done");
    scores_.update(agent_id, Dimension::OUTPUT_QUALITY, output_quality_heuristic(result), "output heuristic");
    scores_.update(agent_id, Dimension::IMPROVEMENT_RATE, reworked ? 85.0 : 70.0,
                   reworked ? "completed after rework" : "completed");
    check_threshold(agent_id);
}

void ReputationScheduler::on_error(const std::string& agent_id, const std::string& task_id,
                                   const std::string& error) {
    const std::string reason = "task " + task_id + " failed: " + error_class(error);
    scores_.update(agent_id, Dimension::TASK_COMPLETION, 0.0, reason);
    scores_.update(agent_id, Dimension::CONSISTENCY, 30.0, reason);
    check_threshold(agent_id);
}

void ReputationScheduler::on_review(const std::string& reviewer_id, const std::string& reviewed_id,
                                    double score) {
    // Calibrated reviewers avoid extremes.
    double accuracy = 55.0;
    if (score >= 40.0 && score <= 80.0) accuracy = 85.0;
    else if (score >= 20.0 && score <= 90.0) accuracy = 70.0;

    scores_.update(reviewer_id, Dimension::REVIEW_ACCURACY, accuracy, "reviewed " + reviewed_id);
    scores_.update(reviewed_id, Dimension::OUTPUT_QUALITY, score, "peer review by " + reviewer_id);
    check_threshold(reviewer_id);
    if (reviewed_id != reviewer_id) check_threshold(reviewed_id);
}

void ReputationScheduler::check_threshold(const std::string& agent_id) {
    const ThresholdStatus status = scores_.threshold_status(agent_id);
    switch (status) {
        case ThresholdStatus::HEALTHY:
            evolution_.on_recovered(agent_id);
            break;
        case ThresholdStatus::WATCH:
            break;
        case ThresholdStatus::WARNING:
        case ThresholdStatus::EVOLVE:
            if (auto plan = evolution_.maybe_trigger(agent_id, status)) {
                log_info(kComponent, agent_id + " -> " + evolution_path_name(plan->path) + " remediation");
            }
            break;
    }
}

} // namespace hive
