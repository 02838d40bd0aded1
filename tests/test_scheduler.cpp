#include "test_common.h"
#include "hive/reputation_scheduler.h"

#include <fstream>

using namespace hive;
namespace fs = std::filesystem;

static SwarmConfig team_config(const fs::path& dir) {
    SwarmConfig cfg;
    cfg.state_dir = dir;
    for (const char* id : {"w1", "w2", "rev"}) {
        WorkerDef w;
        w.id = id;
        w.role = "general";
        w.model = "base";
        cfg.workers.push_back(w);
    }
    return cfg;
}

int main() {
    int64_t now = 1'700'000'000'000;
    Clock clock = [&] { return now; };

    // Test 1: output quality heuristic
    {
        expect_near(output_quality_heuristic(""), 20.0, 1e-9, "empty result");
        expect_near(output_quality_heuristic("   ok   \n"), 20.0, 1e-9, "trimmed under 10 chars");
        expect_near(output_quality_heuristic("The answer is forty two, as computed."), 60.0, 1e-9, "plain baseline");
        expect_near(output_quality_heuristic("Steps:\n- first\n- second"), 70.0, 1e-9, "list marker");
        expect_near(output_quality_heuristic(std::string(250, 'a')), 70.0, 1e-9, "over 200 chars");
        expect_near(output_quality_heuristic("# Report\n" + std::string(600, 'b')), 85.0, 1e-9, "long and structured");
    }

    // Test 2: completion, error and review updates
    {
        fs::path dir = scratch_dir("hive_test_scheduler_updates");
        SwarmConfig cfg = team_config(dir);
        StatePaths paths(dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);
        ReputationScheduler sched(s, evo);

        Task t;
        t.id = "t1";
        sched.on_task_complete("w1", t, "The answer is forty two, as computed.");
        ReputationEntry e = s.get_all("w1");
        expect_near(e.get(Dimension::TASK_COMPLETION), 79.0, 1e-6, "completion signal 100");
        expect_near(e.get(Dimension::OUTPUT_QUALITY), 67.0, 1e-6, "heuristic 60");
        expect_near(sched.reputation("w1"), 71.35, 1e-6, "composite");
        expect_true(evo.marker_state("w1").empty(), "watch band triggers nothing");

        Task reworked;
        reworked.id = "t2";
        reworked.evolution_flags = {"rework:review_score_30"};
        sched.on_task_complete("w2", reworked, "The answer is forty two, as computed.");
        expect_near(s.get_all("w2").get(Dimension::TASK_COMPLETION), 70.0, 1e-6, "rework completes at 70");

        sched.on_error("w2", "t3", "timeout: step took too long");
        e = s.get_all("w2");
        expect_near(e.get(Dimension::TASK_COMPLETION), 49.0, 1e-6, "error drives completion to 0");
        expect_near(e.get(Dimension::CONSISTENCY), 58.0, 1e-6, "error signal 30 on consistency");

        sched.on_review("rev", "w1", 60);
        expect_near(s.get_all("rev").get(Dimension::REVIEW_ACCURACY), 74.5, 1e-6, "calibrated score");
        expect_near(s.get_all("w1").get(Dimension::OUTPUT_QUALITY), 64.9, 1e-6, "reviewed worker gets the score");
        sched.on_review("rev", "w2", 98);
        expect_near(s.get_all("rev").get(Dimension::REVIEW_ACCURACY), 68.65, 1e-6, "extreme score");
        sched.on_review("rev", "w2", 25);
        expect_near(s.get_all("rev").get(Dimension::REVIEW_ACCURACY), 69.055, 0.006, "moderately calibrated");
    }

    // Test 3: repeated failures hand off to evolution, recovery clears it
    {
        fs::path dir = scratch_dir("hive_test_scheduler_evolve");
        SwarmConfig cfg = team_config(dir);
        StatePaths paths(dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);
        ReputationScheduler sched(s, evo);

        for (int i = 0; i < 8; i++) {
            Task t = q.create("job " + std::to_string(i));
            q.claim_next("w1", sched.reputation("w1"), "general");
            q.fail(t.id, "w1", "crash: segfault");
            sched.on_error("w1", t.id, "crash: segfault");
            sched.on_review("rev", "w1", 0);
        }
        expect_true(s.threshold_status("w1") == ThresholdStatus::EVOLVE, "failures reach the evolve band");
        expect_true(evo.marker_state("w1") == kMarkerApplied, "prompt remediation applied");
        expect_true(evo.override_text("w1").find(kOverrideHeader) != std::string::npos, "override written");

        fs::create_directories(paths.overrides());
        {
            std::ofstream f(paths.overrides() / "w2.md");
            f << kOverrideHeader << " (2024-01-01)\n- stale constraint\n";
        }
        Task ok;
        ok.id = "ok";
        for (int i = 0; i < 8; i++) sched.on_task_complete("w2", ok, "# Report\n" + std::string(600, 'b'));
        expect_true(s.threshold_status("w2") == ThresholdStatus::HEALTHY, "good work is healthy");
        expect_true(evo.override_text("w2").empty(), "recovery clears overrides");
    }

    std::cout << "test_scheduler: ALL PASSED\n";
    return 0;
}
