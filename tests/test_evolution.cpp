#include "test_common.h"
#include "hive/evolution.h"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

using namespace hive;
namespace fs = std::filesystem;

static const char* kConfigJson = R"({
  "default_fallback_model": "small",
  "workers": [
    {"id": "w1", "role": "coder", "model": "base", "fallback_models": ["alt"]},
    {"id": "w2", "role": "writer", "model": "base"},
    {"id": "w3", "role": "analyst", "model": "base"}
  ]
})";

static SwarmConfig make_config(const fs::path& dir, bool with_default_fallback = true) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    {
        std::ofstream f(dir / "hive.json");
        f << kConfigJson;
    }
    SwarmConfig cfg = load_config(dir / "hive.json");
    if (!with_default_fallback) cfg.default_fallback_model.clear();
    return cfg;
}

static void add_history(WorkQueue& q, const std::string& agent, int ok, int failed) {
    for (int i = 0; i < ok + failed; i++) {
        Task t = q.create("job " + std::to_string(i));
        q.claim_next(agent, 70, "");
        if (i < failed) {
            q.fail(t.id, agent, "crash: exit 1");
        } else {
            q.submit_for_review(t.id, agent, "result");
            q.complete(t.id, agent);
        }
    }
}

static void push(ScoreAggregator& s, const std::string& agent, Dimension d, double signal, int times) {
    for (int i = 0; i < times; i++) s.update(agent, d, signal);
}

static bool has(const std::vector<std::string>& v, const std::string& x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

static size_t count_of(const std::string& text, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) n++;
    return n;
}

class FixedChat final : public IChat {
public:
    explicit FixedChat(bool ok) : ok_(ok) {}
    ChatResult chat(const std::vector<ChatMessage>&, const std::string&) override {
        ChatResult r;
        if (ok_) r.text = "  The worker misreads multi-step tasks.\n";
        else r.error = "offline";
        return r;
    }
    std::string name() const override { return "fixed"; }

private:
    bool ok_;
};

int main() {
    const fs::path base = fs::temp_directory_path() / "hive_test_evolution";
    int64_t now = 1'700'000'000'000;
    Clock clock = [&] { return now; };

    // Test 1: the legacy bare review_failed tag is not a rework signal
    {
        SwarmConfig cfg = make_config(base / "legacy");
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);

        add_history(q, "w1", 6, 0);
        for (const auto& t : q.history("w1")) q.flag(t.id, "review_failed");

        expect_true(!is_rework_flag("review_failed"), "bare review_failed is not a rework flag");
        expect_true(is_rework_flag("rework:review_score_20"), "rework: prefix is");
        expect_true(is_rework_flag("timeout_recovered:claimed"), "timeout recovery is");
        expect_true(is_rework_flag("failed:crash") && is_failure_flag("failed:crash"), "failure counts as both");

        EvolutionPlan plan = evo.diagnose("w1");
        expect_true(!has(plan.patterns, "frequent_rework"), "review_failed must not count as rework");
        expect_true(!has(plan.patterns, "high_failure_rate"), "nor as failure");
        expect_true(plan.patterns.empty(), "healthy history has no patterns");
        expect_true(plan.path == EvolutionPath::PROMPT, "prompt path by default");
        expect_true(plan.confidence == 0.5, "low confidence without patterns");
    }

    // Test 2: prompt path, dedup and cooldown
    {
        SwarmConfig cfg = make_config(base / "prompt");
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);
        add_history(q, "w1", 2, 3);

        expect_true(!evo.maybe_trigger("w1", ThresholdStatus::WARNING), "warning only logs");
        expect_true(!evo.maybe_trigger("w1", ThresholdStatus::WATCH), "watch does nothing");
        expect_true(evo.marker_state("w1").empty(), "no marker yet");

        auto plan = evo.maybe_trigger("w1", ThresholdStatus::EVOLVE);
        expect_true(plan.has_value(), "evolve executes a plan");
        expect_true(has(plan->patterns, "high_failure_rate") && has(plan->patterns, "frequent_rework"),
                    "3 of 5 failed is both patterns");
        expect_true(plan->confidence == 0.75, "two patterns raise confidence");
        expect_true(plan->path == EvolutionPath::PROMPT, "no stagnation means prompt path");
        expect_true(plan->root_cause_source == "heuristic", "no chat configured");

        std::string text = evo.override_text("w1");
        expect_true(text.find("## Evolution Override (" + utc_date(now) + ")") != std::string::npos, "dated header");
        expect_eq_ll((long long)count_of(text, "\n- "), 2, "one line per constraint");
        expect_true(evo.marker_state("w1") == kMarkerApplied, "applied marker");
        expect_true(evo.is_pending("w1"), "applied counts as pending during cooldown");
        expect_true(!evo.maybe_trigger("w1", ThresholdStatus::EVOLVE), "second trigger deduplicated");

        now += 601'000;
        expect_true(!evo.is_pending("w1"), "cooldown over");
        auto again = evo.maybe_trigger("w1", ThresholdStatus::EVOLVE);
        expect_true(again.has_value(), "triggers again after cooldown");
        expect_true(evo.override_text("w1") == text, "identical constraints are not appended twice");

        AuditLog log(paths.evolution_log());
        auto lines = log.tail(10);
        expect_eq_ll((long long)lines.size(), 2, "each plan logged");
        expect_true(lines[0].find("\"path\":\"prompt\"") != std::string::npos, "plan path logged");

        evo.on_recovered("w1");
        expect_true(evo.override_text("w1").empty(), "recovery clears overrides");
        expect_true(evo.marker_state("w1").empty(), "recovery clears the applied marker");
        expect_true(!evo.clear_overrides("w1"), "clearing twice is a no-op");
    }

    // Test 3: at most three override blocks, newest kept
    {
        SwarmConfig cfg = make_config(base / "cap");
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);

        auto step = [&] {
            now += 601'000;
            auto p = evo.maybe_trigger("w3", ThresholdStatus::EVOLVE);
            expect_true(p && p->path == EvolutionPath::PROMPT, "prompt remediation expected");
            return *p;
        };

        EvolutionPlan p1 = step();
        expect_true(p1.patterns.empty() && p1.prompt_additions.size() == 1, "generic constraint");
        push(s, "w3", Dimension::OUTPUT_QUALITY, 0, 2);
        step();
        push(s, "w3", Dimension::CONSISTENCY, 0, 2);
        step();
        push(s, "w3", Dimension::OUTPUT_QUALITY, 100, 2);
        push(s, "w3", Dimension::CONSISTENCY, 100, 2);
        push(s, "w3", Dimension::IMPROVEMENT_RATE, 0, 2);
        EvolutionPlan p4 = step();
        expect_true(p4.patterns == std::vector<std::string>{"not_improving"}, "single stagnation pattern");

        std::string text = evo.override_text("w3");
        expect_eq_ll((long long)count_of(text, kOverrideHeader), 3, "capped at three blocks");
        expect_true(text.find(p1.prompt_additions[0]) == std::string::npos, "oldest block dropped");
        expect_true(text.find(p4.prompt_additions[0]) != std::string::npos, "newest block kept");
    }

    // Test 4: model path and operator confirmation
    {
        SwarmConfig cfg = make_config(base / "model");
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);
        add_history(q, "w1", 1, 4);
        push(s, "w1", Dimension::IMPROVEMENT_RATE, 0, 2);

        auto plan = evo.maybe_trigger("w1", ThresholdStatus::EVOLVE);
        expect_true(plan && plan->path == EvolutionPath::MODEL, "stagnation with a fallback picks the model path");
        expect_true(plan->target_model == "alt", "first differing fallback model");
        auto swap = evo.pending_swap("w1");
        expect_true(swap && swap->new_model == "alt" && swap->old_model == "base", "swap recorded");
        expect_true(evo.marker_state("w1") == kMarkerAwaitingConfirmation, "awaiting confirmation");
        expect_true(!evo.maybe_trigger("w1", ThresholdStatus::EVOLVE), "no second plan while awaiting");
        expect_true(!evo.apply_model_swap("w2").empty(), "no swap pending for w2");

        expect_true(evo.apply_model_swap("w1").empty(), "swap applies");
        expect_true(evo.current_model("w1") == "alt", "in-memory model updated");
        expect_true(load_config(cfg.path).find_worker("w1")->model == "alt", "config file rewritten");
        expect_true(!evo.pending_swap("w1"), "swap consumed");
        expect_true(evo.marker_state("w1").empty(), "marker cleared");

        // "alt" is now current, so the configured default is next.
        EvolutionPlan next = evo.diagnose("w1");
        expect_true(next.path == EvolutionPath::MODEL && next.target_model == "small", "falls back to the default model");

        evo.maybe_trigger("w1", ThresholdStatus::EVOLVE);
        expect_true(evo.discard_model_swap("w1"), "discard pending swap");
        expect_true(!evo.pending_swap("w1") && evo.marker_state("w1").empty(), "discard clears swap and marker");
        expect_true(!evo.discard_model_swap("w1"), "nothing left to discard");
    }

    // Test 5: role path and voting
    {
        SwarmConfig cfg = make_config(base / "role", /*with_default_fallback=*/false);
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);
        add_history(q, "w2", 1, 4);
        push(s, "w2", Dimension::IMPROVEMENT_RATE, 0, 2);

        expect_true(evo.cast_vote("w2", "w1", true).status == VoteStatus::NO_PENDING_VOTE, "no vote yet");

        auto plan = evo.maybe_trigger("w2", ThresholdStatus::EVOLVE);
        expect_true(plan && plan->path == EvolutionPath::ROLE, "stagnation without a fallback picks the role path");
        expect_true(!plan->role_proposal.empty(), "proposal text");
        expect_eq_ll((long long)evo.pending_votes().size(), 1, "vote open");
        expect_true(evo.marker_state("w2") == kMarkerAwaitingVote, "awaiting vote");

        expect_true(evo.cast_vote("w2", "outsider", true).status == VoteStatus::NOT_A_TEAMMATE, "outsiders rejected");
        VoteOutcome v1 = evo.cast_vote("w2", "w1", true);
        expect_true(v1.status == VoteStatus::WAITING_FOR_QUORUM, "one of three is below quorum");
        expect_eq_ll(v1.quorum, 2, "quorum is team/2 + 1");
        expect_true(evo.cast_vote("w2", "w1", false).status == VoteStatus::ALREADY_VOTED, "duplicate voter rejected");
        VoteOutcome v2 = evo.cast_vote("w2", "w3", false);
        expect_true(v2.status == VoteStatus::REJECTED, "1 for, 1 against is below 0.6");
        expect_true(evo.pending_votes().empty(), "rejected vote discarded");
        expect_true(evo.marker_state("w2").empty(), "marker cleared on rejection");
        expect_true(evo.override_text("w2").find(kRestructureHeader) == std::string::npos, "no restructure applied");

        now += 1000;
        plan = evo.maybe_trigger("w2", ThresholdStatus::EVOLVE);
        expect_true(plan && plan->path == EvolutionPath::ROLE, "new vote opened");
        expect_true(evo.cast_vote("w2", "w1", true).status == VoteStatus::WAITING_FOR_QUORUM, "first approval");
        VoteOutcome ok = evo.cast_vote("w2", "w2", true);
        expect_true(ok.status == VoteStatus::APPROVED, "two approvals reach quorum and threshold");
        expect_true(evo.override_text("w2").find(kRestructureHeader) != std::string::npos, "restructure block appended");
        expect_true(evo.override_text("w2").find("writer") != std::string::npos, "block names the role");
        expect_true(evo.marker_state("w2").empty(), "marker cleared on approval");
    }

    // Test 6: role path once the override file is full
    {
        SwarmConfig cfg = make_config(base / "exhausted");
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);
        fs::create_directories(paths.overrides());
        {
            std::ofstream f(paths.overrides() / "w3.md");
            for (int i = 0; i < 3; i++) f << kOverrideHeader << " (2024-01-0" << i + 1 << ")\n- rule " << i << "\n\n";
        }
        add_history(q, "w3", 2, 3);
        EvolutionPlan plan = evo.diagnose("w3");
        expect_true(plan.path == EvolutionPath::ROLE, "full override file escalates failures to the role path");
    }

    // Test 7: chat summary with silent fallback
    {
        SwarmConfig cfg = make_config(base / "chat");
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        add_history(q, "w1", 1, 2);

        FixedChat good(true);
        EvolutionEngine with_chat(cfg, q, s, &good, clock);
        EvolutionPlan p = with_chat.diagnose("w1");
        expect_true(p.root_cause_source == "chat", "chat summary used");
        expect_true(p.root_cause == "The worker misreads multi-step tasks.", "summary trimmed");

        FixedChat bad(false);
        EvolutionEngine broken(cfg, q, s, &bad, clock);
        EvolutionPlan h = broken.diagnose("w1");
        expect_true(h.root_cause_source == "heuristic" && !h.root_cause.empty(), "heuristic kept on chat failure");
    }

    // Test 8: a pending marker left by a dead trigger expires
    {
        SwarmConfig cfg = make_config(base / "abandoned");
        cfg.chat.timeout_ms = 1000;
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);
        add_history(q, "w1", 2, 3);
        expect_eq_ll(evo.pending_marker_ttl_ms(), 301'000, "chat timeout plus margin");

        fs::create_directories(paths.evolution_pending());
        {
            std::ofstream f(paths.evolution_pending() / "w1.json");
            f << R"({"agent_id": "w1", "path": "prompt", "state": "pending", "updated_at": )" << now << "}\n";
        }
        expect_true(!evo.maybe_trigger("w1", ThresholdStatus::EVOLVE), "fresh pending marker blocks");
        now += 200'000;
        expect_true(evo.is_pending("w1"), "still inside the bound");

        now += 102'000;
        expect_true(!evo.is_pending("w1"), "old pending marker is abandoned");
        auto plan = evo.maybe_trigger("w1", ThresholdStatus::EVOLVE);
        expect_true(plan.has_value(), "worker diagnosed again");
        expect_true(evo.marker_state("w1") == kMarkerApplied, "marker replaced");
    }

    // Test 9: a failing diagnosis releases the marker
    {
        SwarmConfig cfg = make_config(base / "throws");
        StatePaths paths(cfg.state_dir);
        WorkQueue q(paths.tasks(), {}, clock);
        ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
        EvolutionEngine evo(cfg, q, s, nullptr, clock);
        add_history(q, "w1", 2, 3);

        // A directory where the queue lock belongs makes every queue read throw.
        fs::path lock = paths.tasks();
        lock += ".lock";
        fs::remove(lock);
        fs::create_directory(lock);
        expect_true(!evo.maybe_trigger("w1", ThresholdStatus::EVOLVE), "no plan when diagnosis throws");
        expect_true(evo.marker_state("w1").empty(), "marker cleared");

        fs::remove(lock);
        expect_true(evo.maybe_trigger("w1", ThresholdStatus::EVOLVE).has_value(), "next trigger proceeds");
    }

    // Test 10: concurrent triggers from separate engines yield one plan
    {
        SwarmConfig cfg = make_config(base / "race");
        StatePaths paths(cfg.state_dir);
        {
            WorkQueue q(paths.tasks(), {}, clock);
            add_history(q, "w1", 2, 3);
        }

        constexpr int kThreads = 8;
        std::atomic<int> plans{0};
        std::atomic<bool> go{false};
        std::vector<std::thread> ths;
        for (int i = 0; i < kThreads; i++) {
            ths.emplace_back([&] {
                WorkQueue q(paths.tasks(), {}, clock);
                ScoreAggregator s(paths.reputation_cache(), paths.score_log(), clock);
                EvolutionEngine evo(cfg, q, s, nullptr, clock);
                while (!go.load()) std::this_thread::yield();
                if (evo.maybe_trigger("w1", ThresholdStatus::EVOLVE)) plans++;
            });
        }
        go.store(true);
        for (auto& th : ths) th.join();

        expect_eq_ll(plans.load(), 1, "exactly one trigger wins");
        AuditLog log(paths.evolution_log());
        auto lines = log.tail(100);
        expect_eq_ll((long long)lines.size(), 1, "one plan line logged");
        expect_true(lines[0].find("plan") != std::string::npos, "the line is the plan");
    }

    std::error_code ec;
    fs::remove_all(base, ec);
    std::cout << "test_evolution: ALL PASSED\n";
    return 0;
}
