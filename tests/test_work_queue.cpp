#include "test_common.h"
#include "hive/work_queue.h"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace hive;

static bool has_flag(const Task& t, const std::string& flag) {
    return std::find(t.evolution_flags.begin(), t.evolution_flags.end(), flag) != t.evolution_flags.end();
}

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "hive_test_work_queue";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    std::atomic<int64_t> now{1'000'000};
    Clock clock = [&] { return now.load(); };
    LeaseSettings lease;
    lease.claim_timeout_ms = 60'000;
    lease.review_timeout_ms = 120'000;

    // Test 1: create -> claim -> review -> complete
    {
        WorkQueue q(dir / "basic.json", lease, clock);
        Task t = q.create("write the summary");
        expect_true(t.status == TaskStatus::PENDING, "new task should be pending");
        expect_eq_ll((long long)t.id.size(), 36, "id should be uuid shaped");
        expect_eq_ll(q.pending_count(), 1, "one pending");

        auto c = q.claim_next("w1", 72.5, "writer");
        expect_true(c && c->id == t.id, "w1 should claim the task");
        expect_true(c->agent_id == std::string("w1"), "agent recorded");
        expect_true(c->claim_reputation && *c->claim_reputation == 72.5, "claim reputation recorded");
        expect_true(!q.claim_next("w2", 70, "writer"), "nothing left to claim");

        expect_true(q.submit_for_review(t.id, "w1", "done"), "submit should succeed");
        expect_true(!q.submit_for_review(t.id, "w1", "again"), "second submit is rejected");
        expect_true(q.add_review(t.id, "w2", 80, "fine"), "review recorded");
        expect_true(!q.add_review(t.id, "w2", 10, "again"), "repeat review from the same reviewer ignored");

        auto done = q.complete(t.id, "w2");
        expect_true(done && done->status == TaskStatus::COMPLETED, "task completed");
        expect_true(done->completed_at.has_value(), "completed_at set");
        auto again = q.complete(t.id, "w2");
        expect_true(again && again->status == TaskStatus::COMPLETED, "complete on a completed task is a no-op");
        expect_eq_ll((long long)q.get(t.id)->reviews.size(), 1, "one review kept");
        expect_true(!q.get("no-such-id"), "unknown id yields nullopt");
        expect_true(!q.cancel("no-such-id"), "unknown id op is a no-op");
    }

    // Test 2: A then B, B blocked by A
    {
        WorkQueue q(dir / "deps.json", lease, clock);
        Task a = q.create("A");
        Task b = q.create("B", {a.id});
        expect_true(b.status == TaskStatus::BLOCKED, "B should start blocked");

        auto first = q.claim_next("w1", 70, "");
        expect_true(first && first->id == a.id, "A claimed first");
        expect_true(!q.claim_next("w2", 70, ""), "B is not claimable while A is open");

        q.submit_for_review(a.id, "w1", "a-result");
        q.complete(a.id, "w1");
        expect_true(q.get(b.id)->status == TaskStatus::PENDING, "completing A promotes B");
        auto second = q.claim_next("w2", 70, "");
        expect_true(second && second->id == b.id, "B claimable after A completes");
    }

    // Test 3: a blocker id that does not exist keeps the task blocked
    {
        WorkQueue q(dir / "missing_dep.json", lease, clock);
        Task t = q.create("orphan", {"does-not-exist"});
        expect_true(!q.claim_next("w1", 70, ""), "missing blocker is unsatisfied");
        expect_true(q.get(t.id)->status == TaskStatus::BLOCKED, "still blocked");
    }

    // Test 4: exactly-once claims under concurrent workers
    {
        WorkQueue q(dir / "race.json", lease, clock);
        const int kTasks = 40;
        for (int i = 0; i < kTasks; i++) q.create("task " + std::to_string(i));

        std::mutex mu;
        std::vector<std::string> claimed;
        std::vector<std::thread> ths;
        for (int w = 0; w < 8; w++) {
            ths.emplace_back([&, w] {
                WorkQueue mine(dir / "race.json", lease, clock);
                while (auto t = mine.claim_next("w" + std::to_string(w), 70, "")) {
                    std::lock_guard<std::mutex> lk(mu);
                    claimed.push_back(t->id);
                }
            });
        }
        for (auto& th : ths) th.join();
        std::set<std::string> unique(claimed.begin(), claimed.end());
        expect_eq_ll((long long)claimed.size(), kTasks, "every task claimed");
        expect_eq_ll((long long)unique.size(), kTasks, "no task claimed twice");
    }

    // Test 5: role keyword matching
    {
        WorkQueue q(dir / "roles.json", lease, clock);
        Task t = q.create("survey papers", {}, std::string("research"));
        expect_true(!q.claim_next("coder-1", 70, "Python coder"), "coder must not take a research task");
        auto r = q.claim_next("r1", 70, "Senior RESEARCH analyst");
        expect_true(r && r->id == t.id, "case-insensitive role match");

        Task t2 = q.create("more research", {}, std::string("research"));
        auto by_id = q.claim_next("research-bot", 70, "generalist");
        expect_true(by_id && by_id->id == t2.id, "keyword may match the worker id");
    }

    // Test 6: stale claim and stale review recovery
    {
        WorkQueue q(dir / "stale.json", lease, clock);
        Task a = q.create("slow");
        Task b = q.create("slow review");
        q.claim_next("w1", 70, "");
        q.claim_next("w2", 70, "");
        q.submit_for_review(b.id, "w2", "r");

        now += 61'000;
        auto rec = q.recover_stale_tasks();
        expect_eq_ll((long long)rec.size(), 1, "only the claim lease has expired");
        Task ra = *q.get(a.id);
        expect_true(ra.status == TaskStatus::PENDING, "recovered claim is pending");
        expect_true(!ra.agent_id, "agent cleared");
        expect_true(has_flag(ra, "timeout_recovered:claimed"), "recovery flag");
        expect_eq_ll(ra.retry_count, 1, "retry counted");
        expect_true(ra.assignees.size() == 1 && ra.assignees[0] == "w1", "assignee history kept");

        now += 60'000;
        rec = q.recover_stale_tasks();
        expect_eq_ll((long long)rec.size(), 1, "review lease expired");
        Task rb = *q.get(b.id);
        expect_true(rb.status == TaskStatus::PENDING, "stale review is pending again");
        expect_true(has_flag(rb, "timeout_recovered:review"), "review recovery flag");
        expect_true(q.recover_stale_tasks().empty(), "nothing more to recover");
    }

    // Test 7: rework sends the task back unassigned
    {
        WorkQueue q(dir / "rework.json", lease, clock);
        Task t = q.create("draft");
        q.claim_next("w1", 70, "");
        q.submit_for_review(t.id, "w1", "weak");
        q.add_review(t.id, "w2", 30, "missing detail");
        auto r = q.complete(t.id, "w2", std::string("review_score_30"));
        expect_true(r && r->status == TaskStatus::PENDING, "rework -> pending");
        expect_true(!r->agent_id, "rework clears the agent");
        expect_true(r->reviews.empty(), "rework clears reviews for the next round");
        expect_true(has_flag(*r, "rework:review_score_30"), "rework flag");
        expect_eq_ll(r->retry_count, 1, "rework counts as a retry");
        auto again = q.claim_next("w3", 70, "");
        expect_true(again && again->id == t.id, "reworked task is claimable again");
        expect_eq_ll((long long)again->assignees.size(), 2, "both claimers recorded");
    }

    // Test 8: fail, cancel, pause, resume, retry, clear
    {
        WorkQueue q(dir / "ops.json", lease, clock);
        Task a = q.create("a");
        Task b = q.create("b");
        Task c = q.create("c");

        expect_true(q.pause(a.id), "pause pending");
        auto claimed = q.claim_next("w1", 70, "");
        expect_true(claimed && claimed->id == b.id, "paused task is skipped");
        expect_true(!q.pause(b.id), "claimed task cannot be paused");
        expect_true(q.resume(a.id), "resume paused");
        expect_true(q.get(a.id)->status == TaskStatus::PENDING, "resumed task is pending");

        auto f = q.fail(b.id, "w1", "Timeout: exec_cmd exceeded");
        expect_true(f && f->status == TaskStatus::FAILED, "fail");
        expect_true(has_flag(*f, "failed:timeout"), "failure flag carries the error class");
        expect_true(q.retry(b.id), "retry failed task");
        Task rb = *q.get(b.id);
        expect_true(rb.status == TaskStatus::PENDING && !rb.agent_id, "retried task is pending and unassigned");

        expect_true(q.cancel(c.id), "cancel pending");
        expect_true(!q.cancel(c.id), "cancel is not repeatable");
        expect_true(q.retry(c.id), "retry cancelled task");

        q.claim_next("w1", 70, "");
        expect_eq_ll(q.clear(), -1, "clear refuses while a task is claimed");
        expect_eq_ll((long long)q.list().size(), 3, "nothing removed");
        expect_eq_ll(q.cancel_all(), 3, "cancel_all cancels every non-terminal task");
        expect_eq_ll(q.clear(), 3, "clear removes all");
        expect_eq_ll((long long)q.list().size(), 0, "queue empty");
    }

    // Test 9: history is most recent first and limited
    {
        WorkQueue q(dir / "history.json", lease, clock);
        std::vector<std::string> ids;
        for (int i = 0; i < 5; i++) {
            now += 1000;
            ids.push_back(q.create("h" + std::to_string(i)).id);
        }
        for (int i = 0; i < 5; i++) q.claim_next("w1", 70, "");
        auto h = q.history("w1", 3);
        expect_eq_ll((long long)h.size(), 3, "history limited");
        expect_true(h[0].id == ids[4] && h[2].id == ids[2], "newest first");
        expect_true(q.history("nobody").empty(), "no history for an unknown agent");
        expect_eq_ll((long long)q.list_by_agent("w1").size(), 5, "list_by_agent");
    }

    // Test 10: a corrupt document is moved aside
    {
        fs::path p = dir / "corrupt.json";
        { std::ofstream(p) << "{not json"; }
        WorkQueue q(p, lease, clock);
        expect_true(q.list().empty(), "corrupt queue reads as empty");
        Task t = q.create("fresh");
        expect_true(q.get(t.id).has_value(), "queue usable after corruption");
        bool aside = false;
        for (const auto& e : fs::directory_iterator(dir)) {
            if (e.path().filename().string().rfind("corrupt.json.corrupt.", 0) == 0) aside = true;
        }
        expect_true(aside, "corrupt file kept for inspection");
    }

    // Test 11: a worker whose lease expired cannot touch the reclaimed task
    {
        WorkQueue q(dir / "lease_lost.json", lease, clock);
        Task t = q.create("long job");
        q.claim_next("w1", 70, "");
        now += 61'000;
        expect_eq_ll((long long)q.recover_stale_tasks().size(), 1, "w1's claim recovered");
        auto w2 = q.claim_next("w2", 70, "");
        expect_true(w2 && w2->id == t.id, "w2 reclaims the task");

        expect_true(!q.submit_for_review(t.id, "w1", "stale"), "late submit from w1 rejected");
        expect_true(!q.fail(t.id, "w1", "crash: late"), "late fail from w1 rejected");
        expect_true(!q.complete(t.id, "w1"), "late complete from w1 rejected");
        Task held = *q.get(t.id);
        expect_true(held.status == TaskStatus::CLAIMED, "task still claimed");
        expect_true(held.agent_id == std::string("w2"), "w2 still holds it");
        expect_true(!held.result, "no stale result stored");

        expect_true(q.submit_for_review(t.id, "w2", "fresh"), "holder submits");
        expect_true(!q.complete(t.id, "w3"), "a peer that has not reviewed cannot complete");
        q.add_review(t.id, "w3", 90, "ok");
        auto done = q.complete(t.id, "w3");
        expect_true(done && done->status == TaskStatus::COMPLETED, "reviewer completes");
        expect_true(done->result == std::string("fresh"), "holder's result kept");
    }

    // Test 12: results of a task tree
    {
        WorkQueue q(dir / "results.json", lease, clock);
        auto finish = [&](const std::string& agent, const std::string& result) {
            auto t = q.claim_next(agent, 70, "");
            q.submit_for_review(t->id, agent, result);
            q.complete(t->id, agent);
        };
        Task plan = q.create("plan the feature");
        Task impl = q.create("implement it", {plan.id});
        Task docs = q.create("document it", {impl.id});
        Task other = q.create("unrelated");

        expect_true(q.collect_results("no-such-id").empty(), "unknown root");
        finish("planner-1", "plan output");
        expect_true(q.collect_results(plan.id) == "[agent:planner-1]\nplan output",
                    "planner output when nothing else finished");

        finish("coder", "code output here");
        finish("writer", "docs output");
        finish("coder", "unrelated output");
        std::string all = q.collect_results(plan.id);
        expect_true(all == "[agent:coder]\ncode output here\n\n---\n\n[agent:writer]\ndocs output",
                    "worker results in creation order, planner dropped");
        expect_true(all.find("unrelated") == std::string::npos, "tasks outside the tree excluded");
        expect_true(q.collect_results(docs.id) == "[agent:writer]\ndocs output", "subtree only");
        expect_true(q.get(other.id)->status == TaskStatus::COMPLETED, "unrelated task done");
    }

    fs::remove_all(dir, ec);
    std::cout << "test_work_queue: ALL PASSED\n";
    return 0;
}
