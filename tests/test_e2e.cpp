#include "test_common.h"
#include "hive/runtime.h"
#include "hive/swarm.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

using namespace hive;

// Records execution order; results are long enough to pass heuristic review.
class OrderedExecutor final : public ITaskExecutor {
public:
    std::string execute(const Task& task, const WorkerDef& worker) override {
        {
            std::lock_guard<std::mutex> lk(mu);
            order.push_back(task.description);
        }
        if (task.description == "flaky") throw TaskError("exec_failed", "exit_code=2");
        return "# " + task.description + "\n- produced by " + worker.id + " after checking every requirement";
    }

    std::mutex mu;
    std::vector<std::string> order;
};

static bool wait_until(const std::function<bool()>& pred, int timeout_ms = 10000) {
    for (int waited = 0; waited < timeout_ms; waited += 20) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

int main() {
    const char* json = R"({
      "state_dir": "state",
      "runtime": {"mode": "in_process"},
      "queue": {"poll_interval_ms": 20},
      "reputation": {"peer_review_agents": ["builder", "checker"]},
      "workers": [
        {"id": "builder", "role": "backend developer"},
        {"id": "checker", "role": "qa reviewer"}
      ]
    })";
    auto dir = scratch_dir("hive_test_e2e");
    SwarmConfig cfg = parse_config(json, dir);
    expect_true(cfg.state_dir == dir / "state", "state dir resolved against the config dir");

    Swarm swarm(cfg);
    auto exec = std::make_unique<OrderedExecutor>();
    OrderedExecutor* ordered = exec.get();
    swarm.set_executor(std::move(exec));

    WorkQueue& q = swarm.queue();
    Task a = q.create("design the schema", {}, std::string("backend"));
    Task b = q.create("implement the schema", {a.id}, std::string("backend"));
    Task c = q.create("flaky");
    expect_true(b.status == TaskStatus::BLOCKED, "B waits for A");

    auto rt = make_runtime(cfg, swarm.runtime_deps());
    rt->start_all(cfg);

    bool settled = wait_until([&] {
        auto ta = q.get(a.id), tb = q.get(b.id), tc = q.get(c.id);
        return ta->status == TaskStatus::COMPLETED && tb->status == TaskStatus::COMPLETED &&
               tc->status == TaskStatus::FAILED;
    });
    rt->stop_all();
    expect_true(settled, "A and B completed, the flaky task failed");

    auto ta = q.get(a.id);
    auto tb = q.get(b.id);
    expect_true(ta->agent_id == std::string("builder") && tb->agent_id == std::string("builder"),
                "role tasks went to the backend developer");
    expect_true(ta->reviewed_by("checker"), "peer reviewed A");
    expect_true(!ta->reviewed_by("builder"), "no self review");
    expect_true(*tb->completed_at >= *ta->completed_at, "B finished after A");
    {
        std::lock_guard<std::mutex> lk(ordered->mu);
        auto pos_a = std::find(ordered->order.begin(), ordered->order.end(), "design the schema");
        auto pos_b = std::find(ordered->order.begin(), ordered->order.end(), "implement the schema");
        expect_true(pos_a < pos_b, "A executed before B");
    }

    expect_true(q.get(c.id)->has_flag_prefix("failed:exec_failed"), "failure flagged");
    expect_eq_ll((long long)swarm.scores().agents().size(), 2, "both workers scored");
    expect_true(swarm.scores().get_all("checker").get(Dimension::REVIEW_ACCURACY) != ScoreAggregator::kDefaultScore,
                "reviewer accuracy moved");
    expect_true(!q.history("builder").empty(), "history kept");

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::cout << "test_e2e: ALL PASSED\n";
    return 0;
}
