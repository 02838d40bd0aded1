#include "test_common.h"
#include "hive/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace hive;

static bool throws(const std::string& text) {
    try {
        parse_config(text, "/tmp");
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

int main() {
    namespace fs = std::filesystem;

    // Test 1: profile detection and defaults
    {
        unsetenv("HIVE_PROFILE");
        expect_true(detect_profile() == Profile::DEV, "default should be DEV");
        setenv("HIVE_PROFILE", "PROD", 1);
        expect_true(detect_profile() == Profile::PROD, "should detect PROD case-insensitive");

        setenv("HIVE_LOCK_TIMEOUT_MS", "42", 1);
        unsetenv("HIVE_AUDIT_FSYNC");
        apply_profile_defaults(Profile::PROD);
        expect_true(std::string(std::getenv("HIVE_LOCK_TIMEOUT_MS")) == "42", "existing env var kept");
        expect_true(std::string(std::getenv("HIVE_AUDIT_FSYNC")) == "1", "PROD turns audit fsync on");
        expect_true(std::string(profile_name(Profile::DEV)) == "dev", "dev name");

        unsetenv("HIVE_PROFILE");
        unsetenv("HIVE_LOCK_TIMEOUT_MS");
        unsetenv("HIVE_AUDIT_FSYNC");
    }

    // Test 2: a full document
    {
        const char* text = R"({
          "state_dir": "state",
          "default_fallback_model": "small-model",
          "runtime": {"mode": "lazy", "delegate": "process", "always_on": ["lead"],
                      "idle_shutdown": 120, "monitor_interval_ms": 500, "stop_grace_ms": 2000},
          "queue": {"lease_timeout_sec": 30, "review_timeout_sec": 90, "poll_interval_ms": 200,
                    "max_idle_cycles": 5},
          "reputation": {"peer_review_agents": ["lead", "critic"], "role_vote_threshold": 0.75,
                         "review_pass_score": 55},
          "chat": {"cmd": "bin/chat", "model": "m1", "timeout_ms": 9000},
          "workers": [
            {"id": "lead", "role": "planner", "model": "big", "fallback_models": ["mid"], "exec_cmd": "bin/run"},
            {"id": "critic", "role": "reviewer"}
          ]
        })";
        SwarmConfig c = parse_config(text, "/srv/hive");
        expect_true(c.state_dir == fs::path("/srv/hive/state"), "relative state_dir resolves against base");
        expect_true(c.default_fallback_model == "small-model", "fallback model");
        expect_true(c.runtime.mode == RuntimeMode::LAZY && c.runtime.delegate == RuntimeMode::PROCESS, "modes");
        expect_true(c.runtime.always_on.size() == 1 && c.runtime.always_on[0] == "lead", "always_on");
        expect_eq_ll(c.runtime.idle_shutdown_sec, 120, "idle_shutdown");
        expect_eq_ll(c.queue.lease_timeout_sec, 30, "lease");
        expect_eq_ll(c.queue.recovery_interval_sec, 30, "recovery interval default");
        expect_eq_ll(c.queue.max_idle_cycles, 5, "max idle");
        expect_true(c.reputation.role_vote_threshold == 0.75, "vote threshold");
        expect_true(c.reputation.review_pass_score == 55.0, "pass score");
        expect_eq_ll(c.reputation.evolution_cooldown_sec, 600, "cooldown default");
        expect_eq_ll(c.chat.timeout_ms, 9000, "chat timeout");
        expect_eq_ll((long long)c.workers.size(), 2, "two workers");
        const WorkerDef* lead = c.find_worker("lead");
        expect_true(lead && lead->fallback_models.size() == 1 && lead->exec_cmd == "bin/run", "worker fields");
        expect_true(!c.find_worker("nobody"), "unknown worker");
        expect_true(c.worker_ids() == std::vector<std::string>({"lead", "critic"}), "ids in config order");
    }

    // Test 3: defaults for an empty document
    {
        SwarmConfig c = parse_config("{}", "/base");
        expect_true(c.state_dir == fs::path("/base/.hive"), "default state dir");
        expect_true(c.runtime.mode == RuntimeMode::PROCESS, "default mode");
        expect_true(c.workers.empty(), "no workers");
    }

    // Test 4: invalid documents throw
    {
        expect_true(throws("not json"), "invalid JSON");
        expect_true(throws("[]"), "not an object");
        expect_true(throws(R"({"runtime": {"mode": "threads"}})"), "unknown runtime mode");
        expect_true(throws(R"({"runtime": {"mode": "lazy", "delegate": "lazy"}})"), "lazy cannot delegate to lazy");
        expect_true(throws(R"({"workers": [{"id": "a"}, {"id": "a"}]})"), "duplicate worker id");
        expect_true(throws(R"({"workers": [{"role": "x"}]})"), "missing worker id");
        bool missing_file = false;
        try {
            load_config("/nonexistent/hive.json");
        } catch (const std::runtime_error&) {
            missing_file = true;
        }
        expect_true(missing_file, "unreadable file throws");
    }

    // Test 5: update_worker_model rewrites only that worker
    {
        fs::path dir = fs::temp_directory_path() / "hive_test_config";
        std::error_code ec;
        fs::remove_all(dir, ec);
        fs::create_directories(dir, ec);
        fs::path p = dir / "hive.json";
        {
            std::ofstream f(p);
            f << R"({"workers": [{"id": "a", "model": "m-old"}, {"id": "b", "model": "m-b"}]})";
        }
        expect_true(update_worker_model(p, "a", "m-new").empty(), "update succeeds");
        expect_true(!update_worker_model(p, "zzz", "m").empty(), "unknown worker reported");
        SwarmConfig c = load_config(p);
        expect_true(c.find_worker("a")->model == "m-new", "model rewritten");
        expect_true(c.find_worker("b")->model == "m-b", "other worker untouched");
        expect_true(c.path == fs::absolute(p), "path recorded");
        expect_true(c.state_dir == dir / ".hive", "state dir next to the file");
        fs::remove_all(dir, ec);
    }

    std::cout << "test_config: ALL PASSED\n";
    return 0;
}
