#include "test_common.h"
#include "hive/executor.h"
#include "hive/json_util.h"

using namespace hive;
namespace fs = std::filesystem;

static WorkerDef worker_with(const std::string& cmd) {
    WorkerDef w;
    w.id = "w1";
    w.role = "coder";
    w.model = "m-large";
    w.exec_cmd = cmd;
    return w;
}

static std::string error_kind_of(CommandExecutor& ex, const Task& t, const WorkerDef& w) {
    try {
        ex.execute(t, w);
    } catch (const TaskError& e) {
        return e.kind();
    }
    return "";
}

class ScriptedChat final : public IChat {
public:
    explicit ScriptedChat(ChatResult reply) : reply_(std::move(reply)) {}
    ChatResult chat(const std::vector<ChatMessage>&, const std::string& model) override {
        last_model = model;
        return reply_;
    }
    std::string name() const override { return "scripted"; }

    std::string last_model;

private:
    ChatResult reply_;
};

int main() {
    fs::path dir = scratch_dir("hive_test_executor");
    fs::path overrides = dir / "overrides";
    fs::create_directories(overrides);
    {
        std::ofstream f(overrides / "w1.md");
        f << "## Evolution Override (2024-01-01)\n- be precise\n";
    }
    CommandExecutor ex(overrides, 5000);

    Task t;
    t.id = "task-1";
    t.description = "sum the numbers";

    // Test 1: JSON result and the request on stdin
    {
        std::string req_path = (dir / "req.json").string();
        auto cmd = write_script(dir / "ok.sh", "cat > " + req_path + "\nprintf '{\"result\":\"the sum is 6\"}'");
        std::string out = ex.execute(t, worker_with(cmd));
        expect_true(out == "the sum is 6", "result extracted");

        bool missing = true;
        json::Doc req = json::load_file(req_path, &missing);
        expect_true(!missing && req, "request written to stdin");
        expect_true(json::get_string(req.root, "task_id") == "task-1", "task id");
        expect_true(json::get_string(req.root, "description") == "sum the numbers", "description");
        expect_true(json::get_string(req.root, "role") == "coder", "role");
        expect_true(json::get_string(req.root, "model") == "m-large", "model");
        expect_true(json::get_string(req.root, "overrides").find("be precise") != std::string::npos,
                    "override instructions passed along");
    }

    // Test 2: plain text is the result as-is
    {
        auto cmd = write_script(dir / "plain.sh", "cat >/dev/null\necho 'plain answer'");
        expect_true(ex.execute(t, worker_with(cmd)) == "plain answer\n", "plain stdout");
    }

    // Test 3: failure classes
    {
        auto err = write_script(dir / "err.sh", "cat >/dev/null\nprintf '{\"error\":\"bad input\"}'");
        expect_true(error_kind_of(ex, t, worker_with(err)) == "task_error", "error reply");

        auto exit3 = write_script(dir / "exit3.sh", "cat >/dev/null\nexit 3");
        expect_true(error_kind_of(ex, t, worker_with(exit3)) == "exec_failed", "non-zero exit");

        auto empty = write_script(dir / "empty.sh", "cat >/dev/null\nprintf '{\"result\":\"  \"}'");
        expect_true(error_kind_of(ex, t, worker_with(empty)) == "empty_result", "blank result");

        expect_true(error_kind_of(ex, t, worker_with("")) == "config_error", "no exec_cmd");

        CommandExecutor quick(overrides, 300);
        auto slow = write_script(dir / "slow.sh", "sleep 5");
        expect_true(error_kind_of(quick, t, worker_with(slow)) == "timeout", "timeout");

        try {
            ex.execute(t, worker_with(exit3));
            die("expected TaskError");
        } catch (const TaskError& e) {
            expect_true(std::string(e.what()).starts_with("exec_failed: "), "what() leads with the class");
        }
    }

    // Test 4: review score parsing
    {
        expect_true(parse_review_score("Solid work.\nSCORE: 72") == 72.0, "upper case");
        expect_true(parse_review_score("score:  55.5 overall") == 55.5, "decimal");
        expect_true(parse_review_score("Score: 140") == 100.0, "clamped high");
        expect_true(!parse_review_score("looks fine"), "no score");
        expect_true(!parse_review_score("score: n/a"), "no number");
    }

    // Test 5: reviewers
    {
        Task done = t;
        done.result = "# Sum\n- 1 + 2 + 3 = 6";
        WorkerDef reviewer = worker_with("");
        reviewer.id = "rev";

        HeuristicReviewer h;
        expect_true(h.review(done, reviewer).score == 70.0, "heuristic review");

        ChatResult good;
        good.text = "Correct and clear.\nSCORE: 88";
        ScriptedChat chat_ok(good);
        ChatReviewer cr(chat_ok);
        ReviewVerdict v = cr.review(done, reviewer);
        expect_true(v.score == 88.0, "chat score used");
        expect_true(v.comment.find("Correct") != std::string::npos, "comment kept");
        expect_true(chat_ok.last_model == "m-large", "reviewer's model");

        ChatResult vague;
        vague.text = "Fine.";
        ScriptedChat chat_vague(vague);
        ChatReviewer cr2(chat_vague);
        expect_true(cr2.review(done, reviewer).score == 70.0, "no score falls back to heuristic");

        ChatResult down;
        down.error = "offline";
        ScriptedChat chat_down(down);
        ChatReviewer cr3(chat_down);
        expect_true(cr3.review(done, reviewer).comment == "heuristic review", "chat error falls back");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    std::cout << "test_executor: ALL PASSED\n";
    return 0;
}
