#include "hive/executor.h"
#include "hive/config.h"
#include "hive/evolution.h"
#include "hive/json_util.h"
#include "hive/log.h"
#include "hive/reputation_scheduler.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace hive {

static const char* kComponent = "executor";

CommandExecutor::CommandExecutor(std::filesystem::path overrides_dir, int timeout_ms)
    : overrides_dir_(std::move(overrides_dir)) {
    lim_.timeout_ms = timeout_ms > 0 ? timeout_ms : env_int("HIVE_EXEC_TIMEOUT_MS", 600000);
}

std::string CommandExecutor::execute(const Task& task, const WorkerDef& worker) {
    std::vector<std::string> argv = split_argv_quoted(worker.exec_cmd);
    if (argv.empty()) throw TaskError("config_error", "worker " + worker.id + " has no usable exec_cmd");

    json::Doc req = json::new_object();
    json::put_string(req.root, "task_id", task.id);
    json::put_string(req.root, "description", task.description);
    json::put_string(req.root, "role", worker.role);
    json::put_string(req.root, "model", worker.model);
    json::put_string(req.root, "overrides", load_override_text(overrides_dir_, worker.id));

    ProcResult pr;
    if (!proc_run_capture_stdin(argv, "", json::dump(req.root), lim_, &pr)) {
        throw TaskError("spawn_failed", pr.error);
    }
    if (pr.timed_out) throw TaskError("timeout", "exec_cmd exceeded " + std::to_string(lim_.timeout_ms) + "ms");
    if (pr.exit_code != 0) throw TaskError("exec_failed", "exit_code=" + std::to_string(pr.exit_code));

    json::Doc reply = json::parse(pr.output);
    std::string result;
    if (reply && json::is_object(reply.root)) {
        if (auto err = json::get_opt_string(reply.root, "error"); err && !err->empty()) {
            throw TaskError("task_error", *err);
        }
        result = json::get_string(reply.root, "result");
    } else {
        result = pr.output;
    }
    if (result.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw TaskError("empty_result", "exec_cmd produced no output");
    }
    if (pr.output_truncated) log_warn(kComponent, "output of task " + task.id + " was truncated");
    return result;
}

ReviewVerdict HeuristicReviewer::review(const Task& task, const WorkerDef&) {
    ReviewVerdict v;
    v.score = output_quality_heuristic(task.result.value_or(""));
    v.comment = "heuristic review";
    return v;
}

std::optional<double> parse_review_score(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    size_t pos = lower.find("score:");
    if (pos == std::string::npos) return std::nullopt;
    pos += 6;
    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) pos++;
    size_t end = pos;
    while (end < text.size() && (std::isdigit(static_cast<unsigned char>(text[end])) || text[end] == '.')) end++;
    if (end == pos) return std::nullopt;
    try {
        return std::clamp(std::stod(text.substr(pos, end - pos)), 0.0, 100.0);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

ReviewVerdict ChatReviewer::review(const Task& task, const WorkerDef& reviewer) {
    std::vector<ChatMessage> msgs{
        {"system", "You review work produced by a teammate. Reply with a short critique and end with "
                   "a line of the form SCORE: <0-100>."},
        {"user", "Task:\n" + task.description + "\n\nResult:\n" + task.result.value_or("")},
    };
    ChatResult r = chat_.chat(msgs, reviewer.model);
    if (!r.ok()) {
        log_debug(kComponent, "chat review unavailable, using heuristic: " + r.error);
        return fallback_.review(task, reviewer);
    }
    auto score = parse_review_score(r.text);
    if (!score) {
        log_warn(kComponent, "chat review for " + task.id + " carried no score, using heuristic");
        return fallback_.review(task, reviewer);
    }
    ReviewVerdict v;
    v.score = *score;
    v.comment = r.text.substr(0, 500);
    return v;
}

} // namespace hive
