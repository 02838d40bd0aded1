#pragma once

#include "hive/chat.h"
#include "hive/proc.h"
#include "hive/types.h"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace hive {

// Task execution failure. what() starts with the error class so the queue
// flag reads "failed:<kind>".
class TaskError : public std::runtime_error {
public:
    TaskError(const std::string& kind, const std::string& detail)
        : std::runtime_error(kind + ": " + detail), kind_(kind) {}

    const std::string& kind() const { return kind_; }

private:
    std::string kind_;
};

// Runs one task on behalf of a worker and returns its result text.
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;
    virtual std::string execute(const Task& task, const WorkerDef& worker) = 0;
};

// CommandExecutor: runs the worker's exec_cmd.
//
// Contract:
// - stdin:  {"task_id","description","role","model","overrides"}
// - stdout: {"result":"..."} or {"error":"..."}; plain text is the result as-is
// Timeout: HIVE_EXEC_TIMEOUT_MS (default 600000) unless given explicitly.
class CommandExecutor final : public ITaskExecutor {
public:
    explicit CommandExecutor(std::filesystem::path overrides_dir, int timeout_ms = 0);

    std::string execute(const Task& task, const WorkerDef& worker) override;

private:
    std::filesystem::path overrides_dir_;
    ProcLimits lim_;
};

struct ReviewVerdict {
    double score{0.0};
    std::string comment;
};

class IReviewer {
public:
    virtual ~IReviewer() = default;
    virtual ReviewVerdict review(const Task& task, const WorkerDef& reviewer) = 0;
};

// Scores the result with the output-quality heuristic.
class HeuristicReviewer final : public IReviewer {
public:
    ReviewVerdict review(const Task& task, const WorkerDef& reviewer) override;
};

// Asks the chat capability for a "SCORE: <0-100>" verdict. Falls back to the
// heuristic when chat fails or the reply carries no score.
class ChatReviewer final : public IReviewer {
public:
    explicit ChatReviewer(IChat& chat) : chat_(chat) {}

    ReviewVerdict review(const Task& task, const WorkerDef& reviewer) override;

private:
    IChat& chat_;
    HeuristicReviewer fallback_;
};

// "SCORE: 72" anywhere in the text (case-insensitive), clamped to 0..100.
std::optional<double> parse_review_score(const std::string& text);

} // namespace hive
