#pragma once

#include "hive/audit_log.h"
#include "hive/chat.h"
#include "hive/config.h"
#include "hive/ids.h"
#include "hive/score_aggregator.h"
#include "hive/work_queue.h"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hive {

enum class EvolutionPath { PROMPT, MODEL, ROLE };

const char* evolution_path_name(EvolutionPath p);

struct EvolutionPlan {
    std::string agent_id;
    std::string root_cause;
    std::string root_cause_source{"heuristic"};  // "heuristic" | "chat"
    std::vector<std::string> patterns;
    EvolutionPath path{EvolutionPath::PROMPT};
    std::vector<std::string> prompt_additions;   // PROMPT
    std::string target_model;                    // MODEL
    std::string role_proposal;                   // ROLE
    double confidence{0.5};
    std::string expected_improvement;
    int64_t created_at{0};
};

struct PendingSwap {
    std::string agent_id;
    std::string new_model;
    std::string old_model;
    std::string reason;
    int64_t created_at{0};
};

struct PendingVote {
    std::string agent_id;
    std::string proposal;
    std::vector<std::string> votes_for;
    std::vector<std::string> votes_against;
    int64_t created_at{0};
};

enum class VoteStatus {
    NO_PENDING_VOTE,
    ALREADY_VOTED,
    NOT_A_TEAMMATE,
    WAITING_FOR_QUORUM,
    APPROVED,
    REJECTED,
};

const char* vote_status_name(VoteStatus s);

struct VoteOutcome {
    VoteStatus status{VoteStatus::NO_PENDING_VOTE};
    int votes_for{0};
    int votes_against{0};
    int quorum{0};
};

// Marker states for an in-flight remediation.
inline constexpr const char* kMarkerPending = "pending";
inline constexpr const char* kMarkerApplied = "applied";
inline constexpr const char* kMarkerAwaitingConfirmation = "awaiting_confirmation";
inline constexpr const char* kMarkerAwaitingVote = "awaiting_vote";

// Override blocks kept per worker (most recent win).
inline constexpr size_t kMaxOverrideBlocks = 3;
inline constexpr const char* kOverrideHeader = "## Evolution Override";
inline constexpr const char* kRestructureHeader = "## Role Restructure";

// Current override text for a worker ("" when none).
std::string load_override_text(const std::filesystem::path& overrides_dir, const std::string& agent_id);

// EvolutionEngine: diagnosis and the three remediation paths.
//
// Per-worker state lives in files under the state directory (see StatePaths):
// a marker in evolution/pending/ while a remediation is in flight, a swap
// record awaiting operator confirmation, a vote record awaiting teammates,
// and the override instructions file. The marker is checked and written
// under evolution/pending/<id>.lock, so two near-simultaneous triggers for
// one worker produce one plan.
class EvolutionEngine {
public:
    EvolutionEngine(SwarmConfig config, WorkQueue& queue, ScoreAggregator& scores,
                    IChat* chat = nullptr, Clock clock = system_clock_ms());

    // `warning` is logged only; `evolve` diagnoses and executes unless a
    // remediation is already in flight. Returns the executed plan.
    std::optional<EvolutionPlan> maybe_trigger(const std::string& agent_id, ThresholdStatus status);

    // Pure diagnosis over recent history and current dimensions.
    EvolutionPlan diagnose(const std::string& agent_id) const;

    // True while a remediation is in flight: an applied marker inside its
    // cooldown, an awaiting marker, or a pending marker younger than
    // pending_marker_ttl_ms().
    bool is_pending(const std::string& agent_id) const;
    std::string marker_state(const std::string& agent_id) const;  // "" when none

    // Recovery (composite back to >= 80): drop overrides and an applied marker.
    void on_recovered(const std::string& agent_id);

    std::string override_text(const std::string& agent_id) const;
    bool clear_overrides(const std::string& agent_id);

    std::optional<PendingSwap> pending_swap(const std::string& agent_id) const;
    // Operator confirmation. Returns empty string on success.
    std::string apply_model_swap(const std::string& agent_id);
    bool discard_model_swap(const std::string& agent_id);

    VoteOutcome cast_vote(const std::string& agent_id, const std::string& voter_id, bool approve);
    std::vector<PendingVote> pending_votes() const;

    // Worker's model as this engine currently knows it.
    std::string current_model(const std::string& agent_id) const;

    // Chat timeout plus a margin.
    int64_t pending_marker_ttl_ms() const;

private:
    std::optional<std::string> pick_fallback_model(const std::string& agent_id) const;
    size_t override_block_count(const std::string& agent_id) const;

    void execute(EvolutionPlan& plan);
    bool append_override_block(const std::string& agent_id, const std::string& header,
                               const std::vector<std::string>& lines);

    void write_marker(const std::string& agent_id, EvolutionPath path, const char* state,
                      int64_t cooldown_until = 0);
    void clear_marker(const std::string& agent_id);
    void log_plan(const EvolutionPlan& plan);

    std::filesystem::path marker_path(const std::string& agent_id) const;
    std::filesystem::path marker_lock_path(const std::string& agent_id) const;
    std::filesystem::path swap_path(const std::string& agent_id) const;
    std::filesystem::path vote_path(const std::string& agent_id) const;
    std::filesystem::path overrides_path(const std::string& agent_id) const;

    SwarmConfig config_;
    StatePaths paths_;
    WorkQueue& queue_;
    ScoreAggregator& scores_;
    IChat* chat_;
    Clock clock_;
    AuditLog log_;
    mutable std::mutex config_mu_;
};

} // namespace hive
