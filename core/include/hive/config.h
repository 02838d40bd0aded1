#pragma once

#include "hive/types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hive {

enum class Profile { DEV, PROD };

// Detect profile from HIVE_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no audit fsync, debug logging, generous timeouts)
// PROD: strict (audit fsync on, info logging, tight timeouts)
void apply_profile_defaults(Profile p);

// Integer env var; `defv` when unset or not a number.
int env_int(const char* key, int defv);

// How workers are hosted.
enum class RuntimeMode { PROCESS, IN_PROCESS, LAZY };

const char* runtime_mode_name(RuntimeMode m);
std::optional<RuntimeMode> parse_runtime_mode(const std::string& s);

struct RuntimeSettings {
    RuntimeMode mode{RuntimeMode::PROCESS};
    RuntimeMode delegate{RuntimeMode::IN_PROCESS};  // lazy mode only
    std::vector<std::string> always_on;
    int idle_shutdown_sec{300};
    int monitor_interval_ms{2000};
    int stop_grace_ms{5000};
    std::string worker_bin;  // process mode; empty = the running hive_cli
};

struct QueueSettings {
    int lease_timeout_sec{600};
    int review_timeout_sec{1800};
    int poll_interval_ms{1000};
    int recovery_interval_sec{30};
    int max_idle_cycles{0};  // 0 = never exit on idleness
};

struct ReputationSettings {
    std::vector<std::string> peer_review_agents;
    double role_vote_threshold{0.6};
    double min_claim_reputation{0.0};
    double review_pass_score{60.0};
    int evolution_cooldown_sec{600};
};

struct ChatSettings {
    std::string cmd;  // empty = no chat capability
    std::string model;
    int timeout_ms{0};  // 0 = HIVE_CHAT_TIMEOUT_MS
};

struct SwarmConfig {
    std::filesystem::path path;       // file it was loaded from (may be empty)
    std::filesystem::path state_dir;  // absolute after load
    std::string default_fallback_model;
    RuntimeSettings runtime;
    QueueSettings queue;
    ReputationSettings reputation;
    ChatSettings chat;
    std::vector<WorkerDef> workers;

    const WorkerDef* find_worker(const std::string& id) const;
    std::vector<std::string> worker_ids() const;
};

// Parses a config document. Relative state_dir resolves against `base_dir`.
// Throws std::runtime_error on invalid JSON, unknown runtime mode, a lazy
// delegate of "lazy", or a missing/duplicate worker id.
SwarmConfig parse_config(const std::string& json_text, const std::filesystem::path& base_dir);

// Loads and parses the file; throws std::runtime_error if it cannot be read.
SwarmConfig load_config(const std::filesystem::path& path);

// Rewrites one worker's "model" in the config file under <path>.lock.
// Returns empty string on success.
std::string update_worker_model(const std::filesystem::path& path,
                                const std::string& worker_id,
                                const std::string& model);

// Every persisted location, derived from the state directory.
struct StatePaths {
    std::filesystem::path root;

    explicit StatePaths(std::filesystem::path state_dir) : root(std::move(state_dir)) {}

    std::filesystem::path tasks() const { return root / "tasks.json"; }
    std::filesystem::path mailboxes() const { return root / "mailboxes"; }
    std::filesystem::path reputation_cache() const { return root / "reputation" / "cache.json"; }
    std::filesystem::path score_log() const { return root / "reputation" / "score_log.jsonl"; }
    std::filesystem::path evolution_pending() const { return root / "evolution" / "pending"; }
    std::filesystem::path pending_swaps() const { return root / "evolution" / "pending_swaps"; }
    std::filesystem::path pending_votes() const { return root / "evolution" / "pending_votes"; }
    std::filesystem::path overrides() const { return root / "evolution" / "overrides"; }
    std::filesystem::path evolution_log() const { return root / "evolution" / "evolution_log.jsonl"; }
    std::filesystem::path heartbeats() const { return root / "heartbeats"; }
};

} // namespace hive
