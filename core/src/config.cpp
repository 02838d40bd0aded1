#include "hive/config.h"
#include "hive/file_lock.h"
#include "hive/json_util.h"
#include "hive/log.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <stdexcept>

namespace hive {

Profile detect_profile() {
    const char* env = std::getenv("HIVE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("HIVE_AUDIT_FSYNC",     "0",      NO_OVERWRITE);
            setenv("HIVE_LOG_LEVEL",       "debug",  NO_OVERWRITE);
            setenv("HIVE_LOCK_TIMEOUT_MS", "10000",  NO_OVERWRITE);
            setenv("HIVE_EXEC_TIMEOUT_MS", "600000", NO_OVERWRITE);
            setenv("HIVE_CHAT_TIMEOUT_MS", "120000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("HIVE_AUDIT_FSYNC",     "1",      NO_OVERWRITE);
            setenv("HIVE_LOG_LEVEL",       "info",   NO_OVERWRITE);
            setenv("HIVE_LOCK_TIMEOUT_MS", "5000",   NO_OVERWRITE);
            setenv("HIVE_EXEC_TIMEOUT_MS", "300000", NO_OVERWRITE);
            setenv("HIVE_CHAT_TIMEOUT_MS", "60000",  NO_OVERWRITE);
            break;
    }
}

int env_int(const char* key, int defv) {
    const char* e = std::getenv(key);
    if (!e || !*e) return defv;
    try {
        return std::stoi(e);
    } catch (const std::exception&) {
        log_warn("config", std::string("ignoring non-numeric ") + key + "=" + e);
        return defv;
    }
}

const char* runtime_mode_name(RuntimeMode m) {
    switch (m) {
        case RuntimeMode::PROCESS:    return "process";
        case RuntimeMode::IN_PROCESS: return "in_process";
        case RuntimeMode::LAZY:       return "lazy";
    }
    return "process";
}

std::optional<RuntimeMode> parse_runtime_mode(const std::string& s) {
    if (s == "process")    return RuntimeMode::PROCESS;
    if (s == "in_process") return RuntimeMode::IN_PROCESS;
    if (s == "lazy")       return RuntimeMode::LAZY;
    return std::nullopt;
}

const WorkerDef* SwarmConfig::find_worker(const std::string& id) const {
    for (const auto& w : workers) {
        if (w.id == id) return &w;
    }
    return nullptr;
}

std::vector<std::string> SwarmConfig::worker_ids() const {
    std::vector<std::string> out;
    out.reserve(workers.size());
    for (const auto& w : workers) out.push_back(w.id);
    return out;
}

static RuntimeMode mode_or_throw(const std::string& s, const char* key) {
    auto m = parse_runtime_mode(s);
    if (!m) throw std::runtime_error(std::string("config: unknown ") + key + ": " + s);
    return *m;
}

SwarmConfig parse_config(const std::string& json_text, const std::filesystem::path& base_dir) {
    json::Doc d = json::parse(json_text);
    if (!d || !json::is_object(d.root)) throw std::runtime_error("config: not a JSON object");

    SwarmConfig cfg;
    std::filesystem::path state = json::get_string(d.root, "state_dir", ".hive");
    cfg.state_dir = state.is_absolute() ? state : (base_dir / state);
    cfg.default_fallback_model = json::get_string(d.root, "default_fallback_model");

    if (json_object* rt = json::member(d.root, "runtime")) {
        cfg.runtime.mode = mode_or_throw(json::get_string(rt, "mode", "process"), "runtime.mode");
        cfg.runtime.delegate = mode_or_throw(json::get_string(rt, "delegate", "in_process"), "runtime.delegate");
        if (cfg.runtime.delegate == RuntimeMode::LAZY) {
            throw std::runtime_error("config: runtime.delegate cannot be lazy");
        }
        cfg.runtime.always_on = json::get_string_array(rt, "always_on");
        cfg.runtime.idle_shutdown_sec = (int)json::get_int(rt, "idle_shutdown", cfg.runtime.idle_shutdown_sec);
        cfg.runtime.monitor_interval_ms = (int)json::get_int(rt, "monitor_interval_ms", cfg.runtime.monitor_interval_ms);
        cfg.runtime.stop_grace_ms = (int)json::get_int(rt, "stop_grace_ms", cfg.runtime.stop_grace_ms);
        cfg.runtime.worker_bin = json::get_string(rt, "worker_bin");
    }

    if (json_object* q = json::member(d.root, "queue")) {
        cfg.queue.lease_timeout_sec = (int)json::get_int(q, "lease_timeout_sec", cfg.queue.lease_timeout_sec);
        cfg.queue.review_timeout_sec = (int)json::get_int(q, "review_timeout_sec", cfg.queue.review_timeout_sec);
        cfg.queue.poll_interval_ms = (int)json::get_int(q, "poll_interval_ms", cfg.queue.poll_interval_ms);
        cfg.queue.recovery_interval_sec = (int)json::get_int(q, "recovery_interval_sec", cfg.queue.recovery_interval_sec);
        cfg.queue.max_idle_cycles = (int)json::get_int(q, "max_idle_cycles", cfg.queue.max_idle_cycles);
    }

    if (json_object* r = json::member(d.root, "reputation")) {
        cfg.reputation.peer_review_agents = json::get_string_array(r, "peer_review_agents");
        cfg.reputation.role_vote_threshold = json::get_double(r, "role_vote_threshold", cfg.reputation.role_vote_threshold);
        cfg.reputation.min_claim_reputation = json::get_double(r, "min_claim_reputation", cfg.reputation.min_claim_reputation);
        cfg.reputation.review_pass_score = json::get_double(r, "review_pass_score", cfg.reputation.review_pass_score);
        cfg.reputation.evolution_cooldown_sec = (int)json::get_int(r, "evolution_cooldown_sec", cfg.reputation.evolution_cooldown_sec);
    }

    if (json_object* c = json::member(d.root, "chat")) {
        cfg.chat.cmd = json::get_string(c, "cmd");
        cfg.chat.model = json::get_string(c, "model");
        cfg.chat.timeout_ms = (int)json::get_int(c, "timeout_ms", cfg.chat.timeout_ms);
    }

    std::set<std::string> seen;
    json_object* arr = json::member(d.root, "workers");
    if (arr && json_object_is_type(arr, json_type_array)) {
        const size_t n = json_object_array_length(arr);
        for (size_t i = 0; i < n; i++) {
            json_object* w = json_object_array_get_idx(arr, i);
            if (!json::is_object(w)) throw std::runtime_error("config: workers[" + std::to_string(i) + "] is not an object");
            WorkerDef def;
            def.id = json::get_string(w, "id");
            if (def.id.empty()) throw std::runtime_error("config: workers[" + std::to_string(i) + "] missing id");
            if (!seen.insert(def.id).second) throw std::runtime_error("config: duplicate worker id: " + def.id);
            def.role = json::get_string(w, "role");
            def.model = json::get_string(w, "model");
            def.fallback_models = json::get_string_array(w, "fallback_models");
            def.exec_cmd = json::get_string(w, "exec_cmd");
            cfg.workers.push_back(std::move(def));
        }
    }
    return cfg;
}

SwarmConfig load_config(const std::filesystem::path& path) {
    std::string body;
    if (!json::read_text_file(path, &body)) throw std::runtime_error("config: cannot open " + path.string());
    auto base = std::filesystem::absolute(path).parent_path();
    SwarmConfig cfg = parse_config(body, base);
    cfg.path = std::filesystem::absolute(path);
    return cfg;
}

std::string update_worker_model(const std::filesystem::path& path,
                                const std::string& worker_id,
                                const std::string& model) {
    auto lock_path = path;
    lock_path += ".lock";
    ScopedFileLock lock(lock_path, "config");

    bool missing = false;
    json::Doc d = json::load_file(path, &missing);
    if (missing) return "config not found: " + path.string();
    if (!d || !json::is_object(d.root)) return "config is not a JSON object";

    json_object* arr = json::member(d.root, "workers");
    if (!arr || !json_object_is_type(arr, json_type_array)) return "config has no workers";

    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* w = json_object_array_get_idx(arr, i);
        if (json::get_string(w, "id") != worker_id) continue;
        json::put_string(w, "model", model);
        return json::write_atomic(path, json::dump(d.root, true) + "\n");
    }
    return "unknown worker: " + worker_id;
}

} // namespace hive
