#include "hive/evolution.h"
#include "hive/file_lock.h"
#include "hive/json_util.h"
#include "hive/log.h"

#include <algorithm>
#include <sstream>

namespace hive {

static const char* kComponent = "evolution";

// Diagnosis thresholds.
static constexpr double kHighFailureRatio = 0.30;
static constexpr double kFrequentReworkRatio = 0.20;
static constexpr double kLowDimension = 45.0;
static constexpr double kNotImprovingBelow = 40.0;
static constexpr size_t kHistoryWindow = 50;
static constexpr size_t kMaxRootCauseChars = 1000;
// A pending marker older than the chat timeout plus this margin belongs to a
// trigger whose process died.
static constexpr int64_t kPendingMarkerMarginMs = 5 * 60 * 1000;

const char* evolution_path_name(EvolutionPath p) {
    switch (p) {
        case EvolutionPath::PROMPT: return "prompt";
        case EvolutionPath::MODEL:  return "model";
        case EvolutionPath::ROLE:   return "role";
    }
    return "prompt";
}

const char* vote_status_name(VoteStatus s) {
    switch (s) {
        case VoteStatus::NO_PENDING_VOTE:    return "no_pending_vote";
        case VoteStatus::ALREADY_VOTED:      return "already_voted";
        case VoteStatus::NOT_A_TEAMMATE:     return "not_a_teammate";
        case VoteStatus::WAITING_FOR_QUORUM: return "waiting_for_quorum";
        case VoteStatus::APPROVED:           return "approved";
        case VoteStatus::REJECTED:           return "rejected";
    }
    return "no_pending_vote";
}

std::string load_override_text(const std::filesystem::path& overrides_dir, const std::string& agent_id) {
    std::string text;
    if (!json::read_text_file(overrides_dir / (agent_id + ".md"), &text)) return "";
    return text;
}

static std::string pattern_instruction(const std::string& pattern) {
    if (pattern == "high_failure_rate")
        return "Before you finish, check the result against every requirement in the task. State any assumption you had to make.";
    if (pattern == "frequent_rework")
        return "Re-read the task description before starting and confirm the final answer addresses each point it raises.";
    if (pattern == "low_output_quality")
        return "Structure the answer with headings or lists and give concrete details instead of general summaries.";
    if (pattern == "inconsistent_output")
        return "Use the same layout for every task: a one-paragraph summary first, then the detailed result.";
    if (pattern == "not_improving")
        return "Read the reviewer comments on your earlier tasks and apply them explicitly in this one.";
    return "";
}

static std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

EvolutionEngine::EvolutionEngine(SwarmConfig config, WorkQueue& queue, ScoreAggregator& scores,
                                 IChat* chat, Clock clock)
    : config_(std::move(config)),
      paths_(config_.state_dir),
      queue_(queue),
      scores_(scores),
      chat_(chat),
      clock_(std::move(clock)),
      log_(paths_.evolution_log()) {}

std::filesystem::path EvolutionEngine::marker_path(const std::string& agent_id) const {
    return paths_.evolution_pending() / (agent_id + ".json");
}

std::filesystem::path EvolutionEngine::marker_lock_path(const std::string& agent_id) const {
    return paths_.evolution_pending() / (agent_id + ".lock");
}

std::filesystem::path EvolutionEngine::swap_path(const std::string& agent_id) const {
    return paths_.pending_swaps() / (agent_id + ".json");
}

std::filesystem::path EvolutionEngine::vote_path(const std::string& agent_id) const {
    return paths_.pending_votes() / (agent_id + ".json");
}

std::filesystem::path EvolutionEngine::overrides_path(const std::string& agent_id) const {
    return paths_.overrides() / (agent_id + ".md");
}

// ---------- marker ----------

std::string EvolutionEngine::marker_state(const std::string& agent_id) const {
    bool missing = false;
    json::Doc d = json::load_file(marker_path(agent_id), &missing);
    if (missing || !d) return "";
    return json::get_string(d.root, "state");
}

bool EvolutionEngine::is_pending(const std::string& agent_id) const {
    bool missing = false;
    json::Doc d = json::load_file(marker_path(agent_id), &missing);
    if (missing) return false;
    if (!d || !json::is_object(d.root)) {
        log_warn(kComponent, "unreadable marker for " + agent_id + ", ignoring it");
        return false;
    }
    const std::string state = json::get_string(d.root, "state");
    if (state == kMarkerApplied) {
        return clock_() < json::get_int(d.root, "cooldown_until");
    }
    if (state == kMarkerPending) {
        const int64_t age = clock_() - json::get_int(d.root, "updated_at");
        if (age > pending_marker_ttl_ms()) {
            log_warn(kComponent, "pending marker for " + agent_id + " is " + std::to_string(age / 1000) +
                     "s old, treating it as abandoned");
            return false;
        }
    }
    return true;
}

int64_t EvolutionEngine::pending_marker_ttl_ms() const {
    const int chat_ms = config_.chat.timeout_ms > 0 ? config_.chat.timeout_ms
                                                    : env_int("HIVE_CHAT_TIMEOUT_MS", 60000);
    return static_cast<int64_t>(chat_ms) + kPendingMarkerMarginMs;
}

void EvolutionEngine::write_marker(const std::string& agent_id, EvolutionPath path, const char* state,
                                   int64_t cooldown_until) {
    json::Doc d = json::new_object();
    json::put_string(d.root, "agent_id", agent_id);
    json::put_string(d.root, "path", evolution_path_name(path));
    json::put_string(d.root, "state", state);
    json::put_int(d.root, "updated_at", clock_());
    if (cooldown_until > 0) json::put_int(d.root, "cooldown_until", cooldown_until);
    std::string err = json::write_atomic(marker_path(agent_id), json::dump(d.root, true) + "\n");
    if (!err.empty()) log_error(kComponent, "cannot write marker for " + agent_id + ": " + err);
}

void EvolutionEngine::clear_marker(const std::string& agent_id) {
    std::error_code ec;
    std::filesystem::remove(marker_path(agent_id), ec);
}

// ---------- trigger / diagnosis ----------

std::optional<EvolutionPlan> EvolutionEngine::maybe_trigger(const std::string& agent_id, ThresholdStatus status) {
    if (status == ThresholdStatus::WARNING) {
        log_warn(kComponent, agent_id + " is in the warning band (composite " +
                 std::to_string(scores_.get(agent_id)) + "), monitoring");
        return std::nullopt;
    }
    if (status != ThresholdStatus::EVOLVE) return std::nullopt;

    {
        ScopedFileLock lock(marker_lock_path(agent_id), kComponent);
        if (is_pending(agent_id)) {
            log_debug(kComponent, agent_id + " already has a remediation in flight");
            return std::nullopt;
        }
        write_marker(agent_id, EvolutionPath::PROMPT, kMarkerPending);
    }

    EvolutionPlan plan;
    try {
        plan = diagnose(agent_id);
        log_plan(plan);
        execute(plan);
    } catch (const std::exception& e) {
        log_error(kComponent, "remediation for " + agent_id + " failed: " + e.what());
        clear_marker(agent_id);
        return std::nullopt;
    }
    return plan;
}

EvolutionPlan EvolutionEngine::diagnose(const std::string& agent_id) const {
    EvolutionPlan plan;
    plan.agent_id = agent_id;
    plan.created_at = clock_();

    const auto tasks = queue_.history(agent_id, kHistoryWindow);
    const auto entry = scores_.get_all(agent_id);

    size_t errors = 0, reworks = 0;
    for (const auto& t : tasks) {
        if (task_has_failure(t)) errors++;
        if (task_has_rework_signal(t)) reworks++;
    }
    const double total = static_cast<double>(tasks.size());
    if (total > 0) {
        if (errors / total > kHighFailureRatio) plan.patterns.push_back("high_failure_rate");
        if (reworks / total > kFrequentReworkRatio) plan.patterns.push_back("frequent_rework");
    }
    if (entry.get(Dimension::OUTPUT_QUALITY) < kLowDimension) plan.patterns.push_back("low_output_quality");
    if (entry.get(Dimension::CONSISTENCY) < kLowDimension) plan.patterns.push_back("inconsistent_output");
    if (entry.get(Dimension::IMPROVEMENT_RATE) < kNotImprovingBelow) plan.patterns.push_back("not_improving");

    std::ostringstream rc;
    rc << "composite " << entry.composite << " over " << tasks.size() << " recent task(s): "
       << errors << " failed, " << reworks << " reworked";
    if (plan.patterns.empty()) rc << "; no dominant error pattern";
    else rc << "; patterns: " << join(plan.patterns, ", ");
    plan.root_cause = rc.str();

    if (chat_) {
        std::ostringstream detail;
        detail << "Worker " << agent_id << ": " << plan.root_cause << ".\n";
        for (const auto& t : tasks) {
            if (t.evolution_flags.empty()) continue;
            detail << "- " << t.description.substr(0, 200) << " [" << join(t.evolution_flags, ", ") << "]\n";
        }
        std::vector<ChatMessage> msgs{
            {"system", "You diagnose why an autonomous worker agent underperforms. Reply with the likely root cause in at most two sentences."},
            {"user", detail.str()},
        };
        ChatResult r = chat_->chat(msgs, config_.chat.model);
        std::string text = trim(r.text);
        if (r.ok() && !text.empty()) {
            if (text.size() > kMaxRootCauseChars) text.resize(kMaxRootCauseChars);
            plan.root_cause = text;
            plan.root_cause_source = "chat";
        } else {
            log_debug(kComponent, "summary unavailable for " + agent_id + ": " + r.error);
        }
    }

    auto has = [&](const char* p) {
        return std::find(plan.patterns.begin(), plan.patterns.end(), p) != plan.patterns.end();
    };
    const bool stuck = has("not_improving") && plan.patterns.size() >= 2;
    const bool prompt_exhausted = override_block_count(agent_id) >= kMaxOverrideBlocks &&
                                  (has("high_failure_rate") || has("frequent_rework"));
    auto fallback = pick_fallback_model(agent_id);

    if (stuck && fallback) {
        plan.path = EvolutionPath::MODEL;
        plan.target_model = *fallback;
    } else if (stuck || prompt_exhausted) {
        plan.path = EvolutionPath::ROLE;
        std::string role;
        {
            std::lock_guard<std::mutex> lk(config_mu_);
            if (const WorkerDef* def = config_.find_worker(agent_id)) role = def->role;
        }
        plan.role_proposal = "Narrow " + agent_id + (role.empty() ? "" : " (" + role + ")") +
                             " to tasks that match its role keyword; recent patterns: " +
                             (plan.patterns.empty() ? "none" : join(plan.patterns, ", "));
    } else {
        plan.path = EvolutionPath::PROMPT;
        for (const auto& p : plan.patterns) {
            std::string line = pattern_instruction(p);
            if (!line.empty()) plan.prompt_additions.push_back(line);
        }
        if (plan.prompt_additions.empty()) {
            plan.prompt_additions.push_back("Slow down: verify each result against the task before submitting it.");
        }
    }

    plan.confidence = plan.patterns.size() >= 2 ? 0.75 : 0.5;
    plan.expected_improvement = "composite back above 60 within 10 tasks";
    return plan;
}

void EvolutionEngine::execute(EvolutionPlan& plan) {
    const std::string& id = plan.agent_id;
    switch (plan.path) {
        case EvolutionPath::PROMPT: {
            std::string header = std::string(kOverrideHeader) + " (" + utc_date(clock_()) + ")";
            if (!append_override_block(id, header, plan.prompt_additions)) {
                log_info(kComponent, "override for " + id + " already carries these constraints");
            }
            int64_t cooldown = clock_() + static_cast<int64_t>(config_.reputation.evolution_cooldown_sec) * 1000;
            write_marker(id, plan.path, kMarkerApplied, cooldown);
            log_info(kComponent, "prompt override applied to " + id);
            break;
        }
        case EvolutionPath::MODEL: {
            json::Doc d = json::new_object();
            json::put_string(d.root, "agent_id", id);
            json::put_string(d.root, "new_model", plan.target_model);
            json::put_string(d.root, "old_model", current_model(id));
            json::put_string(d.root, "reason", plan.root_cause);
            json::put_int(d.root, "created_at", clock_());
            std::string err = json::write_atomic(swap_path(id), json::dump(d.root, true) + "\n");
            if (!err.empty()) {
                log_error(kComponent, "cannot write pending swap for " + id + ": " + err);
                clear_marker(id);
                return;
            }
            write_marker(id, plan.path, kMarkerAwaitingConfirmation);
            log_warn(kComponent, "model swap for " + id + " -> " + plan.target_model + " awaits operator confirmation");
            break;
        }
        case EvolutionPath::ROLE: {
            json::Doc d = json::new_object();
            json::put_string(d.root, "agent_id", id);
            json::put_string(d.root, "proposal", plan.role_proposal);
            json::put_string_array(d.root, "votes_for", {});
            json::put_string_array(d.root, "votes_against", {});
            json::put_int(d.root, "created_at", clock_());
            std::string err = json::write_atomic(vote_path(id), json::dump(d.root, true) + "\n");
            if (!err.empty()) {
                log_error(kComponent, "cannot write vote request for " + id + ": " + err);
                clear_marker(id);
                return;
            }
            write_marker(id, plan.path, kMarkerAwaitingVote);
            log_warn(kComponent, "role restructure for " + id + " awaits a team vote");
            break;
        }
    }
}

void EvolutionEngine::log_plan(const EvolutionPlan& plan) {
    json::Doc d = json::new_object();
    json::put_int(d.root, "ts", plan.created_at);
    json::put_string(d.root, "event", "plan");
    json::put_string(d.root, "agent_id", plan.agent_id);
    json::put_string(d.root, "root_cause", plan.root_cause);
    json::put_string(d.root, "root_cause_source", plan.root_cause_source);
    json::put_string_array(d.root, "patterns", plan.patterns);
    json::put_string(d.root, "path", evolution_path_name(plan.path));
    json::put_double(d.root, "confidence", plan.confidence);
    json::put_string(d.root, "expected_improvement", plan.expected_improvement);
    switch (plan.path) {
        case EvolutionPath::PROMPT: json::put_string_array(d.root, "prompt_additions", plan.prompt_additions); break;
        case EvolutionPath::MODEL:  json::put_string(d.root, "target_model", plan.target_model); break;
        case EvolutionPath::ROLE:   json::put_string(d.root, "role_proposal", plan.role_proposal); break;
    }
    std::string err = log_.append_json_line(json::dump(d.root));
    if (!err.empty()) log_warn(kComponent, "evolution log append failed: " + err);
}

// ---------- path A: prompt overrides ----------

std::string EvolutionEngine::override_text(const std::string& agent_id) const {
    return load_override_text(paths_.overrides(), agent_id);
}

size_t EvolutionEngine::override_block_count(const std::string& agent_id) const {
    std::istringstream in(override_text(agent_id));
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        if (line.starts_with(kOverrideHeader)) n++;
    }
    return n;
}

bool EvolutionEngine::append_override_block(const std::string& agent_id, const std::string& header,
                                            const std::vector<std::string>& lines) {
    auto lock_path = overrides_path(agent_id);
    lock_path += ".lock";
    ScopedFileLock lock(lock_path, kComponent);

    const std::string existing = override_text(agent_id);
    std::vector<std::string> fresh;
    for (const auto& l : lines) {
        if (existing.find(l) == std::string::npos) fresh.push_back(l);
    }
    if (fresh.empty()) return false;

    // Split into blocks, each starting at a "## " header line.
    std::vector<std::string> blocks;
    {
        std::istringstream in(existing);
        std::string line;
        while (std::getline(in, line)) {
            if (line.starts_with("## ") || blocks.empty()) blocks.emplace_back();
            blocks.back() += line + "\n";
        }
    }
    std::string block = header + "\n";
    for (const auto& l : fresh) block += "- " + l + "\n";
    blocks.push_back(block);

    size_t overrides = 0;
    for (const auto& b : blocks) {
        if (b.starts_with(kOverrideHeader)) overrides++;
    }
    for (auto it = blocks.begin(); it != blocks.end() && overrides > kMaxOverrideBlocks;) {
        if (it->starts_with(kOverrideHeader)) {
            it = blocks.erase(it);
            overrides--;
        } else {
            ++it;
        }
    }

    std::string content;
    for (const auto& b : blocks) {
        std::string t = trim(b);
        if (t.empty()) continue;
        if (!content.empty()) content += "\n";
        content += t + "\n";
    }
    std::string err = json::write_atomic(overrides_path(agent_id), content);
    if (!err.empty()) {
        log_error(kComponent, "cannot write overrides for " + agent_id + ": " + err);
        return false;
    }
    return true;
}

bool EvolutionEngine::clear_overrides(const std::string& agent_id) {
    std::error_code ec;
    bool removed = std::filesystem::remove(overrides_path(agent_id), ec);
    if (removed) log_info(kComponent, "cleared overrides for " + agent_id);
    return removed;
}

void EvolutionEngine::on_recovered(const std::string& agent_id) {
    clear_overrides(agent_id);
    ScopedFileLock lock(marker_lock_path(agent_id), kComponent);
    if (marker_state(agent_id) == kMarkerApplied) clear_marker(agent_id);
}

// ---------- path B: model swap ----------

std::string EvolutionEngine::current_model(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lk(config_mu_);
    const WorkerDef* def = config_.find_worker(agent_id);
    return def ? def->model : "";
}

std::optional<std::string> EvolutionEngine::pick_fallback_model(const std::string& agent_id) const {
    std::lock_guard<std::mutex> lk(config_mu_);
    const WorkerDef* def = config_.find_worker(agent_id);
    const std::string current = def ? def->model : "";
    if (def) {
        for (const auto& m : def->fallback_models) {
            if (!m.empty() && m != current) return m;
        }
    }
    if (!config_.default_fallback_model.empty() && config_.default_fallback_model != current) {
        return config_.default_fallback_model;
    }
    return std::nullopt;
}

std::optional<PendingSwap> EvolutionEngine::pending_swap(const std::string& agent_id) const {
    bool missing = false;
    json::Doc d = json::load_file(swap_path(agent_id), &missing);
    if (missing || !d || !json::is_object(d.root)) return std::nullopt;
    PendingSwap s;
    s.agent_id = json::get_string(d.root, "agent_id", agent_id);
    s.new_model = json::get_string(d.root, "new_model");
    s.old_model = json::get_string(d.root, "old_model");
    s.reason = json::get_string(d.root, "reason");
    s.created_at = json::get_int(d.root, "created_at");
    if (s.new_model.empty()) return std::nullopt;
    return s;
}

std::string EvolutionEngine::apply_model_swap(const std::string& agent_id) {
    auto swap = pending_swap(agent_id);
    if (!swap) return "no pending model swap for " + agent_id;

    if (!config_.path.empty()) {
        std::string err;
        try {
            err = update_worker_model(config_.path, agent_id, swap->new_model);
        } catch (const std::exception& e) {
            err = e.what();
        }
        if (!err.empty()) return err;
    }
    {
        std::lock_guard<std::mutex> lk(config_mu_);
        for (auto& w : config_.workers) {
            if (w.id == agent_id) w.model = swap->new_model;
        }
    }

    std::error_code ec;
    std::filesystem::remove(swap_path(agent_id), ec);
    {
        ScopedFileLock lock(marker_lock_path(agent_id), kComponent);
        clear_marker(agent_id);
    }

    json::Doc d = json::new_object();
    json::put_int(d.root, "ts", clock_());
    json::put_string(d.root, "event", "model_swap_applied");
    json::put_string(d.root, "agent_id", agent_id);
    json::put_string(d.root, "old_model", swap->old_model);
    json::put_string(d.root, "new_model", swap->new_model);
    std::string err = log_.append_json_line(json::dump(d.root));
    if (!err.empty()) log_warn(kComponent, "evolution log append failed: " + err);
    log_info(kComponent, "model for " + agent_id + " is now " + swap->new_model);
    return "";
}

bool EvolutionEngine::discard_model_swap(const std::string& agent_id) {
    std::error_code ec;
    bool removed = std::filesystem::remove(swap_path(agent_id), ec);
    if (removed) {
        ScopedFileLock lock(marker_lock_path(agent_id), kComponent);
        clear_marker(agent_id);
    }
    return removed;
}

// ---------- path C: role restructure vote ----------

static PendingVote vote_from_json(json_object* o, const std::string& agent_id) {
    PendingVote v;
    v.agent_id = json::get_string(o, "agent_id", agent_id);
    v.proposal = json::get_string(o, "proposal");
    v.votes_for = json::get_string_array(o, "votes_for");
    v.votes_against = json::get_string_array(o, "votes_against");
    v.created_at = json::get_int(o, "created_at");
    return v;
}

VoteOutcome EvolutionEngine::cast_vote(const std::string& agent_id, const std::string& voter_id, bool approve) {
    VoteOutcome out;
    auto lock_path = vote_path(agent_id);
    lock_path += ".lock";
    ScopedFileLock lock(lock_path, kComponent);

    bool missing = false;
    json::Doc d = json::load_file(vote_path(agent_id), &missing);
    if (missing || !d || !json::is_object(d.root)) return out;
    PendingVote v = vote_from_json(d.root, agent_id);

    std::vector<std::string> team;
    std::string role;
    {
        std::lock_guard<std::mutex> lk(config_mu_);
        team = config_.worker_ids();
        if (const WorkerDef* def = config_.find_worker(agent_id)) role = def->role;
    }
    const int team_size = std::max<int>(1, static_cast<int>(team.size()));
    out.quorum = team_size / 2 + 1;
    out.votes_for = static_cast<int>(v.votes_for.size());
    out.votes_against = static_cast<int>(v.votes_against.size());

    if (!team.empty() && std::find(team.begin(), team.end(), voter_id) == team.end()) {
        out.status = VoteStatus::NOT_A_TEAMMATE;
        return out;
    }
    auto voted = [&](const std::vector<std::string>& xs) {
        return std::find(xs.begin(), xs.end(), voter_id) != xs.end();
    };
    if (voted(v.votes_for) || voted(v.votes_against)) {
        out.status = VoteStatus::ALREADY_VOTED;
        return out;
    }

    (approve ? v.votes_for : v.votes_against).push_back(voter_id);
    out.votes_for = static_cast<int>(v.votes_for.size());
    out.votes_against = static_cast<int>(v.votes_against.size());
    const int total = out.votes_for + out.votes_against;

    if (total < out.quorum) {
        json::put_string_array(d.root, "votes_for", v.votes_for);
        json::put_string_array(d.root, "votes_against", v.votes_against);
        std::string err = json::write_atomic(vote_path(agent_id), json::dump(d.root, true) + "\n");
        if (!err.empty()) log_error(kComponent, "cannot record vote on " + agent_id + ": " + err);
        out.status = VoteStatus::WAITING_FOR_QUORUM;
        return out;
    }

    const double ratio = static_cast<double>(out.votes_for) / static_cast<double>(total);
    if (ratio >= config_.reputation.role_vote_threshold) {
        out.status = VoteStatus::APPROVED;
        std::vector<std::string> lines{
            role.empty() ? "Only accept tasks that clearly match your assigned role; decline anything else."
                         : "Only accept tasks that clearly match your role (" + role + "); decline anything else.",
            "Restructure reason: " + v.proposal,
        };
        std::string header = std::string(kRestructureHeader) + " (" + utc_date(clock_()) + ")";
        append_override_block(agent_id, header, lines);
        log_info(kComponent, "role restructure for " + agent_id + " approved");
    } else {
        out.status = VoteStatus::REJECTED;
        log_info(kComponent, "role restructure for " + agent_id + " rejected");
    }

    std::error_code ec;
    std::filesystem::remove(vote_path(agent_id), ec);
    {
        ScopedFileLock mlock(marker_lock_path(agent_id), kComponent);
        clear_marker(agent_id);
    }

    json::Doc ev = json::new_object();
    json::put_int(ev.root, "ts", clock_());
    json::put_string(ev.root, "event", "vote_resolved");
    json::put_string(ev.root, "agent_id", agent_id);
    json::put_string(ev.root, "status", vote_status_name(out.status));
    json::put_int(ev.root, "votes_for", out.votes_for);
    json::put_int(ev.root, "votes_against", out.votes_against);
    std::string log_err = log_.append_json_line(json::dump(ev.root));
    if (!log_err.empty()) log_warn(kComponent, "evolution log append failed: " + log_err);
    return out;
}

std::vector<PendingVote> EvolutionEngine::pending_votes() const {
    std::vector<PendingVote> out;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(paths_.pending_votes(), ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        bool missing = false;
        json::Doc d = json::load_file(entry.path(), &missing);
        if (!d || !json::is_object(d.root)) continue;
        out.push_back(vote_from_json(d.root, entry.path().stem().string()));
    }
    std::sort(out.begin(), out.end(),
              [](const PendingVote& a, const PendingVote& b) { return a.agent_id < b.agent_id; });
    return out;
}

} // namespace hive
