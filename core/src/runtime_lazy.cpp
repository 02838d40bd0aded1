#include "hive/runtime_lazy.h"
#include "hive/heartbeat.h"
#include "hive/log.h"

#include <algorithm>
#include <stdexcept>

namespace hive {

static const char* kComponent = "runtime.lazy";

LazyRuntime::LazyRuntime(std::unique_ptr<AgentRuntime> delegate, RuntimeSettings settings, WorkQueue& queue,
                         std::filesystem::path heartbeat_dir, Clock clock, int64_t recovery_interval_ms)
    : delegate_(std::move(delegate)),
      settings_(std::move(settings)),
      queue_(queue),
      heartbeat_dir_(std::move(heartbeat_dir)),
      clock_(std::move(clock)),
      recovery_interval_ms_(recovery_interval_ms) {
    monitor_ = std::thread([this] { monitor_main(); });
}

LazyRuntime::~LazyRuntime() {
    {
        std::lock_guard<std::mutex> lk(stop_mu_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    if (monitor_.joinable()) monitor_.join();
}

void LazyRuntime::monitor_main() {
    const auto interval = std::chrono::milliseconds(std::max(10, settings_.monitor_interval_ms));
    std::unique_lock<std::mutex> lk(stop_mu_);
    while (!stop_cv_.wait_for(lk, interval, [this] { return stopping_; })) {
        lk.unlock();
        try {
            tick_monitor();
        } catch (const std::exception& e) {
            log_error(kComponent, std::string("monitor pass failed: ") + e.what());
        }
        lk.lock();
    }
}

bool LazyRuntime::is_always_on(const std::string& id) const {
    return std::find(settings_.always_on.begin(), settings_.always_on.end(), id) != settings_.always_on.end();
}

void LazyRuntime::touch(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    touched_[id] = clock_();
}

void LazyRuntime::start(const WorkerDef& def, const SwarmConfig& config) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        registered_[def.id] = def;
        config_ = config;
    }
    delegate_->start(def, config);
    touch(def.id);
}

void LazyRuntime::start_all(const SwarmConfig& config) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        config_ = config;
        for (const auto& w : config.workers) registered_[w.id] = w;
    }
    for (const auto& w : config.workers) {
        if (!is_always_on(w.id)) continue;
        delegate_->start(w, config);
        touch(w.id);
    }
    log_info(kComponent, "registered " + std::to_string(config.workers.size()) + " worker(s), " +
             std::to_string(settings_.always_on.size()) + " always on");
}

bool LazyRuntime::is_alive(const std::string& id) {
    return delegate_->is_alive(id);
}

std::vector<std::string> LazyRuntime::agent_ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& [id, def] : registered_) out.push_back(id);
    return out;
}

bool LazyRuntime::all_alive() {
    for (const auto& id : agent_ids()) {
        if (is_always_on(id) && !delegate_->is_alive(id)) return false;
    }
    std::lock_guard<std::mutex> lk(mu_);
    return !registered_.empty();
}

void LazyRuntime::stop(const std::string& id) {
    delegate_->stop(id);
}

void LazyRuntime::stop_all() {
    delegate_->stop_all();
}

void LazyRuntime::ensure_running(const std::string& id, const SwarmConfig& config) {
    if (delegate_->is_alive(id)) return;
    WorkerDef def;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = registered_.find(id);
        if (it != registered_.end()) {
            def = it->second;
        } else if (const WorkerDef* d = config.find_worker(id)) {
            def = *d;
        } else {
            throw std::runtime_error("unknown worker " + id);
        }
    }
    start(def, config);
}

std::vector<std::string> LazyRuntime::prune_dead() {
    return delegate_->prune_dead();
}

int64_t LazyRuntime::last_activity(const std::string& id, const std::vector<Task>& tasks) const {
    int64_t newest = 0;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = touched_.find(id);
        if (it != touched_.end()) newest = it->second;
    }
    if (auto hb = read_heartbeat(heartbeat_dir_, id)) newest = std::max(newest, hb->ts);
    for (const auto& t : tasks) {
        if (t.agent_id != id) continue;
        if (t.status == TaskStatus::CLAIMED || t.status == TaskStatus::REVIEW) return clock_();
    }
    return newest;
}

void LazyRuntime::maybe_recover() {
    const int64_t now = clock_();
    if (last_recovery_ms_ != 0 && now - last_recovery_ms_ < recovery_interval_ms_) return;
    last_recovery_ms_ = now;
    auto recovered = queue_.recover_stale_tasks();
    if (!recovered.empty()) {
        log_info(kComponent, "recovered " + std::to_string(recovered.size()) + " stale task(s)");
    }
}

int LazyRuntime::tick_monitor() {
    std::map<std::string, WorkerDef> registered;
    SwarmConfig config;
    {
        std::lock_guard<std::mutex> lk(mu_);
        registered = registered_;
        config = config_;
    }
    if (registered.empty()) return 0;

    maybe_recover();
    const std::vector<Task> tasks = queue_.list();
    int changed = 0;

    std::set<std::string> alive;
    for (const auto& [id, def] : registered) {
        if (delegate_->is_alive(id)) alive.insert(id);
    }

    auto start_one = [&](const WorkerDef& def, const std::string& why) {
        try {
            delegate_->start(def, config);
        } catch (const std::exception& e) {
            log_error(kComponent, "cannot start " + def.id + ": " + e.what());
            return;
        }
        touch(def.id);
        alive.insert(def.id);
        changed++;
        log_info(kComponent, "started " + def.id + " on demand (" + why + ")");
    };

    bool roleless_pending = false;
    for (const auto& t : tasks) {
        if (t.status != TaskStatus::PENDING) continue;
        if (!t.required_role || t.required_role->empty()) {
            roleless_pending = true;
            continue;
        }
        const std::string& role = *t.required_role;
        bool served = false;
        for (const auto& id : alive) {
            if (role_matches(role, registered[id].role, id)) {
                served = true;
                break;
            }
        }
        if (served) continue;
        for (const auto& [id, def] : registered) {
            if (alive.count(id) == 0 && role_matches(role, def.role, id)) {
                start_one(def, "role " + role);
                break;
            }
        }
    }
    if (roleless_pending && alive.empty()) {
        start_one(registered.begin()->second, "pending work");
    }

    const int64_t now = clock_();
    const int64_t idle_ms = static_cast<int64_t>(settings_.idle_shutdown_sec) * 1000;
    for (const auto& id : alive) {
        if (is_always_on(id)) continue;
        const int64_t last = last_activity(id, tasks);
        if (now - last <= idle_ms) continue;
        log_info(kComponent, "stopping " + id + " after " + std::to_string((now - last) / 1000) + "s idle");
        delegate_->stop(id);
        changed++;
    }
    return changed;
}

} // namespace hive
