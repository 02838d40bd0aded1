#include "hive/runtime_inproc.h"
#include "hive/log.h"

#include <stdexcept>

namespace hive {

static const char* kComponent = "runtime.inproc";
static constexpr int64_t kBusyPollMs = 50;
static constexpr auto kStopLogEvery = std::chrono::seconds(10);

CooperativeRuntime::CooperativeRuntime(WorkerServices services, int poll_interval_ms)
    : services_(std::move(services)), poll_interval_ms_(poll_interval_ms) {
    thread_ = std::thread([this] { loop_main(); });
}

CooperativeRuntime::~CooperativeRuntime() {
    stop_all();
    timers_.shutdown();
    if (thread_.joinable()) thread_.join();
}

void CooperativeRuntime::loop_main() {
    TimerQueue<std::shared_ptr<Slot>>::Item item;
    while (timers_.pop(item)) {
        run_slot(item.value);
    }
}

void CooperativeRuntime::finish_slot(const std::shared_ptr<Slot>& slot, const char* why) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        slot->finished.store(true);
    }
    finished_cv_.notify_all();
    log_info(kComponent, slot->def.id + " finished (" + why + ")");
}

void CooperativeRuntime::run_slot(const std::shared_ptr<Slot>& slot) {
    if (slot->finished.load()) return;

    if (slot->cancel.load()) {
        if (slot->loop->drain_for_cancel()) {
            finish_slot(slot, "stopped");
        } else {
            timers_.push_after(kBusyPollMs, slot);
        }
        return;
    }

    TickResult r;
    try {
        r = slot->loop->tick();
    } catch (const std::exception& e) {
        log_error(kComponent, slot->def.id + " tick failed: " + e.what());
        if (slot->loop->busy()) {
            slot->cancel.store(true);
            timers_.push_after(kBusyPollMs, slot);
        } else {
            finish_slot(slot, "error");
        }
        return;
    }

    switch (r) {
        case TickResult::EXIT:
            finish_slot(slot, "exit");
            break;
        case TickResult::IDLE:
            timers_.push_after(poll_interval_ms_, slot);
            break;
        case TickResult::WORKED:
            timers_.push_after(slot->loop->busy() ? kBusyPollMs : 0, slot);
            break;
    }
}

void CooperativeRuntime::start(const WorkerDef& def, const SwarmConfig& config) {
    auto slot = std::make_shared<Slot>();
    slot->def = def;
    slot->loop = std::make_unique<WorkerLoop>(def, loop_settings_from(config), services_, /*offload=*/true);
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = slots_.find(def.id);
        if (it != slots_.end() && !it->second->finished.load()) {
            log_debug(kComponent, def.id + " already running");
            return;
        }
        slots_[def.id] = slot;
    }
    timers_.push_after(0, slot);
    log_info(kComponent, "started " + def.id);
}

bool CooperativeRuntime::is_alive(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = slots_.find(id);
    return it != slots_.end() && !it->second->finished.load();
}

std::vector<std::string> CooperativeRuntime::agent_ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& [id, slot] : slots_) out.push_back(id);
    return out;
}

void CooperativeRuntime::wait_finished(const std::vector<std::shared_ptr<Slot>>& slots) {
    std::unique_lock<std::mutex> lk(mu_);
    auto all_done = [&] {
        for (const auto& s : slots) {
            if (!s->finished.load()) return false;
        }
        return true;
    };
    while (!finished_cv_.wait_for(lk, kStopLogEvery, all_done)) {
        log_warn(kComponent, "still waiting for in-flight tasks to drain");
    }
}

void CooperativeRuntime::stop(const std::string& id) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = slots_.find(id);
        if (it == slots_.end()) return;
        slot = it->second;
    }
    slot->cancel.store(true);
    if (!slot->finished.load()) {
        // Wake the slot now rather than at its next scheduled tick.
        timers_.push_after(0, slot);
        wait_finished({slot});
    }
    std::lock_guard<std::mutex> lk(mu_);
    auto it = slots_.find(id);
    if (it != slots_.end() && it->second == slot) slots_.erase(it);
}

void CooperativeRuntime::stop_all() {
    std::vector<std::shared_ptr<Slot>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, slot] : slots_) all.push_back(slot);
    }
    for (const auto& s : all) {
        s->cancel.store(true);
        if (!s->finished.load()) timers_.push_after(0, s);
    }
    wait_finished(all);
    std::lock_guard<std::mutex> lk(mu_);
    slots_.clear();
}

void CooperativeRuntime::ensure_running(const std::string& id, const SwarmConfig& config) {
    WorkerDef def;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = slots_.find(id);
        if (it != slots_.end()) {
            if (!it->second->finished.load()) return;
            def = it->second->def;
        } else if (const WorkerDef* d = config.find_worker(id)) {
            def = *d;
        } else {
            throw std::runtime_error("unknown worker " + id);
        }
    }
    log_info(kComponent, "restarting " + id);
    start(def, config);
}

std::vector<std::string> CooperativeRuntime::prune_dead() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> dead;
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (!it->second->finished.load()) {
            ++it;
            continue;
        }
        dead.push_back(it->first);
        it = slots_.erase(it);
    }
    return dead;
}

} // namespace hive
