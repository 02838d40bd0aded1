#include "hive/runtime_process.h"
#include "hive/log.h"
#include "hive/proc.h"

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>

namespace hive {

static const char* kComponent = "runtime.process";
static constexpr int kGracePollMs = 500;
static constexpr int kTermWaitMs = 3000;

ArgvBuilder default_argv_builder(const std::string& worker_bin, const std::filesystem::path& config_path) {
    std::string bin = worker_bin;
    if (bin.empty()) {
        std::error_code ec;
        auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        bin = ec ? "hive_cli" : self.string();
    }
    return [bin, cfg = config_path.string()](const WorkerDef& def) {
        return std::vector<std::string>{bin, "worker", "--config", cfg, "--id", def.id};
    };
}

ProcessRuntime::ProcessRuntime(ArgvBuilder argv_builder, Mailbox* mailbox, int stop_grace_ms)
    : argv_builder_(std::move(argv_builder)), mailbox_(mailbox), stop_grace_ms_(stop_grace_ms) {}

void ProcessRuntime::start(const WorkerDef& def, const SwarmConfig&) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = children_.find(def.id);
    if (it != children_.end() && proc_alive(it->second)) {
        log_debug(kComponent, def.id + " already running (pid " + std::to_string(it->second) + ")");
        return;
    }

    pid_t pid = -1;
    std::string err = proc_spawn(argv_builder_(def), "", {"HIVE_WORKER_ID=" + def.id}, &pid);
    if (!err.empty()) throw std::runtime_error("cannot start worker " + def.id + ": " + err);
    children_[def.id] = pid;
    log_info(kComponent, "started " + def.id + " (pid " + std::to_string(pid) + ")");
}

bool ProcessRuntime::is_alive(const std::string& id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = children_.find(id);
    return it != children_.end() && proc_alive(it->second);
}

std::vector<std::string> ProcessRuntime::agent_ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& [id, pid] : children_) out.push_back(id);
    return out;
}

std::optional<pid_t> ProcessRuntime::pid_of(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = children_.find(id);
    if (it == children_.end()) return std::nullopt;
    return it->second;
}

void ProcessRuntime::stop_children(const std::map<std::string, pid_t>& children) {
    if (mailbox_) {
        for (const auto& [id, pid] : children) {
            std::string err = mailbox_->send(id, "", kMsgShutdown);
            if (!err.empty()) log_warn(kComponent, "shutdown request to " + id + " failed: " + err);
        }
    }

    auto running = [&] {
        std::vector<std::pair<std::string, pid_t>> out;
        for (const auto& c : children) {
            if (proc_alive(c.second)) out.push_back(c);
        }
        return out;
    };

    for (int waited = 0; waited < stop_grace_ms_; waited += kGracePollMs) {
        if (running().empty()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(kGracePollMs));
    }

    for (const auto& [id, pid] : running()) {
        log_warn(kComponent, id + " ignored shutdown, sending SIGTERM");
        proc_signal(pid, SIGTERM);
    }
    for (const auto& [id, pid] : running()) {
        if (proc_wait_exit(pid, kTermWaitMs)) continue;
        log_error(kComponent, id + " ignored SIGTERM, sending SIGKILL");
        proc_signal(pid, SIGKILL);
        proc_wait_exit(pid, kTermWaitMs);
    }
}

void ProcessRuntime::stop(const std::string& id) {
    std::map<std::string, pid_t> one;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = children_.find(id);
        if (it == children_.end()) return;
        one.insert(*it);
    }
    stop_children(one);
    std::lock_guard<std::mutex> lk(mu_);
    children_.erase(id);
    log_info(kComponent, "stopped " + id);
}

void ProcessRuntime::stop_all() {
    std::map<std::string, pid_t> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        all = children_;
    }
    if (all.empty()) return;
    stop_children(all);
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, pid] : all) children_.erase(id);
    log_info(kComponent, "stopped " + std::to_string(all.size()) + " worker(s)");
}

void ProcessRuntime::ensure_running(const std::string& id, const SwarmConfig&) {
    throw std::runtime_error("process runtime cannot restart " + id + " in place; start it again instead");
}

std::vector<std::string> ProcessRuntime::prune_dead() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> dead;
    for (auto it = children_.begin(); it != children_.end();) {
        if (proc_alive(it->second)) {
            ++it;
            continue;
        }
        dead.push_back(it->first);
        it = children_.erase(it);
    }
    return dead;
}

} // namespace hive
