#include "hive/chat.h"
#include "hive/config.h"
#include "hive/json_util.h"
#include "hive/log.h"

#include <algorithm>
#include <cstdlib>

namespace hive {

static const char* kComponent = "chat";

CommandChat::CommandChat(std::string cmd, int timeout_ms) : cmd_(std::move(cmd)) {
    lim_.timeout_ms = timeout_ms > 0 ? timeout_ms : env_int("HIVE_CHAT_TIMEOUT_MS", 60000);
    lim_.stdout_max_bytes = 2 * 1024 * 1024;
}

ChatResult CommandChat::chat(const std::vector<ChatMessage>& messages, const std::string& model) {
    ChatResult r;
    r.provider = name();

    std::vector<std::string> argv = split_argv_quoted(cmd_);
    if (argv.empty()) {
        r.error = "chat cmd parsed to empty argv";
        return r;
    }

    json::Doc req = json::new_object();
    json::put_string(req.root, "model", model);
    json_object* arr = json_object_new_array();
    for (const auto& m : messages) {
        json_object* mo = json_object_new_object();
        json::put_string(mo, "role", m.role);
        json::put_string(mo, "content", m.content);
        json_object_array_add(arr, mo);
    }
    json_object_object_add(req.root, "messages", arr);

    ProcResult pr;
    if (!proc_run_capture_stdin(argv, "", json::dump(req.root), lim_, &pr)) {
        r.error = "chat cmd failed to start: " + pr.error;
        return r;
    }
    if (pr.timed_out) {
        r.error = "chat cmd timed out after " + std::to_string(lim_.timeout_ms) + "ms";
        return r;
    }
    if (pr.exit_code != 0) {
        r.error = "chat cmd exit_code=" + std::to_string(pr.exit_code);
        return r;
    }

    json::Doc reply = json::parse(pr.output);
    if (reply && json::is_object(reply.root)) {
        if (auto err = json::get_opt_string(reply.root, "error"); err && !err->empty()) {
            r.error = "chat provider error: " + *err;
            return r;
        }
        r.text = json::get_string(reply.root, "text");
    } else {
        r.text = pr.output;
    }
    if (r.text.empty()) r.error = "chat cmd returned an empty reply";
    return r;
}

ResilientChat::ResilientChat(std::vector<std::unique_ptr<IChat>> providers, ResiliencePolicy policy,
                             Clock clock)
    : policy_(policy), clock_(std::move(clock)) {
    for (auto& p : providers) {
        Slot s;
        s.provider = std::move(p);
        slots_.push_back(std::move(s));
    }
}

bool ResilientChat::breaker_open(size_t i) const {
    std::lock_guard<std::mutex> lk(mu_);
    return i < slots_.size() && slots_[i].disabled_until_ms > clock_();
}

ChatResult ResilientChat::chat(const std::vector<ChatMessage>& messages, const std::string& model) {
    ChatResult last;
    last.provider = name();
    last.error = "no chat provider available";

    for (size_t i = 0; i < slots_.size(); i++) {
        Slot& s = slots_[i];
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (s.disabled_until_ms > clock_()) continue;
        }

        for (int attempt = 1; attempt <= std::max(1, policy_.attempts_per_provider); attempt++) {
            ChatResult r = s.provider->chat(messages, model);
            if (r.ok()) {
                std::lock_guard<std::mutex> lk(mu_);
                s.consecutive_fail = 0;
                s.disabled_until_ms = 0;
                return r;
            }
            last = r;
            std::lock_guard<std::mutex> lk(mu_);
            s.consecutive_fail += 1;
            if (s.consecutive_fail >= policy_.fail_threshold) {
                s.disabled_until_ms = clock_() + policy_.cooldown_ms;
                log_warn(kComponent, "provider " + s.provider->name() + " disabled for " +
                         std::to_string(policy_.cooldown_ms) + "ms after " +
                         std::to_string(s.consecutive_fail) + " consecutive failures");
                break;
            }
        }
    }
    return last;
}

std::unique_ptr<IChat> make_chat(const ChatSettings& settings) {
    if (settings.cmd.empty()) return nullptr;
    std::vector<std::unique_ptr<IChat>> providers;
    providers.push_back(std::make_unique<CommandChat>(settings.cmd, settings.timeout_ms));
    return std::make_unique<ResilientChat>(std::move(providers));
}

} // namespace hive
