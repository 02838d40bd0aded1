#pragma once

#include "hive/config.h"
#include "hive/ids.h"
#include "hive/proc.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hive {

struct ChatMessage {
    std::string role;     // "system" | "user" | "assistant"
    std::string content;
};

struct ChatResult {
    std::string text;
    std::string error;    // non-empty on failure
    std::string provider;

    bool ok() const { return error.empty(); }
};

// Chat capability. Failures are reported in ChatResult::error, never thrown.
class IChat {
public:
    virtual ~IChat() = default;
    virtual ChatResult chat(const std::vector<ChatMessage>& messages, const std::string& model) = 0;
    virtual std::string name() const = 0;
};

// CommandChat: external command provider.
//
// Contract:
// - stdin:  {"model":"...","messages":[{"role":"...","content":"..."},...]}
// - stdout: {"text":"..."}  (a plain-text reply is accepted as-is)
// Timeout: ChatSettings::timeout_ms, or HIVE_CHAT_TIMEOUT_MS when that is unset.
class CommandChat final : public IChat {
public:
    explicit CommandChat(std::string cmd, int timeout_ms = 0);

    ChatResult chat(const std::vector<ChatMessage>& messages, const std::string& model) override;
    std::string name() const override { return "cmd"; }

private:
    std::string cmd_;
    ProcLimits lim_;
};

struct ResiliencePolicy {
    int attempts_per_provider{2};
    int fail_threshold{3};      // consecutive failures that open a provider's breaker
    int64_t cooldown_ms{30000}; // how long an open breaker skips the provider
};

// ResilientChat: retries each provider, then fails over to the next in order.
//
// Each provider has its own circuit breaker: after fail_threshold consecutive
// failures it is skipped for cooldown_ms, then retried (half-open). Any
// success closes it again.
class ResilientChat final : public IChat {
public:
    ResilientChat(std::vector<std::unique_ptr<IChat>> providers, ResiliencePolicy policy = {},
                  Clock clock = system_clock_ms());

    ChatResult chat(const std::vector<ChatMessage>& messages, const std::string& model) override;
    std::string name() const override { return "resilient"; }

    // Test hook: whether provider i is currently skipped.
    bool breaker_open(size_t i) const;

private:
    struct Slot {
        std::unique_ptr<IChat> provider;
        int consecutive_fail{0};
        int64_t disabled_until_ms{0};
    };

    std::vector<Slot> slots_;
    ResiliencePolicy policy_;
    Clock clock_;
    mutable std::mutex mu_;
};

// Builds the configured chat capability; nullptr when chat.cmd is empty.
std::unique_ptr<IChat> make_chat(const ChatSettings& settings);

} // namespace hive
