#include "test_common.h"
#include "hive/chat.h"

using namespace hive;

// Fails a fixed number of times, then answers.
class FlakyChat final : public IChat {
public:
    FlakyChat(std::string name, int failures) : name_(std::move(name)), failures_(failures) {}

    ChatResult chat(const std::vector<ChatMessage>&, const std::string&) override {
        calls++;
        ChatResult r;
        r.provider = name_;
        if (failures_ < 0 || calls <= failures_) {
            r.error = name_ + " unavailable";
            return r;
        }
        r.text = "from " + name_;
        return r;
    }
    std::string name() const override { return name_; }

    int calls{0};

private:
    std::string name_;
    int failures_;  // < 0: always fail
};

int main() {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "hive_test_chat";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    const std::vector<ChatMessage> msgs{{"user", "ping"}};

    // Test 1: command provider, JSON reply
    {
        auto cmd = write_script(dir / "json.sh", "cat >/dev/null\nprintf '{\"text\":\"pong\"}'");
        CommandChat c(cmd, 5000);
        ChatResult r = c.chat(msgs, "m");
        expect_true(r.ok(), "json reply ok: " + r.error);
        expect_true(r.text == "pong", "text extracted");
    }

    // Test 2: request reaches the command on stdin; a non-JSON reply is the text
    {
        auto cmd = write_script(dir / "echo.sh", "tr -d '{}'");
        CommandChat c(cmd, 5000);
        ChatResult r = c.chat(msgs, "model-x");
        expect_true(r.ok(), "echo ok: " + r.error);
        expect_true(r.text.find("\"model-x\"") != std::string::npos, "model forwarded");
        expect_true(r.text.find("\"ping\"") != std::string::npos, "messages forwarded");
    }

    // Test 3: failures are values
    {
        auto err_cmd = write_script(dir / "err.sh", "cat >/dev/null\nprintf '{\"error\":\"quota\"}'");
        ChatResult r1 = CommandChat(err_cmd, 5000).chat(msgs, "m");
        expect_true(!r1.ok() && r1.error.find("quota") != std::string::npos, "provider error surfaced");

        auto exit_cmd = write_script(dir / "exit.sh", "cat >/dev/null\nexit 3");
        ChatResult r2 = CommandChat(exit_cmd, 5000).chat(msgs, "m");
        expect_true(!r2.ok(), "non-zero exit is an error");

        ChatResult r3 = CommandChat("", 5000).chat(msgs, "m");
        expect_true(!r3.ok(), "empty command is an error");
    }

    // Test 4: retries, breaker and failover
    {
        int64_t now = 0;
        std::vector<std::unique_ptr<IChat>> providers;
        auto* a = new FlakyChat("a", -1);
        auto* b = new FlakyChat("b", 0);
        providers.emplace_back(a);
        providers.emplace_back(b);
        ResiliencePolicy pol;
        pol.attempts_per_provider = 2;
        pol.fail_threshold = 3;
        pol.cooldown_ms = 1000;
        ResilientChat rc(std::move(providers), pol, [&] { return now; });

        ChatResult r = rc.chat(msgs, "m");
        expect_true(r.ok() && r.text == "from b", "fails over to b");
        expect_eq_ll(a->calls, 2, "a retried per policy");
        expect_true(!rc.breaker_open(0), "two failures keep the breaker closed");

        rc.chat(msgs, "m");
        expect_eq_ll(a->calls, 3, "third failure trips the breaker");
        expect_true(rc.breaker_open(0), "breaker open");

        rc.chat(msgs, "m");
        expect_eq_ll(a->calls, 3, "open breaker skips a");

        now += 1001;
        expect_true(!rc.breaker_open(0), "breaker half-open after cooldown");
        rc.chat(msgs, "m");
        expect_true(a->calls > 3, "a tried again after cooldown");
    }

    // Test 5: recovery closes the breaker
    {
        std::vector<std::unique_ptr<IChat>> providers;
        auto* a = new FlakyChat("a", 1);
        providers.emplace_back(a);
        ResilientChat rc(std::move(providers));
        ChatResult r = rc.chat(msgs, "m");
        expect_true(r.ok() && r.text == "from a", "second attempt succeeds");

        std::vector<std::unique_ptr<IChat>> none;
        ResilientChat empty(std::move(none));
        expect_true(!empty.chat(msgs, "m").ok(), "no providers is an error");
    }

    // Test 6: factory
    {
        ChatSettings s;
        expect_true(make_chat(s) == nullptr, "no command, no chat");
        s.cmd = "/bin/true";
        expect_true(make_chat(s) != nullptr, "command configured");
    }

    fs::remove_all(dir, ec);
    std::cout << "test_chat: ALL PASSED\n";
    return 0;
}
