#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

namespace hive {

// TimerQueue
// - Thread-safe push/pop of values keyed by a due time (steady-clock ms)
// - pop() blocks until the earliest item is due, or shutdown()
// - Equal due times pop in push order
//
// Drives the cooperative runtime's event loop.
template <typename T>
class TimerQueue {
public:
    struct Item {
        int64_t due_ms{0};
        uint64_t seq{0};
        T value;
    };

    static int64_t now_ms() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
    }

private:
    struct Cmp {
        bool operator()(const Item& a, const Item& b) const {
            // std::priority_queue pops the "largest" element; invert so the earliest due comes first.
            if (a.due_ms != b.due_ms) return a.due_ms > b.due_ms;
            return a.seq > b.seq;
        }
    };

public:
    TimerQueue() = default;

    void push_at(int64_t due_ms, T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return;
        q_.push(Item{due_ms, seq_++, std::move(value)});
        cv_.notify_one();
    }

    void push_after(int64_t delay_ms, T value) { push_at(now_ms() + delay_ms, std::move(value)); }

    // Returns false when shut down.
    bool pop(Item& out) {
        std::unique_lock<std::mutex> lk(mu_);
        for (;;) {
            if (closed_) return false;
            if (q_.empty()) {
                cv_.wait(lk);
                continue;
            }
            const int64_t due = q_.top().due_ms;
            const int64_t now = now_ms();
            if (due <= now) break;
            cv_.wait_for(lk, std::chrono::milliseconds(due - now));
        }
        out = q_.top();
        q_.pop();
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::priority_queue<Item, std::vector<Item>, Cmp> q_;
    uint64_t seq_{0};
    bool closed_{false};
};

} // namespace hive
