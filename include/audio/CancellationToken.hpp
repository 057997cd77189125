#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

// Wakes a waiting consumer when a producer pushes data or a stop is requested.
// notify() never takes the lock, so it is safe from an audio callback; a
// wakeup racing the consumer's predicate check is caught by the wait timeout.
class WakeSignal {
public:
    void notify() {
        seq_.fetch_add(1, std::memory_order_release);
        cv_.notify_all();
    }

    uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

    // Returns true if the sequence moved past `seen` before the timeout
    bool waitFor(uint64_t seen, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx_);
        return cv_.wait_for(lock, timeout, [&] { return sequence() != seen; });
    }

private:
    std::mutex              mtx_;
    std::condition_variable cv_;
    std::atomic<uint64_t>   seq_{0};
};

// Cooperative stop flag shared between the thread that cancels and the
// loops that poll it. Copies share state. Whoever cancels also joins.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() {
        state_->cancelled.store(true, std::memory_order_release);
        state_->wake.notify();
    }

    bool isCancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    WakeSignal& wake() const { return state_->wake; }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        WakeSignal        wake;
    };
    std::shared_ptr<State> state_;
};
