#pragma once
#include "logger.h"
#include "sync_errors.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

// Shared stop flag for one worker. wait_for() returns early when cancelled.
class CancellationToken {
public:
    void cancel() {
        { std::lock_guard<std::mutex> lk(m_); cancelled_.store(true); }
        cv_.notify_all();
    }
    // Only while no one is waiting on the token.
    void reset() { cancelled_.store(false); }
    bool cancelled() const { return cancelled_.load(); }
    void throw_if_cancelled() const { if (cancelled()) throw CancelledError(); }

    // true if the full duration elapsed, false if cancelled meanwhile
    bool wait_for(std::chrono::milliseconds d) {
        std::unique_lock<std::mutex> lk(m_);
        return !cv_.wait_for(lk, d, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{ false };
    std::mutex m_;
    std::condition_variable cv_;
};

struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{ 500 };
    std::chrono::milliseconds max_backoff{ 8000 };
};

// Runs op() up to max_attempts times with doubling backoff. Only exceptions of
// type Retryable are retried; anything else propagates immediately, as does the
// last Retryable failure.
template <typename Retryable, typename Op>
auto with_retry(const RetryPolicy& policy, CancellationToken* cancel, const std::string& what, Op&& op)
    -> decltype(op()) {
    std::chrono::milliseconds backoff = policy.initial_backoff;
    const int attempts = std::max(1, policy.max_attempts);
    for (int attempt = 1;; ++attempt) {
        if (cancel) cancel->throw_if_cancelled();
        try {
            return op();
        }
        catch (const Retryable& e) {
            if (attempt >= attempts) throw;
            log_warn(what + " failed (attempt " + std::to_string(attempt) + "/" +
                std::to_string(attempts) + "): " + e.what() + "; retrying in " +
                std::to_string(backoff.count()) + "ms");
        }
        if (cancel) {
            if (!cancel->wait_for(backoff)) throw CancelledError();
        }
        else {
            std::this_thread::sleep_for(backoff);
        }
        backoff = std::min(backoff * 2, policy.max_backoff);
    }
}
