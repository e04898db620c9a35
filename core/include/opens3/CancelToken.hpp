// One-shot cancellation flag shared between a job's caller and its worker.
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace opens3 {

class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken &) = delete;
    CancelToken &operator=(const CancelToken &) = delete;

    // Sets the flag (idempotent) and wakes every waiter.
    void cancel() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool isCancelled() const { return cancelled_.load(); }

    // Sleeps up to `d`; returns true as soon as the token is cancelled.
    template <class Rep, class Period>
    bool waitFor(const std::chrono::duration<Rep, Period> &d) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, d, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

} // namespace opens3
