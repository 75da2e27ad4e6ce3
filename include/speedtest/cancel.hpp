#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

/**
* @file
* @brief Cooperative cancellation shared by the server's long-running loops.
*/

namespace speedtest {

/**
* @brief Copyable handle on a one-way stop flag.
*
* Every copy refers to the same state. Loops poll @ref stop_requested at
* iteration boundaries and sleep through @ref wait_for, which wakes as soon
* as @ref request_stop is called, so shutdown latency is bounded by one poll
* timeout rather than one full sleep.
*/
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void request_stop() {
        {
            std::lock_guard<std::mutex> lg(state_->mu);
            state_->stopped.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    bool stop_requested() const { return state_->stopped.load(std::memory_order_acquire); }

    /**
     * @brief Sleep up to @p timeout, or less if a stop is requested meanwhile.
     * @return true if a stop has been requested.
     */
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lk(state_->mu);
        return state_->cv.wait_for(lk, timeout, [this] {
            return state_->stopped.load(std::memory_order_acquire);
        });
    }

private:
    struct State {
        std::atomic<bool>       stopped{false};
        std::mutex              mu;
        std::condition_variable cv;
    };
    std::shared_ptr<State> state_;
};

} // namespace speedtest
