#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace pyguard {

// Shared cancel flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    void cancel() const {
        {
            std::lock_guard<std::mutex> lock(state_->mtx);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    bool is_cancelled() const { return state_->cancelled.load(); }

    // Sleeps up to `d`. Returns true when woken by cancel().
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock<std::mutex> lock(state_->mtx);
        return state_->cv.wait_for(lock, d, [this] { return state_->cancelled.load(); });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mtx;
        std::condition_variable cv;
    };
    std::shared_ptr<State> state_;
};

}
