// task.hpp - Wakers and shared exit-status cells
#pragma once

#include "errno.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace rvix {

// Handle that asks whoever is polling an awaitable to poll it again.
// A default-constructed waker does nothing.
// Copies of one waker compare equal.
class Waker {
public:
    Waker() = default;
    explicit Waker(std::function<void()> fn)
        : fn_(std::make_shared<const std::function<void()>>(std::move(fn))) {}
    // Retired once `owner` is gone
    Waker(std::function<void()> fn, std::weak_ptr<const void> owner)
        : fn_(std::make_shared<const std::function<void()>>(std::move(fn))),
          owner_(std::move(owner)),
          owned_(true) {}

    void wake() const {
        if (fn_ && *fn_) (*fn_)();
    }

    bool same_as(const Waker& other) const { return fn_ == other.fn_; }

    // Nobody is polling through this waker any more
    bool expired() const { return owned_ && owner_.expired(); }

    explicit operator bool() const { return fn_ && *fn_; }

private:
    std::shared_ptr<const std::function<void()>> fn_;
    std::weak_ptr<const void> owner_;
    bool owned_ = false;
};

// Keeps the wakers registered by pollers until the next event.
class WakerList {
public:
    // A waker already in the list is not added twice. Retired wakers are
    // dropped here, so a list nobody wakes stays bounded.
    void add(const Waker& waker) {
        if (!waker) return;
        wakers_.erase(std::remove_if(wakers_.begin(), wakers_.end(),
                                     [](const Waker& w) { return w.expired(); }),
                      wakers_.end());
        for (const auto& w : wakers_) {
            if (w.same_as(waker)) return;
        }
        wakers_.push_back(waker);
    }

    size_t size() const { return wakers_.size(); }

    // Moves the list out so it can be woken without holding a lock
    std::vector<Waker> take() {
        std::vector<Waker> out;
        out.swap(wakers_);
        return out;
    }

private:
    std::vector<Waker> wakers_;
};

inline void wake_all(const std::vector<Waker>& wakers) {
    for (const auto& w : wakers) w.wake();
}

// Exit status shared between a task and everyone observing it.
class TaskStatus {
public:
    void set_finished(ExitCode code) {
        std::vector<Waker> wakers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (code_) return;
            code_ = code;
            wakers = waiters_.take();
        }
        cv_.notify_all();
        wake_all(wakers);
    }

    std::optional<ExitCode> exit_code() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return code_;
    }

    bool is_finished() const {
        return exit_code().has_value();
    }

    // Polls for the exit code, registering `waker` if still running.
    std::optional<ExitCode> poll(const Waker& waker) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!code_) waiters_.add(waker);
        return code_;
    }

    // Host-side blocking wait
    ExitCode wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return code_.has_value(); });
        return *code_;
    }

    template <typename Rep, typename Period>
    std::optional<ExitCode> wait_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return code_.has_value(); });
        return code_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<ExitCode> code_;
    WakerList waiters_;
};

}  // namespace rvix
