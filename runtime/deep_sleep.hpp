// deep_sleep.hpp - Suspend a guest thread on an awaitable without holding a host thread
//
// A syscall that has to wait hands deep_sleep an awaitable and the
// callback that publishes its result. If the awaitable is not ready the
// guest is unwound, the host thread returns to the pool, and the task
// manager resumes the guest once the awaitable, the timeout or a fatal
// signal resolves the wait.
#pragma once

#include "action.hpp"
#include "env.hpp"
#include "snapshot.hpp"
#include "trace.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <variant>

namespace rvix {

template <typename T>
class Awaitable {
public:
    virtual ~Awaitable() = default;
    // The value once ready, nullopt after registering `waker`
    virtual std::optional<T> poll(const Waker& waker) = 0;
};

template <typename T>
struct WaitResult {
    Errno status = Errno::Success;  // Success carries a value
    std::optional<T> value;
};

template <typename T>
using OnResult = std::function<Errno(GuestExecution&, WaitResult<T>)>;

template <typename T>
class AwaitTrigger : public Trigger {
public:
    AwaitTrigger(std::unique_ptr<Awaitable<T>> awaitable, OnResult<T> on_result)
        : awaitable_(std::move(awaitable)), on_result_(std::move(on_result)) {}

    bool poll(const Waker& waker) override {
        if (!value_) value_ = awaitable_->poll(waker);
        return value_.has_value();
    }

    Errno finish(GuestExecution& guest, Errno status) override {
        WaitResult<T> result;
        result.status = (status == Errno::Success && !value_) ? Errno::Again : status;
        result.value = std::move(value_);
        return on_result_(guest, std::move(result));
    }

private:
    std::unique_ptr<Awaitable<T>> awaitable_;
    OnResult<T> on_result_;
    std::optional<T> value_;
};

// Never ready: a sleep that only its timeout ends
class InfiniteSleep : public Awaitable<std::monostate> {
public:
    std::optional<std::monostate> poll(const Waker&) override { return std::nullopt; }
};

// Guest nanosecond count as a timeout; waits too long to schedule are
// treated as waiting forever.
inline std::optional<std::chrono::nanoseconds> bounded_timeout(uint64_t ns) {
    constexpr uint64_t FOREVER = 1ULL << 62;
    if (ns >= FOREVER) return std::nullopt;
    return std::chrono::nanoseconds(static_cast<int64_t>(ns));
}

// Returns the syscall's errno when the wait resolved synchronously.
// Otherwise the thread is left with a DeepSleep (or a Trap if the stack
// could not be captured) and the return value is not delivered.
//   timeout: nullopt waits forever, zero never suspends (Again)
template <typename T>
Errno deep_sleep(ThreadEnv& env, std::optional<std::chrono::nanoseconds> timeout,
                 std::chrono::nanoseconds poll_interval, std::unique_ptr<Awaitable<T>> awaitable,
                 OnResult<T> on_result, ResumeAction resume) {
    if (auto value = awaitable->poll(Waker())) {
        return on_result(env.guest(), WaitResult<T>{Errno::Success, std::move(value)});
    }
    if (timeout && timeout->count() <= 0) {
        return on_result(env.guest(), WaitResult<T>{Errno::Again, std::nullopt});
    }

    SnapshotBlob store = make_blob(env.guest().capture_snapshot());
    auto trigger = std::make_unique<AwaitTrigger<T>>(std::move(awaitable), std::move(on_result));

    return unwind(env, [&](ThreadEnv& e, CapturedStack stack) -> OnCalledAction {
        DeepSleepWork work;
        work.rewind.stack = std::move(stack);
        work.rewind.store_data = std::move(store);
        work.rewind.width = e.guest().width();
        work.trigger = std::move(trigger);
        work.resume = std::move(resume);
        work.timeout = timeout;
        work.poll_interval = poll_interval;
        RVIX_TRACE("deep_sleep", "tid=%u suspended in %s (timeout %s)", e.thread().tid(),
                   resume_name(work.resume), timeout ? "set" : "none");
        return DeepSleep{std::move(work)};
    });
}

}  // namespace rvix
