#include "deep_sleep.hpp"
#include "fake_guest.hpp"
#include "proc.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace rvix {
namespace {

using namespace std::chrono_literals;
using test::FakeGuest;
using test::Harness;
using test::Program;
using test::exit_with;
using test::frame;
using test::sys;

// Ready once set; wakes whoever polled it
class Flag : public Awaitable<int> {
public:
    struct State {
        std::mutex mutex;
        std::optional<int> value;
        WakerList wakers;
        std::atomic<int> polls{0};

        void set(int v) {
            std::vector<Waker> w;
            {
                std::lock_guard<std::mutex> lock(mutex);
                value = v;
                w = wakers.take();
            }
            wake_all(w);
        }
    };

    explicit Flag(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::optional<int> poll(const Waker& waker) override {
        state_->polls++;
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->value) state_->wakers.add(waker);
        return state_->value;
    }

private:
    std::shared_ptr<State> state_;
};

RuntimeConfig fast_config() {
    RuntimeConfig config;
    config.poll_interval = 10ms;
    config.worker_threads = 2;
    return config;
}

// on_result that reports the status it saw as the syscall result and
// the value (if any) in guest memory at HEAP
OnResult<int> report() {
    return [](GuestExecution& g, WaitResult<int> r) {
        g.write_value<int32_t>(FakeGuest::HEAP, r.value ? *r.value : -1);
        return r.status;
    };
}

TEST(DeepSleepTest, ReadyAwaitableCompletesWithoutUnwinding) {
    Harness h(fast_config());
    auto s = h.prepare("ready", {});
    auto state = std::make_shared<Flag::State>();
    state->value = 5;

    Errno ret = deep_sleep<int>(*s.env, std::nullopt, 10ms, std::make_unique<Flag>(state),
                                report(), PollResume{1});
    EXPECT_EQ(ret, Errno::Success);
    EXPECT_FALSE(s.env->has_on_called());
    EXPECT_EQ(s.guest->read_value<int32_t>(FakeGuest::HEAP), 5);
}

TEST(DeepSleepTest, ZeroTimeoutReturnsAgainImmediately) {
    Harness h(fast_config());
    auto s = h.prepare("nonblocking", {});
    auto state = std::make_shared<Flag::State>();

    Errno ret = deep_sleep<int>(*s.env, 0ns, 10ms, std::make_unique<Flag>(state), report(),
                                PollResume{1});
    EXPECT_EQ(ret, Errno::Again);
    EXPECT_FALSE(s.env->has_on_called());
    EXPECT_EQ(state->polls.load(), 1);
}

TEST(DeepSleepTest, PendingAwaitableLeavesDeepSleepAction) {
    Harness h(fast_config());
    auto s = h.prepare("pending", {});
    s.guest->set_sp(FakeGuest::STACK_UPPER - 48);
    auto state = std::make_shared<Flag::State>();

    Errno ret = deep_sleep<int>(*s.env, 250ms, 10ms, std::make_unique<Flag>(state), report(),
                                JoinResume{3});
    EXPECT_EQ(ret, Errno::Success);

    auto action = s.env->take_on_called();
    ASSERT_TRUE(action);
    auto* sleep = std::get_if<DeepSleep>(&*action);
    ASSERT_NE(sleep, nullptr);
    EXPECT_EQ(sleep->work.rewind.stack.memory_stack.size(), 48u);
    EXPECT_EQ(sleep->work.rewind.width, AddressWidth::Bits64);
    ASSERT_TRUE(sleep->work.rewind.store_data);
    ASSERT_TRUE(sleep->work.timeout);
    EXPECT_EQ(*sleep->work.timeout, 250ms);
    EXPECT_EQ(sleep->work.poll_interval, 10ms);
    EXPECT_EQ(std::get<JoinResume>(sleep->work.resume).pid, 3u);
    EXPECT_STREQ(resume_name(sleep->work.resume), "proc_join");
}

TEST(DeepSleepTest, UncapturableStackTraps) {
    RuntimeConfig config = fast_config();
    config.capture_limit = 16;
    Harness h(config);
    auto s = h.prepare("deep", {});
    s.guest->set_sp(FakeGuest::STACK_UPPER - 64);

    deep_sleep<int>(*s.env, std::nullopt, 10ms,
                    std::make_unique<Flag>(std::make_shared<Flag::State>()), report(),
                    PollResume{1});
    auto action = s.env->take_on_called();
    ASSERT_TRUE(action);
    ASSERT_TRUE(std::holds_alternative<Trap>(*action));
    EXPECT_EQ(std::get<Trap>(*action).code, exit_code_from(Errno::Memviolation));
}

TEST(DeepSleepTest, BoundedTimeoutTreatsHugeWaitsAsForever) {
    EXPECT_EQ(bounded_timeout(0), 0ns);
    EXPECT_EQ(bounded_timeout(1500), 1500ns);
    EXPECT_FALSE(bounded_timeout(1ULL << 62));
    EXPECT_FALSE(bounded_timeout(~0ULL));
}

TEST(DeepSleepTest, CompleteResumeMapsPerSyscall) {
    FakeGuest g(std::make_shared<const Program>());
    AwaitTrigger<int> trigger(std::make_unique<Flag>(std::make_shared<Flag::State>()), report());

    EXPECT_EQ(complete_resume(SleepResume{}, &trigger, g, Errno::Timedout), Errno::Success);
    EXPECT_EQ(complete_resume(PollResume{1}, &trigger, g, Errno::Timedout), Errno::Timedout);
    // Resolved without a value: nothing to report
    EXPECT_EQ(complete_resume(JoinResume{1}, &trigger, g, Errno::Success), Errno::Again);
    EXPECT_EQ(complete_resume(ForkResume{}, nullptr, g, Errno::Success), Errno::Success);
}

TEST(DeepSleepTest, ThreadSleepResumesAfterItsDuration) {
    Harness h(fast_config());
    std::chrono::steady_clock::time_point woke;
    const auto start = std::chrono::steady_clock::now();
    auto s = h.start("sleeper", {
        frame(32),
        sys([](ThreadEnv& e, FakeGuest&) { return thread_sleep(e, 40'000'000); }),
        [&woke](FakeGuest& g) {
            woke = std::chrono::steady_clock::now();
            g.write_value<uint64_t>(FakeGuest::HEAP, g.a0());
        },
        exit_with(0),
    });

    ASSERT_EQ(h.wait(s.process), 0);
    EXPECT_GE(woke - start, 40ms);
    EXPECT_LT(woke - start, 2s);
    EXPECT_EQ(s.guest->read_value<uint64_t>(FakeGuest::HEAP), 0u);
}

TEST(DeepSleepTest, ResumedGuestSeesItsStackUnchanged) {
    Harness h(fast_config());
    auto s = h.start("stack", {
        frame(64),
        [](FakeGuest& g) {
            for (uint32_t i = 0; i < 16; i++) g.store_u32(g.sp() + i * 4, 0xA0000000 + i);
            g.reg(9) = 0x5151;
            g.global = 21;
        },
        sys([](ThreadEnv& e, FakeGuest&) { return thread_sleep(e, 5'000'000); }),
        [](FakeGuest& g) {
            uint32_t ok = g.reg(9) == 0x5151 && g.global == 21;
            for (uint32_t i = 0; i < 16; i++) ok &= g.load_u32(g.sp() + i * 4) == 0xA0000000 + i;
            g.exit(ok ? 0 : 1);
        },
    });
    EXPECT_EQ(h.wait(s.process), 0);
}

TEST(DeepSleepTest, WakerResumesBeforeThePollInterval) {
    RuntimeConfig config = fast_config();
    config.poll_interval = 30s;
    Harness h(config);
    auto state = std::make_shared<Flag::State>();

    auto s = h.start("waiter", {
        frame(16),
        sys([state](ThreadEnv& e, FakeGuest&) {
            if (auto ret = handle_rewind(e)) return *ret;
            return deep_sleep<int>(e, std::nullopt, e.config().poll_interval,
                                   std::make_unique<Flag>(state), report(), PollResume{1});
        }),
        [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.a0())); },
    });

    ASSERT_TRUE(test::wait_until([&] { return h.runtime->tasks().sleeping() == 1; }));
    state->set(77);

    ASSERT_EQ(h.wait(s.process, 5s), 0);
    EXPECT_EQ(s.guest->read_value<int32_t>(FakeGuest::HEAP), 77);
}

TEST(DeepSleepTest, TimeoutResolvesPendingAwaitableWithTimedout) {
    Harness h(fast_config());
    auto s = h.start("timeout", {
        frame(16),
        sys([](ThreadEnv& e, FakeGuest&) {
            if (auto ret = handle_rewind(e)) return *ret;
            return deep_sleep<int>(e, 20ms, e.config().poll_interval,
                                   std::make_unique<Flag>(std::make_shared<Flag::State>()),
                                   report(), PollResume{1});
        }),
        [](FakeGuest& g) { g.exit(static_cast<ExitCode>(g.a0())); },
    });

    EXPECT_EQ(h.wait(s.process), exit_code_from(Errno::Timedout));
    EXPECT_EQ(s.guest->read_value<int32_t>(FakeGuest::HEAP), -1);
}

TEST(DeepSleepTest, ThrowingResultHandlerStillEndsTheProcess) {
    Harness h(fast_config());
    auto s = h.start("throws", {
        frame(16),
        sys([](ThreadEnv& e, FakeGuest&) {
            if (auto ret = handle_rewind(e)) return *ret;
            OnResult<int> failing = [](GuestExecution&, WaitResult<int>) -> Errno {
                throw std::runtime_error("result handler failed");
            };
            return deep_sleep<int>(e, 10ms, e.config().poll_interval,
                                   std::make_unique<Flag>(std::make_shared<Flag::State>()),
                                   std::move(failing), PollResume{1});
        }),
        exit_with(0),
    });

    EXPECT_EQ(h.wait(s.process, 2s), 1);
    EXPECT_EQ(s.process->main_thread()->exit_code(), 1);
    EXPECT_TRUE(test::wait_until([&] { return h.runtime->tasks().active_tasks() == 0; }));
}

TEST(DeepSleepTest, FatalSignalPreemptsTheWait) {
    Harness h(fast_config());
    auto s = h.start("forever", {
        frame(16),
        sys([](ThreadEnv& e, FakeGuest&) { return thread_sleep(e, ~0ULL); }),
        exit_with(0),
    });

    ASSERT_TRUE(test::wait_until([&] { return h.runtime->tasks().sleeping() == 1; }));
    s.process->signal(Signal::Term);

    EXPECT_EQ(h.wait(s.process), 128 + 15);
    EXPECT_EQ(s.process->main_thread()->exit_code(), 128 + 15);
}

TEST(DeepSleepTest, IgnoredSignalDoesNotEndTheSleep) {
    Harness h(fast_config());
    auto s = h.start("ignores", {
        frame(16),
        sys([](ThreadEnv& e, FakeGuest&) { return thread_sleep(e, 60'000'000); }),
        exit_with(3),
    });

    ASSERT_TRUE(test::wait_until([&] { return h.runtime->tasks().sleeping() == 1; }));
    s.process->signal(Signal::Chld);
    s.process->signal(Signal::Winch);

    EXPECT_EQ(h.wait(s.process), 3);
}

TEST(DeepSleepTest, SuspendedGuestHoldsNoWorker) {
    RuntimeConfig config = fast_config();
    config.worker_threads = 1;
    Harness h(config);

    auto sleeper = h.start("long", {
        frame(16),
        sys([](ThreadEnv& e, FakeGuest&) { return thread_sleep(e, 300'000'000); }),
        exit_with(1),
    });
    ASSERT_TRUE(test::wait_until([&] { return h.runtime->tasks().sleeping() == 1; }));

    // The only worker is free for another guest while the first sleeps
    auto quick = h.start("quick", {exit_with(2)});
    EXPECT_EQ(h.wait(quick.process, 200ms), 2);
    EXPECT_FALSE(sleeper.process->is_finished());
    EXPECT_EQ(h.wait(sleeper.process), 1);
}

}  // namespace
}  // namespace rvix
