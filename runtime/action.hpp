// action.hpp - What happens to a guest thread after a syscall unwound
#pragma once

#include "errno.hpp"
#include "rewind.hpp"
#include "task.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <variant>

namespace rvix {

// How a deep sleep resolved
struct TriggerOutcome {
    Errno status = Errno::Success;  // Success, Timedout or an awaitable error
    Signal signal = Signal::None;   // fatal signal that pre-empted the wait
};

// Type-erased awaitable plus the callback that publishes its result.
class Trigger {
public:
    virtual ~Trigger() = default;
    // True once resolved; registers `waker` otherwise.
    virtual bool poll(const Waker& waker) = 0;
    // Writes the result into guest memory, returns the syscall errno.
    virtual Errno finish(GuestExecution& guest, Errno status) = 0;
};

// Per-syscall resumption logic, dispatched when the wait resolves
struct SleepResume {};
struct PollResume {
    uint32_t nsubscriptions = 0;
};
struct JoinResume {
    uint32_t pid = 0;
};
struct ForkResume {};

using ResumeAction = std::variant<SleepResume, PollResume, JoinResume, ForkResume>;

// Runs after the suspended state was rewound; returns what the
// re-executed syscall reports to the guest.
Errno complete_resume(const ResumeAction& action, Trigger* trigger,
                      GuestExecution& guest, Errno status);

const char* resume_name(const ResumeAction& action);

struct DeepSleepWork {
    RewindState rewind;
    std::unique_ptr<Trigger> trigger;
    ResumeAction resume;
    std::optional<std::chrono::nanoseconds> timeout;  // none = wait forever
    std::chrono::nanoseconds poll_interval{0};
};

// State was rewound in place; let the syscall run again
struct InvokeAgain {};
// Terminate the thread's process
struct Trap {
    ExitCode code = 0;
};
// Park the thread until the work's trigger resolves
struct DeepSleep {
    DeepSleepWork work;
};
// The process image continues in another execution (proc_exec)
struct Replaced {};

using OnCalledAction = std::variant<InvokeAgain, Trap, DeepSleep, Replaced>;

}  // namespace rvix
