#include "deep_sleep.hpp"
#include "trace.hpp"

#include <type_traits>

namespace rvix {

Errno complete_resume(const ResumeAction& action, Trigger* trigger,
                      GuestExecution& guest, Errno status) {
    return std::visit([&](const auto& resume) -> Errno {
        using A = std::decay_t<decltype(resume)>;
        if constexpr (std::is_same_v<A, ForkResume>) {
            // The forked child sees its fork call succeed
            return Errno::Success;
        } else if constexpr (std::is_same_v<A, SleepResume>) {
            // An expired sleep is a successful sleep
            if (trigger) trigger->finish(guest, status);
            return Errno::Success;
        } else if constexpr (std::is_same_v<A, PollResume>) {
            const Errno ret = trigger ? trigger->finish(guest, status) : status;
            RVIX_TRACE("poll", "resumed over %u subscriptions -> %s", resume.nsubscriptions,
                       errno_name(ret));
            return ret;
        } else {
            return trigger ? trigger->finish(guest, status) : status;
        }
    }, action);
}

const char* resume_name(const ResumeAction& action) {
    switch (action.index()) {
        case 0: return "thread_sleep";
        case 1: return "poll_oneoff";
        case 2: return "proc_join";
        case 3: return "proc_fork";
        default: return "?";
    }
}

}  // namespace rvix
