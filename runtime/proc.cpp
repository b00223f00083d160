#include "proc.hpp"
#include "abi.hpp"
#include "deep_sleep.hpp"
#include "fork.hpp"
#include "loader.hpp"
#include "runner.hpp"
#include "runtime.hpp"
#include "trace.hpp"

#include <thread>
#include <utility>

namespace rvix {

namespace {

// Resolves once any of the watched children has exited
class ChildExit : public Awaitable<std::pair<uint32_t, ExitCode>> {
public:
    explicit ChildExit(std::vector<std::shared_ptr<WasiProcess>> children)
        : children_(std::move(children)) {}

    std::optional<std::pair<uint32_t, ExitCode>> poll(const Waker& waker) override {
        for (const auto& child : children_) {
            if (auto code = child->status()->poll(waker)) {
                return std::make_pair(child->pid(), *code);
            }
        }
        return std::nullopt;
    }

private:
    std::vector<std::shared_ptr<WasiProcess>> children_;
};

}  // namespace

Errno thread_sleep(ThreadEnv& env, uint64_t duration_ns) {
    if (process_signals_and_exit(env)) return Errno::Success;
    if (auto ret = handle_rewind(env)) return *ret;

    OnResult<std::monostate> on_result = [](GuestExecution&, WaitResult<std::monostate> r) {
        switch (r.status) {
            case Errno::Success:
            case Errno::Timedout:
            case Errno::Again:
                return Errno::Success;
            default:
                return r.status;
        }
    };
    return deep_sleep<std::monostate>(env, bounded_timeout(duration_ns), env.config().poll_interval,
                                      std::make_unique<InfiniteSleep>(), std::move(on_result),
                                      SleepResume{});
}

Errno sched_yield(ThreadEnv& env) {
    std::this_thread::yield();
    return thread_sleep(env, 0);
}

Errno proc_join(ThreadEnv& env, uint64_t pid_ptr, uint32_t flags, uint64_t status_ptr) {
    if (process_signals_and_exit(env)) return Errno::Success;
    if (auto ret = handle_rewind(env)) return *ret;

    uint32_t pid;
    try {
        pid = env.guest().read_value<uint32_t>(pid_ptr);
    } catch (const GuestFault&) {
        return Errno::Memviolation;
    }

    auto self = env.identity().process;
    std::vector<std::shared_ptr<WasiProcess>> targets;
    if (pid == JOIN_ANY_PID) {
        targets = self->children();
    } else if (auto child = self->find_child(pid)) {
        targets.push_back(std::move(child));
    }
    if (targets.empty()) {
        return Errno::Child;
    }

    std::optional<std::chrono::nanoseconds> timeout;
    if (flags & JOIN_NON_BLOCKING) timeout = std::chrono::nanoseconds(0);

    OnResult<std::pair<uint32_t, ExitCode>> on_result =
        [self, pid_ptr, status_ptr](GuestExecution& g, WaitResult<std::pair<uint32_t, ExitCode>> r) {
            if (r.status != Errno::Success || !r.value) {
                return r.status == Errno::Success ? Errno::Again : r.status;
            }
            const auto [child_pid, code] = *r.value;
            try {
                g.write_value<uint32_t>(pid_ptr, child_pid);
                g.write_value<int32_t>(status_ptr, code);
            } catch (const GuestFault&) {
                return Errno::Memviolation;
            }
            self->reap_child(child_pid);
            RVIX_TRACE("proc", "pid=%u joined child pid=%u (exit %d)", self->pid(), child_pid, code);
            return Errno::Success;
        };

    return deep_sleep<std::pair<uint32_t, ExitCode>>(
        env, timeout, env.config().poll_interval,
        std::make_unique<ChildExit>(std::move(targets)), std::move(on_result),
        JoinResume{pid});
}

Errno proc_exit(ThreadEnv& env, ExitCode code) {
    RVIX_TRACE("proc", "pid=%u proc_exit(%d)%s", env.process().pid(), code,
               env.vfork ? " in vfork" : "");
    env.set_on_called(Trap{code});
    return Errno::Success;
}

Errno proc_exec(ThreadEnv& env, const std::string& path, const std::vector<std::string>& args) {
    if (process_signals_and_exit(env)) return Errno::Success;
    if (!env.fs()) {
        return Errno::Noent;
    }

    std::shared_ptr<const Module> module;
    Errno err = env.runtime().modules().load_from_vfs(*env.fs(), path, module);
    if (err != Errno::Success) {
        RVIX_TRACE("exec", "pid=%u proc_exec(%s) -> %s", env.process().pid(), path.c_str(), errno_name(err));
        return err;
    }

    std::vector<std::string> argv = args;
    if (argv.empty()) argv.push_back(path);
    err = spawn_exec(env.runtime(), env.identity(), env.fs(), std::move(module), argv);
    if (err != Errno::Success) {
        return err;
    }

    if (env.vfork) {
        finish_vfork(env);
    } else {
        env.set_on_called(Replaced{});
    }
    return Errno::Success;
}

Errno proc_signal(ThreadEnv& env, uint32_t pid, uint8_t sig) {
    if (sig > MAX_SIGNAL) {
        return Errno::Inval;
    }
    auto self = env.identity().process;
    auto target = (pid == 0) ? self : env.runtime().processes().lookup(pid);
    if (!target || target->is_finished()) {
        return Errno::Srch;
    }
    if (sig == 0) {
        return Errno::Success;
    }
    RVIX_TRACE("signal", "pid=%u sends signal %u to pid=%u", self->pid(), sig, target->pid());
    target->signal(static_cast<Signal>(sig));
    if (target == self) {
        process_signals_and_exit(env);
    }
    return Errno::Success;
}

Errno proc_id(ThreadEnv& env, uint64_t pid_ptr) {
    try {
        env.guest().write_value<uint32_t>(pid_ptr, env.process().pid());
    } catch (const GuestFault&) {
        return Errno::Memviolation;
    }
    return Errno::Success;
}

Errno proc_parent(ThreadEnv& env, uint32_t pid, uint64_t parent_ptr) {
    auto target = (pid == 0) ? env.identity().process : env.runtime().processes().lookup(pid);
    if (!target) {
        return Errno::Srch;
    }
    try {
        env.guest().write_value<uint32_t>(parent_ptr, target->ppid());
    } catch (const GuestFault&) {
        return Errno::Memviolation;
    }
    return Errno::Success;
}

std::vector<std::string> split_args(const std::string& packed) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < packed.size()) {
        size_t end = packed.find('\n', start);
        if (end == std::string::npos) end = packed.size();
        if (end > start) out.push_back(packed.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

}  // namespace rvix
