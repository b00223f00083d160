#include "runner.hpp"
#include "fd.hpp"
#include "fork.hpp"
#include "runtime.hpp"
#include "trace.hpp"

#include <exception>
#include <optional>
#include <variant>

namespace rvix {

namespace {

void park(const std::shared_ptr<ThreadEnv>& env, DeepSleepWork&& work) {
    auto thread = env->identity().thread;
    env->runtime().tasks().resume_after_poller(
        std::move(thread), std::move(work),
        [env](DeepSleepWork&& resumed, TriggerOutcome outcome) {
            respawn_thread(env, std::move(resumed), outcome);
        });
}

// Returns true if the guest should run again
bool dispatch(const std::shared_ptr<ThreadEnv>& env, OnCalledAction action) {
    for (;;) {
        if (std::holds_alternative<InvokeAgain>(action)) {
            return true;
        }
        if (auto* trap = std::get_if<Trap>(&action)) {
            if (!finish_thread(*env, trap->code)) return false;
            // vfork parent takes over the execution
            auto next = env->take_on_called();
            if (!next) return false;
            action = std::move(*next);
            continue;
        }
        if (auto* sleep = std::get_if<DeepSleep>(&action)) {
            park(env, std::move(sleep->work));
            return false;
        }
        // Replaced: the image lives on in another execution
        return false;
    }
}

OnCalledAction run_once(ThreadEnv& env) {
    try {
        env.guest().run();
    } catch (const GuestFault& e) {
        RVIX_WARN("rvix", "pid=%u guest fault at 0x%lx: %s", env.process().pid(),
                  (long)e.addr(), e.what());
        env.take_on_called();
        return Trap{exit_code_from(Errno::Memviolation)};
    } catch (const std::exception& e) {
        RVIX_WARN("rvix", "pid=%u fatal exception: %s", env.process().pid(), e.what());
        env.take_on_called();
        return Trap{1};
    }
    if (auto action = env.take_on_called()) {
        return std::move(*action);
    }
    return Trap{env.guest().exit_code()};
}

// Rewinds a woken thread and publishes its wait result. Returns the exit
// code when the thread cannot continue.
std::optional<ExitCode> restore_sleeper(ThreadEnv& env, DeepSleepWork& work, TriggerOutcome outcome) {
    if (outcome.signal != Signal::None) {
        RVIX_TRACE("deep_sleep", "tid=%u interrupted by signal %u in %s", env.thread().tid(),
                   (unsigned)outcome.signal, resume_name(work.resume));
        return signal_exit_code(outcome.signal);
    }

    Errno err = rewind(env.guest(), work.rewind);
    if (err != Errno::Success) {
        RVIX_WARN("deep_sleep", "tid=%u rewind failed: %s", env.thread().tid(), errno_name(err));
        return exit_code_from(err);
    }

    Errno ret;
    try {
        ret = complete_resume(work.resume, work.trigger.get(), env.guest(), outcome.status);
    } catch (const GuestFault& e) {
        RVIX_WARN("deep_sleep", "tid=%u result write fault at 0x%lx", env.thread().tid(), (long)e.addr());
        ret = Errno::Memviolation;
    }
    RVIX_TRACE("deep_sleep", "tid=%u resumed %s -> %s", env.thread().tid(),
               resume_name(work.resume), errno_name(ret));
    env.set_rewind_result(ret);
    return std::nullopt;
}

}  // namespace

void run_thread(std::shared_ptr<ThreadEnv> env) {
    while (dispatch(env, run_once(*env))) {
    }
}

void respawn_thread(std::shared_ptr<ThreadEnv> env, DeepSleepWork&& work, TriggerOutcome outcome) {
    std::optional<ExitCode> trap;
    try {
        trap = restore_sleeper(*env, work, outcome);
    } catch (const std::exception& e) {
        RVIX_WARN("deep_sleep", "tid=%u cannot resume %s: %s", env->thread().tid(),
                  resume_name(work.resume), e.what());
        env->take_on_called();
        trap = 1;
    }
    if (trap) {
        if (dispatch(env, Trap{*trap})) run_thread(env);
        return;
    }
    run_thread(std::move(env));
}

void resume_forked(std::shared_ptr<ThreadEnv> env, const RewindState& state) {
    std::optional<ExitCode> trap;
    try {
        Errno err = rewind(env->guest(), state);
        if (err != Errno::Success) {
            RVIX_WARN("fork", "child pid=%u cannot be rewound: %s", env->process().pid(), errno_name(err));
            trap = exit_code_from(err);
        } else {
            env->set_rewind_result(complete_resume(ForkResume{}, nullptr, env->guest(), Errno::Success));
        }
    } catch (const std::exception& e) {
        RVIX_WARN("fork", "child pid=%u cannot resume: %s", env->process().pid(), e.what());
        env->take_on_called();
        trap = 1;
    }
    if (trap) {
        if (dispatch(env, Trap{*trap})) run_thread(env);
        return;
    }
    run_thread(std::move(env));
}

bool finish_thread(ThreadEnv& env, ExitCode code) {
    RVIX_TRACE("proc", "pid=%u tid=%u exited with %d", env.process().pid(), env.thread().tid(), code);
    env.thread().set_finished(code);
    env.process().terminate(code);
    env.fds().close_all();
    if (!env.vfork) {
        return false;
    }
    finish_vfork(env);
    return true;
}

Errno spawn_exec(Runtime& runtime, const ProcessIdentity& identity,
                 std::shared_ptr<vfs::VirtualFS> fs, std::shared_ptr<const Module> module,
                 const std::vector<std::string>& args) {
    std::unique_ptr<GuestExecution> guest;
    try {
        guest = runtime.instantiate(module, args);
    } catch (const std::exception& e) {
        RVIX_WARN("exec", "cannot instantiate %s: %s", module->name.c_str(), e.what());
        return Errno::Noexec;
    }

    auto env = ThreadEnv::create(runtime, identity, std::move(fs), std::move(module));
    env->attach(std::move(guest));
    if (!runtime.spawn_guest(env, [](std::shared_ptr<ThreadEnv> e) { run_thread(std::move(e)); })) {
        return Errno::Again;
    }
    RVIX_TRACE("exec", "pid=%u started %s", identity.process->pid(), env->module()->name.c_str());
    return Errno::Success;
}

}  // namespace rvix
