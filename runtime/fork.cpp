#include "fork.hpp"
#include "fd.hpp"
#include "runner.hpp"
#include "runtime.hpp"
#include "trace.hpp"

namespace rvix {

namespace {

Errno copy_fork(ThreadEnv& env, ProcessIdentity child, uint64_t pid_ptr) {
    ProcessControl& control = env.runtime().processes();
    const uint32_t child_pid = child.process->pid();
    SnapshotBlob store = make_blob(env.guest().capture_snapshot());

    return unwind(env, [&](ThreadEnv& parent, CapturedStack stack) -> OnCalledAction {
        GuestExecution& guest = parent.guest();
        const StackLayout layout = guest.stack_layout();

        // The child's view already holds 0; writing it again proves the
        // slot lies in the captured stack before anything is spawned.
        auto state = std::make_shared<RewindState>();
        state->stack = stack;
        state->store_data = store;
        state->width = guest.width();
        if (!patch_captured_u32(state->stack.memory_stack, layout, pid_ptr, 0)) {
            RVIX_WARN("fork", "pid slot 0x%lx is outside the captured stack", (long)pid_ptr);
            control.abandon(child.process);
            return Trap{exit_code_from(Errno::Memviolation)};
        }

        Errno result = Errno::Success;
        std::unique_ptr<GuestExecution> copy;
        try {
            copy = guest.clone_memory();
        } catch (const std::exception& e) {
            RVIX_WARN("fork", "cannot copy guest memory: %s", e.what());
        }
        bool spawned = false;
        if (copy) {
            auto child_env = ThreadEnv::create(parent.runtime(), child, parent.fs(), parent.module());
            child_env->attach(std::move(copy));
            spawned = parent.runtime().spawn_guest(child_env, [state](std::shared_ptr<ThreadEnv> e) {
                resume_forked(std::move(e), *state);
            });
        }
        if (spawned) {
            patch_captured_u32(stack.memory_stack, layout, pid_ptr, child_pid);
            RVIX_TRACE("fork", "pid=%u copied into child pid=%u (%zu stack bytes)",
                       parent.process().pid(), child_pid, stack.memory_stack.size());
        } else {
            RVIX_WARN("fork", "child pid=%u could not be started", child_pid);
            control.abandon(child.process);
            result = Errno::Again;
        }

        Errno err = rewind(guest, stack.memory_stack, stack.rewind_stack, *store, guest.width());
        if (err != Errno::Success) {
            return Trap{exit_code_from(err)};
        }
        parent.set_rewind_result(result);
        return InvokeAgain{};
    });
}

Errno lazy_fork(ThreadEnv& env, ProcessIdentity child, uint64_t pid_ptr) {
    ProcessControl& control = env.runtime().processes();
    SnapshotBlob store = make_blob(env.guest().capture_snapshot());

    return unwind(env, [&](ThreadEnv& e, CapturedStack stack) -> OnCalledAction {
        GuestExecution& guest = e.guest();
        if (!patch_captured_u32(stack.memory_stack, guest.stack_layout(), pid_ptr, 0)) {
            RVIX_WARN("fork", "pid slot 0x%lx is outside the captured stack", (long)pid_ptr);
            control.abandon(child.process);
            return Trap{exit_code_from(Errno::Memviolation)};
        }
        Errno err = rewind(guest, stack.memory_stack, stack.rewind_stack, *store, guest.width());
        if (err != Errno::Success) {
            control.abandon(child.process);
            return Trap{exit_code_from(err)};
        }

        const uint32_t child_pid = child.process->pid();
        VFork vf;
        vf.stack = std::move(stack);
        vf.store_data = store;
        vf.width = guest.width();
        vf.pid_ptr = pid_ptr;
        vf.parent = e.swap_identity(std::move(child));
        RVIX_TRACE("fork", "pid=%u vforked child pid=%u", vf.parent.process->pid(), child_pid);
        e.vfork = std::move(vf);
        e.set_rewind_result(Errno::Success);
        return InvokeAgain{};
    });
}

}  // namespace

Errno proc_fork(ThreadEnv& env, bool copy_memory, uint64_t pid_ptr) {
    if (process_signals_and_exit(env)) return Errno::Success;
    if (auto ret = handle_rewind(env)) return *ret;

    auto child = env.fork_identity();
    if (!child) {
        return Errno::Perm;
    }
    try {
        env.guest().write_value<uint32_t>(pid_ptr, 0);
    } catch (const GuestFault&) {
        env.runtime().processes().abandon(child->process);
        return Errno::Memviolation;
    }

    // A vfork child only borrows the execution, so it forks by copying
    if (!copy_memory && !env.vfork) {
        return lazy_fork(env, std::move(*child), pid_ptr);
    }
    return copy_fork(env, std::move(*child), pid_ptr);
}

void finish_vfork(ThreadEnv& env) {
    VFork vf = std::move(*env.vfork);
    env.vfork.reset();

    const uint32_t child_pid = env.process().pid();
    env.swap_identity(std::move(vf.parent));

    GuestExecution& guest = env.guest();
    if (!patch_captured_u32(vf.stack.memory_stack, guest.stack_layout(), vf.pid_ptr, child_pid)) {
        env.set_on_called(Trap{exit_code_from(Errno::Memviolation)});
        return;
    }
    static const Bytes empty;
    Errno err = rewind(guest, vf.stack.memory_stack, vf.stack.rewind_stack,
                       vf.store_data ? *vf.store_data : empty, vf.width);
    if (err != Errno::Success) {
        RVIX_WARN("fork", "pid=%u cannot resume after vfork: %s", env.process().pid(), errno_name(err));
        env.set_on_called(Trap{exit_code_from(err)});
        return;
    }
    RVIX_TRACE("fork", "pid=%u resumes, vfork child pid=%u done", env.process().pid(), child_pid);
    env.set_rewind_result(Errno::Success);
    env.set_on_called(InvokeAgain{});
}

}  // namespace rvix
