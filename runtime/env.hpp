// env.hpp - Per guest-thread environment
//
// Everything a syscall needs: the process identity it acts as, the
// filesystem, the guest it runs on and the suspension state that
// survives between an unwind and the matching rewind.
#pragma once

#include "action.hpp"
#include "config.hpp"
#include "guest.hpp"
#include "process.hpp"
#include "rewind.hpp"

#include <memory>
#include <optional>

namespace rvix {

namespace vfs {
class VirtualFS;
class FdTable;
}

struct Module;
class Runtime;

// The process a thread environment currently acts as. A vfork swaps it.
struct ProcessIdentity {
    std::shared_ptr<WasiProcess> process;
    std::shared_ptr<WasiThread> thread;
    std::shared_ptr<vfs::FdTable> fds;
};

// Parent state parked while a lazily forked child borrows the execution
struct VFork {
    CapturedStack stack;
    SnapshotBlob store_data;
    AddressWidth width = AddressWidth::Bits64;
    ProcessIdentity parent;
    uint64_t pid_ptr = 0;
};

class ThreadEnv : public std::enable_shared_from_this<ThreadEnv> {
public:
    ThreadEnv(Runtime& runtime, ProcessIdentity identity, std::shared_ptr<vfs::VirtualFS> fs,
              std::shared_ptr<const Module> module);

    static std::shared_ptr<ThreadEnv> create(Runtime& runtime, ProcessIdentity identity,
                                             std::shared_ptr<vfs::VirtualFS> fs,
                                             std::shared_ptr<const Module> module) {
        return std::make_shared<ThreadEnv>(runtime, std::move(identity), std::move(fs),
                                           std::move(module));
    }

    Runtime& runtime() const { return runtime_; }
    const RuntimeConfig& config() const;

    const ProcessIdentity& identity() const { return identity_; }
    WasiProcess& process() const { return *identity_.process; }
    WasiThread& thread() const { return *identity_.thread; }
    vfs::FdTable& fds() const { return *identity_.fds; }
    // Installs `next` and returns the identity it replaced
    ProcessIdentity swap_identity(ProcessIdentity next);

    const std::shared_ptr<vfs::VirtualFS>& fs() const { return fs_; }
    const std::shared_ptr<const Module>& module() const { return module_; }

    bool has_guest() const { return guest_ != nullptr; }
    GuestExecution& guest() const { return *guest_; }
    void attach(std::unique_ptr<GuestExecution> guest);

    // Duplicates the process bookkeeping for a fork: a new child process
    // with one thread and an fd table derived from ours. nullopt if the
    // process table refused.
    std::optional<ProcessIdentity> fork_identity();

    // Seed rotating the order poll_oneoff reads its subscriptions in
    uint64_t next_poll_seed() { return poll_seed_++; }

    void set_rewind_result(Errno result) { rewind_result_ = result; }
    std::optional<Errno> take_rewind_result();

    void set_on_called(OnCalledAction action) { on_called_ = std::move(action); }
    bool has_on_called() const { return on_called_.has_value(); }
    std::optional<OnCalledAction> take_on_called();

    std::optional<VFork> vfork;

private:
    Runtime& runtime_;
    ProcessIdentity identity_;
    std::shared_ptr<vfs::VirtualFS> fs_;
    std::shared_ptr<const Module> module_;
    std::unique_ptr<GuestExecution> guest_;

    uint64_t poll_seed_ = 0;
    std::optional<Errno> rewind_result_;
    std::optional<OnCalledAction> on_called_;
};

// At the top of a suspending syscall: the result a rewound call
// returns, exactly once.
std::optional<Errno> handle_rewind(ThreadEnv& env);

// Leaves a Trap if a fatal signal is pending; returns true if it did.
bool process_signals_and_exit(ThreadEnv& env);

// Captures the guest stack and hands it to `continuation`, whose
// on-called action decides how the thread proceeds. Traps with
// Memviolation if the stack cannot be captured.
template <typename F>
Errno unwind(ThreadEnv& env, F&& continuation) {
    CapturedStack stack;
    Errno err = capture_stack(env.guest(), env.config().capture_limit, stack);
    if (err != Errno::Success) {
        env.set_on_called(Trap{exit_code_from(err)});
        return err;
    }
    env.set_on_called(continuation(env, std::move(stack)));
    return Errno::Success;
}

}  // namespace rvix
