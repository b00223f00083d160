#include "env.hpp"
#include "fd.hpp"
#include "runtime.hpp"
#include "trace.hpp"

namespace rvix {

ThreadEnv::ThreadEnv(Runtime& runtime, ProcessIdentity identity,
                     std::shared_ptr<vfs::VirtualFS> fs, std::shared_ptr<const Module> module)
    : runtime_(runtime),
      identity_(std::move(identity)),
      fs_(std::move(fs)),
      module_(std::move(module)) {}

const RuntimeConfig& ThreadEnv::config() const {
    return runtime_.config();
}

ProcessIdentity ThreadEnv::swap_identity(ProcessIdentity next) {
    std::swap(identity_, next);
    return next;
}

void ThreadEnv::attach(std::unique_ptr<GuestExecution> guest) {
    guest_ = std::move(guest);
    if (guest_) guest_->bind(*this);
}

std::optional<ProcessIdentity> ThreadEnv::fork_identity() {
    auto child = runtime_.processes().fork(identity_.process);
    if (!child) {
        return std::nullopt;
    }
    ProcessIdentity id;
    id.process = child;
    id.thread = child->new_thread();
    id.fds = identity_.fds->fork();
    RVIX_TRACE("fork", "pid=%u forked child pid=%u tid=%u",
               identity_.process->pid(), child->pid(), id.thread->tid());
    return id;
}

std::optional<Errno> ThreadEnv::take_rewind_result() {
    auto result = rewind_result_;
    rewind_result_.reset();
    return result;
}

std::optional<OnCalledAction> ThreadEnv::take_on_called() {
    auto action = std::move(on_called_);
    on_called_.reset();
    return action;
}

std::optional<Errno> handle_rewind(ThreadEnv& env) {
    auto result = env.take_rewind_result();
    if (result) {
        RVIX_TRACE("rewind", "tid=%u resumed with %s", env.thread().tid(), errno_name(*result));
    }
    return result;
}

bool process_signals_and_exit(ThreadEnv& env) {
    Signal sig = env.thread().take_fatal_signal();
    if (sig == Signal::None) {
        return false;
    }
    RVIX_TRACE("signal", "pid=%u terminated by signal %u", env.process().pid(), (unsigned)sig);
    env.set_on_called(Trap{signal_exit_code(sig)});
    return true;
}

}  // namespace rvix
