// syscalls.hpp - Process and thread syscalls for RISC-V guests
// Number in a7, arguments in a0..a5, WASI errno returned in a0.
//
// Uses libriscv's userdata mechanism to pass the ThreadEnv to handlers.
#pragma once

#include <libriscv/machine.hpp>
#include "abi.hpp"
#include "env.hpp"
#include "fork.hpp"
#include "poll.hpp"
#include "proc.hpp"
#include "trace.hpp"

#include <string>
#include <variant>

namespace rvix::syscalls {

template <int W>
using Machine = riscv::Machine<W>;

// Longest path and packed argv proc_exec accepts
static constexpr size_t MAX_PATH_LEN = 4096;
static constexpr size_t MAX_ARGS_LEN = 1 << 20;

template <int W>
inline ThreadEnv& get_env(Machine<W>& m) {
    return *m.template get_userdata<ThreadEnv>();
}

// 64-bit arguments take a register pair on RV32
template <int W>
inline uint64_t sysarg_u64(Machine<W>& m, int idx) {
    if constexpr (W == 4) {
        return uint64_t(m.cpu.reg(10 + idx)) | (uint64_t(m.cpu.reg(11 + idx)) << 32);
    } else {
        return m.sysarg(idx);
    }
}

// Delivers `ret` unless the call left an on-called action. InvokeAgain
// means the guest was rewound in place: the handler returns and the
// re-positioned ecall runs again. Anything else stops the machine for
// the runner to act on.
template <int W>
inline void finish_syscall(Machine<W>& m, ThreadEnv& env, Errno ret) {
    if (auto action = env.take_on_called()) {
        if (std::holds_alternative<InvokeAgain>(*action)) return;
        env.set_on_called(std::move(*action));
        m.stop();
        return;
    }
    m.set_result(static_cast<int>(ret));
}

inline Errno read_string(ThreadEnv& env, uint64_t addr, uint64_t len, size_t max, std::string& out) {
    if (len > max) return Errno::TooBig;
    out.resize(len);
    try {
        if (len) env.guest().read(addr, out.data(), len);
    } catch (const GuestFault&) {
        return Errno::Memviolation;
    }
    return Errno::Success;
}

namespace handlers {

template <int W>
static void sys_thread_sleep(Machine<W>& m) {
    auto& env = get_env(m);
    const uint64_t ns = sysarg_u64(m, 0);
    RVIX_TRACE("syscall", "thread_sleep(%lu) pid=%u", (unsigned long)ns, env.process().pid());
    finish_syscall(m, env, thread_sleep(env, ns));
}

template <int W>
static void sys_poll_oneoff(Machine<W>& m) {
    auto& env = get_env(m);
    const uint64_t subs = m.sysarg(0);
    const uint64_t events = m.sysarg(1);
    const uint32_t nsubs = m.template sysarg<uint32_t>(2);
    const uint64_t nevents = m.sysarg(3);
    RVIX_TRACE("syscall", "poll_oneoff(0x%lx, 0x%lx, %u) pid=%u", (long)subs, (long)events,
               nsubs, env.process().pid());
    finish_syscall(m, env, poll_oneoff(env, subs, events, nsubs, nevents));
}

template <int W>
static void sys_proc_fork(Machine<W>& m) {
    auto& env = get_env(m);
    const bool copy_memory = m.template sysarg<uint32_t>(0) != 0;
    const uint64_t pid_ptr = m.sysarg(1);
    RVIX_TRACE("syscall", "proc_fork(%s) pid=%u", copy_memory ? "copy" : "lazy", env.process().pid());
    finish_syscall(m, env, proc_fork(env, copy_memory, pid_ptr));
}

template <int W>
static void sys_proc_exec(Machine<W>& m) {
    auto& env = get_env(m);
    std::string path, packed;
    Errno err = read_string(env, m.sysarg(0), m.sysarg(1), MAX_PATH_LEN, path);
    if (err == Errno::Success) {
        err = read_string(env, m.sysarg(2), m.sysarg(3), MAX_ARGS_LEN, packed);
    }
    if (err != Errno::Success) {
        finish_syscall(m, env, err);
        return;
    }
    RVIX_TRACE("syscall", "proc_exec(%s) pid=%u", path.c_str(), env.process().pid());
    finish_syscall(m, env, proc_exec(env, path, split_args(packed)));
}

template <int W>
static void sys_proc_join(Machine<W>& m) {
    auto& env = get_env(m);
    const uint64_t pid_ptr = m.sysarg(0);
    const uint32_t flags = m.template sysarg<uint32_t>(1);
    const uint64_t status_ptr = m.sysarg(2);
    RVIX_TRACE("syscall", "proc_join(flags=%u) pid=%u", flags, env.process().pid());
    finish_syscall(m, env, proc_join(env, pid_ptr, flags, status_ptr));
}

template <int W>
static void sys_proc_exit(Machine<W>& m) {
    auto& env = get_env(m);
    finish_syscall(m, env, proc_exit(env, m.template sysarg<int>(0)));
}

template <int W>
static void sys_proc_signal(Machine<W>& m) {
    auto& env = get_env(m);
    const uint32_t pid = m.template sysarg<uint32_t>(0);
    const uint32_t sig = m.template sysarg<uint32_t>(1);
    Errno ret = sig > 0xFF ? Errno::Inval : proc_signal(env, pid, static_cast<uint8_t>(sig));
    finish_syscall(m, env, ret);
}

template <int W>
static void sys_proc_id(Machine<W>& m) {
    auto& env = get_env(m);
    finish_syscall(m, env, proc_id(env, m.sysarg(0)));
}

template <int W>
static void sys_proc_parent(Machine<W>& m) {
    auto& env = get_env(m);
    finish_syscall(m, env, proc_parent(env, m.template sysarg<uint32_t>(0), m.sysarg(1)));
}

template <int W>
static void sys_sched_yield(Machine<W>& m) {
    auto& env = get_env(m);
    finish_syscall(m, env, sched_yield(env));
}

}  // namespace handlers

template <int W>
inline void install_syscalls(Machine<W>& machine) {
    using namespace handlers;
    machine.install_syscall_handler(nr::thread_sleep, sys_thread_sleep<W>);
    machine.install_syscall_handler(nr::poll_oneoff, sys_poll_oneoff<W>);
    machine.install_syscall_handler(nr::proc_fork, sys_proc_fork<W>);
    machine.install_syscall_handler(nr::proc_exec, sys_proc_exec<W>);
    machine.install_syscall_handler(nr::proc_join, sys_proc_join<W>);
    machine.install_syscall_handler(nr::proc_exit, sys_proc_exit<W>);
    machine.install_syscall_handler(nr::proc_signal, sys_proc_signal<W>);
    machine.install_syscall_handler(nr::proc_id, sys_proc_id<W>);
    machine.install_syscall_handler(nr::proc_parent, sys_proc_parent<W>);
    machine.install_syscall_handler(nr::sched_yield, sys_sched_yield<W>);

    Machine<W>::on_unhandled_syscall = [](Machine<W>& m, size_t sysnum) {
        RVIX_WARN("syscall", "UNHANDLED #%zu a0=0x%lx a1=0x%lx", sysnum,
                  (long)m.cpu.reg(10), (long)m.cpu.reg(11));
        m.set_result(-38);  // ENOSYS
    };
}

}  // namespace rvix::syscalls
