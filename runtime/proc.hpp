// proc.hpp - Sleep, join, exec, exit and signal syscalls
#pragma once

#include "env.hpp"

#include <string>
#include <vector>

namespace rvix {

Errno thread_sleep(ThreadEnv& env, uint64_t duration_ns);
Errno sched_yield(ThreadEnv& env);

// Waits for a child to exit. *pid_ptr selects the child (JOIN_ANY_PID
// for any) and receives the pid that exited; *status_ptr its exit code.
//   no such child             -> Child
//   non-blocking, none exited -> Again
Errno proc_join(ThreadEnv& env, uint64_t pid_ptr, uint32_t flags, uint64_t status_ptr);

// Inside a vfork window this resumes the parent.
Errno proc_exit(ThreadEnv& env, ExitCode code);

// `args` is a newline separated argv; an empty list runs `path` as argv[0].
Errno proc_exec(ThreadEnv& env, const std::string& path, const std::vector<std::string>& args);

// pid 0 is the caller's process
Errno proc_signal(ThreadEnv& env, uint32_t pid, uint8_t sig);

Errno proc_id(ThreadEnv& env, uint64_t pid_ptr);
// pid 0 is the caller's process
Errno proc_parent(ThreadEnv& env, uint32_t pid, uint64_t parent_ptr);

std::vector<std::string> split_args(const std::string& packed);

}  // namespace rvix
