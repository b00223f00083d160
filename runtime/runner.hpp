// runner.hpp - Drives guest threads on the worker pool
#pragma once

#include "env.hpp"
#include "loader.hpp"

#include <memory>
#include <string>
#include <vector>

namespace rvix {

// Runs the guest until it exits, traps or parks in a deep sleep.
void run_thread(std::shared_ptr<ThreadEnv> env);

// Post-wait re-entry: rewinds the suspended state, publishes the result
// of the wait into guest memory and runs the guest again. A fatal signal
// finishes the thread instead.
void respawn_thread(std::shared_ptr<ThreadEnv> env, DeepSleepWork&& work, TriggerOutcome outcome);

// Entry of a copy-forked child: rewinds the captured state into the
// cloned execution so the child returns from its fork call.
void resume_forked(std::shared_ptr<ThreadEnv> env, const RewindState& state);

// Records `code` for the thread and its process and closes the process's
// descriptors. Returns true if the execution goes on as the parent of a
// vfork, with the parent's on-called action left in `env`.
bool finish_thread(ThreadEnv& env, ExitCode code);

// Instantiates `module` as a new execution of `identity` and queues it.
//   guest construction failed -> Noexec
//   task manager refused      -> Again
Errno spawn_exec(Runtime& runtime, const ProcessIdentity& identity,
                 std::shared_ptr<vfs::VirtualFS> fs, std::shared_ptr<const Module> module,
                 const std::vector<std::string>& args);

}  // namespace rvix
