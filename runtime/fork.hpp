// fork.hpp - Duplicate a running guest process
//
// Copy mode clones the guest memory into a new execution for the child.
// Lazy mode (vfork) lets the child borrow the parent's execution until it
// calls proc_exec or proc_exit; the parent is then rewound to its fork
// call. Memory the child writes outside the recorded stack during that
// window stays visible to the parent.
#pragma once

#include "env.hpp"

namespace rvix {

// Writes 0 to *pid_ptr for the child and the child's pid for the parent.
//   process table full        -> Perm
//   pid_ptr not writable      -> Memviolation
//   child could not be queued -> Again (parent keeps its stack)
// A pid slot outside the captured stack terminates the process.
Errno proc_fork(ThreadEnv& env, bool copy_memory, uint64_t pid_ptr);

// Ends the vfork window of `env`: swaps the parent identity back, hands
// it the child's pid and rewinds it to its fork call. Leaves InvokeAgain
// (or a Trap if the parent state cannot be restored) as on-called action.
void finish_vfork(ThreadEnv& env);

}  // namespace rvix
