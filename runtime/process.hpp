// process.hpp - Guest process and thread bookkeeping
//
// A process owns its threads and its children. Exit statuses are shared
// cells so a parent can observe a child's exit without owning it, and a
// thread only keeps a non-owning reference back to its process.
#pragma once

#include "errno.hpp"
#include "task.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace rvix {

class WasiProcess;
class ProcessControl;

class WasiThread {
public:
    WasiThread(uint32_t tid, std::weak_ptr<WasiProcess> process);

    uint32_t tid() const { return tid_; }
    std::shared_ptr<WasiProcess> process() const { return process_.lock(); }

    // Queues a signal and wakes the thread if it is in a deep sleep
    void signal(Signal sig);
    bool has_fatal_signal() const;
    // Returns the first pending fatal signal (or None). Pending signals
    // whose default action is to ignore them are dropped.
    Signal take_fatal_signal();

    // Waker of the deep sleep the thread is parked in
    void set_sleep_waker(Waker waker);
    void clear_sleep_waker();

    void set_finished(ExitCode code);
    std::optional<ExitCode> exit_code() const;

private:
    mutable std::mutex mutex_;
    const uint32_t tid_;
    std::weak_ptr<WasiProcess> process_;
    std::deque<Signal> pending_;
    Waker sleep_waker_;
    std::optional<ExitCode> exit_code_;
};

class WasiProcess : public std::enable_shared_from_this<WasiProcess> {
public:
    WasiProcess(ProcessControl& control, uint32_t pid, uint32_t ppid);

    uint32_t pid() const { return pid_; }
    uint32_t ppid() const { return ppid_; }
    ProcessControl& control() const { return control_; }

    const std::shared_ptr<TaskStatus>& status() const { return status_; }
    bool is_finished() const { return status_->is_finished(); }

    std::shared_ptr<WasiThread> new_thread();
    std::shared_ptr<WasiThread> main_thread() const;
    std::vector<std::shared_ptr<WasiThread>> threads() const;

    void add_child(std::shared_ptr<WasiProcess> child);
    std::shared_ptr<WasiProcess> find_child(uint32_t pid) const;
    std::vector<std::shared_ptr<WasiProcess>> children() const;
    // Drops the child handle once its exit code has been observed
    bool reap_child(uint32_t pid);

    // Delivers `sig` to every thread of the process
    void signal(Signal sig);

    // Records the process exit code (first caller wins) and finishes
    // every thread that is still running.
    void terminate(ExitCode code);

private:
    ProcessControl& control_;
    const uint32_t pid_;
    const uint32_t ppid_;
    std::shared_ptr<TaskStatus> status_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<WasiThread>> threads_;
    std::vector<std::shared_ptr<WasiProcess>> children_;
};

// Pid allocation and lookup. Holds processes weakly: a process lives as
// long as its parent (or the host) holds it.
class ProcessControl {
public:
    explicit ProcessControl(size_t max_processes = 32768);

    std::shared_ptr<WasiProcess> new_root();
    // A new process linked into `parent`'s children. nullptr once
    // max_processes processes are alive.
    std::shared_ptr<WasiProcess> fork(const std::shared_ptr<WasiProcess>& parent);
    // Undoes a fork whose child never started
    void abandon(const std::shared_ptr<WasiProcess>& child);

    std::shared_ptr<WasiProcess> lookup(uint32_t pid) const;
    uint32_t next_tid();
    size_t live_processes() const;

private:
    std::shared_ptr<WasiProcess> make_process(uint32_t ppid);
    void prune();

    mutable std::mutex mutex_;
    size_t max_processes_;
    uint32_t next_pid_ = 1;
    uint32_t next_tid_ = 1;
    std::map<uint32_t, std::weak_ptr<WasiProcess>> processes_;
};

}  // namespace rvix
