// task_manager.hpp - Host execution for guest tasks and deep sleeps
//
// Guest code runs on a bounded worker pool. A thread in deep sleep holds
// no worker: its poller lives on a single reactor thread and re-polls the
// awaited trigger on wake, on every poll interval and at the deadline.
#pragma once

#include "action.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

namespace rvix {

class WasiThread;

class TaskManager {
public:
    using Task = std::function<void()>;
    // Called on a worker once the sleep resolved
    using Respawn = std::function<void(DeepSleepWork&&, TriggerOutcome)>;

    TaskManager(size_t worker_threads, size_t max_tasks);
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Queues `task` on the worker pool. Returns false after shutdown or
    // when max_tasks tasks are already queued or running.
    bool spawn(Task task);

    // Parks `work` until its trigger resolves, its timeout passes or a
    // fatal signal reaches `thread`, then runs `respawn` on the pool.
    void resume_after_poller(std::shared_ptr<WasiThread> thread, DeepSleepWork work,
                             Respawn respawn);

    // Runs a guest resumed from deep sleep. It counts toward max_tasks
    // like a spawned task but is never turned away.
    void run_resumed(Task task);

    // Stops accepting tasks and drops pending sleeps
    void shutdown();

    size_t active_tasks() const { return active_.load(); }
    size_t sleeping() const { return sleeping_.load(); }

private:
    void run_counted(Task task);

    // Declared first: handlers destroyed with the executors below touch them
    size_t max_tasks_;
    std::atomic<size_t> active_{0};
    std::atomic<size_t> sleeping_{0};
    std::atomic<bool> stopping_{false};

    boost::asio::io_context reactor_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> reactor_work_;
    boost::asio::thread_pool pool_;
    std::thread reactor_thread_;
};

}  // namespace rvix
