// runtime.hpp - Shared services for every guest process
//
// One Runtime per host process: configuration, the pid table, the
// module cache, the guest factory and the task manager that runs it all.
#pragma once

#include "config.hpp"
#include "guest.hpp"
#include "loader.hpp"
#include "process.hpp"
#include "task_manager.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rvix {

class ThreadEnv;

class Runtime {
public:
    // Builds a fresh execution of `module` with `args` as argv
    using GuestFactory = std::function<std::unique_ptr<GuestExecution>(
        std::shared_ptr<const Module> module, const std::vector<std::string>& args,
        const RuntimeConfig& config)>;
    using Entry = std::function<void(std::shared_ptr<ThreadEnv>)>;

    Runtime(RuntimeConfig config, GuestFactory factory);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    const RuntimeConfig& config() const { return config_; }
    ProcessControl& processes() { return processes_; }
    ModuleCache& modules() { return modules_; }
    TaskManager& tasks() { return tasks_; }

    // Throws std::runtime_error if the factory cannot build the guest
    std::unique_ptr<GuestExecution> instantiate(const std::shared_ptr<const Module>& module,
                                                const std::vector<std::string>& args);

    // Runs `entry(env)` on the worker pool. False if the task manager
    // rejected it.
    bool spawn_guest(std::shared_ptr<ThreadEnv> env, Entry entry);

    void shutdown() { tasks_.shutdown(); }

private:
    RuntimeConfig config_;
    GuestFactory factory_;
    ProcessControl processes_;
    ModuleCache modules_;
    // Last: its workers use everything above until they are joined
    TaskManager tasks_;
};

}  // namespace rvix
