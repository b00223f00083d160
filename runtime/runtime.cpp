#include "runtime.hpp"
#include "env.hpp"
#include "trace.hpp"

#include <stdexcept>

namespace rvix {

Runtime::Runtime(RuntimeConfig config, GuestFactory factory)
    : config_(config),
      factory_(std::move(factory)),
      tasks_(config.worker_threads, config.max_tasks) {}

std::unique_ptr<GuestExecution> Runtime::instantiate(const std::shared_ptr<const Module>& module,
                                                     const std::vector<std::string>& args) {
    if (!factory_) {
        throw std::runtime_error("no guest factory installed");
    }
    auto guest = factory_(module, args, config_);
    if (!guest) {
        throw std::runtime_error("guest factory failed for " + module->name);
    }
    return guest;
}

bool Runtime::spawn_guest(std::shared_ptr<ThreadEnv> env, Entry entry) {
    const uint32_t tid = env->thread().tid();
    bool ok = tasks_.spawn([env = std::move(env), entry = std::move(entry)]() mutable {
        entry(std::move(env));
    });
    if (!ok) {
        RVIX_WARN("tasks", "could not spawn tid=%u", tid);
    }
    return ok;
}

}  // namespace rvix
