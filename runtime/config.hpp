// config.hpp - Runtime configuration (defaults, overridable from the CLI)
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace rvix {

static constexpr uint64_t MAX_INSTRUCTIONS = 512'000'000'000ULL;  // 512 billion
static constexpr uint32_t HEAP_SYSCALLS_BASE = 480;
static constexpr uint32_t MEMORY_SYSCALLS_BASE = 485;

struct RuntimeConfig {
    // How often a deep sleep re-polls its awaitable without a wake
    std::chrono::milliseconds poll_interval{50};
    // Guest execution workers
    size_t worker_threads = 4;
    // Guest tasks that may be queued or running at once
    size_t max_tasks = 1024;
    // Largest guest stack an unwind may capture
    size_t capture_limit = 4u << 20;
    // fd subscriptions turned into pollable guards per poll_oneoff call
    size_t poll_batch_limit = 64;
    // Above this, poll_oneoff terminates the process
    uint32_t max_subscriptions = 4096;
    uint64_t memory_max = 256ULL << 20;
    uint64_t stack_size = 1ULL << 20;
    uint64_t heap_size = 64ULL << 20;
    uint64_t max_instructions = MAX_INSTRUCTIONS;
};

}  // namespace rvix
