// trace.hpp - stderr logging for the runtime
#pragma once

#include <atomic>
#include <cstdio>

namespace rvix {

// Syscall tracing (disabled by default to reduce log noise)
inline std::atomic<bool> g_trace_syscalls{false};

}  // namespace rvix

#define RVIX_TRACE(tag, fmt, ...) do { \
    if (::rvix::g_trace_syscalls.load(std::memory_order_relaxed)) \
        fprintf(stderr, "[" tag "] " fmt "\n", ##__VA_ARGS__); \
} while (0)

#define RVIX_WARN(tag, fmt, ...) \
    fprintf(stderr, "[" tag "] " fmt "\n", ##__VA_ARGS__)
