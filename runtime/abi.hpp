// abi.hpp - Guest ABI: syscall numbers and poll record layouts
//
// Process/thread syscalls live above the Linux range handled by libriscv
// and the native heap/memory helpers (480..499).
//
// Subscription record (48 bytes, little endian):
//   0  userdata   u64
//   8  tag        u8     (0 = clock, 1 = fd_read, 2 = fd_write)
//   16 clock: id u32 | timeout u64 @24 | precision u64 @32 | flags u16 @40
//   16 fd:    fd u32
//
// Event record (32 bytes):
//   0  userdata u64
//   8  error    u16
//   10 type     u8
//   16 nbytes   u64    (fd events)
//   24 flags    u16    (bit 0 = hangup)
#pragma once

#include "errno.hpp"
#include <cstdint>
#include <cstring>

namespace rvix {

namespace nr {
    constexpr int thread_sleep = 500;
    constexpr int poll_oneoff  = 501;
    constexpr int proc_fork    = 502;
    constexpr int proc_exec    = 503;
    constexpr int proc_join    = 504;
    constexpr int proc_exit    = 505;
    constexpr int proc_signal  = 506;
    constexpr int proc_id      = 507;
    constexpr int proc_parent  = 508;
    constexpr int sched_yield  = 509;
}

enum class Eventtype : uint8_t {
    Clock   = 0,
    FdRead  = 1,
    FdWrite = 2,
};

enum class Clockid : uint32_t {
    Realtime         = 0,
    Monotonic        = 1,
    ProcessCputimeId = 2,
    ThreadCputimeId  = 3,
};

constexpr uint16_t SUBCLOCKFLAGS_ABSTIME = 1;
constexpr uint16_t EVENTRWFLAGS_HANGUP = 1;

// proc_join
constexpr uint32_t JOIN_ANY_PID = 0xFFFFFFFFu;
constexpr uint32_t JOIN_NON_BLOCKING = 1;

constexpr size_t SUBSCRIPTION_SIZE = 48;
constexpr size_t EVENT_SIZE = 32;

// Little-endian field access into raw guest records
template <typename T>
inline T load_le(const uint8_t* p) {
    T val;
    std::memcpy(&val, p, sizeof(T));
    return val;
}

template <typename T>
inline void store_le(uint8_t* p, T val) {
    std::memcpy(p, &val, sizeof(T));
}

struct TriggeredEvent {
    uint64_t userdata = 0;
    Eventtype type = Eventtype::Clock;
    Errno error = Errno::Success;
    uint64_t nbytes = 0;
    uint16_t flags = 0;
};

inline void encode_event(const TriggeredEvent& ev, uint8_t (&raw)[EVENT_SIZE]) {
    std::memset(raw, 0, EVENT_SIZE);
    store_le<uint64_t>(raw + 0, ev.userdata);
    store_le<uint16_t>(raw + 8, static_cast<uint16_t>(ev.error));
    raw[10] = static_cast<uint8_t>(ev.type);
    if (ev.type != Eventtype::Clock) {
        store_le<uint64_t>(raw + 16, ev.nbytes);
        store_le<uint16_t>(raw + 24, ev.flags);
    }
}

inline TriggeredEvent decode_event(const uint8_t (&raw)[EVENT_SIZE]) {
    TriggeredEvent ev;
    ev.userdata = load_le<uint64_t>(raw + 0);
    ev.error = static_cast<Errno>(load_le<uint16_t>(raw + 8));
    ev.type = static_cast<Eventtype>(raw[10]);
    ev.nbytes = load_le<uint64_t>(raw + 16);
    ev.flags = load_le<uint16_t>(raw + 24);
    return ev;
}

}  // namespace rvix
