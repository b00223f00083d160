// errno.hpp - Guest-visible error, signal and rights codes
//
// Values follow WASI preview1 numbering (plus the WASIX memory-violation
// code) so guest libc ports can use them unchanged.
#pragma once

#include <cstdint>

namespace rvix {

enum class Errno : uint16_t {
    Success      = 0,
    TooBig       = 1,
    Access       = 2,
    Again        = 6,
    Badf         = 8,
    Child        = 12,
    Exist        = 20,
    Fault        = 21,
    Intr         = 27,
    Inval        = 28,
    Io           = 29,
    Isdir        = 31,
    Noent        = 44,
    Noexec       = 45,
    Nomem        = 48,
    Nosys        = 52,
    Notdir       = 54,
    Notsup       = 58,
    Overflow     = 61,
    Perm         = 63,
    Pipe         = 64,
    Srch         = 71,
    Timedout     = 73,
    Notcapable   = 76,
    Memviolation = 78,
    Unknown      = 79,
};

inline const char* errno_name(Errno e) {
    switch (e) {
        case Errno::Success:      return "Success";
        case Errno::TooBig:       return "TooBig";
        case Errno::Access:       return "Access";
        case Errno::Again:        return "Again";
        case Errno::Badf:         return "Badf";
        case Errno::Child:        return "Child";
        case Errno::Exist:        return "Exist";
        case Errno::Fault:        return "Fault";
        case Errno::Intr:         return "Intr";
        case Errno::Inval:        return "Inval";
        case Errno::Io:           return "Io";
        case Errno::Isdir:        return "Isdir";
        case Errno::Noent:        return "Noent";
        case Errno::Noexec:       return "Noexec";
        case Errno::Nomem:        return "Nomem";
        case Errno::Nosys:        return "Nosys";
        case Errno::Notdir:       return "Notdir";
        case Errno::Notsup:       return "Notsup";
        case Errno::Overflow:     return "Overflow";
        case Errno::Perm:         return "Perm";
        case Errno::Pipe:         return "Pipe";
        case Errno::Srch:         return "Srch";
        case Errno::Timedout:     return "Timedout";
        case Errno::Notcapable:   return "Notcapable";
        case Errno::Memviolation: return "Memviolation";
        case Errno::Unknown:      return "Unknown";
    }
    return "???";
}

// Process exit status. Guest-chosen codes, errno values for traps,
// 128 + signo for fatal signals.
using ExitCode = int32_t;

inline ExitCode exit_code_from(Errno e) {
    return static_cast<ExitCode>(e);
}

enum class Signal : uint8_t {
    None   = 0,
    Hup    = 1,
    Int    = 2,
    Quit   = 3,
    Ill    = 4,
    Trap   = 5,
    Abrt   = 6,
    Bus    = 7,
    Fpe    = 8,
    Kill   = 9,
    Usr1   = 10,
    Segv   = 11,
    Usr2   = 12,
    Pipe   = 13,
    Alrm   = 14,
    Term   = 15,
    Chld   = 16,
    Cont   = 17,
    Stop   = 18,
    Tstp   = 19,
    Ttin   = 20,
    Ttou   = 21,
    Urg    = 22,
    Xcpu   = 23,
    Xfsz   = 24,
    Vtalrm = 25,
    Prof   = 26,
    Winch  = 27,
    Poll   = 28,
    Pwr    = 29,
    Sys    = 30,
};

constexpr uint8_t MAX_SIGNAL = 30;

// Default disposition: everything terminates except job control and
// the informational signals.
inline bool signal_is_fatal(Signal sig) {
    switch (sig) {
        case Signal::None:
        case Signal::Chld:
        case Signal::Cont:
        case Signal::Stop:
        case Signal::Tstp:
        case Signal::Ttin:
        case Signal::Ttou:
        case Signal::Urg:
        case Signal::Winch:
            return false;
        default:
            return true;
    }
}

inline ExitCode signal_exit_code(Signal sig) {
    return 128 + static_cast<ExitCode>(sig);
}

// fd rights (bit positions as in WASI preview1)
namespace rights {
    constexpr uint64_t FD_DATASYNC        = 1ULL << 0;
    constexpr uint64_t FD_READ            = 1ULL << 1;
    constexpr uint64_t FD_SEEK            = 1ULL << 2;
    constexpr uint64_t FD_FDSTAT_SET_FLAGS = 1ULL << 3;
    constexpr uint64_t FD_SYNC            = 1ULL << 4;
    constexpr uint64_t FD_TELL            = 1ULL << 5;
    constexpr uint64_t FD_WRITE           = 1ULL << 6;
    constexpr uint64_t FD_READDIR         = 1ULL << 14;
    constexpr uint64_t FD_FILESTAT_GET    = 1ULL << 21;
    constexpr uint64_t POLL_FD_READWRITE  = 1ULL << 27;

    constexpr uint64_t ALL = (1ULL << 30) - 1;
    constexpr uint64_t STDIO = FD_READ | FD_WRITE | FD_FILESTAT_GET | POLL_FD_READWRITE;
}

}  // namespace rvix
