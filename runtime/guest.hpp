// guest.hpp - The execution a guest thread runs on
//
// The process/thread layer only talks to guests through this interface:
// libriscv machines in the runtime (riscv_guest.hpp), scripted fakes in
// the tests.
#pragma once

#include "snapshot.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace rvix {

class ThreadEnv;

enum class AddressWidth : uint8_t {
    Bits32 = 4,
    Bits64 = 8,
};

inline size_t address_bytes(AddressWidth w) {
    return static_cast<size_t>(w);
}

// Guest stack region; grows down from stack_upper.
struct StackLayout {
    uint64_t stack_lower = 0;
    uint64_t stack_upper = 0;
};

// Guest memory access outside the sandbox
class GuestFault : public std::runtime_error {
public:
    GuestFault(const std::string& what, uint64_t addr)
        : std::runtime_error(what), addr_(addr) {}
    uint64_t addr() const { return addr_; }
private:
    uint64_t addr_;
};

class GuestExecution {
public:
    virtual ~GuestExecution() = default;

    virtual AddressWidth width() const = 0;
    virtual StackLayout stack_layout() const = 0;
    virtual uint64_t stack_pointer() const = 0;

    // Both throw GuestFault when [addr, addr+len) is not guest memory.
    virtual void read(uint64_t addr, void* dst, size_t len) const = 0;
    virtual void write(uint64_t addr, const void* src, size_t len) = 0;

    // Register file plus the point a resumed guest re-enters at: the
    // syscall instruction that was executing when this was taken.
    virtual Bytes save_continuation() const = 0;
    // Returns false if `data` is not a continuation of this guest.
    virtual bool load_continuation(const uint8_t* data, size_t len) = 0;

    virtual StoreSnapshot capture_snapshot() const = 0;
    virtual void restore_snapshot(const StoreSnapshot& snapshot) = 0;

    // A new execution of the same module whose memory is a copy of this
    // one's. Registers are left for a rewind to fill in.
    virtual std::unique_ptr<GuestExecution> clone_memory() const = 0;

    // Associates syscall dispatch with `env`.
    virtual void bind(ThreadEnv& env) = 0;

    // Runs until the guest exits or a syscall stops it. Throws on a
    // fault the guest cannot recover from.
    virtual void run() = 0;
    // Exit code once run() returned without a pending on-called action
    virtual ExitCode exit_code() const = 0;

    template <typename T>
    T read_value(uint64_t addr) const {
        T val;
        read(addr, &val, sizeof(T));
        return val;
    }

    template <typename T>
    void write_value(uint64_t addr, T val) {
        write(addr, &val, sizeof(T));
    }

    // Pointer-sized value for this guest's width
    void write_address(uint64_t addr, uint64_t val) {
        if (width() == AddressWidth::Bits32) {
            write_value<uint32_t>(addr, static_cast<uint32_t>(val));
        } else {
            write_value<uint64_t>(addr, val);
        }
    }
};

}  // namespace rvix
