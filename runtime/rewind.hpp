// rewind.hpp - Guest stack capture and restore
//
// A suspended guest is two byte buffers plus a snapshot:
//   memory_stack: the live stack bytes [sp, stack_upper)
//   rewind_stack: the encoded continuation (registers + resume point)
// Only this engine reads or writes them; everyone else moves them around.
#pragma once

#include "errno.hpp"
#include "guest.hpp"
#include "snapshot.hpp"

namespace rvix {

struct CapturedStack {
    Bytes memory_stack;
    Bytes rewind_stack;
};

struct RewindState {
    CapturedStack stack;
    SnapshotBlob store_data;
    AddressWidth width = AddressWidth::Bits64;
};

// Copies the live stack and continuation out of `guest`. Fails with
// Memviolation if the stack pointer is outside the stack region or the
// live stack is larger than `capture_limit`.
Errno capture_stack(const GuestExecution& guest, size_t capture_limit, CapturedStack& out);

// Restores a captured state into `guest` so it re-enters at the
// captured resume point. All checks run before anything is written.
//   width mismatch           -> Inval
//   undecodable snapshot     -> Unknown
//   stack larger than region -> Memviolation
//   malformed continuation   -> Inval
Errno rewind(GuestExecution& guest, const Bytes& memory_stack, const Bytes& rewind_stack,
             const Bytes& store_data, AddressWidth width);

inline Errno rewind(GuestExecution& guest, const RewindState& state) {
    static const Bytes empty;
    return rewind(guest, state.stack.memory_stack, state.stack.rewind_stack,
                  state.store_data ? *state.store_data : empty, state.width);
}

// Writes a 32-bit pid into a captured memory stack at the slot that maps
// to guest address `addr`. Returns false if the slot is not inside the
// captured part of the stack.
bool patch_captured_u32(Bytes& memory_stack, const StackLayout& layout,
                        uint64_t addr, uint32_t value);

}  // namespace rvix
