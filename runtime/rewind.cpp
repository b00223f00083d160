#include "rewind.hpp"
#include "trace.hpp"

#include <cstring>

namespace rvix {

Errno capture_stack(const GuestExecution& guest, size_t capture_limit, CapturedStack& out) {
    const StackLayout layout = guest.stack_layout();
    const uint64_t sp = guest.stack_pointer();

    if (sp < layout.stack_lower || sp > layout.stack_upper) {
        RVIX_WARN("rewind", "unwind: sp=0x%lx outside stack [0x%lx, 0x%lx)",
                  (long)sp, (long)layout.stack_lower, (long)layout.stack_upper);
        return Errno::Memviolation;
    }
    const uint64_t live = layout.stack_upper - sp;
    if (live > capture_limit) {
        RVIX_WARN("rewind", "unwind: live stack %lu bytes exceeds capture limit %zu",
                  (unsigned long)live, capture_limit);
        return Errno::Memviolation;
    }

    out.memory_stack.resize(live);
    try {
        if (live > 0) guest.read(sp, out.memory_stack.data(), live);
    } catch (const GuestFault& e) {
        RVIX_WARN("rewind", "unwind: stack read fault at 0x%lx: %s", (long)e.addr(), e.what());
        return Errno::Memviolation;
    }
    out.rewind_stack = guest.save_continuation();

    RVIX_TRACE("rewind", "unwound sp=0x%lx memory_stack=%zu rewind_stack=%zu",
               (long)sp, out.memory_stack.size(), out.rewind_stack.size());
    return Errno::Success;
}

Errno rewind(GuestExecution& guest, const Bytes& memory_stack, const Bytes& rewind_stack,
             const Bytes& store_data, AddressWidth width) {
    if (width != guest.width()) {
        RVIX_WARN("rewind", "address width mismatch (%zu-byte state, %zu-byte guest)",
                  address_bytes(width), address_bytes(guest.width()));
        return Errno::Inval;
    }

    StoreSnapshot snapshot;
    Errno err = StoreSnapshot::deserialize(store_data.data(), store_data.size(), snapshot);
    if (err != Errno::Success) {
        return err;
    }

    const StackLayout layout = guest.stack_layout();
    if (memory_stack.size() > layout.stack_upper - layout.stack_lower) {
        RVIX_WARN("rewind", "memory stack of %zu bytes does not fit the stack region",
                  memory_stack.size());
        return Errno::Memviolation;
    }
    // The continuation is validated as it is loaded, so it goes first
    if (!guest.load_continuation(rewind_stack.data(), rewind_stack.size())) {
        RVIX_WARN("rewind", "continuation of %zu bytes rejected by guest", rewind_stack.size());
        return Errno::Inval;
    }

    guest.restore_snapshot(snapshot);
    const uint64_t sp = layout.stack_upper - memory_stack.size();
    try {
        if (!memory_stack.empty()) guest.write(sp, memory_stack.data(), memory_stack.size());
    } catch (const GuestFault& e) {
        RVIX_WARN("rewind", "stack write fault at 0x%lx: %s", (long)e.addr(), e.what());
        return Errno::Memviolation;
    }
    RVIX_TRACE("rewind", "rewound sp=0x%lx memory_stack=%zu", (long)sp, memory_stack.size());
    return Errno::Success;
}

bool patch_captured_u32(Bytes& memory_stack, const StackLayout& layout,
                        uint64_t addr, uint32_t value) {
    if (addr < layout.stack_lower || addr + sizeof(uint32_t) > layout.stack_upper) {
        return false;
    }
    const uint64_t offset = layout.stack_upper - addr;
    if (offset > memory_stack.size()) {
        return false;
    }
    const size_t pos = memory_stack.size() - offset;
    std::memcpy(memory_stack.data() + pos, &value, sizeof(value));
    return true;
}

}  // namespace rvix
