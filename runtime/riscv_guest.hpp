// riscv_guest.hpp - libriscv machines as guest executions
//
// One RiscvGuest per guest thread. The machine runs a statically linked
// RV32 or RV64 ELF in userland emulation: Linux syscalls come from
// libriscv, the process/thread syscalls (500+) from syscalls.hpp.
#pragma once

#include <libriscv/machine.hpp>
#include "config.hpp"
#include "env.hpp"
#include "guest.hpp"
#include "loader.hpp"
#include "syscalls.hpp"
#include "trace.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace rvix {

inline const std::vector<std::string>& guest_environment() {
    static const std::vector<std::string> env = {
        "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin",
        "HOME=/root",
        "USER=root",
        "TERM=xterm-256color",
        "LANG=C.UTF-8",
        "HOSTNAME=rvix",
        "TZ=UTC",
    };
    return env;
}

template <int W>
class RiscvGuest : public GuestExecution {
public:
    using Machine = riscv::Machine<W>;
    using address_t = riscv::address_type<W>;

    // Continuation: magic, width, pc, x0..x31
    static constexpr uint32_t CONTINUATION_MAGIC = 0x54435652;  // "RVCT"
    static constexpr size_t CONTINUATION_SIZE = 8 + 8 + 32 * 8;
    static constexpr size_t FP_GLOBALS = 32;

    RiscvGuest(std::shared_ptr<const Module> module, const std::vector<std::string>& args,
               const RuntimeConfig& config)
        : module_(std::move(module)), config_(config) {
        create_machine();
        machine_->setup_linux(args, guest_environment());
    }

    AddressWidth width() const override {
        return W == 4 ? AddressWidth::Bits32 : AddressWidth::Bits64;
    }

    StackLayout stack_layout() const override { return stack_; }

    uint64_t stack_pointer() const override {
        return machine_->cpu.reg(riscv::REG_SP);
    }

    void read(uint64_t addr, void* dst, size_t len) const override {
        try {
            machine_->memory.memcpy_out(dst, static_cast<address_t>(addr), len);
        } catch (const riscv::MachineException& e) {
            throw GuestFault(e.what(), addr);
        }
    }

    void write(uint64_t addr, const void* src, size_t len) override {
        try {
            machine_->memory.memcpy(static_cast<address_t>(addr), src, len);
        } catch (const riscv::MachineException& e) {
            throw GuestFault(e.what(), addr);
        }
    }

    Bytes save_continuation() const override {
        Bytes out(CONTINUATION_SIZE);
        store_u64(out, 0, CONTINUATION_MAGIC | (uint64_t(W) << 32));
        store_u64(out, 8, machine_->cpu.pc());
        for (int i = 0; i < 32; i++) {
            store_u64(out, 16 + i * 8, machine_->cpu.reg(i));
        }
        return out;
    }

    bool load_continuation(const uint8_t* data, size_t len) override {
        if (len != CONTINUATION_SIZE) return false;
        uint64_t header;
        std::memcpy(&header, data, 8);
        if (header != (CONTINUATION_MAGIC | (uint64_t(W) << 32))) return false;

        uint64_t pc;
        std::memcpy(&pc, data + 8, 8);
        for (int i = 1; i < 32; i++) {  // x0 is hardwired zero
            uint64_t reg;
            std::memcpy(&reg, data + 16 + i * 8, 8);
            machine_->cpu.reg(i) = static_cast<address_t>(reg);
        }
        machine_->cpu.jump(static_cast<address_t>(pc));
        // Inside a syscall handler the pc advances past the ecall on return
        if (running_) machine_->cpu.increment_pc(-4);
        return true;
    }

    StoreSnapshot capture_snapshot() const override {
        StoreSnapshot snap;
        auto& regs = machine_->cpu.registers();
        snap.globals.reserve(FP_GLOBALS + 1);
        for (size_t i = 0; i < FP_GLOBALS; i++) {
            snap.globals.push_back(static_cast<uint64_t>(regs.getfl(i).i64));
        }
        snap.globals.push_back(regs.fcsr().whole);
        snap.aux["mmap_address"] = machine_->memory.mmap_address();
        return snap;
    }

    void restore_snapshot(const StoreSnapshot& snapshot) override {
        auto& regs = machine_->cpu.registers();
        const size_t nfp = std::min(snapshot.globals.size(), FP_GLOBALS);
        for (size_t i = 0; i < nfp; i++) {
            regs.getfl(i).i64 = snapshot.globals[i];
        }
        if (snapshot.globals.size() > FP_GLOBALS) {
            regs.fcsr().whole = static_cast<uint32_t>(snapshot.globals[FP_GLOBALS]);
        }
        auto it = snapshot.aux.find("mmap_address");
        if (it != snapshot.aux.end()) {
            machine_->memory.mmap_address() = static_cast<address_t>(it->second);
        }
    }

    std::unique_ptr<GuestExecution> clone_memory() const override {
        auto copy = std::unique_ptr<RiscvGuest>(new RiscvGuest(module_, config_));
        const size_t size = machine_->memory.memory_arena_size();
        if (size == 0 || copy->machine_->memory.memory_arena_size() != size) {
            throw std::runtime_error("guest memory arena cannot be copied");
        }
        std::memcpy((uint8_t*)copy->machine_->memory.memory_arena_ptr(),
                    (const uint8_t*)machine_->memory.memory_arena_ptr(), size);
        copy->machine_->memory.mmap_address() = machine_->memory.mmap_address();
        RVIX_TRACE("fork", "copied %zu bytes of guest memory", size);
        return copy;
    }

    void bind(ThreadEnv& env) override {
        machine_->set_userdata(&env);
    }

    // Handles page protection faults at segment boundaries by making the
    // faulting page RWX and retrying, like a minimal page fault handler.
    void run() override {
        RunningFlag flag(running_);
        for (int retries = 0; retries < 8; retries++) {
            try {
                machine_->simulate(config_.max_instructions);
                return;
            } catch (const riscv::MachineException& e) {
                const uint64_t fault_addr = e.data();
                RVIX_TRACE("rvix", "MachineException: %s data=0x%lx pc=0x%lx retry=%d",
                           e.what(), (long)fault_addr, (long)machine_->cpu.pc(), retries);
                if (machine_->instruction_limit_reached()) {
                    RVIX_WARN("rvix", "instruction limit reached after %lu instructions",
                              (unsigned long)machine_->instruction_counter());
                    throw;
                }
                if (fault_addr != 0 && retries < 7) {
                    constexpr uint64_t PAGE_MASK = ~0xFFFULL;
                    riscv::PageAttributes attr;
                    attr.read = true;
                    attr.write = true;
                    attr.exec = true;
                    machine_->memory.set_page_attr(fault_addr & PAGE_MASK, 4096, attr);
                    continue;
                }
                throw;
            }
        }
    }

    ExitCode exit_code() const override {
        return static_cast<ExitCode>(machine_->template return_value<int>());
    }

private:
    struct RunningFlag {
        explicit RunningFlag(bool& flag) : flag_(flag) { flag_ = true; }
        ~RunningFlag() { flag_ = false; }
        bool& flag_;
    };

    // Same module and options, memory left for clone_memory to fill
    RiscvGuest(std::shared_ptr<const Module> module, const RuntimeConfig& config)
        : module_(std::move(module)), config_(config) {
        create_machine();
    }

    void create_machine() {
        riscv::MachineOptions<W> options;
        options.memory_max = config_.memory_max;
        options.stack_size = config_.stack_size;
        machine_ = std::make_unique<Machine>(module_->binary, options);

        const uint64_t top = machine_->cpu.reg(riscv::REG_SP);
        stack_.stack_upper = top;
        stack_.stack_lower = top > config_.stack_size ? top - config_.stack_size : 0;

        machine_->setup_linux_syscalls();
        const auto heap_area = machine_->memory.mmap_allocate(config_.heap_size);
        machine_->setup_native_heap(HEAP_SYSCALLS_BASE, heap_area, config_.heap_size);
        machine_->setup_native_memory(MEMORY_SYSCALLS_BASE);
        syscalls::install_syscalls(*machine_);

        machine_->set_printer([](const auto&, const char* data, size_t len) {
            std::cout.write(data, len);
            std::cout.flush();
        });
    }

    static void store_u64(Bytes& out, size_t offset, uint64_t val) {
        std::memcpy(out.data() + offset, &val, sizeof(val));
    }

    std::shared_ptr<const Module> module_;
    RuntimeConfig config_;
    std::unique_ptr<Machine> machine_;
    StackLayout stack_;
    bool running_ = false;
};

inline std::unique_ptr<GuestExecution> make_riscv_guest(std::shared_ptr<const Module> module,
                                                        const std::vector<std::string>& args,
                                                        const RuntimeConfig& config) {
    if (module->width == AddressWidth::Bits32) {
        return std::make_unique<RiscvGuest<riscv::RISCV32>>(std::move(module), args, config);
    }
    return std::make_unique<RiscvGuest<riscv::RISCV64>>(std::move(module), args, config);
}

}  // namespace rvix
