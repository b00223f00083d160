// fake_guest.hpp - Scripted in-memory guest for the runtime tests
//
// A program is a list of instructions run in order; pc indexes the list.
// Syscall instructions behave like an ecall under libriscv: a rewind
// inside the handler re-executes the same instruction, a stop leaves pc
// after it, and a rewind outside run() re-enters at the captured one.
#pragma once

#include "env.hpp"
#include "fd.hpp"
#include "guest.hpp"
#include "loader.hpp"
#include "runner.hpp"
#include "runtime.hpp"
#include "vfs.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstring>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace rvix::test {

class FakeGuest;
using Instruction = std::function<void(FakeGuest&)>;
using Program = std::vector<Instruction>;

class FakeGuest : public GuestExecution {
public:
    static constexpr uint64_t BASE = 0x10000;
    static constexpr uint64_t MEMORY_SIZE = 0x10000;
    static constexpr uint64_t STACK_LOWER = BASE + 0x8000;
    static constexpr uint64_t STACK_UPPER = BASE + MEMORY_SIZE;
    // Scratch memory outside the stack region
    static constexpr uint64_t HEAP = BASE + 0x100;
    static constexpr uint32_t CONTINUATION_MAGIC = 0x454b4146;  // "FAKE"
    static constexpr size_t CONTINUATION_SIZE = 16 + 32 * 8;

    explicit FakeGuest(std::shared_ptr<const Program> program,
                       AddressWidth width = AddressWidth::Bits64,
                       std::vector<std::string> args = {})
        : program_(std::move(program)), width_(width), args_(std::move(args)),
          memory_(MEMORY_SIZE, 0) {
        regs_[2] = STACK_UPPER;
    }

    AddressWidth width() const override { return width_; }
    StackLayout stack_layout() const override { return {STACK_LOWER, STACK_UPPER}; }
    uint64_t stack_pointer() const override { return regs_[2]; }

    void read(uint64_t addr, void* dst, size_t len) const override {
        check(addr, len);
        std::memcpy(dst, memory_.data() + (addr - BASE), len);
    }

    void write(uint64_t addr, const void* src, size_t len) override {
        check(addr, len);
        std::memcpy(memory_.data() + (addr - BASE), src, len);
    }

    Bytes save_continuation() const override {
        Bytes out(CONTINUATION_SIZE);
        const uint32_t header[2] = {CONTINUATION_MAGIC, static_cast<uint32_t>(width_)};
        std::memcpy(out.data(), header, sizeof(header));
        const uint64_t pc = pc_;
        std::memcpy(out.data() + 8, &pc, 8);
        std::memcpy(out.data() + 16, regs_.data(), 32 * 8);
        return out;
    }

    bool load_continuation(const uint8_t* data, size_t len) override {
        if (len != CONTINUATION_SIZE) return false;
        uint32_t header[2];
        std::memcpy(header, data, sizeof(header));
        if (header[0] != CONTINUATION_MAGIC || header[1] != static_cast<uint32_t>(width_)) {
            return false;
        }
        uint64_t pc;
        std::memcpy(&pc, data + 8, 8);
        std::memcpy(regs_.data(), data + 16, 32 * 8);
        regs_[0] = 0;
        pc_ = pc;
        if (running_) next_ = pc;
        return true;
    }

    StoreSnapshot capture_snapshot() const override {
        StoreSnapshot snap;
        snap.globals = {global, global2};
        snap.aux["brk"] = brk;
        return snap;
    }

    void restore_snapshot(const StoreSnapshot& snapshot) override {
        if (snapshot.globals.size() >= 2) {
            global = snapshot.globals[0];
            global2 = snapshot.globals[1];
        }
        auto it = snapshot.aux.find("brk");
        if (it != snapshot.aux.end()) brk = it->second;
    }

    std::unique_ptr<GuestExecution> clone_memory() const override {
        if (fail_clone) {
            throw std::runtime_error("fake guest: clone refused");
        }
        auto copy = std::make_unique<FakeGuest>(program_, width_, args_);
        copy->memory_ = memory_;
        copy->regs_.fill(0);
        return copy;
    }

    void bind(ThreadEnv& env) override { env_ = &env; }

    void run() override {
        struct RunningFlag {
            explicit RunningFlag(bool& flag) : flag_(flag) { flag_ = true; }
            ~RunningFlag() { flag_ = false; }
            bool& flag_;
        } flag(running_);

        stopped_ = false;
        while (!stopped_ && pc_ < program_->size()) {
            const uint64_t cur = pc_;
            next_ = cur + 1;
            (*program_)[cur](*this);
            pc_ = next_;
        }
    }

    ExitCode exit_code() const override { return exit_code_; }

    // Instruction-side helpers
    ThreadEnv& env() { return *env_; }
    uint64_t& reg(int i) { return regs_[i]; }
    uint64_t a0() const { return regs_[10]; }
    uint64_t sp() const { return regs_[2]; }
    void set_sp(uint64_t sp) { regs_[2] = sp; }
    uint64_t pc() const { return pc_; }
    void jump(uint64_t target) { next_ = target; }
    void stop() { stopped_ = true; }
    void exit(ExitCode code) {
        exit_code_ = code;
        stopped_ = true;
    }
    bool running() const { return running_; }
    const std::vector<std::string>& args() const { return args_; }

    uint32_t load_u32(uint64_t addr) const { return read_value<uint32_t>(addr); }
    void store_u32(uint64_t addr, uint32_t val) { write_value<uint32_t>(addr, val); }

    // Snapshot-visible state
    uint64_t global = 0;
    uint64_t global2 = 0;
    uint64_t brk = 0;
    bool fail_clone = false;

private:
    void check(uint64_t addr, size_t len) const {
        if (addr < BASE || len > MEMORY_SIZE || addr - BASE > MEMORY_SIZE - len) {
            throw GuestFault("fake guest: access out of bounds", addr);
        }
    }

    std::shared_ptr<const Program> program_;
    AddressWidth width_;
    std::vector<std::string> args_;
    std::vector<uint8_t> memory_;
    std::array<uint64_t, 32> regs_{};
    uint64_t pc_ = 0;
    uint64_t next_ = 0;
    bool running_ = false;
    bool stopped_ = false;
    ExitCode exit_code_ = 0;
    ThreadEnv* env_ = nullptr;
};

// ecall: runs `fn` and delivers its errno in a0 unless it left an
// on-called action (InvokeAgain re-executes, anything else stops).
inline Instruction sys(std::function<Errno(ThreadEnv&, FakeGuest&)> fn) {
    return [fn = std::move(fn)](FakeGuest& g) {
        ThreadEnv& env = g.env();
        Errno ret = fn(env, g);
        if (auto action = env.take_on_called()) {
            if (std::holds_alternative<InvokeAgain>(*action)) return;
            env.set_on_called(std::move(*action));
            g.stop();
            return;
        }
        g.reg(10) = static_cast<uint64_t>(ret);
    };
}

inline Instruction exit_with(ExitCode code) {
    return [code](FakeGuest& g) { g.exit(code); };
}

// Reserves `size` bytes of stack
inline Instruction frame(uint64_t size) {
    return [size](FakeGuest& g) { g.set_sp(g.sp() - size); };
}

// What instructions observed, across every process running a program
struct Record {
    std::string label;
    uint32_t pid = 0;
    std::vector<uint64_t> values;
};

class Journal {
public:
    void add(Record r) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(r));
    }

    std::vector<Record> find(const std::string& label) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Record> out;
        for (const auto& r : records_) {
            if (r.label == label) out.push_back(r);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Record> records_;
};

inline Instruction record(std::shared_ptr<Journal> journal, std::string label,
                          std::function<std::vector<uint64_t>(FakeGuest&)> values = {}) {
    return [journal, label, values](FakeGuest& g) {
        Record r;
        r.label = label;
        r.pid = g.env().process().pid();
        if (values) r.values = values(g);
        journal->add(std::move(r));
    };
}

// Smallest buffer inspect_elf accepts, followed by `payload`
inline std::vector<uint8_t> make_elf(AddressWidth width, const std::string& payload = "") {
    std::vector<uint8_t> elf(64, 0);
    elf[0] = 0x7f;
    elf[1] = 'E';
    elf[2] = 'L';
    elf[3] = 'F';
    elf[4] = (width == AddressWidth::Bits32) ? 1 : 2;
    elf[5] = 1;
    elf[18] = 0xF3;
    elf.insert(elf.end(), payload.begin(), payload.end());
    return elf;
}

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

// A Runtime whose guests are fake programs looked up by module name
class Harness {
public:
    struct Started {
        std::shared_ptr<ThreadEnv> env;
        FakeGuest* guest = nullptr;
        std::shared_ptr<WasiProcess> process;
    };

    explicit Harness(RuntimeConfig config = RuntimeConfig())
        : fs(std::make_shared<vfs::VirtualFS>()),
          programs_(std::make_shared<Programs>()) {
        auto programs = programs_;
        runtime = std::make_unique<Runtime>(config,
            [programs](std::shared_ptr<const Module> module, const std::vector<std::string>& args,
                       const RuntimeConfig&) -> std::unique_ptr<GuestExecution> {
                auto program = programs->get(module->name);
                if (!program) return nullptr;
                return std::make_unique<FakeGuest>(program, module->width, args);
            });
    }

    ~Harness() {
        runtime->shutdown();
    }

    // Registers `program` under `name` and returns its module. With
    // `in_fs` the binary is also placed at `name` in the filesystem.
    std::shared_ptr<const Module> add_program(const std::string& name, Program program,
                                              AddressWidth width = AddressWidth::Bits64,
                                              bool in_fs = false) {
        programs_->put(name, std::make_shared<const Program>(std::move(program)));
        auto bytes = make_elf(width, name);
        if (in_fs) fs->add_virtual_file(name, bytes);
        std::shared_ptr<const Module> module;
        if (runtime->modules().load(bytes, name, module) != Errno::Success) {
            throw std::runtime_error("cannot load fake module " + name);
        }
        return module;
    }

    ProcessIdentity root_identity() {
        ProcessIdentity id;
        id.process = runtime->processes().new_root();
        id.thread = id.process->new_thread();
        id.fds = vfs::FdTable::with_stdio(std::make_shared<vfs::TtyInode>(),
                                          std::make_shared<vfs::TtyInode>(),
                                          std::make_shared<vfs::TtyInode>());
        return id;
    }

    // Root process with `program` attached but not running
    Started prepare(const std::string& name, Program program,
                    AddressWidth width = AddressWidth::Bits64) {
        auto module = add_program(name, std::move(program), width);
        Started s;
        auto id = root_identity();
        s.process = id.process;
        s.env = ThreadEnv::create(*runtime, id, fs, module);
        auto guest = runtime->instantiate(module, {name});
        s.guest = static_cast<FakeGuest*>(guest.get());
        s.env->attach(std::move(guest));
        return s;
    }

    // Same, queued on the worker pool
    Started start(const std::string& name, Program program,
                  AddressWidth width = AddressWidth::Bits64) {
        Started s = prepare(name, std::move(program), width);
        if (!runtime->spawn_guest(s.env, run_thread)) {
            throw std::runtime_error("cannot spawn " + name);
        }
        return s;
    }

    std::optional<ExitCode> wait(const std::shared_ptr<WasiProcess>& process,
                                 std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        return process->status()->wait_for(timeout);
    }

    std::unique_ptr<Runtime> runtime;
    std::shared_ptr<vfs::VirtualFS> fs;

private:
    class Programs {
    public:
        void put(const std::string& name, std::shared_ptr<const Program> program) {
            std::lock_guard<std::mutex> lock(mutex_);
            programs_[name] = std::move(program);
        }
        std::shared_ptr<const Program> get(const std::string& name) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = programs_.find(name);
            return it == programs_.end() ? nullptr : it->second;
        }
    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::shared_ptr<const Program>> programs_;
    };

    std::shared_ptr<Programs> programs_;
};

}  // namespace rvix::test
