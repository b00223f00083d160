// main.cpp - rvix: RISC-V guest processes with fork, poll and deep sleep
//
// Runs a statically linked RISC-V ELF in userland emulation. Guest
// threads that sleep, poll or wait for a child give their host thread
// back to the pool until the wait resolves.
//
// Usage:
//   rvix [options] <riscv-elf-binary> [args...]
//   rvix [options] --rootfs <rootfs.tar> <entry-binary> [args...]

#include "config.hpp"
#include "env.hpp"
#include "fd.hpp"
#include "loader.hpp"
#include "riscv_guest.hpp"
#include "runner.hpp"
#include "runtime.hpp"
#include "trace.hpp"
#include "vfs.hpp"

#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <signal.h>
#include <unistd.h>
#include <execinfo.h>

static void segfault_handler(int) {
    void* bt[32];
    int n = backtrace(bt, 32);
    fprintf(stderr, "\n=== SIGSEGV caught ===\n");
    backtrace_symbols_fd(bt, n, 2);
    _exit(139);
}

static std::vector<uint8_t> load_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw std::runtime_error("Could not open: " + path);
    }
    auto size = file.tellg();
    file.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(size);
    file.read(reinterpret_cast<char*>(data.data()), size);
    return data;
}

// Minimal /dev and /etc so guests find the usual files
static void setup_virtual_files(rvix::vfs::VirtualFS& fs) {
    fs.add_virtual_file("/dev/null", std::vector<uint8_t>{});
    fs.add_virtual_file("/dev/tty", std::vector<uint8_t>{});
    fs.add_virtual_file("/dev/urandom", std::vector<uint8_t>{});
    fs.add_virtual_file("/etc/passwd", "root:x:0:0:root:/root:/bin/sh\n");
    fs.add_virtual_file("/etc/group", "root:x:0:\n");
    fs.add_virtual_file("/etc/hostname", "rvix\n");
    fs.add_virtual_file("/etc/hosts", "127.0.0.1 localhost\n");
}

static void usage(const char* argv0) {
    std::cerr << "rvix - RISC-V process runtime via libriscv\n\n";
    std::cerr << "Usage:\n";
    std::cerr << "  " << argv0 << " [options] <riscv-elf-binary> [args...]\n";
    std::cerr << "  " << argv0 << " [options] --rootfs <rootfs.tar> <entry-binary> [args...]\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --poll-interval <ms>       deep sleep re-poll interval (50)\n";
    std::cerr << "  --threads <n>              guest worker threads (4)\n";
    std::cerr << "  --max-tasks <n>            guest tasks queued or running (1024)\n";
    std::cerr << "  --capture-limit <bytes>    largest stack an unwind captures (4 MiB)\n";
    std::cerr << "  --poll-batch <n>           fd guards per poll_oneoff call (64)\n";
    std::cerr << "  --max-subscriptions <n>    poll_oneoff subscription limit (4096)\n";
    std::cerr << "  --memory <MiB>             guest memory per process (256)\n";
    std::cerr << "  --stack <KiB>              guest stack size (1024)\n";
    std::cerr << "  --trace                    log every process syscall\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << argv0 << " ./guest_demo\n";
    std::cerr << "  " << argv0 << " --threads 8 --rootfs alpine.tar /bin/busybox sh\n";
}

// Parses the value of `opt`; false (with a message) if it is missing or
// not a number.
static bool parse_number(int argc, char** argv, int& i, uint64_t& out) {
    const char* opt = argv[i];
    if (i + 1 >= argc) {
        std::cerr << "Error: " << opt << " requires a value\n";
        return false;
    }
    const std::string value = argv[++i];
    try {
        size_t pos = 0;
        out = std::stoull(value, &pos, 10);
        if (pos != value.size()) throw std::invalid_argument(value);
    } catch (const std::exception&) {
        std::cerr << "Error: " << opt << ": not a number: " << value << "\n";
        return false;
    }
    return true;
}

int main(int argc, char** argv) {
    signal(SIGSEGV, segfault_handler);
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    rvix::RuntimeConfig config;
    std::string rootfs_path;
    std::string entry_path;
    std::vector<std::string> guest_args;
    bool container_mode = false;

    // Parse arguments
    int i = 1;
    while (i < argc) {
        uint64_t n = 0;
        if (strcmp(argv[i], "--rootfs") == 0) {
            if (i + 2 >= argc) {
                std::cerr << "Error: --rootfs requires <tarfile> and <entry-binary>\n";
                return 1;
            }
            container_mode = true;
            rootfs_path = argv[++i];
            entry_path = argv[++i];
            guest_args.push_back(entry_path);
            i++;
            break;
        } else if (strcmp(argv[i], "--poll-interval") == 0) {
            if (!parse_number(argc, argv, i, n)) return 1;
            config.poll_interval = std::chrono::milliseconds(n);
        } else if (strcmp(argv[i], "--threads") == 0) {
            if (!parse_number(argc, argv, i, n)) return 1;
            config.worker_threads = n;
        } else if (strcmp(argv[i], "--max-tasks") == 0) {
            if (!parse_number(argc, argv, i, n)) return 1;
            config.max_tasks = n;
        } else if (strcmp(argv[i], "--capture-limit") == 0) {
            if (!parse_number(argc, argv, i, n)) return 1;
            config.capture_limit = n;
        } else if (strcmp(argv[i], "--poll-batch") == 0) {
            if (!parse_number(argc, argv, i, n)) return 1;
            config.poll_batch_limit = n;
        } else if (strcmp(argv[i], "--max-subscriptions") == 0) {
            if (!parse_number(argc, argv, i, n)) return 1;
            config.max_subscriptions = static_cast<uint32_t>(n);
        } else if (strcmp(argv[i], "--memory") == 0) {
            if (!parse_number(argc, argv, i, n)) return 1;
            config.memory_max = n << 20;
        } else if (strcmp(argv[i], "--stack") == 0) {
            if (!parse_number(argc, argv, i, n)) return 1;
            config.stack_size = n << 10;
        } else if (strcmp(argv[i], "--trace") == 0) {
            rvix::g_trace_syscalls = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: Unknown option: " << argv[i] << "\n";
            return 1;
        } else {
            entry_path = argv[i];
            break;
        }
        i++;
    }
    // Everything after the entry binary belongs to the guest
    while (i < argc) {
        guest_args.push_back(argv[i++]);
    }

    if (entry_path.empty()) {
        std::cerr << "Error: No entry binary specified\n";
        return 1;
    }

    try {
        rvix::Runtime runtime(config, rvix::make_riscv_guest);
        auto fs = std::make_shared<rvix::vfs::VirtualFS>();
        std::shared_ptr<const rvix::Module> module;
        rvix::Errno err;

        if (container_mode) {
            std::cout << "[rvix] Loading rootfs: " << rootfs_path << "\n";
            auto tar_data = load_file(rootfs_path);
            if (!fs->load_tar(tar_data.data(), tar_data.size())) {
                std::cerr << "Error: Failed to parse rootfs tar\n";
                return 1;
            }
            setup_virtual_files(*fs);
            std::cout << "[rvix] Entry point: " << entry_path << "\n";
            err = runtime.modules().load_from_vfs(*fs, entry_path, module);
        } else {
            // Standalone mode: binary from the host, minimal VFS for exec
            std::cout << "[rvix] Loading binary: " << entry_path << "\n";
            setup_virtual_files(*fs);
            err = runtime.modules().load(load_file(entry_path), entry_path, module);
        }
        if (err != rvix::Errno::Success) {
            std::cerr << "Error: Cannot load " << entry_path << ": " << rvix::errno_name(err) << "\n";
            return 1;
        }
        std::cout << "[rvix] Valid RV" << (module->width == rvix::AddressWidth::Bits32 ? 32 : 64)
                  << " ELF detected (" << module->binary.size() << " bytes)\n";

        rvix::ProcessIdentity identity;
        identity.process = runtime.processes().new_root();
        identity.thread = identity.process->new_thread();
        identity.fds = rvix::vfs::FdTable::with_stdio(
            std::make_shared<rvix::vfs::HostFdInode>(STDIN_FILENO),
            std::make_shared<rvix::vfs::TtyInode>(),
            std::make_shared<rvix::vfs::TtyInode>());

        auto env = rvix::ThreadEnv::create(runtime, identity, fs, module);
        env->attach(runtime.instantiate(module, guest_args));
        if (!runtime.spawn_guest(env, rvix::run_thread)) {
            std::cerr << "Error: Could not start the guest\n";
            return 1;
        }

        const rvix::ExitCode code = identity.process->status()->wait();
        std::cout << "\n[rvix] Program exited with code: " << code << "\n";
        runtime.shutdown();
        return code;
    } catch (const riscv::MachineException& e) {
        std::cerr << "\n[rvix] Machine exception: " << e.what();
        if (e.data() != 0) {
            std::cerr << " (data: 0x" << std::hex << e.data() << std::dec << ")";
        }
        std::cerr << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\n[rvix] Error: " << e.what() << "\n";
        return 1;
    }
}
