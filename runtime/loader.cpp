#include "loader.hpp"
#include "trace.hpp"

namespace rvix {

Errno inspect_elf(const std::vector<uint8_t>& binary, AddressWidth& width) {
    if (binary.size() < 64 ||
        binary[0] != 0x7f || binary[1] != 'E' || binary[2] != 'L' || binary[3] != 'F') {
        return Errno::Noexec;
    }
    // e_machine at offset 18-19, 0xF3 for RISC-V
    uint16_t e_machine = binary[18] | (binary[19] << 8);
    if (e_machine != 0xF3) {
        return Errno::Noexec;
    }
    switch (binary[4]) {
        case 1: width = AddressWidth::Bits32; return Errno::Success;
        case 2: width = AddressWidth::Bits64; return Errno::Success;
        default: return Errno::Noexec;
    }
}

// FNV-1a
uint64_t content_hash(const uint8_t* data, size_t size) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (size_t i = 0; i < size; i++) {
        h ^= data[i];
        h *= 0x100000001b3ULL;
    }
    return h;
}

Errno ModuleCache::load(std::vector<uint8_t> binary, const std::string& name,
                        std::shared_ptr<const Module>& out) {
    const uint64_t hash = content_hash(binary.data(), binary.size());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = modules_.find(hash);
        if (it != modules_.end() && it->second->binary == binary) {
            RVIX_TRACE("exec", "module cache hit for %s (%016lx)", name.c_str(), (unsigned long)hash);
            out = it->second;
            return Errno::Success;
        }
    }

    AddressWidth width;
    Errno err = inspect_elf(binary, width);
    if (err != Errno::Success) {
        RVIX_WARN("exec", "%s is not a RISC-V ELF", name.c_str());
        return err;
    }

    auto module = std::make_shared<Module>();
    module->hash = hash;
    module->name = name;
    module->binary = std::move(binary);
    module->width = width;

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = modules_[hash];
    slot = module;
    out = slot;
    RVIX_TRACE("exec", "compiled module %s (%zu bytes, RV%d)", name.c_str(),
               module->binary.size(), width == AddressWidth::Bits32 ? 32 : 64);
    return Errno::Success;
}

Errno ModuleCache::load_from_vfs(const vfs::VirtualFS& fs, const std::string& path,
                                 std::shared_ptr<const Module>& out) {
    auto content = fs.read_file(path);
    if (!content) {
        return Errno::Noent;
    }
    return load(std::move(*content), path, out);
}

size_t ModuleCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modules_.size();
}

}  // namespace rvix
