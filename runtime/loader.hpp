// loader.hpp - Guest binaries and the content-addressed module cache
#pragma once

#include "errno.hpp"
#include "guest.hpp"
#include "vfs.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace rvix {

struct Module {
    uint64_t hash = 0;
    std::string name;
    std::vector<uint8_t> binary;
    AddressWidth width = AddressWidth::Bits64;
};

// RISC-V ELF check. Returns Success and the width, or Noexec.
Errno inspect_elf(const std::vector<uint8_t>& binary, AddressWidth& width);

uint64_t content_hash(const uint8_t* data, size_t size);

class ModuleCache {
public:
    // Returns the cached module for these bytes or adds one. Binaries
    // that are not RISC-V ELF files are rejected with Noexec.
    Errno load(std::vector<uint8_t> binary, const std::string& name,
               std::shared_ptr<const Module>& out);

    // Reads `path` from the filesystem and loads it.
    //   missing or not a regular file -> Noent
    Errno load_from_vfs(const vfs::VirtualFS& fs, const std::string& path,
                        std::shared_ptr<const Module>& out);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<const Module>> modules_;
};

}  // namespace rvix
