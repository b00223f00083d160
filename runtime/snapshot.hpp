// snapshot.hpp - Serialized host-side execution state
//
// Captured together with the guest stack when a syscall unwinds, and
// restored before the stack is written back. Everything outside this
// codec treats the serialized form as an opaque blob.
//
// Binary format:
//   Header:  magic "RVIXSNAP" (8B) + version (4B) + flags (4B)
//   Globals: count (4B) + values (8B each)
//   Aux:     count (4B) + [key_len (2B), key, value (8B)]...
#pragma once

#include "errno.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace rvix {

using Bytes = std::vector<uint8_t>;
using SnapshotBlob = std::shared_ptr<const Bytes>;

struct StoreSnapshot {
    // Execution globals in a fixed order chosen by the guest adapter
    std::vector<uint64_t> globals;
    // Named auxiliary store values (allocator frontiers and the like)
    std::map<std::string, uint64_t> aux;

    Bytes serialize() const;

    // Decodes `data` into `out`. Returns Unknown on a malformed blob.
    static Errno deserialize(const uint8_t* data, size_t size, StoreSnapshot& out);

    bool operator==(const StoreSnapshot& other) const {
        return globals == other.globals && aux == other.aux;
    }
};

inline SnapshotBlob make_blob(const StoreSnapshot& snapshot) {
    return std::make_shared<const Bytes>(snapshot.serialize());
}

}  // namespace rvix
