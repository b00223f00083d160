#include "snapshot.hpp"
#include "trace.hpp"

#include <cstring>
#include <stdexcept>

namespace rvix {

namespace {

constexpr char MAGIC[8] = {'R','V','I','X','S','N','A','P'};
constexpr uint32_t VERSION = 1;

void emit(Bytes& out, const void* data, size_t len) {
    auto* p = reinterpret_cast<const uint8_t*>(data);
    out.insert(out.end(), p, p + len);
}

template<typename T>
void emit_val(Bytes& out, T val) {
    emit(out, &val, sizeof(val));
}

struct Reader {
    const uint8_t* p;
    const uint8_t* end;

    template<typename T>
    T read() {
        if (remaining() < sizeof(T)) throw std::runtime_error("snapshot: unexpected EOF");
        T val;
        std::memcpy(&val, p, sizeof(T));
        p += sizeof(T);
        return val;
    }

    void read_into(void* dst, size_t len) {
        if (remaining() < len) throw std::runtime_error("snapshot: unexpected EOF");
        std::memcpy(dst, p, len);
        p += len;
    }

    size_t remaining() const { return static_cast<size_t>(end - p); }
};

void decode(Reader& r, StoreSnapshot& out) {
    char magic[8];
    r.read_into(magic, sizeof(magic));
    if (std::memcmp(magic, MAGIC, sizeof(MAGIC)) != 0) {
        throw std::runtime_error("snapshot: bad magic");
    }
    uint32_t version = r.read<uint32_t>();
    if (version != VERSION) {
        throw std::runtime_error("snapshot: unsupported version");
    }
    r.read<uint32_t>();  // flags

    uint32_t nglobals = r.read<uint32_t>();
    if (nglobals > r.remaining() / sizeof(uint64_t)) {
        throw std::runtime_error("snapshot: globals overrun");
    }
    out.globals.resize(nglobals);
    for (auto& g : out.globals) g = r.read<uint64_t>();

    uint32_t naux = r.read<uint32_t>();
    for (uint32_t i = 0; i < naux; i++) {
        uint16_t key_len = r.read<uint16_t>();
        std::string key(key_len, '\0');
        r.read_into(key.data(), key_len);
        out.aux[key] = r.read<uint64_t>();
    }
    if (r.remaining() != 0) {
        throw std::runtime_error("snapshot: trailing bytes");
    }
}

}  // namespace

Bytes StoreSnapshot::serialize() const {
    Bytes out;
    out.reserve(16 + 8 + globals.size() * 8 + aux.size() * 32);

    emit(out, MAGIC, sizeof(MAGIC));
    emit_val<uint32_t>(out, VERSION);
    emit_val<uint32_t>(out, 0);  // flags (reserved)

    emit_val<uint32_t>(out, static_cast<uint32_t>(globals.size()));
    for (uint64_t g : globals) emit_val(out, g);

    emit_val<uint32_t>(out, static_cast<uint32_t>(aux.size()));
    for (const auto& [key, value] : aux) {
        emit_val<uint16_t>(out, static_cast<uint16_t>(key.size()));
        emit(out, key.data(), key.size());
        emit_val(out, value);
    }
    return out;
}

Errno StoreSnapshot::deserialize(const uint8_t* data, size_t size, StoreSnapshot& out) {
    Reader r{data, data + size};
    StoreSnapshot decoded;
    try {
        decode(r, decoded);
    } catch (const std::runtime_error& e) {
        RVIX_WARN("snapshot", "decode failed: %s (%zu bytes)", e.what(), size);
        return Errno::Unknown;
    }
    out = std::move(decoded);
    return Errno::Success;
}

}  // namespace rvix
