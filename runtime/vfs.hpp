// vfs.hpp - In-memory filesystem tree shared by all guest processes
//
// Loaded from a tar archive (the container rootfs). Guests never mutate
// the tree through the process layer; exec reads binaries from it.
#pragma once

#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rvix::vfs {

// File types (matching Linux stat mode)
enum class FileType : uint16_t {
    Regular    = 0100000,
    Directory  = 0040000,
    Symlink    = 0120000,
    CharDev    = 0020000,
    BlockDev   = 0060000,
    Fifo       = 0010000,
    Socket     = 0140000,
};

struct Entry {
    std::string name;
    FileType type = FileType::Regular;
    uint32_t mode = 0644;
    uint64_t size = 0;
    uint64_t mtime = 0;
    std::string link_target;
    std::vector<uint8_t> content;
    std::unordered_map<std::string, std::shared_ptr<Entry>> children;

    bool is_dir() const { return type == FileType::Directory; }
    bool is_file() const { return type == FileType::Regular; }
    bool is_symlink() const { return type == FileType::Symlink; }
};

class VirtualFS {
public:
    static constexpr int MAX_SYMLINK_DEPTH = 16;

    VirtualFS() {
        root_ = std::make_shared<Entry>();
        root_->type = FileType::Directory;
        root_->mode = 0755;
    }

    // Loads a ustar/GNU archive. Returns false on a truncated archive;
    // entries before the damage stay loaded.
    bool load_tar(const uint8_t* data, size_t size) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t offset = 0;
        std::string long_name;

        while (offset + BLOCK <= size) {
            const uint8_t* hdr = data + offset;
            if (is_zero_block(hdr)) return true;
            offset += BLOCK;

            const char type_flag = static_cast<char>(hdr[156]);
            const uint64_t file_size = parse_octal(hdr + 124, 12);
            const uint64_t padded = (file_size + BLOCK - 1) / BLOCK * BLOCK;
            if (offset + file_size > size) return false;

            if (type_flag == 'L') {
                // GNU long name: payload is the name of the next member
                long_name.assign(reinterpret_cast<const char*>(data + offset), file_size);
                long_name = long_name.c_str();
                offset += padded;
                continue;
            }

            std::string name = long_name.empty() ? member_name(hdr) : long_name;
            long_name.clear();
            if (name.starts_with("./")) name.erase(0, 2);

            auto entry = std::make_shared<Entry>();
            entry->type = file_type(type_flag);
            entry->mode = static_cast<uint32_t>(parse_octal(hdr + 100, 8));
            entry->size = file_size;
            entry->mtime = parse_octal(hdr + 136, 12);
            entry->link_target = field(hdr + 157, 100);
            if (entry->is_file() && file_size > 0) {
                entry->content.assign(data + offset, data + offset + file_size);
            }
            offset += padded;

            if (!name.empty() && name != ".") insert_entry("/" + name, entry);
        }
        return true;
    }

    // Resolves `path`, following symlinks (including the final one)
    std::shared_ptr<Entry> resolve(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return resolve_locked(path, MAX_SYMLINK_DEPTH);
    }

    bool exists(const std::string& path) const {
        return resolve(path) != nullptr;
    }

    // Contents of a regular file, nullopt if missing or not a file
    std::optional<std::vector<uint8_t>> read_file(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto entry = resolve_locked(path, MAX_SYMLINK_DEPTH);
        if (!entry || !entry->is_file()) return std::nullopt;
        return entry->content;
    }

    // Adds a file at runtime (for /proc, /dev emulation)
    void add_virtual_file(const std::string& path, const std::vector<uint8_t>& content) {
        auto entry = std::make_shared<Entry>();
        entry->mode = 0444;
        entry->content = content;
        entry->size = content.size();
        std::lock_guard<std::mutex> lock(mutex_);
        insert_entry(path, entry);
    }

    void add_virtual_file(const std::string& path, const std::string& content) {
        add_virtual_file(path, std::vector<uint8_t>(content.begin(), content.end()));
    }

    void add_symlink(const std::string& path, const std::string& target) {
        auto entry = std::make_shared<Entry>();
        entry->type = FileType::Symlink;
        entry->mode = 0777;
        entry->link_target = target;
        std::lock_guard<std::mutex> lock(mutex_);
        insert_entry(path, entry);
    }

private:
    static constexpr size_t BLOCK = 512;

    mutable std::mutex mutex_;
    std::shared_ptr<Entry> root_;

    static bool is_zero_block(const uint8_t* p) {
        for (size_t i = 0; i < BLOCK; i++) {
            if (p[i] != 0) return false;
        }
        return true;
    }

    static uint64_t parse_octal(const uint8_t* p, size_t len) {
        uint64_t val = 0;
        size_t i = 0;
        while (i < len && p[i] == ' ') i++;
        for (; i < len && p[i] >= '0' && p[i] <= '7'; i++) {
            val = val * 8 + (p[i] - '0');
        }
        return val;
    }

    static std::string field(const uint8_t* p, size_t len) {
        size_t n = 0;
        while (n < len && p[n] != 0) n++;
        return std::string(reinterpret_cast<const char*>(p), n);
    }

    static std::string member_name(const uint8_t* hdr) {
        std::string name = field(hdr, 100);
        if (std::memcmp(hdr + 257, "ustar", 5) == 0) {
            std::string prefix = field(hdr + 345, 155);
            if (!prefix.empty()) name = prefix + "/" + name;
        }
        return name;
    }

    static FileType file_type(char flag) {
        switch (flag) {
            case '2': return FileType::Symlink;
            case '3': return FileType::CharDev;
            case '4': return FileType::BlockDev;
            case '5': return FileType::Directory;
            case '6': return FileType::Fifo;
            default:  return FileType::Regular;  // '0', '\0', hard links
        }
    }

    static std::vector<std::string> split(std::string_view path) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start < path.size()) {
            size_t end = path.find('/', start);
            if (end == std::string_view::npos) end = path.size();
            if (end > start) parts.emplace_back(path.substr(start, end - start));
            start = end + 1;
        }
        return parts;
    }

    std::shared_ptr<Entry> resolve_locked(const std::string& path, int depth) const {
        std::vector<std::string> parts = split(path);
        std::vector<std::shared_ptr<Entry>> stack{root_};

        for (size_t i = 0; i < parts.size(); i++) {
            const auto& part = parts[i];
            if (part == ".") continue;
            if (part == "..") {
                if (stack.size() > 1) stack.pop_back();
                continue;
            }
            const auto& dir = stack.back();
            if (!dir->is_dir()) return nullptr;
            auto it = dir->children.find(part);
            if (it == dir->children.end()) return nullptr;

            if (it->second->is_symlink()) {
                if (depth <= 0) return nullptr;
                // Re-resolve target + the rest of the path
                std::string target = it->second->link_target;
                if (!target.starts_with("/")) {
                    std::string base;
                    for (size_t j = 1; j < stack.size(); j++) base += "/" + stack[j]->name;
                    target = base + "/" + target;
                }
                for (size_t j = i + 1; j < parts.size(); j++) target += "/" + parts[j];
                return resolve_locked(target, depth - 1);
            }
            stack.push_back(it->second);
        }
        return stack.back();
    }

    void insert_entry(const std::string& path, std::shared_ptr<Entry> entry) {
        std::vector<std::string> parts = split(path);
        if (parts.empty()) return;

        auto dir = root_;
        for (size_t i = 0; i + 1 < parts.size(); i++) {
            auto& slot = dir->children[parts[i]];
            if (!slot) {
                slot = std::make_shared<Entry>();
                slot->name = parts[i];
                slot->type = FileType::Directory;
                slot->mode = 0755;
            }
            dir = slot;
        }
        entry->name = parts.back();
        auto& slot = dir->children[entry->name];
        if (slot && slot->is_dir() && entry->is_dir()) {
            // Directory listed after its contents: keep the children
            slot->mode = entry->mode;
            slot->mtime = entry->mtime;
            return;
        }
        slot = std::move(entry);
    }
};

}  // namespace rvix::vfs
