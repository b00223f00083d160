// fd.hpp - Per-process file descriptor tables and pollable inodes
#pragma once

#include "abi.hpp"
#include "errno.hpp"
#include "task.hpp"
#include "vfs.hpp"

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <utility>

namespace rvix::vfs {

enum class PollDirection { Read, Write };

// One readiness check of an inode in one direction
struct Readiness {
    bool ready = false;
    uint64_t nbytes = 0;
    bool hangup = false;
    Errno error = Errno::Success;
};

class Inode {
public:
    virtual ~Inode() = default;
    virtual FileType type() const = 0;
    // False for inodes a poll subscription cannot watch
    virtual bool pollable() const { return true; }
    // Registers `waker` for the next state change when not ready
    virtual Readiness poll(PollDirection dir, const Waker& waker) = 0;
};

// Regular file from the tree: always ready, reads report the size
class FileInode : public Inode {
public:
    explicit FileInode(std::shared_ptr<Entry> entry) : entry_(std::move(entry)) {}
    FileType type() const override { return FileType::Regular; }
    Readiness poll(PollDirection dir, const Waker& waker) override;

private:
    std::shared_ptr<Entry> entry_;
};

class DirectoryInode : public Inode {
public:
    explicit DirectoryInode(std::shared_ptr<Entry> entry) : entry_(std::move(entry)) {}
    FileType type() const override { return FileType::Directory; }
    bool pollable() const override { return false; }
    Readiness poll(PollDirection dir, const Waker& waker) override;

private:
    std::shared_ptr<Entry> entry_;
};

// Host terminal output: always writable, never readable
class TtyInode : public Inode {
public:
    FileType type() const override { return FileType::CharDev; }
    Readiness poll(PollDirection dir, const Waker& waker) override;
};

// Host descriptor (stdin, sockets) checked with a zero-timeout ::poll
class HostFdInode : public Inode {
public:
    explicit HostFdInode(int fd) : fd_(fd) {}
    FileType type() const override { return FileType::CharDev; }
    Readiness poll(PollDirection dir, const Waker& waker) override;

private:
    int fd_;
};

// Byte buffer shared by the two ends of a pipe
class PipeBuffer {
public:
    static constexpr size_t CAPACITY = 65536;

    // Bytes accepted, or Pipe once no reader is left
    std::pair<size_t, Errno> write(const uint8_t* data, size_t len);
    // 0 bytes with Success means end of file
    std::pair<size_t, Errno> read(uint8_t* data, size_t len);

    Readiness poll_read(const Waker& waker);
    Readiness poll_write(const Waker& waker);

    void open_end(PollDirection end);
    void close_end(PollDirection end);

    // Wakers registered by pending polls on either end
    size_t waiting() const;

private:
    mutable std::mutex mutex_;
    std::deque<uint8_t> data_;
    size_t readers_ = 0;
    size_t writers_ = 0;
    WakerList read_waiters_;
    WakerList write_waiters_;
};

class PipeEnd : public Inode {
public:
    PipeEnd(std::shared_ptr<PipeBuffer> buffer, PollDirection end);
    ~PipeEnd() override;
    FileType type() const override { return FileType::Fifo; }
    Readiness poll(PollDirection dir, const Waker& waker) override;
    PipeBuffer& buffer() { return *buffer_; }

private:
    std::shared_ptr<PipeBuffer> buffer_;
    PollDirection end_;
};

struct FdEntry {
    std::shared_ptr<Inode> inode;
    uint64_t rights = 0;
    uint64_t rights_inheriting = 0;
    uint16_t flags = 0;
};

class FdTable {
public:
    static constexpr uint32_t STDIN = 0;
    static constexpr uint32_t STDOUT = 1;
    static constexpr uint32_t STDERR = 2;

    static std::shared_ptr<FdTable> with_stdio(std::shared_ptr<Inode> in,
                                               std::shared_ptr<Inode> out,
                                               std::shared_ptr<Inode> err);

    std::optional<FdEntry> get_fd(uint32_t fd) const;
    uint32_t insert(FdEntry entry);
    void insert_at(uint32_t fd, FdEntry entry);
    bool close(uint32_t fd);
    void close_all();
    // Read end first
    std::pair<uint32_t, uint32_t> pipe();

    std::set<uint32_t> open_fds() const;
    size_t size() const;

    // Independent table sharing the open inodes (for a forked child)
    std::shared_ptr<FdTable> fork() const;

private:
    mutable std::mutex mutex_;
    std::map<uint32_t, FdEntry> fds_;
    uint32_t next_fd_ = 3;  // 0, 1, 2 reserved for stdin/out/err
};

inline bool is_stdio(uint32_t fd) {
    return fd <= FdTable::STDERR;
}

// Watches one fd subscription of a poll_oneoff call
class PollGuard {
public:
    // nullopt when the fd's inode cannot be polled
    static std::optional<PollGuard> create(uint32_t fd, const FdEntry& entry,
                                           Eventtype type, uint64_t userdata);

    // The triggered event, or nullopt after registering `waker`
    std::optional<TriggeredEvent> poll(const Waker& waker);

    uint32_t fd() const { return fd_; }
    uint64_t userdata() const { return userdata_; }

private:
    PollGuard(uint32_t fd, std::shared_ptr<Inode> inode, Eventtype type, uint64_t userdata)
        : fd_(fd), inode_(std::move(inode)), type_(type), userdata_(userdata) {}

    uint32_t fd_;
    std::shared_ptr<Inode> inode_;
    Eventtype type_;
    uint64_t userdata_;
};

}  // namespace rvix::vfs
