#include "fd.hpp"
#include "trace.hpp"

#include <algorithm>

#include <poll.h>
#include <sys/ioctl.h>

namespace rvix::vfs {

// ============================================================================
// Inodes
// ============================================================================

Readiness FileInode::poll(PollDirection dir, const Waker&) {
    Readiness r;
    r.ready = true;
    if (dir == PollDirection::Read) r.nbytes = entry_->content.size();
    return r;
}

Readiness DirectoryInode::poll(PollDirection, const Waker&) {
    Readiness r;
    r.ready = true;
    r.error = Errno::Badf;
    return r;
}

Readiness TtyInode::poll(PollDirection dir, const Waker&) {
    Readiness r;
    r.ready = (dir == PollDirection::Write);
    return r;
}

Readiness HostFdInode::poll(PollDirection dir, const Waker&) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = (dir == PollDirection::Read) ? POLLIN : POLLOUT;
    pfd.revents = 0;

    Readiness r;
    int n = ::poll(&pfd, 1, 0);
    if (n < 0) {
        r.ready = true;
        r.error = Errno::Io;
        return r;
    }
    if (pfd.revents & (POLLERR | POLLNVAL)) {
        r.ready = true;
        r.error = (pfd.revents & POLLNVAL) ? Errno::Badf : Errno::Io;
        return r;
    }
    if (pfd.revents & POLLHUP) {
        r.ready = true;
        r.hangup = true;
    }
    if (pfd.revents & pfd.events) {
        r.ready = true;
        if (dir == PollDirection::Read) {
            int avail = 0;
            if (::ioctl(fd_, FIONREAD, &avail) == 0 && avail > 0) {
                r.nbytes = static_cast<uint64_t>(avail);
            }
        }
    }
    // No host wakeups: the deep sleep re-polls every interval
    return r;
}

// ============================================================================
// Pipes
// ============================================================================

std::pair<size_t, Errno> PipeBuffer::write(const uint8_t* data, size_t len) {
    std::vector<Waker> wakers;
    size_t n = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (readers_ == 0) return {0, Errno::Pipe};
        n = std::min(len, CAPACITY - data_.size());
        if (n == 0) return {0, Errno::Again};
        data_.insert(data_.end(), data, data + n);
        wakers = read_waiters_.take();
    }
    wake_all(wakers);
    return {n, Errno::Success};
}

std::pair<size_t, Errno> PipeBuffer::read(uint8_t* data, size_t len) {
    std::vector<Waker> wakers;
    size_t n = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (data_.empty()) {
            return {0, writers_ == 0 ? Errno::Success : Errno::Again};
        }
        n = std::min(len, data_.size());
        std::copy_n(data_.begin(), n, data);
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(n));
        wakers = write_waiters_.take();
    }
    wake_all(wakers);
    return {n, Errno::Success};
}

Readiness PipeBuffer::poll_read(const Waker& waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    Readiness r;
    if (!data_.empty()) {
        r.ready = true;
        r.nbytes = data_.size();
    }
    if (writers_ == 0) {
        r.ready = true;
        r.hangup = true;
    }
    if (!r.ready) read_waiters_.add(waker);
    return r;
}

Readiness PipeBuffer::poll_write(const Waker& waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    Readiness r;
    if (readers_ == 0) {
        r.ready = true;
        r.hangup = true;
        r.error = Errno::Pipe;
        return r;
    }
    if (data_.size() < CAPACITY) {
        r.ready = true;
        r.nbytes = CAPACITY - data_.size();
    } else {
        write_waiters_.add(waker);
    }
    return r;
}

size_t PipeBuffer::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_waiters_.size() + write_waiters_.size();
}

void PipeBuffer::open_end(PollDirection end) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (end == PollDirection::Read) readers_++; else writers_++;
}

void PipeBuffer::close_end(PollDirection end) {
    std::vector<Waker> wakers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (end == PollDirection::Read) {
            if (readers_ > 0 && --readers_ == 0) wakers = write_waiters_.take();
        } else {
            if (writers_ > 0 && --writers_ == 0) wakers = read_waiters_.take();
        }
    }
    wake_all(wakers);
}

PipeEnd::PipeEnd(std::shared_ptr<PipeBuffer> buffer, PollDirection end)
    : buffer_(std::move(buffer)), end_(end) {
    buffer_->open_end(end_);
}

PipeEnd::~PipeEnd() {
    buffer_->close_end(end_);
}

Readiness PipeEnd::poll(PollDirection dir, const Waker& waker) {
    if (dir != end_) {
        Readiness r;
        r.ready = true;
        r.error = Errno::Badf;
        return r;
    }
    return dir == PollDirection::Read ? buffer_->poll_read(waker) : buffer_->poll_write(waker);
}

// ============================================================================
// FdTable
// ============================================================================

std::shared_ptr<FdTable> FdTable::with_stdio(std::shared_ptr<Inode> in,
                                             std::shared_ptr<Inode> out,
                                             std::shared_ptr<Inode> err) {
    auto table = std::make_shared<FdTable>();
    table->insert_at(STDIN, FdEntry{std::move(in), rights::STDIO, 0, 0});
    table->insert_at(STDOUT, FdEntry{std::move(out), rights::STDIO, 0, 0});
    table->insert_at(STDERR, FdEntry{std::move(err), rights::STDIO, 0, 0});
    return table;
}

std::optional<FdEntry> FdTable::get_fd(uint32_t fd) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fds_.find(fd);
    if (it == fds_.end()) return std::nullopt;
    return it->second;
}

uint32_t FdTable::insert(FdEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    while (fds_.count(next_fd_)) next_fd_++;
    uint32_t fd = next_fd_++;
    fds_[fd] = std::move(entry);
    return fd;
}

void FdTable::insert_at(uint32_t fd, FdEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    fds_[fd] = std::move(entry);
}

bool FdTable::close(uint32_t fd) {
    FdEntry dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fds_.find(fd);
        if (it == fds_.end()) return false;
        dropped = std::move(it->second);
        fds_.erase(it);
        if (fd < next_fd_ && fd > STDERR) next_fd_ = fd;
    }
    // `dropped` releases the inode outside the lock (pipe ends wake peers)
    return true;
}

void FdTable::close_all() {
    std::map<uint32_t, FdEntry> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(fds_);
        next_fd_ = 3;
    }
}

std::pair<uint32_t, uint32_t> FdTable::pipe() {
    auto buffer = std::make_shared<PipeBuffer>();
    auto reader = std::make_shared<PipeEnd>(buffer, PollDirection::Read);
    auto writer = std::make_shared<PipeEnd>(buffer, PollDirection::Write);
    const uint64_t base = rights::FD_FILESTAT_GET | rights::POLL_FD_READWRITE;
    uint32_t rfd = insert(FdEntry{reader, base | rights::FD_READ, 0, 0});
    uint32_t wfd = insert(FdEntry{writer, base | rights::FD_WRITE, 0, 0});
    return {rfd, wfd};
}

std::set<uint32_t> FdTable::open_fds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<uint32_t> out;
    for (const auto& [fd, _] : fds_) out.insert(fd);
    return out;
}

size_t FdTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fds_.size();
}

std::shared_ptr<FdTable> FdTable::fork() const {
    auto child = std::make_shared<FdTable>();
    std::lock_guard<std::mutex> lock(mutex_);
    child->fds_ = fds_;
    child->next_fd_ = next_fd_;
    return child;
}

// ============================================================================
// PollGuard
// ============================================================================

std::optional<PollGuard> PollGuard::create(uint32_t fd, const FdEntry& entry,
                                           Eventtype type, uint64_t userdata) {
    if (!entry.inode || !entry.inode->pollable()) {
        return std::nullopt;
    }
    return PollGuard(fd, entry.inode, type, userdata);
}

std::optional<TriggeredEvent> PollGuard::poll(const Waker& waker) {
    const auto dir = (type_ == Eventtype::FdRead) ? PollDirection::Read : PollDirection::Write;
    Readiness r = inode_->poll(dir, waker);
    if (!r.ready) return std::nullopt;

    TriggeredEvent ev;
    ev.userdata = userdata_;
    ev.type = type_;
    ev.error = r.error;
    ev.nbytes = r.nbytes;
    ev.flags = r.hangup ? EVENTRWFLAGS_HANGUP : 0;
    return ev;
}

}  // namespace rvix::vfs
