#include "process.hpp"
#include "trace.hpp"

#include <algorithm>

namespace rvix {

// ============================================================================
// WasiThread
// ============================================================================

WasiThread::WasiThread(uint32_t tid, std::weak_ptr<WasiProcess> process)
    : tid_(tid), process_(std::move(process)) {}

void WasiThread::signal(Signal sig) {
    Waker waker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (exit_code_) return;
        pending_.push_back(sig);
        waker = sleep_waker_;
    }
    RVIX_TRACE("signal", "tid=%u queued signal %u", tid_, (unsigned)sig);
    waker.wake();
}

bool WasiThread::has_fatal_signal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(pending_.begin(), pending_.end(), signal_is_fatal);
}

Signal WasiThread::take_fatal_signal() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!pending_.empty()) {
        Signal sig = pending_.front();
        pending_.pop_front();
        if (signal_is_fatal(sig)) return sig;
    }
    return Signal::None;
}

void WasiThread::set_sleep_waker(Waker waker) {
    std::lock_guard<std::mutex> lock(mutex_);
    sleep_waker_ = std::move(waker);
}

void WasiThread::clear_sleep_waker() {
    std::lock_guard<std::mutex> lock(mutex_);
    sleep_waker_ = Waker();
}

void WasiThread::set_finished(ExitCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exit_code_) exit_code_ = code;
    pending_.clear();
}

std::optional<ExitCode> WasiThread::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

// ============================================================================
// WasiProcess
// ============================================================================

WasiProcess::WasiProcess(ProcessControl& control, uint32_t pid, uint32_t ppid)
    : control_(control), pid_(pid), ppid_(ppid), status_(std::make_shared<TaskStatus>()) {}

std::shared_ptr<WasiThread> WasiProcess::new_thread() {
    auto thread = std::make_shared<WasiThread>(control_.next_tid(), weak_from_this());
    std::lock_guard<std::mutex> lock(mutex_);
    threads_.push_back(thread);
    return thread;
}

std::shared_ptr<WasiThread> WasiProcess::main_thread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_.empty() ? nullptr : threads_.front();
}

std::vector<std::shared_ptr<WasiThread>> WasiProcess::threads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return threads_;
}

void WasiProcess::add_child(std::shared_ptr<WasiProcess> child) {
    std::lock_guard<std::mutex> lock(mutex_);
    children_.push_back(std::move(child));
}

std::shared_ptr<WasiProcess> WasiProcess::find_child(uint32_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : children_) {
        if (c->pid() == pid) return c;
    }
    return nullptr;
}

std::vector<std::shared_ptr<WasiProcess>> WasiProcess::children() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return children_;
}

bool WasiProcess::reap_child(uint32_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(children_.begin(), children_.end(),
                           [pid](const auto& c) { return c->pid() == pid; });
    if (it == children_.end()) return false;
    children_.erase(it);
    return true;
}

void WasiProcess::signal(Signal sig) {
    for (const auto& t : threads()) {
        t->signal(sig);
    }
}

void WasiProcess::terminate(ExitCode code) {
    for (const auto& t : threads()) {
        t->set_finished(code);
    }
    if (!status_->is_finished()) {
        RVIX_TRACE("proc", "pid=%u exited with code %d", pid_, code);
    }
    status_->set_finished(code);
}

// ============================================================================
// ProcessControl
// ============================================================================

ProcessControl::ProcessControl(size_t max_processes)
    : max_processes_(max_processes) {}

std::shared_ptr<WasiProcess> ProcessControl::make_process(uint32_t ppid) {
    prune();
    if (processes_.size() >= max_processes_) {
        return nullptr;
    }
    uint32_t pid = next_pid_++;
    auto process = std::make_shared<WasiProcess>(*this, pid, ppid);
    processes_[pid] = process;
    return process;
}

std::shared_ptr<WasiProcess> ProcessControl::new_root() {
    std::lock_guard<std::mutex> lock(mutex_);
    return make_process(0);
}

std::shared_ptr<WasiProcess> ProcessControl::fork(const std::shared_ptr<WasiProcess>& parent) {
    std::shared_ptr<WasiProcess> child;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        child = make_process(parent->pid());
    }
    if (!child) {
        RVIX_WARN("proc", "fork of pid=%u refused: %zu processes alive",
                  parent->pid(), max_processes_);
        return nullptr;
    }
    parent->add_child(child);
    return child;
}

void ProcessControl::abandon(const std::shared_ptr<WasiProcess>& child) {
    if (auto parent = lookup(child->ppid())) {
        parent->reap_child(child->pid());
    }
    child->terminate(exit_code_from(Errno::Again));
    std::lock_guard<std::mutex> lock(mutex_);
    processes_.erase(child->pid());
}

std::shared_ptr<WasiProcess> ProcessControl::lookup(uint32_t pid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(pid);
    return it == processes_.end() ? nullptr : it->second.lock();
}

uint32_t ProcessControl::next_tid() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_tid_++;
}

size_t ProcessControl::live_processes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& [pid, weak] : processes_) {
        if (!weak.expired()) n++;
    }
    return n;
}

void ProcessControl::prune() {
    for (auto it = processes_.begin(); it != processes_.end();) {
        if (it->second.expired()) {
            it = processes_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace rvix
