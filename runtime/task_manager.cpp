#include "task_manager.hpp"
#include "process.hpp"
#include "trace.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <exception>

namespace rvix {

namespace {

using Clock = std::chrono::steady_clock;

// Drives one deep sleep on the reactor. All state is touched on the
// strand only; the waker may fire from any thread.
class Poller : public std::enable_shared_from_this<Poller> {
public:
    Poller(boost::asio::io_context& reactor, TaskManager& tasks,
           std::atomic<size_t>& sleeping, std::shared_ptr<WasiThread> thread,
           DeepSleepWork work, TaskManager::Respawn respawn)
        : strand_(boost::asio::make_strand(reactor)),
          timer_(strand_),
          tasks_(tasks),
          sleeping_(sleeping),
          thread_(std::move(thread)),
          work_(std::move(work)),
          respawn_(std::move(respawn)) {
        interval_ = std::chrono::duration_cast<Clock::duration>(work_.poll_interval);
        if (interval_ <= Clock::duration::zero()) {
            interval_ = std::chrono::milliseconds(50);
        }
        if (work_.timeout) {
            deadline_ = Clock::now() + std::chrono::duration_cast<Clock::duration>(*work_.timeout);
        }
    }

    ~Poller() {
        sleeping_.fetch_sub(1);
    }

    void start() {
        sleeping_.fetch_add(1);
        // Wakers outlive the reactor in pipe and status waiter lists, so
        // they hold the poller weakly and never the strand itself. They
        // retire with `alive_` once the sleep resolved.
        std::weak_ptr<Poller> weak = weak_from_this();
        waker_ = Waker([weak] {
            if (auto self = weak.lock()) {
                boost::asio::post(self->strand_, [weak] {
                    if (auto s = weak.lock()) s->tick();
                });
            }
        }, std::weak_ptr<const void>(alive_));
        thread_->set_sleep_waker(waker_);
        boost::asio::post(strand_, [self = shared_from_this()] { self->tick(); });
    }

private:
    void tick() {
        if (done_) return;

        if (thread_->has_fatal_signal()) {
            Signal sig = thread_->take_fatal_signal();
            RVIX_TRACE("deep_sleep", "tid=%u woken by signal %u", thread_->tid(), (unsigned)sig);
            complete({Errno::Intr, sig});
            return;
        }
        if (work_.trigger->poll(waker_)) {
            complete({Errno::Success, Signal::None});
            return;
        }
        const auto now = Clock::now();
        if (deadline_ && now >= *deadline_) {
            complete({Errno::Timedout, Signal::None});
            return;
        }

        auto next = now + interval_;
        if (deadline_) next = std::min(next, *deadline_);
        timer_.expires_at(next);
        timer_.async_wait(boost::asio::bind_executor(strand_,
            [self = shared_from_this()](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted) return;
                self->tick();
            }));
    }

    void complete(TriggerOutcome outcome) {
        done_ = true;
        alive_.reset();
        timer_.cancel();
        thread_->clear_sleep_waker();
        tasks_.run_resumed([self = shared_from_this(), outcome] {
            self->respawn_(std::move(self->work_), outcome);
        });
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    TaskManager& tasks_;
    std::atomic<size_t>& sleeping_;
    std::shared_ptr<WasiThread> thread_;
    DeepSleepWork work_;
    TaskManager::Respawn respawn_;
    Waker waker_;
    std::shared_ptr<const void> alive_ = std::make_shared<char>(0);
    Clock::duration interval_;
    std::optional<Clock::time_point> deadline_;
    bool done_ = false;
};

}  // namespace

TaskManager::TaskManager(size_t worker_threads, size_t max_tasks)
    : max_tasks_(max_tasks),
      reactor_work_(boost::asio::make_work_guard(reactor_)),
      pool_(std::max<size_t>(worker_threads, 1)) {
    reactor_thread_ = std::thread([this] { reactor_.run(); });
}

TaskManager::~TaskManager() {
    shutdown();
    pool_.join();
    if (reactor_thread_.joinable()) reactor_thread_.join();
}

bool TaskManager::spawn(Task task) {
    if (stopping_.load()) {
        RVIX_WARN("tasks", "spawn rejected: shutting down");
        return false;
    }
    if (active_.fetch_add(1) >= max_tasks_) {
        active_.fetch_sub(1);
        RVIX_WARN("tasks", "spawn rejected: %zu tasks active", max_tasks_);
        return false;
    }
    run_counted(std::move(task));
    return true;
}

void TaskManager::run_resumed(Task task) {
    active_.fetch_add(1);
    run_counted(std::move(task));
}

void TaskManager::run_counted(Task task) {
    boost::asio::post(pool_, [this, task = std::move(task)] {
        try {
            task();
        } catch (const std::exception& e) {
            RVIX_WARN("tasks", "task failed: %s", e.what());
        }
        active_.fetch_sub(1);
    });
}

void TaskManager::resume_after_poller(std::shared_ptr<WasiThread> thread, DeepSleepWork work,
                                      Respawn respawn) {
    auto poller = std::make_shared<Poller>(reactor_, *this, sleeping_, std::move(thread),
                                           std::move(work), std::move(respawn));
    poller->start();
}

void TaskManager::shutdown() {
    if (stopping_.exchange(true)) return;
    reactor_work_.reset();
    reactor_.stop();
    pool_.stop();
}

}  // namespace rvix
