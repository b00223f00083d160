#include "poll.hpp"
#include "trace.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <utility>

namespace rvix {

namespace {

using Clock = std::chrono::steady_clock;

struct ClockWait {
    uint64_t userdata;
    Clock::time_point deadline;
};

uint64_t clock_now_ns(Clockid id) {
    using namespace std::chrono;
    if (id == Clockid::Realtime) {
        return duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count();
    }
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

Errno write_events(GuestExecution& guest, uint64_t events_ptr, uint64_t nevents_ptr,
                   const std::vector<TriggeredEvent>& events) {
    try {
        uint8_t raw[EVENT_SIZE];
        for (size_t i = 0; i < events.size(); i++) {
            encode_event(events[i], raw);
            guest.write(events_ptr + i * EVENT_SIZE, raw, EVENT_SIZE);
        }
        guest.write_address(nevents_ptr, events.size());
    } catch (const GuestFault& e) {
        RVIX_WARN("poll", "event write fault at 0x%lx", (long)e.addr());
        return Errno::Memviolation;
    }
    return Errno::Success;
}

}  // namespace

std::optional<PollSubscription> PollSubscription::decode(const uint8_t* raw) {
    PollSubscription sub;
    sub.userdata = load_le<uint64_t>(raw + 0);
    switch (raw[8]) {
        case 0:
            sub.type = Eventtype::Clock;
            sub.clock_id = static_cast<Clockid>(load_le<uint32_t>(raw + 16));
            sub.timeout = load_le<uint64_t>(raw + 24);
            sub.precision = load_le<uint64_t>(raw + 32);
            sub.flags = load_le<uint16_t>(raw + 40);
            break;
        case 1:
        case 2:
            sub.type = static_cast<Eventtype>(raw[8]);
            sub.fd = load_le<uint32_t>(raw + 16);
            break;
        default:
            return std::nullopt;
    }
    return sub;
}

std::optional<std::vector<TriggeredEvent>> PollBatch::poll(const Waker& waker) {
    std::vector<TriggeredEvent> ready;
    for (auto& guard : guards_) {
        if (auto ev = guard.poll(waker)) ready.push_back(*ev);
    }
    if (ready.empty()) return std::nullopt;
    return ready;
}

Errno poll_oneoff(ThreadEnv& env, uint64_t subs_ptr, uint64_t events_ptr,
                  uint32_t nsubscriptions, uint64_t nevents_ptr) {
    if (process_signals_and_exit(env)) return Errno::Success;
    if (auto ret = handle_rewind(env)) return *ret;

    if (nsubscriptions == 0) {
        return Errno::Inval;
    }
    if (nsubscriptions > env.config().max_subscriptions) {
        RVIX_WARN("poll", "pid=%u polls %u subscriptions (limit %u)", env.process().pid(),
                  nsubscriptions, env.config().max_subscriptions);
        env.set_on_called(Trap{exit_code_from(Errno::Overflow)});
        return Errno::Overflow;
    }

    const uint64_t seed = env.next_poll_seed();
    GuestExecution& guest = env.guest();
    Bytes raw(static_cast<size_t>(nsubscriptions) * SUBSCRIPTION_SIZE);
    try {
        guest.write_address(nevents_ptr, 0);
        guest.read(subs_ptr, raw.data(), raw.size());
    } catch (const GuestFault&) {
        return Errno::Memviolation;
    }

    // Rotated so every subscription reaches the guard batch in turn
    std::vector<PollSubscription> subs;
    subs.reserve(nsubscriptions);
    for (uint32_t n = 0; n < nsubscriptions; n++) {
        const size_t i = (n + seed) % nsubscriptions;
        auto sub = PollSubscription::decode(raw.data() + i * SUBSCRIPTION_SIZE);
        if (!sub) return Errno::Inval;
        subs.push_back(*sub);
    }

    const auto fds = env.identity().fds;
    const auto start = Clock::now();
    std::vector<ClockWait> clocks;
    std::set<std::pair<uint32_t, uint64_t>> seen_clocks;
    std::vector<const PollSubscription*> fd_subs;
    std::optional<std::chrono::nanoseconds> wait;

    for (const auto& sub : subs) {
        if (sub.type != Eventtype::Clock) {
            if (!vfs::is_stdio(sub.fd)) {
                auto entry = fds->get_fd(sub.fd);
                if (!entry) return Errno::Badf;
                if (!(entry->rights & rights::POLL_FD_READWRITE)) return Errno::Access;
            }
            fd_subs.push_back(&sub);
            continue;
        }

        if (sub.clock_id != Clockid::Realtime && sub.clock_id != Clockid::Monotonic) {
            RVIX_WARN("poll", "unsupported clock %u", static_cast<unsigned>(sub.clock_id));
            return Errno::Inval;
        }
        if (!seen_clocks.emplace(static_cast<uint32_t>(sub.clock_id), sub.userdata).second) {
            continue;
        }
        if (sub.timeout == 0) {
            continue;  // no timeout
        }
        std::chrono::nanoseconds ns{0};
        if (sub.timeout != 1) {
            uint64_t rel = sub.timeout;
            if (sub.flags & SUBCLOCKFLAGS_ABSTIME) {
                const uint64_t now = clock_now_ns(sub.clock_id);
                rel = sub.timeout > now ? sub.timeout - now : 1;
            }
            auto bounded = bounded_timeout(rel);
            if (!bounded) continue;
            ns = *bounded;
            clocks.push_back(ClockWait{sub.userdata, start + ns});
        }
        wait = wait ? std::min(*wait, ns) : ns;
    }

    std::vector<vfs::PollGuard> guards;
    for (const PollSubscription* sub : fd_subs) {
        if (guards.size() >= env.config().poll_batch_limit) break;
        auto entry = fds->get_fd(sub->fd);
        if (!entry) return Errno::Badf;
        auto guard = vfs::PollGuard::create(sub->fd, *entry, sub->type, sub->userdata);
        if (!guard) return Errno::Badf;
        guards.push_back(std::move(*guard));
    }

    RVIX_TRACE("poll", "pid=%u nsubs=%u guards=%zu clocks=%zu wait=%s", env.process().pid(),
               nsubscriptions, guards.size(), clocks.size(),
               !wait ? "infinite" : (wait->count() == 0 ? "nonblocking" : "timed"));

    OnResult<std::vector<TriggeredEvent>> on_result =
        [events_ptr, nevents_ptr, clocks](GuestExecution& g, WaitResult<std::vector<TriggeredEvent>> r) {
            std::vector<TriggeredEvent> events;
            switch (r.status) {
                case Errno::Success:
                    if (r.value) events = std::move(*r.value);
                    break;
                case Errno::Timedout: {
                    const auto now = Clock::now();
                    for (const auto& c : clocks) {
                        if (c.deadline > now) continue;
                        TriggeredEvent ev;
                        ev.userdata = c.userdata;
                        ev.type = Eventtype::Clock;
                        events.push_back(ev);
                    }
                    if (clocks.empty()) RVIX_WARN("poll", "timed out without clock subscriptions");
                    break;
                }
                case Errno::Again:
                    break;
                default:
                    RVIX_WARN("poll", "failed to poll during deep sleep: %s", errno_name(r.status));
                    return r.status;
            }
            return write_events(g, events_ptr, nevents_ptr, events);
        };

    return deep_sleep<std::vector<TriggeredEvent>>(
        env, wait, env.config().poll_interval, std::make_unique<PollBatch>(std::move(guards)),
        std::move(on_result), PollResume{nsubscriptions});
}

}  // namespace rvix
