// poll.hpp - poll_oneoff: wait on fd readiness and clocks at once
#pragma once

#include "abi.hpp"
#include "deep_sleep.hpp"
#include "env.hpp"
#include "fd.hpp"

#include <optional>
#include <vector>

namespace rvix {

struct PollSubscription {
    uint64_t userdata = 0;
    Eventtype type = Eventtype::Clock;
    // Clock
    Clockid clock_id = Clockid::Realtime;
    uint64_t timeout = 0;
    uint64_t precision = 0;
    uint16_t flags = 0;
    // FdRead / FdWrite
    uint32_t fd = 0;

    // nullopt for an unknown event type
    static std::optional<PollSubscription> decode(const uint8_t* raw);
};

// Polls every guard of one poll_oneoff call; ready once any event is.
class PollBatch : public Awaitable<std::vector<TriggeredEvent>> {
public:
    explicit PollBatch(std::vector<vfs::PollGuard> guards) : guards_(std::move(guards)) {}

    std::optional<std::vector<TriggeredEvent>> poll(const Waker& waker) override;

    size_t size() const { return guards_.size(); }

private:
    std::vector<vfs::PollGuard> guards_;
};

// Reads `nsubscriptions` records at `subs_ptr`, waits for the first of
// them to trigger and writes the triggered events to `events_ptr` and
// their count to `nevents_ptr`.
Errno poll_oneoff(ThreadEnv& env, uint64_t subs_ptr, uint64_t events_ptr,
                  uint32_t nsubscriptions, uint64_t nevents_ptr);

}  // namespace rvix
