#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wshadow"
#include <boost/heap/fibonacci_heap.hpp>
#pragma GCC diagnostic pop
#include <boost/unordered_map.hpp>

#include "index_table.hpp"
#include "util/bounded_queue.hpp"

namespace wgpeer {

enum class TimerKind : uint8_t {
    Rekey,
    KeepAlive,
    HandshakeRetry,
};

struct RekeyEvent {
    PeerId peer;
};

struct KeepAliveEvent {
    PeerId peer;
};

struct HandshakeRetryEvent {
    PeerId peer;
};

using TimerEvent = std::variant<RekeyEvent, KeepAliveEvent, HandshakeRetryEvent>;

static inline PeerId timer_event_peer(const TimerEvent &ev) {
    return std::visit([](const auto &e) { return e.peer; }, ev);
}

namespace timer_impl {

struct PeerTimer {
    struct Compare {
        constexpr bool operator()(const PeerTimer &lhs, const PeerTimer &rhs) const {
            return lhs.nexttime > rhs.nexttime;
        }
    };
    using PeerTimerQueue = boost::heap::fibonacci_heap<PeerTimer, boost::heap::compare<PeerTimer::Compare>>;

    PeerId peer;
    TimerKind kind;
    mutable uint64_t nexttime;
    // 0 for single shot
    uint64_t interval;
};

} // namespace timer_impl

// Per-peer timers on CLOCK_MONOTONIC nanoseconds. At most one timer of each kind is pending per peer.
class TimerQueue {
    using PeerTimerQueue = timer_impl::PeerTimer::PeerTimerQueue;

public:
    TimerQueue() {
    }
    TimerQueue(const TimerQueue &) = delete;
    TimerQueue &operator=(const TimerQueue &) = delete;

    // Arms a timer, replacing any pending one of the same kind.
    void schedule(PeerId peer, TimerKind kind, uint64_t when, uint64_t interval = 0);
    void schedule_rekey(PeerId peer, uint64_t now);
    void schedule_keepalive(PeerId peer, uint64_t now, uint64_t interval);
    // RekeyTimeout plus random jitter
    void schedule_retry(PeerId peer, uint64_t now);

    bool cancel(PeerId peer, TimerKind kind);
    size_t cancel(PeerId peer);
    bool armed(PeerId peer, TimerKind kind) const;

    // Moves due timers into out while it has room. Recurring timers are rescheduled.
    size_t expire(uint64_t now, BoundedQueue<TimerEvent> &out);
    std::optional<uint64_t> next_deadline() const;
    size_t size() const {
        return _queue.size();
    }

private:
    static constexpr uint64_t timer_key(PeerId peer, TimerKind kind) {
        return (static_cast<uint64_t>(peer) << 8) | static_cast<uint64_t>(kind);
    }

    PeerTimerQueue _queue;
    boost::unordered_map<uint64_t, PeerTimerQueue::handle_type> _handles;
};

} // namespace wgpeer
