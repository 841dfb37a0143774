#include <sodium.h>

#include "timer.hpp"
#include "proto.hpp"
#include "dbgprint.hpp"

using namespace wgpeer::proto;
using namespace wgpeer::timer_impl;

namespace wgpeer {

static TimerEvent make_event(const PeerTimer &timer) {
    switch (timer.kind) {
    case TimerKind::Rekey:
        return RekeyEvent{timer.peer};
    case TimerKind::KeepAlive:
        return KeepAliveEvent{timer.peer};
    case TimerKind::HandshakeRetry:
    default:
        return HandshakeRetryEvent{timer.peer};
    }
}

void TimerQueue::schedule(PeerId peer, TimerKind kind, uint64_t when, uint64_t interval) {
    cancel(peer, kind);
    auto handle = _queue.push(PeerTimer{
        .peer = peer,
        .kind = kind,
        .nexttime = when,
        .interval = interval,
    });
    _handles.emplace(timer_key(peer, kind), handle);
}

void TimerQueue::schedule_rekey(PeerId peer, uint64_t now) {
    schedule(peer, TimerKind::Rekey, now + RekeyAfterTime);
}

void TimerQueue::schedule_keepalive(PeerId peer, uint64_t now, uint64_t interval) {
    schedule(peer, TimerKind::KeepAlive, now + interval, interval);
}

void TimerQueue::schedule_retry(PeerId peer, uint64_t now) {
    uint64_t jitter = randombytes_uniform(RekeyTimeoutJitterMaxMs) * OneMillisecond;
    schedule(peer, TimerKind::HandshakeRetry, now + RekeyTimeout + jitter);
}

bool TimerQueue::cancel(PeerId peer, TimerKind kind) {
    auto it = _handles.find(timer_key(peer, kind));
    if (it == _handles.end())
        return false;
    _queue.erase(it->second);
    _handles.erase(it);
    return true;
}

size_t TimerQueue::cancel(PeerId peer) {
    size_t count = 0;
    for (auto kind : {TimerKind::Rekey, TimerKind::KeepAlive, TimerKind::HandshakeRetry})
        if (cancel(peer, kind))
            count++;
    return count;
}

bool TimerQueue::armed(PeerId peer, TimerKind kind) const {
    return _handles.find(timer_key(peer, kind)) != _handles.end();
}

size_t TimerQueue::expire(uint64_t now, BoundedQueue<TimerEvent> &out) {
    size_t count = 0;
    while (!_queue.empty() && _queue.top().nexttime <= now && !out.full()) {
        auto &top = _queue.top();
        if (!out.try_push(make_event(top)))
            break;
        count++;
        auto key = timer_key(top.peer, top.kind);
        if (top.interval) {
            auto handle = _handles.at(key);
            top.nexttime += top.interval;
            // don't burst to catch up after a stall
            if (top.nexttime <= now)
                top.nexttime = now + top.interval;
            _queue.decrease(handle);
        } else {
            _handles.erase(key);
            _queue.pop();
        }
    }
    if (count)
        DBG_PRINT("{} timers fired\n", count);
    return count;
}

std::optional<uint64_t> TimerQueue::next_deadline() const {
    if (_queue.empty())
        return std::nullopt;
    return _queue.top().nexttime;
}

} // namespace wgpeer
