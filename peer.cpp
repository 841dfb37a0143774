#include <utility>
#include <tdutil/time.hpp>

#include "peer.hpp"
#include "dbgprint.hpp"

using namespace tdutil::operators;

namespace wgpeer {

bool PendingHandshake::expired(const timespec &now) const {
    return (now - begin) > proto::RekeyTimeout;
}

outcome::result<uint32_t> Peer::begin_handshake(
    IndexTable &indices,
    HandshakeRole role,
    proto::Handshake &&handshake,
    const timespec &now,
    bool supersede) {
    if (_next) {
        if (!supersede && !_next->expired(now))
            return fail(PeerError::HandshakeInProgress);
        indices.erase(_next->local_index);
        _next.reset();
    }

    PendingHandshake pending;
    pending.handshake = std::move(handshake);
    pending.role = role;
    pending.local_index = indices.allocate(_id);
    pending.begin = now;
    _next = std::move(pending);
    DBG_PRINT("peer {}: next slot {}\n", _id, _next->local_index);
    return _next->local_index;
}

outcome::result<proto::Session *> Peer::prepare_session(const timespec &now) {
    if (!_next)
        return fail(PeerError::NoActiveSession);
    if (!_next->session) {
        auto keys = BOOST_OUTCOME_TRYX(_next->handshake.split(now, _next->local_index, _next->remote_index));
        _next->session = std::make_unique<proto::Session>(std::move(keys));
    }
    return _next->session.get();
}

outcome::result<proto::Session *> Peer::complete_handshake(IndexTable &indices, const timespec &now) {
    if (!_next)
        return fail(PeerError::NoActiveSession);
    auto session = std::move(_next->session);
    if (!session) {
        auto keys = BOOST_OUTCOME_TRYX(_next->handshake.split(now, _next->local_index, _next->remote_index));
        session = std::make_unique<proto::Session>(std::move(keys));
    }
    _next.reset();

    if (_past)
        indices.erase(_past->local_id());
    _past = std::move(_current);
    _current = std::move(session);
    DBG_PRINT("peer {}: current slot {}\n", _id, _current->local_id());
    return _current.get();
}

bool Peer::abandon_handshake(IndexTable &indices) {
    if (!_next)
        return false;
    indices.erase(_next->local_index);
    _next.reset();
    return true;
}

bool Peer::expire_sessions(IndexTable &indices, const timespec &now, long life) {
    if (_past && _past->expired(now, life)) {
        indices.erase(_past->local_id());
        _past.reset();
    }
    if (_current && _current->expired(now, life)) {
        indices.erase(_current->local_id());
        _current.reset();
    }
    return has_session();
}

void Peer::clear(IndexTable &indices) {
    indices.erase_peer(_id);
    _next.reset();
    _current.reset();
    _past.reset();
    _staged.clear();
    attempt_begin.reset();
}

outcome::result<PendingHandshake *> Peer::next() {
    if (!_next)
        return fail(PeerError::NoActiveSession);
    return &*_next;
}

outcome::result<proto::Session *> Peer::current() {
    if (!_current)
        return fail(PeerError::NoActiveSession);
    return _current.get();
}

outcome::result<proto::Session *> Peer::past() {
    if (!_past)
        return fail(PeerError::NoActiveSession);
    return _past.get();
}

outcome::result<proto::Session *> Peer::unconfirmed() {
    if (!_next || !_next->session)
        return fail(PeerError::NoActiveSession);
    return _next->session.get();
}

bool Peer::stage(std::span<const uint8_t> pkt) {
    bool kept = true;
    if (_staged.size() >= MaxStaged) {
        _staged.pop_front();
        kept = false;
    }
    _staged.emplace_back(pkt.begin(), pkt.end());
    return kept;
}

std::deque<std::vector<uint8_t>> Peer::take_staged() {
    return std::exchange(_staged, {});
}

} // namespace wgpeer
