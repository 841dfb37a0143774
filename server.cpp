#include <array>
#include <stdexcept>
#include <utility>
#include <noise/protocol.h>
#include <sodium.h>
#include <fmt/format.h>
#include <tdutil/time.hpp>

#include "server.hpp"
#include "dbgprint.hpp"

using namespace tdutil::operators;
using namespace wgpeer::proto;
using namespace wgpeer::time;

namespace wgpeer {

static constexpr size_t MaxPayload = 65535;

PeerServer::PeerServer(const Key256 &privkey, DatagramSink *net, TunnelSink *tun)
    : _privkey(privkey), _pubkey(derive_public_key(privkey)), _net(net), _tun(tun),
      _txbuf(transport_size(MaxPayload)), _rxbuf(MaxPayload + TagSize) {
}

PeerServer::~PeerServer() {
    for (auto id : _peers.ids()) {
        auto entry = _peers.find(id);
        entry->state.synchronize()->clear(_indices);
    }
    sodium_memzero(_privkey.key, sizeof(_privkey.key));
}

PeerId PeerServer::add_peer(const PeerConfig &config) {
    if (!config.preshared_key)
        throw std::invalid_argument("peer has no preshared key");
    long keepalive =
        config.persistent_keepalive_interval ? config.persistent_keepalive_interval * OneSecond : KeepaliveTimeout;
    auto &entry = _peers.add(config.public_key, *config.preshared_key, keepalive);
    if (config.endpoint)
        entry.state.synchronize()->set_endpoint(*config.endpoint);
    fmt::print("peer {} added\n", entry.id);
    return entry.id;
}

bool PeerServer::remove_peer(PeerId id) {
    auto entry = _peers.find(id);
    if (!entry)
        return false;
    _timers.cancel(id);
    entry->state.synchronize()->clear(_indices);
    _peers.remove(id);
    fmt::print("peer {} removed\n", id);
    return true;
}

bool PeerServer::push_datagram(const Endpoint &source, std::span<const uint8_t> data) {
    return _inbound.try_emplace(Datagram{source, std::vector<uint8_t>(data.begin(), data.end())});
}

bool PeerServer::push_plaintext(PeerId peer, std::span<const uint8_t> data) {
    return _outbound.try_emplace(Plaintext{peer, std::vector<uint8_t>(data.begin(), data.end())});
}

size_t PeerServer::poll(const timespec &now) {
    size_t count = 0;

    while (true) {
        _timers.expire(to_time(now), _timer_events);
        if (_timer_events.empty())
            break;
        while (auto ev = _timer_events.try_pop()) {
            auto res = handle_timer(*ev, now);
            if (!res)
                warn_error("timer", res.error());
            count++;
        }
    }

    while (auto dgram = _inbound.try_pop()) {
        auto res = handle_incoming_packet(dgram->source, dgram->data, now);
        if (!res)
            warn_error("inbound packet", res.error());
        count++;
    }

    while (auto ptext = _outbound.try_pop()) {
        auto res = handle_outgoing_packet(ptext->peer, ptext->data, now);
        if (!res)
            warn_error("outbound packet", res.error());
        count++;
    }

    return count;
}

outcome::result<void> PeerServer::initiate_handshake(PeerId id, const timespec &now) {
    auto entry = _peers.find(id);
    if (!entry)
        return fail(ENOENT);
    auto state = entry->state.synchronize();
    return send_initiation(*entry, *state, now, false);
}

outcome::result<void> PeerServer::send_initiation(PeerEntry &entry, Peer &peer, const timespec &now, bool supersede) {
    if (!peer.endpoint())
        return fail(PeerError::NoEndpoint);

    auto hs = BOOST_OUTCOME_TRYX(Handshake::create(NOISE_ROLE_INITIATOR, _privkey, &entry.pubkey, entry.psk));
    auto index = BOOST_OUTCOME_TRYX(peer.begin_handshake(_indices, HandshakeRole::Initiator, std::move(hs), now, supersede));
    auto pending = peer.next().value();

    Handshake1 msg;
    auto written = pending->handshake.write_initiation(msg, index, _clock.get(now));
    if (!written) {
        peer.abandon_handshake(_indices);
        return written.error();
    }

    if (!peer.attempt_begin)
        peer.attempt_begin = now;
    _timers.schedule_retry(entry.id, to_time(now));
    _net->send_datagram(*peer.endpoint(), std::span(reinterpret_cast<const uint8_t *>(&msg), sizeof(msg)));
    fmt::print("peer {}: sent handshake initiation, index {}\n", entry.id, index);
    return outcome::success();
}

outcome::result<void> PeerServer::send_transport(
    Peer &peer,
    Session *session,
    std::span<const uint8_t> data,
    const timespec &now) {
    if (!peer.endpoint())
        return fail(PeerError::NoEndpoint);
    auto size = BOOST_OUTCOME_TRYX(session->encrypt(_txbuf, data, now));
    peer.tx_bytes += size;
    _net->send_datagram(*peer.endpoint(), std::span(_txbuf.data(), size));
    return outcome::success();
}

size_t PeerServer::flush_staged(Peer &peer, const timespec &now) {
    auto current = peer.current();
    if (!current)
        return 0;
    size_t sent = 0;
    for (const auto &pkt : peer.take_staged()) {
        auto res = send_transport(peer, current.value(), pkt, now);
        if (res)
            sent++;
        else
            warn_error("flush staged packet", res.error());
    }
    return sent;
}

void PeerServer::maybe_rekey(PeerEntry &entry, Peer &peer, Session *session, const timespec &now) {
    if (!session->needs_rekey(now) || peer.next())
        return;
    auto res = send_initiation(entry, peer, now, false);
    if (!res)
        warn_error("rekey", res.error());
}

void PeerServer::arm_keepalive(const PeerEntry &entry, const timespec &now) {
    if (!_timers.armed(entry.id, TimerKind::KeepAlive))
        _timers.schedule_keepalive(entry.id, to_time(now), entry.keepalive);
}

outcome::result<void> PeerServer::handle_incoming_packet(
    const Endpoint &source,
    std::span<const uint8_t> data,
    const timespec &now) {
    auto pkt = decode_packet(data);
    if (auto hs1 = std::get_if<const Handshake1 *>(&pkt)) {
        return handle_initiation(source, *hs1, now);
    } else if (auto hs2 = std::get_if<const Handshake2 *>(&pkt)) {
        return handle_response(source, *hs2, now);
    } else if (auto transport = std::get_if<TransportPacket>(&pkt)) {
        return handle_transport(source, *transport, now);
    } else if (std::holds_alternative<const CookiePacket *>(pkt)) {
        DBG_PRINT("cookie reply from {} ignored\n", format_endpoint(source));
        return outcome::success();
    } else {
        return fail(PeerError::InvalidPacket);
    }
}

outcome::result<void> PeerServer::handle_initiation(
    const Endpoint &source,
    const Handshake1 *hs1,
    const timespec &now) {
    // The initiation payload does not depend on the PSK (it is only mixed in by the response),
    // so a throwaway responder is enough to learn who is talking to us.
    static const PresharedKey any_psk = {0};
    auto peek = BOOST_OUTCOME_TRYX(Handshake::create(NOISE_ROLE_RESPONDER, _privkey, nullptr, any_psk));
    BOOST_OUTCOME_TRY(peek.read_initiation(*hs1));
    auto remote = peek.remote_public_key();

    auto entry = _peers.find(remote);
    if (!entry)
        return fail(PeerError::HandshakeFailed);
    auto state = entry->state.synchronize();

    auto hs = BOOST_OUTCOME_TRYX(Handshake::create(NOISE_ROLE_RESPONDER, _privkey, nullptr, entry->psk));
    auto timestamp = BOOST_OUTCOME_TRYX(hs.read_initiation(*hs1));
    if (timestamp <= state->last_initiation) {
        DBG_PRINT("peer {}: replayed initiation\n", entry->id);
        return fail(PeerError::HandshakeFailed);
    }

    // simultaneous initiation: the side with the lower public key keeps its own attempt
    bool supersede = false;
    if (auto next = state->next())
        supersede = next.value()->role == HandshakeRole::Responder || remote < _pubkey;
    auto index = BOOST_OUTCOME_TRYX(state->begin_handshake(_indices, HandshakeRole::Responder, std::move(hs), now, supersede));
    state->last_initiation = timestamp;

    auto pending = state->next().value();
    pending->remote_index = hs1->sender_index;
    Handshake2 msg;
    auto written = pending->handshake.write_response(msg, index, pending->remote_index);
    if (!written) {
        state->abandon_handshake(_indices);
        return written.error();
    }
    // current keeps carrying traffic until the initiator proves it holds the new keys
    auto session = state->prepare_session(now);
    if (!session) {
        state->abandon_handshake(_indices);
        return session.error();
    }

    state->set_endpoint(source);
    state->attempt_begin.reset();
    _timers.cancel(entry->id, TimerKind::HandshakeRetry);

    _net->send_datagram(source, std::span(reinterpret_cast<const uint8_t *>(&msg), sizeof(msg)));
    fmt::print("peer {}: sent handshake response, index {} to {}\n", entry->id, index, format_endpoint(source));
    return outcome::success();
}

outcome::result<void> PeerServer::handle_response(
    const Endpoint &source,
    const Handshake2 *hs2,
    const timespec &now) {
    uint32_t local_index = hs2->receiver_index;
    auto id = _indices.find(local_index);
    if (!id)
        return fail(PeerError::HandshakeFailed);
    auto entry = _peers.find(*id);
    if (!entry)
        return fail(PeerError::HandshakeFailed);
    auto state = entry->state.synchronize();

    auto next = state->next();
    if (!next || next.value()->local_index != local_index || next.value()->role != HandshakeRole::Initiator)
        return fail(PeerError::HandshakeFailed);
    auto pending = next.value();
    BOOST_OUTCOME_TRY(pending->handshake.read_response(*hs2));
    pending->remote_index = hs2->sender_index;
    auto session = BOOST_OUTCOME_TRYX(state->complete_handshake(_indices, now));

    state->set_endpoint(source);
    state->attempt_begin.reset();
    _timers.cancel(entry->id, TimerKind::HandshakeRetry);
    _timers.schedule_rekey(entry->id, to_time(now));
    arm_keepalive(*entry, now);
    fmt::print("peer {}: handshake completed as initiator, index {}\n", entry->id, local_index);

    if (state->staged()) {
        flush_staged(*state, now);
    } else {
        // key confirmation for the responder
        auto res = send_transport(*state, session, {}, now);
        if (!res)
            warn_error("confirmation keepalive", res.error());
    }
    return outcome::success();
}

static outcome::result<size_t> decrypt_any(
    Peer &peer,
    std::span<uint8_t> out,
    const TransportPacket &pkt,
    const timespec &now) {
    if (auto current = peer.current()) {
        auto res = current.value()->decrypt(out, pkt, now);
        if (res)
            return res;
    }
    if (auto past = peer.past())
        return past.value()->decrypt(out, pkt, now);
    return fail(PeerError::DecryptFailed);
}

outcome::result<void> PeerServer::handle_transport(
    const Endpoint &source,
    const TransportPacket &pkt,
    const timespec &now) {
    auto id = _indices.find(pkt.header->receiver_index);
    if (!id)
        return fail(PeerError::UnknownSessionIndex);
    auto entry = _peers.find(*id);
    if (!entry)
        return fail(PeerError::UnknownSessionIndex);
    auto state = entry->state.synchronize();

    size_t size;
    auto pending = state->unconfirmed();
    if (pending && pending.value()->local_id() == pkt.header->receiver_index) {
        size = BOOST_OUTCOME_TRYX(pending.value()->decrypt(_rxbuf, pkt, now));
        auto session = BOOST_OUTCOME_TRYX(state->complete_handshake(_indices, now));
        // only the initiator of a session rekeys it on time
        _timers.cancel(entry->id, TimerKind::Rekey);
        arm_keepalive(*entry, now);
        fmt::print("peer {}: handshake completed as responder, index {}\n", entry->id, session->local_id());
        flush_staged(*state, now);
    } else {
        size = BOOST_OUTCOME_TRYX(decrypt_any(*state, _rxbuf, pkt, now));
    }
    state->rx_bytes += sizeof(DataHeader) + pkt.ciphertext.size();
    state->set_endpoint(source);
    if (size)
        _tun->deliver(entry->id, std::span(_rxbuf.data(), size));
    else
        DBG_PRINT("peer {}: keepalive\n", entry->id);
    return outcome::success();
}

outcome::result<void> PeerServer::handle_outgoing_packet(
    PeerId id,
    std::span<const uint8_t> data,
    const timespec &now) {
    auto entry = _peers.find(id);
    if (!entry)
        return fail(ENOENT);
    auto state = entry->state.synchronize();

    if (auto current = state->current()) {
        auto res = send_transport(*state, current.value(), data, now);
        if (res) {
            maybe_rekey(*entry, *state, current.value(), now);
            return outcome::success();
        } else if (res.error() != PeerError::NoActiveSession) {
            return res.error();
        }
    }

    if (!state->stage(data))
        DBG_PRINT("peer {}: staging full, dropped oldest packet\n", id);
    auto next = state->next();
    if (!next || next.value()->expired(now))
        return send_initiation(*entry, *state, now, false);
    return outcome::success();
}

outcome::result<void> PeerServer::handle_timer(const TimerEvent &ev, const timespec &now) {
    auto id = timer_event_peer(ev);
    auto entry = _peers.find(id);
    if (!entry)
        return fail(ENOENT);
    auto state = entry->state.synchronize();

    if (std::holds_alternative<RekeyEvent>(ev)) {
        DBG_PRINT("peer {}: rekey\n", id);
        return send_initiation(*entry, *state, now, false);
    } else if (std::holds_alternative<KeepAliveEvent>(ev)) {
        if (!state->expire_sessions(_indices, now, 3 * RejectAfterTime)) {
            _timers.cancel(id, TimerKind::KeepAlive);
            DBG_PRINT("peer {}: all sessions expired\n", id);
            return outcome::success();
        }
        auto current = state->current();
        // nothing usable to keep alive until the next handshake
        if (!current || current.value()->expired(now))
            return outcome::success();
        if ((now - current.value()->last_send()) < entry->keepalive)
            return outcome::success();
        return send_transport(*state, current.value(), {}, now);
    } else {
        auto next = state->next();
        if (!next || next.value()->role != HandshakeRole::Initiator)
            return outcome::success();
        if (state->attempt_begin && (now - *state->attempt_begin) > RekeyAttemptTime) {
            state->abandon_handshake(_indices);
            state->clear_staged();
            state->attempt_begin.reset();
            warn_print("peer {}: handshake did not complete after {} seconds, giving up\n", id, RekeyAttemptTime / OneSecond);
            return outcome::success();
        }
        return send_initiation(*entry, *state, now, true);
    }
}

} // namespace wgpeer
