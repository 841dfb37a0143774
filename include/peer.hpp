#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <span>
#include <vector>
#include <time.h>

#include "result.hpp" // IWYU pragma: keep
#include "endpoint.hpp"
#include "index_table.hpp"
#include "proto.hpp"
#include "handshake.hpp"
#include "session.hpp"
#include "tai64n.hpp"

namespace wgpeer {

enum class HandshakeRole {
    Initiator,
    Responder,
};

// The "next" slot: a handshake that has been started locally but not finalized.
struct PendingHandshake {
    proto::Handshake handshake;
    HandshakeRole role = HandshakeRole::Initiator;
    uint32_t local_index = 0;
    // learned from the initiation (responder) or the response (initiator)
    uint32_t remote_index = 0;
    timespec begin = time::timespec_min();
    // responder: keys derived when the response went out; promoted by the first transport packet on them
    std::unique_ptr<proto::Session> session;

    bool expired(const timespec &now) const;
};

// Mutable per-peer state: the {next, current, past} session slots and traffic accounting.
// Every index a slot holds is registered in the IndexTable and erased when the slot goes away.
class Peer {
public:
    static constexpr size_t MaxStaged = 128;

    explicit Peer(PeerId id) : _id(id) {
    }

    PeerId id() const {
        return _id;
    }

    const std::optional<Endpoint> &endpoint() const {
        return _endpoint;
    }
    void set_endpoint(const Endpoint &ep) {
        _endpoint = ep;
    }

    // Allocates a session index and installs the handshake as the next slot.
    // An unexpired next slot is only replaced when supersede is set.
    outcome::result<uint32_t> begin_handshake(
        IndexTable &indices,
        HandshakeRole role,
        proto::Handshake &&handshake,
        const timespec &now,
        bool supersede = false);
    // Derives the keys of a finished responder leg without installing them.
    // The session stays in next, still unconfirmed, until complete_handshake.
    outcome::result<proto::Session *> prepare_session(const timespec &now);
    // Finalizes next and rotates current to past and next to current.
    // The session pushed out of past loses its index.
    outcome::result<proto::Session *> complete_handshake(IndexTable &indices, const timespec &now);
    // Drops next. Returns false if there was none.
    bool abandon_handshake(IndexTable &indices);
    // Drops established sessions older than life. Returns true if any session remains.
    bool expire_sessions(IndexTable &indices, const timespec &now, long life);
    // Drops every slot, staged packet and index of this peer.
    void clear(IndexTable &indices);

    outcome::result<PendingHandshake *> next();
    outcome::result<proto::Session *> current();
    outcome::result<proto::Session *> past();
    // the session prepared in next, if any
    outcome::result<proto::Session *> unconfirmed();

    bool has_session() const {
        return _current || _past;
    }

    // Queues plaintext until a session exists. Returns false if the oldest packet had to be dropped.
    bool stage(std::span<const uint8_t> pkt);
    std::deque<std::vector<uint8_t>> take_staged();
    size_t staged() const {
        return _staged.size();
    }
    void clear_staged() {
        _staged.clear();
    }

    // wire bytes of transport packets sent and authenticated
    uint64_t tx_bytes = 0;
    uint64_t rx_bytes = 0;
    // greatest initiation timestamp accepted from this peer
    time::TAI64N last_initiation;
    // start of the current series of initiation attempts, if any
    std::optional<timespec> attempt_begin;

private:
    PeerId _id;
    std::optional<Endpoint> _endpoint;
    std::optional<PendingHandshake> _next;
    std::unique_ptr<proto::Session> _current, _past;
    std::deque<std::vector<uint8_t>> _staged;
};

} // namespace wgpeer
