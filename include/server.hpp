#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include <time.h>

#include "keys.hpp"
#include "result.hpp" // IWYU pragma: keep
#include "endpoint.hpp"
#include "config.hpp"
#include "index_table.hpp"
#include "peer.hpp"
#include "peer_table.hpp"
#include "timer.hpp"
#include "proto.hpp"
#include "tai64n.hpp"
#include "util/bounded_queue.hpp"

namespace wgpeer {

// Where encrypted datagrams go. Implementations must not call back into the server.
class DatagramSink {
public:
    virtual ~DatagramSink() {
    }
    virtual void send_datagram(const Endpoint &to, std::span<const uint8_t> data) = 0;
};

// Where decrypted payloads go.
class TunnelSink {
public:
    virtual ~TunnelSink() {
    }
    virtual void deliver(PeerId peer, std::span<const uint8_t> data) = 0;
};

struct Datagram {
    Endpoint source;
    std::vector<uint8_t> data;
};

struct Plaintext {
    PeerId peer;
    std::vector<uint8_t> data;
};

// Drives every peer's handshake and transport state from three queues, in priority order:
// timer events, inbound datagrams, outbound plaintext.
// Per-event failures are logged and never interrupt the loop.
class PeerServer {
public:
    static constexpr size_t QueueCapacity = 1024;

    PeerServer(const Key256 &privkey, DatagramSink *net, TunnelSink *tun);
    PeerServer(const PeerServer &) = delete;
    PeerServer &operator=(const PeerServer &) = delete;
    ~PeerServer();

    const Key256 &public_key() const {
        return _pubkey;
    }

    // throws std::invalid_argument if the peer has no preshared key or is already known
    PeerId add_peer(const PeerConfig &config);
    bool remove_peer(PeerId id);

    // false if the queue is full; the caller should hold the data back
    bool push_datagram(const Endpoint &source, std::span<const uint8_t> data);
    bool push_plaintext(PeerId peer, std::span<const uint8_t> data);

    // Starts a handshake as initiator. Fails with HandshakeInProgress if one is already pending.
    outcome::result<void> initiate_handshake(PeerId id, const timespec &now);

    // Runs one cycle over all three queues. Returns the number of events handled.
    size_t poll(const timespec &now);
    std::optional<uint64_t> next_deadline() const {
        return _timers.next_deadline();
    }
    bool idle() const {
        return _timer_events.empty() && _inbound.empty() && _outbound.empty();
    }
    bool inbound_full() const {
        return _inbound.full();
    }
    bool outbound_full() const {
        return _outbound.full();
    }

    outcome::result<void> handle_incoming_packet(
        const Endpoint &source,
        std::span<const uint8_t> data,
        const timespec &now);
    outcome::result<void> handle_timer(const TimerEvent &ev, const timespec &now);
    outcome::result<void> handle_outgoing_packet(PeerId id, std::span<const uint8_t> data, const timespec &now);

    PeerTable &peers() {
        return _peers;
    }
    const PeerTable &peers() const {
        return _peers;
    }
    IndexTable &indices() {
        return _indices;
    }
    TimerQueue &timers() {
        return _timers;
    }

private:
    outcome::result<void> handle_initiation(
        const Endpoint &source,
        const proto::Handshake1 *hs1,
        const timespec &now);
    outcome::result<void> handle_response(const Endpoint &source, const proto::Handshake2 *hs2, const timespec &now);
    outcome::result<void> handle_transport(
        const Endpoint &source,
        const proto::TransportPacket &pkt,
        const timespec &now);

    outcome::result<void> send_initiation(PeerEntry &entry, Peer &peer, const timespec &now, bool supersede);
    outcome::result<void> send_transport(
        Peer &peer,
        proto::Session *session,
        std::span<const uint8_t> data,
        const timespec &now);
    size_t flush_staged(Peer &peer, const timespec &now);
    void maybe_rekey(PeerEntry &entry, Peer &peer, proto::Session *session, const timespec &now);
    void arm_keepalive(const PeerEntry &entry, const timespec &now);

    Key256 _privkey, _pubkey;
    DatagramSink *_net;
    TunnelSink *_tun;
    time::TAI64NClock _clock;

    PeerTable _peers;
    IndexTable _indices;
    TimerQueue _timers;

    BoundedQueue<TimerEvent, QueueCapacity> _timer_events;
    BoundedQueue<Datagram, QueueCapacity> _inbound;
    BoundedQueue<Plaintext, QueueCapacity> _outbound;

    std::vector<uint8_t> _txbuf, _rxbuf;
};

} // namespace wgpeer
