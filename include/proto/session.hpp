#pragma once

#include <cstdint>
#include <span>
#include <time.h>

#include "keys.hpp"
#include "result.hpp" // IWYU pragma: keep
#include "proto.hpp"
#include "replay.hpp"
#include "tai64n.hpp"

namespace wgpeer::proto {

// An established key pair and its transport state.
// Send counters only move forward; a session is never reused after rotation out of the peer.
class Session {
public:
    explicit Session(KeyPair &&keys);
    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    const KeyPair &keys() const {
        return _keys;
    }
    uint32_t local_id() const {
        return _keys.local_id();
    }
    uint32_t remote_id() const {
        return _keys.remote_id();
    }
    bool initiator() const {
        return _keys.initiator;
    }
    const timespec &birth() const {
        return _keys.birth;
    }
    // counter the next encrypted packet will carry
    uint64_t send_nonce() const {
        return _send_nonce;
    }
    const timespec &last_send() const {
        return _last_send;
    }
    const timespec &last_recv() const {
        return _last_recv;
    }

    bool expired(const timespec &now, long life = RejectAfterTime) const;
    // whether sending on this session should trigger a new handshake
    bool needs_rekey(const timespec &now) const;

    // Writes a full transport packet to out and returns its size.
    outcome::result<size_t> encrypt(std::span<uint8_t> out, std::span<const uint8_t> in, const timespec &now);
    // Authenticates and decrypts into out, returning the plaintext size.
    // The replay window only advances on success.
    outcome::result<size_t> decrypt(std::span<uint8_t> out, const TransportPacket &pkt, const timespec &now);

private:
    KeyPair _keys;
    uint64_t _send_nonce = 0;
    timespec _last_send, _last_recv;
    ReplayWindow<ReplayWindowBits> _replay;
};

} // namespace wgpeer::proto
