#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <time.h>
#include <noise/protocol.h>
#include <tdutil/auto_handle.hpp>

#include "keys.hpp"
#include "result.hpp" // IWYU pragma: keep
#include "proto.hpp"
#include "tai64n.hpp"

namespace wgpeer::proto {

using NoiseHandshake = tdutil::auto_handle<noise_handshakestate_free>;

// Everything needed to regenerate an initiator's state after it sent the first leg.
// Secrets are wiped when the object dies.
struct InitiationRecord {
    InitiationRecord() {
    }
    InitiationRecord(const InitiationRecord &) = default;
    InitiationRecord &operator=(const InitiationRecord &) = default;
    ~InitiationRecord();

    Key256 privkey;
    Key256 remote;
    PresharedKey psk;
    std::array<uint8_t, 32> ephemeral;
    uint32_t sender_index = 0;
    time::TAI64N timestamp;
};

// One leg of a Noise_IKpsk2 exchange, from either side.
// Authentication failures on inbound messages are reported as PeerError::HandshakeFailed;
// the underlying noise-c error is only traced.
class Handshake {
public:
    Handshake() {
    }

    // remote is required for the initiator and ignored for the responder.
    static outcome::result<Handshake> create(
        int role,
        const Key256 &privkey,
        const Key256 *remote,
        std::span<const uint8_t, 32> psk);

    bool exists() const {
        return !!_hs;
    }
    bool is_role(int role) const {
        return _hs && noise_handshakestate_get_role(_hs.get()) == role;
    }
    bool is_action(int action) const {
        return _hs && noise_handshakestate_get_action(_hs.get()) == action;
    }

    Key256 local_public_key() const;
    // for a responder, valid once read_initiation succeeded
    Key256 remote_public_key() const;

    // initiator: first leg
    outcome::result<void> write_initiation(Handshake1 &out, uint32_t sender_index, const time::TAI64N &timestamp);
    // responder: consumes the first leg and returns the initiator's timestamp
    outcome::result<time::TAI64N> read_initiation(const Handshake1 &in);
    // responder: second leg
    outcome::result<void> write_response(Handshake2 &out, uint32_t sender_index, uint32_t receiver_index);
    // initiator: consumes the second leg, whose payload must be empty.
    // A response that fails authentication leaves the handshake ready to read another one.
    outcome::result<void> read_response(const Handshake2 &in);

    // Finalizes the session keys. The handshake is consumed.
    outcome::result<KeyPair> split(const timespec &now, uint32_t local_index, uint32_t remote_index);

private:
    explicit Handshake(NoiseHandshakeState *hs) : _hs(hs) {
    }

    outcome::result<void> fix_ephemeral();
    // replays the first leg from _initiation
    outcome::result<void> rewind();

    NoiseHandshake _hs;
    std::optional<InitiationRecord> _initiation;
};

} // namespace wgpeer::proto
