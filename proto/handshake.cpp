#include <algorithm>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <sodium.h>
#include <tdutil/util.hpp>

#include "handshake.hpp"
#include "dbgprint.hpp"

using namespace tdutil;

#define WGPEER_PROTO_NAME "Noise_IKpsk2_25519_ChaChaPoly_BLAKE2s"
#define WGPEER_IDENTIFIER "WireGuard v1 zx2c4 Jason@zx2c4.com"

static constexpr NoiseBuffer noise_input(std::span<const uint8_t> span) {
    NoiseBuffer ret;
    noise_buffer_set_input(ret, const_cast<uint8_t *>(span.data()), span.size());
    return ret;
}

static constexpr NoiseBuffer noise_output(std::span<uint8_t> span) {
    NoiseBuffer ret;
    noise_buffer_set_output(ret, span.data(), span.size());
    return ret;
}

namespace wgpeer::proto {

InitiationRecord::~InitiationRecord() {
    sodium_memzero(&privkey, sizeof(privkey));
    sodium_memzero(psk.data(), psk.size());
    sodium_memzero(ephemeral.data(), ephemeral.size());
}

outcome::result<Handshake> Handshake::create(
    int role,
    const Key256 &privkey,
    const Key256 *remote,
    std::span<const uint8_t, 32> psk) {
    int err;

    if (role == NOISE_ROLE_INITIATOR && !remote)
        throw std::invalid_argument("remote pubkey not provided for initiator");

    NoiseHandshakeState *_hs;
    err = noise_handshakestate_new_by_name(&_hs, WGPEER_PROTO_NAME, role);
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);
    Handshake hs(_hs);

    err = noise_handshakestate_set_prologue(hs._hs.get(), WGPEER_IDENTIFIER, strlen(WGPEER_IDENTIFIER));
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);

    err = noise_handshakestate_set_pre_shared_key(hs._hs.get(), psk.data(), psk.size());
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);

    auto dhl = noise_handshakestate_get_local_keypair_dh(hs._hs.get());
    err = noise_dhstate_set_keypair_private(dhl, &privkey.key[0], std::size(privkey.key));
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);

    if (role == NOISE_ROLE_INITIATOR) {
        auto dhr = noise_handshakestate_get_remote_public_key_dh(hs._hs.get());
        err = noise_dhstate_set_public_key(dhr, &remote->key[0], std::size(remote->key));
        if (err != NOISE_ERROR_NONE)
            return noise_fail(err);

        // chosen here rather than by noise-c so that the first leg can be replayed
        auto &init = hs._initiation.emplace();
        init.privkey = privkey;
        init.remote = *remote;
        std::copy(psk.begin(), psk.end(), init.psk.begin());
        randombytes_buf(init.ephemeral.data(), init.ephemeral.size());
        BOOST_OUTCOME_TRY(hs.fix_ephemeral());
    }

    err = noise_handshakestate_start(hs._hs.get());
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);

    return hs;
}

outcome::result<void> Handshake::fix_ephemeral() {
    auto dh = noise_handshakestate_get_fixed_ephemeral_dh(_hs.get());
    if (!dh)
        return noise_fail(NOISE_ERROR_NO_MEMORY);
    auto err = noise_dhstate_set_keypair_private(dh, _initiation->ephemeral.data(), _initiation->ephemeral.size());
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);
    return outcome::success();
}

outcome::result<void> Handshake::rewind() {
    if (!_initiation)
        return fail(EINVAL);
    auto init = *_initiation;
    auto hs = BOOST_OUTCOME_TRYX(create(NOISE_ROLE_INITIATOR, init.privkey, &init.remote, init.psk));
    hs._initiation = init;
    BOOST_OUTCOME_TRY(hs.fix_ephemeral());
    Handshake1 discard;
    BOOST_OUTCOME_TRY(hs.write_initiation(discard, init.sender_index, init.timestamp));
    *this = std::move(hs);
    return outcome::success();
}

Key256 Handshake::local_public_key() const {
    Key256 pubkey;
    auto dh = noise_handshakestate_get_local_keypair_dh(_hs.get());
    if (!dh)
        throw std::runtime_error("cannot get local pubkey");
    auto err = noise_dhstate_get_public_key(dh, &pubkey.key[0], std::size(pubkey.key));
    if (err != NOISE_ERROR_NONE)
        throw std::system_error(err, noise_category(), "noise_dhstate_get_public_key");
    return pubkey;
}

Key256 Handshake::remote_public_key() const {
    Key256 pubkey;
    auto dh = noise_handshakestate_get_remote_public_key_dh(_hs.get());
    if (!dh)
        throw std::runtime_error("cannot get remote pubkey");
    auto err = noise_dhstate_get_public_key(dh, &pubkey.key[0], std::size(pubkey.key));
    if (err != NOISE_ERROR_NONE)
        throw std::system_error(err, noise_category(), "noise_dhstate_get_public_key");
    return pubkey;
}

outcome::result<void> Handshake::write_initiation(
    Handshake1 &out,
    uint32_t sender_index,
    const time::TAI64N &timestamp) {
    if (!is_role(NOISE_ROLE_INITIATOR) || !is_action(NOISE_ACTION_WRITE_MESSAGE))
        return fail(EINVAL);
    sodium_memzero(&out, sizeof(out));

    out.message_type_and_zeroes = static_cast<uint32_t>(MessageType::Initiation);
    out.sender_index = sender_index;

    auto ts = timestamp;
    NoiseBuffer payload = noise_input(ts.bytes);
    NoiseBuffer hsb = noise_output(out.handshake);
    auto err = noise_handshakestate_write_message(_hs.get(), &hsb, &payload);
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);
    if (hsb.size != sizeof(out.handshake))
        return fail(EINVAL);
    if (_initiation) {
        _initiation->sender_index = sender_index;
        _initiation->timestamp = timestamp;
    }

    calculate_mac1(
        remote_public_key(),
        std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(&out), offsetof(Handshake1, mac1)),
        std::span(out.mac1));
    return outcome::success();
}

outcome::result<time::TAI64N> Handshake::read_initiation(const Handshake1 &in) {
    if (!is_role(NOISE_ROLE_RESPONDER) || !is_action(NOISE_ACTION_READ_MESSAGE))
        return fail(EINVAL);

    if (!verify_mac1(
            local_public_key(),
            std::span(reinterpret_cast<const uint8_t *>(&in), offsetof(Handshake1, mac1)),
            std::span(in.mac1))) {
        DBG_PRINT("initiation mac1 mismatch\n");
        return fail(PeerError::HandshakeFailed);
    }

    time::TAI64N timestamp;
    NoiseBuffer hsb = noise_input(in.handshake);
    NoiseBuffer tsb = noise_output(timestamp.bytes);
    auto err = noise_handshakestate_read_message(_hs.get(), &hsb, &tsb);
    if (err != NOISE_ERROR_NONE) {
        DBG_PRINT("initiation rejected: {}\n", noise_category().message(err));
        return fail(PeerError::HandshakeFailed);
    }
    if (tsb.size != timestamp.bytes.size())
        return fail(PeerError::HandshakeFailed);
    return timestamp;
}

outcome::result<void> Handshake::write_response(Handshake2 &out, uint32_t sender_index, uint32_t receiver_index) {
    if (!is_role(NOISE_ROLE_RESPONDER) || !is_action(NOISE_ACTION_WRITE_MESSAGE))
        return fail(EINVAL);
    sodium_memzero(&out, sizeof(out));

    out.message_type_and_zeroes = static_cast<uint32_t>(MessageType::Response);
    out.sender_index = sender_index;
    out.receiver_index = receiver_index;

    NoiseBuffer hsb = noise_output(out.handshake);
    auto err = noise_handshakestate_write_message(_hs.get(), &hsb, nullptr);
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);
    if (hsb.size != sizeof(out.handshake) || !is_action(NOISE_ACTION_SPLIT))
        return fail(EINVAL);

    calculate_mac1(
        remote_public_key(),
        std::span<const uint8_t>(reinterpret_cast<const uint8_t *>(&out), offsetof(Handshake2, mac1)),
        std::span(out.mac1));
    return outcome::success();
}

outcome::result<void> Handshake::read_response(const Handshake2 &in) {
    if (!is_role(NOISE_ROLE_INITIATOR) || !is_action(NOISE_ACTION_READ_MESSAGE))
        return fail(PeerError::HandshakeFailed);

    if (!verify_mac1(
            local_public_key(),
            std::span(reinterpret_cast<const uint8_t *>(&in), offsetof(Handshake2, mac1)),
            std::span(in.mac1))) {
        DBG_PRINT("response mac1 mismatch\n");
        return fail(PeerError::HandshakeFailed);
    }

    // IKpsk2 responses carry no payload; anything decrypted here is a protocol violation
    std::array<uint8_t, 16> payload;
    NoiseBuffer hsb = noise_input(in.handshake);
    NoiseBuffer plb = noise_output(payload);
    auto err = noise_handshakestate_read_message(_hs.get(), &hsb, &plb);
    if (err == NOISE_ERROR_NONE && plb.size == 0 && is_action(NOISE_ACTION_SPLIT))
        return outcome::success();

    if (err != NOISE_ERROR_NONE)
        DBG_PRINT("response rejected: {}\n", noise_category().message(err));
    else
        DBG_PRINT("response carried a {} byte payload\n", plb.size);
    // noise-c fails the whole handshake state, so rebuild it for the genuine response
    BOOST_OUTCOME_TRY(rewind());
    return fail(PeerError::HandshakeFailed);
}

outcome::result<KeyPair> Handshake::split(const timespec &now, uint32_t local_index, uint32_t remote_index) {
    if (!is_action(NOISE_ACTION_SPLIT))
        return fail(PeerError::NoActiveSession);

    std::array<uint8_t, 32> skey, rkey;
    auto_cleanup zeroize([&] {
        sodium_memzero(skey.data(), skey.size());
        sodium_memzero(rkey.data(), rkey.size());
    });
    size_t sklen = skey.size(), rklen = rkey.size();
    auto err = noise_handshakestate_split_raw(_hs.get(), skey.data(), &sklen, rkey.data(), &rklen);
    if (err != NOISE_ERROR_NONE)
        return noise_fail(err);

    KeyPair keys;
    keys.birth = now;
    keys.initiator = noise_handshakestate_get_role(_hs.get()) == NOISE_ROLE_INITIATOR;
    keys.send = Key(std::span(skey.data(), sklen), remote_index);
    keys.recv = Key(std::span(rkey.data(), rklen), local_index);
    _hs.reset();
    _initiation.reset();
    return keys;
}

} // namespace wgpeer::proto
