#include <array>
#include <boost/endian/conversion.hpp>
#include <sodium.h>
#include <tdutil/time.hpp>

#include "session.hpp"
#include "dbgprint.hpp"

using namespace boost::endian;
using namespace tdutil::operators;

namespace wgpeer::proto {

using Nonce = std::array<uint8_t, crypto_aead_chacha20poly1305_IETF_NPUBBYTES>;

static Nonce make_nonce(uint64_t counter) {
    Nonce nonce = {0};
    store_little_u64(&nonce[4], counter);
    return nonce;
}

Session::Session(KeyPair &&keys)
    : _keys(std::move(keys)), _last_send(_keys.birth), _last_recv(_keys.birth), _replay(RejectAfterMessages) {
}

bool Session::expired(const timespec &now, long life) const {
    return (now - _keys.birth) > life;
}

bool Session::needs_rekey(const timespec &now) const {
    if (_send_nonce > RekeyAfterMessages)
        return true;
    return _keys.initiator && expired(now, RekeyAfterTime);
}

outcome::result<size_t> Session::encrypt(std::span<uint8_t> out, std::span<const uint8_t> in, const timespec &now) {
    if (expired(now) || _send_nonce >= RejectAfterMessages)
        return fail(PeerError::NoActiveSession);
    if (out.size() < transport_size(in.size()))
        return fail(ENOBUFS);

    auto counter = _send_nonce++;
    store_little_u32(out.data(), static_cast<uint32_t>(MessageType::Transport));
    store_little_u32(out.data() + offsetof(DataHeader, receiver_index), _keys.remote_id());
    store_little_u64(out.data() + offsetof(DataHeader, counter), counter);
    auto nonce = make_nonce(counter);

    auto cryptout = out.subspan(sizeof(DataHeader));
    unsigned long long outsize = 0;
    crypto_aead_chacha20poly1305_ietf_encrypt(
        cryptout.data(),
        &outsize,
        in.data(),
        in.size(),
        nullptr,
        0,
        nullptr,
        nonce.data(),
        _keys.send.key.data());
    _last_send = now;
    return sizeof(DataHeader) + outsize;
}

outcome::result<size_t> Session::decrypt(std::span<uint8_t> out, const TransportPacket &pkt, const timespec &now) {
    if (expired(now))
        return fail(PeerError::DecryptFailed);
    uint64_t counter = pkt.header->counter;
    if (!_replay.check(counter)) {
        DBG_PRINT("session {}: counter {} replayed or out of window\n", local_id(), counter);
        return fail(PeerError::DecryptFailed);
    }
    if (pkt.ciphertext.size() < TagSize || out.size() < pkt.ciphertext.size() - TagSize)
        return fail(PeerError::DecryptFailed);

    auto nonce = make_nonce(counter);
    unsigned long long outsize = 0;
    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            out.data(),
            &outsize,
            nullptr,
            pkt.ciphertext.data(),
            pkt.ciphertext.size(),
            nullptr,
            0,
            nonce.data(),
            _keys.recv.key.data()) < 0)
        return fail(PeerError::DecryptFailed);

    if (!_replay.mark(counter))
        return fail(PeerError::DecryptFailed);
    _last_recv = now;
    return outsize;
}

} // namespace wgpeer::proto
