#include <algorithm>
#include <array>
#include <stdexcept>
#include <boost/endian/conversion.hpp>
#include <noise/protocol.h>
#include <blake2.h>
#include <sodium.h>

#include "proto.hpp"

using namespace boost::endian;

#define WGPEER_LABEL_MAC1 "mac1----"

namespace wgpeer {

std::string PeerErrorCategory::message(int cond) const {
    switch (static_cast<PeerError>(cond)) {
    case PeerError::UnknownSessionIndex:
        return "unknown session index";
    case PeerError::HandshakeFailed:
        return "handshake failed";
    case PeerError::DecryptFailed:
        return "decrypt failed";
    case PeerError::NoActiveSession:
        return "no active session";
    case PeerError::HandshakeInProgress:
        return "handshake in progress";
    case PeerError::InvalidPacket:
        return "invalid packet";
    case PeerError::NoEndpoint:
        return "peer has no endpoint";
    default:
        return "unknown error";
    }
}

const std::error_category &peer_category() noexcept {
    static const PeerErrorCategory category;
    return category;
}

} // namespace wgpeer

namespace wgpeer::proto {

std::string NoiseErrorCategory::message(int cond) const {
    std::array<char, 64> buf = {0};
    if (noise_strerror(cond, buf.data(), buf.size()) < 0)
        return "unknown noise error";
    return std::string(buf.data());
}

const std::error_category &noise_category() noexcept {
    static const NoiseErrorCategory category;
    return category;
}

DecodedPacket decode_packet(std::span<const uint8_t> in) {
    if (in.size() < sizeof(uint32_t))
        return std::monostate{};
    auto mtype = static_cast<MessageType>(load_little_u32(in.data()));
    switch (mtype) {
    case MessageType::Initiation:
        if (in.size() == sizeof(Handshake1))
            return reinterpret_cast<const Handshake1 *>(in.data());
        else
            return std::monostate{};
    case MessageType::Response:
        if (in.size() == sizeof(Handshake2))
            return reinterpret_cast<const Handshake2 *>(in.data());
        else
            return std::monostate{};
    case MessageType::CookieReply:
        if (in.size() == sizeof(CookiePacket))
            return reinterpret_cast<const CookiePacket *>(in.data());
        else
            return std::monostate{};
    case MessageType::Transport:
        if (in.size() >= transport_size(0))
            return TransportPacket{
                reinterpret_cast<const DataHeader *>(in.data()),
                in.subspan(sizeof(DataHeader)),
            };
        else
            return std::monostate{};
    default:
        return std::monostate{};
    }
}

static void make_mac1key(const Key256 &pubkey, std::span<uint8_t, 32> out) {
    std::array<uint8_t, 8 + 32> in;
    std::copy_n(WGPEER_LABEL_MAC1, 8, in.begin());
    std::copy(std::begin(pubkey.key), std::end(pubkey.key), &in[8]);
    auto err = blake2s(out.data(), in.data(), nullptr, out.size(), in.size(), 0);
    if (err)
        throw std::runtime_error("make_mac1key");
}

void calculate_mac1(const Key256 &pubkey, std::span<const uint8_t> payload, std::span<uint8_t, 16> out) {
    std::array<uint8_t, 32> mac1key = {0};
    make_mac1key(pubkey, mac1key);
    auto err = blake2s(out.data(), payload.data(), mac1key.data(), out.size(), payload.size(), mac1key.size());
    sodium_memzero(mac1key.data(), mac1key.size());
    if (err)
        throw std::runtime_error("calculate_mac1");
}

bool verify_mac1(const Key256 &pubkey, std::span<const uint8_t> payload, std::span<const uint8_t, 16> mac1) {
    std::array<uint8_t, 16> expected;
    calculate_mac1(pubkey, payload, expected);
    return sodium_memcmp(expected.data(), mac1.data(), expected.size()) == 0;
}

} // namespace wgpeer::proto
