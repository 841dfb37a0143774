#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <system_error>
#include <boost/endian.hpp>

#include "keys.hpp"
#include "result.hpp" // IWYU pragma: keep

namespace wgpeer::proto {

struct NoiseErrorCategory : public std::error_category {
    const char *name() const noexcept override {
        return "NoiseError";
    }

    std::string message(int cond) const override;
};

const std::error_category &noise_category() noexcept;

static inline outcome::failure_type<std::error_code> noise_fail(int err) {
    return outcome::failure_type<std::error_code>(std::error_code(err, noise_category()));
}

static const uint64_t RekeyAfterMessages = 1ull << 60;
static const uint64_t RejectAfterMessages = UINT64_MAX - (1ull << 13);
static const long OneSecond = 1'000'000'000l;
static const long OneMillisecond = 1'000'000l;
static const long RekeyAfterTime = OneSecond * 120;
static const long RekeyAttemptTime = OneSecond * 90;
static const long RekeyTimeout = OneSecond * 5;
static const long RekeyTimeoutJitterMaxMs = 333;
static const long RejectAfterTime = OneSecond * 180;
static const long KeepaliveTimeout = OneSecond * 10;
static const size_t ReplayWindowBits = 8192;

static_assert(RekeyAfterTime < RejectAfterTime, "sessions must be rotated before they are rejected");

enum class MessageType : uint32_t {
    Initiation = 1,
    Response = 2,
    CookieReply = 3,
    Transport = 4,
};

// NOLINTBEGIN(cppcoreguidelines-avoid-c-arrays)

struct [[gnu::packed]] Handshake1 {
    boost::endian::little_uint32_t message_type_and_zeroes;
    boost::endian::little_uint32_t sender_index;
    uint8_t handshake[32 + 32 + 16 + 12 + 16];
    uint8_t mac1[16];
    uint8_t mac2[16];
};

struct [[gnu::packed]] Handshake2 {
    boost::endian::little_uint32_t message_type_and_zeroes;
    boost::endian::little_uint32_t sender_index;
    boost::endian::little_uint32_t receiver_index;
    uint8_t handshake[32 + 0 + 16];
    uint8_t mac1[16];
    uint8_t mac2[16];
};

struct [[gnu::packed]] CookiePacket {
    boost::endian::little_uint32_t message_type_and_zeroes;
    boost::endian::little_uint32_t receiver_index;
    uint8_t nonce[24];
    uint8_t encrypted_cookie[16 + 16];
};

struct [[gnu::packed]] DataHeader {
    boost::endian::little_uint32_t message_type_and_zeroes;
    boost::endian::little_uint32_t receiver_index;
    boost::endian::little_uint64_t counter;
};

// NOLINTEND(cppcoreguidelines-avoid-c-arrays)

static_assert(sizeof(Handshake1) == 148);
static_assert(sizeof(Handshake2) == 92);
static_assert(sizeof(CookiePacket) == 64);
static_assert(sizeof(DataHeader) == 16);

static constexpr size_t TagSize = 16;

static constexpr size_t transport_size(size_t ptext_size) {
    return sizeof(DataHeader) + ptext_size + TagSize;
}

// Transport packet split into its header and the authenticated ciphertext following it.
struct TransportPacket {
    const DataHeader *header;
    std::span<const uint8_t> ciphertext;
};

using DecodedPacket =
    std::variant<std::monostate, const Handshake1 *, const Handshake2 *, const CookiePacket *, TransportPacket>;

// Classifies a datagram by its leading type word. Anything malformed decodes to monostate.
DecodedPacket decode_packet(std::span<const uint8_t> in);

void calculate_mac1(const Key256 &pubkey, std::span<const uint8_t> payload, std::span<uint8_t, 16> out);
bool verify_mac1(const Key256 &pubkey, std::span<const uint8_t> payload, std::span<const uint8_t, 16> mac1);

} // namespace wgpeer::proto
