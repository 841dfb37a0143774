#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstddef>
#include <iterator>
#include <span>
#include <time.h>
#include <sodium/utils.h>
#include <xxhash.h>

namespace wgpeer {

// NOLINTBEGIN(cppcoreguidelines-avoid-c-arrays)

// Static X25519 key. Public keys double as peer identities.
struct Key256 {
    uint8_t key[32];
};

bool parse_keybytes(uint8_t (&key)[32], const char *str);

// NOLINTEND(cppcoreguidelines-avoid-c-arrays)

Key256 derive_public_key(const Key256 &privkey);

static constexpr bool operator==(const Key256 &a, const Key256 &b) noexcept {
    return std::equal(std::begin(a.key), std::end(a.key), std::begin(b.key));
}

static constexpr auto operator<=>(const Key256 &a, const Key256 &b) noexcept {
    return std::lexicographical_compare_three_way(
        std::begin(a.key),
        std::end(a.key),
        std::begin(b.key),
        std::end(b.key));
}

static inline size_t hash_value(const Key256 &a) noexcept {
    return XXH3_64bits(&a.key[0], sizeof(a.key));
}

using PresharedKey = std::array<uint8_t, 32>;

// Symmetric session key plus the session index it authenticates.
// The key bytes are wiped when the object dies.
struct Key {
    Key() {
    }
    Key(std::span<const uint8_t> bytes, uint32_t _id) : id(_id) {
        std::copy_n(bytes.begin(), std::min(bytes.size(), key.size()), key.begin());
    }
    Key(const Key &) = default;
    Key &operator=(const Key &) = default;
    ~Key() {
        sodium_memzero(key.data(), key.size());
    }

    std::array<uint8_t, 32> key = {0};
    uint32_t id = 0;
};

// Test helper only; protocol logic never compares keys.
static inline bool operator==(const Key &a, const Key &b) noexcept {
    return a.id == b.id && sodium_memcmp(a.key.data(), b.key.data(), a.key.size()) == 0;
}

struct KeyPair {
    // CLOCK_MONOTONIC time of creation
    timespec birth = {0, 0};
    // whether we sent the initiation that produced this pair
    bool initiator = false;
    // key for outbound messages; id is the remote peer's session index
    Key send;
    // key for inbound messages; id is our session index
    Key recv;

    uint32_t local_id() const {
        return recv.id;
    }
    uint32_t remote_id() const {
        return send.id;
    }
};

} // namespace wgpeer

namespace std {
template <>
struct hash<wgpeer::Key256> {
    size_t operator()(const wgpeer::Key256 &a) const noexcept {
        return XXH3_64bits(&a.key[0], sizeof(a.key));
    }
};
} // namespace std
