#include <algorithm>
#include <cstring>
#include <catch2/catch_test_macros.hpp>
#include <sodium.h>

#include "keys.hpp"
#include "wgpeer.hpp"

using namespace wgpeer;

TEST_CASE("parse_keybytes") {
    uint8_t key[32];

    SECTION("hex") {
        REQUIRE(parse_keybytes(key, "000102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"));
        for (int i = 0; i < 32; i++)
            REQUIRE(key[i] == i);
    }

    SECTION("base64") {
        // same bytes as the hex case
        REQUIRE(parse_keybytes(key, "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8="));
        for (int i = 0; i < 32; i++)
            REQUIRE(key[i] == i);
        REQUIRE(parse_keybytes(key, "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8"));
        REQUIRE(key[31] == 31);
    }

    SECTION("invalid") {
        REQUIRE_FALSE(parse_keybytes(key, ""));
        REQUIRE_FALSE(parse_keybytes(key, "00"));
        REQUIRE_FALSE(parse_keybytes(key, "zz0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f"));
        REQUIRE_FALSE(parse_keybytes(key, "!!ECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8="));
    }
}

TEST_CASE("derive_public_key") {
    init_crypto();
    Key256 priv;
    randombytes_buf(&priv.key[0], sizeof(priv.key));
    auto pub = derive_public_key(priv);

    uint8_t expected[32];
    REQUIRE(crypto_scalarmult_base(expected, &priv.key[0]) == 0);
    REQUIRE(memcmp(expected, &pub.key[0], 32) == 0);
    REQUIRE(derive_public_key(priv) == pub);
}

TEST_CASE("Key256 ordering") {
    Key256 a{}, b{};
    b.key[31] = 1;
    REQUIRE(a < b);
    REQUIRE_FALSE(b < a);
    REQUIRE(a != b);
    b.key[31] = 0;
    REQUIRE(a == b);
    REQUIRE(hash_value(a) == hash_value(b));
}

TEST_CASE("KeyPair ids") {
    std::array<uint8_t, 32> bytes;
    bytes.fill(7);
    KeyPair kp;
    kp.send = Key(bytes, 0x11111111);
    kp.recv = Key(bytes, 0x22222222);
    REQUIRE(kp.local_id() == 0x22222222);
    REQUIRE(kp.remote_id() == 0x11111111);
    REQUIRE(kp.send.key == bytes);
    REQUIRE_FALSE(kp.send == kp.recv);

    Key copy = kp.recv;
    REQUIRE(copy == kp.recv);
}
