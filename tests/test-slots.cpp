#include <array>
#include <optional>
#include <set>
#include <vector>
#include <noise/protocol.h>
#include <catch2/catch_test_macros.hpp>

#include "peer.hpp"
#include "index_table.hpp"
#include "loopback.hpp"

using namespace wgpeer;
using namespace wgpeer::proto;
using namespace wgpeer::test;

// Runs both legs and returns the initiator's side, ready to split.
static Handshake finished_handshake() {
    test_init();
    auto ipriv = random_key(), rpriv = random_key();
    auto rpub = derive_public_key(rpriv);
    PresharedKey psk = {0};
    auto init = Handshake::create(NOISE_ROLE_INITIATOR, ipriv, &rpub, psk).value();
    auto resp = Handshake::create(NOISE_ROLE_RESPONDER, rpriv, nullptr, psk).value();
    Handshake1 hs1;
    REQUIRE(init.write_initiation(hs1, 1, time::TAI64N(timespec{1, 0})).has_value());
    REQUIRE(resp.read_initiation(hs1).has_value());
    Handshake2 hs2;
    REQUIRE(resp.write_response(hs2, 2, 1).has_value());
    REQUIRE(init.read_response(hs2).has_value());
    return init;
}

// Responder side after writing its response.
static Handshake finished_response() {
    test_init();
    auto ipriv = random_key(), rpriv = random_key();
    auto rpub = derive_public_key(rpriv);
    PresharedKey psk = {0};
    auto init = Handshake::create(NOISE_ROLE_INITIATOR, ipriv, &rpub, psk).value();
    auto resp = Handshake::create(NOISE_ROLE_RESPONDER, rpriv, nullptr, psk).value();
    Handshake1 hs1;
    REQUIRE(init.write_initiation(hs1, 1, time::TAI64N(timespec{1, 0})).has_value());
    REQUIRE(resp.read_initiation(hs1).has_value());
    Handshake2 hs2;
    REQUIRE(resp.write_response(hs2, 2, 1).has_value());
    return resp;
}

static Handshake fresh_handshake() {
    test_init();
    auto priv = random_key(), remote = derive_public_key(random_key());
    PresharedKey psk = {0};
    return Handshake::create(NOISE_ROLE_INITIATOR, priv, &remote, psk).value();
}

TEST_CASE("index table") {
    test_init();
    IndexTable indices;
    std::set<uint32_t> seen;
    for (int i = 0; i < 1000; i++) {
        auto index = indices.allocate(i % 3);
        REQUIRE(index != 0);
        REQUIRE(seen.insert(index).second);
    }
    REQUIRE(indices.size() == 1000);

    auto first = *seen.begin();
    auto owner = indices.find(first);
    REQUIRE(owner);
    REQUIRE(indices.erase(first));
    REQUIRE_FALSE(indices.erase(first));
    REQUIRE_FALSE(indices.find(first));

    auto removed = indices.erase_peer(*owner);
    REQUIRE(indices.size() == 999 - removed);
    for (auto index : seen)
        if (auto found = indices.find(index))
            REQUIRE(*found != *owner);
}

TEST_CASE("empty peer slots") {
    Peer peer(1);
    auto next = peer.next();
    REQUIRE(next.has_error());
    REQUIRE(next.error() == PeerError::NoActiveSession);
    REQUIRE(peer.current().error() == PeerError::NoActiveSession);
    REQUIRE(peer.past().error() == PeerError::NoActiveSession);
    REQUIRE_FALSE(peer.has_session());

    IndexTable indices;
    auto done = peer.complete_handshake(indices, at_seconds(0));
    REQUIRE(done.has_error());
    REQUIRE(done.error() == PeerError::NoActiveSession);
    REQUIRE_FALSE(peer.abandon_handshake(indices));
}

TEST_CASE("next slot") {
    IndexTable indices;
    Peer peer(7);
    auto now = at_seconds(0);

    auto first = peer.begin_handshake(indices, HandshakeRole::Initiator, fresh_handshake(), now);
    REQUIRE(first.has_value());
    REQUIRE(indices.find(first.value()) == std::optional<PeerId>(7));

    SECTION("second attempt is refused and the first survives") {
        auto second = peer.begin_handshake(indices, HandshakeRole::Initiator, fresh_handshake(), now);
        REQUIRE(second.has_error());
        REQUIRE(second.error() == PeerError::HandshakeInProgress);
        REQUIRE(peer.next().value()->local_index == first.value());
        REQUIRE(peer.next().value()->handshake.exists());
        REQUIRE(indices.size() == 1);
    }

    SECTION("supersede") {
        auto second = peer.begin_handshake(indices, HandshakeRole::Responder, fresh_handshake(), now, true);
        REQUIRE(second.has_value());
        REQUIRE(second.value() != first.value());
        REQUIRE(peer.next().value()->role == HandshakeRole::Responder);
        REQUIRE_FALSE(indices.find(first.value()));
        REQUIRE(indices.size() == 1);
    }

    SECTION("expired attempt is replaced") {
        auto later = at_seconds(RekeyTimeout / OneSecond + 1);
        REQUIRE(peer.next().value()->expired(later));
        auto second = peer.begin_handshake(indices, HandshakeRole::Initiator, fresh_handshake(), later);
        REQUIRE(second.has_value());
        REQUIRE_FALSE(indices.find(first.value()));
        REQUIRE(indices.size() == 1);
    }

    SECTION("abandon") {
        REQUIRE(peer.abandon_handshake(indices));
        REQUIRE(peer.next().has_error());
        REQUIRE(indices.size() == 0);
    }

    SECTION("incomplete handshake cannot be finalized") {
        auto done = peer.complete_handshake(indices, now);
        REQUIRE(done.has_error());
        REQUIRE(peer.next().has_value());
    }
}

TEST_CASE("slot rotation") {
    IndexTable indices;
    Peer peer(3);
    std::vector<uint32_t> ids;

    for (int i = 0; i < 3; i++) {
        auto now = at_seconds(i * 10);
        auto index = peer.begin_handshake(indices, HandshakeRole::Initiator, finished_handshake(), now);
        REQUIRE(index.has_value());
        peer.next().value()->remote_index = 1000 + i;
        auto session = peer.complete_handshake(indices, now);
        REQUIRE(session.has_value());
        REQUIRE(session.value()->local_id() == index.value());
        REQUIRE(session.value()->remote_id() == static_cast<uint32_t>(1000 + i));
        REQUIRE(peer.next().has_error());
        ids.push_back(index.value());
    }

    REQUIRE(peer.current().value()->local_id() == ids[2]);
    REQUIRE(peer.past().value()->local_id() == ids[1]);
    // the session rotated out of past loses its index
    REQUIRE_FALSE(indices.find(ids[0]));
    REQUIRE(indices.find(ids[1]));
    REQUIRE(indices.find(ids[2]));
    REQUIRE(indices.size() == 2);

    SECTION("expire") {
        // past was born at 10s, current at 20s
        REQUIRE(peer.expire_sessions(indices, at_seconds(10 + RejectAfterTime / OneSecond + 1), RejectAfterTime));
        REQUIRE(peer.past().has_error());
        REQUIRE(peer.current().has_value());
        REQUIRE(indices.size() == 1);
        REQUIRE_FALSE(peer.expire_sessions(indices, at_seconds(20 + RejectAfterTime / OneSecond + 1), RejectAfterTime));
        REQUIRE(indices.size() == 0);
    }

    SECTION("clear") {
        REQUIRE(peer.begin_handshake(indices, HandshakeRole::Initiator, fresh_handshake(), at_seconds(30)).has_value());
        std::array<uint8_t, 3> pkt = {1, 2, 3};
        peer.stage(pkt);
        peer.attempt_begin = at_seconds(30);
        peer.clear(indices);
        REQUIRE(indices.size() == 0);
        REQUIRE_FALSE(peer.has_session());
        REQUIRE(peer.next().has_error());
        REQUIRE(peer.staged() == 0);
        REQUIRE_FALSE(peer.attempt_begin);
    }
}

TEST_CASE("responder session is held in next") {
    IndexTable indices;
    Peer peer(5);
    auto now = at_seconds(0);
    auto first = peer.begin_handshake(indices, HandshakeRole::Initiator, finished_handshake(), now).value();
    REQUIRE(peer.complete_handshake(indices, now).has_value());

    auto later = at_seconds(10);
    auto index = peer.begin_handshake(indices, HandshakeRole::Responder, finished_response(), later);
    REQUIRE(index.has_value());
    peer.next().value()->remote_index = 77;
    REQUIRE(peer.unconfirmed().has_error());

    auto session = peer.prepare_session(later);
    REQUIRE(session.has_value());
    REQUIRE(session.value()->local_id() == index.value());
    REQUIRE(session.value()->remote_id() == 77);
    REQUIRE_FALSE(session.value()->initiator());
    REQUIRE(peer.prepare_session(later).value() == session.value());
    REQUIRE(peer.unconfirmed().value() == session.value());
    REQUIRE(peer.current().value()->local_id() == first);
    REQUIRE(peer.past().has_error());
    REQUIRE(indices.size() == 2);

    SECTION("confirmed") {
        auto done = peer.complete_handshake(indices, at_seconds(11));
        REQUIRE(done.has_value());
        REQUIRE(done.value() == session.value());
        REQUIRE(peer.current().value() == session.value());
        REQUIRE(peer.past().value()->local_id() == first);
        REQUIRE(peer.next().has_error());
        REQUIRE(peer.unconfirmed().has_error());
        REQUIRE(indices.size() == 2);
    }

    SECTION("abandoned") {
        REQUIRE(peer.abandon_handshake(indices));
        REQUIRE(peer.unconfirmed().has_error());
        REQUIRE_FALSE(indices.find(index.value()));
        REQUIRE(peer.current().value()->local_id() == first);
        REQUIRE(indices.size() == 1);
    }
}

TEST_CASE("staging drops the oldest packet") {
    Peer peer(1);
    for (size_t i = 0; i < Peer::MaxStaged; i++) {
        std::array<uint8_t, 1> pkt = {static_cast<uint8_t>(i)};
        REQUIRE(peer.stage(pkt));
    }
    std::array<uint8_t, 1> extra = {0xff};
    REQUIRE_FALSE(peer.stage(extra));
    REQUIRE(peer.staged() == Peer::MaxStaged);

    auto staged = peer.take_staged();
    REQUIRE(peer.staged() == 0);
    REQUIRE(staged.size() == Peer::MaxStaged);
    REQUIRE(staged.front()[0] == 1);
    REQUIRE(staged.back()[0] == 0xff);
}
