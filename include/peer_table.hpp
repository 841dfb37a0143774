#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <boost/unordered_map.hpp>
#include <boost/thread/synchronized_value.hpp>

#include "keys.hpp"
#include "endpoint.hpp"
#include "index_table.hpp"
#include "peer.hpp"

namespace wgpeer {

// Registry entry of one remote identity.
struct PeerEntry {
    PeerEntry(PeerId _id, const Key256 &_pubkey, const PresharedKey &_psk, long _keepalive)
        : id(_id), pubkey(_pubkey), psk(_psk), keepalive(_keepalive), state(Peer(_id)) {
    }
    PeerEntry(const PeerEntry &) = delete;
    PeerEntry &operator=(const PeerEntry &) = delete;
    ~PeerEntry();

    // readonly
    PeerId id;
    Key256 pubkey;
    PresharedKey psk;
    // keepalive interval in nanoseconds
    long keepalive;

    mutable boost::synchronized_value<Peer> state;
};

// Arena of peers addressed by PeerId, with a secondary lookup by public key.
// Owned by the orchestrator; not synchronized itself.
class PeerTable {
public:
    PeerTable() {
    }
    PeerTable(const PeerTable &) = delete;
    PeerTable &operator=(const PeerTable &) = delete;

    // throws std::invalid_argument if the key is already registered
    PeerEntry &add(const Key256 &pubkey, const PresharedKey &psk, long keepalive);
    // The caller is responsible for clearing the peer's indices beforehand.
    bool remove(PeerId id);

    PeerEntry *find(PeerId id) const;
    PeerEntry *find(const Key256 &pubkey) const;

    size_t size() const {
        return _peers.size();
    }
    std::vector<PeerId> ids() const;

private:
    PeerId _next_id = 1;
    boost::unordered_map<PeerId, std::unique_ptr<PeerEntry>> _peers;
    boost::unordered_map<Key256, PeerId> _by_pubkey;
};

} // namespace wgpeer
