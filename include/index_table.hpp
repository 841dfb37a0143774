#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <boost/unordered_map.hpp>
#include <boost/thread/synchronized_value.hpp>

namespace wgpeer {

// Stable handle of a peer in the registry.
using PeerId = uint32_t;

// Maps locally chosen session indices to the peer owning them.
// A peer holds one entry per live slot (next, current, past).
class IndexTable {
public:
    IndexTable() {
    }
    IndexTable(const IndexTable &) = delete;
    IndexTable &operator=(const IndexTable &) = delete;

    // Picks a random, nonzero index not already in use and binds it to peer.
    uint32_t allocate(PeerId peer);
    std::optional<PeerId> find(uint32_t index) const;
    bool erase(uint32_t index);
    size_t erase_peer(PeerId peer);
    size_t size() const;

private:
    mutable boost::synchronized_value<boost::unordered_map<uint32_t, PeerId>> _map;
};

} // namespace wgpeer
