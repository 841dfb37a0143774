#include <algorithm>
#include <stdexcept>
#include <sodium.h>

#include "peer_table.hpp"

namespace wgpeer {

PeerEntry::~PeerEntry() {
    sodium_memzero(psk.data(), psk.size());
}

PeerEntry &PeerTable::add(const Key256 &pubkey, const PresharedKey &psk, long keepalive) {
    if (_by_pubkey.count(pubkey))
        throw std::invalid_argument("duplicate peer public key");
    auto id = _next_id++;
    auto entry = std::make_unique<PeerEntry>(id, pubkey, psk, keepalive);
    auto &ret = *entry;
    _peers.emplace(id, std::move(entry));
    _by_pubkey.emplace(pubkey, id);
    return ret;
}

bool PeerTable::remove(PeerId id) {
    auto it = _peers.find(id);
    if (it == _peers.end())
        return false;
    _by_pubkey.erase(it->second->pubkey);
    _peers.erase(it);
    return true;
}

PeerEntry *PeerTable::find(PeerId id) const {
    auto it = _peers.find(id);
    if (it == _peers.end())
        return nullptr;
    return it->second.get();
}

PeerEntry *PeerTable::find(const Key256 &pubkey) const {
    auto it = _by_pubkey.find(pubkey);
    if (it == _by_pubkey.end())
        return nullptr;
    return find(it->second);
}

std::vector<PeerId> PeerTable::ids() const {
    std::vector<PeerId> ret;
    ret.reserve(_peers.size());
    for (const auto &[id, entry] : _peers)
        ret.push_back(id);
    std::sort(ret.begin(), ret.end());
    return ret;
}

} // namespace wgpeer
