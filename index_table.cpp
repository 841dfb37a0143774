#include <sodium.h>

#include "index_table.hpp"

namespace wgpeer {

uint32_t IndexTable::allocate(PeerId peer) {
    auto map = _map.synchronize();
    while (true) {
        uint32_t index = randombytes_random();
        if (!index)
            continue;
        auto [it, inserted] = map->emplace(index, peer);
        if (inserted)
            return index;
    }
}

std::optional<PeerId> IndexTable::find(uint32_t index) const {
    auto map = _map.synchronize();
    auto it = map->find(index);
    if (it == map->end())
        return std::nullopt;
    return it->second;
}

bool IndexTable::erase(uint32_t index) {
    auto map = _map.synchronize();
    return map->erase(index) > 0;
}

size_t IndexTable::erase_peer(PeerId peer) {
    auto map = _map.synchronize();
    size_t count = 0;
    for (auto it = map->begin(); it != map->end();) {
        if (it->second == peer) {
            it = map->erase(it);
            count++;
        } else {
            ++it;
        }
    }
    return count;
}

size_t IndexTable::size() const {
    return _map.synchronize()->size();
}

} // namespace wgpeer
