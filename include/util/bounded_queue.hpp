#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <utility>

namespace wgpeer {

// FIFO that refuses new items once Capacity are queued.
// Producers are expected to hold back (stop polling their source) rather than drop.
template <typename T, size_t Capacity = 1024>
class BoundedQueue {
public:
    static constexpr size_t capacity() {
        return Capacity;
    }

    bool try_push(T &&item) {
        if (full())
            return false;
        _items.push_back(std::move(item));
        return true;
    }

    template <typename... Args>
    bool try_emplace(Args &&...args) {
        if (full())
            return false;
        _items.emplace_back(std::forward<Args>(args)...);
        return true;
    }

    // Makes room by dropping the oldest item. Returns false if one was dropped.
    template <typename... Args>
    bool emplace_evict(Args &&...args) {
        bool kept = !full();
        if (!kept)
            _items.pop_front();
        _items.emplace_back(std::forward<Args>(args)...);
        return kept;
    }

    T &front() {
        return _items.front();
    }

    std::optional<T> try_pop() {
        if (_items.empty())
            return std::nullopt;
        std::optional<T> ret(std::move(_items.front()));
        _items.pop_front();
        return ret;
    }

    bool full() const {
        return _items.size() >= Capacity;
    }
    bool empty() const {
        return _items.empty();
    }
    size_t size() const {
        return _items.size();
    }
    void clear() {
        _items.clear();
    }

private:
    std::deque<T> _items;
};

} // namespace wgpeer
