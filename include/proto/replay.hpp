#pragma once

/* SPDX-License-Identifier: MIT
 *
 * Copyright (C) 2017-2023 WireGuard LLC. All Rights Reserved.
 */

#include <array>
#include <bit>
#include <climits>
#include <cstddef>
#include <cstdint>

namespace wgpeer::proto {

// Sliding window of received transport counters (RFC 6479 bitmap ring).
// Checking and marking are split so that a counter is only consumed once its packet authenticated.
template <size_t Size>
class ReplayWindow {
    using Block = uint64_t;
    static constexpr size_t BlockBits = sizeof(Block) * CHAR_BIT;
    static_assert(std::has_single_bit(Size) && Size > BlockBits);
    static constexpr size_t BlockBitLog = std::countr_zero(BlockBits);
    static constexpr size_t RingBlocks = Size / BlockBits;
    static constexpr uint64_t WindowSize = Size - BlockBits;

public:
    explicit ReplayWindow(uint64_t limit) noexcept : _limit(limit) {
        _ring.fill(0);
    }

    // true if the counter is acceptable: below the limit, inside the window and not yet seen
    bool check(uint64_t counter) const noexcept {
        if (counter >= _limit)
            return false;
        if (counter > _last)
            return true;
        if (_last - counter > WindowSize)
            return false;
        return !(_ring[block_of(counter)] & bit_of(counter));
    }

    // Records the counter. Returns false if it was not acceptable.
    bool mark(uint64_t counter) noexcept {
        if (!check(counter))
            return false;
        if (counter > _last) {
            auto current = _last >> BlockBitLog;
            auto target = counter >> BlockBitLog;
            auto advance = target - current;
            if (advance > RingBlocks)
                advance = RingBlocks;
            for (uint64_t i = 1; i <= advance; i++)
                _ring[(current + i) & (RingBlocks - 1)] = 0;
            _last = counter;
        }
        _ring[block_of(counter)] |= bit_of(counter);
        return true;
    }

    static constexpr uint64_t window_size() noexcept {
        return WindowSize;
    }

    void reset() noexcept {
        _ring.fill(0);
        _last = 0;
    }

private:
    static constexpr size_t block_of(uint64_t counter) noexcept {
        return static_cast<size_t>(counter >> BlockBitLog) & (RingBlocks - 1);
    }
    static constexpr Block bit_of(uint64_t counter) noexcept {
        return Block(1) << (counter & (BlockBits - 1));
    }

    std::array<Block, RingBlocks> _ring;
    uint64_t _last = 0;
    uint64_t _limit;
};

} // namespace wgpeer::proto
