#pragma once

#include <array>
#include <cerrno>
#include <compare>
#include <cstdint>
#include <limits>
#include <system_error>
#include <time.h>

namespace wgpeer::time {

static constexpr uint64_t to_time(const timespec &ts) {
    return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000 + static_cast<uint64_t>(ts.tv_nsec);
}

static constexpr timespec to_timespec(uint64_t tm) {
    return timespec{
        static_cast<time_t>(tm / 1'000'000'000),
        static_cast<long>(tm % 1'000'000'000),
    };
}

// minimum valid timespec
static constexpr timespec timespec_min() {
    return {0, 0};
}

// maximum valid timespec
static constexpr timespec timespec_max() {
    return {std::numeric_limits<decltype(timespec::tv_sec)>::max(), 999999999};
}

static inline timespec gettime(clockid_t clockid) {
    timespec res;
    if (clock_gettime(clockid, &res) < 0)
        throw std::system_error(errno, std::system_category(), "clock_gettime");
    return res;
}

static inline uint64_t gettime64(clockid_t clockid) {
    return to_time(gettime(clockid));
}

// 12-byte external TAI64N label, big-endian seconds (offset by 2^62 + 10) then nanoseconds.
// Byte order makes lexicographic comparison equal to time order.
struct TAI64N {
    std::array<uint8_t, 12> bytes = {0};

    TAI64N() {
    }
    explicit TAI64N(const timespec &ts);
};

static inline auto operator<=>(const TAI64N &a, const TAI64N &b) noexcept {
    return a.bytes <=> b.bytes;
}

static inline bool operator==(const TAI64N &a, const TAI64N &b) noexcept {
    return a.bytes == b.bytes;
}

// Wall-clock timestamps anchored once at construction and advanced by CLOCK_MONOTONIC,
// so initiation timestamps never go backwards when the wall clock is stepped.
class TAI64NClock {
public:
    TAI64NClock();
    TAI64N get(const timespec &mono_now, bool whiten = false) const;

private:
    timespec _realtime_origin, _mono_origin;
};

} // namespace wgpeer::time
