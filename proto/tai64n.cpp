#include <system_error>
#include <boost/endian/conversion.hpp>
#include <tdutil/time.hpp>

#include "tai64n.hpp"

using namespace boost::endian;
using namespace tdutil::operators;

namespace wgpeer::time {

static const uint64_t Tai64Base = 0x400000000000000aull;

TAI64N::TAI64N(const timespec &ts) {
    store_big_u64(&bytes[0], Tai64Base + static_cast<uint64_t>(ts.tv_sec));
    store_big_u32(&bytes[8], static_cast<uint32_t>(ts.tv_nsec));
}

TAI64NClock::TAI64NClock() {
    _realtime_origin = gettime(CLOCK_REALTIME);
    _mono_origin = gettime(CLOCK_MONOTONIC);
}

TAI64N TAI64NClock::get(const timespec &mono_now, bool whiten) const {
    auto time_now = _realtime_origin + (mono_now - _mono_origin);
    if (whiten)
        time_now.tv_nsec -= time_now.tv_nsec % 0x1000000l;
    return TAI64N(time_now);
}

} // namespace wgpeer::time
