#pragma once

#include <cstdio>
#include <system_error>
#include <utility>
#include <fmt/format.h>

#if WGPEER_DEBUG
#define DBG_PRINT(...) fmt::print(stderr, __VA_ARGS__)
#else
#define DBG_PRINT(...)
#endif

namespace wgpeer {

// dropped packets and failed timer actions; always printed
template <typename... T>
static inline void warn_print(fmt::format_string<T...> f, T &&...args) {
    fmt::print(stderr, f, std::forward<T>(args)...);
}

static inline void warn_error(const char *what, const std::error_code &ec) {
    fmt::print(stderr, "{}: {} ({})\n", what, ec.message(), ec.category().name());
}

} // namespace wgpeer
