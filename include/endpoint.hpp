#pragma once

#include <compare>
#include <cstring>
#include <cstddef>
#include <string>
#include <utility>
#include <variant>
#include <sys/socket.h>
#include <netinet/in.h>
#include <xxhash.h>

static inline bool operator==(const sockaddr_in &a, const sockaddr_in &b) noexcept {
    return a.sin_family == b.sin_family && a.sin_port == b.sin_port && a.sin_addr.s_addr == b.sin_addr.s_addr;
}

static inline bool operator==(const sockaddr_in6 &a, const sockaddr_in6 &b) noexcept {
    return a.sin6_family == b.sin6_family && a.sin6_port == b.sin6_port &&
           !memcmp(&a.sin6_addr, &b.sin6_addr, sizeof(a.sin6_addr)) && a.sin6_scope_id == b.sin6_scope_id;
}

namespace wgpeer {

// Network address of a peer, as seen on the datagram transport.
using Endpoint = std::variant<sockaddr_in, sockaddr_in6>;

static inline bool operator==(const Endpoint &a, const Endpoint &b) noexcept {
    if (a.index() != b.index())
        return false;
    if (auto sina = std::get_if<sockaddr_in>(&a))
        return *sina == std::get<sockaddr_in>(b);
    else
        return std::get<sockaddr_in6>(a) == std::get<sockaddr_in6>(b);
}

// "ip:port" or "[ip6]:port"; returns monostate if unparsable
std::variant<std::monostate, sockaddr_in, sockaddr_in6> parse_ipport(const char *str);

// v4-mapped IPv6 sources are folded back to plain IPv4
Endpoint endpoint_from_sockaddr(const sockaddr *sa, socklen_t len);

// returns the socklen to pass alongside the pointer
socklen_t endpoint_to_sockaddr(const Endpoint &ep, sockaddr_in6 &storage);

std::string format_endpoint(const Endpoint &ep);

static inline size_t hash_value(const Endpoint &a) noexcept {
    if (auto sin = std::get_if<sockaddr_in>(&a))
        return XXH3_64bits(sin, offsetof(sockaddr_in, sin_zero));
    else
        return XXH3_64bits(&std::get<sockaddr_in6>(a), sizeof(sockaddr_in6));
}

} // namespace wgpeer

namespace std {
template <>
struct hash<wgpeer::Endpoint> {
    size_t operator()(const wgpeer::Endpoint &a) const noexcept {
        return wgpeer::hash_value(a);
    }
};
} // namespace std
