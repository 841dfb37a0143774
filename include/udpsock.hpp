#pragma once

#include <cstring>
#include <span>
#include <system_error>
#include <utility>
#include <variant>
#include <sys/socket.h>
#include <netinet/in.h>
#include <tdutil/fildes.hpp>

#include "endpoint.hpp"
#include "result.hpp"

namespace wgpeer {

class UdpServer {
public:
    UdpServer(const Endpoint &ep, bool nonblock) {
        sockaddr_in6 storage;
        auto len = endpoint_to_sockaddr(ep, storage);
        auto family = reinterpret_cast<const sockaddr *>(&storage)->sa_family;

        _sock = tdutil::FileDescriptor(socket(family, SOCK_DGRAM, 0));
        _sock.check();

        if (family == AF_INET6) {
            int v6only = 0;
            if (setsockopt(_sock, IPPROTO_IPV6, IPV6_V6ONLY, &v6only, sizeof(v6only)) < 0)
                throw std::system_error(errno, std::system_category(), "setsockopt(IPV6_V6ONLY)");
        }

        if (bind(_sock, reinterpret_cast<const sockaddr *>(&storage), len) < 0)
            throw std::system_error(errno, std::system_category(), "bind");

        if (nonblock)
            _sock.set_nonblock(true);
        _family = family;
    }

    constexpr tdutil::FileDescriptor &fd() {
        return _sock;
    }

    // Per-packet failures, EAGAIN included, are returned rather than thrown.
    outcome::result<size_t> send_to(const Endpoint &to, std::span<const uint8_t> data) {
        sockaddr_in6 storage;
        auto len = endpoint_to_sockaddr(map_family(to), storage);
        auto ret = sendto(_sock, data.data(), data.size(), 0, reinterpret_cast<const sockaddr *>(&storage), len);
        if (ret < 0)
            return fail(errno);
        return static_cast<size_t>(ret);
    }

    outcome::result<std::pair<size_t, Endpoint>> recv_from(std::span<uint8_t> buf) {
        sockaddr_in6 storage;
        socklen_t len = sizeof(storage);
        auto ret = recvfrom(_sock, buf.data(), buf.size(), 0, reinterpret_cast<sockaddr *>(&storage), &len);
        if (ret < 0)
            return fail(errno);
        return std::make_pair(static_cast<size_t>(ret), endpoint_from_sockaddr(reinterpret_cast<sockaddr *>(&storage), len));
    }

private:
    // an IPv6 socket reaches IPv4 peers through v4-mapped addresses
    Endpoint map_family(const Endpoint &to) const {
        auto sin = std::get_if<sockaddr_in>(&to);
        if (_family != AF_INET6 || !sin)
            return to;
        sockaddr_in6 sin6{};
        sin6.sin6_family = AF_INET6;
        sin6.sin6_port = sin->sin_port;
        sin6.sin6_addr.s6_addr[10] = 0xff;
        sin6.sin6_addr.s6_addr[11] = 0xff;
        memcpy(&sin6.sin6_addr.s6_addr[12], &sin->sin_addr, sizeof(sin->sin_addr));
        return sin6;
    }

    tdutil::FileDescriptor _sock;
    sa_family_t _family = AF_UNSPEC;
};

} // namespace wgpeer
