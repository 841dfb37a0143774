#include <regex>
#include <string>
#include <stdexcept>
#include <arpa/inet.h>
#include <boost/endian/conversion.hpp>
#include <fmt/format.h>

#include "endpoint.hpp"

using namespace boost::endian;

namespace wgpeer {

std::variant<std::monostate, sockaddr_in, sockaddr_in6> parse_ipport(const char *str) {
    std::string input(str);
    std::regex pattern4("([0-9.]+):([0-9]{1,5})");
    std::regex pattern6("\\[([0-9a-f:.]+)\\]:([0-9]{1,5})", std::regex::icase);
    std::smatch match;
    if (std::regex_match(input, match, pattern4)) {
        sockaddr_in sin{};
        sin.sin_family = AF_INET;
        auto ip = match[1].str();
        if (inet_pton(AF_INET, ip.c_str(), &sin.sin_addr) > 0) {
            auto port = std::stoul(match[2].str());
            if (port > 0 && port <= UINT16_MAX) {
                sin.sin_port = native_to_big(static_cast<uint16_t>(port));
                return sin;
            }
        }
    } else if (std::regex_match(input, match, pattern6)) {
        sockaddr_in6 sin6{};
        sin6.sin6_family = AF_INET6;
        auto ip = match[1].str();
        if (inet_pton(AF_INET6, ip.c_str(), &sin6.sin6_addr) > 0) {
            auto port = std::stoul(match[2].str());
            if (port > 0 && port <= UINT16_MAX) {
                sin6.sin6_port = native_to_big(static_cast<uint16_t>(port));
                return sin6;
            }
        }
    }
    return {};
}

Endpoint endpoint_from_sockaddr(const sockaddr *sa, socklen_t len) {
    if (sa->sa_family == AF_INET && len >= sizeof(sockaddr_in)) {
        sockaddr_in sin{};
        memcpy(&sin, sa, sizeof(sin));
        return sin;
    } else if (sa->sa_family == AF_INET6 && len >= sizeof(sockaddr_in6)) {
        sockaddr_in6 sin6{};
        memcpy(&sin6, sa, sizeof(sin6));
        if (IN6_IS_ADDR_V4MAPPED(&sin6.sin6_addr)) {
            sockaddr_in sin{};
            sin.sin_family = AF_INET;
            sin.sin_port = sin6.sin6_port;
            memcpy(&sin.sin_addr, &sin6.sin6_addr.s6_addr[12], sizeof(sin.sin_addr));
            return sin;
        }
        return sin6;
    } else {
        throw std::invalid_argument("unsupported address family");
    }
}

socklen_t endpoint_to_sockaddr(const Endpoint &ep, sockaddr_in6 &storage) {
    memset(&storage, 0, sizeof(storage));
    if (auto sin = std::get_if<sockaddr_in>(&ep)) {
        memcpy(&storage, sin, sizeof(*sin));
        return sizeof(sockaddr_in);
    } else {
        storage = std::get<sockaddr_in6>(ep);
        return sizeof(sockaddr_in6);
    }
}

std::string format_endpoint(const Endpoint &ep) {
    char buf[INET6_ADDRSTRLEN] = {0}; // NOLINT(cppcoreguidelines-avoid-c-arrays)
    if (auto sin = std::get_if<sockaddr_in>(&ep)) {
        inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        return fmt::format("{}:{}", buf, big_to_native(sin->sin_port));
    } else {
        auto &sin6 = std::get<sockaddr_in6>(ep);
        inet_ntop(AF_INET6, &sin6.sin6_addr, buf, sizeof(buf));
        return fmt::format("[{}]:{}", buf, big_to_native(sin6.sin6_port));
    }
}

} // namespace wgpeer
