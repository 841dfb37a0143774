#include <cstring>
#include <variant>
#include <arpa/inet.h>
#include <catch2/catch_test_macros.hpp>

#include "endpoint.hpp"

using namespace wgpeer;

TEST_CASE("parse_ipport") {
    SECTION("ipv4") {
        auto ep = parse_ipport("192.0.2.1:51820");
        auto sin = std::get_if<sockaddr_in>(&ep);
        REQUIRE(sin);
        REQUIRE(sin->sin_family == AF_INET);
        REQUIRE(ntohs(sin->sin_port) == 51820);
        REQUIRE(ntohl(sin->sin_addr.s_addr) == 0xc0000201);
    }

    SECTION("ipv6") {
        auto ep = parse_ipport("[2001:db8::1]:443");
        auto sin6 = std::get_if<sockaddr_in6>(&ep);
        REQUIRE(sin6);
        REQUIRE(sin6->sin6_family == AF_INET6);
        REQUIRE(ntohs(sin6->sin6_port) == 443);
        REQUIRE(sin6->sin6_addr.s6_addr[0] == 0x20);
        REQUIRE(sin6->sin6_addr.s6_addr[15] == 1);
    }

    SECTION("invalid") {
        REQUIRE(std::holds_alternative<std::monostate>(parse_ipport("")));
        REQUIRE(std::holds_alternative<std::monostate>(parse_ipport("192.0.2.1")));
        REQUIRE(std::holds_alternative<std::monostate>(parse_ipport("192.0.2.256:1")));
        REQUIRE(std::holds_alternative<std::monostate>(parse_ipport("192.0.2.1:0")));
        REQUIRE(std::holds_alternative<std::monostate>(parse_ipport("192.0.2.1:70000")));
        REQUIRE(std::holds_alternative<std::monostate>(parse_ipport("2001:db8::1:80")));
        REQUIRE(std::holds_alternative<std::monostate>(parse_ipport("[2001:db8::1]")));
        REQUIRE(std::holds_alternative<std::monostate>(parse_ipport("example.com:80")));
    }
}

TEST_CASE("endpoint_from_sockaddr folds v4-mapped addresses") {
    sockaddr_in6 sin6{};
    sin6.sin6_family = AF_INET6;
    sin6.sin6_port = htons(1234);
    REQUIRE(inet_pton(AF_INET6, "::ffff:198.51.100.7", &sin6.sin6_addr) == 1);

    auto ep = endpoint_from_sockaddr(reinterpret_cast<const sockaddr *>(&sin6), sizeof(sin6));
    auto sin = std::get_if<sockaddr_in>(&ep);
    REQUIRE(sin);
    REQUIRE(ntohs(sin->sin_port) == 1234);
    REQUIRE(format_endpoint(ep) == "198.51.100.7:1234");

    REQUIRE(inet_pton(AF_INET6, "2001:db8::7", &sin6.sin6_addr) == 1);
    ep = endpoint_from_sockaddr(reinterpret_cast<const sockaddr *>(&sin6), sizeof(sin6));
    REQUIRE(std::holds_alternative<sockaddr_in6>(ep));
    REQUIRE(format_endpoint(ep) == "[2001:db8::7]:1234");
}

TEST_CASE("endpoint_to_sockaddr") {
    Endpoint ep = std::get<sockaddr_in>(parse_ipport("10.1.2.3:9"));
    sockaddr_in6 storage;
    REQUIRE(endpoint_to_sockaddr(ep, storage) == sizeof(sockaddr_in));
    sockaddr_in sin;
    memcpy(&sin, &storage, sizeof(sin));
    REQUIRE(Endpoint(sin) == ep);

    Endpoint ep6 = std::get<sockaddr_in6>(parse_ipport("[::1]:9"));
    REQUIRE(endpoint_to_sockaddr(ep6, storage) == sizeof(sockaddr_in6));
    REQUIRE(Endpoint(storage) == ep6);
    REQUIRE_FALSE(ep == ep6);
    REQUIRE(hash_value(ep) != hash_value(ep6));
}
