#include <algorithm>
#include <charconv>
#include <fstream>
#include <string_view>
#include <arpa/inet.h>
#include <sodium.h>

#include "config.hpp"

namespace wgpeer {

static std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string_view::npos)
        return {};
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

static Key256 parse_key(size_t lineno, const std::string &value) {
    Key256 key;
    if (!parse_keybytes(key.key, value.c_str()))
        throw ConfigError(lineno, "invalid key");
    return key;
}

static Endpoint parse_endpoint(size_t lineno, const std::string &value) {
    auto ep = parse_ipport(value.c_str());
    if (auto sin = std::get_if<sockaddr_in>(&ep))
        return *sin;
    else if (auto sin6 = std::get_if<sockaddr_in6>(&ep))
        return *sin6;
    else
        throw ConfigError(lineno, "invalid address " + value);
}

static unsigned int parse_number(size_t lineno, const std::string &value, unsigned int max) {
    unsigned int out = 0;
    auto res = std::from_chars(value.data(), value.data() + value.size(), out);
    if (res.ec != std::errc{} || res.ptr != value.data() + value.size() || out > max)
        throw ConfigError(lineno, "invalid number " + value);
    return out;
}

Config parse_config(std::istream &in) {
    Config config;
    std::string raw;
    size_t lineno = 0;
    while (std::getline(in, raw)) {
        lineno++;
        auto line = trim(raw);
        if (line.empty() || line.starts_with('#'))
            continue;
        auto eq = line.find('=');
        if (eq == std::string_view::npos)
            throw ConfigError(lineno, "expected key=value");
        auto key = std::string(trim(line.substr(0, eq)));
        auto value = std::string(trim(line.substr(eq + 1)));

        if (key == "private_key") {
            config.private_key = parse_key(lineno, value);
        } else if (key == "listen_address") {
            config.listen_address = parse_endpoint(lineno, value);
        } else if (key == "listen_port") {
            sockaddr_in sin{};
            sin.sin_family = AF_INET;
            sin.sin_addr.s_addr = htonl(INADDR_ANY);
            sin.sin_port = htons(static_cast<uint16_t>(parse_number(lineno, value, 65535)));
            config.listen_address = sin;
        } else if (key == "public_key") {
            auto pubkey = parse_key(lineno, value);
            if (std::any_of(config.peers.begin(), config.peers.end(), [&](const PeerConfig &p) {
                    return p.public_key == pubkey;
                }))
                throw ConfigError(lineno, "duplicate peer");
            config.peers.emplace_back();
            config.peers.back().public_key = pubkey;
        } else if (!config.peers.empty()) {
            auto &peer = config.peers.back();
            if (key == "preshared_key") {
                auto psk = parse_key(lineno, value);
                peer.preshared_key = std::to_array(psk.key);
                sodium_memzero(psk.key, sizeof(psk.key));
            } else if (key == "endpoint") {
                peer.endpoint = parse_endpoint(lineno, value);
            } else if (key == "persistent_keepalive_interval") {
                peer.persistent_keepalive_interval = parse_number(lineno, value, 65535);
            } else {
                throw ConfigError(lineno, "unknown key " + key);
            }
        } else if (key == "preshared_key" || key == "endpoint" || key == "persistent_keepalive_interval") {
            throw ConfigError(lineno, key + " before public_key");
        } else {
            throw ConfigError(lineno, "unknown key " + key);
        }
    }
    return config;
}

void validate_config(const Config &config) {
    if (!config.private_key)
        throw ConfigError(0, "missing private_key");
    if (sodium_is_zero(config.private_key->key, sizeof(config.private_key->key)))
        throw ConfigError(0, "private_key is zero");
    for (const auto &peer : config.peers) {
        if (!peer.preshared_key)
            throw ConfigError(0, "peer is missing preshared_key");
    }
}

Config load_config(const std::string &path) {
    std::ifstream in(path);
    if (!in)
        throw ConfigError(0, "cannot open " + path);
    return parse_config(in);
}

} // namespace wgpeer
