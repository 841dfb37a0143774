#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "keys.hpp"
#include "endpoint.hpp"

namespace wgpeer {

struct PeerConfig {
    Key256 public_key = {};
    std::optional<PresharedKey> preshared_key;
    std::optional<Endpoint> endpoint;
    // seconds, 0 for the default keepalive interval
    unsigned int persistent_keepalive_interval = 0;
};

struct Config {
    std::optional<Key256> private_key;
    std::optional<Endpoint> listen_address;
    std::vector<PeerConfig> peers;
};

class ConfigError : public std::runtime_error {
public:
    ConfigError(size_t line, const std::string &what)
        : std::runtime_error(line ? "line " + std::to_string(line) + ": " + what : what), _line(line) {
    }

    // 1-based, 0 if the error is not tied to a line
    size_t line() const noexcept {
        return _line;
    }

private:
    size_t _line;
};

// Parses UAPI-style key=value lines. Throws ConfigError.
Config parse_config(std::istream &in);
// Checks what must hold before the event loop may start. Throws ConfigError.
void validate_config(const Config &config);
Config load_config(const std::string &path);

} // namespace wgpeer
