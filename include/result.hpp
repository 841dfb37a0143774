#pragma once

#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>
#include <boost/outcome.hpp>

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

namespace wgpeer {

// Per-packet and per-timer failures. None of these are fatal to the event loop.
enum class PeerError {
    // inbound packet references a session index we never handed out (or already reaped)
    UnknownSessionIndex = 1,
    // handshake message failed to parse or authenticate
    HandshakeFailed,
    // transport packet failed against both current and past sessions
    DecryptFailed,
    // required session slot is absent or no longer usable
    NoActiveSession,
    // a handshake for this peer is already in flight
    HandshakeInProgress,
    // datagram is too short, of unknown type, or of the wrong size for its type
    InvalidPacket,
    // packet must be sent but the peer has no known endpoint
    NoEndpoint,
};

struct PeerErrorCategory : public std::error_category {
    const char *name() const noexcept override {
        return "PeerError";
    }

    std::string message(int cond) const override;
};

const std::error_category &peer_category() noexcept;

static inline std::error_code make_error_code(PeerError e) noexcept {
    return std::error_code(static_cast<int>(e), peer_category());
}

static constexpr bool is_eagain(int e = errno) {
    return e == EAGAIN || e == EWOULDBLOCK;
}

static inline outcome::failure_type<std::error_code> fail(int e = errno) {
    return outcome::failure_type<std::error_code>(std::error_code(e, std::system_category()));
}

static inline outcome::failure_type<std::error_code> fail(PeerError e) {
    return outcome::failure_type<std::error_code>(make_error_code(e));
}

static inline outcome::failure_type<std::error_code> check_eagain(int e = errno, const char *what = nullptr) {
    if (is_eagain(e))
        return fail(e);
    else
        throw std::system_error(e, std::system_category(), what);
}

} // namespace wgpeer

namespace std {
template <>
struct is_error_code_enum<wgpeer::PeerError> : std::true_type {};
} // namespace std
