#pragma once

#include <cerrno>
#include <csignal>
#include <stdexcept>
#include <system_error>
#include <noise/protocol.h>
#include <sodium.h>

#include "proto.hpp"

namespace wgpeer {

// Must run once before any key or handshake operation.
static inline void init_crypto() {
    if (sodium_init() < 0)
        throw std::runtime_error("sodium_init");
    auto err = noise_init();
    if (err != NOISE_ERROR_NONE)
        throw std::system_error(err, proto::noise_category(), "noise_init");
}

static inline void make_exit_sigset(sigset_t &sigs) {
    if (sigemptyset(&sigs) < 0 || sigaddset(&sigs, SIGINT) < 0 || sigaddset(&sigs, SIGTERM) < 0)
        throw std::system_error(errno, std::system_category(), "sigset");
}

} // namespace wgpeer
