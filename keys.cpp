#include <cstring>
#include <stdexcept>
#include <string_view>
#include <boost/algorithm/hex.hpp>
#include <sodium.h>

#include "keys.hpp"

namespace wgpeer {

bool parse_keybytes(uint8_t (&key)[32], const char *str) { // NOLINT(cppcoreguidelines-avoid-c-arrays)
    auto s = std::string_view(str);
    switch (s.length()) {
    case 64:
        try {
            return boost::algorithm::unhex(s.begin(), s.end(), std::begin(key)) == std::end(key);
        } catch (const boost::algorithm::hex_decode_error &) {
            return false;
        }
    case 43:
    case 44: {
        size_t written = 0;
        if (sodium_base642bin(
                &key[0],
                std::size(key),
                s.data(),
                s.size(),
                nullptr,
                &written,
                nullptr,
                s.length() == 44 ? sodium_base64_VARIANT_ORIGINAL : sodium_base64_VARIANT_ORIGINAL_NO_PADDING) < 0)
            return false;
        return written == 32;
    }
    default:
        return false;
    }
}

Key256 derive_public_key(const Key256 &privkey) {
    Key256 pubkey;
    if (crypto_scalarmult_base(&pubkey.key[0], &privkey.key[0]) < 0)
        throw std::invalid_argument("cannot derive public key");
    return pubkey;
}

} // namespace wgpeer
