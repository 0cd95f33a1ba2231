#include "crypto/id.hpp"
#include "crypto/hash.hpp"

#include <array>
#include <sodium.h>
#include <stdexcept>

namespace fk::crypto {

namespace {
constexpr char ALPHABET[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr std::string_view PREFIX_CONTEXT = "fk/ns-prefix/v1";
}

std::string base32(const uint8_t* data, const size_t len) {
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t acc = 0;
    int bits = 0;
    for (size_t i = 0; i < len; ++i) {
        acc = (acc << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(ALPHABET[(acc >> bits) & 0x1F]);
        }
    }
    if (bits > 0) out.push_back(ALPHABET[(acc << (5 - bits)) & 0x1F]);
    return out;
}

std::string idPrefix(const std::string_view ns) {
    if (ns.empty()) throw std::invalid_argument("Id namespace must not be empty");
    hash::ensureSodium();

    std::array<uint8_t, 16> digest{};
    crypto_generichash_state st;
    if (crypto_generichash_init(&st, nullptr, 0, digest.size()) != 0)
        throw std::runtime_error("blake2b init failed");
    crypto_generichash_update(&st, reinterpret_cast<const unsigned char*>(PREFIX_CONTEXT.data()), PREFIX_CONTEXT.size());
    crypto_generichash_update(&st, reinterpret_cast<const unsigned char*>(ns.data()), ns.size());
    crypto_generichash_final(&st, digest.data(), digest.size());

    return base32(digest.data(), digest.size()).substr(0, ID_PREFIX_CHARS);
}

std::string makeId(const std::string_view ns) {
    auto prefix = idPrefix(ns);
    std::array<uint8_t, ID_RANDOM_BYTES> body{};
    randombytes_buf(body.data(), body.size());
    return prefix + "_" + base32(body.data(), body.size());
}

}
