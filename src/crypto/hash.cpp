#include "crypto/hash.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fk::crypto::hash {

void ensureSodium() {
    static const int ready = [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)ready;
}

Blake2b::Blake2b() {
    ensureSodium();
    if (crypto_generichash_init(&state_, nullptr, 0, DIGEST_BYTES) != 0)
        throw std::runtime_error("blake2b init failed");
}

void Blake2b::update(const uint8_t* data, const size_t len) {
    if (finalized_) throw std::logic_error("blake2b update after final");
    crypto_generichash_update(&state_, data, len);
}

std::string Blake2b::finalHex() {
    if (finalized_) throw std::logic_error("blake2b finalized twice");
    std::array<uint8_t, DIGEST_BYTES> out{};
    crypto_generichash_final(&state_, out.data(), out.size());
    finalized_ = true;
    return toHex(out.data(), out.size());
}

Sha256::Sha256() {
    ensureSodium();
    crypto_hash_sha256_init(&state_);
}

void Sha256::update(const uint8_t* data, const size_t len) {
    if (finalized_) throw std::logic_error("sha256 update after final");
    crypto_hash_sha256_update(&state_, data, len);
}

std::string Sha256::finalHex() {
    if (finalized_) throw std::logic_error("sha256 finalized twice");
    std::array<uint8_t, DIGEST_BYTES> out{};
    crypto_hash_sha256_final(&state_, out.data());
    finalized_ = true;
    return toHex(out.data(), out.size());
}

std::string toHex(const uint8_t* data, const size_t len) {
    std::ostringstream result;
    for (size_t i = 0; i < len; ++i)
        result << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    return result.str();
}

std::string blake2b(const std::string_view data) {
    Blake2b h;
    h.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return h.finalHex();
}

std::string blake2bFile(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    Blake2b h;
    char buffer[8192];
    while (file.good()) {
        file.read(buffer, sizeof(buffer));
        h.update(reinterpret_cast<const uint8_t*>(buffer), static_cast<size_t>(file.gcount()));
    }
    return h.finalHex();
}

std::string sha256(const std::string_view data) {
    Sha256 h;
    h.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return h.finalHex();
}

}
