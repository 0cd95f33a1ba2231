#pragma once

#include <sodium.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fk::crypto::hash {

// Incremental BLAKE2b (libsodium generichash). Used as the fast content-identity digest.
class Blake2b {
public:
    static constexpr size_t DIGEST_BYTES = crypto_generichash_BYTES; // 32

    Blake2b();

    void update(const uint8_t* data, size_t len);

    // Returns the lower-case hex digest. May only be called once.
    [[nodiscard]] std::string finalHex();

private:
    crypto_generichash_state state_{};
    bool finalized_ = false;
};

// Incremental SHA-256. Used as the integrity checksum.
class Sha256 {
public:
    static constexpr size_t DIGEST_BYTES = crypto_hash_sha256_BYTES;

    Sha256();

    void update(const uint8_t* data, size_t len);

    [[nodiscard]] std::string finalHex();

private:
    crypto_hash_sha256_state state_{};
    bool finalized_ = false;
};

// sodium_init() once per process. Thread-safe.
void ensureSodium();

std::string toHex(const uint8_t* data, size_t len);

std::string blake2b(std::string_view data);
std::string blake2bFile(const std::filesystem::path& filepath);
std::string sha256(std::string_view data);

}
