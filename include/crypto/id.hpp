#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace fk::crypto {

inline constexpr size_t ID_PREFIX_CHARS = 6;
inline constexpr size_t ID_RANDOM_BYTES = 16;

// Crockford Base32, upper case, no padding.
std::string base32(const uint8_t* data, size_t len);

// Stable per-namespace tag, e.g. every "files" id starts with the same six characters.
std::string idPrefix(std::string_view ns);

// "<prefix>_<26 chars of randomness>".
std::string makeId(std::string_view ns);

}
