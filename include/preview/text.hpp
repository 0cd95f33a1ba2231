#pragma once

#include <cstddef>
#include <istream>
#include <string>

namespace fk::preview::text {

inline constexpr size_t DEFAULT_EXCERPT_BYTES = 64 * 1024;

// Reads at most max_bytes and drops a trailing partial UTF-8 sequence.
std::string excerpt(std::istream& in, size_t max_bytes = DEFAULT_EXCERPT_BYTES);

}
