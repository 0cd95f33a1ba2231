#pragma once

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fk::files {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ValidationError : Error {
    using Error::Error;
};

struct SizeLimitExceeded : Error {
    SizeLimitExceeded(const uintmax_t limit, const uintmax_t observed)
        : Error("File size exceeds limit of " + std::to_string(limit) + " bytes (read " +
                std::to_string(observed) + ")"),
          limit(limit), observed(observed) {}

    uintmax_t limit, observed;
};

struct Cancelled : Error {
    using Error::Error;
};

struct IOError : Error {
    using Error::Error;
};

struct ThreatDetected : Error {
    explicit ThreatDetected(std::vector<std::string> found)
        : Error(fmt::format("Threat detected: {}", fmt::join(found, ", "))), threats(std::move(found)) {}

    std::vector<std::string> threats;
};

struct NotFound : Error {
    using Error::Error;
};

struct NotReady : Error {
    using Error::Error;
};

struct InvalidTransition : Error {
    using Error::Error;
};

// Command-line mapping: rejected requests exit 4, missing records 3, everything else EXIT_FAILURE.
struct ExitStatus {
    int code;
    const char* error;
};

inline ExitStatus exitStatusFor(const std::exception& e) {
    if (dynamic_cast<const NotFound*>(&e)) return {3, "not_found"};
    if (dynamic_cast<const IOError*>(&e)) return {EXIT_FAILURE, "failed"};
    if (dynamic_cast<const Error*>(&e)) return {4, "rejected"};
    return {EXIT_FAILURE, "failed"};
}

}
