#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>

namespace fk::storage {

namespace fs = std::filesystem;

// Writable destination returned by Backend::create(). Bytes become visible at `path`
// only after commit(); a sink destroyed without commit() discards what was written.
class Sink {
public:
    virtual ~Sink() = default;

    virtual void write(const uint8_t* data, size_t len) = 0;

    virtual void commit() = 0;

    // Drops everything written so far. Safe to call more than once.
    virtual void abort() noexcept = 0;

    [[nodiscard]] virtual bool committed() const = 0;
};

struct Stat {
    uintmax_t size_bytes{};
};

class Backend {
public:
    virtual ~Backend() = default;

    // Sequential reader over a committed object. Throws std::runtime_error when missing.
    [[nodiscard]] virtual std::unique_ptr<std::istream> open(const fs::path& path) const = 0;

    [[nodiscard]] virtual std::unique_ptr<Sink> create(const fs::path& path) = 0;

    // Idempotent: removing a missing path is not an error. Throws on I/O failure.
    virtual void remove(const fs::path& path) = 0;

    [[nodiscard]] virtual std::optional<Stat> stat(const fs::path& path) const = 0;
};

}
