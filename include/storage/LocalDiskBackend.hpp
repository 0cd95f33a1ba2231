#pragma once

#include "storage/Backend.hpp"

namespace fk::storage {

// Plain local filesystem. Sinks write to "<dir>/.<name>.part-<suffix>" and rename on commit.
class LocalDiskBackend final : public Backend {
public:
    LocalDiskBackend() = default;

    [[nodiscard]] std::unique_ptr<std::istream> open(const fs::path& path) const override;
    [[nodiscard]] std::unique_ptr<Sink> create(const fs::path& path) override;
    void remove(const fs::path& path) override;
    [[nodiscard]] std::optional<Stat> stat(const fs::path& path) const override;
};

}
