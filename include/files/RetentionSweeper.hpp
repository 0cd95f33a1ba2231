#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <cstddef>

namespace fk::files {

class FileManager;

// Periodically purges tombstones older than the retention window.
class RetentionSweeper final : public concurrency::AsyncService {
public:
    RetentionSweeper(FileManager& manager, std::chrono::seconds interval, unsigned int retentionDays);

    ~RetentionSweeper() override;

    // One pass against `now`. Returns the number of tombstones purged.
    size_t sweepOnce(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    [[nodiscard]] std::chrono::system_clock::time_point cutoffFor(std::chrono::system_clock::time_point now) const;

protected:
    void runLoop() override;

private:
    FileManager& manager_;
    std::chrono::seconds interval_;
    unsigned int retentionDays_;
};

}
