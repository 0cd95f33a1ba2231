#include "files/RetentionSweeper.hpp"
#include "files/FileManager.hpp"
#include "log/Registry.hpp"

using namespace fk::files;

RetentionSweeper::RetentionSweeper(FileManager& manager, const std::chrono::seconds interval,
                                   const unsigned int retentionDays)
    : AsyncService("RetentionSweeper"), manager_(manager), interval_(interval), retentionDays_(retentionDays) {}

RetentionSweeper::~RetentionSweeper() {
    // Join before the members runLoop() reads are destroyed.
    stop();
}

std::chrono::system_clock::time_point RetentionSweeper::cutoffFor(const std::chrono::system_clock::time_point now) const {
    return now - std::chrono::hours(24) * retentionDays_;
}

size_t RetentionSweeper::sweepOnce(const std::chrono::system_clock::time_point now) {
    const auto purged = manager_.purgeTombstones(cutoffFor(now));
    if (purged > 0) log::Registry::sweeper()->info("[RetentionSweeper] Purged {} expired records", purged);
    else log::Registry::sweeper()->debug("[RetentionSweeper] Nothing to purge");
    return purged;
}

void RetentionSweeper::runLoop() {
    while (!shouldStop()) {
        try {
            sweepOnce();
        } catch (const std::exception& e) {
            log::Registry::sweeper()->warn("[RetentionSweeper] Sweep failed: {}", e.what());
        }

        lazySleep(interval_);
    }
}
