#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json_fwd.hpp>

namespace fk::files::model {

struct UploadProgress {
    using clock = std::chrono::steady_clock;

    uintmax_t bytes_transferred = 0;
    std::optional<uintmax_t> total_bytes;
    std::optional<double> percentage;   // only when total_bytes > 0
    double speed_bps = 0.0;
    std::optional<std::chrono::seconds> eta; // only when speed > 0 and total known
    clock::time_point started_at{};
    clock::time_point last_update{};

    // Recomputes percentage, speed and ETA from bytes_transferred at `now`.
    void refresh(clock::time_point now);
};

void to_json(nlohmann::json& j, const UploadProgress& p);

}
