#include "files/model/Progress.hpp"

#include <nlohmann/json.hpp>

using namespace fk::files::model;

namespace {
constexpr double MIN_ELAPSED_SECONDS = 1e-3;
}

void UploadProgress::refresh(const clock::time_point now) {
    last_update = now;

    if (total_bytes && *total_bytes > 0)
        percentage = 100.0 * static_cast<double>(bytes_transferred) / static_cast<double>(*total_bytes);
    else percentage.reset();

    const double elapsed = std::chrono::duration<double>(now - started_at).count();
    speed_bps = elapsed > MIN_ELAPSED_SECONDS ? static_cast<double>(bytes_transferred) / elapsed : 0.0;

    if (speed_bps > 0.0 && total_bytes && *total_bytes >= bytes_transferred) {
        const auto remaining = static_cast<double>(*total_bytes - bytes_transferred);
        eta = std::chrono::seconds(static_cast<long long>(remaining / speed_bps));
    } else eta.reset();
}

void fk::files::model::to_json(nlohmann::json& j, const UploadProgress& p) {
    j = {
        {"bytes_transferred", p.bytes_transferred},
        {"speed_bps", p.speed_bps},
        {"elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(p.last_update - p.started_at).count()},
    };

    j["total_bytes"] = p.total_bytes ? nlohmann::json(*p.total_bytes) : nlohmann::json(nullptr);
    j["percentage"] = p.percentage ? nlohmann::json(*p.percentage) : nlohmann::json(nullptr);
    j["eta_seconds"] = p.eta ? nlohmann::json(p.eta->count()) : nlohmann::json(nullptr);
}
