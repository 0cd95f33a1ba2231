#include "files/ProcessingPipeline.hpp"
#include "preview/Generator.hpp"
#include "security/VirusScanner.hpp"
#include "storage/Backend.hpp"
#include "log/Registry.hpp"

#include <fmt/ranges.h>

using namespace fk::files;

namespace {

fk::preview::Request requestFor(const fk::files::model::Record& r) {
    return {r.id, r.path, r.mime_type, r.type};
}

}

ProcessingPipeline::ProcessingPipeline(std::shared_ptr<storage::Backend> backend,
                                       std::shared_ptr<preview::Generator> generator,
                                       std::shared_ptr<security::VirusScanner> scanner,
                                       const Stages stages)
    : backend_(std::move(backend)), generator_(std::move(generator)), scanner_(std::move(scanner)), stages_(stages) {
    if (!backend_) throw std::invalid_argument("ProcessingPipeline requires a storage backend");
}

bool ProcessingPipeline::wantsThumbnail(const model::Type t) const {
    return stages_.thumbnails && generator_ && model::capabilitiesOf(t).thumbnail;
}

bool ProcessingPipeline::wantsPreview(const model::Type t) const {
    return stages_.previews && generator_ && model::capabilitiesOf(t).preview;
}

ProcessingOutcome ProcessingPipeline::run(const model::Record& record) const {
    ProcessingOutcome out;

    if (wantsScan()) out.virus_scan = scan(record);
    if (out.infected()) return out;

    if (wantsThumbnail(record.type)) out.thumbnail = thumbnail(record);
    if (wantsPreview(record.type)) out.preview = preview(record);

    return out;
}

std::optional<fk::files::model::ScanResult> ProcessingPipeline::scan(const model::Record& record) const {
    try {
        const auto in = backend_->open(record.path);
        const auto report = scanner_->scan(*in);

        model::ScanResult res;
        res.scanned = true;
        res.clean = report.clean;
        res.threats = report.threats;
        res.scanner = scanner_->name();
        res.scanned_at = std::chrono::system_clock::now();

        if (!res.clean)
            log::Registry::security()->warn("[ProcessingPipeline] Threats in {} ({}): {}",
                                            record.id, record.name, fmt::format("{}", fmt::join(res.threats, ", ")));
        return res;
    } catch (const std::exception& e) {
        log::Registry::security()->error("[ProcessingPipeline] Scanner failed for {}: {}", record.id, e.what());
        return std::nullopt;
    }
}

std::optional<fk::files::model::Thumbnail> ProcessingPipeline::thumbnail(const model::Record& record) const {
    try {
        const auto asset = generator_->thumbnail(requestFor(record));
        return model::Thumbnail{asset.path, asset.width, asset.height, asset.size_bytes};
    } catch (const std::exception& e) {
        log::Registry::thumb()->warn("[ProcessingPipeline] Thumbnail skipped for {} ({}): {}",
                                     record.id, record.mime_type, e.what());
        return std::nullopt;
    }
}

std::optional<fk::files::model::Preview> ProcessingPipeline::preview(const model::Record& record) const {
    try {
        const auto asset = generator_->preview(requestFor(record));
        model::Preview p;
        p.path = asset.path;
        p.kind = asset.kind;
        p.width = asset.width;
        p.height = asset.height;
        p.page_count = asset.page_count;
        p.generated_at = std::chrono::system_clock::now();
        return p;
    } catch (const std::exception& e) {
        log::Registry::thumb()->warn("[ProcessingPipeline] Preview skipped for {} ({}): {}",
                                     record.id, record.mime_type, e.what());
        return std::nullopt;
    }
}
