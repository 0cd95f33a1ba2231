#pragma once

#include "files/model/Record.hpp"

#include <memory>
#include <optional>

namespace fk::storage { class Backend; }
namespace fk::preview { class Generator; }
namespace fk::security { class VirusScanner; }

namespace fk::files {

struct ProcessingOutcome {
    std::optional<model::Thumbnail> thumbnail;
    std::optional<model::Preview> preview;
    std::optional<model::ScanResult> virus_scan;

    [[nodiscard]] bool infected() const { return virus_scan && virus_scan->scanned && !virus_scan->clean; }
};

// Best-effort derivation of thumbnails, previews and scan results for a committed upload.
// Stage eligibility comes from model::capabilitiesOf(record.type).
class ProcessingPipeline {
public:
    struct Stages {
        bool thumbnails = true;
        bool previews = true;
        bool virus_scan = false;
    };

    ProcessingPipeline(std::shared_ptr<storage::Backend> backend,
                       std::shared_ptr<preview::Generator> generator,
                       std::shared_ptr<security::VirusScanner> scanner,
                       Stages stages);

    // Never throws for stage failures; those are logged as warnings. An infected file is reported
    // through ProcessingOutcome::infected() and skips the render stages.
    [[nodiscard]] ProcessingOutcome run(const model::Record& record) const;

    [[nodiscard]] bool wantsThumbnail(model::Type t) const;
    [[nodiscard]] bool wantsPreview(model::Type t) const;
    [[nodiscard]] bool wantsScan() const { return stages_.virus_scan && scanner_ != nullptr; }

private:
    std::optional<model::ScanResult> scan(const model::Record& record) const;
    std::optional<model::Thumbnail> thumbnail(const model::Record& record) const;
    std::optional<model::Preview> preview(const model::Record& record) const;

    std::shared_ptr<storage::Backend> backend_;
    std::shared_ptr<preview::Generator> generator_;
    std::shared_ptr<security::VirusScanner> scanner_;
    Stages stages_;
};

}
