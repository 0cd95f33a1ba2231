#include "files/UploadPipeline.hpp"
#include "files/errors.hpp"
#include "storage/Backend.hpp"
#include "crypto/hash.hpp"
#include "log/Registry.hpp"

#include <vector>

using namespace fk::files;

UploadPipeline::UploadPipeline(std::shared_ptr<storage::Backend> backend, const size_t chunkSize,
                               const uintmax_t maxFileSize)
    : backend_(std::move(backend)), chunkSize_(chunkSize), maxFileSize_(maxFileSize) {
    if (!backend_) throw std::invalid_argument("UploadPipeline requires a storage backend");
    if (chunkSize_ == 0) throw std::invalid_argument("UploadPipeline chunk size must be > 0");
}

UploadResult UploadPipeline::run(std::istream& source,
                                 const std::filesystem::path& dest,
                                 const std::optional<uintmax_t> totalBytes,
                                 const concurrency::CancelToken& cancel,
                                 const ProgressCallback& onProgress) const {
    std::unique_ptr<storage::Sink> sink;
    try {
        sink = backend_->create(dest);
    } catch (const std::exception& e) {
        throw IOError("Failed to open destination " + dest.string() + ": " + e.what());
    }

    crypto::hash::Blake2b contentHash;
    crypto::hash::Sha256 checksum;

    model::UploadProgress progress;
    progress.total_bytes = totalBytes;
    progress.started_at = progress.last_update = model::UploadProgress::clock::now();

    std::vector<char> chunk(chunkSize_);

    while (true) {
        if (cancel.isCancelled()) {
            sink->abort();
            log::Registry::upload()->info("[UploadPipeline] Cancelled after {} bytes: {}",
                                          progress.bytes_transferred, dest.string());
            throw Cancelled("Upload cancelled after " + std::to_string(progress.bytes_transferred) + " bytes");
        }

        source.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (source.bad()) {
            sink->abort();
            throw IOError("Read error from upload source after " + std::to_string(progress.bytes_transferred) + " bytes");
        }

        const auto got = static_cast<size_t>(source.gcount());
        if (got == 0) break;

        progress.bytes_transferred += got;
        if (maxFileSize_ > 0 && progress.bytes_transferred > maxFileSize_) {
            sink->abort();
            log::Registry::upload()->warn("[UploadPipeline] Size ceiling {} exceeded at {} bytes: {}",
                                          maxFileSize_, progress.bytes_transferred, dest.string());
            throw SizeLimitExceeded(maxFileSize_, progress.bytes_transferred);
        }

        const auto* bytes = reinterpret_cast<const uint8_t*>(chunk.data());
        try {
            sink->write(bytes, got);
        } catch (const std::exception& e) {
            sink->abort();
            throw IOError(std::string("Write error: ") + e.what());
        }
        contentHash.update(bytes, got);
        checksum.update(bytes, got);

        progress.refresh(model::UploadProgress::clock::now());
        if (onProgress) onProgress(progress);

        if (source.eof()) break;
    }

    try {
        sink->commit();
    } catch (const std::exception& e) {
        sink->abort();
        throw IOError(std::string("Failed to commit upload: ") + e.what());
    }

    return {progress.bytes_transferred, contentHash.finalHex(), checksum.finalHex()};
}
