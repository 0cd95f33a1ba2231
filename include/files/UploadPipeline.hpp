#pragma once

#include "files/model/Progress.hpp"
#include "concurrency/CancelToken.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace fk::storage { class Backend; }

namespace fk::files {

struct UploadResult {
    uintmax_t size_bytes = 0;
    std::string content_hash; // BLAKE2b-256, hex
    std::string checksum;     // SHA-256, hex
};

// Streams a source into the backend in fixed-size chunks, hashing and size-checking on the way.
class UploadPipeline {
public:
    using ProgressCallback = std::function<void(const model::UploadProgress&)>;

    UploadPipeline(std::shared_ptr<storage::Backend> backend, size_t chunkSize, uintmax_t maxFileSize);

    // Throws SizeLimitExceeded, Cancelled or IOError; nothing is left at `dest` on failure.
    UploadResult run(std::istream& source,
                     const std::filesystem::path& dest,
                     std::optional<uintmax_t> totalBytes = std::nullopt,
                     const concurrency::CancelToken& cancel = {},
                     const ProgressCallback& onProgress = {}) const;

    [[nodiscard]] size_t chunkSize() const { return chunkSize_; }
    [[nodiscard]] uintmax_t maxFileSize() const { return maxFileSize_; }

private:
    std::shared_ptr<storage::Backend> backend_;
    size_t chunkSize_;
    uintmax_t maxFileSize_;
};

}
