#pragma once

#include "files/model/Type.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace fk::storage { class Backend; }
namespace fk::config { struct FileManagerConfig; }

namespace fk::preview {

struct Request {
    std::string id;
    std::filesystem::path source;
    std::string mime_type;
    files::model::Type type = files::model::Type::Other;
};

struct Asset {
    std::filesystem::path path;
    std::string kind; // "image" or "text"
    unsigned int width = 0, height = 0;
    unsigned int page_count = 0;
    uintmax_t size_bytes = 0;
};

// Derives secondary assets from a committed upload. Both calls throw std::runtime_error
// when the source cannot be rendered.
class Generator {
public:
    virtual ~Generator() = default;

    virtual Asset thumbnail(const Request& req) = 0;

    virtual Asset preview(const Request& req) = 0;
};

// stb_image + libjpeg-turbo for raster images, pdfium for PDFs, UTF-8 excerpts for text.
class DefaultGenerator final : public Generator {
public:
    DefaultGenerator(std::shared_ptr<storage::Backend> backend, const config::FileManagerConfig& cfg);

    Asset thumbnail(const Request& req) override;
    Asset preview(const Request& req) override;

private:
    Asset renderJpeg(const Request& req, const std::filesystem::path& out, unsigned int maxDim) const;
    Asset writeOut(const std::filesystem::path& out, const uint8_t* data, size_t len) const;

    std::shared_ptr<storage::Backend> backend_;
    std::filesystem::path thumbnailDir_, previewDir_;
    unsigned int thumbnailSize_, previewSize_;
};

}
