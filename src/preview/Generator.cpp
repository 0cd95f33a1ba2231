#include "preview/Generator.hpp"
#include "preview/image.hpp"
#include "preview/pdf.hpp"
#include "preview/text.hpp"
#include "storage/Backend.hpp"
#include "config/Config.hpp"

#include <iterator>
#include <stdexcept>
#include <vector>

using namespace fk::preview;
using fk::files::model::Type;

namespace {

std::vector<uint8_t> readAll(std::istream& in) {
    std::vector<uint8_t> buf{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) throw std::runtime_error("Read error while loading source for rendering");
    return buf;
}

}

DefaultGenerator::DefaultGenerator(std::shared_ptr<storage::Backend> backend, const config::FileManagerConfig& cfg)
    : backend_(std::move(backend)),
      thumbnailDir_(cfg.thumbnail_dir),
      previewDir_(cfg.preview_dir),
      thumbnailSize_(cfg.thumbnail_size),
      previewSize_(cfg.preview_size) {
    if (!backend_) throw std::invalid_argument("DefaultGenerator requires a storage backend");
}

Asset DefaultGenerator::writeOut(const std::filesystem::path& out, const uint8_t* data, const size_t len) const {
    if (len == 0) throw std::runtime_error("Rendered output is empty: " + out.string());
    auto sink = backend_->create(out);
    sink->write(data, len);
    sink->commit();

    Asset a;
    a.path = out;
    a.size_bytes = len;
    return a;
}

Asset DefaultGenerator::renderJpeg(const Request& req, const std::filesystem::path& out, const unsigned int maxDim) const {
    const auto in = backend_->open(req.source);
    const auto buffer = readAll(*in);

    Rendered r;
    if (req.mime_type == "application/pdf") r = pdf::resize_and_compress_buffer(buffer.data(), buffer.size(), maxDim);
    else if (req.type == Type::Image && req.mime_type != "image/svg+xml")
        r = image::resize_and_compress_buffer(buffer.data(), buffer.size(), maxDim);
    else throw std::runtime_error("No renderer for MIME type " + req.mime_type);

    auto asset = writeOut(out, r.jpeg.data(), r.jpeg.size());
    asset.kind = "image";
    asset.width = r.width;
    asset.height = r.height;
    asset.page_count = r.page_count;
    return asset;
}

Asset DefaultGenerator::thumbnail(const Request& req) {
    return renderJpeg(req, thumbnailDir_ / (req.id + ".jpg"), thumbnailSize_);
}

Asset DefaultGenerator::preview(const Request& req) {
    if (req.type == Type::Text) {
        const auto in = backend_->open(req.source);
        const auto body = text::excerpt(*in);
        auto asset = writeOut(previewDir_ / (req.id + ".txt"),
                              reinterpret_cast<const uint8_t*>(body.data()), body.size());
        asset.kind = "text";
        asset.page_count = 1;
        return asset;
    }

    return renderJpeg(req, previewDir_ / (req.id + ".jpg"), previewSize_);
}
