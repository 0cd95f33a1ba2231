#include "storage/LocalDiskBackend.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

using namespace fk::storage;

namespace {

class LocalSink final : public Sink {
public:
    explicit LocalSink(fs::path finalPath)
        : final_(std::move(finalPath)), part_(fk::util::partPathFor(final_)) {
        if (final_.has_parent_path()) fs::create_directories(final_.parent_path());
        out_.open(part_, std::ios::binary | std::ios::trunc);
        if (!out_.is_open()) throw std::runtime_error("Failed to create file: " + part_.string());
    }

    ~LocalSink() override {
        if (!committed_) abort();
    }

    void write(const uint8_t* data, const size_t len) override {
        if (committed_ || aborted_) throw std::logic_error("write on a closed sink: " + final_.string());
        out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        if (!out_.good()) throw std::runtime_error("Failed to write file: " + part_.string());
    }

    void commit() override {
        if (committed_) return;
        if (aborted_) throw std::logic_error("commit on an aborted sink: " + final_.string());

        out_.flush();
        const bool ok = out_.good();
        out_.close();
        if (!ok) throw std::runtime_error("Failed to flush file: " + part_.string());

        std::error_code ec;
        fs::rename(part_, final_, ec);
        if (ec) throw std::runtime_error("Failed to move " + part_.string() + " to " + final_.string() + ": " + ec.message());
        committed_ = true;
    }

    void abort() noexcept override {
        if (committed_ || aborted_) return;
        aborted_ = true;
        if (out_.is_open()) out_.close();

        std::error_code ec;
        fs::remove(part_, ec);
        if (ec) {
            try {
                fk::log::Registry::storage()->warn("[LocalDiskBackend] Failed to remove partial file {}: {}",
                                                   part_.string(), ec.message());
            } catch (const std::exception&) {}
        }
    }

    [[nodiscard]] bool committed() const override { return committed_; }

private:
    fs::path final_, part_;
    std::ofstream out_;
    bool committed_ = false, aborted_ = false;
};

}

std::unique_ptr<std::istream> LocalDiskBackend::open(const fs::path& path) const {
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!in->is_open()) throw std::runtime_error("Failed to open file: " + path.string());
    return in;
}

std::unique_ptr<Sink> LocalDiskBackend::create(const fs::path& path) {
    return std::make_unique<LocalSink>(path);
}

void LocalDiskBackend::remove(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw std::runtime_error("Failed to delete file " + path.string() + ": " + ec.message());
}

std::optional<Stat> LocalDiskBackend::stat(const fs::path& path) const {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return std::nullopt;
    const auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return Stat{size};
}
