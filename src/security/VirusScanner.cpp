#include "security/VirusScanner.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>

using namespace fk::security;

SignatureScanner::SignatureScanner(const std::vector<std::string>& hexSignatures, const size_t chunkSize)
    : chunkSize_(chunkSize) {
    if (chunkSize_ == 0) throw std::invalid_argument("SignatureScanner chunk size must be > 0");

    const std::string eicar(EICAR);
    signatures_.push_back({"EICAR-Test-File", {eicar.begin(), eicar.end()}});

    for (const auto& hex : hexSignatures) {
        auto bytes = fromHex(hex);
        if (bytes.empty()) continue;
        std::string label = "sig:";
        for (const char c : hex) label.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        signatures_.push_back({std::move(label), std::move(bytes)});
    }

    for (const auto& s : signatures_) longest_ = std::max(longest_, s.bytes.size());
}

std::vector<uint8_t> SignatureScanner::fromHex(const std::string& hex) {
    if (hex.size() % 2 != 0) throw std::invalid_argument("Odd-length hex signature: " + hex);

    const auto nibble = [&](const char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("Invalid hex signature: " + hex);
    };

    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
        out.push_back(static_cast<uint8_t>(nibble(hex[i]) << 4 | nibble(hex[i + 1])));
    return out;
}

ScanReport SignatureScanner::scan(std::istream& in) {
    ScanReport report;
    std::vector<bool> hit(signatures_.size(), false);

    // Keep the last (longest - 1) bytes of the previous chunk so matches spanning a boundary are found.
    std::vector<uint8_t> window;
    std::vector<char> chunk(chunkSize_);

    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<size_t>(in.gcount());
        if (got == 0) break;

        window.insert(window.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(got));

        for (size_t i = 0; i < signatures_.size(); ++i) {
            if (hit[i]) continue;
            const auto& sig = signatures_[i].bytes;
            if (std::search(window.begin(), window.end(), sig.begin(), sig.end()) != window.end()) hit[i] = true;
        }

        const size_t keep = longest_ > 0 ? longest_ - 1 : 0;
        if (window.size() > keep) window.erase(window.begin(), window.end() - static_cast<std::ptrdiff_t>(keep));
    }

    if (in.bad()) throw std::runtime_error("Read error while scanning stream");

    for (size_t i = 0; i < signatures_.size(); ++i)
        if (hit[i]) report.threats.push_back(signatures_[i].label);
    report.clean = report.threats.empty();
    return report;
}
