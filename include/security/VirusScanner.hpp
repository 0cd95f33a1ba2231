#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace fk::security {

struct ScanReport {
    bool clean = true;
    std::vector<std::string> threats;
};

class VirusScanner {
public:
    virtual ~VirusScanner() = default;

    // Throws std::runtime_error when the stream cannot be scanned.
    [[nodiscard]] virtual ScanReport scan(std::istream& in) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// Streaming byte-signature matcher. Always knows the EICAR test string; extra signatures
// are hex encoded ("4d5a9000") and reported as "sig:<hex>".
class SignatureScanner final : public VirusScanner {
public:
    static constexpr const char* EICAR =
        R"(X5O!P%@AP[4\PZX54(P^)7CC)7}$EICAR-STANDARD-ANTIVIRUS-TEST-FILE!$H+H*)";

    explicit SignatureScanner(const std::vector<std::string>& hexSignatures = {}, size_t chunkSize = 64 * 1024);

    [[nodiscard]] ScanReport scan(std::istream& in) override;

    [[nodiscard]] std::string name() const override { return "signature"; }

    [[nodiscard]] size_t signatureCount() const { return signatures_.size(); }

private:
    struct Signature {
        std::string label;
        std::vector<uint8_t> bytes;
    };

    static std::vector<uint8_t> fromHex(const std::string& hex);

    std::vector<Signature> signatures_;
    size_t longest_ = 0;
    size_t chunkSize_;
};

}
