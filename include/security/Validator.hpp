#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace fk::security {

class Validator {
public:
    virtual ~Validator() = default;

    [[nodiscard]] virtual std::string sanitizeInput(std::string_view input) const = 0;

    [[nodiscard]] virtual bool containsMaliciousContent(std::string_view input) const = 0;

    // Throws files::ValidationError describing the first offending key or value.
    virtual void validateRequestBody(const nlohmann::json& body) const = 0;
};

class DefaultValidator final : public Validator {
public:
    static constexpr size_t MAX_INPUT_LENGTH = 10000;
    static constexpr size_t MAX_BODY_DEPTH = 16;
    static constexpr size_t MAX_BODY_KEYS = 1024;

    // Strips NUL and control characters (keeping tab and newline), trims surrounding
    // whitespace and caps the result at MAX_INPUT_LENGTH bytes.
    [[nodiscard]] std::string sanitizeInput(std::string_view input) const override;

    // Path separators, traversal, reserved filename characters, markup and script handlers.
    [[nodiscard]] bool containsMaliciousContent(std::string_view input) const override;

    void validateRequestBody(const nlohmann::json& body) const override;

private:
    void validateNode(const nlohmann::json& node, const std::string& where, size_t depth, size_t& keys) const;
};

[[nodiscard]] bool containsScriptPattern(std::string_view input);

}
