#include "security/Validator.hpp"
#include "files/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <nlohmann/json.hpp>

using namespace fk::security;

namespace {

std::string lower(const std::string_view s) {
    std::string out(s);
    std::ranges::transform(out.begin(), out.end(), out.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

constexpr std::array<std::string_view, 11> FILENAME_HAZARDS = {
    "..", "/", "\\", std::string_view("\0", 1), "<", ">", ":", "\"", "|", "?", "*"
};

constexpr std::array<std::string_view, 12> SCRIPT_PATTERNS = {
    "<script", "</script>", "javascript:", "vbscript:", "onload=", "onerror=",
    "onclick=", "onmouseover=", "onfocus=", "onblur=", "onchange=", "onsubmit="
};

}

bool fk::security::containsScriptPattern(const std::string_view input) {
    const auto l = lower(input);
    return std::ranges::any_of(SCRIPT_PATTERNS, [&](const auto p) { return l.find(p) != std::string::npos; });
}

std::string DefaultValidator::sanitizeInput(const std::string_view input) const {
    std::string out;
    out.reserve(std::min(input.size(), MAX_INPUT_LENGTH));

    for (const char ch : input) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 && c != '\t' && c != '\n') continue;
        if (c == 0x7F) continue;
        out.push_back(ch);
    }

    const auto first = out.find_first_not_of(" \t\n");
    if (first == std::string::npos) return {};
    const auto last = out.find_last_not_of(" \t\n");
    out = out.substr(first, last - first + 1);

    if (out.size() > MAX_INPUT_LENGTH) out.resize(MAX_INPUT_LENGTH);
    return out;
}

bool DefaultValidator::containsMaliciousContent(const std::string_view input) const {
    if (std::ranges::any_of(FILENAME_HAZARDS, [&](const auto h) { return input.find(h) != std::string_view::npos; }))
        return true;
    return containsScriptPattern(input);
}

void DefaultValidator::validateRequestBody(const nlohmann::json& body) const {
    if (!body.is_object()) throw files::ValidationError("Request body must be a JSON object");
    size_t keys = 0;
    validateNode(body, "$", 0, keys);
}

void DefaultValidator::validateNode(const nlohmann::json& node, const std::string& where,
                                    const size_t depth, size_t& keys) const {
    if (depth > MAX_BODY_DEPTH) throw files::ValidationError("Request body nested too deeply at " + where);

    if (node.is_object()) {
        for (const auto& [key, value] : node.items()) {
            if (++keys > MAX_BODY_KEYS) throw files::ValidationError("Request body has too many keys");
            if (key.empty() || key.size() > 256)
                throw files::ValidationError("Invalid key length at " + where);
            if (key.find('\0') != std::string::npos || containsScriptPattern(key))
                throw files::ValidationError("Dangerous content in key at " + where);
            validateNode(value, where + "." + key, depth + 1, keys);
        }
    } else if (node.is_array()) {
        size_t i = 0;
        for (const auto& value : node) validateNode(value, where + "[" + std::to_string(i++) + "]", depth + 1, keys);
    } else if (node.is_string()) {
        const auto& s = node.get_ref<const std::string&>();
        if (s.size() > MAX_INPUT_LENGTH) throw files::ValidationError("Value too long at " + where);
        if (s.find('\0') != std::string::npos || containsScriptPattern(s))
            throw files::ValidationError("Dangerous content in value at " + where);
    }
}
