#include "files/TypePolicy.hpp"
#include "files/errors.hpp"

#include <algorithm>
#include <cctype>

using namespace fk::files;

namespace {

std::string lower(std::string s) {
    std::ranges::transform(s.begin(), s.end(), s.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string withDot(std::string ext) {
    if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
    return ext;
}

}

TypePolicy::TypePolicy(std::vector<std::string> allowed, std::vector<std::string> blocked) {
    for (auto& a : allowed) allowed_.push_back(lower(std::move(a)));
    for (auto& b : blocked) blocked_.push_back(lower(std::move(b)));
}

bool TypePolicy::isBlocked(const std::string& extension) const {
    const auto ext = withDot(lower(extension));
    return std::ranges::any_of(blocked_, [&](const std::string& rule) {
        return rule == "*" || (!ext.empty() && withDot(rule) == ext);
    });
}

bool TypePolicy::isAllowed(const std::string& extension, const std::string& mimeType) const {
    if (allowed_.empty()) return true;

    const auto ext = withDot(lower(extension));
    const auto mime = lower(mimeType);

    return std::ranges::any_of(allowed_, [&](const std::string& rule) {
        if (rule == "*") return true;
        if (rule.ends_with('*')) return mime.starts_with(rule.substr(0, rule.size() - 1));
        if (rule == mime) return true;
        return !ext.empty() && rule.find('/') == std::string::npos && withDot(rule) == ext;
    });
}

void TypePolicy::check(const std::string& extension, const std::string& mimeType) const {
    if (isBlocked(extension))
        throw ValidationError("File type is blocked: " + (extension.empty() ? std::string("(none)") : extension));
    if (!isAllowed(extension, mimeType))
        throw ValidationError("File type not allowed: " + mimeType);
}
