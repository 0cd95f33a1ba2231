#pragma once

#include <string>
#include <vector>

namespace fk::files {

// Allow/block rules for incoming files.
//   blocked: "*" blocks everything; otherwise an extension, with or without the dot, case-insensitive.
//   allowed: "image/*" is a MIME prefix; otherwise an exact MIME type or extension.
// An empty allow list admits anything not blocked.
class TypePolicy {
public:
    TypePolicy(std::vector<std::string> allowed, std::vector<std::string> blocked);

    [[nodiscard]] bool isBlocked(const std::string& extension) const;
    [[nodiscard]] bool isAllowed(const std::string& extension, const std::string& mimeType) const;

    // Throws ValidationError naming the rule that rejected the file.
    void check(const std::string& extension, const std::string& mimeType) const;

private:
    std::vector<std::string> allowed_, blocked_;
};

}
