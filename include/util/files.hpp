#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fk::util {

std::string readFileToString(const std::filesystem::path& path);

// Writes to a temporary sibling and renames it over `path`.
void writeFileAtomic(const std::filesystem::path& path, std::string_view contents);

std::string generate_random_suffix(size_t length = 8);

std::filesystem::path partPathFor(const std::filesystem::path& path);

}
