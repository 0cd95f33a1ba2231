#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fk::files::model {

enum class Type : uint8_t { Image, Video, Audio, Document, Archive, Code, Text, Other };

inline constexpr size_t TYPE_COUNT = 8;

inline constexpr std::array<Type, TYPE_COUNT> ALL_TYPES = {
    Type::Image, Type::Video, Type::Audio, Type::Document, Type::Archive, Type::Code, Type::Text, Type::Other
};

struct Capabilities {
    bool thumbnail;
    bool preview;
};

// Indexed by Type. Closed set: adding a Type requires a row here.
inline constexpr std::array<Capabilities, TYPE_COUNT> CAPABILITIES = {{
    /* Image    */ {true,  true},
    /* Video    */ {true,  false},
    /* Audio    */ {false, false},
    /* Document */ {true,  true},
    /* Archive  */ {false, false},
    /* Code     */ {false, false},
    /* Text     */ {false, true},
    /* Other    */ {false, false},
}};

constexpr const Capabilities& capabilitiesOf(const Type t) { return CAPABILITIES[static_cast<size_t>(t)]; }

std::string_view to_string(Type t);
std::optional<Type> typeFromString(std::string_view s);

// Lower-cased extension with leading dot, or empty.
std::string normalizedExtension(const std::filesystem::path& filename);

Type classify(const std::filesystem::path& filename);

std::string inferMimeTypeFromPath(const std::filesystem::path& filename);

}
