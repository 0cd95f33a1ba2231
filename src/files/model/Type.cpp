#include "files/model/Type.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace fk::files::model {

std::string_view to_string(const Type t) {
    switch (t) {
        case Type::Image: return "image";
        case Type::Video: return "video";
        case Type::Audio: return "audio";
        case Type::Document: return "document";
        case Type::Archive: return "archive";
        case Type::Code: return "code";
        case Type::Text: return "text";
        case Type::Other: return "other";
    }
    return "other";
}

std::optional<Type> typeFromString(const std::string_view s) {
    for (const auto t : ALL_TYPES)
        if (to_string(t) == s) return t;
    return std::nullopt;
}

std::string normalizedExtension(const std::filesystem::path& filename) {
    std::string ext = filename.extension().string();
    std::ranges::transform(ext.begin(), ext.end(), ext.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

Type classify(const std::filesystem::path& filename) {
    static const std::unordered_map<std::string, Type> byExtension = {
        {".jpg", Type::Image}, {".jpeg", Type::Image}, {".png", Type::Image}, {".gif", Type::Image},
        {".bmp", Type::Image}, {".webp", Type::Image}, {".svg", Type::Image},
        {".mp4", Type::Video}, {".avi", Type::Video}, {".mov", Type::Video}, {".wmv", Type::Video},
        {".flv", Type::Video}, {".webm", Type::Video}, {".mkv", Type::Video},
        {".mp3", Type::Audio}, {".wav", Type::Audio}, {".flac", Type::Audio}, {".aac", Type::Audio},
        {".ogg", Type::Audio}, {".wma", Type::Audio},
        {".pdf", Type::Document}, {".doc", Type::Document}, {".docx", Type::Document}, {".xls", Type::Document},
        {".xlsx", Type::Document}, {".ppt", Type::Document}, {".pptx", Type::Document}, {".rtf", Type::Document},
        {".zip", Type::Archive}, {".rar", Type::Archive}, {".7z", Type::Archive}, {".tar", Type::Archive},
        {".gz", Type::Archive}, {".bz2", Type::Archive},
        {".js", Type::Code}, {".ts", Type::Code}, {".go", Type::Code}, {".py", Type::Code},
        {".java", Type::Code}, {".cpp", Type::Code}, {".c", Type::Code}, {".h", Type::Code},
        {".hpp", Type::Code}, {".css", Type::Code}, {".html", Type::Code}, {".xml", Type::Code},
        {".json", Type::Code}, {".yaml", Type::Code}, {".yml", Type::Code},
        {".txt", Type::Text}, {".md", Type::Text}, {".log", Type::Text}, {".cfg", Type::Text},
        {".conf", Type::Text}, {".ini", Type::Text}, {".csv", Type::Text},
    };

    const auto it = byExtension.find(normalizedExtension(filename));
    return it != byExtension.end() ? it->second : Type::Other;
}

std::string inferMimeTypeFromPath(const std::filesystem::path& filename) {
    static const std::unordered_map<std::string, std::string> mimeMap = {
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"}, {".gif", "image/gif"},
        {".bmp", "image/bmp"}, {".webp", "image/webp"}, {".svg", "image/svg+xml"},
        {".mp4", "video/mp4"}, {".avi", "video/x-msvideo"}, {".mov", "video/quicktime"},
        {".webm", "video/webm"}, {".mkv", "video/x-matroska"}, {".wmv", "video/x-ms-wmv"},
        {".flv", "video/x-flv"},
        {".mp3", "audio/mpeg"}, {".wav", "audio/wav"}, {".flac", "audio/flac"}, {".aac", "audio/aac"},
        {".ogg", "audio/ogg"}, {".wma", "audio/x-ms-wma"},
        {".pdf", "application/pdf"}, {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".rtf", "application/rtf"},
        {".zip", "application/zip"}, {".rar", "application/vnd.rar"}, {".7z", "application/x-7z-compressed"},
        {".tar", "application/x-tar"}, {".gz", "application/gzip"}, {".bz2", "application/x-bzip2"},
        {".js", "text/javascript"}, {".ts", "application/typescript"}, {".py", "text/x-python"},
        {".java", "text/x-java"}, {".c", "text/x-c"}, {".h", "text/x-c"}, {".cpp", "text/x-c++"},
        {".hpp", "text/x-c++"}, {".go", "text/x-go"},
        {".css", "text/css"}, {".html", "text/html"}, {".xml", "application/xml"},
        {".json", "application/json"}, {".yaml", "application/yaml"}, {".yml", "application/yaml"},
        {".txt", "text/plain"}, {".md", "text/markdown"}, {".log", "text/plain"}, {".csv", "text/csv"},
        {".cfg", "text/plain"}, {".conf", "text/plain"}, {".ini", "text/plain"},
    };

    const auto it = mimeMap.find(normalizedExtension(filename));
    return it != mimeMap.end() ? it->second : "application/octet-stream";
}

}
