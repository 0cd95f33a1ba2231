#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace fk::config {

constexpr static uintmax_t DEFAULT_MAX_FILE_SIZE_BYTES = 100 * 1024 * 1024; // 100MB
constexpr static uintmax_t DEFAULT_CHUNK_SIZE_BYTES = 1024 * 1024;          // 1MB

struct FileManagerConfig {
    std::filesystem::path storage_dir = "storage/files";
    std::filesystem::path thumbnail_dir = "storage/thumbnails";
    std::filesystem::path preview_dir = "storage/previews";
    std::filesystem::path temp_dir = "storage/temp";

    uintmax_t max_file_size = DEFAULT_MAX_FILE_SIZE_BYTES; // 0 disables the ceiling
    std::vector<std::string> allowed_types = {"image/*", "text/*", "application/pdf"};
    std::vector<std::string> blocked_types;

    bool generate_thumbnails = true;
    bool generate_previews = true;
    bool virus_scan_enabled = false;
    std::vector<std::string> virus_signatures; // hex encoded byte patterns

    bool versioning_enabled = true;
    unsigned int max_versions = 10;

    std::chrono::seconds cleanup_interval = std::chrono::hours(24);
    unsigned int retention_days = 30;

    size_t chunk_size = DEFAULT_CHUNK_SIZE_BYTES;
    unsigned int concurrent_uploads = 5;

    unsigned int thumbnail_size = 256;
    unsigned int preview_size = 1024;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum filekeep = spdlog::level::info;   // Startup, shutdown, uploads and deletes
    spdlog::level::level_enum storage  = spdlog::level::warn;   // Underlying I/O issues
    spdlog::level::level_enum upload   = spdlog::level::warn;   // Aborted transfers, ceiling breaches
    spdlog::level::level_enum thumb    = spdlog::level::warn;   // Failed renders only
    spdlog::level::level_enum security = spdlog::level::warn;   // Rejected names, detected threats
    spdlog::level::level_enum sweeper  = spdlog::level::info;   // Purge counts
    spdlog::level::level_enum records  = spdlog::level::err;    // Unreadable or unwritable records
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    FileManagerConfig file_manager;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const FileManagerConfig& c);
void from_json(const nlohmann::json& j, FileManagerConfig& c);

} // namespace fk::config
