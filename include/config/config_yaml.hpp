#pragma once

#include "config/Config.hpp"
#include "util/interval.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace fk::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<FileManagerConfig> {
    static Node encode(const FileManagerConfig& rhs) {
        Node node;
        node["storage_dir"] = rhs.storage_dir.string();
        node["thumbnail_dir"] = rhs.thumbnail_dir.string();
        node["preview_dir"] = rhs.preview_dir.string();
        node["temp_dir"] = rhs.temp_dir.string();
        node["max_file_size"] = rhs.max_file_size;
        node["allowed_types"] = rhs.allowed_types;
        node["blocked_types"] = rhs.blocked_types;
        node["generate_thumbnails"] = rhs.generate_thumbnails;
        node["generate_previews"] = rhs.generate_previews;
        node["virus_scan_enabled"] = rhs.virus_scan_enabled;
        node["virus_signatures"] = rhs.virus_signatures;
        node["versioning_enabled"] = rhs.versioning_enabled;
        node["max_versions"] = rhs.max_versions;
        node["cleanup_interval"] = fk::util::intervalToString(rhs.cleanup_interval);
        node["retention_days"] = rhs.retention_days;
        node["chunk_size"] = rhs.chunk_size;
        node["concurrent_uploads"] = rhs.concurrent_uploads;
        node["thumbnail_size"] = rhs.thumbnail_size;
        node["preview_size"] = rhs.preview_size;
        return node;
    }

    static bool decode(const Node& node, FileManagerConfig& rhs) {
        if (!node.IsMap()) return false;
        const FileManagerConfig def;
        rhs.storage_dir = node["storage_dir"].as<std::string>(def.storage_dir.string());
        rhs.thumbnail_dir = node["thumbnail_dir"].as<std::string>(def.thumbnail_dir.string());
        rhs.preview_dir = node["preview_dir"].as<std::string>(def.preview_dir.string());
        rhs.temp_dir = node["temp_dir"].as<std::string>(def.temp_dir.string());

        if (node["max_file_size_mb"]) rhs.max_file_size = node["max_file_size_mb"].as<uintmax_t>() * 1024 * 1024;
        else rhs.max_file_size = node["max_file_size"].as<uintmax_t>(def.max_file_size);

        rhs.allowed_types = node["allowed_types"] ? node["allowed_types"].as<std::vector<std::string>>()
                                                  : def.allowed_types;
        rhs.blocked_types = node["blocked_types"] ? node["blocked_types"].as<std::vector<std::string>>()
                                                  : def.blocked_types;
        rhs.generate_thumbnails = node["generate_thumbnails"].as<bool>(def.generate_thumbnails);
        rhs.generate_previews = node["generate_previews"].as<bool>(def.generate_previews);
        rhs.virus_scan_enabled = node["virus_scan_enabled"].as<bool>(def.virus_scan_enabled);
        rhs.virus_signatures = node["virus_signatures"] ? node["virus_signatures"].as<std::vector<std::string>>()
                                                        : def.virus_signatures;
        rhs.versioning_enabled = node["versioning_enabled"].as<bool>(def.versioning_enabled);
        rhs.max_versions = node["max_versions"].as<unsigned int>(def.max_versions);
        rhs.cleanup_interval = node["cleanup_interval"]
                                   ? fk::util::parseInterval(node["cleanup_interval"].as<std::string>())
                                   : def.cleanup_interval;
        rhs.retention_days = node["retention_days"].as<unsigned int>(def.retention_days);
        rhs.chunk_size = node["chunk_size"].as<size_t>(def.chunk_size);
        rhs.concurrent_uploads = node["concurrent_uploads"].as<unsigned int>(def.concurrent_uploads);
        rhs.thumbnail_size = node["thumbnail_size"].as<unsigned int>(def.thumbnail_size);
        rhs.preview_size = node["preview_size"].as<unsigned int>(def.preview_size);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["filekeep"] = to_std_string(spdlog::level::to_string_view(rhs.filekeep));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["upload"]   = to_std_string(spdlog::level::to_string_view(rhs.upload));
        node["thumb"]    = to_std_string(spdlog::level::to_string_view(rhs.thumb));
        node["security"] = to_std_string(spdlog::level::to_string_view(rhs.security));
        node["sweeper"]  = to_std_string(spdlog::level::to_string_view(rhs.sweeper));
        node["records"]  = to_std_string(spdlog::level::to_string_view(rhs.records));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.filekeep = spdlog::level::from_str(node["filekeep"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.upload = spdlog::level::from_str(node["upload"].as<std::string>("warn"));
        rhs.thumb = spdlog::level::from_str(node["thumb"].as<std::string>("warn"));
        rhs.security = spdlog::level::from_str(node["security"].as<std::string>("warn"));
        rhs.sweeper = spdlog::level::from_str(node["sweeper"].as<std::string>("info"));
        rhs.records = spdlog::level::from_str(node["records"].as<std::string>("err"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
