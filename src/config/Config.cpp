#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/interval.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace fk::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("Config root must be a mapping");

    if (auto node = root["file_manager"]) {
        if (!YAML::convert<FileManagerConfig>::decode(node, cfg.file_manager))
            throw std::runtime_error("Config section 'file_manager' must be a mapping");
    }
    if (auto node = root["logging"]) {
        if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging))
            throw std::runtime_error("Config section 'logging' must be a mapping");
    }

    if (cfg.file_manager.chunk_size == 0) throw std::runtime_error("file_manager.chunk_size must be > 0");
    if (cfg.file_manager.concurrent_uploads == 0)
        throw std::runtime_error("file_manager.concurrent_uploads must be > 0");

    return cfg;
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

Config loadConfig(const std::filesystem::path& path) {
    return fromRoot(YAML::LoadFile(path.string()));
}

Config loadConfigFromString(const std::string& yaml) {
    return fromRoot(YAML::Load(yaml));
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"file_manager", c.file_manager},
        {"logging", {
            {"log_dir", c.logging.log_dir.string()},
            {"console_log_level", levelName(c.logging.levels.console_log_level)},
            {"file_log_level", levelName(c.logging.levels.file_log_level)}
        }}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("file_manager").get_to(c.file_manager);
    if (j.contains("logging")) {
        const auto& l = j.at("logging");
        c.logging.log_dir = l.value("log_dir", std::string{});
        c.logging.levels.console_log_level = spdlog::level::from_str(l.value("console_log_level", "info"));
        c.logging.levels.file_log_level = spdlog::level::from_str(l.value("file_log_level", "warn"));
    }
}

void to_json(nlohmann::json& j, const FileManagerConfig& c) {
    j = {
        {"storage_dir", c.storage_dir.string()},
        {"thumbnail_dir", c.thumbnail_dir.string()},
        {"preview_dir", c.preview_dir.string()},
        {"temp_dir", c.temp_dir.string()},
        {"max_file_size", c.max_file_size},
        {"allowed_types", c.allowed_types},
        {"blocked_types", c.blocked_types},
        {"generate_thumbnails", c.generate_thumbnails},
        {"generate_previews", c.generate_previews},
        {"virus_scan_enabled", c.virus_scan_enabled},
        {"virus_signatures", c.virus_signatures},
        {"versioning_enabled", c.versioning_enabled},
        {"max_versions", c.max_versions},
        {"cleanup_interval", util::intervalToString(c.cleanup_interval)},
        {"retention_days", c.retention_days},
        {"chunk_size", c.chunk_size},
        {"concurrent_uploads", c.concurrent_uploads},
        {"thumbnail_size", c.thumbnail_size},
        {"preview_size", c.preview_size}
    };
}

void from_json(const nlohmann::json& j, FileManagerConfig& c) {
    const FileManagerConfig def;
    c.storage_dir = j.value("storage_dir", def.storage_dir.string());
    c.thumbnail_dir = j.value("thumbnail_dir", def.thumbnail_dir.string());
    c.preview_dir = j.value("preview_dir", def.preview_dir.string());
    c.temp_dir = j.value("temp_dir", def.temp_dir.string());
    c.max_file_size = j.value("max_file_size", def.max_file_size);
    c.allowed_types = j.value("allowed_types", def.allowed_types);
    c.blocked_types = j.value("blocked_types", def.blocked_types);
    c.generate_thumbnails = j.value("generate_thumbnails", def.generate_thumbnails);
    c.generate_previews = j.value("generate_previews", def.generate_previews);
    c.virus_scan_enabled = j.value("virus_scan_enabled", def.virus_scan_enabled);
    c.virus_signatures = j.value("virus_signatures", def.virus_signatures);
    c.versioning_enabled = j.value("versioning_enabled", def.versioning_enabled);
    c.max_versions = j.value("max_versions", def.max_versions);
    c.cleanup_interval = j.contains("cleanup_interval")
                             ? util::parseInterval(j.at("cleanup_interval").get<std::string>())
                             : def.cleanup_interval;
    c.retention_days = j.value("retention_days", def.retention_days);
    c.chunk_size = j.value("chunk_size", def.chunk_size);
    c.concurrent_uploads = j.value("concurrent_uploads", def.concurrent_uploads);
    c.thumbnail_size = j.value("thumbnail_size", def.thumbnail_size);
    c.preview_size = j.value("preview_size", def.preview_size);
}

} // namespace fk::config
