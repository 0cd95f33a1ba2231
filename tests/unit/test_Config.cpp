#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/interval.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace fk::config;

TEST(ConfigTest, EmptyDocumentYieldsDefaults) {
    const auto cfg = loadConfigFromString("{}");
    const FileManagerConfig def;

    EXPECT_EQ(cfg.file_manager.storage_dir, def.storage_dir);
    EXPECT_EQ(cfg.file_manager.max_file_size, 100u * 1024 * 1024);
    EXPECT_EQ(cfg.file_manager.allowed_types, (std::vector<std::string>{"image/*", "text/*", "application/pdf"}));
    EXPECT_TRUE(cfg.file_manager.generate_thumbnails);
    EXPECT_FALSE(cfg.file_manager.virus_scan_enabled);
    EXPECT_EQ(cfg.file_manager.max_versions, 10u);
    EXPECT_EQ(cfg.file_manager.cleanup_interval, std::chrono::hours(24));
    EXPECT_EQ(cfg.file_manager.retention_days, 30u);
    EXPECT_EQ(cfg.file_manager.chunk_size, 1024u * 1024);
    EXPECT_EQ(cfg.file_manager.concurrent_uploads, 5u);
    EXPECT_TRUE(cfg.logging.log_dir.empty());
}

TEST(ConfigTest, ParsesFileManagerSection) {
    const auto cfg = loadConfigFromString(R"(
file_manager:
  storage_dir: /srv/files
  max_file_size_mb: 2
  allowed_types: ["image/png", ".txt"]
  blocked_types: [exe]
  virus_scan_enabled: true
  virus_signatures: ["deadbeef"]
  cleanup_interval: 30m
  retention_days: 7
  concurrent_uploads: 2
logging:
  log_levels:
    subsystem_levels:
      upload: debug
)");

    EXPECT_EQ(cfg.file_manager.storage_dir, "/srv/files");
    EXPECT_EQ(cfg.file_manager.max_file_size, 2u * 1024 * 1024);
    EXPECT_EQ(cfg.file_manager.allowed_types.size(), 2u);
    EXPECT_EQ(cfg.file_manager.blocked_types.front(), "exe");
    EXPECT_TRUE(cfg.file_manager.virus_scan_enabled);
    EXPECT_EQ(cfg.file_manager.cleanup_interval, std::chrono::minutes(30));
    EXPECT_EQ(cfg.file_manager.retention_days, 7u);
    EXPECT_EQ(cfg.file_manager.concurrent_uploads, 2u);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.upload, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.records, spdlog::level::err);
}

TEST(ConfigTest, RejectsZeroConcurrency) {
    EXPECT_THROW(loadConfigFromString("file_manager:\n  concurrent_uploads: 0\n"), std::exception);
}

TEST(ConfigTest, RejectsNonMappingSection) {
    EXPECT_THROW(loadConfigFromString("file_manager: [1, 2]\n"), std::exception);
}

TEST(ConfigTest, LoadsFromFile) {
    const auto path = fs::temp_directory_path() / "filekeep_config_test.yaml";
    {
        std::ofstream out(path);
        out << "file_manager:\n  max_file_size: 10\n  generate_previews: false\n";
    }

    const auto cfg = loadConfig(path);
    EXPECT_EQ(cfg.file_manager.max_file_size, 10u);
    EXPECT_FALSE(cfg.file_manager.generate_previews);
    fs::remove(path);
}

TEST(ConfigTest, JsonCarriesFileManagerSettings) {
    Config cfg;
    cfg.file_manager.max_versions = 3;
    cfg.file_manager.cleanup_interval = std::chrono::hours(6);

    const nlohmann::json j = cfg;
    Config back = j.get<Config>();
    EXPECT_EQ(back.file_manager.max_versions, 3u);
    EXPECT_EQ(back.file_manager.cleanup_interval, std::chrono::hours(6));
}

TEST(IntervalTest, ParsesUnits) {
    using fk::util::parseInterval;
    EXPECT_EQ(parseInterval("90"), std::chrono::seconds(90));
    EXPECT_EQ(parseInterval("30m"), std::chrono::minutes(30));
    EXPECT_EQ(parseInterval("24h"), std::chrono::hours(24));
    EXPECT_EQ(parseInterval("7d"), std::chrono::hours(24 * 7));
    EXPECT_THROW(parseInterval("soon"), std::invalid_argument);
    EXPECT_THROW(parseInterval("5w"), std::invalid_argument);
    EXPECT_EQ(fk::util::intervalToString(std::chrono::hours(48)), "2d");
}

TEST(ConfigRegistryTest, DefaultPathHonoursEnvironment) {
    setenv("FILEKEEP_CONFIG", "/tmp/custom.yaml", 1);
    EXPECT_EQ(ConfigRegistry::defaultPath(), "/tmp/custom.yaml");
    unsetenv("FILEKEEP_CONFIG");
    EXPECT_EQ(ConfigRegistry::defaultPath(), "/etc/filekeep/config.yaml");
}
