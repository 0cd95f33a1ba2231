#pragma once

#include "files/model/Type.hpp"
#include "files/model/Status.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fk::files::model {

using time_point = std::chrono::system_clock::time_point;

struct Thumbnail {
    std::filesystem::path path;
    unsigned int width = 0, height = 0;
    uintmax_t size_bytes = 0;
};

struct Preview {
    std::filesystem::path path;
    std::string kind; // "image" or "text"
    unsigned int width = 0, height = 0;
    unsigned int page_count = 0;
    time_point generated_at{};
};

struct Version {
    std::string id;
    unsigned int number = 0;
    std::filesystem::path path;
    uintmax_t size_bytes = 0;
    std::string content_hash, checksum;
    time_point created_at{};
    std::string created_by;
    std::string comment;
};

struct Permissions {
    std::string owner, group;
    std::string mode = "0644";
    bool is_public = false;
    std::vector<std::string> shared_with;
    std::optional<time_point> expires_at;
};

struct ScanResult {
    bool scanned = false;
    bool clean = true;
    std::vector<std::string> threats;
    std::string scanner;
    time_point scanned_at{};
};

struct Record {
    std::string id;
    std::string name, original_name;
    std::filesystem::path path;
    uintmax_t size_bytes = 0;
    Type type = Type::Other;
    std::string mime_type;
    std::string extension;
    Status status = Status::Pending;
    std::string content_hash, checksum;
    time_point created_at{}, updated_at{}, accessed_at{};
    std::optional<time_point> deleted_at;
    std::string uploaded_by;
    std::set<std::string> tags;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<Thumbnail> thumbnail;
    std::optional<Preview> preview;
    unsigned int version = 1;
    std::string version_comment;
    std::vector<Version> versions;
    std::optional<Permissions> permissions;
    std::optional<ScanResult> virus_scan;

    [[nodiscard]] bool hasTag(const std::string& tag) const { return tags.contains(tag); }
};

int64_t toMillis(time_point tp);
time_point fromMillis(int64_t ms);

void to_json(nlohmann::json& j, const Thumbnail& t);
void from_json(const nlohmann::json& j, Thumbnail& t);
void to_json(nlohmann::json& j, const Preview& p);
void from_json(const nlohmann::json& j, Preview& p);
void to_json(nlohmann::json& j, const Version& v);
void from_json(const nlohmann::json& j, Version& v);
void to_json(nlohmann::json& j, const Permissions& p);
void from_json(const nlohmann::json& j, Permissions& p);
void to_json(nlohmann::json& j, const ScanResult& s);
void from_json(const nlohmann::json& j, ScanResult& s);
void to_json(nlohmann::json& j, const Record& r);
void from_json(const nlohmann::json& j, Record& r);

}
