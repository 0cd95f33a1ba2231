#include "files/model/Record.hpp"

#include <stdexcept>

using namespace fk::files::model;
using nlohmann::json;

int64_t fk::files::model::toMillis(const time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

time_point fk::files::model::fromMillis(const int64_t ms) {
    return time_point(std::chrono::duration_cast<time_point::duration>(std::chrono::milliseconds(ms)));
}

namespace {

template <typename T>
void optionalTo(json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
    else j[key] = nullptr;
}

template <typename T>
void optionalFrom(const json& j, const char* key, std::optional<T>& v) {
    if (j.contains(key) && !j.at(key).is_null()) v = j.at(key).get<T>();
    else v.reset();
}

}

void fk::files::model::to_json(json& j, const Thumbnail& t) {
    j = {
        {"path", t.path.string()},
        {"width", t.width},
        {"height", t.height},
        {"size_bytes", t.size_bytes},
    };
}

void fk::files::model::from_json(const json& j, Thumbnail& t) {
    t.path = j.at("path").get<std::string>();
    t.width = j.value("width", 0u);
    t.height = j.value("height", 0u);
    t.size_bytes = j.value("size_bytes", uintmax_t{0});
}

void fk::files::model::to_json(json& j, const Preview& p) {
    j = {
        {"path", p.path.string()},
        {"kind", p.kind},
        {"width", p.width},
        {"height", p.height},
        {"page_count", p.page_count},
        {"generated_at", toMillis(p.generated_at)},
    };
}

void fk::files::model::from_json(const json& j, Preview& p) {
    p.path = j.at("path").get<std::string>();
    p.kind = j.value("kind", std::string{});
    p.width = j.value("width", 0u);
    p.height = j.value("height", 0u);
    p.page_count = j.value("page_count", 0u);
    p.generated_at = fromMillis(j.value("generated_at", int64_t{0}));
}

void fk::files::model::to_json(json& j, const Version& v) {
    j = {
        {"id", v.id},
        {"number", v.number},
        {"path", v.path.string()},
        {"size_bytes", v.size_bytes},
        {"content_hash", v.content_hash},
        {"checksum", v.checksum},
        {"created_at", toMillis(v.created_at)},
        {"created_by", v.created_by},
        {"comment", v.comment},
    };
}

void fk::files::model::from_json(const json& j, Version& v) {
    v.id = j.at("id").get<std::string>();
    v.number = j.at("number").get<unsigned int>();
    v.path = j.at("path").get<std::string>();
    v.size_bytes = j.value("size_bytes", uintmax_t{0});
    v.content_hash = j.value("content_hash", std::string{});
    v.checksum = j.value("checksum", std::string{});
    v.created_at = fromMillis(j.value("created_at", int64_t{0}));
    v.created_by = j.value("created_by", std::string{});
    v.comment = j.value("comment", std::string{});
}

void fk::files::model::to_json(json& j, const Permissions& p) {
    j = {
        {"owner", p.owner},
        {"group", p.group},
        {"mode", p.mode},
        {"public", p.is_public},
        {"shared_with", p.shared_with},
    };
    if (p.expires_at) j["expires_at"] = toMillis(*p.expires_at);
    else j["expires_at"] = nullptr;
}

void fk::files::model::from_json(const json& j, Permissions& p) {
    p.owner = j.value("owner", std::string{});
    p.group = j.value("group", std::string{});
    p.mode = j.value("mode", std::string{"0644"});
    p.is_public = j.value("public", false);
    p.shared_with = j.value("shared_with", std::vector<std::string>{});
    if (j.contains("expires_at") && !j.at("expires_at").is_null())
        p.expires_at = fromMillis(j.at("expires_at").get<int64_t>());
    else p.expires_at.reset();
}

void fk::files::model::to_json(json& j, const ScanResult& s) {
    j = {
        {"scanned", s.scanned},
        {"clean", s.clean},
        {"threats", s.threats},
        {"scanner", s.scanner},
        {"scanned_at", toMillis(s.scanned_at)},
    };
}

void fk::files::model::from_json(const json& j, ScanResult& s) {
    s.scanned = j.value("scanned", false);
    s.clean = j.value("clean", true);
    s.threats = j.value("threats", std::vector<std::string>{});
    s.scanner = j.value("scanner", std::string{});
    s.scanned_at = fromMillis(j.value("scanned_at", int64_t{0}));
}

void fk::files::model::to_json(json& j, const Record& r) {
    j = {
        {"id", r.id},
        {"name", r.name},
        {"original_name", r.original_name},
        {"path", r.path.string()},
        {"size_bytes", r.size_bytes},
        {"type", to_string(r.type)},
        {"mime_type", r.mime_type},
        {"extension", r.extension},
        {"status", to_string(r.status)},
        {"content_hash", r.content_hash},
        {"checksum", r.checksum},
        {"created_at", toMillis(r.created_at)},
        {"updated_at", toMillis(r.updated_at)},
        {"accessed_at", toMillis(r.accessed_at)},
        {"uploaded_by", r.uploaded_by},
        {"tags", r.tags},
        {"metadata", r.metadata},
        {"version", r.version},
        {"version_comment", r.version_comment},
        {"versions", r.versions},
    };

    if (r.deleted_at) j["deleted_at"] = toMillis(*r.deleted_at);
    else j["deleted_at"] = nullptr;

    optionalTo(j, "thumbnail", r.thumbnail);
    optionalTo(j, "preview", r.preview);
    optionalTo(j, "permissions", r.permissions);
    optionalTo(j, "virus_scan", r.virus_scan);
}

void fk::files::model::from_json(const json& j, Record& r) {
    r.id = j.at("id").get<std::string>();
    r.name = j.at("name").get<std::string>();
    r.original_name = j.value("original_name", r.name);
    r.path = j.at("path").get<std::string>();
    r.size_bytes = j.value("size_bytes", uintmax_t{0});

    const auto type = typeFromString(j.value("type", std::string{"other"}));
    r.type = type.value_or(Type::Other);

    const auto statusStr = j.at("status").get<std::string>();
    const auto status = statusFromString(statusStr);
    if (!status) throw std::invalid_argument("Unknown record status: " + statusStr);
    r.status = *status;

    r.mime_type = j.value("mime_type", std::string{});
    r.extension = j.value("extension", std::string{});
    r.content_hash = j.value("content_hash", std::string{});
    r.checksum = j.value("checksum", std::string{});
    r.created_at = fromMillis(j.value("created_at", int64_t{0}));
    r.updated_at = fromMillis(j.value("updated_at", int64_t{0}));
    r.accessed_at = fromMillis(j.value("accessed_at", int64_t{0}));

    if (j.contains("deleted_at") && !j.at("deleted_at").is_null())
        r.deleted_at = fromMillis(j.at("deleted_at").get<int64_t>());
    else r.deleted_at.reset();

    r.uploaded_by = j.value("uploaded_by", std::string{});
    r.tags = j.value("tags", std::set<std::string>{});
    r.metadata = j.contains("metadata") && j.at("metadata").is_object() ? j.at("metadata") : json::object();
    r.versions = j.value("versions", std::vector<Version>{});
    r.version = j.value("version", r.versions.empty() ? 1u : r.versions.back().number + 1);
    r.version_comment = j.value("version_comment", std::string{});

    optionalFrom(j, "thumbnail", r.thumbnail);
    optionalFrom(j, "preview", r.preview);
    optionalFrom(j, "permissions", r.permissions);
    optionalFrom(j, "virus_scan", r.virus_scan);
}
