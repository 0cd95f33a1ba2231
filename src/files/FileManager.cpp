#include "files/FileManager.hpp"
#include "files/RecordStore.hpp"
#include "files/RetentionSweeper.hpp"
#include "files/errors.hpp"
#include "storage/LocalDiskBackend.hpp"
#include "preview/Generator.hpp"
#include "security/Validator.hpp"
#include "security/VirusScanner.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <regex>

using namespace fk::files;
using namespace std::chrono;
namespace fs = std::filesystem;

namespace {

std::shared_ptr<fk::security::VirusScanner> defaultScanner(const fk::config::FileManagerConfig& cfg) {
    if (!cfg.virus_scan_enabled) return nullptr;
    return std::make_shared<fk::security::SignatureScanner>(cfg.virus_signatures);
}

bool inFlight(const model::Status s) {
    return s == model::Status::Pending || s == model::Status::Uploading || s == model::Status::Processing;
}

}

bool ListFilter::matches(const model::Record& r) const {
    if (type && r.type != *type) return false;
    if (status && r.status != *status) return false;
    if (extension) {
        auto ext = *extension;
        std::ranges::transform(ext.begin(), ext.end(), ext.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
        if (ext != r.extension) return false;
    }
    if (tag && !r.hasTag(*tag)) return false;
    return true;
}

void fk::files::to_json(nlohmann::json& j, const Stats& s) {
    nlohmann::json byType = nlohmann::json::object(), byStatus = nlohmann::json::object();
    for (const auto& [t, n] : s.by_type) byType[std::string(model::to_string(t))] = n;
    for (const auto& [st, n] : s.by_status) byStatus[std::string(model::to_string(st))] = n;

    j = {
        {"total_files", s.total_files},
        {"active_uploads", s.active_uploads},
        {"total_size", s.total_size},
        {"total_size_mb", static_cast<double>(s.total_size) / (1024.0 * 1024.0)},
        {"by_type", byType},
        {"by_status", byStatus},
    };
}

FileManager::FileManager(config::FileManagerConfig cfg, Dependencies deps)
    : config_(std::move(cfg)),
      backend_(deps.backend ? std::move(deps.backend) : std::make_shared<storage::LocalDiskBackend>()),
      store_(deps.store ? std::move(deps.store) : std::make_shared<JsonRecordStore>(config_.storage_dir / "metadata")),
      validator_(deps.validator ? std::move(deps.validator) : std::make_shared<security::DefaultValidator>()),
      policy_(config_.allowed_types, config_.blocked_types),
      upload_(backend_, config_.chunk_size, config_.max_file_size),
      processing_(backend_,
                  deps.generator ? std::move(deps.generator) : std::make_shared<preview::DefaultGenerator>(backend_, config_),
                  deps.scanner ? std::move(deps.scanner) : defaultScanner(config_),
                  {.thumbnails = config_.generate_thumbnails,
                   .previews = config_.generate_previews,
                   .virus_scan = config_.virus_scan_enabled}),
      gate_(config_.concurrent_uploads) {
    for (const auto& dir : {config_.storage_dir, config_.thumbnail_dir, config_.preview_dir, config_.temp_dir})
        if (!dir.empty()) fs::create_directories(dir);

    loadExisting();

    if (config_.cleanup_interval.count() > 0) {
        sweeper_ = std::make_unique<RetentionSweeper>(*this, config_.cleanup_interval, config_.retention_days);
        sweeper_->start();
    }

    log::Registry::filekeep()->info("[FileManager] Ready: {} records, {} tombstones, storage at {}",
                                    records_.size(), tombstones_.size(), config_.storage_dir.string());
}

FileManager::~FileManager() {
    shutdown();
}

void FileManager::shutdown() {
    if (sweeper_) sweeper_->stop();
}

void FileManager::loadExisting() {
    size_t interrupted = 0;

    for (auto& rec : store_->loadAll()) {
        if (rec.status == model::Status::Deleted) {
            tombstones_.emplace(rec.id, std::move(rec));
            continue;
        }

        if (inFlight(rec.status)) {
            model::transition(rec.status, model::Status::Error);
            rec.updated_at = system_clock::now();
            persistQuietly(rec);
            ++interrupted;
        }

        records_.emplace(rec.id, std::move(rec));
    }

    if (interrupted > 0)
        log::Registry::filekeep()->warn("[FileManager] Marked {} interrupted uploads as failed", interrupted);
}

void FileManager::persist(const model::Record& record) const {
    store_->save(record);
}

model::Record FileManager::persistLatest(const std::string& id) {
    std::scoped_lock saving(persistMutex_);
    model::Record latest;
    {
        std::shared_lock lock(mutex_);
        const auto it = records_.find(id);
        if (it == records_.end()) throw NotFound("File not found: " + id);
        latest = it->second;
    }
    persist(latest);
    return latest;
}

void FileManager::persistQuietly(const model::Record& record) const {
    try {
        store_->save(record);
    } catch (const std::exception& e) {
        log::Registry::records()->error("[FileManager] Failed to save record {}: {}", record.id, e.what());
    }
}

void FileManager::removeQuietly(const fs::path& path, const char* what, const std::string& id) const {
    if (path.empty()) return;
    try {
        backend_->remove(path);
    } catch (const std::exception& e) {
        log::Registry::storage()->error("[FileManager] Failed to delete {} of {}: {}", what, id, e.what());
    }
}

fk::concurrency::CancelToken FileManager::tokenFor(const UploadOptions& options) const {
    return options.deadline ? options.cancel.until(*options.deadline) : options.cancel;
}

void FileManager::setStatus(const std::string& id, const model::Status to) {
    std::unique_lock lock(mutex_);
    auto& r = records_.at(id);
    model::transition(r.status, to);
    r.updated_at = system_clock::now();
}

void FileManager::failUpload(const std::string& id) {
    std::optional<model::Record> snapshot;
    {
        std::unique_lock lock(mutex_);
        progress_.erase(id);
        if (const auto it = records_.find(id); it != records_.end()) {
            if (inFlight(it->second.status)) model::transition(it->second.status, model::Status::Error);
            it->second.updated_at = system_clock::now();
            snapshot = it->second;
        }
    }
    if (snapshot) persistQuietly(*snapshot);
}

void FileManager::updateProgress(const std::string& id, const model::UploadProgress& p, const UploadOptions& options) {
    model::UploadProgress merged;
    {
        std::unique_lock lock(mutex_);
        const auto it = progress_.find(id);
        if (it == progress_.end()) return;
        it->second = p;
        merged = p;
    }
    if (options.on_progress) options.on_progress(id, merged);
}

model::Record FileManager::uploadFile(std::istream& source,
                                      const std::string& filename,
                                      const nlohmann::json& metadata,
                                      const UploadOptions& options) {
    const auto name = validator_->sanitizeInput(filename);
    if (name.empty()) throw ValidationError("Invalid filename after sanitization");
    if (validator_->containsMaliciousContent(name)) {
        log::Registry::security()->warn("[FileManager] Rejected filename: {}", name);
        throw ValidationError("Filename contains potentially malicious content: " + name);
    }

    const nlohmann::json meta = metadata.is_null() ? nlohmann::json::object() : metadata;
    validator_->validateRequestBody(meta);

    const auto ext = model::normalizedExtension(name);
    const auto mime = model::inferMimeTypeFromPath(name);
    policy_.check(ext, mime);

    const auto now = system_clock::now();

    model::Record rec;
    rec.id = crypto::makeId("files");
    rec.name = rec.original_name = name;
    rec.path = config_.storage_dir / (rec.id + ext);
    rec.type = model::classify(name);
    rec.mime_type = mime;
    rec.extension = ext;
    rec.status = model::Status::Pending;
    rec.created_at = rec.updated_at = rec.accessed_at = now;
    rec.uploaded_by = options.uploaded_by;
    rec.metadata = meta;
    for (const auto& tag : options.tags)
        if (auto t = validator_->sanitizeInput(tag); !t.empty()) rec.tags.insert(std::move(t));

    const std::string id = rec.id;

    model::UploadProgress initial;
    initial.total_bytes = options.expected_size;
    initial.started_at = initial.last_update = model::UploadProgress::clock::now();

    {
        std::unique_lock lock(mutex_);
        records_.emplace(id, rec);
        progress_.emplace(id, initial);
    }
    persistQuietly(rec);

    const auto token = tokenFor(options);
    auto slot = gate_.acquire(token);
    if (!slot.held()) {
        failUpload(id);
        log::Registry::upload()->info("[FileManager] Upload of {} ({}) cancelled while waiting for a slot", name, id);
        throw Cancelled("Upload of " + name + " cancelled while waiting for an upload slot");
    }

    UploadResult result;
    try {
        setStatus(id, model::Status::Uploading);
        result = upload_.run(source, rec.path, options.expected_size, token,
                             [&](const model::UploadProgress& p) { updateProgress(id, p, options); });
    } catch (const Error& e) {
        failUpload(id);
        log::Registry::upload()->warn("[FileManager] Upload of {} ({}) failed: {}", name, id, e.what());
        throw;
    } catch (const std::exception& e) {
        failUpload(id);
        log::Registry::upload()->warn("[FileManager] Upload of {} ({}) failed: {}", name, id, e.what());
        throw IOError("Upload of " + name + " failed: " + e.what());
    }

    model::Record processing;
    {
        std::unique_lock lock(mutex_);
        auto& r = records_.at(id);
        r.size_bytes = result.size_bytes;
        r.content_hash = result.content_hash;
        r.checksum = result.checksum;
        model::transition(r.status, model::Status::Processing);
        r.updated_at = system_clock::now();
        processing = r;
    }

    const auto outcome = processing_.run(processing);

    model::Record done;
    {
        std::unique_lock lock(mutex_);
        auto& r = records_.at(id);
        r.thumbnail = outcome.thumbnail;
        r.preview = outcome.preview;
        r.virus_scan = outcome.virus_scan;
        model::transition(r.status, outcome.infected() ? model::Status::Error : model::Status::Ready);
        r.updated_at = system_clock::now();
        progress_.erase(id);
        done = r;
    }
    slot.release();

    if (outcome.infected()) {
        removeQuietly(done.path, "infected content", id);
        persistQuietly(done);
        throw ThreatDetected(done.virus_scan->threats);
    }

    persistQuietly(done);
    log::Registry::filekeep()->info("[FileManager] Uploaded {} ({}, {} bytes)", name, id, done.size_bytes);
    return done;
}

Download FileManager::downloadFile(const std::string& id) {
    model::Record snapshot;
    {
        std::unique_lock lock(mutex_);
        const auto it = records_.find(id);
        if (it == records_.end()) throw NotFound("File not found: " + id);
        if (it->second.status != model::Status::Ready)
            throw NotReady("File not ready: " + id + " is " + std::string(model::to_string(it->second.status)));
        it->second.accessed_at = system_clock::now();
        snapshot = it->second;
    }

    try {
        return {backend_->open(snapshot.path), std::move(snapshot)};
    } catch (const std::exception& e) {
        throw IOError("Failed to open " + id + ": " + e.what());
    }
}

std::optional<model::Record> FileManager::getFileInfo(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = records_.find(id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

std::optional<model::Record> FileManager::getTombstone(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = tombstones_.find(id);
    if (it == tombstones_.end()) return std::nullopt;
    return it->second;
}

std::vector<model::Record> FileManager::listFiles(const ListFilter& filter) const {
    std::vector<model::Record> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [_, r] : records_)
            if (filter.matches(r)) out.push_back(r);
    }

    std::ranges::sort(out, [](const model::Record& a, const model::Record& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });
    return out;
}

void FileManager::deleteFile(const std::string& id) {
    model::Record snapshot;
    {
        std::unique_lock lock(mutex_);
        const auto it = records_.find(id);
        if (it == records_.end()) throw NotFound("File not found: " + id);

        auto& r = it->second;
        model::transition(r.status, model::Status::Deleted);
        r.deleted_at = r.updated_at = system_clock::now();
        snapshot = r;
        tombstones_.insert_or_assign(id, std::move(r));
        records_.erase(it);
    }

    removeQuietly(snapshot.path, "content", id);
    if (snapshot.thumbnail) removeQuietly(snapshot.thumbnail->path, "thumbnail", id);
    if (snapshot.preview) removeQuietly(snapshot.preview->path, "preview", id);
    for (const auto& v : snapshot.versions) removeQuietly(v.path, "version", id);

    persistQuietly(snapshot);
    log::Registry::filekeep()->info("[FileManager] Deleted {} ({})", snapshot.name, id);
}

template <typename Fn>
model::Record FileManager::mutateActive(const std::string& id, Fn&& fn) {
    std::unique_lock lock(mutex_);
    const auto it = records_.find(id);
    if (it == records_.end()) throw NotFound("File not found: " + id);

    fn(it->second);
    it->second.updated_at = system_clock::now();
    lock.unlock();

    return persistLatest(id);
}

model::Record FileManager::updateMetadata(const std::string& id, const nlohmann::json& metadata) {
    validator_->validateRequestBody(metadata);
    return mutateActive(id, [&](model::Record& r) {
        if (!r.metadata.is_object()) r.metadata = nlohmann::json::object();
        for (const auto& [key, value] : metadata.items()) r.metadata[key] = value;
    });
}

model::Record FileManager::addTags(const std::string& id, const std::vector<std::string>& tags) {
    std::vector<std::string> clean;
    for (const auto& tag : tags)
        if (auto t = validator_->sanitizeInput(tag); !t.empty()) clean.push_back(std::move(t));

    return mutateActive(id, [&](model::Record& r) { r.tags.insert(clean.begin(), clean.end()); });
}

model::Record FileManager::setPermissions(const std::string& id, const model::Permissions& permissions) {
    static const std::regex modePattern("^[0-7]{3,4}$");
    if (!std::regex_match(permissions.mode, modePattern))
        throw ValidationError("Invalid permission mode: " + permissions.mode);

    return mutateActive(id, [&](model::Record& r) { r.permissions = permissions; });
}

std::optional<model::UploadProgress> FileManager::getUploadProgress(const std::string& id) const {
    std::shared_lock lock(mutex_);
    const auto it = progress_.find(id);
    if (it == progress_.end()) return std::nullopt;
    return it->second;
}

Stats FileManager::getStats() const {
    std::shared_lock lock(mutex_);

    Stats s;
    s.total_files = records_.size();
    s.active_uploads = progress_.size();
    for (const auto& [_, r] : records_) {
        s.total_size += r.size_bytes;
        ++s.by_type[r.type];
        ++s.by_status[r.status];
    }
    return s;
}

std::unique_ptr<std::istream> FileManager::getThumbnail(const std::string& id) const {
    fs::path path;
    {
        std::shared_lock lock(mutex_);
        const auto it = records_.find(id);
        if (it == records_.end()) throw NotFound("File not found: " + id);
        if (!it->second.thumbnail) throw NotFound("Thumbnail not available for file: " + id);
        path = it->second.thumbnail->path;
    }

    try {
        return backend_->open(path);
    } catch (const std::exception& e) {
        throw IOError("Failed to open thumbnail of " + id + ": " + e.what());
    }
}

std::unique_ptr<std::istream> FileManager::getPreview(const std::string& id) const {
    fs::path path;
    {
        std::shared_lock lock(mutex_);
        const auto it = records_.find(id);
        if (it == records_.end()) throw NotFound("File not found: " + id);
        if (!it->second.preview) throw NotFound("Preview not available for file: " + id);
        path = it->second.preview->path;
    }

    try {
        return backend_->open(path);
    } catch (const std::exception& e) {
        throw IOError("Failed to open preview of " + id + ": " + e.what());
    }
}

model::Record FileManager::addVersion(const std::string& id,
                                      std::istream& source,
                                      const std::string& comment,
                                      const UploadOptions& options) {
    if (!config_.versioning_enabled) throw ValidationError("Versioning is disabled");

    model::Record base;
    {
        std::unique_lock lock(mutex_);
        const auto it = records_.find(id);
        if (it == records_.end()) throw NotFound("File not found: " + id);
        if (it->second.status != model::Status::Ready) throw NotReady("File not ready: " + id);
        if (versioning_.contains(id)) throw InvalidTransition("A new version of " + id + " is already uploading");
        versioning_.insert(id);
        base = it->second;

        model::UploadProgress initial;
        initial.total_bytes = options.expected_size;
        initial.started_at = initial.last_update = model::UploadProgress::clock::now();
        progress_.insert_or_assign(id, initial);
    }

    struct Release {
        FileManager& fm;
        const std::string& id;
        ~Release() {
            std::unique_lock lock(fm.mutex_);
            fm.versioning_.erase(id);
            fm.progress_.erase(id);
        }
    } release{*this, id};

    const unsigned int current = base.version;
    const auto newPath = config_.storage_dir / (id + "_v" + std::to_string(current + 1) + base.extension);

    const auto token = tokenFor(options);
    auto slot = gate_.acquire(token);
    if (!slot.held()) throw Cancelled("New version of " + id + " cancelled while waiting for an upload slot");

    UploadResult result;
    try {
        result = upload_.run(source, newPath, options.expected_size, token,
                             [&](const model::UploadProgress& p) { updateProgress(id, p, options); });
    } catch (const Error& e) {
        log::Registry::upload()->warn("[FileManager] New version of {} failed: {}", id, e.what());
        throw;
    } catch (const std::exception& e) {
        log::Registry::upload()->warn("[FileManager] New version of {} failed: {}", id, e.what());
        throw IOError("New version of " + id + " failed: " + e.what());
    }

    model::Record candidate = base;
    candidate.path = newPath;
    candidate.size_bytes = result.size_bytes;
    candidate.content_hash = result.content_hash;
    candidate.checksum = result.checksum;

    const auto outcome = processing_.run(candidate);
    slot.release();

    if (outcome.infected()) {
        removeQuietly(newPath, "infected version", id);
        throw ThreatDetected(outcome.virus_scan->threats);
    }

    std::vector<fs::path> pruned;
    model::Record updated;
    {
        std::unique_lock lock(mutex_);
        const auto it = records_.find(id);
        if (it == records_.end()) {
            lock.unlock();
            removeQuietly(newPath, "orphaned version", id);
            if (outcome.thumbnail) removeQuietly(outcome.thumbnail->path, "orphaned thumbnail", id);
            if (outcome.preview) removeQuietly(outcome.preview->path, "orphaned preview", id);
            throw NotFound("File was deleted while a new version uploaded: " + id);
        }

        auto& r = it->second;
        const auto now = system_clock::now();

        model::Version archived;
        archived.id = crypto::makeId("versions");
        archived.number = current;
        archived.path = r.path;
        archived.size_bytes = r.size_bytes;
        archived.content_hash = r.content_hash;
        archived.checksum = r.checksum;
        archived.created_at = now;
        archived.created_by = r.uploaded_by;
        archived.comment = r.version_comment;
        r.versions.push_back(std::move(archived));

        r.version = current + 1;
        r.version_comment = comment;

        r.path = newPath;
        r.size_bytes = result.size_bytes;
        r.content_hash = result.content_hash;
        r.checksum = result.checksum;
        r.thumbnail = outcome.thumbnail;
        r.preview = outcome.preview;
        r.virus_scan = outcome.virus_scan;
        if (!options.uploaded_by.empty()) r.uploaded_by = options.uploaded_by;
        r.updated_at = now;

        while (r.versions.size() > config_.max_versions) {
            pruned.push_back(r.versions.front().path);
            r.versions.erase(r.versions.begin());
        }

        updated = r;
    }

    if (base.thumbnail && !outcome.thumbnail) removeQuietly(base.thumbnail->path, "stale thumbnail", id);
    if (base.preview && (!outcome.preview || outcome.preview->path != base.preview->path))
        removeQuietly(base.preview->path, "stale preview", id);
    for (const auto& p : pruned) removeQuietly(p, "pruned version", id);

    persistQuietly(updated);
    log::Registry::filekeep()->info("[FileManager] Added version {} of {} ({} bytes, {} kept)",
                                    current + 1, id, updated.size_bytes, updated.versions.size());
    return updated;
}

size_t FileManager::purgeTombstones(const system_clock::time_point cutoff) {
    std::vector<std::string> purged;
    {
        std::unique_lock lock(mutex_);
        for (auto it = tombstones_.begin(); it != tombstones_.end();) {
            const auto& r = it->second;
            if (r.deleted_at && *r.deleted_at < cutoff && r.created_at < cutoff) {
                purged.push_back(it->first);
                it = tombstones_.erase(it);
            } else ++it;
        }
    }

    for (const auto& id : purged) {
        try {
            store_->remove(id);
        } catch (const std::exception& e) {
            log::Registry::records()->error("[FileManager] Failed to remove purged record {}: {}", id, e.what());
        }
    }

    return purged.size();
}
