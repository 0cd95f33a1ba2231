#pragma once

#include "config/Config.hpp"
#include "concurrency/AdmissionGate.hpp"
#include "concurrency/CancelToken.hpp"
#include "crypto/id.hpp"
#include "files/model/Record.hpp"
#include "files/model/Progress.hpp"
#include "files/TypePolicy.hpp"
#include "files/UploadPipeline.hpp"
#include "files/ProcessingPipeline.hpp"

#include <chrono>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace fk::storage { class Backend; }
namespace fk::preview { class Generator; }
namespace fk::security { class Validator; class VirusScanner; }

namespace fk::files {

class RecordStore;
class RetentionSweeper;

struct UploadOptions {
    std::string uploaded_by;
    std::optional<uintmax_t> expected_size;
    std::vector<std::string> tags;
    concurrency::CancelToken cancel;
    std::optional<concurrency::CancelToken::clock::time_point> deadline;
    std::function<void(const std::string& id, const model::UploadProgress&)> on_progress;
};

struct ListFilter {
    std::optional<model::Type> type;
    std::optional<model::Status> status;
    std::optional<std::string> extension;
    std::optional<std::string> tag;

    [[nodiscard]] bool matches(const model::Record& r) const;
};

struct Stats {
    size_t total_files = 0;
    size_t active_uploads = 0;
    uintmax_t total_size = 0;
    std::map<model::Type, size_t> by_type;
    std::map<model::Status, size_t> by_status;
};

void to_json(nlohmann::json& j, const Stats& s);

struct Download {
    std::unique_ptr<std::istream> stream;
    model::Record record;
};

// Collaborators handed to a FileManager. Null members are replaced by the defaults
// built from the config (local disk, JSON records, signature scanner, ...).
struct Dependencies {
    std::shared_ptr<storage::Backend> backend;
    std::shared_ptr<RecordStore> store;
    std::shared_ptr<security::Validator> validator;
    std::shared_ptr<preview::Generator> generator;
    std::shared_ptr<security::VirusScanner> scanner;
};

class FileManager {
public:
    explicit FileManager(config::FileManagerConfig cfg, Dependencies deps = {});
    ~FileManager();

    FileManager(const FileManager&) = delete;
    FileManager& operator=(const FileManager&) = delete;

    model::Record uploadFile(std::istream& source,
                             const std::string& filename,
                             const nlohmann::json& metadata = nlohmann::json::object(),
                             const UploadOptions& options = {});

    Download downloadFile(const std::string& id);

    [[nodiscard]] std::optional<model::Record> getFileInfo(const std::string& id) const;

    // Newest first.
    [[nodiscard]] std::vector<model::Record> listFiles(const ListFilter& filter = {}) const;

    void deleteFile(const std::string& id);

    model::Record updateMetadata(const std::string& id, const nlohmann::json& metadata);

    model::Record addTags(const std::string& id, const std::vector<std::string>& tags);

    model::Record setPermissions(const std::string& id, const model::Permissions& permissions);

    [[nodiscard]] std::optional<model::UploadProgress> getUploadProgress(const std::string& id) const;

    [[nodiscard]] Stats getStats() const;

    std::unique_ptr<std::istream> getThumbnail(const std::string& id) const;
    std::unique_ptr<std::istream> getPreview(const std::string& id) const;

    // Replaces the content of a ready record; the previous content is kept as a version.
    model::Record addVersion(const std::string& id,
                             std::istream& source,
                             const std::string& comment = {},
                             const UploadOptions& options = {});

    [[nodiscard]] std::optional<model::Record> getTombstone(const std::string& id) const;

    // Drops every tombstone whose deletion and creation times are both before `cutoff`.
    size_t purgeTombstones(std::chrono::system_clock::time_point cutoff);

    // Stops the retention sweeper. Idempotent.
    void shutdown();

    [[nodiscard]] const config::FileManagerConfig& config() const { return config_; }

    [[nodiscard]] unsigned int slotsInUse() const { return gate_.inUse(); }

private:
    void loadExisting();
    void persist(const model::Record& record) const;
    model::Record persistLatest(const std::string& id);
    void persistQuietly(const model::Record& record) const;

    void failUpload(const std::string& id);
    void setStatus(const std::string& id, model::Status to);
    void updateProgress(const std::string& id, const model::UploadProgress& p, const UploadOptions& options);

    [[nodiscard]] concurrency::CancelToken tokenFor(const UploadOptions& options) const;

    template <typename Fn>
    model::Record mutateActive(const std::string& id, Fn&& fn);

    void removeQuietly(const std::filesystem::path& path, const char* what, const std::string& id) const;

    config::FileManagerConfig config_;

    std::shared_ptr<storage::Backend> backend_;
    std::shared_ptr<RecordStore> store_;
    std::shared_ptr<security::Validator> validator_;

    TypePolicy policy_;
    UploadPipeline upload_;
    ProcessingPipeline processing_;
    concurrency::AdmissionGate gate_;

    mutable std::shared_mutex mutex_;
    std::mutex persistMutex_;
    std::unordered_map<std::string, model::Record> records_;
    std::unordered_map<std::string, model::Record> tombstones_;
    std::unordered_map<std::string, model::UploadProgress> progress_;
    std::unordered_set<std::string> versioning_;

    std::unique_ptr<RetentionSweeper> sweeper_;
};

}
