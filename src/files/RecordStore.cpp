#include "files/RecordStore.hpp"
#include "files/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace fk::files;
namespace fs = std::filesystem;

JsonRecordStore::JsonRecordStore(fs::path dir) : dir_(std::move(dir)) {
    fs::create_directories(dir_);
}

fs::path JsonRecordStore::pathFor(const std::string& id) const {
    if (id.empty() || id.find('/') != std::string::npos || id.find("..") != std::string::npos)
        throw ValidationError("Invalid record id: " + id);
    return dir_ / (id + ".json");
}

void JsonRecordStore::save(const model::Record& record) {
    const nlohmann::json j = record;
    try {
        util::writeFileAtomic(pathFor(record.id), j.dump(2));
    } catch (const std::runtime_error& e) {
        if (dynamic_cast<const Error*>(&e)) throw;
        throw IOError("Failed to save record " + record.id + ": " + e.what());
    }
}

std::optional<model::Record> JsonRecordStore::load(const std::string& id) const {
    const auto path = pathFor(id);
    if (!fs::exists(path)) return std::nullopt;

    try {
        return nlohmann::json::parse(util::readFileToString(path)).get<model::Record>();
    } catch (const std::exception& e) {
        throw IOError("Failed to load record " + id + ": " + e.what());
    }
}

void JsonRecordStore::remove(const std::string& id) {
    std::error_code ec;
    fs::remove(pathFor(id), ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw IOError("Failed to remove record " + id + ": " + ec.message());
}

std::vector<model::Record> JsonRecordStore::loadAll() const {
    std::vector<model::Record> records;
    if (!fs::exists(dir_)) return records;

    for (const auto& entry : fs::directory_iterator(dir_)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        if (entry.path().filename().string().starts_with(".")) continue; // leftover temp files

        try {
            records.push_back(nlohmann::json::parse(util::readFileToString(entry.path())).get<model::Record>());
        } catch (const std::exception& e) {
            log::Registry::records()->error("[JsonRecordStore] Skipping unreadable record {}: {}",
                                            entry.path().string(), e.what());
        }
    }

    return records;
}
