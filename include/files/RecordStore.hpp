#pragma once

#include "files/model/Record.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fk::files {

class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual void save(const model::Record& record) = 0;

    [[nodiscard]] virtual std::optional<model::Record> load(const std::string& id) const = 0;

    // Idempotent.
    virtual void remove(const std::string& id) = 0;

    [[nodiscard]] virtual std::vector<model::Record> loadAll() const = 0;
};

// One "<id>.json" document per record under `dir`, written atomically.
class JsonRecordStore final : public RecordStore {
public:
    explicit JsonRecordStore(std::filesystem::path dir);

    void save(const model::Record& record) override;
    [[nodiscard]] std::optional<model::Record> load(const std::string& id) const override;
    void remove(const std::string& id) override;
    [[nodiscard]] std::vector<model::Record> loadAll() const override;

    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
    [[nodiscard]] std::filesystem::path pathFor(const std::string& id) const;

    std::filesystem::path dir_;
};

}
