#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fk::files::model {

enum class Status : uint8_t { Pending, Uploading, Processing, Ready, Error, Deleted };

inline constexpr Status ALL_STATUSES[] = {
    Status::Pending, Status::Uploading, Status::Processing, Status::Ready, Status::Error, Status::Deleted
};

constexpr bool canTransition(const Status from, const Status to) {
    switch (from) {
        case Status::Pending: return to == Status::Uploading || to == Status::Error;
        case Status::Uploading: return to == Status::Processing || to == Status::Error;
        case Status::Processing: return to == Status::Ready || to == Status::Error;
        case Status::Ready:
        case Status::Error: return to == Status::Deleted;
        case Status::Deleted: return false;
    }
    return false;
}

// Throws files::InvalidTransition when `from -> to` is not an edge of the lifecycle.
void transition(Status& current, Status to);

std::string_view to_string(Status s);
std::optional<Status> statusFromString(std::string_view s);

}
