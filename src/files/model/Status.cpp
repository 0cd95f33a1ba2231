#include "files/model/Status.hpp"
#include "files/errors.hpp"

#include <string>

namespace fk::files::model {

void transition(Status& current, const Status to) {
    if (!canTransition(current, to))
        throw InvalidTransition("Illegal status transition " + std::string(to_string(current)) + " -> " +
                                std::string(to_string(to)));
    current = to;
}

std::string_view to_string(const Status s) {
    switch (s) {
        case Status::Pending: return "pending";
        case Status::Uploading: return "uploading";
        case Status::Processing: return "processing";
        case Status::Ready: return "ready";
        case Status::Error: return "error";
        case Status::Deleted: return "deleted";
    }
    return "error";
}

std::optional<Status> statusFromString(const std::string_view s) {
    for (const auto st : ALL_STATUSES)
        if (to_string(st) == s) return st;
    return std::nullopt;
}

}
