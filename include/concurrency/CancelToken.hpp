#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace fk::concurrency {

// Shared cancellation flag with an optional deadline. Copies observe the same flag.
class CancelToken {
public:
    using clock = std::chrono::steady_clock;

    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    static CancelToken withTimeout(const clock::duration timeout) {
        CancelToken t;
        t.deadline_ = clock::now() + timeout;
        return t;
    }

    // Copy sharing this token's flag whose deadline is the earlier of the two.
    [[nodiscard]] CancelToken until(const clock::time_point tp) const {
        CancelToken t = *this;
        if (!t.deadline_ || tp < *t.deadline_) t.deadline_ = tp;
        return t;
    }

    void cancel() const { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const {
        if (flag_->load(std::memory_order_acquire)) return true;
        return deadline_ && clock::now() >= *deadline_;
    }

    [[nodiscard]] const std::optional<clock::time_point>& deadline() const { return deadline_; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::optional<clock::time_point> deadline_;
};

}
