#include "concurrency/AdmissionGate.hpp"

#include <algorithm>
#include <stdexcept>

using namespace fk::concurrency;

AdmissionGate::Slot& AdmissionGate::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void AdmissionGate::Slot::release() {
    if (!gate_) return;
    gate_->release_();
    gate_ = nullptr;
}

AdmissionGate::AdmissionGate(const unsigned int capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("AdmissionGate capacity must be > 0");
}

AdmissionGate::Slot AdmissionGate::acquire(const CancelToken& token) {
    std::unique_lock lock(mutex_);
    while (inUse_ >= capacity_) {
        if (token.isCancelled()) return {};

        // Wake periodically so a flipped token or passed deadline is noticed without a notifier.
        auto wakeAt = CancelToken::clock::now() + CANCEL_POLL_INTERVAL;
        if (const auto& deadline = token.deadline()) wakeAt = std::min(wakeAt, *deadline);
        cv_.wait_until(lock, wakeAt);
    }
    if (token.isCancelled()) return {};

    ++inUse_;
    return Slot(this);
}

AdmissionGate::Slot AdmissionGate::tryAcquire() {
    std::scoped_lock lock(mutex_);
    if (inUse_ >= capacity_) return {};
    ++inUse_;
    return Slot(this);
}

unsigned int AdmissionGate::inUse() const {
    std::scoped_lock lock(mutex_);
    return inUse_;
}

void AdmissionGate::release_() {
    {
        std::scoped_lock lock(mutex_);
        if (inUse_ > 0) --inUse_;
    }
    cv_.notify_one();
}
