#pragma once

#include "concurrency/CancelToken.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace fk::concurrency {

// Fixed-capacity gate bounding how many units of work may run at once.
class AdmissionGate {
public:
    class Slot {
    public:
        Slot() = default;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept;
        ~Slot() { release(); }

        void release();

        [[nodiscard]] bool held() const { return gate_ != nullptr; }

    private:
        friend class AdmissionGate;
        explicit Slot(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_ = nullptr;
    };

    explicit AdmissionGate(unsigned int capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks until a slot frees or the token fires. Returns an empty Slot on cancellation;
    // no capacity is consumed in that case.
    [[nodiscard]] Slot acquire(const CancelToken& token = {});

    [[nodiscard]] Slot tryAcquire();

    [[nodiscard]] unsigned int capacity() const { return capacity_; }
    [[nodiscard]] unsigned int inUse() const;

private:
    void release_();

    static constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{20};

    const unsigned int capacity_;
    unsigned int inUse_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}
