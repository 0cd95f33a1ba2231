#include <gtest/gtest.h>
#include "concurrency/AdmissionGate.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace fk::concurrency;
using namespace std::chrono_literals;

TEST(AdmissionGateTest, ZeroCapacityRejected) {
    EXPECT_THROW(AdmissionGate(0), std::invalid_argument);
}

TEST(AdmissionGateTest, SlotReleasedOnScopeExit) {
    AdmissionGate gate(1);
    {
        auto slot = gate.acquire();
        EXPECT_TRUE(slot.held());
        EXPECT_EQ(gate.inUse(), 1u);
        EXPECT_FALSE(gate.tryAcquire().held());
    }
    EXPECT_EQ(gate.inUse(), 0u);
    EXPECT_TRUE(gate.tryAcquire().held());
}

TEST(AdmissionGateTest, MovedSlotReleasesOnce) {
    AdmissionGate gate(2);
    auto a = gate.acquire();
    auto b = std::move(a);
    EXPECT_FALSE(a.held());
    EXPECT_TRUE(b.held());
    b.release();
    b.release();
    EXPECT_EQ(gate.inUse(), 0u);
}

TEST(AdmissionGateTest, NeverExceedsCapacity) {
    constexpr unsigned int K = 3;
    AdmissionGate gate(K);
    std::atomic<unsigned int> inside{0}, peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            auto slot = gate.acquire();
            const auto now = ++inside;
            unsigned int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(10ms);
            --inside;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), K);
    EXPECT_EQ(gate.inUse(), 0u);
}

TEST(AdmissionGateTest, CancelledWaiterConsumesNothing) {
    AdmissionGate gate(1);
    auto held = gate.acquire();

    CancelToken token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });

    const auto slot = gate.acquire(token);
    canceller.join();

    EXPECT_FALSE(slot.held());
    EXPECT_EQ(gate.inUse(), 1u);
}

TEST(AdmissionGateTest, DeadlineStopsWaiting) {
    AdmissionGate gate(1);
    auto held = gate.acquire();

    const auto start = std::chrono::steady_clock::now();
    const auto slot = gate.acquire(CancelToken::withTimeout(60ms));
    const auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(slot.held());
    EXPECT_GE(waited, 50ms);
    EXPECT_LT(waited, 2s);
}

TEST(CancelTokenTest, CopiesShareFlagAndUntilKeepsEarlierDeadline) {
    const CancelToken a;
    const auto b = a.until(CancelToken::clock::now() + 1h);
    EXPECT_FALSE(b.isCancelled());
    a.cancel();
    EXPECT_TRUE(b.isCancelled());

    const auto soon = CancelToken::withTimeout(1ms).until(CancelToken::clock::now() + 1h);
    std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(soon.isCancelled());
}
