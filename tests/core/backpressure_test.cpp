// =============================================================================
// pipeflow - Backpressure Controller Tests
// =============================================================================

#include "pflow/core/backpressure.h"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

namespace pflow {
namespace {

using namespace std::chrono_literals;

TEST(BackpressureTest, AcquireRespectsLimit) {
    BackpressureController controller(4);
    CancellationSource source;

    EXPECT_EQ(controller.maxInFlight(), 4u);
    EXPECT_EQ(controller.inFlight(), 0u);

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(controller.acquire(source.token()));
    }
    EXPECT_EQ(controller.inFlight(), 4u);

    // At the limit a cancelled token fails instead of blocking
    source.cancel();
    EXPECT_FALSE(controller.acquire(source.token()));
    EXPECT_EQ(controller.inFlight(), 4u);

    controller.release();
    EXPECT_EQ(controller.inFlight(), 3u);
    EXPECT_TRUE(controller.acquire(CancellationToken{}));
    EXPECT_EQ(controller.inFlight(), 4u);
}

TEST(BackpressureTest, ZeroLimitIsUnbounded) {
    BackpressureController controller(0);
    CancellationToken token;
    for (int i = 0; i < 10000; ++i) {
        ASSERT_TRUE(controller.acquire(token));
    }
    EXPECT_EQ(controller.inFlight(), 10000u);
}

TEST(BackpressureTest, AcquireWaitsForRelease) {
    BackpressureController controller(1);
    CancellationToken token;
    ASSERT_TRUE(controller.acquire(token));

    auto waiter = std::async(std::launch::async, [&] { return controller.acquire(token); });
    EXPECT_EQ(waiter.wait_for(30ms), std::future_status::timeout);

    controller.release();
    EXPECT_TRUE(waiter.get());
    EXPECT_EQ(controller.inFlight(), 1u);
}

TEST(BackpressureTest, AcquireWakesOnCancel) {
    BackpressureController controller(1);
    CancellationSource source;
    ASSERT_TRUE(controller.acquire(source.token()));

    auto waiter =
        std::async(std::launch::async, [&] { return controller.acquire(source.token()); });
    std::this_thread::sleep_for(20ms);
    source.cancel();
    EXPECT_FALSE(waiter.get());
}

TEST(BackpressureTest, AbortFailsAcquire) {
    BackpressureController controller(1);
    CancellationToken token;
    ASSERT_TRUE(controller.acquire(token));

    auto waiter = std::async(std::launch::async, [&] { return controller.acquire(token); });
    std::this_thread::sleep_for(20ms);
    controller.abort();
    EXPECT_FALSE(waiter.get());

    // An abort also fails acquires that would have found room
    controller.release();
    EXPECT_FALSE(controller.acquire(token));
    EXPECT_EQ(controller.inFlight(), 0u);
}

}  // namespace
}  // namespace pflow
