// =============================================================================
// pipeflow - Cancellation Tests
// =============================================================================

#include "pflow/core/cancellation.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace pflow {
namespace {

using namespace std::chrono_literals;

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.canBeCancelled());
    EXPECT_EQ(token.reason(), CancellationReason::kNone);
    EXPECT_FALSE(token.deadline().has_value());
    EXPECT_EQ(token.waitLimit(), Clock::time_point::max());
}

TEST(CancellationTest, CancelIsVisibleToTokens) {
    CancellationSource source;
    auto token = source.token();
    EXPECT_FALSE(token.isCancelled());

    source.cancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_TRUE(source.isCancelled());
    EXPECT_EQ(token.reason(), CancellationReason::kCancelled);

    // Idempotent
    source.cancel();
    EXPECT_TRUE(token.isCancelled());
}

TEST(CancellationTest, CallbackRunsOnceOnCancel) {
    CancellationSource source;
    std::atomic<int> calls{0};
    auto registration = source.token().onCancel([&calls] { ++calls; });
    EXPECT_TRUE(registration.active());

    source.cancel();
    source.cancel();
    EXPECT_EQ(calls.load(), 1);
}

TEST(CancellationTest, ResetRegistrationSkipsCallback) {
    CancellationSource source;
    std::atomic<int> calls{0};
    auto registration = source.token().onCancel([&calls] { ++calls; });
    registration.reset();
    EXPECT_FALSE(registration.active());

    source.cancel();
    EXPECT_EQ(calls.load(), 0);
}

TEST(CancellationTest, RegistrationAfterCancelIsInactive) {
    CancellationSource source;
    source.cancel();
    auto registration = source.token().onCancel([] {});
    EXPECT_FALSE(registration.active());
}

TEST(CancellationTest, ParentCancelsChild) {
    CancellationSource parent;
    CancellationSource child(parent.token());
    EXPECT_FALSE(child.isCancelled());

    parent.cancel();
    EXPECT_TRUE(child.isCancelled());
    EXPECT_EQ(child.token().reason(), CancellationReason::kCancelled);
}

TEST(CancellationTest, ChildDoesNotCancelParent) {
    CancellationSource parent;
    CancellationSource child(parent.token());
    child.cancel();
    EXPECT_TRUE(child.isCancelled());
    EXPECT_FALSE(parent.isCancelled());
}

TEST(CancellationTest, ChildOfCancelledParentStartsCancelled) {
    CancellationSource parent;
    parent.cancel();
    CancellationSource child(parent.token());
    EXPECT_TRUE(child.isCancelled());
}

TEST(CancellationTest, DeadlineExpires) {
    auto source = CancellationSource::withTimeout(20ms);
    auto token = source.token();
    ASSERT_TRUE(token.deadline().has_value());
    EXPECT_FALSE(token.isCancelled());

    std::this_thread::sleep_for(40ms);
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(token.reason(), CancellationReason::kDeadlineExceeded);
}

TEST(CancellationTest, ChildInheritsEarlierDeadline) {
    const auto soon = Clock::now() + 50ms;
    auto parent = CancellationSource::withDeadline(soon);
    auto child = CancellationSource::withTimeout(10s, parent.token());
    ASSERT_TRUE(child.token().deadline().has_value());
    EXPECT_EQ(*child.token().deadline(), soon);
}

TEST(CancellationTest, SleepForCompletes) {
    CancellationSource source;
    EXPECT_TRUE(source.token().sleepFor(5ms));
}

TEST(CancellationTest, SleepForWakesOnCancel) {
    CancellationSource source;
    auto token = source.token();
    std::thread canceller([&source] {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });

    const auto start = Clock::now();
    EXPECT_FALSE(token.sleepFor(10s));
    EXPECT_LT(Clock::now() - start, 5s);
    canceller.join();
}

TEST(CancellationTest, SleepForStopsAtDeadline) {
    auto source = CancellationSource::withTimeout(20ms);
    const auto start = Clock::now();
    EXPECT_FALSE(source.token().sleepFor(10s));
    EXPECT_LT(Clock::now() - start, 5s);
}

}  // namespace
}  // namespace pflow
