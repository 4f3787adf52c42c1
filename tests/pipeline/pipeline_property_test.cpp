// =============================================================================
// pipeflow - Pipeline Property Tests
// =============================================================================
// Property-based tests for the Pipeline builder.
//
// **Property: a composed pipeline matches the equivalent sequential
// computation, for unordered stages up to permutation**
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pflow/pflow.h"

namespace pflow::test {

using namespace std::chrono_literals;

// =============================================================================
// Test Fixtures
// =============================================================================

class PipelinePropertyTest : public ::testing::Test {
protected:
    static std::vector<int> range(int count) {
        std::vector<int> values(static_cast<std::size_t>(count));
        for (int i = 0; i < count; ++i) {
            values[static_cast<std::size_t>(i)] = i + 1;
        }
        return values;
    }
};

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(PipelineProperty, MapFilterTakeMatchesSequential, (const std::vector<int>& values)) {
    const auto n = *rc::gen::inRange<std::size_t>(0, values.size() + 3);

    Context ctx;
    auto result = Pipeline<int>::from(ctx, values)
                      .map([](int v) { return static_cast<long long>(v) * v; })
                      .filter([](const long long& v) { return v % 3 != 1; })
                      .take(n)
                      .collect();

    std::vector<long long> expected;
    for (int v : values) {
        const long long square = static_cast<long long>(v) * v;
        if (square % 3 != 1 && expected.size() < n) {
            expected.push_back(square);
        }
    }
    RC_ASSERT(result == expected);
}

RC_GTEST_PROP(PipelineProperty, OrderedFanOutMatchesMap, (const std::vector<int>& values)) {
    const auto workers = *rc::gen::inRange<std::size_t>(1, 6);

    Context ctx;
    auto ordered = Pipeline<int>::from(ctx, values)
                       .orderedFanOut(workers, [](int v) { return v / 2; })
                       .collect();

    std::vector<int> expected;
    for (int v : values) {
        expected.push_back(v / 2);
    }
    RC_ASSERT(ordered == expected);
}

// =============================================================================
// Builder Scenarios
// =============================================================================

TEST_F(PipelinePropertyTest, SquareFilterTake) {
    Context ctx;
    auto result = Pipeline<int>::from(ctx, {1, 2, 3, 4, 5})
                      .map([](int v) { return v * v; })
                      .filter([](const int& v) { return v > 10; })
                      .take(1)
                      .collect();
    EXPECT_EQ(result, (std::vector<int>{16}));
    EXPECT_TRUE(ctx.waitFor(5s));
}

TEST_F(PipelinePropertyTest, BatchOfThree) {
    Context ctx;
    auto result = Pipeline<int>::from(ctx, range(7)).batch(3).collect();
    EXPECT_EQ(result, (std::vector<std::vector<int>>{{1, 2, 3}, {4, 5, 6}, {7}}));
}

TEST_F(PipelinePropertyTest, OrderedSquaresWithJitter) {
    Context ctx;
    auto result = Pipeline<int>::from(ctx, range(5))
                      .orderedFanOut(3,
                                     [](int v) {
                                         std::this_thread::sleep_for(
                                             std::chrono::milliseconds((5 - v) * 5));
                                         return v * v;
                                     })
                      .collect();
    EXPECT_EQ(result, (std::vector<int>{1, 4, 9, 16, 25}));
}

TEST_F(PipelinePropertyTest, SquareEvenNumbers) {
    Context ctx;
    auto result = Pipeline<int>::from(ctx, range(10))
                      .filter([](const int& v) { return v % 2 == 0; })
                      .map([](int v) { return v * v; })
                      .collect();
    EXPECT_EQ(result, (std::vector<int>{4, 16, 36, 64, 100}));
}

TEST_F(PipelinePropertyTest, UnorderedFanOutThenBatch) {
    Context ctx;
    auto batches = Pipeline<int>::from(ctx, range(100))
                       .fanOut(4, [](int v) { return v + 1; })
                       .batch(8)
                       .collect();

    std::vector<int> flattened;
    for (const auto& chunk : batches) {
        EXPECT_LE(chunk.size(), 8u);
        flattened.insert(flattened.end(), chunk.begin(), chunk.end());
    }
    std::sort(flattened.begin(), flattened.end());

    auto expected = range(100);
    for (int& v : expected) {
        v += 1;
    }
    EXPECT_EQ(flattened, expected);
}

TEST_F(PipelinePropertyTest, TeeIntoTwoConsumers) {
    Context ctx;
    auto [words, lengths] = Pipeline<std::string>::from(ctx, {"a", "bb", "ccc"}).tee();

    auto lengthFuture = std::async(std::launch::async, [lengths = lengths] {
        return lengths.map([](std::string s) { return s.size(); }).collect();
    });
    auto upper = words.map([](std::string s) {
                          std::transform(s.begin(), s.end(), s.begin(),
                                         [](unsigned char c) { return static_cast<char>(c - 32); });
                          return s;
                      })
                     .collect();

    EXPECT_EQ(upper, (std::vector<std::string>{"A", "BB", "CCC"}));
    EXPECT_EQ(lengthFuture.get(), (std::vector<std::size_t>{1, 2, 3}));
}

TEST_F(PipelinePropertyTest, BufferedPipelineKeepsOrder) {
    Context ctx;
    auto result =
        Pipeline<int>::from(ctx, range(50)).buffer(16).map([](int v) { return -v; }).collect();
    ASSERT_EQ(result.size(), 50u);
    EXPECT_EQ(result.front(), -1);
    EXPECT_EQ(result.back(), -50);
}

TEST_F(PipelinePropertyTest, ForEachVisitsEveryValue) {
    Context ctx;
    int sum = 0;
    const CloseReason reason =
        Pipeline<int>::from(ctx, range(10)).forEach([&sum](int v) { sum += v; });
    EXPECT_EQ(sum, 55);
    EXPECT_EQ(reason, CloseReason::kCompleted);
}

// =============================================================================
// collectChecked
// =============================================================================

TEST_F(PipelinePropertyTest, CollectCheckedSucceeds) {
    Context ctx;
    auto result = Pipeline<int>::from(ctx, {3, 2, 1}).collectChecked();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, (std::vector<int>{3, 2, 1}));
}

TEST_F(PipelinePropertyTest, CollectCheckedReportsStageFailure) {
    Context ctx;
    auto result = Pipeline<int>::from(ctx, range(10))
                      .map([](int v) {
                          if (v == 5) {
                              throw std::runtime_error("stage exploded");
                          }
                          return v;
                      })
                      .collectChecked();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kStageFailed);
    EXPECT_NE(result.error().message().find("stage exploded"), std::string::npos);
}

TEST_F(PipelinePropertyTest, CollectCheckedReportsCancellation) {
    CancellationSource caller;
    Context ctx(caller.token());
    auto pipeline = Pipeline<int>::from(ctx, range(1000)).map([](int v) {
        std::this_thread::sleep_for(1ms);
        return v;
    });

    std::thread canceller([&caller] {
        std::this_thread::sleep_for(20ms);
        caller.cancel();
    });
    auto result = pipeline.collectChecked();
    canceller.join();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
    EXPECT_TRUE(ctx.waitFor(5s));
}

TEST_F(PipelinePropertyTest, CollectCheckedReportsDeadline) {
    auto caller = CancellationSource::withTimeout(30ms);
    Context ctx(caller.token());
    auto result = Pipeline<int>::from(ctx, range(1000))
                      .map([](int v) {
                          std::this_thread::sleep_for(1ms);
                          return v;
                      })
                      .collectChecked();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kDeadlineExceeded);
}

// =============================================================================
// Termination
// =============================================================================

TEST_F(PipelinePropertyTest, CancelledPipelineTerminatesPromptly) {
    Context ctx;
    auto pipeline = Pipeline<int>::from(ctx, range(100000))
                        .fanOut(4,
                                [](int v) {
                                    std::this_thread::sleep_for(50us);
                                    return v;
                                })
                        .orderedFanOut(3, [](int v) { return v * 2; })
                        .batch(10);

    std::atomic<int> batches{0};
    auto consumer = std::async(std::launch::async, [&] {
        return pipeline.forEach([&batches](const std::vector<int>&) { ++batches; });
    });
    std::this_thread::sleep_for(20ms);
    ctx.cancel();

    EXPECT_EQ(consumer.get(), CloseReason::kCancelled);
    EXPECT_TRUE(ctx.waitFor(5s));
}

TEST_F(PipelinePropertyTest, TakeReleasesWholePipeline) {
    Context ctx;
    auto result = Pipeline<int>::from(ctx, range(100000))
                      .fanOut(4, [](int v) { return v; })
                      .buffer(4)
                      .take(5)
                      .collect();
    EXPECT_EQ(result.size(), 5u);
    EXPECT_TRUE(ctx.waitFor(5s));
    EXPECT_FALSE(ctx.isCancelled());
}

}  // namespace pflow::test
