// =============================================================================
// pipeflow - Transform Property Tests
// =============================================================================
// Property-based tests for map, filter, mapWithError and collectErrors.
//
// **Property: map and filter agree with their sequential counterparts**
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include "pflow/stages/transform.h"

namespace pflow::test {

using namespace std::chrono_literals;

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(TransformProperty, MapMatchesSequentialTransform, (const std::vector<int>& values)) {
    Context ctx;
    auto result = collect(ctx, map(ctx, generator(ctx, values),
                                   [](int v) { return static_cast<long long>(v) * 3 + 1; }));

    std::vector<long long> expected;
    expected.reserve(values.size());
    for (int v : values) {
        expected.push_back(static_cast<long long>(v) * 3 + 1);
    }
    RC_ASSERT(result == expected);
}

RC_GTEST_PROP(TransformProperty, FilterKeepsMatchingInOrder, (const std::vector<int>& values)) {
    Context ctx;
    auto isEven = [](const int& v) { return v % 2 == 0; };
    auto result = collect(ctx, filter(ctx, generator(ctx, values), isEven));

    std::vector<int> expected;
    std::copy_if(values.begin(), values.end(), std::back_inserter(expected), isEven);
    RC_ASSERT(result == expected);
}

// =============================================================================
// map / filter
// =============================================================================

TEST(TransformTest, MapChangesType) {
    Context ctx;
    auto result = collect(ctx, map(ctx, generator(ctx, {1, 22, 333}),
                                   [](int v) { return std::to_string(v); }));
    EXPECT_EQ(result, (std::vector<std::string>{"1", "22", "333"}));
}

TEST(TransformTest, MapExceptionFailsStream) {
    Context ctx;
    auto out = map(ctx, generator(ctx, {1, 2, 3, 4}), [](int v) {
        if (v == 3) {
            throw std::runtime_error("bad value");
        }
        return v;
    });
    auto result = collect(ctx, out);
    EXPECT_EQ(result, (std::vector<int>{1, 2}));
    EXPECT_EQ(out.closeReason(), CloseReason::kFailed);
    ASSERT_TRUE(out.failure());
    EXPECT_THROW(std::rethrow_exception(out.failure()), std::runtime_error);
    EXPECT_TRUE(ctx.waitFor(5s));
}

TEST(TransformTest, FailurePropagatesThroughLaterStages) {
    Context ctx;
    auto failing = map(ctx, generator(ctx, {1, 2, 3}), [](int v) {
        if (v == 2) {
            throw InvalidArgumentError("two");
        }
        return v;
    });
    auto out = filter(ctx, map(ctx, failing, [](int v) { return v * 10; }),
                      [](const int&) { return true; });
    EXPECT_EQ(collect(ctx, out), (std::vector<int>{10}));
    EXPECT_EQ(out.closeReason(), CloseReason::kFailed);
    EXPECT_THROW(std::rethrow_exception(out.failure()), InvalidArgumentError);
}

TEST(TransformTest, FilterPredicateExceptionFailsStream) {
    Context ctx;
    auto out = filter(ctx, generator(ctx, {1, 2}), [](const int&) -> bool {
        throw std::runtime_error("predicate failed");
    });
    EXPECT_TRUE(collect(ctx, out).empty());
    EXPECT_EQ(out.closeReason(), CloseReason::kFailed);
}

// =============================================================================
// mapWithError / collectErrors
// =============================================================================

TEST(TransformTest, MapWithErrorTagsEveryItem) {
    Context ctx;
    auto out = mapWithError(ctx, generator(ctx, {1, 2, 3, 4}), [](int v) -> Result<int> {
        if (v % 2 == 0) {
            return makeError(ErrorCode::kInvalidArgument, "even value {}", v);
        }
        return v * 100;
    });
    auto results = collect(ctx, out);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].value(), 100);
    EXPECT_EQ(results[1].error().code(), ErrorCode::kInvalidArgument);
    EXPECT_EQ(results[1].error().message(), "even value 2");
    EXPECT_EQ(results[2].value(), 300);
    EXPECT_FALSE(results[3].has_value());
    EXPECT_EQ(out.closeReason(), CloseReason::kCompleted);
}

TEST(TransformTest, MapWithErrorCapturesExceptions) {
    Context ctx;
    auto out = mapWithError(ctx, generator(ctx, {1, 2}), [](int v) {
        if (v == 1) {
            throw std::runtime_error("plain failure");
        }
        return v;
    });
    auto results = collect(ctx, out);
    ASSERT_EQ(results.size(), 2u);
    ASSERT_FALSE(results[0].has_value());
    EXPECT_EQ(results[0].error().code(), ErrorCode::kStageFailed);
    EXPECT_EQ(results[1].value(), 2);
    EXPECT_EQ(out.closeReason(), CloseReason::kCompleted);
}

TEST(TransformTest, CollectErrorsSplitsStream) {
    Context ctx;
    auto tagged = mapWithError(ctx, generator(ctx, {1, 2, 3, 4, 5, 6}), [](int v) -> Result<int> {
        if (v % 3 == 0) {
            return makeError(ErrorCode::kInvalidArgument, "multiple of three: {}", v);
        }
        return v;
    });
    auto [values, errors] = collectErrors(ctx, tagged);

    // Both outputs are drained concurrently
    auto errorsFuture = std::async(std::launch::async, [&ctx, errors = errors] {
        return collect(ctx, errors);
    });
    auto good = collect(ctx, values);
    auto bad = errorsFuture.get();

    EXPECT_EQ(good, (std::vector<int>{1, 2, 4, 5}));
    ASSERT_EQ(bad.size(), 2u);
    EXPECT_EQ(bad[0].message(), "multiple of three: 3");
    EXPECT_EQ(bad[1].message(), "multiple of three: 6");
    EXPECT_EQ(values.closeReason(), CloseReason::kCompleted);
    EXPECT_EQ(errors.closeReason(), CloseReason::kCompleted);
}

TEST(TransformTest, CollectErrorsSkipsAbandonedOutput) {
    Context ctx;
    auto tagged = mapWithError(ctx, generator(ctx, {1, 2, 3, 4}), [](int v) -> Result<int> {
        if (v == 2) {
            return makeError(ErrorCode::kInvalidArgument, "two");
        }
        return v;
    });
    auto [values, errors] = collectErrors(ctx, tagged);
    errors.abandon();
    EXPECT_EQ(collect(ctx, values), (std::vector<int>{1, 3, 4}));
    EXPECT_TRUE(ctx.waitFor(5s));
}

}  // namespace pflow::test
