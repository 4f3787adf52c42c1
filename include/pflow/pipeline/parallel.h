// =============================================================================
// pipeflow - Parallel Slice Helpers
// =============================================================================
// Parallel map over in-memory data, for callers that already hold all their
// inputs and do not need a streaming pipeline.
//
// - parallelMap: results in completion order
// - orderedParallelMap: results in input order
//
// Both run on a oneTBB task arena limited to numWorkers threads and check the
// cancellation token before every element. fn must not block on streams.
// =============================================================================

#ifndef PFLOW_PIPELINE_PARALLEL_H
#define PFLOW_PIPELINE_PARALLEL_H

#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <tbb/task_group.h>

#include "pflow/common/error.h"
#include "pflow/common/logger.h"
#include "pflow/common/types.h"
#include "pflow/core/cancellation.h"

namespace pflow {

namespace detail {

/// @brief Shared bookkeeping of a parallel slice run.
struct SliceRun {
    std::atomic<bool> stopped{false};
    std::mutex mutex;
    std::exception_ptr failure;
    std::optional<ItemIndex> failedIndex;

    void fail(ItemIndex index, std::exception_ptr error) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!failure) {
            failure = std::move(error);
            failedIndex = index;
        }
        stopped.store(true, std::memory_order_release);
    }
};

/// @brief Validate arguments shared by the slice helpers.
[[nodiscard]] VoidResult checkSliceArguments(std::size_t numWorkers);

/// @brief Turn the outcome of a slice run into an error, if it has one.
[[nodiscard]] std::optional<Error> sliceRunError(const SliceRun& run,
                                                 const CancellationToken& token,
                                                 std::string_view operation);

/// @brief Apply body(begin, end) to chunks of [0, count) on a limited arena.
template <typename Body>
void runSlices(std::size_t count, std::size_t numWorkers, SliceRun& run, Body&& body) {
    tbb::task_group_context group;
    tbb::task_arena arena(static_cast<int>(numWorkers));
    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, count),
            [&](const tbb::blocked_range<std::size_t>& range) {
                if (run.stopped.load(std::memory_order_acquire)) {
                    group.cancel_group_execution();
                    return;
                }
                body(range.begin(), range.end());
                if (run.stopped.load(std::memory_order_acquire)) {
                    group.cancel_group_execution();
                }
            },
            group);
    });
}

}  // namespace detail

// =============================================================================
// parallelMap
// =============================================================================

/// @brief Apply fn to every input on numWorkers threads.
/// @return Results in completion order, kCancelled / kDeadlineExceeded if the
///         token fired, kStageFailed if fn threw, kInvalidArgument for 0 workers.
template <typename In, typename Fn>
    requires Transform<Fn, const In&>
[[nodiscard]] Result<std::vector<TransformResult<Fn, const In&>>> parallelMap(
    const CancellationToken& token, const std::vector<In>& inputs, std::size_t numWorkers, Fn fn) {
    using Out = TransformResult<Fn, const In&>;
    if (auto valid = detail::checkSliceArguments(numWorkers); !valid) {
        return std::unexpected(valid.error());
    }

    std::vector<Out> results;
    results.reserve(inputs.size());
    std::mutex resultsMutex;
    detail::SliceRun run;

    detail::runSlices(inputs.size(), numWorkers, run, [&](std::size_t begin, std::size_t end) {
        std::vector<Out> local;
        local.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            if (token.isCancelled() || run.stopped.load(std::memory_order_acquire)) {
                run.stopped.store(true, std::memory_order_release);
                break;
            }
            try {
                local.push_back(fn(inputs[i]));
            } catch (...) {
                run.fail(i, std::current_exception());
                break;
            }
        }

        // Merge local results into the shared vector
        std::lock_guard<std::mutex> lock(resultsMutex);
        for (auto& value : local) {
            results.push_back(std::move(value));
        }
    });

    if (auto error = detail::sliceRunError(run, token, "parallelMap")) {
        return std::unexpected(std::move(*error));
    }
    return results;
}

// =============================================================================
// orderedParallelMap
// =============================================================================

/// @brief Apply fn to every input on numWorkers threads, keeping input order.
/// @return Results in input order, or the same errors as parallelMap.
template <typename In, typename Fn>
    requires Transform<Fn, const In&>
[[nodiscard]] Result<std::vector<TransformResult<Fn, const In&>>> orderedParallelMap(
    const CancellationToken& token, const std::vector<In>& inputs, std::size_t numWorkers, Fn fn) {
    using Out = TransformResult<Fn, const In&>;
    if (auto valid = detail::checkSliceArguments(numWorkers); !valid) {
        return std::unexpected(valid.error());
    }

    std::vector<std::optional<Out>> slots(inputs.size());
    detail::SliceRun run;

    detail::runSlices(inputs.size(), numWorkers, run, [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            if (token.isCancelled() || run.stopped.load(std::memory_order_acquire)) {
                run.stopped.store(true, std::memory_order_release);
                return;
            }
            try {
                slots[i].emplace(fn(inputs[i]));
            } catch (...) {
                run.fail(i, std::current_exception());
                return;
            }
        }
    });

    if (auto error = detail::sliceRunError(run, token, "orderedParallelMap")) {
        return std::unexpected(std::move(*error));
    }

    std::vector<Out> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

}  // namespace pflow

#endif  // PFLOW_PIPELINE_PARALLEL_H
