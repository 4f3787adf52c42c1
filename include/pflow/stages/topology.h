// =============================================================================
// pipeflow - Branch and Join Stages
// =============================================================================
// Stages that change the shape of a pipeline:
// - fanOut: N workers compete for the values of one input
// - fanIn: merge N inputs into one output, in arrival order
// - fanOutFanIn: fanOut followed by fanIn
// - tee: duplicate every value into two branches
// - batch: group consecutive values into vectors
// - batchFanOut: process whole batches on N workers, re-emit the elements
//
// None of these preserve order across workers; see ordered.h for that.
// =============================================================================

#ifndef PFLOW_STAGES_TOPOLOGY_H
#define PFLOW_STAGES_TOPOLOGY_H

#include <atomic>
#include <concepts>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "pflow/stages/transform.h"

namespace pflow {

// =============================================================================
// fanOut
// =============================================================================

/// @brief Start workerCount workers that each read from the shared input.
/// @return One output per worker.
/// @throws InvalidArgumentError if workerCount is 0.
///
/// Each value is processed by exactly one worker. A worker whose fn throws
/// closes its own output with kFailed; the others continue. The last worker
/// to exit abandons the input.
template <Streamable In, typename Fn>
    requires Transform<Fn, In>
[[nodiscard]] std::vector<Receiver<TransformResult<Fn, In>>> fanOut(Context& ctx, Receiver<In> in,
                                                                    std::size_t workerCount,
                                                                    Fn fn) {
    using Out = TransformResult<Fn, In>;
    if (workerCount == 0) {
        throw InvalidArgumentError("fanOut requires at least one worker");
    }

    auto shared = std::make_shared<Fn>(std::move(fn));
    auto remaining = std::make_shared<std::atomic<std::size_t>>(workerCount);
    std::vector<Receiver<Out>> outputs;
    outputs.reserve(workerCount);

    for (std::size_t i = 0; i < workerCount; ++i) {
        auto [tx, rx] = makeStream<Out>(kUnbuffered);
        outputs.push_back(rx);
        ctx.spawn(fmt::format("fanOut[{}]", i), [token = ctx.token(), in, out = std::move(tx),
                                                 fn = shared, remaining,
                                                 worker = static_cast<WorkerId>(i)] {
            ItemIndex processed = 0;
            try {
                while (auto value = in.receive(token)) {
                    const SendStatus status = out.send((*fn)(std::move(*value)), token);
                    if (status != SendStatus::kSent) {
                        detail::closeAfterRefusedSend(status, out);
                        break;
                    }
                    ++processed;
                }
                detail::finishStage("fanOut", token, in, out);
            } catch (...) {
                const Error error = errorFromException(std::current_exception());
                PFLOW_LOG_ERROR("fanOut worker {} failed after {} items: {}", worker, processed,
                                error.toString());
                out.tryClose(CloseReason::kFailed, std::current_exception());
            }
            if (remaining->fetch_sub(1, std::memory_order_acq_rel) == 1) {
                in.abandon();
            }
        });
    }
    return outputs;
}

// =============================================================================
// fanIn
// =============================================================================

/// @brief Merge several inputs into one output.
///
/// Values keep their relative order per input; interleaving across inputs is
/// arbitrary. The output closes once every input ended, with the strongest
/// close reason seen: kFailed over kCancelled over kCompleted.
template <Streamable T>
[[nodiscard]] Receiver<T> fanIn(Context& ctx, std::vector<Receiver<T>> inputs) {
    auto [tx, rx] = makeStream<T>(kUnbuffered);
    if (inputs.empty()) {
        tx.close(CloseReason::kCompleted);
        return rx;
    }

    struct MergeState {
        explicit MergeState(Sender<T> sender, std::size_t count)
            : out(std::move(sender)), remaining(count) {}

        Sender<T> out;
        std::mutex mutex;
        std::size_t remaining;
        CloseReason reason = CloseReason::kCompleted;
        std::exception_ptr failure;
    };
    auto state = std::make_shared<MergeState>(std::move(tx), inputs.size());

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        ctx.spawn(fmt::format("fanIn[{}]", i), [token = ctx.token(), in = inputs[i], state] {
            CloseReason reason = CloseReason::kCompleted;
            bool refused = false;
            while (auto value = in.receive(token)) {
                const SendStatus status = state->out.send(std::move(*value), token);
                if (status != SendStatus::kSent) {
                    in.abandon();
                    reason = status == SendStatus::kCancelled ? CloseReason::kCancelled
                                                              : CloseReason::kCompleted;
                    refused = true;
                    break;
                }
            }
            if (!refused) {
                reason = endReason(token, in.closeReason());
            }

            std::lock_guard<std::mutex> lock(state->mutex);
            if (reason == CloseReason::kFailed && !state->failure) {
                state->failure = in.failure();
            }
            state->reason = mergeCloseReasons(state->reason, reason);
            if (--state->remaining == 0) {
                state->out.tryClose(state->reason, state->failure);
                PFLOW_LOG_DEBUG("Stage 'fanIn' finished: {}", closeReasonToString(state->reason));
            }
        });
    }
    return rx;
}

/// @brief fanOut followed by fanIn: an unordered parallel map.
template <Streamable In, typename Fn>
    requires Transform<Fn, In>
[[nodiscard]] Receiver<TransformResult<Fn, In>> fanOutFanIn(Context& ctx, Receiver<In> in,
                                                            std::size_t workerCount, Fn fn) {
    return fanIn(ctx, fanOut(ctx, std::move(in), workerCount, std::move(fn)));
}

// =============================================================================
// tee
// =============================================================================

/// @brief Options for tee.
struct TeeOptions {
    /// @brief Capacity of each branch stream.
    /// @note 0 keeps the branches in lockstep: a value reaches branch 2 only
    ///       after branch 1 took it.
    std::size_t branchCapacity = kUnbuffered;
};

/// @brief Duplicate every value into two branches, branch 1 first.
///
/// An abandoned branch stops receiving values while the other continues.
template <Streamable T>
    requires std::copyable<T>
[[nodiscard]] std::pair<Receiver<T>, Receiver<T>> tee(Context& ctx, Receiver<T> in,
                                                      TeeOptions options = {}) {
    auto [firstTx, firstRx] = makeStream<T>(options.branchCapacity);
    auto [secondTx, secondRx] = makeStream<T>(options.branchCapacity);
    ctx.spawn("tee", [token = ctx.token(), in = std::move(in), first = std::move(firstTx),
                      second = std::move(secondTx)] {
        bool firstOpen = true;
        bool secondOpen = true;
        while (auto value = in.receive(token)) {
            if (firstOpen) {
                const SendStatus status =
                    secondOpen ? first.send(*value, token) : first.send(std::move(*value), token);
                if (status == SendStatus::kCancelled) {
                    break;
                }
                firstOpen = status == SendStatus::kSent;
            }
            if (secondOpen) {
                const SendStatus status = second.send(std::move(*value), token);
                if (status == SendStatus::kCancelled) {
                    break;
                }
                secondOpen = status == SendStatus::kSent;
            }
            if (!firstOpen && !secondOpen) {
                detail::stopStage("tee", SendStatus::kAbandoned, in, first);
                second.tryClose(CloseReason::kCompleted);
                return;
            }
        }
        if (token.isCancelled()) {
            in.abandon();
        }
        detail::finishStage("tee", token, in, first);
        detail::finishStage("tee", token, in, second);
    });
    return {firstRx, secondRx};
}

// =============================================================================
// batch
// =============================================================================

/// @brief Group consecutive values into vectors of up to size elements.
/// @throws InvalidArgumentError if size is 0.
///
/// A final partial batch is emitted when the input ends; on cancellation it
/// is dropped.
template <Streamable T>
[[nodiscard]] Receiver<std::vector<T>> batch(Context& ctx, Receiver<T> in, std::size_t size) {
    if (size == 0) {
        throw InvalidArgumentError("batch size must be positive");
    }
    auto [tx, rx] = makeStream<std::vector<T>>(kUnbuffered);
    ctx.spawn("batch", [token = ctx.token(), in = std::move(in), out = std::move(tx), size] {
        std::vector<T> current;
        current.reserve(size);
        while (auto value = in.receive(token)) {
            current.push_back(std::move(*value));
            if (current.size() < size) {
                continue;
            }
            const SendStatus status = out.send(std::exchange(current, {}), token);
            if (status != SendStatus::kSent) {
                detail::stopStage("batch", status, in, out);
                return;
            }
            current.reserve(size);
        }
        if (!current.empty() && !token.isCancelled()) {
            const SendStatus status = out.send(std::move(current), token);
            if (status != SendStatus::kSent) {
                detail::stopStage("batch", status, in, out);
                return;
            }
        }
        detail::finishStage("batch", token, in, out);
    });
    return rx;
}

// =============================================================================
// batchFanOut
// =============================================================================

namespace detail {

/// @brief Re-emit the elements of each vector individually.
template <Streamable T>
[[nodiscard]] Receiver<T> flatten(Context& ctx, Receiver<std::vector<T>> in) {
    auto [tx, rx] = makeStream<T>(kUnbuffered);
    ctx.spawn("flatten", [token = ctx.token(), in = std::move(in), out = std::move(tx)] {
        while (auto values = in.receive(token)) {
            for (auto& value : *values) {
                const SendStatus status = out.send(std::move(value), token);
                if (status != SendStatus::kSent) {
                    stopStage("flatten", status, in, out);
                    return;
                }
            }
        }
        finishStage("flatten", token, in, out);
    });
    return rx;
}

}  // namespace detail

/// @brief Process the input in batches on workerCount workers.
///
/// fn receives a std::vector<In> of up to batchSize values and returns a
/// std::vector of results; every result is emitted individually. Output order
/// is unspecified.
/// @throws InvalidArgumentError if workerCount or batchSize is 0.
template <Streamable In, typename Fn>
    requires Transform<Fn, std::vector<In>>
[[nodiscard]] auto batchFanOut(Context& ctx, Receiver<In> in, std::size_t workerCount,
                               std::size_t batchSize, Fn fn) {
    using OutBatch = TransformResult<Fn, std::vector<In>>;
    using Out = typename OutBatch::value_type;
    if (workerCount == 0) {
        throw InvalidArgumentError("batchFanOut requires at least one worker");
    }
    Receiver<std::vector<In>> batches = batch(ctx, std::move(in), batchSize);
    Receiver<OutBatch> merged = fanOutFanIn(ctx, std::move(batches), workerCount, std::move(fn));
    return detail::flatten<Out>(ctx, std::move(merged));
}

}  // namespace pflow

#endif  // PFLOW_STAGES_TOPOLOGY_H
