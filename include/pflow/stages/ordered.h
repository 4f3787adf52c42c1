// =============================================================================
// pipeflow - Ordered Parallel Stage
// =============================================================================
// Parallel map whose output order equals its input order.
//
// Layout:
//   in -> index -> fanOut(workers) -> fanIn -> reorder -> out
//
// The indexing task tags each value with its position. Workers keep the tag.
// The reordering task holds early arrivals in a ReorderBuffer and emits
// greedily while the next expected index is present.
//
// A BackpressureController bounds the number of items between indexing and
// emission (OrderedOptions::maxInFlight), which also bounds the reorder buffer.
// =============================================================================

#ifndef PFLOW_STAGES_ORDERED_H
#define PFLOW_STAGES_ORDERED_H

#include <algorithm>
#include <cstddef>
#include <exception>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <utility>

#include "pflow/common/error.h"
#include "pflow/core/backpressure.h"
#include "pflow/stages/topology.h"

namespace pflow {

// =============================================================================
// Reorder Buffer
// =============================================================================

/// @brief Holds out-of-order items until their turn comes.
/// @tparam T Item type
///
/// Not thread-safe; owned by a single reordering task.
template <typename T>
class ReorderBuffer {
public:
    /// @brief Construct with expected starting index
    explicit ReorderBuffer(ItemIndex startIndex = 0) : nextIndex_(startIndex) {}

    /// @brief Store an item under its index.
    /// @throws InvalidStateError if the index was already emitted or is held.
    void push(ItemIndex index, T item) {
        if (index < nextIndex_ || pending_.contains(index)) {
            throw InvalidStateError(fmt::format("duplicate item index {}", index));
        }
        pending_.emplace(index, std::move(item));
        peak_ = std::max(peak_, pending_.size());
    }

    /// @brief Pop the item with the next expected index, if present.
    std::optional<T> tryPop() {
        auto it = pending_.find(nextIndex_);
        if (it == pending_.end()) {
            return std::nullopt;
        }
        T item = std::move(it->second);
        pending_.erase(it);
        ++nextIndex_;
        return item;
    }

    [[nodiscard]] ItemIndex nextIndex() const noexcept { return nextIndex_; }

    [[nodiscard]] bool empty() const noexcept { return pending_.empty(); }

    [[nodiscard]] std::size_t size() const noexcept { return pending_.size(); }

    /// @brief Largest number of items held at once.
    [[nodiscard]] std::size_t peakSize() const noexcept { return peak_; }

private:
    std::map<ItemIndex, T> pending_;
    ItemIndex nextIndex_ = 0;
    std::size_t peak_ = 0;
};

// =============================================================================
// Options
// =============================================================================

/// @brief Options for orderedFanOutFanIn.
struct OrderedOptions {
    /// @brief Maximum items between indexing and in-order emission (0 = unbounded).
    std::size_t maxInFlight = kDefaultReorderWindow;

    /// @brief Validate option values.
    /// @note A window smaller than the worker count leaves workers idle.
    [[nodiscard]] VoidResult validate(std::size_t workerCount) const;
};

namespace detail {

/// @brief Value tagged with its input position.
template <typename T>
struct OrderedItem {
    ItemIndex index;
    T value;
};

/// @brief Outcome of applying fn to one ordered item.
template <typename T>
using Attempt = std::expected<T, std::exception_ptr>;

}  // namespace detail

// =============================================================================
// orderedFanOutFanIn
// =============================================================================

/// @brief Parallel map on workerCount workers whose output order equals input order.
/// @throws InvalidArgumentError if workerCount is 0.
///
/// If fn throws for some item, every earlier item is still emitted, then the
/// output closes with kFailed carrying that exception.
template <Streamable In, typename Fn>
    requires Transform<Fn, In>
[[nodiscard]] Receiver<TransformResult<Fn, In>> orderedFanOutFanIn(Context& ctx, Receiver<In> in,
                                                                   std::size_t workerCount, Fn fn,
                                                                   OrderedOptions options = {}) {
    using Out = TransformResult<Fn, In>;
    using Indexed = detail::OrderedItem<In>;
    using Processed = detail::OrderedItem<detail::Attempt<Out>>;

    unwrapOrThrow(options.validate(workerCount));
    auto window = std::make_shared<BackpressureController>(options.maxInFlight);

    // Indexing
    auto [indexTx, indexRx] = makeStream<Indexed>(kUnbuffered);
    ctx.spawn("ordered-index", [token = ctx.token(), in = std::move(in),
                                out = std::move(indexTx), window] {
        ItemIndex index = 0;
        while (auto value = in.receive(token)) {
            if (!window->acquire(token)) {
                in.abandon();
                out.tryClose(token.isCancelled() ? CloseReason::kCancelled
                                                 : CloseReason::kCompleted);
                return;
            }
            const SendStatus status = out.send(Indexed{index, std::move(*value)}, token);
            if (status != SendStatus::kSent) {
                detail::stopStage("ordered-index", status, in, out);
                return;
            }
            ++index;
        }
        detail::finishStage("ordered-index", token, in, out);
    });

    // Workers never throw: failures travel as items so the reorder task can
    // emit everything before them
    auto worker = [fn = std::move(fn)](Indexed item) mutable -> Processed {
        try {
            return Processed{item.index, detail::Attempt<Out>{fn(std::move(item.value))}};
        } catch (...) {
            return Processed{item.index, std::unexpected(std::current_exception())};
        }
    };
    Receiver<Processed> merged = fanOutFanIn(ctx, std::move(indexRx), workerCount,
                                             std::move(worker));

    // Reordering
    auto [tx, rx] = makeStream<Out>(kUnbuffered);
    ctx.spawn("ordered-reorder", [token = ctx.token(), merged, out = std::move(tx), window] {
        ReorderBuffer<detail::Attempt<Out>> pending;
        while (auto item = merged.receive(token)) {
            pending.push(item->index, std::move(item->value));
            while (auto next = pending.tryPop()) {
                if (!next->has_value()) {
                    const Error error = errorFromException(next->error());
                    PFLOW_LOG_ERROR("Stage 'orderedFanOutFanIn' failed at item {}: {}",
                                    pending.nextIndex() - 1, error.toString());
                    window->abort();
                    merged.abandon();
                    out.tryClose(CloseReason::kFailed, next->error());
                    return;
                }
                const SendStatus status = out.send(std::move(next->value()), token);
                window->release();
                if (status != SendStatus::kSent) {
                    window->abort();
                    detail::stopStage("ordered-reorder", status, merged, out);
                    return;
                }
            }
        }
        window->abort();
        PFLOW_LOG_DEBUG("Stage 'orderedFanOutFanIn' emitted {} items, reorder peak {}",
                        pending.nextIndex(), pending.peakSize());
        if (token.isCancelled()) {
            merged.abandon();
        }
        detail::finishStage("ordered-reorder", token, merged, out);
    });
    return rx;
}

}  // namespace pflow

#endif  // PFLOW_STAGES_ORDERED_H
