// =============================================================================
// pipeflow - Pipeline Builder
// =============================================================================
// Fluent composition of stages on one Context.
//
// Every call launches its stage immediately and returns a new Pipeline that
// wraps the stage's output stream:
//
//   pflow::Context ctx(token);
//   auto squares = pflow::Pipeline<int>::from(ctx, {1, 2, 3, 4})
//                      .map([](int x) { return x * x; })
//                      .filter([](int x) { return x % 2 == 0; })
//                      .collect();
// =============================================================================

#ifndef PFLOW_PIPELINE_PIPELINE_H
#define PFLOW_PIPELINE_PIPELINE_H

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

#include "pflow/common/error.h"
#include "pflow/stages/ordered.h"
#include "pflow/stages/topology.h"

namespace pflow {

template <Streamable T>
class Pipeline {
public:
    using ValueType = T;

    /// @brief Wrap an existing stream.
    Pipeline(Context& ctx, Receiver<T> stream) : ctx_(&ctx), stream_(std::move(stream)) {}

    /// @brief Start from a generator over values.
    [[nodiscard]] static Pipeline from(Context& ctx, std::vector<T> values) {
        return Pipeline(ctx, generator(ctx, std::move(values)));
    }

    [[nodiscard]] static Pipeline from(Context& ctx, std::initializer_list<T> values) {
        return from(ctx, std::vector<T>(values));
    }

    // =========================================================================
    // Stages
    // =========================================================================

    template <typename Fn>
        requires Transform<Fn, T>
    [[nodiscard]] Pipeline<TransformResult<Fn, T>> map(Fn fn) const {
        return {*ctx_, pflow::map(*ctx_, stream_, std::move(fn))};
    }

    template <typename Pred>
        requires Predicate<Pred, T>
    [[nodiscard]] Pipeline filter(Pred predicate) const {
        return {*ctx_, pflow::filter(*ctx_, stream_, std::move(predicate))};
    }

    [[nodiscard]] Pipeline take(std::size_t n) const {
        return {*ctx_, pflow::take(*ctx_, stream_, n)};
    }

    [[nodiscard]] Pipeline buffer(std::size_t capacity) const {
        return {*ctx_, pflow::buffer(*ctx_, stream_, capacity)};
    }

    [[nodiscard]] Pipeline<std::vector<T>> batch(std::size_t size) const {
        return {*ctx_, pflow::batch(*ctx_, stream_, size)};
    }

    template <typename Fn>
        requires Transform<Fn, T>
    [[nodiscard]] Pipeline<Result<FallibleResult<Fn, T>>> mapWithError(Fn fn) const {
        return {*ctx_, pflow::mapWithError(*ctx_, stream_, std::move(fn))};
    }

    /// @brief Unordered parallel map.
    template <typename Fn>
        requires Transform<Fn, T>
    [[nodiscard]] Pipeline<TransformResult<Fn, T>> fanOut(std::size_t workerCount, Fn fn) const {
        return {*ctx_, fanOutFanIn(*ctx_, stream_, workerCount, std::move(fn))};
    }

    /// @brief Order-preserving parallel map.
    template <typename Fn>
        requires Transform<Fn, T>
    [[nodiscard]] Pipeline<TransformResult<Fn, T>> orderedFanOut(
        std::size_t workerCount, Fn fn, OrderedOptions options = {}) const {
        return {*ctx_, orderedFanOutFanIn(*ctx_, stream_, workerCount, std::move(fn), options)};
    }

    /// @brief Split into two pipelines receiving every value.
    [[nodiscard]] std::pair<Pipeline, Pipeline> tee(TeeOptions options = {}) const
        requires std::copyable<T>
    {
        auto [first, second] = pflow::tee(*ctx_, stream_, options);
        return {Pipeline(*ctx_, first), Pipeline(*ctx_, second)};
    }

    // =========================================================================
    // Terminals
    // =========================================================================

    /// @brief Drain into a vector. On cancellation returns what was read.
    [[nodiscard]] std::vector<T> collect() const { return pflow::collect(*ctx_, stream_); }

    /// @brief Drain into a vector, reporting how the stream ended.
    /// @return kStageFailed if a stage failed, kCancelled if cancelled.
    [[nodiscard]] Result<std::vector<T>> collectChecked() const {
        std::vector<T> values;
        const CloseReason reason =
            sink(*ctx_, stream_, [&values](T value) { values.push_back(std::move(value)); });
        switch (reason) {
            case CloseReason::kCompleted:
                return values;
            case CloseReason::kCancelled:
                if (ctx_->token().reason() == CancellationReason::kDeadlineExceeded) {
                    return makeError(ErrorCode::kDeadlineExceeded,
                                     "pipeline deadline exceeded after {} values", values.size());
                }
                return makeError(ErrorCode::kCancelled, "pipeline cancelled after {} values",
                                 values.size());
            case CloseReason::kFailed:
                return makeError(ErrorCode::kStageFailed, "pipeline failed: {}",
                                 errorFromException(stream_.failure()).message());
        }
        return makeError(ErrorCode::kInternalError, "unknown close reason");
    }

    /// @brief Call fn for every value on the calling thread.
    template <typename Fn>
        requires std::invocable<Fn&, T>
    CloseReason forEach(Fn&& fn) const {
        return sink(*ctx_, stream_, std::forward<Fn>(fn));
    }

    /// @brief Current output stream.
    [[nodiscard]] const Receiver<T>& out() const noexcept { return stream_; }

    [[nodiscard]] Context& context() const noexcept { return *ctx_; }

private:
    Context* ctx_;
    Receiver<T> stream_;
};

}  // namespace pflow

#endif  // PFLOW_PIPELINE_PIPELINE_H
