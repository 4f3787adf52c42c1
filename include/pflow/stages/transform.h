// =============================================================================
// pipeflow - Transform Stages
// =============================================================================
// One-input stages that change or select values:
// - map: apply a function to every value
// - filter: keep values satisfying a predicate
// - mapWithError: apply a fallible function, tagging each result
// - collectErrors: split tagged results into a value stream and an error stream
//
// A function that throws inside map or filter is fatal for the stage: the
// output closes with CloseReason::kFailed carrying the exception. Per-item
// failures that should not stop the stream go through mapWithError.
// =============================================================================

#ifndef PFLOW_STAGES_TRANSFORM_H
#define PFLOW_STAGES_TRANSFORM_H

#include <exception>
#include <type_traits>
#include <utility>

#include "pflow/stages/source.h"

namespace pflow {

namespace detail {

template <typename T>
struct IsResult : std::false_type {};

template <typename T>
struct IsResult<Result<T>> : std::true_type {};

/// @brief Value type produced by a fallible function.
template <typename R>
struct FallibleValue {
    using Type = R;
};

template <typename T>
struct FallibleValue<Result<T>> {
    using Type = T;
};

}  // namespace detail

/// @brief Output value type of mapWithError for a function returning R.
template <typename F, typename In>
using FallibleResult = typename detail::FallibleValue<TransformResult<F, In>>::Type;

// =============================================================================
// map
// =============================================================================

/// @brief Apply fn to every value, preserving order.
template <Streamable In, typename Fn>
    requires Transform<Fn, In>
[[nodiscard]] Receiver<TransformResult<Fn, In>> map(Context& ctx, Receiver<In> in, Fn fn) {
    using Out = TransformResult<Fn, In>;
    auto [tx, rx] = makeStream<Out>(kUnbuffered);
    ctx.spawn("map", [token = ctx.token(), in = std::move(in), out = std::move(tx),
                      fn = std::move(fn)]() mutable {
        ItemIndex index = 0;
        try {
            while (auto value = in.receive(token)) {
                const SendStatus status = out.send(fn(std::move(*value)), token);
                if (status != SendStatus::kSent) {
                    detail::stopStage("map", status, in, out);
                    return;
                }
                ++index;
            }
        } catch (...) {
            detail::failStage("map", index, std::current_exception(), in, out);
            return;
        }
        detail::finishStage("map", token, in, out);
    });
    return rx;
}

// =============================================================================
// filter
// =============================================================================

/// @brief Forward only values for which predicate returns true.
template <Streamable T, typename Pred>
    requires Predicate<Pred, T>
[[nodiscard]] Receiver<T> filter(Context& ctx, Receiver<T> in, Pred predicate) {
    auto [tx, rx] = makeStream<T>(kUnbuffered);
    ctx.spawn("filter", [token = ctx.token(), in = std::move(in), out = std::move(tx),
                         predicate = std::move(predicate)]() mutable {
        ItemIndex index = 0;
        try {
            while (auto value = in.receive(token)) {
                if (predicate(std::as_const(*value))) {
                    const SendStatus status = out.send(std::move(*value), token);
                    if (status != SendStatus::kSent) {
                        detail::stopStage("filter", status, in, out);
                        return;
                    }
                }
                ++index;
            }
        } catch (...) {
            detail::failStage("filter", index, std::current_exception(), in, out);
            return;
        }
        detail::finishStage("filter", token, in, out);
    });
    return rx;
}

// =============================================================================
// mapWithError
// =============================================================================

/// @brief Apply a fallible function, emitting one Result per input value.
///
/// fn may return Result<Out> or a plain Out. An exception thrown by fn becomes
/// an error result (kStageFailed, or the code of a PFlowException); the stage
/// itself keeps going.
template <Streamable In, typename Fn>
    requires Transform<Fn, In>
[[nodiscard]] Receiver<Result<FallibleResult<Fn, In>>> mapWithError(Context& ctx, Receiver<In> in,
                                                                    Fn fn) {
    using Out = FallibleResult<Fn, In>;
    auto [tx, rx] = makeStream<Result<Out>>(kUnbuffered);
    ctx.spawn("mapWithError", [token = ctx.token(), in = std::move(in), out = std::move(tx),
                               fn = std::move(fn)]() mutable {
        while (auto value = in.receive(token)) {
            Result<Out> result = [&]() -> Result<Out> {
                try {
                    if constexpr (detail::IsResult<TransformResult<Fn, In>>::value) {
                        return fn(std::move(*value));
                    } else {
                        return Result<Out>{fn(std::move(*value))};
                    }
                } catch (...) {
                    return std::unexpected(errorFromException(std::current_exception()));
                }
            }();
            const SendStatus status = out.send(std::move(result), token);
            if (status != SendStatus::kSent) {
                detail::stopStage("mapWithError", status, in, out);
                return;
            }
        }
        detail::finishStage("mapWithError", token, in, out);
    });
    return rx;
}

// =============================================================================
// collectErrors
// =============================================================================

/// @brief Route successes and errors of a tagged stream to separate outputs.
///
/// Both outputs are fed by one task. The caller must drain them concurrently:
/// a value waiting on an unread output stalls the other.
/// An abandoned output is skipped; when both are abandoned the input is too.
template <Streamable T>
[[nodiscard]] std::pair<Receiver<T>, Receiver<Error>> collectErrors(Context& ctx,
                                                                    Receiver<Result<T>> in) {
    auto [valueTx, valueRx] = makeStream<T>(kUnbuffered);
    auto [errorTx, errorRx] = makeStream<Error>(kUnbuffered);
    ctx.spawn("collectErrors", [token = ctx.token(), in = std::move(in),
                                values = std::move(valueTx), errors = std::move(errorTx)] {
        bool valuesOpen = true;
        bool errorsOpen = true;
        while (auto item = in.receive(token)) {
            SendStatus status = SendStatus::kSent;
            if (item->has_value()) {
                if (valuesOpen) {
                    status = values.send(std::move(item->value()), token);
                    valuesOpen = status == SendStatus::kSent;
                }
            } else if (errorsOpen) {
                status = errors.send(std::move(item->error()), token);
                errorsOpen = status == SendStatus::kSent;
            }

            if (status == SendStatus::kCancelled) {
                in.abandon();
                values.tryClose(CloseReason::kCancelled);
                errors.tryClose(CloseReason::kCancelled);
                return;
            }
            if (!valuesOpen && !errorsOpen) {
                detail::stopStage("collectErrors", SendStatus::kAbandoned, in, values);
                errors.tryClose(CloseReason::kCompleted);
                return;
            }
        }
        detail::finishStage("collectErrors", token, in, values);
        detail::finishStage("collectErrors", token, in, errors);
    });
    return {valueRx, errorRx};
}

}  // namespace pflow

#endif  // PFLOW_STAGES_TRANSFORM_H
