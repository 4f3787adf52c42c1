// =============================================================================
// pipeflow - Source and Sink Stages
// =============================================================================
// Stages that start, end, buffer or truncate a stream:
// - generator: emit a fixed sequence
// - sink / collect: drain a stream on the calling thread
// - buffer: re-emit through a stream with slack
// - take: forward the first n values, then abandon the input
//
// Conventions shared by every stage:
// - A stage owns its output streams and closes each exactly once.
// - A send that does not return kSent stops the stage, which then abandons
//   its inputs so that producers further upstream are released too.
// - The input's close reason (and failure) is propagated to the output.
// =============================================================================

#ifndef PFLOW_STAGES_SOURCE_H
#define PFLOW_STAGES_SOURCE_H

#include <cstddef>
#include <exception>
#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

#include "pflow/common/error.h"
#include "pflow/common/logger.h"
#include "pflow/common/types.h"
#include "pflow/core/context.h"
#include "pflow/core/stream.h"

namespace pflow {

namespace detail {

/// @brief Close an output after a send was refused.
template <Streamable U>
void closeAfterRefusedSend(SendStatus status, const Sender<U>& out) noexcept {
    out.tryClose(status == SendStatus::kCancelled ? CloseReason::kCancelled
                                                  : CloseReason::kCompleted);
}

/// @brief Stop a one-input stage whose downstream refused a value.
template <Streamable T, Streamable U>
void stopStage(std::string_view stage, SendStatus status, const Receiver<T>& in,
               const Sender<U>& out) noexcept {
    in.abandon();
    closeAfterRefusedSend(status, out);
    PFLOW_LOG_DEBUG("Stage '{}' stopped: output {}", stage, sendStatusToString(status));
}

/// @brief Close an output with the reason its input ended.
template <Streamable T, Streamable U>
void finishStage(std::string_view stage, const CancellationToken& token, const Receiver<T>& in,
                 const Sender<U>& out) {
    const CloseReason reason = endReason(token, in.closeReason());
    out.tryClose(reason, reason == CloseReason::kFailed ? in.failure() : nullptr);
    PFLOW_LOG_DEBUG("Stage '{}' finished: {}", stage, closeReasonToString(reason));
}

/// @brief Fail a stage whose caller-supplied function threw.
template <Streamable T, Streamable U>
void failStage(std::string_view stage, ItemIndex index, std::exception_ptr failure,
               const Receiver<T>& in, const Sender<U>& out) {
    const Error error = errorFromException(failure);
    PFLOW_LOG_ERROR("Stage '{}' failed at item {}: {}", stage, index, error.toString());
    in.abandon();
    out.tryClose(CloseReason::kFailed, std::move(failure));
}

}  // namespace detail

// =============================================================================
// generator
// =============================================================================

/// @brief Emit each value in order on a rendezvous stream, then close.
template <Streamable T>
[[nodiscard]] Receiver<T> generator(Context& ctx, std::vector<T> values) {
    auto [tx, rx] = makeStream<T>(kUnbuffered);
    ctx.spawn("generator",
              [token = ctx.token(), out = std::move(tx), values = std::move(values)]() mutable {
                  for (auto&& value : values) {
                      const SendStatus status = out.send(std::move(value), token);
                      if (status != SendStatus::kSent) {
                          detail::closeAfterRefusedSend(status, out);
                          return;
                      }
                  }
                  out.close(CloseReason::kCompleted);
              });
    return rx;
}

template <Streamable T>
[[nodiscard]] Receiver<T> generator(Context& ctx, std::initializer_list<T> values) {
    return generator(ctx, std::vector<T>(values));
}

// =============================================================================
// sink / collect
// =============================================================================

/// @brief Call fn once per value, in arrival order, on the calling thread.
/// @return How the input ended; kCancelled if the context was cancelled.
/// @note If fn throws, the input is abandoned and the exception propagates.
template <Streamable T, typename Fn>
    requires std::invocable<Fn&, T>
CloseReason sink(Context& ctx, const Receiver<T>& in, Fn&& fn) {
    const CancellationToken token = ctx.token();
    try {
        while (auto value = in.receive(token)) {
            fn(std::move(*value));
        }
    } catch (...) {
        in.abandon();
        throw;
    }
    return endReason(token, in.closeReason());
}

/// @brief Drain a stream into a vector on the calling thread.
/// @note On cancellation returns what was read so far.
template <Streamable T>
[[nodiscard]] std::vector<T> collect(Context& ctx, const Receiver<T>& in) {
    std::vector<T> values;
    sink(ctx, in, [&values](T value) { values.push_back(std::move(value)); });
    return values;
}

// =============================================================================
// buffer
// =============================================================================

/// @brief Re-emit the input through a stream of the given capacity.
template <Streamable T>
[[nodiscard]] Receiver<T> buffer(Context& ctx, Receiver<T> in, std::size_t capacity) {
    auto [tx, rx] = makeStream<T>(capacity);
    ctx.spawn("buffer", [token = ctx.token(), in = std::move(in), out = std::move(tx)] {
        while (auto value = in.receive(token)) {
            const SendStatus status = out.send(std::move(*value), token);
            if (status != SendStatus::kSent) {
                detail::stopStage("buffer", status, in, out);
                return;
            }
        }
        detail::finishStage("buffer", token, in, out);
    });
    return rx;
}

// =============================================================================
// take
// =============================================================================

/// @brief Forward at most n values, then abandon the input.
///
/// When the input ends first everything is forwarded and its close reason
/// propagated. After the n-th value the output closes with kCompleted.
template <Streamable T>
[[nodiscard]] Receiver<T> take(Context& ctx, Receiver<T> in, std::size_t n) {
    auto [tx, rx] = makeStream<T>(kUnbuffered);
    if (n == 0) {
        in.abandon();
        tx.close(CloseReason::kCompleted);
        return rx;
    }
    ctx.spawn("take", [token = ctx.token(), in = std::move(in), out = std::move(tx), n] {
        std::size_t taken = 0;
        while (taken < n) {
            auto value = in.receive(token);
            if (!value) {
                detail::finishStage("take", token, in, out);
                return;
            }
            const SendStatus status = out.send(std::move(*value), token);
            if (status != SendStatus::kSent) {
                detail::stopStage("take", status, in, out);
                return;
            }
            ++taken;
        }
        in.abandon();
        out.close(CloseReason::kCompleted);
        PFLOW_LOG_DEBUG("Stage 'take' reached {} values, input abandoned", n);
    });
    return rx;
}

}  // namespace pflow

#endif  // PFLOW_STAGES_SOURCE_H
