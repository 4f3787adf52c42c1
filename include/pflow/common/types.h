// =============================================================================
// pipeflow - Common Type Definitions
// =============================================================================
// Core type definitions shared by streams, stages and pools.
//
// This module defines:
// - ItemIndex, WorkerId: Type aliases for sequence positions and workers
// - CloseReason: Why a stream ended
// - SendStatus: Outcome of a send attempt
// - Default capacities and limits
// - C++20 Concepts constraining caller-supplied functions
// =============================================================================

#ifndef PFLOW_COMMON_TYPES_H
#define PFLOW_COMMON_TYPES_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <type_traits>

namespace pflow {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Zero-based position of an item in a stage's input.
using ItemIndex = std::uint64_t;

/// @brief Worker number within a fan-out or pool.
using WorkerId = std::uint32_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Capacity of an unbuffered (rendezvous) stream.
inline constexpr std::size_t kUnbuffered = 0;

/// @brief Default maximum number of items between indexing and in-order emission.
inline constexpr std::size_t kDefaultReorderWindow = 1024;

/// @brief Default jobs-stream capacity of a work pool.
inline constexpr std::size_t kDefaultWorkQueueCapacity = 0;

/// @brief Upper bound accepted for worker counts.
inline constexpr std::size_t kMaxWorkers = 1024;

// =============================================================================
// Close Reason Enumeration
// =============================================================================

/// @brief Why a stream stopped delivering values.
enum class CloseReason : std::uint8_t {
    /// @brief The producer delivered everything it had.
    kCompleted = 0,

    /// @brief The producer stopped because its token was cancelled.
    kCancelled = 1,

    /// @brief The producer stopped because a stage failed.
    kFailed = 2
};

/// @brief Convert CloseReason to string.
[[nodiscard]] constexpr std::string_view closeReasonToString(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::kCompleted: return "completed";
        case CloseReason::kCancelled: return "cancelled";
        case CloseReason::kFailed: return "failed";
    }
    return "unknown";
}

/// @brief Combine the close reasons of merged streams.
/// @note Failure dominates cancellation, which dominates completion.
[[nodiscard]] constexpr CloseReason mergeCloseReasons(CloseReason a, CloseReason b) noexcept {
    return static_cast<std::uint8_t>(a) >= static_cast<std::uint8_t>(b) ? a : b;
}

// =============================================================================
// Send Status Enumeration
// =============================================================================

/// @brief Outcome of a send into a stream.
enum class SendStatus : std::uint8_t {
    /// @brief The value was accepted.
    kSent = 0,

    /// @brief The token was cancelled before the value was accepted.
    kCancelled = 1,

    /// @brief Every reader abandoned the stream; the value was discarded.
    kAbandoned = 2
};

/// @brief Convert SendStatus to string.
[[nodiscard]] constexpr std::string_view sendStatusToString(SendStatus status) noexcept {
    switch (status) {
        case SendStatus::kSent: return "sent";
        case SendStatus::kCancelled: return "cancelled";
        case SendStatus::kAbandoned: return "abandoned";
    }
    return "unknown";
}

// =============================================================================
// Concepts
// =============================================================================

/// @brief Types that can travel through a stream.
template <typename T>
concept Streamable = std::movable<T> && std::is_object_v<T>;

/// @brief A one-argument transform producing a streamable value.
template <typename F, typename In>
concept Transform = std::invocable<F&, In> && Streamable<std::invoke_result_t<F&, In>>;

/// @brief A one-argument predicate.
template <typename F, typename In>
concept Predicate = std::predicate<F&, const In&>;

/// @brief Result type of a transform.
template <typename F, typename In>
using TransformResult = std::remove_cvref_t<std::invoke_result_t<F&, In>>;

}  // namespace pflow

#endif  // PFLOW_COMMON_TYPES_H
