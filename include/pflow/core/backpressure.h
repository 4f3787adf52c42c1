// =============================================================================
// pipeflow - Backpressure Module
// =============================================================================
// Counting window bounding the number of items between two points of a
// pipeline. The ordering layer acquires a slot when it indexes an item and
// releases it when the item is emitted in order, which caps the reorder
// buffer at the window size.
// =============================================================================

#ifndef PFLOW_CORE_BACKPRESSURE_H
#define PFLOW_CORE_BACKPRESSURE_H

#include <cstddef>
#include <memory>

#include "pflow/common/types.h"
#include "pflow/core/cancellation.h"

namespace pflow {

/// @brief Limits in-flight items between a producer and a consumer.
///
/// A limit of 0 disables the bound: acquire() never blocks.
class BackpressureController {
public:
    /// @brief Construct with limit
    /// @param maxInFlight Maximum in-flight items, 0 for unbounded
    explicit BackpressureController(std::size_t maxInFlight = kDefaultReorderWindow);

    ~BackpressureController();

    BackpressureController(const BackpressureController&) = delete;
    BackpressureController& operator=(const BackpressureController&) = delete;

    /// @brief Acquire a slot, blocking while at the limit.
    /// @return false if the token fired or abort() was called first.
    [[nodiscard]] bool acquire(const CancellationToken& token);

    /// @brief Release a slot
    void release();

    /// @brief Fail every current and future acquire().
    /// @note Called by the consumer when it stops early.
    void abort() noexcept;

    /// @brief Get current in-flight count
    [[nodiscard]] std::size_t inFlight() const noexcept;

    /// @brief Get maximum in-flight limit
    [[nodiscard]] std::size_t maxInFlight() const noexcept;

private:
    struct State;
    std::shared_ptr<State> state_;
};

}  // namespace pflow

#endif  // PFLOW_CORE_BACKPRESSURE_H
