// =============================================================================
// pipeflow - Cancellation Module
// =============================================================================
// One-way cancellation signal shared across a pipeline invocation.
//
// A CancellationSource owns the signal; CancellationToken is a cheap read-only
// copy handed to stages. Stages never cancel a token, they only observe it at
// every suspension point. A source may carry a deadline and may be linked to a
// parent token, in which case cancelling the parent cancels the child.
//
// Waiters register a callback with onCancel() to be woken when the flag flips.
// Deadlines need no timer: waiters use wait_until(deadline()) and re-check.
//
// Usage:
//   pflow::CancellationSource source;
//   auto token = source.token();
//   ... hand token to stages ...
//   source.cancel();
// =============================================================================

#ifndef PFLOW_CORE_CANCELLATION_H
#define PFLOW_CORE_CANCELLATION_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

namespace pflow {

class CancellationState;

/// @brief Clock used for deadlines.
using Clock = std::chrono::steady_clock;

/// @brief Why a token reports cancellation.
enum class CancellationReason : std::uint8_t {
    /// @brief Not cancelled.
    kNone = 0,

    /// @brief cancel() was called on the source or an ancestor.
    kCancelled = 1,

    /// @brief The deadline elapsed.
    kDeadlineExceeded = 2
};

/// @brief Convert CancellationReason to string.
[[nodiscard]] constexpr std::string_view cancellationReasonToString(
    CancellationReason reason) noexcept {
    switch (reason) {
        case CancellationReason::kNone: return "none";
        case CancellationReason::kCancelled: return "cancelled";
        case CancellationReason::kDeadlineExceeded: return "deadline exceeded";
    }
    return "unknown";
}

// =============================================================================
// Cancellation Registration
// =============================================================================

/// @brief RAII handle for a callback registered with CancellationToken::onCancel.
///
/// Destroying the handle deregisters the callback. A callback that already
/// started running is not waited for, so callbacks must only touch state they
/// keep alive themselves.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::weak_ptr<CancellationState> state, std::uint64_t id) noexcept;
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    /// @brief Deregister now.
    void reset() noexcept;

    /// @brief Check if a callback is still registered.
    [[nodiscard]] bool active() const noexcept { return id_ != 0; }

private:
    std::weak_ptr<CancellationState> state_;
    std::uint64_t id_ = 0;
};

// =============================================================================
// Cancellation Token
// =============================================================================

/// @brief Read-only view of a cancellation signal.
///
/// Default-constructed tokens are never cancelled and have no deadline.
class CancellationToken {
public:
    CancellationToken() = default;

    /// @brief Check whether cancellation was requested or the deadline passed.
    [[nodiscard]] bool isCancelled() const noexcept;

    /// @brief Report why the token is cancelled.
    [[nodiscard]] CancellationReason reason() const noexcept;

    /// @brief Check whether this token can ever become cancelled.
    [[nodiscard]] bool canBeCancelled() const noexcept { return state_ != nullptr; }

    /// @brief Get the effective deadline, if any.
    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept;

    /// @brief Get the deadline or time_point::max() when there is none.
    [[nodiscard]] Clock::time_point waitLimit() const noexcept;

    /// @brief Register a callback invoked once when cancel() is called.
    /// @note Not invoked for deadline expiry; waiters poll the deadline.
    /// @note If already cancelled, the callback is not registered and an
    ///       inactive registration is returned; callers re-check isCancelled().
    [[nodiscard]] CancellationRegistration onCancel(std::function<void()> callback) const;

    /// @brief Sleep for a duration, returning early on cancellation.
    /// @return true if the full duration elapsed, false if cancelled.
    bool sleepFor(Clock::duration duration) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<CancellationState> state) noexcept
        : state_(std::move(state)) {}

    std::shared_ptr<CancellationState> state_;
};

// =============================================================================
// Cancellation Source
// =============================================================================

/// @brief Owner of a cancellation signal.
class CancellationSource {
public:
    /// @brief Create a root source with no deadline.
    CancellationSource();

    /// @brief Create a source linked to a parent token.
    /// @param parent Cancelling the parent cancels this source.
    /// @param deadline Optional deadline; the earlier of this and the parent's applies.
    explicit CancellationSource(const CancellationToken& parent,
                                std::optional<Clock::time_point> deadline = std::nullopt);

    /// @brief Create a source that expires after a timeout.
    [[nodiscard]] static CancellationSource withTimeout(
        Clock::duration timeout, const CancellationToken& parent = {});

    /// @brief Create a source that expires at a deadline.
    [[nodiscard]] static CancellationSource withDeadline(
        Clock::time_point deadline, const CancellationToken& parent = {});

    ~CancellationSource();

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;
    CancellationSource(CancellationSource&&) noexcept = default;
    CancellationSource& operator=(CancellationSource&&) noexcept = default;

    /// @brief Request cancellation. Irreversible; later calls are no-ops.
    void cancel() noexcept;

    /// @brief Check whether the signal is set.
    [[nodiscard]] bool isCancelled() const noexcept;

    /// @brief Get a token observing this source.
    [[nodiscard]] CancellationToken token() const noexcept;

private:
    std::shared_ptr<CancellationState> state_;
    CancellationRegistration parentLink_;
};

}  // namespace pflow

#endif  // PFLOW_CORE_CANCELLATION_H
