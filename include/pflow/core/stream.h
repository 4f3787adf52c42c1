// =============================================================================
// pipeflow - Stream Module
// =============================================================================
// Typed FIFO queue connecting exactly one producing stage to its readers.
//
// Capacity semantics:
// - 0: rendezvous. send() returns only after a reader took the value.
// - c > 0: up to c values may sit unread before send() blocks.
//
// Lifecycle:
// - The producer owns the only Sender and closes the stream exactly once,
//   with a CloseReason and, for failures, the exception that caused it.
// - Values buffered before close are delivered before end-of-stream.
// - A reader that stops early calls abandon(): blocked and future sends
//   return SendStatus::kAbandoned and unread values are discarded.
//
// Every blocking call races the caller's CancellationToken. A cancelled
// receive() reports end-of-stream even when values are still buffered.
//
// Usage:
//   auto [tx, rx] = pflow::makeStream<int>(4);
//   tx.send(1, token);
//   tx.close();
//   while (auto v = rx.receive(token)) { ... }
// =============================================================================

#ifndef PFLOW_CORE_STREAM_H
#define PFLOW_CORE_STREAM_H

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "pflow/common/error.h"
#include "pflow/common/types.h"
#include "pflow/core/cancellation.h"

namespace pflow {

// =============================================================================
// Stream
// =============================================================================

/// @brief Shared queue behind a Sender/Receiver pair.
/// @tparam T Value type.
/// @note Create through makeStream(); cancellation wake-ups need shared ownership.
template <Streamable T>
class Stream : public std::enable_shared_from_this<Stream<T>> {
public:
    explicit Stream(std::size_t capacity) : capacity_(capacity) {}

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    /// @brief Send a value, blocking while the stream has no room.
    /// @return kSent once accepted (taken, for rendezvous streams),
    ///         kCancelled if the token fired first,
    ///         kAbandoned if the readers abandoned the stream.
    /// @throws InvalidStateError if the stream is already closed.
    SendStatus send(T value, const CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            throw InvalidStateError("send on a closed stream");
        }
        if (abandoned_) {
            return SendStatus::kAbandoned;
        }
        if (token.isCancelled()) {
            return SendStatus::kCancelled;
        }

        if (capacity_ > 0) {
            if (queue_.size() >= capacity_) {
                waitLocked(lock, token, [this] { return abandoned_ || queue_.size() < capacity_; });
                if (abandoned_) {
                    return SendStatus::kAbandoned;
                }
                if (queue_.size() >= capacity_) {
                    return SendStatus::kCancelled;
                }
            }
            queue_.push_back(Slot{nextTicket_++, std::move(value)});
            ready_.notify_all();
            return SendStatus::kSent;
        }

        // Rendezvous: park the value and wait until a reader removed it
        const std::uint64_t ticket = nextTicket_++;
        queue_.push_back(Slot{ticket, std::move(value)});
        ready_.notify_all();
        waitLocked(lock, token, [this, ticket] { return !holdsTicket(ticket); });

        if (!holdsTicket(ticket)) {
            return abandoned_ && ticket >= discardFrom_ ? SendStatus::kAbandoned
                                                        : SendStatus::kSent;
        }
        // Cancelled while still parked: withdraw the offer
        auto it = std::find_if(queue_.begin(), queue_.end(),
                               [ticket](const Slot& slot) { return slot.ticket == ticket; });
        queue_.erase(it);
        ready_.notify_all();
        return SendStatus::kCancelled;
    }

    /// @brief Receive the next value.
    /// @return The value, or nullopt at end-of-stream, on cancellation, or after abandon().
    std::optional<T> receive(const CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!readable() && !token.isCancelled()) {
            waitLocked(lock, token, [this] { return readable(); });
        }
        if (token.isCancelled() || abandoned_ || queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front().value);
        queue_.pop_front();
        ready_.notify_all();
        return value;
    }

    /// @brief Close the stream.
    /// @throws InvalidStateError if already closed.
    void close(CloseReason reason = CloseReason::kCompleted, std::exception_ptr failure = nullptr) {
        if (!tryClose(reason, std::move(failure))) {
            throw InvalidStateError("stream closed twice");
        }
    }

    /// @brief Close the stream unless it is already closed.
    /// @return true if this call closed it.
    bool tryClose(CloseReason reason = CloseReason::kCompleted,
                  std::exception_ptr failure = nullptr) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        closed_ = true;
        reason_ = reason;
        failure_ = std::move(failure);
        ready_.notify_all();
        return true;
    }

    /// @brief Declare that no reader will take more values.
    void abandon() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_) {
            return;
        }
        abandoned_ = true;
        discardFrom_ = queue_.empty() ? nextTicket_ : queue_.front().ticket;
        queue_.clear();
        ready_.notify_all();
    }

    /// @brief Check whether the producer closed the stream.
    [[nodiscard]] bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// @brief Check whether the readers abandoned the stream.
    [[nodiscard]] bool isAbandoned() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return abandoned_;
    }

    /// @brief Get the close reason, nullopt while open.
    [[nodiscard]] std::optional<CloseReason> closeReason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            return std::nullopt;
        }
        return reason_;
    }

    /// @brief Get the failure carried by a kFailed close.
    [[nodiscard]] std::exception_ptr failure() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failure_;
    }

    /// @brief Get the number of buffered values.
    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    struct Slot {
        std::uint64_t ticket;
        T value;
    };

    bool readable() const { return !queue_.empty() || closed_ || abandoned_; }

    bool holdsTicket(std::uint64_t ticket) const {
        return !queue_.empty() && queue_.front().ticket <= ticket &&
               std::any_of(queue_.begin(), queue_.end(),
                           [ticket](const Slot& slot) { return slot.ticket == ticket; });
    }

    /// @brief Wait until pred holds or the token fires.
    template <typename Pred>
    void waitLocked(std::unique_lock<std::mutex>& lock, const CancellationToken& token, Pred pred) {
        CancellationRegistration wake;
        if (token.canBeCancelled()) {
            std::weak_ptr<Stream> weak = this->weak_from_this();
            wake = token.onCancel([weak] {
                if (auto self = weak.lock()) {
                    std::lock_guard<std::mutex> guard(self->mutex_);
                    self->ready_.notify_all();
                }
            });
        }
        auto done = [&] { return token.isCancelled() || pred(); };
        if (auto deadline = token.deadline()) {
            ready_.wait_until(lock, *deadline, done);
        } else {
            ready_.wait(lock, done);
        }
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Slot> queue_;
    std::uint64_t nextTicket_ = 0;
    std::uint64_t discardFrom_ = 0;
    bool closed_ = false;
    bool abandoned_ = false;
    CloseReason reason_ = CloseReason::kCompleted;
    std::exception_ptr failure_;
};

// =============================================================================
// Sender
// =============================================================================

/// @brief Write handle, held by the single producing stage.
///
/// Move-only. A Sender destroyed while its stream is open closes it with
/// CloseReason::kCompleted.
template <Streamable T>
class Sender {
public:
    Sender() = default;
    explicit Sender(std::shared_ptr<Stream<T>> stream) noexcept : stream_(std::move(stream)) {}

    ~Sender() {
        if (stream_) {
            stream_->tryClose(CloseReason::kCompleted);
        }
    }

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;
    Sender(Sender&&) noexcept = default;

    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            if (stream_) {
                stream_->tryClose(CloseReason::kCompleted);
            }
            stream_ = std::move(other.stream_);
        }
        return *this;
    }

    SendStatus send(T value, const CancellationToken& token) const {
        return stream_->send(std::move(value), token);
    }

    void close(CloseReason reason = CloseReason::kCompleted,
               std::exception_ptr failure = nullptr) const {
        stream_->close(reason, std::move(failure));
    }

    bool tryClose(CloseReason reason = CloseReason::kCompleted,
                  std::exception_ptr failure = nullptr) const noexcept {
        return stream_ && stream_->tryClose(reason, std::move(failure));
    }

    [[nodiscard]] bool isAbandoned() const { return stream_->isAbandoned(); }
    [[nodiscard]] bool valid() const noexcept { return stream_ != nullptr; }

private:
    std::shared_ptr<Stream<T>> stream_;
};

// =============================================================================
// Receiver
// =============================================================================

/// @brief Read handle. Copies share the same stream.
template <Streamable T>
class Receiver {
public:
    Receiver() = default;
    explicit Receiver(std::shared_ptr<Stream<T>> stream) noexcept : stream_(std::move(stream)) {}

    std::optional<T> receive(const CancellationToken& token) const {
        return stream_->receive(token);
    }

    void abandon() const noexcept {
        if (stream_) {
            stream_->abandon();
        }
    }

    [[nodiscard]] bool isClosed() const { return stream_->isClosed(); }
    [[nodiscard]] std::optional<CloseReason> closeReason() const { return stream_->closeReason(); }
    [[nodiscard]] std::exception_ptr failure() const { return stream_->failure(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return stream_->capacity(); }
    [[nodiscard]] bool valid() const noexcept { return stream_ != nullptr; }

private:
    std::shared_ptr<Stream<T>> stream_;
};

/// @brief Create a stream and its two handles.
/// @param capacity 0 for a rendezvous stream.
template <Streamable T>
[[nodiscard]] std::pair<Sender<T>, Receiver<T>> makeStream(std::size_t capacity = kUnbuffered) {
    auto stream = std::make_shared<Stream<T>>(capacity);
    return {Sender<T>(stream), Receiver<T>(stream)};
}

/// @brief Decide why a reader's loop ended.
/// @note Cancellation wins because a cancelled receive() hides buffered values.
[[nodiscard]] inline CloseReason endReason(const CancellationToken& token,
                                           std::optional<CloseReason> closed) noexcept {
    if (token.isCancelled() || !closed.has_value()) {
        return CloseReason::kCancelled;
    }
    return *closed;
}

}  // namespace pflow

#endif  // PFLOW_CORE_STREAM_H
