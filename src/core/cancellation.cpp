// =============================================================================
// pipeflow - Cancellation Module Implementation
// =============================================================================

#include "pflow/core/cancellation.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace pflow {

// =============================================================================
// CancellationState
// =============================================================================

/// @brief Shared state behind a source and its tokens.
class CancellationState {
public:
    explicit CancellationState(std::optional<Clock::time_point> deadline) : deadline_(deadline) {}

    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

    bool deadlinePassed() const noexcept {
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    void cancel() noexcept {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.load(std::memory_order_relaxed)) {
                return;
            }
            cancelled_.store(true, std::memory_order_release);
            pending.reserve(callbacks_.size());
            for (auto& [id, callback] : callbacks_) {
                pending.push_back(std::move(callback));
            }
            callbacks_.clear();
        }
        wake_.notify_all();

        // Callbacks lock stream mutexes; run them with our lock released
        for (auto& callback : pending) {
            callback();
        }
    }

    std::uint64_t add(std::function<void()> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.load(std::memory_order_relaxed)) {
            return 0;
        }
        const std::uint64_t id = nextId_++;
        callbacks_.emplace(id, std::move(callback));
        return id;
    }

    void remove(std::uint64_t id) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks_.erase(id);
    }

    bool sleepUntil(Clock::time_point until) {
        if (deadline_.has_value()) {
            until = std::min(until, *deadline_);
        }
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_until(lock, until, [this] { return cancelled(); });
        lock.unlock();
        return !cancelled() && !deadlinePassed();
    }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::map<std::uint64_t, std::function<void()>> callbacks_;
    std::uint64_t nextId_ = 1;
};

// =============================================================================
// CancellationRegistration
// =============================================================================

CancellationRegistration::CancellationRegistration(std::weak_ptr<CancellationState> state,
                                                   std::uint64_t id) noexcept
    : state_(std::move(state)), id_(id) {}

CancellationRegistration::~CancellationRegistration() { reset(); }

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0)) {}

CancellationRegistration& CancellationRegistration::operator=(
    CancellationRegistration&& other) noexcept {
    if (this != &other) {
        reset();
        state_ = std::move(other.state_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

void CancellationRegistration::reset() noexcept {
    if (id_ == 0) {
        return;
    }
    if (auto state = state_.lock()) {
        state->remove(id_);
    }
    state_.reset();
    id_ = 0;
}

// =============================================================================
// CancellationToken
// =============================================================================

bool CancellationToken::isCancelled() const noexcept {
    return state_ && (state_->cancelled() || state_->deadlinePassed());
}

CancellationReason CancellationToken::reason() const noexcept {
    if (!state_) {
        return CancellationReason::kNone;
    }
    if (state_->cancelled()) {
        return CancellationReason::kCancelled;
    }
    if (state_->deadlinePassed()) {
        return CancellationReason::kDeadlineExceeded;
    }
    return CancellationReason::kNone;
}

std::optional<Clock::time_point> CancellationToken::deadline() const noexcept {
    if (!state_) {
        return std::nullopt;
    }
    return state_->deadline();
}

Clock::time_point CancellationToken::waitLimit() const noexcept {
    return deadline().value_or(Clock::time_point::max());
}

CancellationRegistration CancellationToken::onCancel(std::function<void()> callback) const {
    if (!state_) {
        return {};
    }
    const std::uint64_t id = state_->add(std::move(callback));
    if (id == 0) {
        return {};
    }
    return CancellationRegistration(state_, id);
}

bool CancellationToken::sleepFor(Clock::duration duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return true;
    }
    if (isCancelled()) {
        return false;
    }
    const auto now = Clock::now();
    const auto until = duration >= Clock::time_point::max() - now ? Clock::time_point::max()
                                                                  : now + duration;
    if (!state_->sleepUntil(until)) {
        return false;
    }
    return Clock::now() >= until;
}

// =============================================================================
// CancellationSource
// =============================================================================

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationState>(std::nullopt)) {}

CancellationSource::CancellationSource(const CancellationToken& parent,
                                       std::optional<Clock::time_point> deadline) {
    std::optional<Clock::time_point> effective = deadline;
    if (auto parentDeadline = parent.deadline()) {
        effective = effective ? std::min(*effective, *parentDeadline) : *parentDeadline;
    }
    state_ = std::make_shared<CancellationState>(effective);

    if (!parent.canBeCancelled()) {
        return;
    }
    std::weak_ptr<CancellationState> weak = state_;
    parentLink_ = parent.onCancel([weak] {
        if (auto state = weak.lock()) {
            state->cancel();
        }
    });
    // Registration is refused once the parent fired
    if (parent.isCancelled() && parent.reason() == CancellationReason::kCancelled) {
        state_->cancel();
    }
}

CancellationSource CancellationSource::withTimeout(Clock::duration timeout,
                                                   const CancellationToken& parent) {
    return CancellationSource(parent, Clock::now() + timeout);
}

CancellationSource CancellationSource::withDeadline(Clock::time_point deadline,
                                                    const CancellationToken& parent) {
    return CancellationSource(parent, deadline);
}

CancellationSource::~CancellationSource() = default;

void CancellationSource::cancel() noexcept {
    if (state_) {
        state_->cancel();
    }
}

bool CancellationSource::isCancelled() const noexcept {
    return token().isCancelled();
}

CancellationToken CancellationSource::token() const noexcept {
    return CancellationToken(state_);
}

}  // namespace pflow
