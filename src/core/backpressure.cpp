// =============================================================================
// pipeflow - Backpressure Module Implementation
// =============================================================================

#include "pflow/core/backpressure.h"

#include <condition_variable>
#include <mutex>

namespace pflow {

struct BackpressureController::State {
    explicit State(std::size_t limit) : maxInFlight(limit) {}

    bool hasRoom() const noexcept { return maxInFlight == 0 || inFlight < maxInFlight; }

    const std::size_t maxInFlight;
    std::size_t inFlight = 0;
    bool aborted = false;
    mutable std::mutex mutex;
    std::condition_variable cv;
};

// =============================================================================
// BackpressureController Implementation
// =============================================================================

BackpressureController::BackpressureController(std::size_t maxInFlight)
    : state_(std::make_shared<State>(maxInFlight)) {}

BackpressureController::~BackpressureController() = default;

bool BackpressureController::acquire(const CancellationToken& token) {
    std::unique_lock lock(state_->mutex);
    if (!state_->aborted && !state_->hasRoom()) {
        CancellationRegistration wake;
        if (token.canBeCancelled()) {
            std::weak_ptr<State> weak = state_;
            wake = token.onCancel([weak] {
                if (auto state = weak.lock()) {
                    std::lock_guard guard(state->mutex);
                    state->cv.notify_all();
                }
            });
        }
        auto done = [&] {
            return state_->aborted || state_->hasRoom() || token.isCancelled();
        };
        if (auto deadline = token.deadline()) {
            state_->cv.wait_until(lock, *deadline, done);
        } else {
            state_->cv.wait(lock, done);
        }
    }
    if (state_->aborted || !state_->hasRoom() || token.isCancelled()) {
        return false;
    }
    ++state_->inFlight;
    return true;
}

void BackpressureController::release() {
    {
        std::lock_guard lock(state_->mutex);
        if (state_->inFlight > 0) {
            --state_->inFlight;
        }
    }
    state_->cv.notify_one();
}

void BackpressureController::abort() noexcept {
    {
        std::lock_guard lock(state_->mutex);
        state_->aborted = true;
    }
    state_->cv.notify_all();
}

std::size_t BackpressureController::inFlight() const noexcept {
    std::lock_guard lock(state_->mutex);
    return state_->inFlight;
}

std::size_t BackpressureController::maxInFlight() const noexcept {
    return state_->maxInFlight;
}

}  // namespace pflow
