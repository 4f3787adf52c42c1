// =============================================================================
// pipeflow - Context Module Implementation
// =============================================================================

#include "pflow/core/context.h"

#include <algorithm>

#include "pflow/common/error.h"
#include "pflow/common/logger.h"

namespace pflow {

std::size_t recommendedWorkerCount() noexcept {
    auto hwThreads = std::thread::hardware_concurrency();
    if (hwThreads == 0) {
        return 4;  // Fallback default
    }
    return std::min<std::size_t>(hwThreads, 32);
}

// =============================================================================
// Context Implementation
// =============================================================================

Context::Context(std::string name) : name_(std::move(name)) {}

Context::Context(const CancellationToken& parent, std::string name)
    : name_(std::move(name)), source_(parent) {}

Context::~Context() {
    source_.cancel();

    // Tasks never spawn tasks, but drain in a loop so a late spawn is still joined
    while (true) {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            threads.swap(threads_);
        }
        if (threads.empty()) {
            break;
        }
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }
    PFLOW_LOG_DEBUG("Context '{}' finished {} tasks", name_, spawned_);
}

void Context::cancel() noexcept {
    source_.cancel();
}

std::size_t Context::activeTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

std::size_t Context::spawnedTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spawned_;
}

void Context::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return active_ == 0; });
}

bool Context::waitFor(Clock::duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_.wait_for(lock, timeout, [this] { return active_ == 0; });
}

std::exception_ptr Context::taskFailure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return taskFailure_;
}

void Context::beginTask(const std::string& taskName) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++active_;
    ++spawned_;
    PFLOW_LOG_TRACE("Context '{}' starting task '{}'", name_, taskName);
}

void Context::endTask(const std::string& taskName, std::exception_ptr failure) noexcept {
    if (failure) {
        const Error error = errorFromException(failure);
        PFLOW_LOG_ERROR("Task '{}' in context '{}' failed: {}", taskName, name_,
                        error.toString());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failure && !taskFailure_) {
            taskFailure_ = std::move(failure);
        }
        --active_;
    }
    idle_.notify_all();
}

}  // namespace pflow
