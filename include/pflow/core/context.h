// =============================================================================
// pipeflow - Context Module
// =============================================================================
// Task scope for one pipeline invocation.
//
// A Context owns a CancellationSource linked to the caller's token and every
// task that stages launch on it. Each task runs on its own thread because
// stage tasks block on streams. Destroying the Context cancels its source
// and joins every task, so no stage outlives the scope that started it.
//
// Usage:
//   pflow::Context ctx(callerToken);
//   auto out = pflow::map(ctx, pflow::generator(ctx, values), square);
//   auto results = pflow::collect(ctx, out);
// =============================================================================

#ifndef PFLOW_CORE_CONTEXT_H
#define PFLOW_CORE_CONTEXT_H

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "pflow/core/cancellation.h"

namespace pflow {

/// @brief Get recommended number of workers for the current system.
[[nodiscard]] std::size_t recommendedWorkerCount() noexcept;

// =============================================================================
// Context
// =============================================================================

/// @brief Owner of the tasks and cancellation of one pipeline invocation.
/// @note Every spawned task is a dedicated OS thread, so a stage's workerCount
///       (or a pool's numWorkers) maps one-to-one onto threads.
class Context {
public:
    /// @brief Create a root context that is only cancelled through cancel().
    explicit Context(std::string name = "pipeline");

    /// @brief Create a context cancelled together with a caller's token.
    explicit Context(const CancellationToken& parent, std::string name = "pipeline");

    /// @brief Cancel and join every task.
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = delete;
    Context& operator=(Context&&) = delete;

    /// @brief Token observed by every stage launched on this context.
    [[nodiscard]] CancellationToken token() const noexcept { return source_.token(); }

    /// @brief Cancel every stage of this invocation.
    void cancel() noexcept;

    [[nodiscard]] bool isCancelled() const noexcept { return source_.isCancelled(); }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// @brief Launch a task.
    /// @param taskName Name used in log messages.
    /// @param body Callable run on a new thread. Exceptions escaping it are
    ///        logged and kept as taskFailure().
    template <typename F>
    void spawn(std::string taskName, F&& body) {
        beginTask(taskName);
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            threads_.emplace_back(
                [this, taskName = std::move(taskName), body = std::forward<F>(body)]() mutable {
                    std::exception_ptr failure;
                    try {
                        body();
                    } catch (...) {
                        failure = std::current_exception();
                    }
                    endTask(taskName, std::move(failure));
                });
        } catch (const std::exception&) {
            endTask("spawn", std::current_exception());
            throw;
        }
    }

    /// @brief Number of tasks that have not finished.
    [[nodiscard]] std::size_t activeTasks() const;

    /// @brief Number of tasks launched so far.
    [[nodiscard]] std::size_t spawnedTasks() const;

    /// @brief Block until every task has finished.
    void wait();

    /// @brief Block until every task has finished or the timeout elapsed.
    /// @return true if all tasks finished.
    bool waitFor(Clock::duration timeout);

    /// @brief First exception that escaped a task body, if any.
    [[nodiscard]] std::exception_ptr taskFailure() const;

private:
    void beginTask(const std::string& taskName);
    void endTask(const std::string& taskName, std::exception_ptr failure) noexcept;

    std::string name_;
    CancellationSource source_;
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::vector<std::thread> threads_;
    std::size_t active_ = 0;
    std::size_t spawned_ = 0;
    std::exception_ptr taskFailure_;
};

}  // namespace pflow

#endif  // PFLOW_CORE_CONTEXT_H
