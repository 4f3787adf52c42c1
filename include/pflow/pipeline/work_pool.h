// =============================================================================
// pipeflow - Work Pool
// =============================================================================
// Fixed-size pool of workers consuming submitted jobs.
//
// State machine:
//   kCreated --start()--> kStarted --submit()--> kAccepting
//   kStarted/kAccepting --close()--> kClosing --all workers exited--> kDrained
//
// The results stream closes once every worker has exited, never earlier.
// Results appear in completion order, one Result<Out> per job. A job whose
// function throws or returns an error yields an error result and its worker
// moves on to the next job. Each job submitted before close() is processed
// exactly once unless the pool is cancelled.
//
// Usage:
//   pflow::WorkPool<int, int> pool(token, {.numWorkers = 4}, square);
//   pool.start();
//   std::thread producer([&] { for (...) pool.submit(job); pool.close(); });
//   while (auto r = pool.results().receive(token)) { if (*r) use(**r); }
// =============================================================================

#ifndef PFLOW_PIPELINE_WORK_POOL_H
#define PFLOW_PIPELINE_WORK_POOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "pflow/common/error.h"
#include "pflow/common/logger.h"
#include "pflow/common/types.h"
#include "pflow/core/context.h"
#include "pflow/core/stream.h"

namespace pflow {

// =============================================================================
// Pool State
// =============================================================================

/// @brief Lifecycle state of a WorkPool.
enum class PoolState : std::uint8_t {
    kCreated = 0,
    kStarted,
    kAccepting,
    kClosing,
    kDrained
};

/// @brief Convert PoolState to string.
[[nodiscard]] std::string_view poolStateToString(PoolState state) noexcept;

// =============================================================================
// Configuration
// =============================================================================

/// @brief Configuration for a WorkPool.
struct WorkPoolConfig {
    /// @brief Number of workers (0 = recommendedWorkerCount())
    std::size_t numWorkers = 0;

    /// @brief Capacity of the jobs stream (0 = submit waits for a worker)
    std::size_t queueCapacity = kDefaultWorkQueueCapacity;

    /// @brief Capacity of the results stream
    std::size_t resultCapacity = kUnbuffered;

    /// @brief Name used in log messages
    std::string name = "work-pool";

    /// @brief Validate configuration.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Get effective worker count (auto-detect if 0).
    [[nodiscard]] std::size_t effectiveWorkers() const noexcept;
};

// =============================================================================
// WorkPool
// =============================================================================

/// @brief Pool of workers applying fn to submitted jobs.
/// @tparam In Job type
/// @tparam Out Value type of a successful job
///
/// fn may return Out or Result<Out>. An exception escaping fn becomes an
/// error result (kStageFailed, or the code of a PFlowException).
///
/// submit() and close() may be called from one producer thread while another
/// thread drains results(). close() waits for a blocked submit() to finish.
/// Workers block when nobody drains results, so shutdown() needs a concurrent
/// reader unless resultCapacity is large enough. Destroying the pool cancels it.
template <Streamable In, Streamable Out>
class WorkPool {
public:
    using Processor = std::function<Result<Out>(In)>;

    /// @brief Construct a pool; no worker runs before start().
    /// @throws InvalidArgumentError if the configuration is invalid.
    WorkPool(const CancellationToken& token, WorkPoolConfig config, Processor fn)
        : config_(std::move(config)), fn_(std::move(fn)), ctx_(token, config_.name) {
        unwrapOrThrow(config_.validate());
        auto [jobsTx, jobsRx] = makeStream<In>(config_.queueCapacity);
        auto [resultsTx, resultsRx] = makeStream<Result<Out>>(config_.resultCapacity);
        jobsTx_ = std::move(jobsTx);
        jobsRx_ = jobsRx;
        resultsTx_ = std::move(resultsTx);
        resultsRx_ = resultsRx;
    }

    WorkPool(const WorkPool&) = delete;
    WorkPool& operator=(const WorkPool&) = delete;

    /// @brief Launch the workers.
    /// @return kInvalidState unless the pool is in kCreated.
    VoidResult start() {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_ != PoolState::kCreated) {
                return makeError(ErrorCode::kInvalidState, "pool '{}' cannot start from state {}",
                                 config_.name, poolStateToString(state_));
            }
            state_ = PoolState::kStarted;
            remaining_ = config_.effectiveWorkers();
        }

        const std::size_t workers = config_.effectiveWorkers();
        for (std::size_t i = 0; i < workers; ++i) {
            ctx_.spawn(fmt::format("{}[{}]", config_.name, i),
                       [this, worker = static_cast<WorkerId>(i)] { runWorker(worker); });
        }
        PFLOW_LOG_DEBUG("Pool '{}' started {} workers", config_.name, workers);
        return makeVoidSuccess();
    }

    /// @brief Submit a job, blocking while the jobs stream has no room.
    /// @return kInvalidState if not started or already closed,
    ///         kCancelled / kDeadlineExceeded if the pool was cancelled while waiting,
    ///         kStreamClosed if every worker has stopped on an internal failure.
    VoidResult submit(In job) {
        std::lock_guard<std::mutex> submitLock(submitMutex_);
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_ == PoolState::kCreated || jobsClosed_) {
                return makeError(ErrorCode::kInvalidState, "pool '{}' is not accepting jobs ({})",
                                 config_.name, poolStateToString(state_));
            }
        }

        const CancellationToken token = ctx_.token();
        const SendStatus status = jobsTx_.send(std::move(job), token);
        if (status != SendStatus::kSent) {
            // Workers exiting on cancellation abandon the jobs stream as well
            if (token.isCancelled()) {
                if (token.reason() == CancellationReason::kDeadlineExceeded) {
                    return makeError(ErrorCode::kDeadlineExceeded, "pool '{}' deadline exceeded",
                                     config_.name);
                }
                return makeError(ErrorCode::kCancelled, "pool '{}' cancelled", config_.name);
            }
            return makeError(ErrorCode::kStreamClosed, "pool '{}' has no running workers",
                             config_.name);
        }

        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == PoolState::kStarted) {
            state_ = PoolState::kAccepting;
        }
        return makeVoidSuccess();
    }

    /// @brief Stop accepting jobs; workers finish the queued ones and exit.
    /// @return kInvalidState if not started or already closed.
    VoidResult close() {
        std::lock_guard<std::mutex> submitLock(submitMutex_);
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ == PoolState::kCreated || jobsClosed_) {
            return makeError(ErrorCode::kInvalidState, "pool '{}' cannot close from state {}",
                             config_.name, poolStateToString(state_));
        }
        jobsClosed_ = true;
        jobsTx_.close(CloseReason::kCompleted);
        if (state_ != PoolState::kDrained) {
            state_ = PoolState::kClosing;
        }
        return makeVoidSuccess();
    }

    /// @brief close() and wait until every worker exited.
    VoidResult shutdown() {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (state_ == PoolState::kCreated) {
                return makeError(ErrorCode::kInvalidState, "pool '{}' was never started",
                                 config_.name);
            }
        }
        if (auto closed = close(); !closed && closed.error().code() != ErrorCode::kInvalidState) {
            return closed;
        }
        std::unique_lock<std::mutex> lock(stateMutex_);
        drained_.wait(lock, [this] { return state_ == PoolState::kDrained; });
        return makeVoidSuccess();
    }

    /// @brief Cancel the pool; in-flight jobs may be dropped.
    void stop() noexcept { ctx_.cancel(); }

    /// @brief Stream of per-job results, closed after the last worker exits.
    [[nodiscard]] Receiver<Result<Out>> results() const { return resultsRx_; }

    [[nodiscard]] std::size_t size() const noexcept { return config_.effectiveWorkers(); }

    [[nodiscard]] PoolState state() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return state_;
    }

    /// @brief Number of results delivered so far, error results included.
    [[nodiscard]] std::uint64_t processedCount() const noexcept {
        return processed_.load(std::memory_order_relaxed);
    }

    /// @brief Number of error results delivered so far.
    [[nodiscard]] std::uint64_t failedCount() const noexcept {
        return failed_.load(std::memory_order_relaxed);
    }

private:
    void runWorker(WorkerId worker) {
        const CancellationToken token = ctx_.token();
        CloseReason reason = CloseReason::kCompleted;
        std::exception_ptr failure;

        try {
            while (auto job = jobsRx_.receive(token)) {
                Result<Out> result = runJob(worker, std::move(*job));
                const bool ok = result.has_value();
                const SendStatus status = resultsTx_.send(std::move(result), token);
                if (status != SendStatus::kSent) {
                    reason = status == SendStatus::kCancelled ? CloseReason::kCancelled
                                                              : CloseReason::kCompleted;
                    break;
                }
                processed_.fetch_add(1, std::memory_order_relaxed);
                if (!ok) {
                    failed_.fetch_add(1, std::memory_order_relaxed);
                }
            }
            if (token.isCancelled()) {
                reason = CloseReason::kCancelled;
            }
        } catch (...) {
            failure = std::current_exception();
            reason = CloseReason::kFailed;
            PFLOW_LOG_ERROR("Pool '{}' worker {} failed: {}", config_.name, worker,
                            errorFromException(failure).toString());
        }
        finishWorker(reason, std::move(failure));
    }

    Result<Out> runJob(WorkerId worker, In job) {
        Result<Out> result = [&]() -> Result<Out> {
            try {
                return fn_(std::move(job));
            } catch (...) {
                return std::unexpected(errorFromException(std::current_exception()));
            }
        }();
        if (!result) {
            PFLOW_LOG_WARNING("Pool '{}' worker {} job failed: {}", config_.name, worker,
                              result.error().toString());
        }
        return result;
    }

    void finishWorker(CloseReason reason, std::exception_ptr failure) {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (reason == CloseReason::kFailed && !failure_) {
            failure_ = std::move(failure);
        }
        reason_ = mergeCloseReasons(reason_, reason);
        if (--remaining_ > 0) {
            return;
        }
        // Last worker: release blocked submitters and end the results stream
        jobsRx_.abandon();
        resultsTx_.tryClose(reason_, failure_);
        state_ = PoolState::kDrained;
        drained_.notify_all();
        PFLOW_LOG_DEBUG("Pool '{}' drained after {} results ({})", config_.name,
                        processed_.load(std::memory_order_relaxed), closeReasonToString(reason_));
    }

    WorkPoolConfig config_;
    Processor fn_;

    Sender<In> jobsTx_;
    Receiver<In> jobsRx_;
    Sender<Result<Out>> resultsTx_;
    Receiver<Result<Out>> resultsRx_;

    mutable std::mutex stateMutex_;
    std::mutex submitMutex_;
    std::condition_variable drained_;
    PoolState state_ = PoolState::kCreated;
    bool jobsClosed_ = false;
    std::size_t remaining_ = 0;
    CloseReason reason_ = CloseReason::kCompleted;
    std::exception_ptr failure_;
    std::atomic<std::uint64_t> processed_{0};
    std::atomic<std::uint64_t> failed_{0};

    // Declared last: destroyed first, joining workers before the members they use
    Context ctx_;
};

}  // namespace pflow

#endif  // PFLOW_PIPELINE_WORK_POOL_H
