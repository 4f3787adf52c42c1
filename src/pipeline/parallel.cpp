// =============================================================================
// pipeflow - Parallel Slice Helpers Implementation
// =============================================================================

#include "pflow/pipeline/parallel.h"

namespace pflow::detail {

VoidResult checkSliceArguments(std::size_t numWorkers) {
    if (numWorkers == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Worker count must be > 0");
    }

    if (numWorkers > kMaxWorkers) {
        return makeError(ErrorCode::kInvalidArgument, "Worker count must be <= {}", kMaxWorkers);
    }

    return {};
}

std::optional<Error> sliceRunError(const SliceRun& run, const CancellationToken& token,
                                   std::string_view operation) {
    if (run.failure) {
        const Error cause = errorFromException(run.failure);
        PFLOW_LOG_ERROR("{} failed at item {}: {}", operation, run.failedIndex.value_or(0),
                        cause.toString());
        return Error{ErrorCode::kStageFailed,
                     fmt::format("{} failed at item {}: {}", operation,
                                 run.failedIndex.value_or(0), cause.message())};
    }

    if (!run.stopped.load(std::memory_order_acquire)) {
        return std::nullopt;
    }

    if (token.reason() == CancellationReason::kDeadlineExceeded) {
        return Error{ErrorCode::kDeadlineExceeded, fmt::format("{} deadline exceeded", operation)};
    }
    return Error{ErrorCode::kCancelled, fmt::format("{} cancelled", operation)};
}

}  // namespace pflow::detail
