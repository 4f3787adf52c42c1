// =============================================================================
// pipeflow - Work Pool Implementation
// =============================================================================

#include "pflow/pipeline/work_pool.h"

namespace pflow {

std::string_view poolStateToString(PoolState state) noexcept {
    switch (state) {
        case PoolState::kCreated:
            return "created";
        case PoolState::kStarted:
            return "started";
        case PoolState::kAccepting:
            return "accepting";
        case PoolState::kClosing:
            return "closing";
        case PoolState::kDrained:
            return "drained";
    }
    return "unknown";
}

// =============================================================================
// WorkPoolConfig Implementation
// =============================================================================

VoidResult WorkPoolConfig::validate() const {
    if (numWorkers > kMaxWorkers) {
        return makeError(ErrorCode::kInvalidArgument, "Worker count must be <= {}, got {}",
                         kMaxWorkers, numWorkers);
    }

    if (name.empty()) {
        return makeError(ErrorCode::kInvalidArgument, "Pool name must not be empty");
    }

    return {};
}

std::size_t WorkPoolConfig::effectiveWorkers() const noexcept {
    return numWorkers > 0 ? numWorkers : recommendedWorkerCount();
}

}  // namespace pflow
