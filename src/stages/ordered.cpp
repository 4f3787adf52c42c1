// =============================================================================
// pipeflow - Ordered Parallel Stage Implementation
// =============================================================================

#include "pflow/stages/ordered.h"

namespace pflow {

VoidResult OrderedOptions::validate(std::size_t workerCount) const {
    if (workerCount == 0) {
        return makeError(ErrorCode::kInvalidArgument,
                         "orderedFanOutFanIn requires at least one worker");
    }

    if (workerCount > kMaxWorkers) {
        return makeError(ErrorCode::kInvalidArgument, "Worker count must be <= {}", kMaxWorkers);
    }

    return {};
}

}  // namespace pflow
