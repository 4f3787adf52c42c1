// =============================================================================
// pipeflow - Umbrella Header
// =============================================================================
// Includes the whole public API.
// =============================================================================

#ifndef PFLOW_PFLOW_H
#define PFLOW_PFLOW_H

#include "pflow/common/error.h"
#include "pflow/common/logger.h"
#include "pflow/common/types.h"
#include "pflow/core/backpressure.h"
#include "pflow/core/cancellation.h"
#include "pflow/core/context.h"
#include "pflow/core/stream.h"
#include "pflow/pipeline/parallel.h"
#include "pflow/pipeline/pipeline.h"
#include "pflow/pipeline/work_pool.h"
#include "pflow/stages/ordered.h"
#include "pflow/stages/source.h"
#include "pflow/stages/topology.h"
#include "pflow/stages/transform.h"

#endif  // PFLOW_PFLOW_H
