#pragma once

#include <string>
#include <vector>

#include "resflow/core/conversion_engine.h"
#include "resflow/core/node_directory.h"

namespace resflow {

// Check runtime invariants of an engine and, optionally, its node directory.
//
// - process progress in [0, 1] and applied efficiency inside the configured clamp
// - converter active_process_ids within max_concurrent_processes and pointing
//   at processes the engine is actually running
// - chain step statuses consistent with current_step_index, and
//   completed == (current_step_index == step count)
//
// Returns a sorted list of human-readable error strings. Empty => valid.
std::vector<std::string> validate_engine_state(const ConversionEngine& engine,
                                               const ConverterNodeDirectory* directory = nullptr);

} // namespace resflow
