#pragma once

#include <cstdint>

namespace resflow {

// Runtime entities created by the engine are keyed by generated ids.
// Content definitions (recipes, chains, converter nodes, resource types)
// use string ids instead.
using ProcessId = std::uint64_t;
using ChainExecutionId = std::uint64_t;

constexpr std::uint64_t kInvalidId = 0;

} // namespace resflow
