#pragma once

#include <cstdint>
#include <string>

#include "resflow/core/ids.h"

namespace resflow {

enum class FlowErrorKind : std::uint8_t {
  None = 0,
  RecipeNotFound,
  ConverterNotFoundOrInvalid,
  ConverterAtCapacity,
  NoConvertersAvailable,
  InsufficientResources,
  ConsumeFailure,
  TransferFailure,
  NodeUpdateFailure,
  DirectoryUnavailable,
  ProcessNotFound,
  InvalidState,
};

// Stable snake_case label ("recipe_not_found", ...).
const char* flow_error_kind_to_string(FlowErrorKind k);

// Outcome of starting a conversion process. Failures are reported here rather
// than thrown.
struct ConversionResult {
  bool success{false};
  ProcessId process_id{kInvalidId};
  std::string recipe_id;

  FlowErrorKind error_kind{FlowErrorKind::None};
  std::string error;
};

} // namespace resflow
