#include "resflow/core/flow_events.h"

#include <type_traits>

namespace resflow {

const char* flow_event_name(const FlowEvent& ev) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ChainStepStarted>) {
          return "CHAIN_STEP_STARTED";
        } else if constexpr (std::is_same_v<T, ChainStepCompleted>) {
          return "CHAIN_STEP_COMPLETED";
        } else if constexpr (std::is_same_v<T, ChainCompleted>) {
          return "CHAIN_COMPLETED";
        } else if constexpr (std::is_same_v<T, ResourceUpdated>) {
          return "RESOURCE_UPDATED";
        } else {
          return "CHAIN_STATUS_UPDATED";
        }
      },
      ev);
}

const char* resource_update_kind_name(ResourceUpdateKind k) {
  switch (k) {
    case ResourceUpdateKind::ConversionCompleted: return "RESOURCE_CONVERSION_COMPLETED";
    case ResourceUpdateKind::ProcessStarted: return "PROCESS_STARTED";
    case ResourceUpdateKind::ProcessUpdated: return "PROCESS_UPDATED";
  }
  return "PROCESS_UPDATED";
}

} // namespace resflow
