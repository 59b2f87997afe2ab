#include "resflow/core/entities.h"

#include <algorithm>

#include "resflow/core/flow_errors.h"

namespace resflow {

bool ConverterNode::supports_recipe(const std::string& recipe_id) const {
  return std::find(supported_recipe_ids.begin(), supported_recipe_ids.end(), recipe_id) !=
         supported_recipe_ids.end();
}

bool ConverterNode::has_spare_capacity() const {
  return static_cast<long long>(active_process_ids.size()) <
         static_cast<long long>(configuration.max_concurrent_processes);
}

const char* flow_error_kind_to_string(FlowErrorKind k) {
  switch (k) {
    case FlowErrorKind::None: return "none";
    case FlowErrorKind::RecipeNotFound: return "recipe_not_found";
    case FlowErrorKind::ConverterNotFoundOrInvalid: return "converter_not_found_or_invalid";
    case FlowErrorKind::ConverterAtCapacity: return "converter_at_capacity";
    case FlowErrorKind::NoConvertersAvailable: return "no_converters_available";
    case FlowErrorKind::InsufficientResources: return "insufficient_resources";
    case FlowErrorKind::ConsumeFailure: return "consume_failure";
    case FlowErrorKind::TransferFailure: return "transfer_failure";
    case FlowErrorKind::NodeUpdateFailure: return "node_update_failure";
    case FlowErrorKind::DirectoryUnavailable: return "directory_unavailable";
    case FlowErrorKind::ProcessNotFound: return "process_not_found";
    case FlowErrorKind::InvalidState: return "invalid_state";
  }
  return "none";
}

} // namespace resflow
