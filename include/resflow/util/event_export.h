#pragma once

#include <string>
#include <vector>

#include "resflow/core/flow_events.h"
#include "resflow/util/json.h"

namespace resflow {

// One event as a JSON object.
//
// Every object has "event" (flow_event_name()) plus the payload fields in
// snake_case, e.g.
//   {"event": "CHAIN_STEP_STARTED", "execution_id": 1, "chain_id": "smelt",
//    "step_index": 0, "recipe_id": "ore_to_metal", "process_id": 1,
//    "converter_id": "smelter_1"}
// RESOURCE_UPDATED objects carry "type" (resource_update_kind_name()).
json::Value flow_event_to_json(const FlowEvent& ev);

// JSON array of events in the order provided. Ends with a trailing newline.
std::string flow_events_to_json(const std::vector<FlowEvent>& events);

// JSON Lines: one compact object per line, trailing newline.
std::string flow_events_to_jsonl(const std::vector<FlowEvent>& events);

// {"count": N, "events": {"CHAIN_COMPLETED": n, ...}} with every event name present.
std::string flow_events_summary_to_json(const std::vector<FlowEvent>& events);

} // namespace resflow
