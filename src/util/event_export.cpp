#include "resflow/util/event_export.h"

#include <type_traits>
#include <utility>

#include "resflow/core/conversion_content.h"

namespace resflow {
namespace {

json::Value id_value(std::uint64_t id) { return static_cast<double>(id); }

json::Value amounts_to_json(const std::vector<ResourceAmount>& amounts) {
  json::Array out;
  out.reserve(amounts.size());
  for (const auto& a : amounts) {
    json::Object o;
    o["type"] = a.type;
    o["amount"] = a.amount;
    out.emplace_back(std::move(o));
  }
  return json::array(std::move(out));
}

json::Value process_to_json(const ConversionProcess& p) {
  json::Object o;
  o["process_id"] = id_value(p.process_id);
  o["recipe_id"] = p.recipe_id;
  o["source_id"] = p.source_id;
  o["active"] = p.active;
  o["paused"] = p.paused;
  o["failed"] = p.failed;
  if (!p.error.empty()) o["error"] = p.error;
  o["start_time_ms"] = static_cast<double>(p.start_time_ms);
  o["end_time_ms"] = p.end_time_ms ? json::Value(static_cast<double>(*p.end_time_ms)) : json::Value(nullptr);
  o["progress"] = p.progress;
  o["applied_efficiency"] = p.applied_efficiency ? json::Value(*p.applied_efficiency) : json::Value(nullptr);
  if (p.chain_execution_id != kInvalidId) {
    o["chain_execution_id"] = id_value(p.chain_execution_id);
    o["chain_step_index"] = static_cast<double>(p.chain_step_index);
  }
  return json::object(std::move(o));
}

json::Value chain_status_to_json(const ChainExecutionStatus& c) {
  json::Object o;
  o["execution_id"] = id_value(c.execution_id);
  o["chain_id"] = c.chain_id;
  o["active"] = c.active;
  o["paused"] = c.paused;
  o["completed"] = c.completed;
  o["failed"] = c.failed;
  if (!c.error_message.empty()) o["error_message"] = c.error_message;
  o["start_time_ms"] = static_cast<double>(c.start_time_ms);
  o["current_step_index"] = static_cast<double>(c.current_step_index);
  o["progress"] = c.progress;

  json::Array steps;
  for (const auto& s : c.step_status) {
    json::Object so;
    so["recipe_id"] = s.recipe_id;
    so["status"] = std::string(process_status_to_string(s.status));
    so["process_id"] = id_value(s.process_id);
    so["converter_id"] = s.converter_id.empty() ? json::Value(nullptr) : json::Value(s.converter_id);
    so["start_time_ms"] = static_cast<double>(s.start_time_ms);
    so["end_time_ms"] = static_cast<double>(s.end_time_ms);
    steps.emplace_back(std::move(so));
  }
  o["step_status"] = json::array(std::move(steps));
  if (c.completed) o["final_outputs"] = amounts_to_json(c.final_outputs);
  return json::object(std::move(o));
}

} // namespace

json::Value flow_event_to_json(const FlowEvent& ev) {
  json::Object obj;
  obj["event"] = std::string(flow_event_name(ev));

  std::visit(
      [&obj](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ChainStepStarted>) {
          obj["execution_id"] = id_value(e.execution_id);
          obj["chain_id"] = e.chain_id;
          obj["step_index"] = static_cast<double>(e.step_index);
          obj["recipe_id"] = e.recipe_id;
          obj["process_id"] = id_value(e.process_id);
          obj["converter_id"] = e.converter_id;
        } else if constexpr (std::is_same_v<T, ChainStepCompleted>) {
          obj["execution_id"] = id_value(e.execution_id);
          obj["chain_id"] = e.chain_id;
          obj["step_index"] = static_cast<double>(e.step_index);
          obj["process_id"] = id_value(e.process_id);
          obj["recipe_id"] = e.recipe_id;
          obj["converter_id"] = e.converter_id;
          obj["outputs"] = amounts_to_json(e.outputs);
          obj["efficiency"] = e.efficiency;
        } else if constexpr (std::is_same_v<T, ChainCompleted>) {
          obj["execution_id"] = id_value(e.execution_id);
          obj["chain_id"] = e.chain_id;
          obj["final_outputs"] = amounts_to_json(e.final_outputs);
        } else if constexpr (std::is_same_v<T, ResourceUpdated>) {
          obj["type"] = std::string(resource_update_kind_name(e.kind));
          obj["process"] = process_to_json(e.process);
          obj["process_id"] = id_value(e.process.process_id);
          obj["recipe_id"] = e.recipe_id;
          obj["converter_id"] = e.converter_id;
          obj["inputs"] = amounts_to_json(e.inputs);
          obj["efficiency"] = e.efficiency;
          if (e.kind == ResourceUpdateKind::ConversionCompleted) {
            obj["outputs"] = amounts_to_json(e.outputs);
            obj["transferred_directly"] = e.transferred_directly;
            obj["delivered_to"] = e.delivered_to.empty() ? json::Value(nullptr) : json::Value(e.delivered_to);
          }
        } else if constexpr (std::is_same_v<T, ChainStatusUpdated>) {
          obj["chain_status"] = chain_status_to_json(e.chain_status);
        }
      },
      ev);

  return json::object(std::move(obj));
}

std::string flow_events_to_json(const std::vector<FlowEvent>& events) {
  json::Array out;
  out.reserve(events.size());
  for (const auto& ev : events) out.push_back(flow_event_to_json(ev));

  std::string json_text = json::stringify(json::array(std::move(out)), 2);
  json_text += "\n";
  return json_text;
}

std::string flow_events_to_jsonl(const std::vector<FlowEvent>& events) {
  std::string out;
  out.reserve(events.size() * 200);

  for (const auto& ev : events) {
    out += json::stringify(flow_event_to_json(ev), 0);
    out.push_back('\n');
  }

  if (out.empty()) out.push_back('\n');
  return out;
}

std::string flow_events_summary_to_json(const std::vector<FlowEvent>& events) {
  json::Object counts;
  for (const char* name :
       {"CHAIN_STEP_STARTED", "CHAIN_STEP_COMPLETED", "CHAIN_COMPLETED", "RESOURCE_UPDATED", "CHAIN_STATUS_UPDATED"}) {
    counts[name] = 0.0;
  }
  for (const auto& ev : events) {
    auto& slot = counts[flow_event_name(ev)];
    slot = slot.number_value() + 1.0;
  }

  json::Object out;
  out["count"] = static_cast<double>(events.size());
  out["events"] = json::object(std::move(counts));

  std::string json_text = json::stringify(json::object(std::move(out)), 2);
  json_text += "\n";
  return json_text;
}

} // namespace resflow
