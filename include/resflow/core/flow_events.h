#pragma once

#include <string>
#include <variant>
#include <vector>

#include "resflow/core/entities.h"
#include "resflow/core/ids.h"

namespace resflow {

// --- notifications published to UI / automation collaborators ---
//
// One struct per notification kind; FlowEvent is the closed set. Sinks switch
// on the alternative with std::visit (see flow_event_name()).

struct ChainStepStarted {
  ChainExecutionId execution_id{kInvalidId};
  std::string chain_id;
  int step_index{0};
  std::string recipe_id;
  ProcessId process_id{kInvalidId};
  std::string converter_id;
};

struct ChainStepCompleted {
  ChainExecutionId execution_id{kInvalidId};
  std::string chain_id;
  int step_index{0};
  ProcessId process_id{kInvalidId};
  std::string recipe_id;
  std::string converter_id;
  std::vector<ResourceAmount> outputs;
  double efficiency{0.0};
};

struct ChainCompleted {
  ChainExecutionId execution_id{kInvalidId};
  std::string chain_id;
  std::vector<ResourceAmount> final_outputs;
};

enum class ResourceUpdateKind : std::uint8_t {
  ConversionCompleted = 0,
  ProcessStarted = 1,
  ProcessUpdated = 2,
};

// Process-level resource notification.
//
// For ConversionCompleted, `outputs` are the efficiency-adjusted amounts and
// `delivered_to` names the node that received them (the next chain step's
// converter after a direct transfer, otherwise the source converter). It is
// empty when the outputs could not be delivered at all.
struct ResourceUpdated {
  ResourceUpdateKind kind{ResourceUpdateKind::ProcessStarted};
  ConversionProcess process;
  std::string recipe_id;
  std::string converter_id;
  std::vector<ResourceAmount> inputs;
  std::vector<ResourceAmount> outputs;
  double efficiency{0.0};
  bool transferred_directly{false};
  std::string delivered_to;
};

struct ChainStatusUpdated {
  ChainExecutionStatus chain_status;
};

using FlowEvent = std::variant<ChainStepStarted, ChainStepCompleted, ChainCompleted, ResourceUpdated, ChainStatusUpdated>;

// "CHAIN_STEP_STARTED", "CHAIN_STEP_COMPLETED", "CHAIN_COMPLETED",
// "RESOURCE_UPDATED", "CHAIN_STATUS_UPDATED".
const char* flow_event_name(const FlowEvent& ev);

// "RESOURCE_CONVERSION_COMPLETED", "PROCESS_STARTED", "PROCESS_UPDATED".
const char* resource_update_kind_name(ResourceUpdateKind k);

// Fire-and-forget receiver of engine notifications.
//
// publish() is called synchronously from inside engine operations and tick
// callbacks; implementations must not call back into the engine.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const FlowEvent& ev) = 0;
};

// Keeps every published event in order. Used by tests and the CLI.
class RecordingEventSink : public EventSink {
 public:
  void publish(const FlowEvent& ev) override { events_.push_back(ev); }

  const std::vector<FlowEvent>& events() const { return events_; }
  void clear() { events_.clear(); }

  template <typename T>
  std::vector<T> of_type() const {
    std::vector<T> out;
    for (const auto& ev : events_) {
      if (const auto* p = std::get_if<T>(&ev)) out.push_back(*p);
    }
    return out;
  }

  template <typename T>
  int count() const {
    int n = 0;
    for (const auto& ev : events_) {
      if (std::holds_alternative<T>(ev)) ++n;
    }
    return n;
  }

 private:
  std::vector<FlowEvent> events_;
};

} // namespace resflow
