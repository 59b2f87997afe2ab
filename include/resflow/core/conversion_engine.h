#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "resflow/core/conversion_registry.h"
#include "resflow/core/efficiency.h"
#include "resflow/core/entities.h"
#include "resflow/core/flow_errors.h"
#include "resflow/core/flow_events.h"
#include "resflow/core/node_directory.h"
#include "resflow/core/process_scheduler.h"
#include "resflow/core/time_source.h"

namespace resflow {

struct EngineConfig {
  // Scheduler tick interval in milliseconds. poll() runs at most one tick per
  // interval; tick() ignores it.
  std::int64_t processing_interval_ms{1000};

  // Maximum number of completed/failed processes kept for inspection.
  // 0 means "unlimited" (not recommended for long sessions).
  int max_process_history{1000};

  // Maximum number of finished (completed or failed) chain executions kept.
  // Running executions are never evicted. 0 means "unlimited".
  int max_chain_history{1000};

  // Clamp for the applied efficiency. Outputs are scaled by the clamped value.
  double min_efficiency{0.0};
  double max_efficiency{2.0};

  // Network stress curve.
  //
  // A converter running at full capacity loses full_load_stress_penalty of its
  // efficiency (0.2 = 20%). The stress term never drops below
  // min_stress_factor, whatever the load.
  double full_load_stress_penalty{0.2};
  double min_stress_factor{0.5};

  // After each process completion, retry every chain whose current step is
  // waiting for a converter with spare capacity.
  //
  // When disabled, a waiting chain only advances on its own completions or an
  // explicit poke_chain()/poke_waiting_chains().
  bool repoke_waiting_chains_on_completion{true};
};

// External status change for a running process.
//
// Only Paused, InProgress (resume) and Failed are accepted; completion is
// driven by the scheduler tick.
struct ProcessUpdate {
  ProcessId process_id{kInvalidId};
  ProcessStatus status{ProcessStatus::InProgress};

  // Used when status == Failed.
  std::string error;
};

// Resource Conversion & Flow Engine.
//
// Runs multi-step production chains across converter nodes owned by a
// ConverterNodeDirectory. Single-threaded: every mutation happens inside a
// public call or a tick, and each runs to completion.
//
// The directory, event sink and clock are borrowed and must outlive the
// engine (or be replaced/cleared before they are destroyed). A null clock
// selects an internal steady clock; a null sink drops events.
class ConversionEngine {
 public:
  explicit ConversionEngine(EngineConfig cfg = {}, ConverterNodeDirectory* directory = nullptr,
                            EventSink* events = nullptr, const TimeSource* clock = nullptr);

  ConversionEngine(const ConversionEngine&) = delete;
  ConversionEngine& operator=(const ConversionEngine&) = delete;

  const EngineConfig& cfg() const { return cfg_; }
  EfficiencyParams efficiency_params() const;

  void set_node_directory(ConverterNodeDirectory* directory) { directory_ = directory; }
  ConverterNodeDirectory* node_directory() const { return directory_; }

  void set_event_sink(EventSink* events) { events_ = events; }

  // --- lifecycle ---
  // Arms the scheduler (first tick due one interval from now).
  void initialize();

  // Hard stop: disarms the scheduler and drops every definition, process and
  // chain execution. Converter nodes keep whatever state they had.
  void dispose();

  bool is_initialized() const { return initialized_; }

  // Runs one tick if the engine is initialized and the interval has elapsed.
  // Returns true if a tick ran.
  bool poll();

  // Advances every active, unpaused process and completes those that reached
  // 100%. Processes started during the tick are first advanced on the next one.
  void tick();

  // --- registry ---
  // Return false when the id is empty. Re-registering an id overwrites it.
  bool register_conversion_recipe(const ConversionRecipe& recipe);
  bool register_conversion_chain(const ConversionChain& chain);

  const ConversionRecipe* find_recipe(const std::string& recipe_id) const;
  const ConversionChain* find_chain(const std::string& chain_id) const;
  const ConversionRegistry& registry() const { return registry_; }

  // --- chains ---
  // Creates a new execution and tries to start its first step.
  //
  // Returns false only when the chain id is unknown. The first step may still
  // fail (see chain_execution()) or wait for converter capacity.
  bool start_conversion_chain(const std::string& chain_id, ChainExecutionId* out_execution_id = nullptr);

  // A paused chain does not start new steps. A running step keeps running.
  bool pause_chain(ChainExecutionId execution_id);
  bool resume_chain(ChainExecutionId execution_id);

  // Fails the execution with "Chain execution cancelled". An in-flight
  // process still completes and its outputs go back to its converter.
  bool cancel_chain(ChainExecutionId execution_id);

  // Retry starting the current step of one chain / of every waiting chain.
  bool poke_chain(ChainExecutionId execution_id);
  int poke_waiting_chains();

  // --- processes ---
  // Ad-hoc process start on a specific converter (no chain).
  ConversionResult start_conversion_process(const std::string& converter_id, const std::string& recipe_id);

  bool update_process(const ProcessUpdate& update, std::string* error = nullptr);
  bool pause_process(ProcessId process_id, std::string* error = nullptr);
  bool resume_process(ProcessId process_id, std::string* error = nullptr);

  // --- queries (copies) ---
  // Looks in the processing queue first, then the completed history.
  std::optional<ConversionProcess> process(ProcessId process_id) const;
  std::vector<ProcessId> active_process_ids() const;
  std::vector<ConversionProcess> completed_processes() const;

  // Looks at running executions first, then the finished history.
  std::optional<ChainExecutionStatus> chain_execution(ChainExecutionId execution_id) const;
  // Running (not yet archived) executions, ascending.
  std::vector<ChainExecutionId> chain_execution_ids() const;
  std::optional<ChainExecutionId> latest_execution_for_chain(const std::string& chain_id) const;
  std::vector<ChainExecutionStatus> finished_chain_executions() const;

 private:
  std::int64_t now_ms() const;
  void publish(FlowEvent ev);

  // engine_chains.cpp
  ChainExecutionStatus* find_running_chain(ChainExecutionId execution_id);
  void process_next_chain_step(ChainExecutionStatus& chain);
  void fail_chain(ChainExecutionStatus& chain, const std::string& message);
  void publish_chain_status(const ChainExecutionStatus& chain);
  bool chain_is_waiting(const ChainExecutionStatus& chain) const;
  void archive_finished_chains();

  // engine_process_start.cpp
  ConversionResult start_process_for(const std::string& converter_id, const std::string& recipe_id,
                                     ChainExecutionId execution_id, int step_index);
  // First eligible converter with spare capacity. Sets *any_eligible when at
  // least one converter supports the recipe at all.
  std::optional<ConverterNode> select_converter(const std::string& recipe_id, const std::string& exclude_id,
                                                bool* any_eligible) const;
  void release_converter_slot(const std::string& converter_id, ProcessId process_id);

  // engine_completion.cpp
  void complete_process(ProcessId process_id);
  std::string plan_next_step_converter(ChainExecutionStatus& chain, const std::string& source_id);

  EngineConfig cfg_;
  ConverterNodeDirectory* directory_{nullptr};
  EventSink* events_{nullptr};
  const TimeSource* clock_{nullptr};
  SteadyTimeSource steady_clock_;

  bool initialized_{false};

  ConversionRegistry registry_;
  ProcessScheduler scheduler_;

  std::map<ChainExecutionId, ChainExecutionStatus> chains_;
  std::deque<ChainExecutionStatus> finished_chains_;

  ProcessId next_process_id_{1};
  ChainExecutionId next_execution_id_{1};
};

} // namespace resflow
