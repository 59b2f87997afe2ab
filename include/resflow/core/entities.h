#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "resflow/core/ids.h"

namespace resflow {

// --- content definitions ---

struct ResourceAmount {
  std::string type;
  double amount{0.0};
};

// Declarative input -> output transformation.
//
// Immutable once registered. Registering a recipe with an existing id replaces
// the old definition; processes that are already running keep the efficiency
// they captured at start time.
struct ConversionRecipe {
  std::string id;
  std::string name;

  std::vector<ResourceAmount> inputs;
  std::vector<ResourceAmount> outputs;

  // Wall time (milliseconds) from process start until completion.
  double processing_time_ms{0.0};

  // Multiplier before converter/load factors are applied (1.0 = nominal).
  double base_efficiency{1.0};

  // Informational; consumed by the automation layer, not by the engine.
  int required_level{0};
  double energy_cost{0.0};
};

// An ordered list of recipe ids executed step-by-step.
struct ConversionChain {
  std::string id;
  std::string name;
  std::vector<std::string> steps;
};

// --- runtime state ---

enum class ProcessStatus : std::uint8_t {
  Pending = 0,
  InProgress = 1,
  Paused = 2,
  Completed = 3,
  Failed = 4,
};

// One in-flight execution of a single recipe on a single converter.
struct ConversionProcess {
  ProcessId process_id{kInvalidId};
  std::string recipe_id;
  std::string source_id;  // converter node id

  bool active{true};
  bool paused{false};
  bool failed{false};
  std::string error;

  std::int64_t start_time_ms{0};
  std::optional<std::int64_t> end_time_ms;

  // Set while paused; start_time_ms is shifted forward by the paused span on resume.
  std::int64_t paused_at_ms{0};

  // [0, 1]. Only the scheduler tick writes this.
  double progress{0.0};

  // Clamped efficiency captured when the process started.
  std::optional<double> applied_efficiency;

  // Owning chain execution, if the process was started by a chain step.
  ChainExecutionId chain_execution_id{kInvalidId};
  int chain_step_index{-1};
};

struct ChainStepStatus {
  std::string recipe_id;
  ProcessStatus status{ProcessStatus::Pending};
  std::int64_t start_time_ms{0};
  std::int64_t end_time_ms{0};
  ProcessId process_id{kInvalidId};

  // Converter running this step. While the step is Pending a non-empty value
  // names the node that received the previous step's outputs; it is preferred
  // when the step starts.
  std::string converter_id;
};

struct ChainExecutionStatus {
  ChainExecutionId execution_id{kInvalidId};
  std::string chain_id;

  bool active{true};
  bool paused{false};
  bool completed{false};
  bool failed{false};
  std::string error_message;

  std::int64_t start_time_ms{0};
  std::int64_t end_time_ms{0};

  int current_step_index{0};
  std::vector<std::string> recipe_ids;
  std::vector<ChainStepStatus> step_status;

  // Completed steps / total steps.
  double progress{0.0};

  // Efficiency-adjusted outputs of the last step (set on completion).
  std::vector<ResourceAmount> final_outputs;

  bool running() const { return active && !completed && !failed; }
};

// --- converter nodes (owned by the flow topology service) ---

enum class NodeType : std::uint8_t {
  Producer = 0,
  Consumer = 1,
  Storage = 2,
  Converter = 3,
};

enum class ConverterStatus : std::uint8_t {
  Idle = 0,
  Active = 1,
};

struct ConverterConfiguration {
  int max_concurrent_processes{1};

  // Per-recipe multiplier keyed by recipe id. Missing => 1.0.
  std::unordered_map<std::string, double> efficiency_modifiers;
};

struct ConverterNode {
  std::string id;
  std::string name;
  NodeType type{NodeType::Converter};

  std::vector<std::string> supported_recipe_ids;
  ConverterConfiguration configuration;
  std::vector<ProcessId> active_process_ids;

  // Node-level multiplier (upgrades, damage, ...).
  double efficiency{1.0};
  ConverterStatus status{ConverterStatus::Idle};

  std::unordered_map<std::string, double> resources;

  // Optional per-resource ceiling for incoming transfers. Missing => unbounded.
  std::unordered_map<std::string, double> storage_capacity;

  bool supports_recipe(const std::string& recipe_id) const;
  bool has_spare_capacity() const;
};

// Partial update accepted by ConverterNodeDirectory::update_node_data.
struct ConverterNodePatch {
  std::optional<std::vector<ProcessId>> active_process_ids;
  std::optional<double> efficiency;
  std::optional<ConverterStatus> status;
};

} // namespace resflow
