#include "resflow/core/conversion_engine.h"

#include <utility>

#include "engine_internal.h"
#include "resflow/util/log.h"
#include "resflow/util/strings.h"

namespace resflow {

using engine_internal::amounts_to_string;
using engine_internal::join;

std::string ConversionEngine::plan_next_step_converter(ChainExecutionStatus& chain, const std::string& source_id) {
  const auto next = static_cast<std::size_t>(chain.current_step_index) + 1;
  if (next >= chain.step_status.size()) return {};

  auto& step = chain.step_status[next];
  if (step.status != ProcessStatus::Pending) return {};

  // Runs after the source released its slot, so the source competes in normal order.
  const auto chosen = select_converter(step.recipe_id, std::string(), nullptr);
  if (!chosen) {
    log::debug(join("No converter with spare capacity for step ", next, " of chain ", chain.chain_id,
                    "; outputs stay on ", source_id));
    return {};
  }
  step.converter_id = chosen->id;
  return chosen->id;
}

void ConversionEngine::complete_process(ProcessId process_id) {
  auto retired = scheduler_.retire(process_id);
  if (!retired) return;

  ConversionProcess p = std::move(*retired);
  const auto now = now_ms();
  p.active = false;
  p.progress = 1.0;
  p.end_time_ms = now;

  // The chain step this process runs, if its chain is still running.
  ChainExecutionStatus* chain = nullptr;
  if (p.chain_execution_id != kInvalidId) {
    chain = find_running_chain(p.chain_execution_id);
    if (chain) {
      const auto idx = static_cast<std::size_t>(p.chain_step_index);
      const bool owns_step = p.chain_step_index >= 0 && idx < chain->step_status.size() &&
                             chain->step_status[idx].process_id == p.process_id &&
                             chain->step_status[idx].status == ProcessStatus::InProgress;
      if (!owns_step) chain = nullptr;
    }
  }

  const ConversionRecipe* recipe = registry_.find_recipe(p.recipe_id);
  if (!recipe) {
    log::error(join("Recipe ", p.recipe_id, " not found for completed process ", p.process_id, "; outputs lost"));
    p.failed = true;
    p.error = join("Recipe ", p.recipe_id, " not found");
    release_converter_slot(p.source_id, p.process_id);
    scheduler_.record_completed(p);
    if (chain) {
      auto& step = chain->step_status[static_cast<std::size_t>(p.chain_step_index)];
      step.status = ProcessStatus::Failed;
      step.end_time_ms = now;
      fail_chain(*chain, p.error);
    }
    return;
  }

  const EfficiencyParams params = efficiency_params();
  double efficiency = 0.0;
  if (p.applied_efficiency) {
    efficiency = *p.applied_efficiency;
  } else if (const auto node = directory_ ? directory_->get_node(p.source_id) : std::nullopt;
             node && node->type == NodeType::Converter) {
    efficiency = calculate_converter_efficiency(*node, *recipe, params);
  } else {
    log::warn(join("Converter node ", p.source_id, " not found or invalid for efficiency calculation"));
  }
  efficiency = clamp_efficiency(efficiency, params);
  p.applied_efficiency = efficiency;

  const std::vector<ResourceAmount> outputs = scale_outputs(recipe->outputs, efficiency);

  release_converter_slot(p.source_id, p.process_id);

  std::string next_converter;
  if (chain && !chain->paused) next_converter = plan_next_step_converter(*chain, p.source_id);

  bool transferred = false;
  std::string delivered_to;
  if (!next_converter.empty() && next_converter != p.source_id && directory_) {
    const auto tr = directory_->transfer_resources(p.source_id, next_converter, outputs);
    if (!tr.ok) {
      log::error(join("Error during direct transfer from ", p.source_id, " to ", next_converter, ": ", tr.error));
    } else if (!tr.value) {
      log::warn(join("Direct transfer failed from ", p.source_id, " to ", next_converter,
                     ". Resources will be added back to source."));
    } else {
      transferred = true;
      delivered_to = next_converter;
    }
  }

  if (!transferred) {
    if (!directory_) {
      log::error(join("Converter node directory unavailable; outputs of process ", p.process_id, " lost (",
                      amounts_to_string(outputs), ")"));
    } else if (const auto st = directory_->add_resources(p.source_id, outputs); !st.ok) {
      log::error(join("Error adding outputs of process ", p.process_id, " to ", p.source_id, ": ", st.error));
    } else {
      delivered_to = p.source_id;
    }
  }

  // The next step prefers whichever node now holds these outputs.
  if (chain) {
    const auto next = static_cast<std::size_t>(p.chain_step_index) + 1;
    if (next < chain->step_status.size() && chain->step_status[next].status == ProcessStatus::Pending) {
      chain->step_status[next].converter_id = delivered_to;
    }
  }

  ResourceUpdated ev;
  ev.kind = ResourceUpdateKind::ConversionCompleted;
  ev.process = p;
  ev.recipe_id = p.recipe_id;
  ev.converter_id = p.source_id;
  ev.inputs = recipe->inputs;
  ev.outputs = outputs;
  ev.efficiency = efficiency;
  ev.transferred_directly = transferred;
  ev.delivered_to = delivered_to;
  publish(std::move(ev));

  log::debug(join("Process ", p.process_id, " completed: ", p.recipe_id, " on ", p.source_id, " -> ",
                  amounts_to_string(outputs), " (efficiency ", format_fixed(efficiency), ")"));

  const int step_index = p.chain_step_index;
  scheduler_.record_completed(std::move(p));

  if (!chain) return;

  auto& step = chain->step_status[static_cast<std::size_t>(step_index)];
  step.status = ProcessStatus::Completed;
  step.end_time_ms = now;
  chain->current_step_index = step_index + 1;
  chain->progress = static_cast<double>(chain->current_step_index) / static_cast<double>(chain->step_status.size());

  ChainStepCompleted done;
  done.execution_id = chain->execution_id;
  done.chain_id = chain->chain_id;
  done.step_index = step_index;
  done.process_id = process_id;
  done.recipe_id = step.recipe_id;
  done.converter_id = step.converter_id;
  done.outputs = outputs;
  done.efficiency = efficiency;
  publish(std::move(done));

  if (chain->current_step_index >= static_cast<int>(chain->recipe_ids.size())) {
    chain->completed = true;
    chain->active = false;
    chain->end_time_ms = now;
    chain->final_outputs = outputs;

    ChainCompleted fin;
    fin.execution_id = chain->execution_id;
    fin.chain_id = chain->chain_id;
    fin.final_outputs = outputs;
    publish(std::move(fin));

    log::info(join("Chain ", chain->chain_id, " (execution ", chain->execution_id, ") completed: ",
                   amounts_to_string(outputs)));
  } else {
    process_next_chain_step(*chain);
  }
}

} // namespace resflow
