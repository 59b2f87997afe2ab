#include "resflow/core/conversion_engine.h"

#include <utility>

#include "engine_internal.h"
#include "resflow/util/log.h"
#include "resflow/util/strings.h"

namespace resflow {

using engine_internal::join;

namespace {

ConversionResult start_failure(const std::string& recipe_id, FlowErrorKind kind, std::string error) {
  ConversionResult r;
  r.success = false;
  r.recipe_id = recipe_id;
  r.error_kind = kind;
  r.error = std::move(error);
  return r;
}

} // namespace

ConversionResult ConversionEngine::start_conversion_process(const std::string& converter_id,
                                                            const std::string& recipe_id) {
  return start_process_for(converter_id, recipe_id, kInvalidId, -1);
}

std::optional<ConverterNode> ConversionEngine::select_converter(const std::string& recipe_id,
                                                                const std::string& exclude_id,
                                                                bool* any_eligible) const {
  if (any_eligible) *any_eligible = false;
  if (!directory_ || !registry_.find_recipe(recipe_id)) return std::nullopt;

  for (auto& node : directory_->get_nodes()) {
    if (node.type != NodeType::Converter || !node.supports_recipe(recipe_id)) continue;
    if (any_eligible) *any_eligible = true;
    if (node.id == exclude_id) continue;
    if (node.has_spare_capacity()) return std::move(node);
  }
  return std::nullopt;
}

ConversionResult ConversionEngine::start_process_for(const std::string& converter_id, const std::string& recipe_id,
                                                     ChainExecutionId execution_id, int step_index) {
  if (!directory_) {
    const std::string msg = "Converter node directory unavailable; cannot start conversion process";
    log::error(msg);
    return start_failure(recipe_id, FlowErrorKind::DirectoryUnavailable, msg);
  }

  const ConversionRecipe* recipe = registry_.find_recipe(recipe_id);
  if (!recipe) {
    const std::string msg = join("Recipe ", recipe_id, " not found");
    log::error(msg);
    return start_failure(recipe_id, FlowErrorKind::RecipeNotFound, msg);
  }

  const auto node = directory_->get_node(converter_id);
  if (!node || node->type != NodeType::Converter) {
    const std::string msg = join("Converter node ", converter_id, " not found or invalid");
    log::error(msg);
    return start_failure(recipe_id, FlowErrorKind::ConverterNotFoundOrInvalid, msg);
  }
  if (!node->has_spare_capacity()) {
    const std::string msg = join("Converter node ", converter_id, " is at capacity (", node->active_process_ids.size(),
                                 "/", node->configuration.max_concurrent_processes, ")");
    log::warn(msg);
    return start_failure(recipe_id, FlowErrorKind::ConverterAtCapacity, msg);
  }

  const auto available = directory_->check_resources_available(converter_id, recipe->inputs);
  if (!available.ok) {
    const std::string msg = join("Error checking resources on ", converter_id, ": ", available.error);
    log::error(msg);
    return start_failure(recipe_id,
                         available.error_kind == FlowErrorKind::None ? FlowErrorKind::DirectoryUnavailable
                                                                     : available.error_kind,
                         msg);
  }
  if (!available.value) {
    const std::string msg = join("Insufficient resources on ", converter_id, " for recipe ", recipe_id);
    log::warn(msg);
    return start_failure(recipe_id, FlowErrorKind::InsufficientResources, msg);
  }

  const auto consumed = directory_->consume_resources(converter_id, recipe->inputs);
  if (!consumed.ok) {
    const std::string msg = join("Error consuming resources on ", converter_id, ": ", consumed.error);
    log::error(msg);
    return start_failure(recipe_id, FlowErrorKind::ConsumeFailure, msg);
  }
  if (!consumed.value) {
    const std::string msg = join("Failed to consume resources on ", converter_id, " for recipe ", recipe_id,
                                 " (potentially unavailable now)");
    log::error(msg);
    return start_failure(recipe_id, FlowErrorKind::ConsumeFailure, msg);
  }

  // Re-read after the directory mutated the node.
  const auto fresh = directory_->get_node(converter_id);
  const ConverterNode& current = fresh ? *fresh : *node;
  const EfficiencyParams params = efficiency_params();

  ConversionProcess p;
  p.process_id = next_process_id_++;
  p.recipe_id = recipe_id;
  p.source_id = converter_id;
  p.start_time_ms = now_ms();
  p.progress = 0.0;
  p.applied_efficiency = clamp_efficiency(calculate_converter_efficiency(current, *recipe, params), params);
  p.chain_execution_id = execution_id;
  p.chain_step_index = step_index;

  const ProcessId pid = p.process_id;
  ResourceUpdated ev;
  ev.kind = ResourceUpdateKind::ProcessStarted;
  ev.process = p;
  ev.recipe_id = recipe_id;
  ev.converter_id = converter_id;
  ev.inputs = recipe->inputs;
  ev.efficiency = *p.applied_efficiency;

  scheduler_.enqueue(std::move(p));

  ConverterNodePatch patch;
  patch.active_process_ids = current.active_process_ids;
  patch.active_process_ids->push_back(pid);
  if (const auto st = directory_->update_node_data(converter_id, patch); !st.ok) {
    log::error(join("Error updating node ", converter_id, " after starting process ", pid, ": ", st.error));
  }

  log::debug(join("Process ", pid, " started: ", recipe_id, " on ", converter_id, " (efficiency ",
                  format_fixed(ev.efficiency), ")"));
  publish(std::move(ev));

  ConversionResult r;
  r.success = true;
  r.process_id = pid;
  r.recipe_id = recipe_id;
  return r;
}

void ConversionEngine::release_converter_slot(const std::string& converter_id, ProcessId process_id) {
  if (!directory_) return;

  const auto node = directory_->get_node(converter_id);
  if (!node || node->type != NodeType::Converter) {
    log::warn(join("Could not find converter node ", converter_id, " to remove process ", process_id));
    return;
  }
  if (!engine_internal::vec_contains(node->active_process_ids, process_id)) return;

  ConverterNodePatch patch;
  patch.active_process_ids = engine_internal::without(node->active_process_ids, process_id);
  if (const auto st = directory_->update_node_data(converter_id, patch); !st.ok) {
    log::error(join("Error updating node ", converter_id, " after finishing process ", process_id, ": ", st.error));
  }
}

} // namespace resflow
