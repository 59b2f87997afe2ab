#include "resflow/core/efficiency.h"

#include <algorithm>
#include <cmath>

namespace resflow {

double resource_quality_factor(const std::vector<ResourceAmount>& inputs) {
  (void)inputs;
  return 1.0;
}

double network_stress_factor(const ConverterNode& converter, const EfficiencyParams& params) {
  const int max_processes = converter.configuration.max_concurrent_processes;
  if (max_processes <= 0) return 1.0;

  const double load_ratio = static_cast<double>(converter.active_process_ids.size()) / static_cast<double>(max_processes);
  const double factor = 1.0 - load_ratio * params.full_load_stress_penalty;
  return std::clamp(factor, std::min(params.min_stress_factor, 1.0), 1.0);
}

EfficiencyBreakdown explain_converter_efficiency(const ConverterNode& converter, const ConversionRecipe& recipe,
                                                 const EfficiencyParams& params) {
  EfficiencyBreakdown b;
  b.base = recipe.base_efficiency;
  b.converter = converter.efficiency;

  if (auto it = converter.configuration.efficiency_modifiers.find(recipe.id);
      it != converter.configuration.efficiency_modifiers.end()) {
    b.recipe_modifier = it->second;
  }

  b.resource_quality = resource_quality_factor(recipe.inputs);
  b.network_stress = network_stress_factor(converter, params);
  b.raw = b.base * b.converter * b.recipe_modifier * b.resource_quality * b.network_stress;
  return b;
}

double calculate_converter_efficiency(const ConverterNode& converter, const ConversionRecipe& recipe,
                                      const EfficiencyParams& params) {
  return explain_converter_efficiency(converter, recipe, params).raw;
}

double clamp_efficiency(double efficiency, const EfficiencyParams& params) {
  if (std::isnan(efficiency)) return params.min_efficiency;
  return std::clamp(efficiency, params.min_efficiency, std::max(params.min_efficiency, params.max_efficiency));
}

std::vector<ResourceAmount> scale_outputs(const std::vector<ResourceAmount>& outputs, double efficiency) {
  std::vector<ResourceAmount> out;
  out.reserve(outputs.size());
  for (const auto& o : outputs) out.push_back({o.type, std::floor(o.amount * efficiency)});
  return out;
}

} // namespace resflow
