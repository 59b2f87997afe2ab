#pragma once

#include <vector>

#include "resflow/core/entities.h"

namespace resflow {

// Tunables for the efficiency pipeline (see EngineConfig for defaults).
struct EfficiencyParams {
  // Efficiency lost at full converter load (load ratio 1.0).
  double full_load_stress_penalty{0.2};

  // The stress term never drops below this.
  double min_stress_factor{0.5};

  // Clamp applied to the final efficiency before outputs are scaled.
  double min_efficiency{0.0};
  double max_efficiency{2.0};
};

// Every factor that went into an efficiency value, for tooling/debugging.
struct EfficiencyBreakdown {
  double base{1.0};
  double converter{1.0};
  double recipe_modifier{1.0};
  double resource_quality{1.0};
  double network_stress{1.0};

  // Product of the factors above, before clamping.
  double raw{1.0};
};

// Input quality multiplier. Inputs carry no quality grade yet, so this is 1.0.
double resource_quality_factor(const std::vector<ResourceAmount>& inputs);

// Load-dependent degradation: 1 - load_ratio * penalty, clamped to
// [min_stress_factor, 1]. A node without capacity (max <= 0) is unstressed.
double network_stress_factor(const ConverterNode& converter, const EfficiencyParams& params = {});

EfficiencyBreakdown explain_converter_efficiency(const ConverterNode& converter, const ConversionRecipe& recipe,
                                                 const EfficiencyParams& params = {});

// Unclamped product of all factors.
double calculate_converter_efficiency(const ConverterNode& converter, const ConversionRecipe& recipe,
                                      const EfficiencyParams& params = {});

// Clamp into [min_efficiency, max_efficiency]. NaN maps to min_efficiency.
double clamp_efficiency(double efficiency, const EfficiencyParams& params = {});

// floor(amount * efficiency) per output.
std::vector<ResourceAmount> scale_outputs(const std::vector<ResourceAmount>& outputs, double efficiency);

} // namespace resflow
