#include "resflow/core/conversion_engine.h"

#include <algorithm>
#include <utility>

#include "engine_internal.h"
#include "resflow/util/log.h"

namespace resflow {

using engine_internal::join;

ConversionEngine::ConversionEngine(EngineConfig cfg, ConverterNodeDirectory* directory, EventSink* events,
                                   const TimeSource* clock)
    : cfg_(std::move(cfg)), directory_(directory), events_(events), clock_(clock) {
  scheduler_.set_interval_ms(cfg_.processing_interval_ms);
}

EfficiencyParams ConversionEngine::efficiency_params() const {
  EfficiencyParams p;
  p.full_load_stress_penalty = cfg_.full_load_stress_penalty;
  p.min_stress_factor = cfg_.min_stress_factor;
  p.min_efficiency = cfg_.min_efficiency;
  p.max_efficiency = cfg_.max_efficiency;
  return p;
}

std::int64_t ConversionEngine::now_ms() const { return clock_ ? clock_->now_ms() : steady_clock_.now_ms(); }

void ConversionEngine::publish(FlowEvent ev) {
  if (!events_) return;
  events_->publish(ev);
}

void ConversionEngine::initialize() {
  if (initialized_) return;
  scheduler_.start(now_ms());
  initialized_ = true;
  log::debug(join("Conversion engine initialized (tick every ", scheduler_.interval_ms(), " ms)"));
}

void ConversionEngine::dispose() {
  const std::size_t dropped = scheduler_.queued_count();
  scheduler_.clear();
  registry_.clear();
  chains_.clear();
  finished_chains_.clear();
  initialized_ = false;
  if (dropped > 0) log::info(join("Conversion engine disposed with ", dropped, " active process(es)"));
}

bool ConversionEngine::poll() {
  if (!initialized_) return false;
  const auto now = now_ms();
  if (!scheduler_.due(now)) return false;
  scheduler_.mark_ticked(now);
  tick();
  return true;
}

bool ConversionEngine::register_conversion_recipe(const ConversionRecipe& recipe) {
  if (!registry_.register_recipe(recipe)) {
    log::warn("Rejected conversion recipe with an empty id");
    return false;
  }
  return true;
}

bool ConversionEngine::register_conversion_chain(const ConversionChain& chain) {
  if (!registry_.register_chain(chain)) {
    log::warn("Rejected conversion chain with an empty id");
    return false;
  }
  return true;
}

const ConversionRecipe* ConversionEngine::find_recipe(const std::string& recipe_id) const {
  return registry_.find_recipe(recipe_id);
}

const ConversionChain* ConversionEngine::find_chain(const std::string& chain_id) const {
  return registry_.find_chain(chain_id);
}

std::optional<ConversionProcess> ConversionEngine::process(ProcessId process_id) const {
  if (const auto* p = scheduler_.find_active(process_id)) return *p;
  if (const auto* p = scheduler_.find_completed(process_id)) return *p;
  return std::nullopt;
}

std::vector<ProcessId> ConversionEngine::active_process_ids() const { return scheduler_.queue_snapshot(); }

std::vector<ConversionProcess> ConversionEngine::completed_processes() const {
  return {scheduler_.history().begin(), scheduler_.history().end()};
}

std::optional<ChainExecutionStatus> ConversionEngine::chain_execution(ChainExecutionId execution_id) const {
  if (auto it = chains_.find(execution_id); it != chains_.end()) return it->second;
  for (const auto& c : finished_chains_) {
    if (c.execution_id == execution_id) return c;
  }
  return std::nullopt;
}

std::vector<ChainExecutionId> ConversionEngine::chain_execution_ids() const {
  std::vector<ChainExecutionId> out;
  out.reserve(chains_.size());
  for (const auto& [id, _] : chains_) out.push_back(id);
  return out;
}

std::optional<ChainExecutionId> ConversionEngine::latest_execution_for_chain(const std::string& chain_id) const {
  ChainExecutionId best = kInvalidId;
  for (const auto& [id, c] : chains_) {
    if (c.chain_id == chain_id) best = std::max(best, id);
  }
  for (const auto& c : finished_chains_) {
    if (c.chain_id == chain_id) best = std::max(best, c.execution_id);
  }
  if (best == kInvalidId) return std::nullopt;
  return best;
}

std::vector<ChainExecutionStatus> ConversionEngine::finished_chain_executions() const {
  return {finished_chains_.begin(), finished_chains_.end()};
}

} // namespace resflow
