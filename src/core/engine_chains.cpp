#include "resflow/core/conversion_engine.h"

#include <utility>

#include "engine_internal.h"
#include "resflow/util/log.h"

namespace resflow {

using engine_internal::join;

namespace {

double completed_fraction(const ChainExecutionStatus& chain) {
  if (chain.step_status.empty()) return chain.completed ? 1.0 : 0.0;
  int done = 0;
  for (const auto& s : chain.step_status) {
    if (s.status == ProcessStatus::Completed) ++done;
  }
  return static_cast<double>(done) / static_cast<double>(chain.step_status.size());
}

} // namespace

bool ConversionEngine::start_conversion_chain(const std::string& chain_id, ChainExecutionId* out_execution_id) {
  const ConversionChain* def = registry_.find_chain(chain_id);
  if (!def) {
    log::warn(join("Conversion chain ", chain_id, " not found"));
    return false;
  }

  ChainExecutionStatus status;
  status.execution_id = next_execution_id_++;
  status.chain_id = chain_id;
  status.start_time_ms = now_ms();
  status.recipe_ids = def->steps;
  status.step_status.reserve(def->steps.size());
  for (const auto& rid : def->steps) {
    ChainStepStatus step;
    step.recipe_id = rid;
    status.step_status.push_back(std::move(step));
  }

  const ChainExecutionId id = status.execution_id;
  auto& chain = chains_.emplace(id, std::move(status)).first->second;
  if (out_execution_id) *out_execution_id = id;

  log::debug(join("Chain ", chain_id, " started (execution ", id, ", ", chain.recipe_ids.size(), " step(s))"));
  process_next_chain_step(chain);
  archive_finished_chains();
  return true;
}

ChainExecutionStatus* ConversionEngine::find_running_chain(ChainExecutionId execution_id) {
  auto it = chains_.find(execution_id);
  if (it == chains_.end() || !it->second.running()) return nullptr;
  return &it->second;
}

bool ConversionEngine::chain_is_waiting(const ChainExecutionStatus& chain) const {
  if (!chain.running() || chain.paused) return false;
  const auto idx = static_cast<std::size_t>(chain.current_step_index);
  return idx < chain.step_status.size() && chain.step_status[idx].status == ProcessStatus::Pending;
}

void ConversionEngine::process_next_chain_step(ChainExecutionStatus& chain) {
  if (!chain.active || chain.completed || chain.failed || chain.paused) return;

  const int index = chain.current_step_index;
  if (index >= static_cast<int>(chain.recipe_ids.size())) {
    // Only reachable for a chain without steps; the completion path finishes
    // the others.
    chain.completed = true;
    chain.active = false;
    chain.end_time_ms = now_ms();
    chain.progress = 1.0;
    ChainCompleted ev;
    ev.execution_id = chain.execution_id;
    ev.chain_id = chain.chain_id;
    publish(std::move(ev));
    return;
  }

  auto& step = chain.step_status[static_cast<std::size_t>(index)];
  if (step.status != ProcessStatus::Pending) return;

  const std::string recipe_id = chain.recipe_ids[static_cast<std::size_t>(index)];

  if (!directory_) {
    fail_chain(chain, "Converter node directory unavailable");
    return;
  }
  if (!registry_.find_recipe(recipe_id)) {
    log::warn(join("Recipe ", recipe_id, " not found when searching for converters"));
  }

  bool any_eligible = false;
  std::optional<ConverterNode> chosen;

  // A converter planned when the previous step finished already holds this
  // step's inputs.
  if (!step.converter_id.empty()) {
    if (auto planned = directory_->get_node(step.converter_id);
        planned && planned->type == NodeType::Converter && planned->supports_recipe(recipe_id) &&
        planned->has_spare_capacity() && registry_.find_recipe(recipe_id)) {
      any_eligible = true;
      chosen = std::move(planned);
    }
  }
  if (!chosen) chosen = select_converter(recipe_id, std::string(), &any_eligible);

  if (!any_eligible) {
    fail_chain(chain, join("No converters available for recipe ", recipe_id));
    return;
  }
  if (!chosen) {
    log::debug(join("Chain ", chain.chain_id, " (execution ", chain.execution_id, ") waiting for a free converter for ",
                    recipe_id));
    return;
  }

  const ConversionResult result = start_process_for(chosen->id, recipe_id, chain.execution_id, index);
  if (!result.success) {
    fail_chain(chain, result.error.empty() ? join("Failed to start conversion for recipe ", recipe_id) : result.error);
    return;
  }

  step.status = ProcessStatus::InProgress;
  step.start_time_ms = now_ms();
  step.process_id = result.process_id;
  step.converter_id = chosen->id;

  ChainStepStarted ev;
  ev.execution_id = chain.execution_id;
  ev.chain_id = chain.chain_id;
  ev.step_index = index;
  ev.recipe_id = recipe_id;
  ev.process_id = result.process_id;
  ev.converter_id = chosen->id;
  publish(std::move(ev));
}

void ConversionEngine::fail_chain(ChainExecutionStatus& chain, const std::string& message) {
  chain.failed = true;
  chain.active = false;
  chain.error_message = message;
  chain.end_time_ms = now_ms();
  chain.progress = completed_fraction(chain);
  log::warn(join("Chain ", chain.chain_id, " (execution ", chain.execution_id, ") failed: ", message));
  publish_chain_status(chain);
}

void ConversionEngine::publish_chain_status(const ChainExecutionStatus& chain) {
  ChainStatusUpdated ev;
  ev.chain_status = chain;
  publish(std::move(ev));
}

bool ConversionEngine::pause_chain(ChainExecutionId execution_id) {
  ChainExecutionStatus* chain = find_running_chain(execution_id);
  if (!chain || chain->paused) return false;
  chain->paused = true;
  publish_chain_status(*chain);
  return true;
}

bool ConversionEngine::resume_chain(ChainExecutionId execution_id) {
  ChainExecutionStatus* chain = find_running_chain(execution_id);
  if (!chain || !chain->paused) return false;
  chain->paused = false;
  publish_chain_status(*chain);
  process_next_chain_step(*chain);
  archive_finished_chains();
  return true;
}

bool ConversionEngine::cancel_chain(ChainExecutionId execution_id) {
  ChainExecutionStatus* chain = find_running_chain(execution_id);
  if (!chain) return false;

  const auto idx = static_cast<std::size_t>(chain->current_step_index);
  if (idx < chain->step_status.size() && chain->step_status[idx].status == ProcessStatus::InProgress) {
    chain->step_status[idx].status = ProcessStatus::Failed;
    chain->step_status[idx].end_time_ms = now_ms();
  }
  fail_chain(*chain, "Chain execution cancelled");
  archive_finished_chains();
  return true;
}

bool ConversionEngine::poke_chain(ChainExecutionId execution_id) {
  ChainExecutionStatus* chain = find_running_chain(execution_id);
  if (!chain || chain->paused) return false;
  process_next_chain_step(*chain);
  archive_finished_chains();
  return true;
}

int ConversionEngine::poke_waiting_chains() {
  std::vector<ChainExecutionId> waiting;
  for (const auto& [id, c] : chains_) {
    if (chain_is_waiting(c)) waiting.push_back(id);
  }

  int started = 0;
  for (ChainExecutionId id : waiting) {
    ChainExecutionStatus* chain = find_running_chain(id);
    if (!chain || !chain_is_waiting(*chain)) continue;
    const auto idx = static_cast<std::size_t>(chain->current_step_index);
    process_next_chain_step(*chain);
    if (chain->step_status[idx].status == ProcessStatus::InProgress) ++started;
  }
  archive_finished_chains();
  return started;
}

void ConversionEngine::archive_finished_chains() {
  for (auto it = chains_.begin(); it != chains_.end();) {
    if (it->second.completed || it->second.failed) {
      finished_chains_.push_back(std::move(it->second));
      it = chains_.erase(it);
    } else {
      ++it;
    }
  }

  if (cfg_.max_chain_history > 0) {
    while (finished_chains_.size() > static_cast<std::size_t>(cfg_.max_chain_history)) finished_chains_.pop_front();
  }
}

} // namespace resflow
