#include "resflow/core/state_validation.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "engine_internal.h"
#include "resflow/core/conversion_content.h"

namespace resflow {

using engine_internal::join;

namespace {

void check_process(std::vector<std::string>& errors, const ConversionProcess& p, const EngineConfig& cfg,
                   const char* where) {
  if (!(p.progress >= 0.0 && p.progress <= 1.0)) {
    errors.push_back(join(where, " process ", p.process_id, " has progress out of range: ", p.progress));
  }
  if (p.applied_efficiency) {
    const double e = *p.applied_efficiency;
    if (!(e >= cfg.min_efficiency && e <= cfg.max_efficiency)) {
      errors.push_back(join(where, " process ", p.process_id, " has applied efficiency out of range: ", e));
    }
  }
}

void check_chain(std::vector<std::string>& errors, const ChainExecutionStatus& c,
                 const std::unordered_set<ProcessId>& active) {
  const std::string label = join("Chain ", c.chain_id, " (execution ", c.execution_id, ")");
  const int steps = static_cast<int>(c.step_status.size());

  if (c.recipe_ids.size() != c.step_status.size()) {
    errors.push_back(join(label, " has ", c.recipe_ids.size(), " recipe ids but ", steps, " step records"));
    return;
  }
  if (c.current_step_index < 0 || c.current_step_index > steps) {
    errors.push_back(join(label, " has current_step_index out of range: ", c.current_step_index));
    return;
  }
  if (c.completed != (c.current_step_index == steps)) {
    errors.push_back(join(label, " completed=", c.completed ? "true" : "false", " but current_step_index=",
                          c.current_step_index, " of ", steps));
  }
  if (c.completed && c.failed) errors.push_back(join(label, " is both completed and failed"));
  if (!(c.progress >= 0.0 && c.progress <= 1.0)) {
    errors.push_back(join(label, " has progress out of range: ", c.progress));
  }

  for (int i = 0; i < steps; ++i) {
    const auto& s = c.step_status[static_cast<std::size_t>(i)];
    if (s.recipe_id != c.recipe_ids[static_cast<std::size_t>(i)]) {
      errors.push_back(join(label, " step ", i, " recipe mismatch: '", s.recipe_id, "'"));
    }

    if (i < c.current_step_index) {
      if (s.status != ProcessStatus::Completed) {
        errors.push_back(join(label, " step ", i, " is before the current step but ",
                              process_status_to_string(s.status)));
      }
      continue;
    }

    if (s.status == ProcessStatus::Completed || s.status == ProcessStatus::Paused) {
      errors.push_back(join(label, " step ", i, " has illegal status ", process_status_to_string(s.status)));
    }
    if (i > c.current_step_index && s.status != ProcessStatus::Pending) {
      errors.push_back(join(label, " step ", i, " is after the current step but ",
                            process_status_to_string(s.status)));
    }
    if (s.status == ProcessStatus::InProgress && c.running() && !active.count(s.process_id)) {
      errors.push_back(join(label, " step ", i, " is IN_PROGRESS but process ", s.process_id, " is not active"));
    }
  }
}

} // namespace

std::vector<std::string> validate_engine_state(const ConversionEngine& engine, const ConverterNodeDirectory* directory) {
  std::vector<std::string> errors;
  const EngineConfig& cfg = engine.cfg();

  std::unordered_set<ProcessId> active;
  for (ProcessId id : engine.active_process_ids()) {
    active.insert(id);
    const auto p = engine.process(id);
    if (!p) {
      errors.push_back(join("Queued process ", id, " has no record"));
      continue;
    }
    check_process(errors, *p, cfg, "Active");
    if (!engine.find_recipe(p->recipe_id)) {
      errors.push_back(join("Active process ", id, " references unknown recipe '", p->recipe_id, "'"));
    }
    if (directory) {
      const auto node = directory->get_node(p->source_id);
      if (!node) {
        errors.push_back(join("Active process ", id, " runs on unknown converter '", p->source_id, "'"));
      } else if (std::find(node->active_process_ids.begin(), node->active_process_ids.end(), id) ==
                 node->active_process_ids.end()) {
        errors.push_back(join("Active process ", id, " is not listed on converter '", p->source_id, "'"));
      }
    }
  }

  for (const auto& p : engine.completed_processes()) {
    check_process(errors, p, cfg, "Completed");
    if (p.active) errors.push_back(join("Completed process ", p.process_id, " is still marked active"));
  }

  if (directory) {
    for (const auto& n : directory->get_nodes()) {
      if (n.type != NodeType::Converter) continue;
      const auto count = static_cast<long long>(n.active_process_ids.size());
      if (count > static_cast<long long>(n.configuration.max_concurrent_processes)) {
        errors.push_back(join("Converter '", n.id, "' runs ", count, " processes (max ",
                              n.configuration.max_concurrent_processes, ")"));
      }
      for (ProcessId id : n.active_process_ids) {
        if (!active.count(id)) {
          errors.push_back(join("Converter '", n.id, "' lists process ", id, " which is not active"));
        }
      }
    }
  }

  for (ChainExecutionId id : engine.chain_execution_ids()) {
    if (const auto c = engine.chain_execution(id)) check_chain(errors, *c, active);
  }
  for (const auto& c : engine.finished_chain_executions()) check_chain(errors, c, active);

  std::sort(errors.begin(), errors.end());
  return errors;
}

} // namespace resflow
