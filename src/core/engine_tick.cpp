#include "resflow/core/conversion_engine.h"

#include <algorithm>
#include <utility>

#include "engine_internal.h"
#include "resflow/util/log.h"

namespace resflow {

using engine_internal::join;

namespace {

bool fail_update(std::string* error, FlowErrorKind kind, const std::string& msg) {
  log::warn(msg);
  if (error) *error = join(flow_error_kind_to_string(kind), ": ", msg);
  return false;
}

} // namespace

void ConversionEngine::tick() {
  const auto now = now_ms();

  // Snapshot: processes started by a completion during this sweep are first
  // advanced on the next tick.
  for (ProcessId id : scheduler_.queue_snapshot()) {
    ConversionProcess* p = scheduler_.find_active(id);
    if (!p || !p->active || p->paused) continue;

    const ConversionRecipe* recipe = registry_.find_recipe(p->recipe_id);
    if (!recipe) {
      log::debug(join("Process ", id, " references unknown recipe ", p->recipe_id, "; not advanced"));
      continue;
    }

    const double progress = ProcessScheduler::compute_progress(now, p->start_time_ms, recipe->processing_time_ms);
    p->progress = std::max(p->progress, progress);
    if (p->progress < 1.0) continue;

    complete_process(id);
    if (cfg_.repoke_waiting_chains_on_completion) poke_waiting_chains();
  }

  scheduler_.trim_history(static_cast<std::size_t>(std::max(0, cfg_.max_process_history)));
  archive_finished_chains();
}

bool ConversionEngine::update_process(const ProcessUpdate& update, std::string* error) {
  ConversionProcess* p = scheduler_.find_active(update.process_id);
  if (!p) {
    return fail_update(error, FlowErrorKind::ProcessNotFound, join("Process ", update.process_id, " not found for update"));
  }

  const auto now = now_ms();
  ChainExecutionStatus* chain = p->chain_execution_id != kInvalidId ? find_running_chain(p->chain_execution_id) : nullptr;

  switch (update.status) {
    case ProcessStatus::Paused:
      if (p->paused) return true;
      p->paused = true;
      p->paused_at_ms = now;
      break;

    case ProcessStatus::InProgress:
      if (!p->paused) return true;
      // Shift the start so the paused span does not count as progress.
      p->start_time_ms += std::max<std::int64_t>(0, now - p->paused_at_ms);
      p->paused = false;
      p->paused_at_ms = 0;
      break;

    case ProcessStatus::Failed: {
      ConversionProcess done = std::move(*scheduler_.retire(update.process_id));
      done.active = false;
      done.failed = true;
      done.error = update.error.empty() ? std::string("Process failed") : update.error;
      done.end_time_ms = now;
      log::error(join("Error in conversion process ", done.process_id, ": ", done.error));

      release_converter_slot(done.source_id, done.process_id);

      ResourceUpdated ev;
      ev.kind = ResourceUpdateKind::ProcessUpdated;
      ev.process = done;
      ev.recipe_id = done.recipe_id;
      ev.converter_id = done.source_id;
      publish(std::move(ev));

      if (chain) {
        const auto idx = static_cast<std::size_t>(done.chain_step_index);
        if (done.chain_step_index >= 0 && idx < chain->step_status.size() &&
            chain->step_status[idx].process_id == done.process_id &&
            chain->step_status[idx].status == ProcessStatus::InProgress) {
          chain->step_status[idx].status = ProcessStatus::Failed;
          chain->step_status[idx].end_time_ms = now;
          fail_chain(*chain, done.error);
        }
      }

      scheduler_.record_completed(std::move(done));
      scheduler_.trim_history(static_cast<std::size_t>(std::max(0, cfg_.max_process_history)));
      if (cfg_.repoke_waiting_chains_on_completion) poke_waiting_chains();
      archive_finished_chains();
      return true;
    }

    case ProcessStatus::Completed:
      return fail_update(error, FlowErrorKind::InvalidState,
                         join("Process ", update.process_id, " can only be completed by the scheduler"));
    case ProcessStatus::Pending:
      return fail_update(error, FlowErrorKind::InvalidState,
                         join("Process ", update.process_id, " cannot return to PENDING"));
  }

  ResourceUpdated ev;
  ev.kind = ResourceUpdateKind::ProcessUpdated;
  ev.process = *p;
  ev.recipe_id = p->recipe_id;
  ev.converter_id = p->source_id;
  ev.efficiency = p->applied_efficiency.value_or(0.0);
  publish(std::move(ev));

  if (chain) publish_chain_status(*chain);
  return true;
}

bool ConversionEngine::pause_process(ProcessId process_id, std::string* error) {
  ProcessUpdate u;
  u.process_id = process_id;
  u.status = ProcessStatus::Paused;
  return update_process(u, error);
}

bool ConversionEngine::resume_process(ProcessId process_id, std::string* error) {
  ProcessUpdate u;
  u.process_id = process_id;
  u.status = ProcessStatus::InProgress;
  return update_process(u, error);
}

} // namespace resflow
