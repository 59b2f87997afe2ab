#include "resflow/core/process_scheduler.h"

#include <algorithm>
#include <utility>

namespace resflow {

ProcessScheduler::ProcessScheduler(std::int64_t interval_ms) { set_interval_ms(interval_ms); }

void ProcessScheduler::set_interval_ms(std::int64_t interval_ms) {
  // At least 1 ms.
  interval_ms_ = std::max<std::int64_t>(1, interval_ms);
}

void ProcessScheduler::start(std::int64_t now_ms) {
  running_ = true;
  next_due_ms_ = now_ms + interval_ms_;
}

void ProcessScheduler::stop() { running_ = false; }

bool ProcessScheduler::due(std::int64_t now_ms) const { return running_ && now_ms >= next_due_ms_; }

void ProcessScheduler::mark_ticked(std::int64_t now_ms) {
  // Catch up without bursting: a late poll schedules the next tick one
  // interval after the current time.
  next_due_ms_ += interval_ms_;
  if (next_due_ms_ <= now_ms) next_due_ms_ = now_ms + interval_ms_;
}

void ProcessScheduler::enqueue(ConversionProcess process) {
  const ProcessId id = process.process_id;
  active_[id] = std::move(process);
  queue_.push_back(id);
}

ConversionProcess* ProcessScheduler::find_active(ProcessId id) {
  auto it = active_.find(id);
  return it == active_.end() ? nullptr : &it->second;
}

const ConversionProcess* ProcessScheduler::find_active(ProcessId id) const {
  auto it = active_.find(id);
  return it == active_.end() ? nullptr : &it->second;
}

std::optional<ConversionProcess> ProcessScheduler::retire(ProcessId id) {
  auto it = active_.find(id);
  if (it == active_.end()) return std::nullopt;

  ConversionProcess p = std::move(it->second);
  active_.erase(it);
  queue_.erase(std::remove(queue_.begin(), queue_.end(), id), queue_.end());
  return p;
}

void ProcessScheduler::record_completed(ConversionProcess process) { history_.push_back(std::move(process)); }

void ProcessScheduler::trim_history(std::size_t max_entries) {
  if (max_entries == 0) return;
  while (history_.size() > max_entries) history_.pop_front();
}

const ConversionProcess* ProcessScheduler::find_completed(ProcessId id) const {
  // Newest first.
  for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
    if (it->process_id == id) return &*it;
  }
  return nullptr;
}

void ProcessScheduler::clear() {
  running_ = false;
  next_due_ms_ = 0;
  queue_.clear();
  active_.clear();
  history_.clear();
}

double ProcessScheduler::compute_progress(std::int64_t now_ms, std::int64_t start_time_ms, double processing_time_ms) {
  if (!(processing_time_ms > 0.0)) return 1.0;
  const double elapsed = static_cast<double>(now_ms - start_time_ms);
  return std::clamp(elapsed / processing_time_ms, 0.0, 1.0);
}

} // namespace resflow
