#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

#include "resflow/core/entities.h"

namespace resflow {

// Fixed-interval tick bookkeeping plus the processing queue and the bounded
// completed-process history.
//
// The scheduler owns process records; the engine reaches them by id. It does
// not run a timer thread: the host calls ConversionEngine::poll() (or tick())
// from its own loop and due() decides whether an interval has elapsed.
class ProcessScheduler {
 public:
  explicit ProcessScheduler(std::int64_t interval_ms = 1000);

  std::int64_t interval_ms() const { return interval_ms_; }
  void set_interval_ms(std::int64_t interval_ms);

  void start(std::int64_t now_ms);
  void stop();
  bool running() const { return running_; }

  bool due(std::int64_t now_ms) const;
  void mark_ticked(std::int64_t now_ms);
  std::int64_t next_due_ms() const { return next_due_ms_; }

  // --- processing queue ---
  void enqueue(ConversionProcess process);
  ConversionProcess* find_active(ProcessId id);
  const ConversionProcess* find_active(ProcessId id) const;

  // Queue order (start order).
  const std::vector<ProcessId>& queue() const { return queue_; }
  std::vector<ProcessId> queue_snapshot() const { return queue_; }
  std::size_t queued_count() const { return queue_.size(); }

  // Removes the process from the queue and returns it.
  std::optional<ConversionProcess> retire(ProcessId id);

  // --- completed history ---
  void record_completed(ConversionProcess process);

  // Drops the oldest entries beyond max_entries. 0 = unlimited.
  void trim_history(std::size_t max_entries);

  const std::deque<ConversionProcess>& history() const { return history_; }
  const ConversionProcess* find_completed(ProcessId id) const;

  void clear();

  // min(1, elapsed / processing_time). Zero or negative processing time
  // completes on the first tick.
  static double compute_progress(std::int64_t now_ms, std::int64_t start_time_ms, double processing_time_ms);

 private:
  std::int64_t interval_ms_{1000};
  bool running_{false};
  std::int64_t next_due_ms_{0};

  std::vector<ProcessId> queue_;
  std::unordered_map<ProcessId, ConversionProcess> active_;
  std::deque<ConversionProcess> history_;
};

} // namespace resflow
