#pragma once

#include <cstdint>

namespace resflow {

// Millisecond clock consulted by the engine for process timing and the tick
// interval.
class TimeSource {
 public:
  virtual ~TimeSource() = default;
  virtual std::int64_t now_ms() const = 0;
};

// Monotonic wall clock (std::chrono::steady_clock).
class SteadyTimeSource : public TimeSource {
 public:
  std::int64_t now_ms() const override;
};

// Externally driven clock for deterministic runs (tests, CLI batch mode).
class ManualTimeSource : public TimeSource {
 public:
  explicit ManualTimeSource(std::int64_t start_ms = 0) : now_ms_(start_ms) {}

  std::int64_t now_ms() const override { return now_ms_; }

  void set_ms(std::int64_t t) { now_ms_ = t; }
  void advance_ms(std::int64_t dt) { now_ms_ += dt; }

 private:
  std::int64_t now_ms_{0};
};

} // namespace resflow
