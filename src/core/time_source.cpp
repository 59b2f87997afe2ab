#include "resflow/core/time_source.h"

#include <chrono>

namespace resflow {

std::int64_t SteadyTimeSource::now_ms() const {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // namespace resflow
