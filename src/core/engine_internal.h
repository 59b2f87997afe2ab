#pragma once

// Helpers shared by the core translation units. Not part of the
// public API.

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "resflow/core/entities.h"
#include "resflow/util/strings.h"

namespace resflow::engine_internal {

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

template <typename T>
inline bool vec_contains(const std::vector<T>& v, const T& x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

template <typename T>
inline std::vector<T> without(std::vector<T> v, const T& x) {
  v.erase(std::remove(v.begin(), v.end(), x), v.end());
  return v;
}

// "ore=10.00, fuel=2.00"
inline std::string amounts_to_string(const std::vector<ResourceAmount>& amounts) {
  std::string out;
  for (const auto& a : amounts) {
    if (!out.empty()) out += ", ";
    out += a.type + "=" + format_fixed(a.amount);
  }
  return out.empty() ? "(none)" : out;
}

} // namespace resflow::engine_internal
