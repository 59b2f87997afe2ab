#pragma once

#include <string>

namespace resflow {

std::string to_lower(std::string s);

// Fixed-precision formatting for amounts and efficiencies in log lines and
// CLI summaries ("1.50", "0.80"). Non-finite values render as "nan"/"inf".
std::string format_fixed(double v, int decimals = 2);

} // namespace resflow
