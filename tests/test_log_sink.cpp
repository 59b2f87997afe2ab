#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "resflow/util/log.h"

#define RF_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_log_sink() {
  namespace rlog = resflow::log;

  const rlog::Level saved = rlog::level();
  std::vector<std::pair<rlog::Level, std::string>> lines;
  rlog::set_sink([&lines](rlog::Level l, const std::string& msg) { lines.emplace_back(l, msg); });

  rlog::set_level(rlog::Level::Warn);
  rlog::debug("dropped");
  rlog::info("dropped");
  rlog::warn("converter at capacity");
  rlog::error("transfer failed");
  RF_ASSERT(lines.size() == 2);
  RF_ASSERT(lines[0].first == rlog::Level::Warn);
  RF_ASSERT(lines[0].second == "converter at capacity");
  RF_ASSERT(lines[1].first == rlog::Level::Error);

  lines.clear();
  rlog::set_level(rlog::Level::Off);
  rlog::error("silenced");
  RF_ASSERT(lines.empty());

  rlog::set_level(rlog::Level::Debug);
  rlog::debug("tick");
  RF_ASSERT(lines.size() == 1);

  rlog::reset_sink();
  rlog::set_level(saved);

  // Level parsing (CLI --log-level).
  rlog::Level parsed = rlog::Level::Info;
  RF_ASSERT(rlog::parse_level("DEBUG", parsed) && parsed == rlog::Level::Debug);
  RF_ASSERT(rlog::parse_level("warning", parsed) && parsed == rlog::Level::Warn);
  RF_ASSERT(rlog::parse_level("off", parsed) && parsed == rlog::Level::Off);
  RF_ASSERT(!rlog::parse_level("verbose", parsed));
  RF_ASSERT(parsed == rlog::Level::Off);

  RF_ASSERT(std::string(rlog::level_label(rlog::Level::Error)) == "ERROR");
  return 0;
}
