#include "resflow/util/log.h"

#include <iostream>
#include <mutex>
#include <utility>

#include "resflow/util/strings.h"

namespace resflow::log {
namespace {
std::mutex g_mu;
Level g_level = Level::Info;
Sink g_sink;

void emit(Level l, const std::string& msg) {
  if (g_level == Level::Off || l < g_level) return;
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_sink) {
    g_sink(l, msg);
    return;
  }
  std::cerr << "[" << level_label(l) << "] " << msg << "\n";
}

} // namespace

void set_level(Level lvl) { g_level = lvl; }
Level level() { return g_level; }

void set_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = std::move(sink);
}

void reset_sink() {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = nullptr;
}

const char* level_label(Level l) {
  switch (l) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
    case Level::Off: return "OFF";
  }
  return "";
}

bool parse_level(const std::string& s, Level& out) {
  const std::string l = to_lower(s);
  if (l == "debug") {
    out = Level::Debug;
  } else if (l == "info") {
    out = Level::Info;
  } else if (l == "warn" || l == "warning") {
    out = Level::Warn;
  } else if (l == "error") {
    out = Level::Error;
  } else if (l == "off" || l == "none") {
    out = Level::Off;
  } else {
    return false;
  }
  return true;
}

void debug(const std::string& msg) { emit(Level::Debug, msg); }
void info(const std::string& msg) { emit(Level::Info, msg); }
void warn(const std::string& msg) { emit(Level::Warn, msg); }
void error(const std::string& msg) { emit(Level::Error, msg); }

} // namespace resflow::log
