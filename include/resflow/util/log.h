#pragma once

#include <functional>
#include <string>

namespace resflow::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

void set_level(Level lvl);
Level level();

// Redirect emitted lines (after level filtering) to a custom sink.
//
// Hosts embed the engine inside a larger game loop and usually want engine
// diagnostics routed into their own console; tests use this to assert that a
// swallowed failure was actually reported.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);
void reset_sink();

const char* level_label(Level l);

// Parses "debug", "info", "warn", "error", "off" (case-insensitive).
// Returns false and leaves `out` untouched on unknown input.
bool parse_level(const std::string& s, Level& out);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace resflow::log
