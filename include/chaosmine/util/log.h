#pragma once

#include <functional>
#include <string>

namespace chaosmine::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

// Receives every message that passes the level filter.
//
// The default sink writes "[LEVEL] message" lines to stderr. Tests install a
// capturing sink to assert on engine diagnostics.
using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level lvl);
Level level();

// Replace the active sink. Passing an empty function restores the stderr sink.
// The sink runs outside the logger's lock, so it may log itself or call back into
// whatever emitted the message. Concurrent messages can reach it at the same time.
void set_sink(Sink sink);

const char* level_label(Level l);

void debug(const std::string& msg);
void info(const std::string& msg);
void warn(const std::string& msg);
void error(const std::string& msg);

} // namespace chaosmine::log
