#pragma once

#include <pinch/result.hpp>
#include <string>
#include <cstdio>

namespace pinch::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Colour defaults to whether stderr is a terminal
void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// "trace" | "debug" | "info" | "warn" | "error", case-insensitive.
// "warning" is accepted as an alias for warn.
Result<Level> parse_level(const std::string& name);

} // namespace pinch::log
