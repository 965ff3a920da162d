#pragma once

#include <pinion/result.hpp>
#include <string>
#include <cstdio>

namespace pinion::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Where messages go; stderr unless redirected. nullptr restores stderr.
void set_sink(std::FILE* sink);

// PINION_LOG=<level> sets the threshold, NO_COLOR turns color off.
// An unknown level is reported and leaves the threshold alone.
Status init_from_env();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// "trace", "debug", "info", "warn"/"warning", "error"; case-insensitive
Result<Level> parse_level(const std::string& name);

} // namespace pinion::log
