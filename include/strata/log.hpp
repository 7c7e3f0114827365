#pragma once

#include <strata/result.hpp>
#include <string>
#include <cstdio>

namespace strata::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Parse "trace", "debug", "info", "warn" or "error"
Result<Level> parse_level(const std::string& name);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination of log output, stderr unless redirected
void set_stream(FILE* stream);
FILE* get_stream();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace strata::log
