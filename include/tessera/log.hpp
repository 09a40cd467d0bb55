#pragma once

#include <string>

// Diagnostics for resolution, digesting and the content store. Lines go to
// stderr as "<level>: <message>", coloured when stderr is a terminal.
namespace tessera::log {

enum Level { Trace, Debug, Info, Warn, Error };

// Messages below the threshold are dropped. Default: Info.
void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// printf-style
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Parse "trace" | "debug" | "info" | "warn" | "error" (any case; "warning"
// is accepted too). Returns false and leaves `out` untouched on an unknown
// name.
bool parse_level(const std::string& name, Level& out);

} // namespace tessera::log
