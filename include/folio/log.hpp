#pragma once

#include <cstdio>
#include <string>

// Leveled printf-style logging. Lines look like
//
//     warn: [compile-1] compilation 3f2a... marked timeout
//
// The bracketed tag appears only on threads that set one.
namespace folio::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination stream; nullptr restores stderr. Colour is never written to
// a stream that is not a terminal.
void set_output(std::FILE* out);

// Tag printed on every line logged from the calling thread; empty clears it
void set_thread_tag(const std::string& tag);
const std::string& thread_tag();

// One whole line per call, even with several threads logging
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// trace, debug, info, warn (or warning), error; case-insensitive.
// Leaves out untouched on unknown names.
bool parse_level(const std::string& name, Level& out);

} // namespace folio::log
