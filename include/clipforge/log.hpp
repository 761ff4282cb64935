#pragma once

namespace clipforge {

/// Enable or disable log_debug output (process-wide, set once at startup).
void set_verbose(bool verbose);
bool verbose_enabled();

// printf-style log helpers. Info and debug go to stdout, warnings and
// errors to stderr with a severity prefix.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace clipforge
