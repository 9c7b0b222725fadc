#pragma once

#include <chrono>
#include <string>

namespace mediaxfer {

// printf-style logging. Info and debug go to stdout, warnings and errors
// to stderr with a severity prefix.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// Enable log_debug output (off by default).
void set_log_verbose(bool verbose);
bool log_verbose();

/// Send info and debug to stderr too, leaving stdout for command output.
void set_log_to_stderr(bool enabled);

/// Append every level to path instead of the standard streams. An empty
/// path goes back to the standard streams. Returns false (and leaves logging
/// unchanged) if the file cannot be opened. Safe while other threads log.
bool set_log_file(const std::string& path);

/// "2024-05-01T12:00:00.123Z"
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

}  // namespace mediaxfer
