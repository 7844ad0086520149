#pragma once

#include <string>
#include "types.hpp"

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Configure the process-wide logger from the sidecar config:
// VerboseLogging → debug, ErrorsOnlyLogging → error, otherwise info.
// LogFile, when set, receives appended lines instead of stderr.
void configure_logging(const SidecarConfig& config);

void set_log_level(LogLevel level);
LogLevel log_level();

// Append a timestamped line if `level` passes the current filter.
void sidecar_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { sidecar_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { sidecar_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { sidecar_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { sidecar_log(LogLevel::Error, msg); }

// Log a local command and its result at debug level.
void log_command(const std::string& label, const std::string& cmd, const CommandResult& r);
