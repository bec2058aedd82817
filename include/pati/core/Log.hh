#pragma once

// Pati Logging Subsystem
// Wraps Quill v11.x async structured logging.
//
// Usage:
//   #include "pati/core/Log.hh"
//   PATI_LOG_DEBUG("Dispatcher: ended with {} listener(s) removed", count);

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>

namespace pati::log {

/// Initialize the logging subsystem (console output only).
/// Safe to call more than once; later calls are no-ops.
void init();

/// Initialize with a file sink in addition to the console. When logging is
/// already running, later messages go to the console and the new file.
/// The file name gets the start date and time appended before its extension.
void init(const char* log_file_path);

/// Flush pending messages and stop the backend thread.
void shutdown();

/// Block until every message logged so far has been written.
void flush();

/// Get the root logger. Initializes the subsystem on first use.
quill::Logger* logger();

/// Set runtime log level (within compile-time ceiling).
void setLevel(quill::LogLevel level);

} // namespace pati::log

// Pati logging macros - wrap Quill with the root logger.
#define PATI_LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(pati::log::logger(), fmt, ##__VA_ARGS__)
#define PATI_LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(pati::log::logger(), fmt, ##__VA_ARGS__)
#define PATI_LOG_INFO(fmt, ...) QUILL_LOG_INFO(pati::log::logger(), fmt, ##__VA_ARGS__)
#define PATI_LOG_WARN(fmt, ...) QUILL_LOG_WARNING(pati::log::logger(), fmt, ##__VA_ARGS__)
#define PATI_LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(pati::log::logger(), fmt, ##__VA_ARGS__)
