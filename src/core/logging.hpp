#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace easel::control {
struct LogConfig;
}

namespace easel::logging {

// Start the Quill backend thread (called once at startup)
void init_logging_system();

// Create the process logger from config: console when output is empty,
// rotating text or JSON file otherwise. Replaces any previous logger.
quill::Logger* init_server_logger(const easel::control::LogConfig& config);

// Flush and stop the backend (called at exit)
void shutdown_logging();

// UUID v4 + per-thread counter for request correlation
std::string generate_correlation_id();

// Validate correlation ID format ({uuid}#{counter})
bool is_valid_uuid(std::string_view uuid);

// Process logger; falls back to a console logger if none was configured
quill::Logger* get_current_logger();

// Map a config level name to a Quill level ("warn" accepted for "warning")
quill::LogLevel parse_log_level(std::string_view level);

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

// Upstream call logging (url must already be redacted)
#define LOG_UPSTREAM(logger, event, upstream, url, status, correlation_id)                  \
    LOG_INFO(logger, "Upstream {}: upstream={}, url={}, status={}, correlation_id={}", event, \
             upstream, url, status, correlation_id)

}  // namespace easel::logging
