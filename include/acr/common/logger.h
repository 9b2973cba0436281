// =============================================================================
// autoclaved-reader - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console (stderr) and file output
// - Thread-safe logging (Quill is inherently thread-safe)
//
// Console output goes to stderr because stdout carries record bytes.
// The ACR_LOG_* macros do nothing until init() has been called, so the
// library can be used without a logging backend.
//
// Usage:
//   acr::log::init("acr.log", acr::log::Level::kInfo);
//   ACR_LOG_INFO("Fetched {} bytes", 42);
// =============================================================================

#ifndef ACR_COMMON_LOGGER_H
#define ACR_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/FileSink.h>
#include <quill/sinks/StreamSink.h>

namespace acr::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kWarning;

    /// @brief Enable console (stderr) output.
    /// @note Ignored when no log file is given; diagnostics always go somewhere.
    bool enableConsole = true;
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Call once at startup; later calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kWarning);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Flush and stop the logging backend.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Convert string to log level (case-insensitive).
/// @return Corresponding log level, kInfo for unknown strings.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Apply -v flags on top of a configured level.
/// @param verbosity 1 lowers the threshold to info, 2 or more to debug.
/// @return The more verbose of the configured and the requested level.
[[nodiscard]] Level levelForVerbosity(Level configured, int verbosity) noexcept;

}  // namespace acr::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define ACR_LOG_IMPL(quillMacro, fmt, ...)                                   \
    do {                                                                     \
        if (quill::Logger* acrLogger_ = acr::log::logger()) {                \
            quillMacro(acrLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                    \
    } while (0)

#define ACR_LOG_TRACE(fmt, ...) ACR_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

#define ACR_LOG_DEBUG(fmt, ...) ACR_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

#define ACR_LOG_INFO(fmt, ...) ACR_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

#define ACR_LOG_WARNING(fmt, ...) ACR_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

#define ACR_LOG_ERROR(fmt, ...) ACR_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

#define ACR_LOG_CRITICAL(fmt, ...) ACR_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // ACR_COMMON_LOGGER_H
