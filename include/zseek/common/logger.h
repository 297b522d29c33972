// =============================================================================
// zseek - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// The library logs through a single process-wide logger. Applications embedding
// zseek call init() to pick sinks and level; until they do, log statements go
// to a console logger at warning level. The first init() replaces that logger.
//
// Usage:
//   zseek::log::init("reader.log", zseek::log::Level::kDebug);
//   ZSEEK_LOG_INFO("Opened {} with {} frames", name, count);
// =============================================================================

#ifndef ZSEEK_COMMON_LOGGER_H
#define ZSEEK_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace zseek::log {

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
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "zseek";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Replaces the console logger created by logger() before init(). Later
///       calls are ignored until shutdown().
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, never null.
/// @note Initializes a console logger at warning level on first use when
///       init() has not been called.
[[nodiscard]] quill::Logger* logger();

/// @brief Check if init() has installed the logger.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Change the minimum level of the global logger.
void setLevel(Level level);

/// @brief Flush all pending log messages.
/// @note Blocks until all messages are written.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert zseek::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace zseek::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define ZSEEK_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(zseek::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define ZSEEK_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(zseek::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define ZSEEK_LOG_INFO(fmt, ...) \
    LOG_INFO(zseek::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define ZSEEK_LOG_WARNING(fmt, ...) \
    LOG_WARNING(zseek::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define ZSEEK_LOG_ERROR(fmt, ...) \
    LOG_ERROR(zseek::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define ZSEEK_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(zseek::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // ZSEEK_COMMON_LOGGER_H
