// =============================================================================
// blkstore - Logger Module
// =============================================================================
// Process-wide asynchronous logger built on Quill, writing to the console
// and/or an append-mode log file.
//
// The library logs through the BLKSTORE_LOG_* macros. They are no-ops until
// init() has been called, so embedding applications and unit tests do not
// need to bring up the Quill backend.
//
// Usage:
//   blkstore::log::init("fetch.log", blkstore::log::Level::kInfo);
//   BLKSTORE_LOG_INFO("Fetched block {} ({} bytes)", path, size);
// =============================================================================

#ifndef BLKSTORE_COMMON_LOGGER_H
#define BLKSTORE_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace blkstore::log {

// =============================================================================
// Levels and Configuration
// =============================================================================

/// @brief Severity, ordered from most to least verbose.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

struct Config {
    /// @brief File the log is appended to; empty logs to the console only.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Also log to stderr. Always on when logFile is empty.
    bool enableConsole = true;

    std::string loggerName = "blkstore";
};

// =============================================================================
// Global Logger
// =============================================================================

/// @brief Start the Quill backend and create the global logger.
/// @note Later calls are ignored until shutdown().
void init(const Config& config);

/// @brief Shorthand for init(Config) with a file and a level.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief The global logger, or nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued messages have reached the sinks.
void flush();

/// @brief Flush, detach the global logger and stop the backend thread.
void shutdown();

// =============================================================================
// Level Helpers
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name (case-insensitive); unknown names give kInfo.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Map CLI verbosity flags to a level.
/// @param verbosity Number of -v flags given.
/// @param quiet Whether -q was given (wins over verbosity).
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace blkstore::log

// =============================================================================
// Logging Macros
// =============================================================================

/// @brief Dispatch to a Quill macro only when the global logger exists.
#define BLKSTORE_LOG_IMPL(QUILL_MACRO, fmt, ...)                                   \
    do {                                                                           \
        if (quill::Logger* blkstoreLogger_ = blkstore::log::logger()) {            \
            QUILL_MACRO(blkstoreLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                          \
    } while (false)

/// @brief Log a trace message.
#define BLKSTORE_LOG_TRACE(fmt, ...) BLKSTORE_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define BLKSTORE_LOG_DEBUG(fmt, ...) BLKSTORE_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define BLKSTORE_LOG_INFO(fmt, ...) BLKSTORE_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define BLKSTORE_LOG_WARNING(fmt, ...) \
    BLKSTORE_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define BLKSTORE_LOG_ERROR(fmt, ...) BLKSTORE_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define BLKSTORE_LOG_CRITICAL(fmt, ...) \
    BLKSTORE_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // BLKSTORE_COMMON_LOGGER_H
