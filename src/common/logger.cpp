// =============================================================================
// blkstore - Logger Module Implementation
// =============================================================================
// Quill-backed global logger. The library never calls init() itself; the CLI
// does so from main() once options are parsed.
// =============================================================================

#include "blkstore/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace blkstore::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

/// @brief Global logger instance pointer, published after initialization.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes init() and shutdown().
std::mutex gInitMutex;

/// @brief Name/level pairs accepted by levelFromString().
constexpr std::array<std::pair<std::string_view, Level>, 8> kLevelNames = {{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"warn", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
    {"fatal", Level::kCritical},
}};

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

// =============================================================================
// Level Conversion Implementation
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    const std::string lower = toLower(levelStr);
    for (const auto& [name, level] : kLevelNames) {
        if (lower == name) {
            return level;
        }
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
    }
    return "info";
}

Level levelFromVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    if (verbosity == 1) {
        return Level::kDebug;
    }
    return Level::kInfo;
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::BackendOptions backendOptions;
    backendOptions.thread_name = "blkstore-log";
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    // Console is also the fallback when nothing else was requested.
    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (!config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('a');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{}));
    }

    quill::Logger* loggerPtr = quill::Frontend::create_or_get_logger(config.loggerName,
                                                                     std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

// =============================================================================
// Logger Access Implementation
// =============================================================================

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* loggerPtr = logger()) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);

    if (quill::Logger* loggerPtr = gLogger.exchange(nullptr, std::memory_order_acq_rel)) {
        loggerPtr->flush_log();
        quill::Backend::stop();
    }
}

}  // namespace blkstore::log
