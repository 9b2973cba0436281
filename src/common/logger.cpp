// =============================================================================
// autoclaved-reader - Logger Module Implementation
// =============================================================================
// Asynchronous logging through Quill. Diagnostics never go to stdout,
// which carries record and report bytes in the CLI.
// =============================================================================

#include "acr/common/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace acr::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

/// @brief Name of the single process-wide logger.
constexpr const char* kLoggerName = "acr";

/// @brief Name of the stderr sink; StreamSink treats "stderr" as std::cerr.
constexpr const char* kStderrSinkName = "stderr";

/// @brief Global logger instance pointer.
/// @note Read by the ACR_LOG_* macros without taking gInitMutex.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Flag indicating if the logger has been initialized.
std::atomic<bool> gInitialized{false};

/// @brief Serializes init() and shutdown().
std::mutex gInitMutex;

/// @brief Convert string to lowercase for case-insensitive comparison.
std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/// @brief Append-mode file sink, so repeated runs share one log file.
std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    quill::FileSinkConfig fileSinkConfig;
    fileSinkConfig.set_open_mode('a');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileSinkConfig,
                                                                quill::FileEventNotifier{});
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

    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "info") {
        return Level::kInfo;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical" || lower == "fatal") {
        return Level::kCritical;
    }

    // Unknown names fall back to info
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

Level levelForVerbosity(Level configured, int verbosity) noexcept {
    Level requested = configured;
    if (verbosity >= 2) {
        requested = Level::kDebug;
    } else if (verbosity == 1) {
        requested = Level::kInfo;
    }
    return std::min(configured, requested);
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);

    // Later calls keep the first configuration
    if (gInitialized.load(std::memory_order_acquire)) {
        return;
    }

    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::StreamSink>(
            kStderrSinkName, std::filesystem::path{kStderrSinkName}));
    }
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }

    quill::Logger* loggerPtr = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));

    gLogger.store(loggerPtr, std::memory_order_release);
    gInitialized.store(true, std::memory_order_release);
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
    return gInitialized.load(std::memory_order_acquire);
}

void flush() {
    if (isInitialized()) {
        quill::Logger* loggerPtr = logger();
        if (loggerPtr != nullptr) {
            loggerPtr->flush_log();
        }
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (!isInitialized()) {
        return;
    }

    flush();
    quill::Backend::stop();

    gLogger.store(nullptr, std::memory_order_release);
    gInitialized.store(false, std::memory_order_release);
}

}  // namespace acr::log
