// =============================================================================
// zseek - Logger Module Implementation
// =============================================================================

#include "zseek/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace zseek::log {

namespace {

// =============================================================================
// Global State
// =============================================================================

/// @brief Name of the console logger created on first use without init().
constexpr std::string_view kImplicitLoggerName = "zseek.implicit";

std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Set once init() has installed the logger; cleared by shutdown().
std::atomic<bool> gInitialized{false};

std::mutex gInitMutex;

/// @brief Create sinks and logger. Caller holds gInitMutex.
quill::Logger* createLogger(const Config& config) {
    quill::BackendOptions backendOptions;
    quill::Backend::start(backendOptions);

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (!config.logFile.empty()) {
        auto fileSink = quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile,
            []() {
                quill::FileSinkConfig fileSinkConfig;
                fileSinkConfig.set_open_mode('a');
                return fileSinkConfig;
            }(),
            quill::FileEventNotifier{});
        sinks.push_back(fileSink);
    }

    // A logger without sinks would drop everything, fall back to the console
    if (sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));
    return loggerPtr;
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
        default:
            return quill::LogLevel::Info;
    }
}

// =============================================================================
// Logger Initialization Implementation
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gInitialized.load(std::memory_order_acquire)) {
        return;
    }

    // Replaces the implicit logger, which stays registered for threads that
    // already hold it but receives no new statements.
    gLogger.store(createLogger(config), std::memory_order_release);
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

quill::Logger* logger() {
    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr != nullptr) {
        return loggerPtr;
    }

    std::lock_guard<std::mutex> lock(gInitMutex);
    loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr == nullptr) {
        Config config;
        config.level = Level::kWarning;
        config.loggerName = std::string(kImplicitLoggerName);
        loggerPtr = createLogger(config);
        gLogger.store(loggerPtr, std::memory_order_release);
    }
    return loggerPtr;
}

bool isInitialized() noexcept {
    return gInitialized.load(std::memory_order_acquire);
}

void setLevel(Level level) {
    logger()->set_log_level(toQuillLevel(level));
}

void flush() {
    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr != nullptr) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        flush();
        quill::Backend::stop();
        gLogger.store(nullptr, std::memory_order_release);
        gInitialized.store(false, std::memory_order_release);
    }
}

}  // namespace zseek::log
