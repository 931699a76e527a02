// CHAINSYNC - Logging System
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License
//
// Provides the logging system used by every component:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Categories for filtering (rpc, zmq, cache, sync, ...)
// - Console and callback sinks
// - Printf-style and stream-style interfaces

#ifndef CHAINSYNC_UTIL_LOGGING_H
#define CHAINSYNC_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace chainsync {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Debug information
    Info = 2,    // General information
    Warn = 3,    // Warnings
    Error = 4,   // Errors
    Fatal = 5,   // Fatal errors
    Off = 6      // Disable logging
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* RPC = "rpc";
    constexpr const char* ZMQ = "zmq";
    constexpr const char* CACHE = "cache";
    constexpr const char* PROVIDER = "provider";
    constexpr const char* SYNC = "sync";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

/// A single log entry
struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Write a log entry
    virtual void Write(const LogEntry& entry) = 0;

    /// Flush any buffered output
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to stdout/stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{false};          // Errors go to stderr
        bool showTimestamp{true};
        bool showCategory{true};
        bool showLocation{false};       // file:line
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

    /// Format entry for output (exposed for tests)
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Set global minimum log level
    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    /// Log a message
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper, emits on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define CHAINSYNC_LOGGER ::chainsync::util::Logger::Instance()

#define CHAINSYNC_LOG_ENABLED(level, category) \
    CHAINSYNC_LOGGER.WillLog(::chainsync::util::LogLevel::level, category)

#define CHAINSYNC_LOG(level, category) \
    if (CHAINSYNC_LOG_ENABLED(level, category)) \
        ::chainsync::util::LogStream(::chainsync::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category)   CHAINSYNC_LOG(Trace, category)
#define LOG_DEBUG(category)   CHAINSYNC_LOG(Debug, category)
#define LOG_INFO(category)    CHAINSYNC_LOG(Info, category)
#define LOG_WARN(category)    CHAINSYNC_LOG(Warn, category)
#define LOG_ERROR(category)   CHAINSYNC_LOG(Error, category)
#define LOG_FATAL(category)   CHAINSYNC_LOG(Fatal, category)

/// Printf-style logging
#define CHAINSYNC_LOGF(level, category, ...) \
    do { \
        if (CHAINSYNC_LOG_ENABLED(level, category)) { \
            CHAINSYNC_LOGGER.LogF(::chainsync::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  CHAINSYNC_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   CHAINSYNC_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   CHAINSYNC_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  CHAINSYNC_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace chainsync

#endif // CHAINSYNC_UTIL_LOGGING_H
