// CHAINSYNC - Logging Implementation
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/util/logging.h>

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace chainsync {
namespace util {

// ============================================================================
// Log Level Functions
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF")   return LogLevel::Off;

    return LogLevel::Info;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string FixedWidth(const std::string& str, size_t width, char pad) {
    if (str.length() >= width) {
        return str.substr(0, width);
    }
    return str + std::string(width - str.length(), pad);
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string formatted = Format(entry);

    std::lock_guard<std::mutex> lock(mutex_);

    FILE* stream = stdout;
    if (config_.useStderr && entry.level >= LogLevel::Error) {
        stream = stderr;
    }

    if (config_.useColors && isatty(fileno(stream))) {
        fprintf(stream, "%s%s\033[0m\n", GetColorCode(entry.level), formatted.c_str());
    } else {
        fprintf(stream, "%s\n", formatted.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    fflush(stderr);
}

std::string ConsoleSink::Format(const LogEntry& entry) const {
    std::ostringstream oss;

    if (config_.showTimestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << " ";
    }

    oss << "[" << FixedWidth(LogLevelToString(entry.level), 5) << "] ";

    if (config_.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }

    if (config_.showLocation && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ":" << entry.line << " ";
    }

    oss << entry.message;

    return oss.str();
}

const char* ConsoleSink::GetColorCode(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "\033[0m";
    }
}

// ============================================================================
// CallbackSink Implementation
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level < level_ || !callback_) {
        return;
    }
    callback_(entry);
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    Shutdown();
}

void Logger::Initialize() {
    if (initialized_.exchange(true)) {
        return;
    }
    AddSink(std::make_shared<ConsoleSink>());
}

void Logger::Shutdown() {
    initialized_.store(false);
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::SetLevel(LogLevel level) {
    level_.store(level);
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
    allCategoriesEnabled_.store(false);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategoriesEnabled_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.find(category) != enabledCategories_.end();
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    allCategoriesEnabled_.store(true);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    char buffer[4096];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level, const std::string& category,
                     const char* file, int line)
    : level_(level)
    , category_(category)
    , file_(file)
    , line_(line)
    , active_(Logger::Instance().WillLog(level, category)) {}

LogStream::~LogStream() {
    if (active_) {
        Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
    }
}

} // namespace util
} // namespace chainsync
