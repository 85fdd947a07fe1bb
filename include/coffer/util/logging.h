// COFFER - Logging System
// Copyright (c) 2024 COFFER Developers
// MIT License
//
// Leveled, category-filtered logging with pluggable sinks (console, file,
// callback) and stream-style / printf-style macros.

#ifndef COFFER_UTIL_LOGGING_H
#define COFFER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace coffer {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* TREASURY = "treasury";
    constexpr const char* EFFECT = "effect";
    constexpr const char* CONFIG = "config";
    constexpr const char* SNAPSHOT = "snapshot";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};           // Error and Fatal go to stderr
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

private:
    std::string Format(const LogEntry& entry) const;
    const char* GetColorCode(LogLevel level) const;

    Config config_;
    std::mutex mutex_;
};

/// Appends to a log file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug,
                      bool autoFlush = false);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::string path_;
    std::ofstream file_;
    LogLevel level_;
    bool autoFlush_;
    mutable std::mutex mutex_;
};

/// Forwards entries to a callback
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
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. Starts with no sinks; Initialize() adds a console sink.
class Logger {
public:
    static Logger& Instance();

    /// Add the default console sink (idempotent)
    void Initialize(LogLevel level = LogLevel::Info);

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the named categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    bool allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define COFFER_LOGGER ::coffer::util::Logger::Instance()

#define COFFER_LOG_ENABLED(level, category) \
    COFFER_LOGGER.WillLog(::coffer::util::LogLevel::level, category)

#define COFFER_LOG(level, category) \
    if (COFFER_LOG_ENABLED(level, category)) \
        ::coffer::util::LogStream(::coffer::util::LogLevel::level, category, \
                                  __FILE__, __LINE__)

#define LOG_TRACE(category)   COFFER_LOG(Trace, category)
#define LOG_DEBUG(category)   COFFER_LOG(Debug, category)
#define LOG_INFO(category)    COFFER_LOG(Info, category)
#define LOG_WARN(category)    COFFER_LOG(Warn, category)
#define LOG_ERROR(category)   COFFER_LOG(Error, category)

#define COFFER_LOGF(level, category, ...) \
    do { \
        if (COFFER_LOG_ENABLED(level, category)) { \
            COFFER_LOGGER.LogF(::coffer::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogInfoF(category, ...)   COFFER_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   COFFER_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  COFFER_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp as "YYYY-MM-DD HH:MM:SS.mmm" local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace coffer

#endif // COFFER_UTIL_LOGGING_H
