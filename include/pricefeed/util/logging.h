// PRICEFEED - Logging System
// Copyright (c) 2024 PRICEFEED Developers
// MIT License
//
// Provides a flexible logging system with:
// - Multiple log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Console and file output
// - Thread-safe logging
// - Stream-style interface

#ifndef PRICEFEED_UTIL_LOGGING_H
#define PRICEFEED_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace pricefeed {
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

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* ORACLE = "oracle";
    constexpr const char* ADMIN = "admin";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
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
    std::string function;
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

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to console (stdout/stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // Use ANSI color codes on a tty
        bool useStderr{true};           // Write warnings and worse to stderr
        bool stderrOnly{false};         // Write every level to stderr
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        bool showLocation{false};       // Include file:line
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
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Log sink that appends to a file, rotating it once it grows past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024}; // 10 MB
        size_t maxFiles{5};               // Rotated files kept as path.1 .. path.N
        bool rotate{true};
        LogLevel level{LogLevel::Debug};
    };

    FileSink();
    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool Open(const std::string& path);
    void Close();
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }
    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    bool OpenLocked(const std::string& path);
    std::string Format(const LogEntry& entry) const;
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that calls a callback function
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
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

/// Process-wide logger
class Logger {
public:
    static Logger& Instance();

    /// Install the default console sink (once)
    void Initialize();

    /// Flush and remove all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

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
    bool allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper; emits on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    LogStream(LogStream&& other) noexcept;
    LogStream& operator=(LogStream&& other) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

    LogStream& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (active_) {
            manip(stream_);
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define PRICEFEED_LOGGER ::pricefeed::util::Logger::Instance()

#define PRICEFEED_LOG_ENABLED(level, category) \
    PRICEFEED_LOGGER.WillLog(::pricefeed::util::LogLevel::level, category)

#define PRICEFEED_LOG(level, category) \
    if (PRICEFEED_LOG_ENABLED(level, category)) \
        ::pricefeed::util::LogStream(::pricefeed::util::LogLevel::level, category, \
                                     __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   PRICEFEED_LOG(Trace, category)
#define LOG_DEBUG(category)   PRICEFEED_LOG(Debug, category)
#define LOG_INFO(category)    PRICEFEED_LOG(Info, category)
#define LOG_WARN(category)    PRICEFEED_LOG(Warn, category)
#define LOG_ERROR(category)   PRICEFEED_LOG(Error, category)
#define LOG_FATAL(category)   PRICEFEED_LOG(Fatal, category)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// RAII timer that logs the duration of an operation at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace pricefeed

#endif // PRICEFEED_UTIL_LOGGING_H
