// AEGIS - Logging System
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Leveled, categorised logging for the controller:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Per-subsystem categories that can be switched on and off
// - Console, file and callback sinks
// - Stream-style macros: LOG_WARN(LogCategory::UPDATE) << "...";

#ifndef AEGIS_UTIL_LOGGING_H
#define AEGIS_UTIL_LOGGING_H

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

namespace aegis {
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

/// Parse log level from string (unknown strings map to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* ADMISSION = "admission";
    constexpr const char* UPDATE = "update";
    constexpr const char* KEYS = "keys";
    constexpr const char* SCRIPT = "script";
    constexpr const char* EVENTS = "events";
    constexpr const char* CONFIG = "config";
    constexpr const char* CRYPTO = "crypto";
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
    std::thread::id threadId;
};

// ============================================================================
// Sinks
// ============================================================================

/// Destination for formatted log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, or stderr for errors when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};           // Errors and above go to stderr
        bool showTimestamp{true};
        bool showCategory{true};
        bool showLocation{false};
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

    const char* ColorFor(LogLevel level) const;
};

/// Appends to a log file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

/// Forwards entries to a callback (used by tests and embedding hosts)
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

class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    /// Install the default console sink once
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();
    void DisableAllCategories();

    /// Dispatch a message to every sink
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    /// Check if a message would be logged
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
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
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
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define AEGIS_LOGGER ::aegis::util::Logger::Instance()

#define AEGIS_LOG_ENABLED(level, category) \
    AEGIS_LOGGER.WillLog(::aegis::util::LogLevel::level, category)

#define AEGIS_LOG(level, category) \
    if (!AEGIS_LOG_ENABLED(level, category)) {} else \
        ::aegis::util::LogStream(::aegis::util::LogLevel::level, category, \
                                 __FILE__, __LINE__)

#define LOG_TRACE(category)   AEGIS_LOG(Trace, category)
#define LOG_DEBUG(category)   AEGIS_LOG(Debug, category)
#define LOG_INFO(category)    AEGIS_LOG(Info, category)
#define LOG_WARN(category)    AEGIS_LOG(Warn, category)
#define LOG_ERROR(category)   AEGIS_LOG(Error, category)
#define LOG_FATAL(category)   AEGIS_LOG(Fatal, category)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the wall time of a scope at DEBUG level
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging ("2024-01-15 10:30:00.123")
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

/// Render an entry as a single line
std::string FormatLogEntry(const LogEntry& entry, bool showTimestamp,
                           bool showCategory, bool showLocation);

} // namespace util
} // namespace aegis

#endif // AEGIS_UTIL_LOGGING_H
