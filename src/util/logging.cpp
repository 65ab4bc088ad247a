// AEGIS - Logging Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace aegis {
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
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;

    return LogLevel::Info;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tmBuf;
    localtime_r(&time, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string FormatLogEntry(const LogEntry& entry, bool showTimestamp,
                           bool showCategory, bool showLocation) {
    std::ostringstream oss;
    if (showTimestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (showLocation && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ':' << entry.line << ' ';
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::string line = FormatLogEntry(entry, config_.showTimestamp,
                                      config_.showCategory, config_.showLocation);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;
    if (config_.useColors && isatty(fileno(stream))) {
        fprintf(stream, "%s%s\033[0m\n", ColorFor(entry.level), line.c_str());
    } else {
        fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    fflush(stderr);
}

const char* ConsoleSink::ColorFor(LogLevel level) const {
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
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : path_(path), file_(path, std::ios::out | std::ios::app), level_(level) {}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }
    std::string line = FormatLogEntry(entry, true, true, true);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CallbackSink
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
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

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
    Flush();
    ClearSinks();
    initialized_.store(false);
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

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    if (allCategoriesEnabled_) {
        // Switching from "everything" to an explicit allow-list
        allCategoriesEnabled_ = false;
        enabledCategories_ = {
            LogCategory::DEFAULT, LogCategory::ADMISSION, LogCategory::UPDATE,
            LogCategory::KEYS, LogCategory::SCRIPT, LogCategory::EVENTS,
            LogCategory::CONFIG, LogCategory::CRYPTO
        };
    }
    enabledCategories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return allCategoriesEnabled_ || enabledCategories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    allCategoriesEnabled_ = true;
    enabledCategories_.clear();
}

void Logger::DisableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    allCategoriesEnabled_ = false;
    enabledCategories_.clear();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level < level_.load() || level == LogLevel::Off) {
        return false;
    }
    return IsCategoryEnabled(category);
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

    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(LogLevel level, const char* category, const char* file, int line)
    : level_(level), category_(category), file_(file), line_(line) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const char* category, std::string operation)
    : category_(category), operation_(std::move(operation)),
      start_(std::chrono::steady_clock::now()) {}

ScopedLogTimer::~ScopedLogTimer() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);
    LOG_DEBUG(category_) << operation_ << " took " << elapsed.count() << "us";
}

} // namespace util
} // namespace aegis
