// ZEUS - Logging Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace zeus {
namespace util {

// ============================================================================
// Levels and Formatting
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
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return LogLevel::Info;
}

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    
    std::tm tmBuf;
    localtime_r(&secs, &tmBuf);
    
    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream oss;
    if (format.showTimestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    if (format.showLevel) {
        oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    }
    if (format.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (format.showThread) {
        oss << "[" << entry.threadId << "] ";
    }
    if (format.showLocation && !entry.file.empty()) {
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
    
    std::string line = FormatLogEntry(entry, config_.format);
    FILE* out = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.useColors && isatty(fileno(out))) {
        std::fprintf(out, "%s%s\033[0m\n", ColorFor(entry.level), line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

const char* ConsoleSink::ColorFor(LogLevel level) {
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

FileSink::FileSink(const std::string& path) {
    config_.path = path;
    std::lock_guard<std::mutex> lock(mutex_);
    OpenLocked(std::ios::out | std::ios::app);
}

FileSink::FileSink(const Config& config) : config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    OpenLocked(config_.append ? (std::ios::out | std::ios::app) : std::ios::out);
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::OpenLocked(std::ios::openmode mode) {
    if (config_.path.empty()) {
        return;
    }
    file_.open(config_.path, mode);
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        currentSize_ = static_cast<size_t>(file_.tellp());
    }
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    
    std::string line = FormatLogEntry(entry, config_.format);
    line.push_back('\n');
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (config_.maxSize > 0 && currentSize_ + line.size() > config_.maxSize) {
        RotateLocked();
        if (!file_.is_open()) {
            return;
        }
    }
    
    file_ << line;
    currentSize_ += line.size();
    if (config_.autoFlush || entry.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::RotateLocked() {
    file_.close();
    
    // debug.log.(N-1) -> debug.log.N ... debug.log -> debug.log.1
    if (config_.maxFiles > 0) {
        std::string oldest = config_.path + "." + std::to_string(config_.maxFiles);
        std::remove(oldest.c_str());
        for (size_t i = config_.maxFiles; i > 1; --i) {
            std::string from = config_.path + "." + std::to_string(i - 1);
            std::string to = config_.path + "." + std::to_string(i);
            std::rename(from.c_str(), to.c_str());
        }
        std::string first = config_.path + ".1";
        std::rename(config_.path.c_str(), first.c_str());
    }
    
    currentSize_ = 0;
    OpenLocked(std::ios::out | std::ios::trunc);
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level >= level_ && callback_) {
        callback_(entry);
    }
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
    if (!initialized_.exchange(false)) {
        return;
    }
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

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
    allCategoriesEnabled_ = false;
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
    return enabledCategories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    allCategoriesEnabled_ = true;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level >= level_.load() && level != LogLevel::Off &&
           IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message,
                 const char* file, int line, const char* function) {
    if (!WillLog(level, category)) {
        return;
    }
    
    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.function = function ? function : "";
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();
    
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
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

LogStream::LogStream(LogLevel level, const char* category,
                     const char* file, int line, const char* function)
    : level_(level), category_(category), file_(file), line_(line),
      function_(function) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_, function_);
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const char* category, std::string operation)
    : category_(category), operation_(std::move(operation)),
      start_(std::chrono::steady_clock::now()) {}

ScopedLogTimer::~ScopedLogTimer() {
    if (Logger::Instance().WillLog(LogLevel::Debug, category_)) {
        std::ostringstream oss;
        oss << operation_ << " took " << ElapsedMs() << "ms";
        Logger::Instance().Log(LogLevel::Debug, category_, oss.str());
    }
}

int64_t ScopedLogTimer::ElapsedMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
}

} // namespace util
} // namespace zeus
