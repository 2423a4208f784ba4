// ZEUS - Logging System
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Leveled, categorized logging shared by the validator and miner daemons.
// - Levels TRACE through FATAL, global threshold plus per-sink threshold
// - Categories per protocol component for filtering
// - Console, rotating file and callback sinks
// - Stream-style and printf-style macros

#ifndef ZEUS_UTIL_LOGGING_H
#define ZEUS_UTIL_LOGGING_H

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

namespace zeus {
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
    constexpr const char* CHALLENGE = "challenge";   // generation and dispatch
    constexpr const char* DIFFICULTY = "difficulty"; // per-miner target changes
    constexpr const char* VERIFY = "verify";         // proof verification
    constexpr const char* SCORE = "score";
    constexpr const char* WEIGHTS = "weights";       // epoch aggregation/export
    constexpr const char* DEVICE = "device";         // DeviceLink and hardware health
    constexpr const char* RESPONDER = "responder";
    constexpr const char* NET = "net";
    constexpr const char* DB = "db";
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
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Which fields a sink renders in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

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

/// Writes to stdout, optionally routing errors to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        LogFormat format;
        bool useColors{true};
        bool useStderr{false};
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
    
    static const char* ColorFor(LogLevel level);
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file, rotating it to path.1 .. path.N by size
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        LogFormat format{true, true, true, true, true};
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogLevel level{LogLevel::Debug};
    };
    
    explicit FileSink(const std::string& path);
    explicit FileSink(const Config& config);
    ~FileSink() override;
    
    bool IsOpen() const;
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }
    
    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};
    
    void OpenLocked(std::ios::openmode mode);
    void RotateLocked();
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Forwards entries to a function (used by tests to capture output)
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
    static Logger& Instance();
    
    /// Install a default console sink (idempotent)
    void Initialize();
    
    /// Flush and drop all sinks
    void Shutdown();
    
    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;
    
    void SetLevel(LogLevel level) { level_.store(level); }
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
    Logger() = default;
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

/// Collects a streamed message and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category,
              const char* file, int line, const char* function);
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
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define ZEUS_LOGGER ::zeus::util::Logger::Instance()

#define ZEUS_LOG_ENABLED(level, category) \
    ZEUS_LOGGER.WillLog(::zeus::util::LogLevel::level, category)

#define ZEUS_LOG(level, category) \
    if (!ZEUS_LOG_ENABLED(level, category)) {} else \
        ::zeus::util::LogStream(::zeus::util::LogLevel::level, category, \
                                __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   ZEUS_LOG(Trace, category)
#define LOG_DEBUG(category)   ZEUS_LOG(Debug, category)
#define LOG_INFO(category)    ZEUS_LOG(Info, category)
#define LOG_WARN(category)    ZEUS_LOG(Warn, category)
#define LOG_ERROR(category)   ZEUS_LOG(Error, category)
#define LOG_FATAL(category)   ZEUS_LOG(Fatal, category)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the duration of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();
    
    /// Elapsed milliseconds since construction
    int64_t ElapsedMs() const;

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define ZEUS_LOG_CONCAT_INNER(a, b) a##b
#define ZEUS_LOG_CONCAT(a, b) ZEUS_LOG_CONCAT_INNER(a, b)
#define ZEUS_LOG_TIMER(category, operation) \
    ::zeus::util::ScopedLogTimer ZEUS_LOG_CONCAT(zeus_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Strip directories from a source path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace zeus

#endif // ZEUS_UTIL_LOGGING_H
