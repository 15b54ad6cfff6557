// RELIQUARY - Logging System
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks. Governance state
// transitions, rejections and storage failures are all reported here.

#ifndef RELIQUARY_UTIL_LOGGING_H
#define RELIQUARY_UTIL_LOGGING_H

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

namespace reliquary {
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

const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive). Unknown names map to Info.
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

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

/// Which fields a sink prints in front of the message
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

/// Writes to stdout, or stderr for Error and above when useStderr is set
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        LogFormat format;
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
};

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file, rotating it to path.1 .. path.N once it grows
/// past maxSize.
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        bool rotate{true};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };
    
    explicit FileSink(const Config& config);
    ~FileSink() override;
    
    /// Open (or reopen) the configured file
    bool Open();
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
    
    bool OpenLocked();
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

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

/// Process-wide log dispatcher
class Logger {
public:
    static Logger& Instance();
    
    /// Install a default console sink if none has been installed yet
    void Initialize();
    
    /// Flush and drop every sink
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
    std::atomic<bool> allCategoriesEnabled_{true};
    
    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects one message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
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
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Setup
// ============================================================================

/// Logging options as read from configuration
struct LogOptions {
    LogLevel level{LogLevel::Info};
    bool printToConsole{true};
    std::string logFile;
};

/// Replace the logger's sinks according to options.
/// @return false if the log file could not be opened (console output, if
///         requested, is still installed)
bool SetupLogging(const LogOptions& options);

// ============================================================================
// Logging Macros
// ============================================================================

#define RELIQUARY_LOGGER ::reliquary::util::Logger::Instance()

#define RELIQUARY_LOG_ENABLED(level, category) \
    RELIQUARY_LOGGER.WillLog(::reliquary::util::LogLevel::level, category)

#define RELIQUARY_LOG(level, category) \
    if (RELIQUARY_LOG_ENABLED(level, category)) \
        ::reliquary::util::LogStream(::reliquary::util::LogLevel::level, category, \
                                     __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   RELIQUARY_LOG(Trace, category)
#define LOG_DEBUG(category)   RELIQUARY_LOG(Debug, category)
#define LOG_INFO(category)    RELIQUARY_LOG(Info, category)
#define LOG_WARN(category)    RELIQUARY_LOG(Warn, category)
#define LOG_ERROR(category)   RELIQUARY_LOG(Error, category)
#define LOG_FATAL(category)   RELIQUARY_LOG(Fatal, category)

#define LogInfo()   LOG_INFO(::reliquary::util::LogCategory::DEFAULT)
#define LogWarn()   LOG_WARN(::reliquary::util::LogCategory::DEFAULT)
#define LogError()  LOG_ERROR(::reliquary::util::LogCategory::DEFAULT)

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace reliquary

#endif // RELIQUARY_UTIL_LOGGING_H
