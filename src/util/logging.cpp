// RELIQUARY - Logging Implementation
// Copyright (c) 2024 RELIQUARY Developers
// MIT License

#include "reliquary/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace reliquary {
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
// Formatting
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

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos != std::string::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format) {
    std::ostringstream oss;
    
    if (format.showTimestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << " ";
    }
    if (format.showLevel) {
        oss << "[" << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    }
    if (format.showCategory && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    if (format.showThread) {
        oss << "[" << entry.threadId << "] ";
    }
    if (format.showLocation && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ":" << entry.line;
        if (!entry.function.empty()) {
            oss << " " << entry.function << "()";
        }
        oss << " ";
    }
    
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

namespace {

const char* ColorCode(LogLevel level) {
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

} // namespace

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    
    std::string line = FormatLogEntry(entry, config_.format);
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    FILE* stream = (config_.useStderr && entry.level >= LogLevel::Error) ? stderr : stdout;
    if (config_.useColors && isatty(fileno(stream))) {
        fprintf(stream, "%s%s\033[0m\n", ColorCode(entry.level), line.c_str());
    } else {
        fprintf(stream, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
    fflush(stderr);
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    if (!config_.path.empty()) {
        Open();
    }
}

FileSink::~FileSink() {
    Close();
}

bool FileSink::Open() {
    std::lock_guard<std::mutex> lock(mutex_);
    return OpenLocked();
}

bool FileSink::OpenLocked() {
    if (file_.is_open()) {
        file_.close();
    }
    
    auto mode = config_.append ? (std::ios::out | std::ios::app) : std::ios::out;
    file_.open(config_.path, mode);
    if (!file_.is_open()) {
        currentSize_ = 0;
        return false;
    }
    
    file_.seekp(0, std::ios::end);
    currentSize_ = static_cast<size_t>(file_.tellp());
    return true;
}

void FileSink::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    
    std::string line = FormatLogEntry(entry, config_.format);
    line += "\n";
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    
    if (config_.rotate && currentSize_ >= config_.maxSize) {
        Rotate();
        if (!file_.is_open()) {
            return;
        }
    }
    
    file_ << line;
    currentSize_ += line.size();
    
    if (config_.autoFlush) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::Rotate() {
    file_.close();
    
    // path.N is dropped, path.(i) becomes path.(i+1), path becomes path.1
    std::string oldest = config_.path + "." + std::to_string(config_.maxFiles);
    std::remove(oldest.c_str());
    for (size_t i = config_.maxFiles; i > 1; --i) {
        std::string from = config_.path + "." + std::to_string(i - 1);
        std::string to = config_.path + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }
    std::string first = config_.path + ".1";
    std::rename(config_.path.c_str(), first.c_str());
    
    file_.open(config_.path, std::ios::out | std::ios::trunc);
    currentSize_ = 0;
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
    if (SinkCount() == 0) {
        AddSink(std::make_shared<ConsoleSink>());
    }
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
    return enabledCategories_.count(category) > 0;
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    allCategoriesEnabled_.store(true);
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
                     const char* file, int line, const char* function)
    : level_(level)
    , category_(category)
    , file_(file)
    , line_(line)
    , function_(function)
    , active_(Logger::Instance().WillLog(level, category)) {}

LogStream::~LogStream() {
    if (active_) {
        Logger::Instance().Log(level_, category_, stream_.str(),
                               file_, line_, function_);
    }
}

// ============================================================================
// Logging Setup
// ============================================================================

bool SetupLogging(const LogOptions& options) {
    Logger& logger = Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(options.level);
    
    if (options.printToConsole) {
        ConsoleSink::Config console;
        console.level = options.level;
        logger.AddSink(std::make_shared<ConsoleSink>(console));
    }
    
    bool ok = true;
    if (!options.logFile.empty()) {
        FileSink::Config file;
        file.path = options.logFile;
        file.level = options.level;
        auto sink = std::make_shared<FileSink>(file);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            ok = false;
        }
    }
    
    if (!ok) {
        LOG_WARN(LogCategory::DEFAULT) << "Could not open log file " << options.logFile;
    }
    return ok;
}

} // namespace util
} // namespace reliquary
