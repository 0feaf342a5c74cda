// VELEDGER - Logging System
// Copyright (c) 2024 VELEDGER Developers
// MIT License
//
// Leveled, categorized logging for the ledger:
// - Levels TRACE..FATAL with a global threshold
// - Per-category filtering (escrow, checkpoint, delegation, ...)
// - Console, file and callback sinks
// - Stream-style macros

#ifndef VELEDGER_UTIL_LOGGING_H
#define VELEDGER_UTIL_LOGGING_H

#include "veledger/core/types.h"

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

namespace veledger {
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
    constexpr const char* ESCROW = "escrow";
    constexpr const char* CHECKPOINT = "checkpoint";
    constexpr const char* DELEGATION = "delegation";
    constexpr const char* REWARDS = "rewards";
    constexpr const char* ASSET = "asset";
    constexpr const char* NODE = "node";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* CRYPTO = "crypto";
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
        bool useStderr{true};
        bool showTimestamp{true};
        bool showLevel{true};
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

    std::string Format(const LogEntry& entry) const;
    const char* GetColorCode(LogLevel level) const;
};

/// Appends to a log file (debug.log in the data directory)
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        bool showLocation{true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const std::string& path);
    explicit FileSink(const Config& config);
    ~FileSink() override;

    /// Open (or reopen) the log file
    bool Open(const std::string& path);

    void Close();

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
};

/// Forwards entries to a callback (used by tests to capture output)
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

    /// Apply a comma separated -debug= list ("escrow,rewards", "all", "1")
    void ApplyDebugCategories(const std::string& list);

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

/// Collects a message and hands it to the logger on destruction
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

    /// 128-bit amounts have no ostream operator
    LogStream& operator<<(Amount value) {
        if (active_) {
            stream_ << AmountToString(value);
        }
        return *this;
    }

    LogStream& operator<<(const Address& addr) {
        if (active_) {
            stream_ << "0x" << addr.ToHex();
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

#define VELEDGER_LOGGER ::veledger::util::Logger::Instance()

#define VELEDGER_LOG_ENABLED(level, category) \
    VELEDGER_LOGGER.WillLog(::veledger::util::LogLevel::level, category)

#define VELEDGER_LOG(level, category) \
    if (VELEDGER_LOG_ENABLED(level, category)) \
        ::veledger::util::LogStream(::veledger::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   VELEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   VELEDGER_LOG(Debug, category)
#define LOG_INFO(category)    VELEDGER_LOG(Info, category)
#define LOG_WARN(category)    VELEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   VELEDGER_LOG(Error, category)
#define LOG_FATAL(category)   VELEDGER_LOG(Fatal, category)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format wall-clock time for log lines
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace veledger

#endif // VELEDGER_UTIL_LOGGING_H
