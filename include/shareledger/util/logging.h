// SHARELEDGER - Logging System
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License
//
// Logging used by every ledger subsystem. Entries carry a level, a
// category and, while a ledger call is executing, the block height of that
// call, so a log can be lined up against the call sequence that produced a
// given state root.

#ifndef SHARELEDGER_UTIL_LOGGING_H
#define SHARELEDGER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace shareledger {
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
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Parse a level name, case-insensitive. Unknown names map to Info.
LogLevel LogLevelFromString(const std::string& str);

/// Parse a level name strictly
std::optional<LogLevel> ParseLogLevel(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* DIVIDEND = "dividend";
    constexpr const char* COMPLIANCE = "compliance";
    constexpr const char* MARKET = "market";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
}

/**
 * Parse per-category levels of the form "governance=debug,db=warn".
 * Whitespace around names is ignored. An empty string yields no entries.
 *
 * @return false on a malformed entry or unknown level; error names it
 */
bool ParseCategoryLevels(const std::string& text,
                         std::map<std::string, LogLevel>& out,
                         std::string& error);

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

    /// Height of the ledger call in progress on the logging thread
    std::optional<uint64_t> height;
};

/// Render an entry as "<time> [LEVEL] [category] h=<height> message"
std::string FormatLogEntry(const LogEntry& entry, bool withTimestamp = true);

// ============================================================================
// Log Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, errors to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool showTimestamp{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool truncate{false};
        bool flushEachEntry{false};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
};

/// Forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : callback_(std::move(callback)), level_(level) {}

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

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Threshold for categories without their own level
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Override the threshold for one category (Off silences it)
    void SetCategoryLevel(const std::string& category, LogLevel level);
    void ClearCategoryLevels();
    LogLevel GetCategoryLevel(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::map<std::string, LogLevel> categoryLevels_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Call Height Scope
// ============================================================================

/**
 * Tags every entry logged on this thread with a block height until the
 * scope ends. Scopes nest; the innermost height wins.
 */
class ScopedLogHeight {
public:
    explicit ScopedLogHeight(uint64_t height);
    ~ScopedLogHeight();

    ScopedLogHeight(const ScopedLogHeight&) = delete;
    ScopedLogHeight& operator=(const ScopedLogHeight&) = delete;

    /// Height tagged on the calling thread, if any
    static std::optional<uint64_t> Current();

private:
    std::optional<uint64_t> previous_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
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

#define SHARELEDGER_LOG(level, category) \
    if (!::shareledger::util::Logger::Instance().WillLog( \
            ::shareledger::util::LogLevel::level, category)) {} \
    else ::shareledger::util::LogStream(::shareledger::util::LogLevel::level, \
                                        category, __FILE__, __LINE__)

#define LOG_TRACE(category)   SHARELEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   SHARELEDGER_LOG(Debug, category)
#define LOG_INFO(category)    SHARELEDGER_LOG(Info, category)
#define LOG_WARN(category)    SHARELEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   SHARELEDGER_LOG(Error, category)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the duration of an operation at Debug level when the scope ends
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation)
        : category_(category)
        , operation_(std::move(operation))
        , start_(std::chrono::steady_clock::now()) {}
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define SHARELEDGER_LOG_TIMER_CAT2(a, b) a##b
#define SHARELEDGER_LOG_TIMER_CAT(a, b) SHARELEDGER_LOG_TIMER_CAT2(a, b)
#define SHARELEDGER_LOG_TIMER(category, operation) \
    ::shareledger::util::ScopedLogTimer \
        SHARELEDGER_LOG_TIMER_CAT(_ledger_timer_, __LINE__)(category, operation)

} // namespace util
} // namespace shareledger

#endif // SHARELEDGER_UTIL_LOGGING_H
