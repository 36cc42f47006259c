// SHARELEDGER - Logging Implementation
// Copyright (c) 2024 SHARELEDGER Developers
// MIT License

#include "shareledger/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace shareledger {
namespace util {

namespace {

thread_local std::optional<uint64_t> tlsCallHeight;

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t");
    return str.substr(start, end - start + 1);
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
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

const char* ColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "\033[0m";
    }
}

} // namespace

// ============================================================================
// Levels and Categories
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    std::string upper = Trim(str);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO")  return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;
    return std::nullopt;
}

LogLevel LogLevelFromString(const std::string& str) {
    return ParseLogLevel(str).value_or(LogLevel::Info);
}

bool ParseCategoryLevels(const std::string& text,
                         std::map<std::string, LogLevel>& out,
                         std::string& error) {
    std::map<std::string, LogLevel> parsed;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        if (Trim(item).empty()) {
            continue;
        }
        size_t eq = item.find('=');
        if (eq == std::string::npos) {
            error = "expected category=level, got '" + Trim(item) + "'";
            return false;
        }
        std::string category = Trim(item.substr(0, eq));
        auto level = ParseLogLevel(item.substr(eq + 1));
        if (category.empty() || !level) {
            error = "invalid category level '" + Trim(item) + "'";
            return false;
        }
        parsed[category] = *level;
    }
    out = std::move(parsed);
    return true;
}

std::string FormatLogEntry(const LogEntry& entry, bool withTimestamp) {
    std::ostringstream oss;
    if (withTimestamp) {
        oss << FormatTimestamp(entry.timestamp) << " ";
    }
    oss << "[" << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    if (entry.height) {
        oss << "h=" << *entry.height << " ";
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    std::string line = FormatLogEntry(entry, config_.showTimestamp);

    std::lock_guard<std::mutex> lock(mutex_);
    FILE* stream = entry.level >= LogLevel::Error ? stderr : stdout;
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

FileSink::FileSink(const Config& config) : config_(config) {
    auto mode = config_.truncate ? (std::ios::out | std::ios::trunc)
                                 : (std::ios::out | std::ios::app);
    file_.open(config_.path, mode);
}

FileSink::~FileSink() {
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
    std::string line = FormatLogEntry(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    file_ << line << '\n';
    if (config_.flushEachEntry) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

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
    Flush();
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

void Logger::SetCategoryLevel(const std::string& category, LogLevel level) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categoryLevels_[category] = level;
}

void Logger::ClearCategoryLevels() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categoryLevels_.clear();
}

LogLevel Logger::GetCategoryLevel(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    auto it = categoryLevels_.find(category);
    return it == categoryLevels_.end() ? level_.load() : it->second;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off) {
        return false;
    }
    LogLevel threshold = GetCategoryLevel(category);
    return threshold != LogLevel::Off && level >= threshold;
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
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
    entry.height = tlsCallHeight;

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
// Scopes
// ============================================================================

ScopedLogHeight::ScopedLogHeight(uint64_t height) : previous_(tlsCallHeight) {
    tlsCallHeight = height;
}

ScopedLogHeight::~ScopedLogHeight() {
    tlsCallHeight = previous_;
}

std::optional<uint64_t> ScopedLogHeight::Current() {
    return tlsCallHeight;
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

ScopedLogTimer::~ScopedLogTimer() {
    auto& logger = Logger::Instance();
    if (!logger.WillLog(LogLevel::Debug, category_)) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_);
    std::ostringstream oss;
    oss << operation_ << " took " << elapsed.count() << "us";
    logger.Log(LogLevel::Debug, category_, oss.str());
}

} // namespace util
} // namespace shareledger
