// SEMAPHORE - Logging Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace semaphore {
namespace util {

namespace {

std::string Lowercase(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
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

} // namespace

// ============================================================================
// Names
// ============================================================================

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
    std::string lower = Lowercase(name);
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return std::nullopt;
}

const char* LogCategoryName(LogCategory category) {
    switch (category) {
        case LogCategory::Identity: return "identity";
        case LogCategory::Group:    return "group";
        case LogCategory::Proof:    return "proof";
        case LogCategory::Config:   return "config";
    }
    return "unknown";
}

std::optional<LogCategory> ParseLogCategory(const std::string& name) {
    for (size_t i = 0; i < NUM_LOG_CATEGORIES; ++i) {
        auto category = static_cast<LogCategory>(i);
        if (name == LogCategoryName(category)) {
            return category;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

std::string StderrSink::Format(const LogRecord& record) {
    std::ostringstream oss;
    oss << FormatTimestamp(record.timestamp) << " ["
        << LogLevelName(record.level) << "] "
        << LogCategoryName(record.category) << ": " << record.message;
    return oss.str();
}

void StderrSink::Write(const LogRecord& record) {
    std::string line = Format(record);
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", line.c_str());
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    ClearCategoryLevels();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::SetStderrOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    if (enabled && !stderrSink_) {
        stderrSink_ = std::make_shared<StderrSink>();
        sinks_.push_back(stderrSink_);
    } else if (!enabled && stderrSink_) {
        sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), stderrSink_), sinks_.end());
        stderrSink_.reset();
    }
}

void Logger::SetLevel(LogLevel level) {
    level_.store(level);
}

void Logger::SetLevel(LogCategory category, LogLevel level) {
    categoryLevels_[static_cast<size_t>(category)].store(static_cast<int>(level));
}

void Logger::ClearCategoryLevels() {
    for (auto& level : categoryLevels_) {
        level.store(NO_OVERRIDE);
    }
}

bool Logger::Enabled(LogLevel level, LogCategory category) const {
    if (level == LogLevel::Off) {
        return false;
    }
    int threshold = categoryLevels_[static_cast<size_t>(category)].load();
    if (threshold == NO_OVERRIDE) {
        threshold = static_cast<int>(level_.load());
    }
    return static_cast<int>(level) >= threshold;
}

void Logger::Write(LogLevel level, LogCategory category, const std::string& message,
                   const char* file, int line) {
    if (!Enabled(level, category)) {
        return;
    }

    LogRecord record;
    record.level = level;
    record.category = category;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(record);
    }
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::~ScopedLogTimer() {
    Logger& logger = Logger::Instance();
    if (logger.Enabled(LogLevel::Debug, category_)) {
        logger.Write(LogLevel::Debug, category_,
                     operation_ + " took " + std::to_string(ElapsedMillis()) + "ms");
    }
}

int64_t ScopedLogTimer::ElapsedMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
}

} // namespace util
} // namespace semaphore
