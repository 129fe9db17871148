// SEMAPHORE - Logging
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Diagnostics for the library. Each record belongs to one functional area
// (identity, group, proof, config) and every area can have its own
// threshold. Nothing is printed until a sink is installed.
//
// Identity secrets must never reach the logger: callers log commitments,
// sizes, depths and timings only.

#ifndef SEMAPHORE_UTIL_LOGGING_H
#define SEMAPHORE_UTIL_LOGGING_H

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace semaphore {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelName(LogLevel level);

/// Case-insensitive; accepts "warning" and "none" as aliases.
/// Returns nullopt for any other name.
std::optional<LogLevel> ParseLogLevel(const std::string& name);

enum class LogCategory {
    Identity = 0,
    Group = 1,
    Proof = 2,
    Config = 3
};

constexpr size_t NUM_LOG_CATEGORIES = 4;

const char* LogCategoryName(LogCategory category);

/// Lowercase names as returned by LogCategoryName
std::optional<LogCategory> ParseLogCategory(const std::string& name);

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level{LogLevel::Info};
    LogCategory category{LogCategory::Proof};
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// Destination for records that passed the logger's thresholds
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

/// "2024-05-01 12:00:00.123 [DEBUG] proof: message" on stderr
class StderrSink : public ILogSink {
public:
    void Write(const LogRecord& record) override;

    static std::string Format(const LogRecord& record);

private:
    std::mutex mutex_;
};

/// Hands records to a callback; lets embedders route output elsewhere
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    void Write(const LogRecord& record) override {
        if (callback_) {
            callback_(record);
        }
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);

    /// Install or remove the shared StderrSink
    void SetStderrOutput(bool enabled);

    /// Threshold for every category without an override
    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Per-category threshold, taking precedence over the global one
    void SetLevel(LogCategory category, LogLevel level);
    void ClearCategoryLevels();

    bool Enabled(LogLevel level, LogCategory category) const;

    void Write(LogLevel level, LogCategory category, const std::string& message,
               const char* file = nullptr, int line = 0);

private:
    Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static constexpr int NO_OVERRIDE = -1;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::array<std::atomic<int>, NUM_LOG_CATEGORIES> categoryLevels_;

    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::shared_ptr<ILogSink> stderrSink_;
};

// ============================================================================
// Stream Front End
// ============================================================================

/// Builds one record and writes it when the statement ends
class LogStream {
public:
    LogStream(LogLevel level, LogCategory category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Write(level_, category_, stream_.str(), file_, line_);
    }

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
    LogCategory category_;
    const char* file_;
    int line_;
};

#define SEMAPHORE_LOG(level, category) \
    if (!::semaphore::util::Logger::Instance().Enabled( \
            ::semaphore::util::LogLevel::level, category)) {} else \
        ::semaphore::util::LogStream(::semaphore::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category) SEMAPHORE_LOG(Trace, category)
#define LOG_DEBUG(category) SEMAPHORE_LOG(Debug, category)
#define LOG_INFO(category)  SEMAPHORE_LOG(Info, category)
#define LOG_WARN(category)  SEMAPHORE_LOG(Warn, category)
#define LOG_ERROR(category) SEMAPHORE_LOG(Error, category)

// ============================================================================
// Timing
// ============================================================================

/// Logs "<operation> took <n>ms" at Debug level when the scope ends
class ScopedLogTimer {
public:
    ScopedLogTimer(LogCategory category, std::string operation)
        : category_(category)
        , operation_(std::move(operation))
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedLogTimer();

    int64_t ElapsedMillis() const;

private:
    LogCategory category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace util
} // namespace semaphore

#endif // SEMAPHORE_UTIL_LOGGING_H
