#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_gateway {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// Abstract log sink — implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Console sink — human-readable timestamped lines (stderr by default).
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// JSON sink — machine-readable JSON lines to a stream.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// ---------------------------------------------------------------------------
// DiagnosticTapSink — forwards every record to an inner sink and hands
// session-related lines ("session", "mcp-session-id", "messages") to an
// observer. Passive session discovery hooks in here.
//
// The observer must not block; it runs under the logger lock. Lines written
// while a ScopedTapSuppression is alive on the current thread are not tapped,
// which keeps the observer's own diagnostics from being fed back to it.
// ---------------------------------------------------------------------------
class DiagnosticTapSink : public ILogSink {
public:
    using LineObserver = std::function<void(std::string_view line)>;

    DiagnosticTapSink(std::unique_ptr<ILogSink> inner, LineObserver observer);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;

    [[nodiscard]] static bool IsSessionRelated(std::string_view line);

private:
    std::unique_ptr<ILogSink> inner_;
    LineObserver observer_;
};

class ScopedTapSuppression {
public:
    ScopedTapSuppression();
    ~ScopedTapSuppression();
    ScopedTapSuppression(const ScopedTapSuppression&) = delete;
    ScopedTapSuppression& operator=(const ScopedTapSuppression&) = delete;

    [[nodiscard]] static bool Active() noexcept;

private:
    bool previous_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger — set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Must be called before any logging.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

/// Convenience free functions that forward to GlobalLogger().
void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace mcp_gateway
