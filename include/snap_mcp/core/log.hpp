#pragma once

#include <snap_mcp/core/result.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace snap_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

const char* LogLevelName(LogLevel level);

// Abstract log sink - implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Human-readable lines. With color: "HH:MM:SS LEVEL [component] message",
// without: "<iso8601> [LEVEL] [component] message".
class TextSink : public ILogSink {
public:
    explicit TextSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON sink - one {"ts","level","component","message"} object per line.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Appends to a file it owns. Plain text or JSON lines, never colored.
class FileSink : public ILogSink {
public:
    static Result<std::unique_ptr<FileSink>, Error> Open(const std::string& path,
                                                         bool json);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    FileSink() = default;

    std::ofstream file_;
    std::unique_ptr<ILogSink> inner_;
};

// Forwards every message to all attached sinks.
class MultiSink : public ILogSink {
public:
    void Add(std::unique_ptr<ILogSink> sink);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::vector<std::unique_ptr<ILogSink>> sinks_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level);

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
// Global logger - set once at startup, used by all components.
// Connection threads log through it concurrently; Logger serializes writes.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Until called, messages are discarded.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace snap_mcp
