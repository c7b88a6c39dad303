#pragma once

#include <dv_alm/core/terminal.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace dv_alm {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Map -v / -vv / -q style flags to a minimum level. Default is Warn so a
// pipeline log only shows problems unless asked for more.
LogLevel LogLevelFromFlags(int verbosity, bool quiet);

// Abstract log sink — implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;

    // Collapsible sections of a CI log. Only PipelineSink renders them.
    virtual void BeginGroup(std::string_view /*title*/) {}
    virtual void EndGroup() {}
};

// Plain sink — one timestamped line per message, no color.
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Color console sink — colored, compact output to a stream.
// When use_color is false, falls back to the same format as ConsoleSink.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
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

// JSON lines appended to a file the sink owns (--log-file).
class JsonFileSink : public ILogSink {
public:
    explicit JsonFileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream file_;
    JsonSink json_;
};

// ---------------------------------------------------------------------------
// PipelineSink — plain lines for a CI agent's log. Warnings and errors are
// emitted as logging commands (##vso[task.logissue] on Azure Pipelines,
// ::warning:: / ::error:: on GitHub Actions) so they show up on the run
// summary page. With PipelineKind::None it behaves like ConsoleSink.
// ---------------------------------------------------------------------------
class PipelineSink : public ILogSink {
public:
    explicit PipelineSink(PipelineKind kind, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
    void BeginGroup(std::string_view title) override;
    void EndGroup() override;

    /// Escape a message for the given agent's logging command syntax.
    static std::string EscapeCommandData(PipelineKind kind, std::string_view data);

private:
    PipelineKind kind_;
    std::ostream& out_;
};

// Forwards every message to two sinks (console + log file).
class TeeSink : public ILogSink {
public:
    TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
    void BeginGroup(std::string_view title) override;
    void EndGroup() override;
private:
    std::unique_ptr<ILogSink> first_;
    std::unique_ptr<ILogSink> second_;
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

    void BeginGroup(std::string_view title);
    void EndGroup();

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

// Groups everything logged during its lifetime, e.g. one solution's deploy
// steps, into one collapsible section of the pipeline log.
class ScopedLogGroup {
public:
    explicit ScopedLogGroup(std::string_view title);
    ~ScopedLogGroup();

    ScopedLogGroup(const ScopedLogGroup&) = delete;
    ScopedLogGroup& operator=(const ScopedLogGroup&) = delete;
};

} // namespace dv_alm
