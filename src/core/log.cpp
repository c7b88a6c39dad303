#include <dv_alm/core/log.hpp>
#include <dv_alm/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace dv_alm {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string HhMmSsNow() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time_t_now);
#else
    localtime_r(&time_t_now, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

const char* LevelAnsi(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

// Fixed-width 5-char level tag (right-padded).
const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "     ";
}

void WritePlainLine(std::ostream& out, LogLevel level,
                    std::string_view component, std::string_view message) {
    out << Iso8601Now()
        << " [" << LevelName(level) << "] "
        << "[" << component << "] "
        << message << '\n';
}

} // anonymous namespace

LogLevel LogLevelFromFlags(int verbosity, bool quiet) {
    if (quiet) return LogLevel::Error;
    if (verbosity >= 2) return LogLevel::Debug;
    if (verbosity == 1) return LogLevel::Info;
    return LogLevel::Warn;
}

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------
ConsoleSink::ConsoleSink(std::ostream& out) : out_(out) {}

void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    WritePlainLine(out_, level, component, message);
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlainLine(out_, level, component, message);
        return;
    }

    // HH:MM:SS LEVEL [component] message
    const auto* level_color = LevelAnsi(level);
    out_ << ansi::kDim << HhMmSsNow() << ansi::kReset << ' ';
    out_ << level_color << LevelTag(level) << ansi::kReset << ' ';
    out_ << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';

    if (level == LogLevel::Error) {
        out_ << level_color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink / JsonFileSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {
        {"ts", Iso8601Now()},
        {"level", LevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Replace invalid UTF-8 from tool output instead of throwing.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
}

JsonFileSink::JsonFileSink(const std::string& path)
    : file_(path, std::ios::app), json_(file_) {}

void JsonFileSink::Write(LogLevel level, std::string_view component,
                         std::string_view message) {
    if (!file_.is_open()) return;
    json_.Write(level, component, message);
}

// ---------------------------------------------------------------------------
// PipelineSink
// ---------------------------------------------------------------------------
PipelineSink::PipelineSink(PipelineKind kind, std::ostream& out)
    : kind_(kind), out_(out) {}

std::string PipelineSink::EscapeCommandData(PipelineKind kind, std::string_view data) {
    const char* percent = kind == PipelineKind::AzurePipelines ? "%AZP25" : "%25";
    std::string escaped;
    escaped.reserve(data.size());
    for (char c : data) {
        switch (c) {
            case '%':  escaped += percent; break;
            case '\r': escaped += "%0D"; break;
            case '\n': escaped += "%0A"; break;
            default:   escaped += c; break;
        }
    }
    return escaped;
}

void PipelineSink::Write(LogLevel level, std::string_view component,
                         std::string_view message) {
    const bool issue = level == LogLevel::Warn || level == LogLevel::Error;
    if (!issue || kind_ == PipelineKind::None) {
        WritePlainLine(out_, level, component, message);
        return;
    }

    const char* type = level == LogLevel::Error ? "error" : "warning";
    std::string text = "[" + std::string(component) + "] " + std::string(message);
    if (kind_ == PipelineKind::AzurePipelines) {
        out_ << "##vso[task.logissue type=" << type << "]"
             << EscapeCommandData(kind_, text) << '\n';
    } else {
        out_ << "::" << type << " title=" << EscapeCommandData(kind_, component)
             << "::" << EscapeCommandData(kind_, message) << '\n';
    }
    out_.flush();
}

void PipelineSink::BeginGroup(std::string_view title) {
    switch (kind_) {
        case PipelineKind::AzurePipelines:
            out_ << "##[group]" << title << '\n';
            break;
        case PipelineKind::GitHubActions:
            out_ << "::group::" << title << '\n';
            break;
        case PipelineKind::None:
            return;
    }
    out_.flush();
}

void PipelineSink::EndGroup() {
    switch (kind_) {
        case PipelineKind::AzurePipelines:
            out_ << "##[endgroup]\n";
            break;
        case PipelineKind::GitHubActions:
            out_ << "::endgroup::\n";
            break;
        case PipelineKind::None:
            return;
    }
    out_.flush();
}

// ---------------------------------------------------------------------------
// TeeSink
// ---------------------------------------------------------------------------
TeeSink::TeeSink(std::unique_ptr<ILogSink> first,
                 std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    if (first_) first_->Write(level, component, message);
    if (second_) second_->Write(level, component, message);
}

void TeeSink::BeginGroup(std::string_view title) {
    if (first_) first_->BeginGroup(title);
    if (second_) second_->BeginGroup(title);
}

void TeeSink::EndGroup() {
    if (first_) first_->EndGroup();
    if (second_) second_->EndGroup();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::BeginGroup(std::string_view title) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_->BeginGroup(title);
}

void Logger::EndGroup() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_->EndGroup();
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

namespace {

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

ScopedLogGroup::ScopedLogGroup(std::string_view title) {
    GlobalLogger().BeginGroup(title);
}

ScopedLogGroup::~ScopedLogGroup() {
    GlobalLogger().EndGroup();
}

} // namespace dv_alm
