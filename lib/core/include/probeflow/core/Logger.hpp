#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace PROBEFLOW {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

std::string LogLevelToString(LogLevel level);

/// Accepts "debug", "info", "warning"/"warn", "error" in any case
std::optional<LogLevel> LogLevelFromString(const std::string& text);

/**
 * @brief Named, thread-safe line logger
 *
 * Lines read "[2025-07-25 14:30:21.123] [INFO] [controller] message".
 * With a log directory every logger appends to <dir>/<name>.log and ERROR
 * lines are echoed to stderr. Without one, lines go to stderr only.
 */
class Logger {
public:
    // Get logger instance for a named component
    static std::shared_ptr<Logger> GetLogger(const std::string& name);

    // Initialize logging system; an empty logDir logs to stderr
    static bool Initialize(const std::string& logDir, LogLevel level = LogLevel::INFO);

    void Debug(const std::string& message);
    void Info(const std::string& message);
    void Warning(const std::string& message);
    void Error(const std::string& message);

    void SetLogLevel(LogLevel level);
    void Flush();

    const std::string& GetName() const { return name; }

    // Destructor (public for shared_ptr)
    ~Logger();

private:
    explicit Logger(const std::string& name);

    void OpenSink();
    void WriteLog(LogLevel level, const std::string& message);
    std::string GetTimestamp() const;

    std::string name;
    std::ofstream logFile;
    LogLevel currentLevel;
    std::mutex logMutex;

    static std::string logDirectory;
    static LogLevel globalLogLevel;
};

} // namespace PROBEFLOW
