#include "probeflow/core/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>

namespace PROBEFLOW {

std::string Logger::logDirectory;
LogLevel Logger::globalLogLevel = LogLevel::INFO;

namespace {

std::mutex& RegistryMutex() {
    static std::mutex registryMutex;
    return registryMutex;
}

std::map<std::string, std::shared_ptr<Logger>>& Registry() {
    static std::map<std::string, std::shared_ptr<Logger>> loggers;
    return loggers;
}

} // namespace

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> LogLevelFromString(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::shared_ptr<Logger> Logger::GetLogger(const std::string& name) {
    std::lock_guard<std::mutex> lock(RegistryMutex());

    auto& loggers = Registry();
    auto it = loggers.find(name);
    if (it != loggers.end()) {
        return it->second;
    }

    auto logger = std::shared_ptr<Logger>(new Logger(name));
    loggers[name] = logger;
    return logger;
}

bool Logger::Initialize(const std::string& logDir, LogLevel level) {
    std::lock_guard<std::mutex> lock(RegistryMutex());

    if (!logDir.empty() && mkdir(logDir.c_str(), 0755) != 0 && errno != EEXIST) {
        std::cerr << "Failed to create log directory: " << logDir << std::endl;
        return false;
    }

    logDirectory = logDir;
    globalLogLevel = level;

    // Loggers handed out before initialization follow the new settings
    for (auto& entry : Registry()) {
        std::lock_guard<std::mutex> loggerLock(entry.second->logMutex);
        entry.second->currentLevel = level;
        entry.second->OpenSink();
    }
    return true;
}

Logger::Logger(const std::string& name)
    : name(name), currentLevel(globalLogLevel) {
    OpenSink();
}

Logger::~Logger() {
    if (logFile.is_open()) {
        logFile.close();
    }
}

void Logger::OpenSink() {
    if (logFile.is_open()) {
        logFile.close();
    }
    if (logDirectory.empty()) {
        return;
    }

    std::string path = logDirectory + "/" + name + ".log";
    logFile.open(path, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
    }
}

void Logger::Debug(const std::string& message) {
    WriteLog(LogLevel::DEBUG, message);
}

void Logger::Info(const std::string& message) {
    WriteLog(LogLevel::INFO, message);
}

void Logger::Warning(const std::string& message) {
    WriteLog(LogLevel::WARNING, message);
}

void Logger::Error(const std::string& message) {
    WriteLog(LogLevel::ERROR, message);
}

void Logger::SetLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex);
    currentLevel = level;
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
    }
}

void Logger::WriteLog(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);

    if (level < currentLevel) {
        return;
    }

    std::string logEntry = "[" + GetTimestamp() + "] [" + LogLevelToString(level) +
                           "] [" + name + "] " + message;

    if (logFile.is_open()) {
        logFile << logEntry << '\n';
        if (level == LogLevel::ERROR) {
            std::cerr << logEntry << std::endl;
        }
        return;
    }

    std::cerr << logEntry << std::endl;
}

std::string Logger::GetTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // namespace PROBEFLOW
