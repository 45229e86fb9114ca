// File: Logger.hpp
// Description: Provides a simple thread-safe logging facility that writes
//              leveled messages to a log file and, optionally, the console.

#pragma once

#include <mutex>
#include <string>

namespace strands {

enum class LogLevel { Debug, Info, Warning, Error };

const char* logLevelName(LogLevel level) noexcept;

class Logger {
public:
    static Logger& instance();

    // Truncates `logFilePath`, creating parent directories as needed. Throws
    // std::runtime_error if the file cannot be opened.
    void initialize(const std::string& logFilePath);
    void shutdown();

    void setMinimumLevel(LogLevel level);
    void setConsoleEcho(bool enabled);
    bool isInitialized() const;

    // No-op until initialize() has succeeded.
    void log(LogLevel level, const std::string& message);
    void log(const std::string& message);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex m_mutex;
    std::string m_logFilePath;
    bool m_initialized{false};
    bool m_consoleEcho{true};
    LogLevel m_minimumLevel{LogLevel::Info};
    struct Impl;
    Impl* m_impl{nullptr};
};

}  // namespace strands
