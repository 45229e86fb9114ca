// File: Logger.cpp
// Description: Implements the logging utility with timestamped, leveled
//              output mirrored to file and console streams.

#include "strands/Logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace strands {

struct Logger::Impl {
    std::ofstream logStream;
};

const char* logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> guard(m_mutex);
    delete m_impl;
    m_impl = nullptr;
}

void Logger::initialize(const std::string& logFilePath) {
    std::lock_guard<std::mutex> guard(m_mutex);

    if (!m_impl) {
        m_impl = new Impl();
    }
    m_initialized = false;
    m_impl->logStream.close();

    const std::filesystem::path targetPath(logFilePath);
    if (const auto parent = targetPath.parent_path(); !parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    m_impl->logStream.open(targetPath, std::ios::out | std::ios::trunc);
    if (!m_impl->logStream.is_open()) {
        throw std::runtime_error("Failed to open log file: " + targetPath.string());
    }

    m_logFilePath = targetPath.string();
    m_initialized = true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_impl) {
        m_impl->logStream.close();
    }
    m_initialized = false;
}

void Logger::setMinimumLevel(LogLevel level) {
    std::lock_guard<std::mutex> guard(m_mutex);
    m_minimumLevel = level;
}

void Logger::setConsoleEcho(bool enabled) {
    std::lock_guard<std::mutex> guard(m_mutex);
    m_consoleEcho = enabled;
}

bool Logger::isInitialized() const {
    std::lock_guard<std::mutex> guard(m_mutex);
    return m_initialized;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (!m_initialized || !m_impl || level < m_minimumLevel) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << " | " << logLevelName(level) << " | " << message;
    const std::string line = oss.str();

    m_impl->logStream << line << '\n';
    m_impl->logStream.flush();
    if (m_consoleEcho) {
        std::cout << line << std::endl;
    }
}

void Logger::log(const std::string& message) {
    log(LogLevel::Info, message);
}

}  // namespace strands
