#include "common/Logger.hpp"
#include <stdexcept>

namespace gqlevo {
namespace common {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() = default;

Logger::~Logger() {
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
}

void Logger::setOutputStream(std::ostream* os) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_consoleOutput = os ? os : &std::cout;
    if (!m_fileStream.is_open()) {
        m_output = m_consoleOutput;
    }
}

void Logger::enableFileLogging(const std::string& filepath) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
    m_fileStream.open(filepath, std::ios::app);
    if (!m_fileStream.is_open()) {
        m_output = m_consoleOutput;
        throw std::runtime_error("Cannot open log file: " + filepath);
    }
    m_output = &m_fileStream;
}

void Logger::disableFileLogging() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fileStream.is_open()) {
        m_fileStream.close();
    }
    m_output = m_consoleOutput;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

LogLevel Logger::stringToLogLevel(const std::string& str) {
    if (str == "debug") return LogLevel::DEBUG;
    if (str == "info")  return LogLevel::INFO;
    if (str == "warn")  return LogLevel::WARN;
    if (str == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + str);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < m_level) return;

    std::lock_guard<std::mutex> lock(m_mutex);
    *m_output << "[" << timestamp() << "] "
              << "[" << levelToString(level) << "] "
              << message << std::endl;
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

} // namespace common
} // namespace gqlevo
