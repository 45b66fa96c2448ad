#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <cstdint>

namespace gqlevo {
namespace common {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - gestion centralisée des logs
 *
 * Diagnostics only: the schema and evolution functions never read it back.
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);
    void disableFileLogging();

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    bool isEnabled(LogLevel level) const { return level >= m_level; }

    // Helpers
    static std::string levelToString(LogLevel level);
    static LogLevel stringToLogLevel(const std::string& str);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();

    LogLevel m_level = LogLevel::INFO;
    std::ostream* m_output = &std::cout;
    std::ostream* m_consoleOutput = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
};

// Convenience macros
#define LOG_DEBUG(msg) gqlevo::common::Logger::instance().debug(msg)
#define LOG_INFO(msg) gqlevo::common::Logger::instance().info(msg)
#define LOG_WARN(msg) gqlevo::common::Logger::instance().warn(msg)
#define LOG_ERROR(msg) gqlevo::common::Logger::instance().error(msg)

} // namespace common
} // namespace gqlevo
