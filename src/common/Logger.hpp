#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>

namespace ordering {
namespace common {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - gestion centralisée des logs du moteur de tri
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Helpers
    static std::string levelToString(LogLevel level);
    static LogLevel levelFromString(const std::string& level);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();

    LogLevel m_level = LogLevel::INFO;
    std::ostream* m_output = &std::cerr;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
};

// Convenience macros
#define ORDERING_LOG_DEBUG(msg) ordering::common::Logger::instance().debug(msg)
#define ORDERING_LOG_INFO(msg) ordering::common::Logger::instance().info(msg)
#define ORDERING_LOG_WARN(msg) ordering::common::Logger::instance().warn(msg)
#define ORDERING_LOG_ERROR(msg) ordering::common::Logger::instance().error(msg)

} // namespace common
} // namespace ordering
