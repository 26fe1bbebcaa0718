#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>

namespace conngraph {
namespace util {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - centralized engine logging
 *
 * The engine itself is single-threaded, but hosts may log from other
 * threads, so writes are serialized.
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }
    void setOutputStream(std::ostream* os);
    void enableFileLogging(const std::string& filepath);
    void disableFileLogging();

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Helpers
    static std::string levelToString(LogLevel level);
    static LogLevel stringToLevel(const std::string& str);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string timestamp();

    LogLevel m_level = LogLevel::INFO;
    std::ostream* m_output = &std::cout;
    std::ostream* m_console = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;
};

// Convenience macros
#define CG_LOG_DEBUG(msg) conngraph::util::Logger::instance().debug(msg)
#define CG_LOG_INFO(msg) conngraph::util::Logger::instance().info(msg)
#define CG_LOG_WARN(msg) conngraph::util::Logger::instance().warn(msg)
#define CG_LOG_ERROR(msg) conngraph::util::Logger::instance().error(msg)

} // namespace util
} // namespace conngraph
