#pragma once

#include <string>
#include <iostream>
#include <fstream>
#include <mutex>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace flowgraph {
namespace app {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - centralized log output
 *
 * Lines look like "[2024-05-01 12:00:00.123] [INFO ] message".
 * Writes to stderr by default so results on stdout stay machine readable.
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }
    void setOutputStream(std::ostream* os);

    /**
     * Append to a file instead of the current stream.
     * Returns false if the file could not be opened (output unchanged).
     */
    bool enableFileLogging(const std::string& filepath);

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Helpers
    static std::string levelToString(LogLevel level);

    /**
     * Parse "debug", "info", "warn" or "error"
     * Throws std::invalid_argument for anything else
     */
    static LogLevel parseLevel(const std::string& level);

private:
    Logger();
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
#define LOG_DEBUG(msg) flowgraph::app::Logger::instance().debug(msg)
#define LOG_INFO(msg) flowgraph::app::Logger::instance().info(msg)
#define LOG_WARN(msg) flowgraph::app::Logger::instance().warn(msg)
#define LOG_ERROR(msg) flowgraph::app::Logger::instance().error(msg)

} // namespace app
} // namespace flowgraph
