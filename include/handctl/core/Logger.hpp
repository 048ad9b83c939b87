#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <fstream>

namespace handctl {
namespace core {

/**
 * Logger severity levels
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5
};

/**
 * Parse a level name ("trace", "DEBUG", "warn", ...).
 * Returns false and leaves @p level untouched for unknown names.
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

/**
 * Simple thread-safe logger
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    void setLevel(LogLevel level) { minLevel_ = level; }

    LogLevel getLevel() const { return minLevel_; }

    /**
     * Check whether a message at @p level would be written
     */
    bool isEnabled(LogLevel level) const { return level >= minLevel_; }

    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    /**
     * Append log output to @p filename (in addition to the console)
     */
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    /**
     * Initialize logger with configuration
     */
    bool initialize(LogLevel level, bool consoleOutput, bool fileOutput, const std::string& filename = "");

    /**
     * Initialize logger with automatic timestamped log file
     * Creates log directory if needed, generates filename with timestamp
     * @param logDirectory Directory for log files
     * @param level Minimum log level to capture
     * @return true if file logging is active, false if only console logging is
     */
    bool initializeWithTimestamp(const std::string& logDirectory = "/tmp/handctl/log",
                                 LogLevel level = LogLevel::INFO);

    /**
     * Get current log file path
     * @return Path to current log file, empty string if no file logging
     */
    std::string getCurrentLogFile() const;

    /**
     * Flush all pending log messages
     */
    void flush();

    /**
     * Log message
     * @param component Optional subsystem tag, printed as [component]
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0,
             const std::string& component = "");

    // Convenience methods
    void trace(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::TRACE, msg, file, line);
    }

    void debug(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::DEBUG, msg, file, line);
    }

    void info(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::INFO, msg, file, line);
    }

    void warning(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::WARNING, msg, file, line);
    }

    void error(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::ERROR, msg, file, line);
    }

    void critical(const std::string& msg, const std::string& file = "", int line = 0) {
        log(LogLevel::CRITICAL, msg, file, line);
    }

    static std::string levelToString(LogLevel level);

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line,
                              const std::string& component) const;
    std::string generateTimestampedFilename(const std::string& directory) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_TRACE(msg) handctl::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) handctl::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) handctl::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) handctl::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) handctl::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) handctl::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging support
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        Logger::getInstance().log(level_, stream_.str(), "", 0, component_);
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::ostringstream stream_;
};

#define HANDCTL_LOG_TRACE(component) \
    handctl::core::LogStream(handctl::core::LogLevel::TRACE, component)

#define HANDCTL_LOG_DEBUG(component) \
    handctl::core::LogStream(handctl::core::LogLevel::DEBUG, component)

#define HANDCTL_LOG_INFO(component) \
    handctl::core::LogStream(handctl::core::LogLevel::INFO, component)

#define HANDCTL_LOG_WARNING(component) \
    handctl::core::LogStream(handctl::core::LogLevel::WARNING, component)

#define HANDCTL_LOG_ERROR(component) \
    handctl::core::LogStream(handctl::core::LogLevel::ERROR, component)

} // namespace core
} // namespace handctl
