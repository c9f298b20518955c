#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <fstream>

namespace skintone {
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
 * Simple thread-safe logger
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    /**
     * Set minimum log level
     */
    void setLevel(LogLevel level) { minLevel_ = level; }

    LogLevel getLevel() const { return minLevel_; }

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable) { consoleOutput_ = enable; }

    void closeLogFile();

    /**
     * Initialize logger with automatic timestamped log file
     * Creates log directory if needed, generates filename with timestamp
     * @param logDirectory Directory for log files
     * @param level Minimum log level to capture
     * @return true if file logging is active, false if only console logging is available
     */
    bool initializeWithTimestamp(const std::string& logDirectory, LogLevel level = LogLevel::INFO);

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
     */
    void log(LogLevel level, const std::string& message,
             const std::string& file = "", int line = 0);

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

    /**
     * Parse level name ("debug", "INFO", ...), returns fallback on unknown names
     */
    static LogLevel levelFromString(const std::string& name, LogLevel fallback = LogLevel::INFO);

private:
    Logger();
    ~Logger();

    // Delete copy/move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;
    std::string generateTimestampedFilename(const std::string& directory) const;
    bool createDirectoryIfNeeded(const std::string& directory) const;

    /// Caller holds mutex_. Replaces any open file; clears currentLogFile_ on failure.
    bool openFileLocked(const std::string& path);

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_TRACE(msg) skintone::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) skintone::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) skintone::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) skintone::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) skintone::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) skintone::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging support
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level), component_(component) {}

    ~LogStream() {
        if (component_.empty()) {
            Logger::getInstance().log(level_, stream_.str());
        } else {
            Logger::getInstance().log(level_, "[" + component_ + "] " + stream_.str());
        }
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

#define SKINTONE_LOG_DEBUG(component) \
    skintone::core::LogStream(skintone::core::LogLevel::DEBUG, component)

#define SKINTONE_LOG_INFO(component) \
    skintone::core::LogStream(skintone::core::LogLevel::INFO, component)

#define SKINTONE_LOG_WARNING(component) \
    skintone::core::LogStream(skintone::core::LogLevel::WARNING, component)

#define SKINTONE_LOG_ERROR(component) \
    skintone::core::LogStream(skintone::core::LogLevel::ERROR, component)

} // namespace core
} // namespace skintone
