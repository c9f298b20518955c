#include "skintone/core/Logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <cctype>
#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <cstring>

namespace skintone {
namespace core {

Logger::Logger() : minLevel_(LogLevel::INFO), consoleOutput_(true) {
}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    logFile_.close();
    currentLogFile_.clear();
}

bool Logger::openFileLocked(const std::string& path) {
    logFile_.close();
    logFile_.clear();

    logFile_.open(path, std::ios::out | std::ios::app);
    if (!logFile_) {
        std::cerr << "[Logger] Error: Failed to open log file " << path
                  << ": " << std::strerror(errno) << std::endl;
        currentLogFile_.clear();
        return false;
    }
    currentLogFile_ = path;
    return true;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (consoleOutput_) {
        std::cout.flush();
        std::cerr.flush();
    }
    if (logFile_.is_open()) {
        logFile_.flush();
    }
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line) {
    if (level < minLevel_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string formatted = formatMessage(level, message, file, line);

    if (consoleOutput_) {
        if (level >= LogLevel::ERROR) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << std::endl;
    }
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "TRACE";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::INFO:     return "INFO";
        case LogLevel::WARNING:  return "WARNING";
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

LogLevel Logger::levelFromString(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return fallback;
}

std::string Logger::getTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

std::string Logger::formatMessage(LogLevel level, const std::string& message,
                                  const std::string& file, int line) const {
    std::ostringstream oss;
    oss << "[" << getTimestamp() << "] [" << levelToString(level) << "] " << message;

    if (!file.empty() && line > 0) {
        // Extract just the filename from the full path
        size_t pos = file.find_last_of("/\\");
        std::string filename = (pos != std::string::npos) ? file.substr(pos + 1) : file;
        oss << " (" << filename << ":" << line << ")";
    }

    return oss.str();
}

std::string Logger::generateTimestampedFilename(const std::string& directory) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream oss;
    oss << directory;
    if (!directory.empty() && directory.back() != '/') {
        oss << '/';
    }
    oss << "log_skintone_";
    oss << std::put_time(&tm_buf, "%Y-%m-%d_%H-%M-%S");
    oss << ".txt";

    return oss.str();
}

bool Logger::createDirectoryIfNeeded(const std::string& directory) const {
    struct stat st;

    if (stat(directory.c_str(), &st) == 0) {
        if (S_ISDIR(st.st_mode)) {
            return true;
        }
        std::cerr << "[Logger] Error: " << directory << " exists but is not a directory" << std::endl;
        return false;
    }

    if (mkdir(directory.c_str(), 0755) == 0) {
        return true;
    }

    // Parent missing: create it first, then retry
    if (errno == ENOENT) {
        size_t pos = directory.find_last_of('/');
        if (pos != std::string::npos && pos > 0) {
            std::string parent = directory.substr(0, pos);
            if (createDirectoryIfNeeded(parent)) {
                return mkdir(directory.c_str(), 0755) == 0;
            }
        }
    }

    std::cerr << "[Logger] Failed to create directory " << directory
              << ": " << std::strerror(errno) << std::endl;
    return false;
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;

    if (!createDirectoryIfNeeded(logDirectory)) {
        std::cerr << "[Logger] Warning: Could not create log directory, file logging disabled" << std::endl;
        return false;
    }
    if (!openFileLocked(generateTimestampedFilename(logDirectory))) {
        return false;
    }

    const std::string rule(43, '=');
    logFile_ << rule << '\n'
             << "Skintone Analyzer Log\n"
             << "Started: " << getTimestamp() << '\n'
             << "Log Level: " << levelToString(level) << '\n'
             << rule << std::endl;
    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

} // namespace core
} // namespace skintone
