#pragma once

#include <string>
#include <sstream>
#include <mutex>
#include <memory>
#include <chrono>
#include <fstream>

namespace wojak {
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
 * Parse a level name ("debug", "INFO", "warn", ...). Unknown names yield fallback.
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * Simple thread-safe logger
 */
class Logger {
public:
    /**
     * Get singleton instance
     */
    static Logger& getInstance();

    void setLevel(LogLevel level);
    LogLevel getLevel() const;

    /**
     * Enable/disable console output
     */
    void setConsoleOutput(bool enable);

    /**
     * Set log file (append mode)
     */
    bool setLogFile(const std::string& filename);

    void closeLogFile();

    /**
     * Initialize logger with configuration
     */
    bool initialize(LogLevel level, bool consoleOutput, bool fileOutput, const std::string& filename = "");

    /**
     * Initialize logger with automatic timestamped log file
     * Creates the log directory if needed, file name is log_wojak_<timestamp>.txt
     * @param logDirectory Directory for log files
     * @param level Minimum log level to capture
     * @return true if file logging is active, false if running console-only
     */
    bool initializeWithTimestamp(const std::string& logDirectory, LogLevel level = LogLevel::INFO);

    /**
     * Get current log file path, empty string if no file logging
     */
    std::string getCurrentLogFile() const;

    void flush();

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

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string getTimestamp() const;
    std::string formatMessage(LogLevel level, const std::string& message,
                              const std::string& file, int line) const;
    std::string generateTimestampedFilename(const std::string& directory) const;

    LogLevel minLevel_ = LogLevel::INFO;
    bool consoleOutput_ = true;
    std::string currentLogFile_;

    mutable std::mutex mutex_;
    std::ofstream logFile_;
};

// Convenience macros
#define LOG_TRACE(msg) wojak::core::Logger::getInstance().trace(msg, __FILE__, __LINE__)
#define LOG_DEBUG(msg) wojak::core::Logger::getInstance().debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) wojak::core::Logger::getInstance().info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) wojak::core::Logger::getInstance().warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) wojak::core::Logger::getInstance().error(msg, __FILE__, __LINE__)
#define LOG_CRITICAL(msg) wojak::core::Logger::getInstance().critical(msg, __FILE__, __LINE__)

// Stream-style logging, message is prefixed with [component]
class LogStream {
public:
    LogStream(LogLevel level, const std::string& component = "")
        : level_(level) {
        if (!component.empty()) {
            stream_ << "[" << component << "] ";
        }
    }

    ~LogStream() {
        Logger::getInstance().log(level_, stream_.str());
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    LogLevel level_;
    std::ostringstream stream_;
};

#define WOJAK_LOG_DEBUG(component) \
    wojak::core::LogStream(wojak::core::LogLevel::DEBUG, component)

#define WOJAK_LOG_INFO(component) \
    wojak::core::LogStream(wojak::core::LogLevel::INFO, component)

#define WOJAK_LOG_WARNING(component) \
    wojak::core::LogStream(wojak::core::LogLevel::WARNING, component)

#define WOJAK_LOG_ERROR(component) \
    wojak::core::LogStream(wojak::core::LogLevel::ERROR, component)

} // namespace core
} // namespace wojak
