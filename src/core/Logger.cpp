#include "wojak/core/Logger.hpp"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace wojak {
namespace core {

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "critical" || lower == "fatal") return LogLevel::CRITICAL;
    return fallback;
}

Logger::Logger() : minLevel_(LogLevel::INFO), consoleOutput_(true) {}

Logger::~Logger() {
    closeLogFile();
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
}

LogLevel Logger::getLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return minLevel_;
}

void Logger::setConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleOutput_ = enable;
}

bool Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (logFile_.is_open()) {
        logFile_.close();
    }

    logFile_.open(filename, std::ios::app);
    currentLogFile_ = logFile_.is_open() ? filename : std::string();
    return logFile_.is_open();
}

void Logger::closeLogFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
    currentLogFile_.clear();
}

bool Logger::initialize(LogLevel level, bool consoleOutput, bool fileOutput, const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    minLevel_ = level;
    consoleOutput_ = consoleOutput;

    if (fileOutput && !filename.empty()) {
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFile_.open(filename, std::ios::app);
        if (!logFile_.is_open()) {
            currentLogFile_.clear();
            return false;
        }
        currentLogFile_ = filename;
    }

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
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < minLevel_) {
        return;
    }

    std::string formatted = formatMessage(level, message, file, line);

    if (consoleOutput_) {
        if (level >= LogLevel::WARNING) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << '\n';
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
        oss << " (" << std::filesystem::path(file).filename().string() << ":" << line << ")";
    }

    return oss.str();
}

std::string Logger::generateTimestampedFilename(const std::string& directory) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    std::ostringstream name;
    name << "log_wojak_" << std::put_time(&tm_buf, "%Y-%m-%d_%H-%M-%S") << ".txt";

    return (std::filesystem::path(directory) / name.str()).string();
}

bool Logger::initializeWithTimestamp(const std::string& logDirectory, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    minLevel_ = level;
    consoleOutput_ = true;

    std::error_code ec;
    std::filesystem::create_directories(logDirectory, ec);
    if (ec || !std::filesystem::is_directory(logDirectory)) {
        std::cerr << "[Logger] Could not create log directory " << logDirectory
                  << ": " << ec.message() << ", file logging disabled" << std::endl;
        return false;
    }

    currentLogFile_ = generateTimestampedFilename(logDirectory);

    if (logFile_.is_open()) {
        logFile_.close();
    }

    logFile_.open(currentLogFile_, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[Logger] Failed to open log file " << currentLogFile_ << std::endl;
        currentLogFile_.clear();
        return false;
    }

    logFile_ << "===========================================" << '\n';
    logFile_ << "Wojak Generator Log" << '\n';
    logFile_ << "Started: " << getTimestamp() << '\n';
    logFile_ << "Log Level: " << levelToString(level) << '\n';
    logFile_ << "===========================================" << std::endl;

    return true;
}

std::string Logger::getCurrentLogFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentLogFile_;
}

} // namespace core
} // namespace wojak
