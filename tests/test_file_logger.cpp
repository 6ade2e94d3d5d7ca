/**
 * @file test_file_logger.cpp
 * @brief File logging checks for the Wojak logger
 *
 * Tests:
 * 1. Timestamped log file creation under a fresh directory
 * 2. Concurrent stream-style logging from request threads
 * 3. Level filtering in the file sink
 * 4. Level name parsing used by the logging.level key
 */

#include "wojak/core/Logger.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace wojak::core;

namespace {

std::atomic<int> errors{0};

const std::string kLogDirectory =
    (std::filesystem::temp_directory_path() / "wojak_test_logs").string();

bool fileContains(const std::string& path, const std::string& needle) {
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

int countLinesContaining(const std::string& path, const std::string& needle) {
    std::ifstream file(path);
    std::string line;
    int count = 0;
    while (std::getline(file, line)) {
        if (line.find(needle) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

bool fail(const std::string& message) {
    std::cerr << "ERROR: " << message << std::endl;
    errors++;
    return false;
}

} // namespace

bool testTimestampedFile() {
    std::cout << "\n=== Timestamped log file ===" << std::endl;

    std::error_code ec;
    std::filesystem::remove_all(kLogDirectory, ec);

    auto& logger = Logger::getInstance();
    logger.setConsoleOutput(false);
    if (!logger.initializeWithTimestamp(kLogDirectory, LogLevel::DEBUG)) {
        return fail("initializeWithTimestamp failed for " + kLogDirectory);
    }
    logger.setConsoleOutput(false);

    const std::string path = logger.getCurrentLogFile();
    if (path.find("log_wojak_") == std::string::npos) {
        return fail("unexpected log file name " + path);
    }
    if (!std::filesystem::exists(path)) {
        return fail("log file not created: " + path);
    }

    std::cout << "PASS: " << path << std::endl;
    return true;
}

bool testConcurrentRequests() {
    std::cout << "\n=== Concurrent request logging ===" << std::endl;

    auto& logger = Logger::getInstance();
    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 200;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    auto start = std::chrono::steady_clock::now();

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                WOJAK_LOG_INFO("WojakGenerator") << "request " << t << "/" << i << " CONCURRENT_MARK";
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger.flush();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    int logged = countLinesContaining(logger.getCurrentLogFile(), "CONCURRENT_MARK");
    std::cout << logged << " lines in " << elapsed.count() << " ms" << std::endl;
    if (logged != kThreads * kMessagesPerThread) {
        return fail("expected " + std::to_string(kThreads * kMessagesPerThread) +
                    " lines, found " + std::to_string(logged));
    }
    if (countLinesContaining(logger.getCurrentLogFile(), "[WojakGenerator] request") != logged) {
        return fail("component prefix missing or lines interleaved");
    }

    std::cout << "PASS: no lost or interleaved lines" << std::endl;
    return true;
}

bool testLevelFilter() {
    std::cout << "\n=== Level filter ===" << std::endl;

    auto& logger = Logger::getInstance();
    logger.setLevel(LogLevel::WARNING);

    LOG_DEBUG("FILTER_DEBUG_MARK");
    LOG_INFO("FILTER_INFO_MARK");
    LOG_WARNING("FILTER_WARNING_MARK");
    WOJAK_LOG_ERROR("RegionBlender") << "FILTER_ERROR_MARK";
    logger.flush();

    const std::string path = logger.getCurrentLogFile();
    bool ok = true;
    if (fileContains(path, "FILTER_DEBUG_MARK") || fileContains(path, "FILTER_INFO_MARK")) {
        ok = fail("messages below WARNING reached the file");
    }
    if (!fileContains(path, "FILTER_WARNING_MARK") || !fileContains(path, "FILTER_ERROR_MARK")) {
        ok = fail("messages at or above WARNING missing");
    }

    logger.setLevel(LogLevel::DEBUG);
    if (ok) {
        std::cout << "PASS: level filter applied" << std::endl;
    }
    return ok;
}

bool testParseLogLevel() {
    std::cout << "\n=== Level names ===" << std::endl;

    bool ok = parseLogLevel("debug") == LogLevel::DEBUG &&
              parseLogLevel("INFO") == LogLevel::INFO &&
              parseLogLevel("warn") == LogLevel::WARNING &&
              parseLogLevel("Error") == LogLevel::ERROR &&
              parseLogLevel("critical") == LogLevel::CRITICAL &&
              parseLogLevel("verbose", LogLevel::TRACE) == LogLevel::TRACE;
    if (!ok) {
        return fail("parseLogLevel mismatch");
    }
    std::cout << "PASS: level names parsed" << std::endl;
    return true;
}

int main() {
    std::cout << "=========================================" << std::endl;
    std::cout << "Wojak File Logger Tests" << std::endl;
    std::cout << "=========================================" << std::endl;

    bool allPassed = testTimestampedFile();
    if (allPassed) {
        allPassed &= testConcurrentRequests();
        allPassed &= testLevelFilter();
    }
    allPassed &= testParseLogLevel();

    Logger::getInstance().closeLogFile();

    std::cout << "\nTotal errors: " << errors.load() << std::endl;
    if (allPassed && errors.load() == 0) {
        std::cout << "ALL TESTS PASSED" << std::endl;
        return 0;
    }
    std::cout << "SOME TESTS FAILED" << std::endl;
    return 1;
}
