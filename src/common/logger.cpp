#include "common/logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>  // for strerror
#include <cerrno>   // for errno

std::mutex Logger::mutex_;
LogLevel Logger::currentLevel_ = LogLevel::INFO;
bool Logger::initialized_ = false;
bool Logger::consoleEcho_ = false;
std::string Logger::logPath_ = "/tmp/oobctl.log";

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return false;
    }

    try {
        std::filesystem::path logDir = std::filesystem::path(logPath).parent_path();
        if (!logDir.empty() && !std::filesystem::exists(logDir)) {
            std::filesystem::create_directories(logDir);
        }

        // Test if we can write to the log file
        FILE* testFile = fopen(logPath.c_str(), "a");
        if (!testFile) {
            std::cerr << "oobctl: failed to open log file " << logPath << ": " << strerror(errno) << std::endl;
            return false;
        }
        fclose(testFile);

        logPath_ = logPath;
        currentLevel_ = level;
        initialized_ = true;
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "oobctl: logger initialization failed: " << e.what() << std::endl;
        return false;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = false;
    consoleEcho_ = false;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    currentLevel_ = level;
}

void Logger::setConsoleEcho(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    consoleEcho_ = enabled;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_) {
        return;
    }

    // Only log if the message level is greater than or equal to the current level
    if (level < currentLevel_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");

    std::string levelStr = levelToString(level);
    std::string logMessage = ss.str() + " [" + levelStr + "] " + message + "\n";

    // stdout belongs to command output, so the console copy always goes to stderr
    if (consoleEcho_) {
        std::cerr << logMessage;
        std::cerr.flush();
    }

    FILE* logFile = fopen(logPath_.c_str(), "a");
    if (logFile) {
        fprintf(logFile, "%s", logMessage.c_str());
        fflush(logFile);
        fclose(logFile);
    } else if (consoleEcho_) {
        std::cerr << "Failed to open log file: " << strerror(errno) << std::endl;
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

bool Logger::parseLevel(const std::string& text, LogLevel& level) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        level = LogLevel::DEBUG;
    } else if (lowered == "info") {
        level = LogLevel::INFO;
    } else if (lowered == "warning" || lowered == "warn") {
        level = LogLevel::WARNING;
    } else if (lowered == "error") {
        level = LogLevel::ERROR;
    } else if (lowered == "fatal") {
        level = LogLevel::FATAL;
    } else {
        return false;
    }
    return true;
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:            return "UNKNOWN";
    }
}
