#include "logger/Logger.hpp"

#include <algorithm>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <condition_variable>
#include <vector>
#include <cctype>

namespace fs = std::filesystem;

std::ofstream Logger::logFile_;
std::mutex Logger::logMutex_;
std::string Logger::logDirectory_ = "logs";
std::string Logger::filePrefix_ = "printfleet";
std::string Logger::currentLogPath_;
std::atomic<size_t> Logger::currentLogSize_{0};
std::atomic<int> Logger::minLevel_{static_cast<int>(LogLevel::Info)};
std::thread Logger::cleanupThread_;
std::atomic<bool> Logger::shutdownRequested_{false};

namespace {
    constexpr size_t MAX_LOG_SIZE = 50 * 1024 * 1024; // 50MB
    constexpr size_t MAX_LOG_FILES = 10;
    constexpr std::chrono::hours LOG_RETENTION{24 * 7}; // 7 days

    std::mutex cleanupWaitMutex;
    std::condition_variable cleanupWake;
}

void Logger::init(const std::string &directory, const std::string &filePrefix) {
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        logDirectory_ = directory.empty() ? "logs" : directory;
        filePrefix_ = filePrefix.empty() ? "printfleet" : filePrefix;
        shutdownRequested_ = false;
        rotateLogFile();
    }
    if (!cleanupThread_.joinable()) {
        startCleanupThread();
    }
    std::cout << "[Logger] Writing to " << currentLogPath_ << " (rotation at "
              << MAX_LOG_SIZE / 1024 / 1024 << "MB)" << std::endl;
}

void Logger::shutdown() {
    {
        std::lock_guard<std::mutex> lock(cleanupWaitMutex);
        shutdownRequested_ = true;
    }
    cleanupWake.notify_all();
    if (cleanupThread_.joinable()) {
        cleanupThread_.join();
    }
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logFile_.is_open()) {
        logFile_.close();
    }
}

void Logger::setMinLevel(LogLevel level) {
    minLevel_ = static_cast<int>(level);
}

LogLevel Logger::getMinLevel() {
    return static_cast<LogLevel>(minLevel_.load());
}

LogLevel Logger::parseLevel(const std::string &name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::Warning;
    if (upper == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

void Logger::logDebug(const std::string &message) {
    log(LogLevel::Debug, message);
}

void Logger::logInfo(const std::string &message) {
    log(LogLevel::Info, message);
}

void Logger::logWarning(const std::string &message) {
    log(LogLevel::Warning, message);
}

void Logger::logError(const std::string &message) {
    log(LogLevel::Error, message);
}

const char *Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

void Logger::log(LogLevel level, const std::string &message) {
    if (static_cast<int>(level) < minLevel_.load()) {
        return;
    }
    if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    std::string formatted = "[" + std::string(levelName(level)) + "] [" + currentTimestamp() + "] " + message;

    std::lock_guard<std::mutex> lock(logMutex_);
    if (level == LogLevel::Error) {
        std::cerr << formatted << std::endl;
    } else {
        std::cout << formatted << std::endl;
    }

    if (logFile_.is_open() && currentLogSize_ > MAX_LOG_SIZE) {
        rotateLogFile();
    }

    if (logFile_.is_open()) {
        logFile_ << formatted << '\n';
        logFile_.flush();
        currentLogSize_ += formatted.length() + 1;
    }
}

void Logger::rotateLogFile() {
    if (logFile_.is_open()) {
        logFile_.close();
    }

    currentLogPath_ = generateLogFilename();
    logFile_.open(currentLogPath_, std::ios::out | std::ios::trunc);
    currentLogSize_ = 0;

    if (!logFile_.is_open()) {
        std::cerr << "[Logger] ERROR: Cannot open log file: " << currentLogPath_ << std::endl;
    }
}

void Logger::startCleanupThread() {
    cleanupThread_ = std::thread([]() {
        while (!shutdownRequested_) {
            cleanupOldLogs();
            std::unique_lock<std::mutex> lock(cleanupWaitMutex);
            cleanupWake.wait_for(lock, std::chrono::hours(1), [] { return shutdownRequested_.load(); });
        }
    });
}

void Logger::cleanupOldLogs() {
    std::string folder;
    {
        std::lock_guard<std::mutex> lock(logMutex_);
        folder = logDirectory_;
    }

    try {
        if (!fs::exists(folder)) return;

        auto cutoffTime = std::chrono::system_clock::now() - LOG_RETENTION;
        std::vector<fs::path> logFiles;

        for (const auto &entry: fs::directory_iterator(folder)) {
            if (entry.path().extension() != ".log") continue;

            auto writeTime = fs::last_write_time(entry);
            auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    writeTime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());

            if (sctp < cutoffTime) {
                fs::remove(entry);
            } else {
                logFiles.push_back(entry.path());
            }
        }

        if (logFiles.size() > MAX_LOG_FILES) {
            std::sort(logFiles.begin(), logFiles.end(), [](const fs::path &a, const fs::path &b) {
                return fs::last_write_time(a) < fs::last_write_time(b);
            });

            for (size_t i = 0; i < logFiles.size() - MAX_LOG_FILES; ++i) {
                fs::remove(logFiles[i]);
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
    }
}

std::string Logger::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&in_time_t, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y%m%d_%H%M%S");

    std::error_code ec;
    if (!fs::exists(logDirectory_, ec)) {
        fs::create_directories(logDirectory_, ec);
    }

    return logDirectory_ + "/" + filePrefix_ + "_" + ss.str() + ".log";
}
