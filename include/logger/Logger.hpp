#pragma once

#include <string>
#include <fstream>
#include <mutex>
#include <thread>
#include <atomic>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

class Logger {
public:
    /**
     * @brief Open the first log file and start the retention thread
     * @param directory Folder that receives the rotated log files
     * @param filePrefix File name prefix, a timestamp is appended
     */
    static void init(const std::string &directory = "logs", const std::string &filePrefix = "printfleet");

    static void shutdown();

    static void setMinLevel(LogLevel level);

    static LogLevel getMinLevel();

    /**
     * @brief Parse "DEBUG", "INFO", "WARNING" or "ERROR" (case insensitive), INFO otherwise
     */
    static LogLevel parseLevel(const std::string &name);

    static void logDebug(const std::string &message);

    static void logInfo(const std::string &message);

    static void logWarning(const std::string &message);

    static void logError(const std::string &message);

private:
    static std::ofstream logFile_;
    static std::mutex logMutex_;
    static std::string logDirectory_;
    static std::string filePrefix_;
    static std::string currentLogPath_;
    static std::atomic<size_t> currentLogSize_;
    static std::atomic<int> minLevel_;
    static std::thread cleanupThread_;
    static std::atomic<bool> shutdownRequested_;

    static void log(LogLevel level, const std::string &message);

    static const char *levelName(LogLevel level);

    static void rotateLogFile();

    static void startCleanupThread();

    static void cleanupOldLogs();

    static std::string currentTimestamp();

    static std::string generateLogFilename();
};
