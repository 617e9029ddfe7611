//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include <atomic>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

namespace cnc {

    enum class LogLevel {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3
    };

    class Logger {
    public:
        struct Options {
            LogLevel level = LogLevel::Warning;
            bool fileEnabled = false;
            std::string directory = "logs";
            size_t maxFileSizeBytes = 50 * 1024 * 1024; // 50MB
            size_t maxFiles = 10;
        };

        static void init();

        static void init(const Options &options);

        static void shutdown();

        static void setLevel(LogLevel level);

        static LogLevel getLevel();

        // Throws std::invalid_argument on unknown names
        static LogLevel levelFromString(const std::string &name);

        static std::string levelToString(LogLevel level);

        static void logDebug(const std::string &message);

        static void logInfo(const std::string &message);

        static void logWarning(const std::string &message);

        static void logError(const std::string &message);

    private:
        static std::ofstream logFile_;
        static std::mutex logMutex_;
        static std::string currentLogPath_;
        static Options options_;
        static std::atomic<size_t> currentLogSize_;
        static std::atomic<int> level_;

        static void log(LogLevel level, const std::string &message);

        static void rotateLogFile();

        static void cleanupOldLogs();

        static std::string currentTimestamp();

        static std::string generateLogFilename();
    };

} // namespace cnc
