//
// Created by Andrea on 19/10/2026.
//

#include "cnc/logger/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace cnc {

    std::ofstream Logger::logFile_;
    std::mutex Logger::logMutex_;
    std::string Logger::currentLogPath_;
    Logger::Options Logger::options_;
    std::atomic<size_t> Logger::currentLogSize_{0};
    std::atomic<int> Logger::level_{static_cast<int>(LogLevel::Warning)};

    void Logger::init() {
        init(Options{});
    }

    void Logger::init(const Options &options) {
        std::lock_guard<std::mutex> lock(logMutex_);
        options_ = options;
        level_ = static_cast<int>(options.level);

        if (logFile_.is_open()) {
            logFile_.close();
        }

        if (options_.fileEnabled) {
            cleanupOldLogs();
            rotateLogFile();
        }
    }

    void Logger::shutdown() {
        std::lock_guard<std::mutex> lock(logMutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    void Logger::setLevel(LogLevel level) {
        level_ = static_cast<int>(level);
    }

    LogLevel Logger::getLevel() {
        return static_cast<LogLevel>(level_.load());
    }

    LogLevel Logger::levelFromString(const std::string &name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "debug") return LogLevel::Debug;
        if (lower == "info") return LogLevel::Info;
        if (lower == "warning" || lower == "warn") return LogLevel::Warning;
        if (lower == "error") return LogLevel::Error;

        throw std::invalid_argument("Unknown log level: " + name);
    }

    std::string Logger::levelToString(LogLevel level) {
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
        return "UNKNOWN";
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

    void Logger::log(LogLevel level, const std::string &message) {
        if (message.empty() || message.find_first_not_of(" \t\r\n") == std::string::npos) {
            return;
        }

        std::string formatted = "[" + levelToString(level) + "] [" + currentTimestamp() + "] " + message;

        std::lock_guard<std::mutex> lock(logMutex_);

        // The file keeps every level, the console only what passes the filter
        if (logFile_.is_open()) {
            if (currentLogSize_ > options_.maxFileSizeBytes) {
                rotateLogFile();
            }
            if (logFile_.is_open()) {
                logFile_ << formatted << std::endl;
                currentLogSize_ += formatted.length() + 1;
            }
        }

        if (static_cast<int>(level) < level_) {
            return;
        }

        if (level == LogLevel::Error || level == LogLevel::Warning) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
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

    void Logger::cleanupOldLogs() {
        try {
            if (!fs::exists(options_.directory)) return;

            std::vector<fs::path> logFiles;
            for (const auto &entry: fs::directory_iterator(options_.directory)) {
                if (entry.path().extension() == ".log") {
                    logFiles.push_back(entry.path());
                }
            }

            // Leave room for the file about to be opened
            size_t keep = options_.maxFiles > 0 ? options_.maxFiles - 1 : 0;
            if (logFiles.size() > keep) {
                std::sort(logFiles.begin(), logFiles.end(), [](const fs::path &a, const fs::path &b) {
                    return fs::last_write_time(a) < fs::last_write_time(b);
                });

                for (size_t i = 0; i < logFiles.size() - keep; ++i) {
                    fs::remove(logFiles[i]);
                }
            }
        } catch (const fs::filesystem_error &e) {
            std::cerr << "[Logger] Cleanup error: " << e.what() << std::endl;
        }
    }

    std::string Logger::currentTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    std::string Logger::generateLogFilename() {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::stringstream ss;
        ss << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S")
           << "_" << std::setw(3) << std::setfill('0') << millis;

        std::error_code ec;
        if (!fs::exists(options_.directory, ec)) {
            fs::create_directories(options_.directory, ec);
        }
        if (ec) {
            std::cerr << "[Logger] ERROR: Cannot create log directory: " << options_.directory
                      << " (" << ec.message() << ")" << std::endl;
        }

        return (fs::path(options_.directory) / ("cnc_interpreter_" + ss.str() + ".log")).string();
    }

} // namespace cnc
