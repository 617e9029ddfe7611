//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include <cstddef>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace cnc::config {
    struct InterpreterConfig {
        std::string errorPolicy = "continue";
        bool stopAtProgramEnd = true;
        bool requireGcodeExtension = false;
        bool failOnDiagnostics = false;
    };

    struct LoggerConfig {
        std::string level = "warning";
        bool fileEnabled = false;
        std::string directory = "logs";
        int maxSizeMb = 50;
        int maxFiles = 10;
    };

    struct ReportConfig {
        bool finalState = true;
    };

    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        // Load configuration. Returns false when the file does not exist.
        bool loadFromFile(const std::string &configPath = "config.json");

        void loadFromEnv();

        void set(const std::string &key, const std::string &value);

        void setDefaults();

        // Configuration access
        InterpreterConfig getInterpreterConfig() const;

        LoggerConfig getLoggerConfig() const;

        ReportConfig getReportConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        // Validation
        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        ConfigManager();

        mutable std::mutex configMutex_;
        std::unordered_map<std::string, std::string> config_;
        std::string configPath_;

        void setDefaultsLocked();
    };

    // Template specializations
    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::logic_error &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stod(it->second);
        } catch (const std::logic_error &) {
            return defaultValue;
        }
    }
} // namespace cnc::config
