//
// Created by Andrea on 19/10/2026.
//

#include "cnc/application/config/ConfigManager.hpp"
#include "cnc/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>

namespace cnc::config {
    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    ConfigManager::ConfigManager() {
        setDefaultsLocked();
    }

    bool ConfigManager::loadFromFile(const std::string &configPath) {
        std::lock_guard<std::mutex> lock(configMutex_);
        configPath_ = configPath;
        setDefaultsLocked();

        if (!std::filesystem::exists(configPath)) {
            Logger::logInfo("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            return false;
        }

        try {
            std::ifstream file(configPath);
            nlohmann::json json;
            file >> json;

            // Flatten JSON into key-value pairs
            std::function<void(const nlohmann::json &, const std::string &)> flatten;
            flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
                for (auto it = obj.begin(); it != obj.end(); ++it) {
                    std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                    if (it.value().is_object()) {
                        flatten(it.value(), key);
                    } else if (it.value().is_string()) {
                        config_[key] = it.value().get<std::string>();
                    } else {
                        config_[key] = it.value().dump();
                    }
                }
            };

            if (!json.is_object()) {
                throw std::runtime_error("top-level value must be an object");
            }

            flatten(json, "");

            Logger::logInfo(
                "[ConfigManager] Loaded " + std::to_string(config_.size()) + " settings from " + configPath);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Failed to load config " + configPath + ": " + std::string(e.what()));
            setDefaultsLocked();
        }
        return true;
    }

    void ConfigManager::loadFromEnv() {
        std::lock_guard<std::mutex> lock(configMutex_);

        const char *envVars[] = {
            "CNC_INTERPRETER_ERROR_POLICY", "CNC_INTERPRETER_STOP_AT_PROGRAM_END",
            "CNC_INTERPRETER_REQUIRE_GCODE_EXTENSION", "CNC_INTERPRETER_FAIL_ON_DIAGNOSTICS",
            "CNC_LOGGER_LEVEL", "CNC_LOGGER_FILE_ENABLED", "CNC_LOGGER_DIRECTORY",
            "CNC_LOGGER_MAX_SIZE_MB", "CNC_LOGGER_MAX_FILES",
            "CNC_REPORT_FINAL_STATE"
        };

        int loaded = 0;
        for (const char *envVar: envVars) {
            const char *value = std::getenv(envVar);
            if (value) {
                // Convert CNC_SECTION_NAME to section.name
                std::string key = std::string(envVar).substr(4);
                std::transform(key.begin(), key.end(), key.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                std::replace(key.begin(), key.end(), '_', '.');

                config_[key] = value;
                loaded++;
            }
        }

        Logger::logInfo("[ConfigManager] Loaded " + std::to_string(loaded) + " settings from environment");
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_[key] = value;
    }

    void ConfigManager::setDefaults() {
        std::lock_guard<std::mutex> lock(configMutex_);
        setDefaultsLocked();
    }

    InterpreterConfig ConfigManager::getInterpreterConfig() const {
        InterpreterConfig config;
        config.errorPolicy = get<std::string>("interpreter.error.policy", "continue");
        config.stopAtProgramEnd = get<bool>("interpreter.stop.at.program.end", true);
        config.requireGcodeExtension = get<bool>("interpreter.require.gcode.extension", false);
        config.failOnDiagnostics = get<bool>("interpreter.fail.on.diagnostics", false);
        return config;
    }

    LoggerConfig ConfigManager::getLoggerConfig() const {
        LoggerConfig config;
        config.level = get<std::string>("logger.level", "warning");
        config.fileEnabled = get<bool>("logger.file.enabled", false);
        config.directory = get<std::string>("logger.directory", "logs");
        config.maxSizeMb = get<int>("logger.max.size.mb", 50);
        config.maxFiles = get<int>("logger.max.files", 10);
        return config;
    }

    ReportConfig ConfigManager::getReportConfig() const {
        ReportConfig config;
        config.finalState = get<bool>("report.final.state", true);
        return config;
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        std::string policy = get<std::string>("interpreter.error.policy", "");
        if (policy != "continue" && policy != "abort") {
            result.errors.push_back("interpreter.error.policy must be 'continue' or 'abort' (got '" + policy + "')");
        }

        std::string level = get<std::string>("logger.level", "");
        try {
            Logger::levelFromString(level);
        } catch (const std::invalid_argument &) {
            result.errors.push_back("logger.level must be one of debug, info, warning, error (got '" + level + "')");
        }

        if (get<int>("logger.max.size.mb", -1) < 1) {
            result.errors.push_back("logger.max.size.mb must be >= 1");
        }

        if (get<int>("logger.max.files", -1) < 1) {
            result.errors.push_back("logger.max.files must be >= 1");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::setDefaultsLocked() {
        config_.clear();

        // Interpreter defaults
        config_["interpreter.error.policy"] = "continue";
        config_["interpreter.stop.at.program.end"] = "true";
        config_["interpreter.require.gcode.extension"] = "false";
        config_["interpreter.fail.on.diagnostics"] = "false";

        // Logger defaults
        config_["logger.level"] = "warning";
        config_["logger.file.enabled"] = "false";
        config_["logger.directory"] = "logs";
        config_["logger.max.size.mb"] = "50";
        config_["logger.max.files"] = "10";

        // Report defaults
        config_["report.final.state"] = "true";
    }
} // namespace cnc::config
