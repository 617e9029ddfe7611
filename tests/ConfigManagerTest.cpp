#include "cnc/application/config/ConfigManager.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using cnc::config::ConfigManager;

namespace {
    class ConfigManagerTest : public ::testing::Test {
    protected:
        ConfigManager &config = ConfigManager::getInstance();
        fs::path file = fs::temp_directory_path() / "cnc_interpreter_config_test.json";

        void SetUp() override {
            config.setDefaults();
        }

        void TearDown() override {
            std::error_code ec;
            fs::remove(file, ec);
            unsetenv("CNC_INTERPRETER_ERROR_POLICY");
            unsetenv("CNC_LOGGER_MAX_FILES");
            config.setDefaults();
        }

        void write(const std::string &content) {
            std::ofstream out(file);
            out << content;
        }
    };
}

TEST_F(ConfigManagerTest, Defaults) {
    auto interpreter = config.getInterpreterConfig();
    EXPECT_EQ(interpreter.errorPolicy, "continue");
    EXPECT_TRUE(interpreter.stopAtProgramEnd);
    EXPECT_FALSE(interpreter.requireGcodeExtension);
    EXPECT_FALSE(interpreter.failOnDiagnostics);

    auto logger = config.getLoggerConfig();
    EXPECT_EQ(logger.level, "warning");
    EXPECT_FALSE(logger.fileEnabled);
    EXPECT_EQ(logger.maxSizeMb, 50);
    EXPECT_EQ(logger.maxFiles, 10);

    EXPECT_TRUE(config.getReportConfig().finalState);
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, MissingFileKeepsDefaults) {
    config.set("logger.level", "debug");

    EXPECT_FALSE(config.loadFromFile("/nonexistent/cnc/config.json"));
    EXPECT_EQ(config.getLoggerConfig().level, "warning");
}

TEST_F(ConfigManagerTest, LoadsNestedSections) {
    write(R"({
        "interpreter": {"error": {"policy": "abort"}, "fail": {"on": {"diagnostics": true}}},
        "logger": {"level": "debug", "max": {"files": 3}},
        "report": {"final": {"state": false}}
    })");

    EXPECT_TRUE(config.loadFromFile(file.string()));

    EXPECT_EQ(config.getInterpreterConfig().errorPolicy, "abort");
    EXPECT_TRUE(config.getInterpreterConfig().failOnDiagnostics);
    EXPECT_EQ(config.getLoggerConfig().level, "debug");
    EXPECT_EQ(config.getLoggerConfig().maxFiles, 3);
    EXPECT_FALSE(config.getReportConfig().finalState);
    // Keys absent from the file keep their default
    EXPECT_TRUE(config.getInterpreterConfig().stopAtProgramEnd);
}

TEST_F(ConfigManagerTest, LoadsDottedKeys) {
    write(R"({"interpreter.stop.at.program.end": false, "logger.directory": "/tmp/cnc-logs"})");

    EXPECT_TRUE(config.loadFromFile(file.string()));

    EXPECT_FALSE(config.getInterpreterConfig().stopAtProgramEnd);
    EXPECT_EQ(config.getLoggerConfig().directory, "/tmp/cnc-logs");
}

TEST_F(ConfigManagerTest, MalformedFileFallsBackToDefaults) {
    write("{ \"logger\": { \"level\": ");

    EXPECT_TRUE(config.loadFromFile(file.string()));
    EXPECT_EQ(config.getLoggerConfig().level, "warning");
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    write(R"({"interpreter": {"error": {"policy": "continue"}}})");
    setenv("CNC_INTERPRETER_ERROR_POLICY", "abort", 1);
    setenv("CNC_LOGGER_MAX_FILES", "4", 1);

    config.loadFromFile(file.string());
    config.loadFromEnv();

    EXPECT_EQ(config.getInterpreterConfig().errorPolicy, "abort");
    EXPECT_EQ(config.getLoggerConfig().maxFiles, 4);
}

TEST_F(ConfigManagerTest, ValidationReportsEveryBadValue) {
    config.set("interpreter.error.policy", "retry");
    config.set("logger.level", "loud");
    config.set("logger.max.files", "0");

    auto result = config.validate();

    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 3u);
}

TEST_F(ConfigManagerTest, NonNumericValueUsesDefault) {
    config.set("logger.max.size.mb", "lots");

    EXPECT_EQ(config.getLoggerConfig().maxSizeMb, 50);
    EXPECT_EQ(config.get<int>("logger.max.size.mb", 7), 7);
    EXPECT_EQ(config.get<std::string>("does.not.exist", "fallback"), "fallback");
}
