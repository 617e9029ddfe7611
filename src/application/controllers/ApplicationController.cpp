//
// Created by Andrea on 19/10/2026.
//

#include "cnc/application/controllers/ApplicationController.hpp"
#include "cnc/application/config/ConfigManager.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/logger/Logger.hpp"
#include "cnc/translator/GCodeInterpreter.hpp"
#include "cnc/translator/registry/HandlerRegistry.hpp"
#include <memory>
#include <ostream>

namespace cnc::application {

    using config::ConfigManager;

    ApplicationController::ApplicationController(std::ostream &out, std::ostream &err)
        : out_(out), err_(err) {}

    std::optional<CommandLineOptions> ApplicationController::parseArguments(
        const std::vector<std::string> &args) const {
        CommandLineOptions options;
        std::string program = args.empty() ? "cnc-interpreter" : args[0];
        bool positionalOnly = false;

        for (size_t i = 1; i < args.size(); ++i) {
            const std::string &arg = args[i];

            if (!positionalOnly && arg.size() > 1 && arg[0] == '-') {
                if (arg == "--") {
                    positionalOnly = true;
                } else if (arg == "--help" || arg == "-h") {
                    options.help = true;
                    return options;
                } else if (arg == "--abort-on-error") {
                    options.abortOnError = true;
                } else if (arg == "--verbose" || arg == "-v") {
                    options.verbose = true;
                } else if (arg == "--config") {
                    if (i + 1 >= args.size()) {
                        err_ << program << ": option --config requires a path" << std::endl;
                        printUsage(err_, program);
                        return std::nullopt;
                    }
                    options.configPath = args[++i];
                } else if (arg.rfind("--config=", 0) == 0) {
                    options.configPath = arg.substr(9);
                } else {
                    err_ << program << ": unknown option " << arg << std::endl;
                    printUsage(err_, program);
                    return std::nullopt;
                }
                continue;
            }

            if (!options.inputFile.empty()) {
                err_ << program << ": unexpected argument " << arg << std::endl;
                printUsage(err_, program);
                return std::nullopt;
            }
            options.inputFile = arg;
        }

        if (options.inputFile.empty()) {
            err_ << program << ": missing input file" << std::endl;
            printUsage(err_, program);
            return std::nullopt;
        }

        return options;
    }

    ExitCode ApplicationController::run(const std::vector<std::string> &args) {
        auto options = parseArguments(args);
        if (!options) {
            return ExitCode::Usage;
        }
        if (options->help) {
            printUsage(out_, args.empty() ? "cnc-interpreter" : args[0]);
            return ExitCode::Success;
        }
        return run(*options);
    }

    ExitCode ApplicationController::run(const CommandLineOptions &options) {
        if (!loadConfiguration(options)) {
            return ExitCode::Fatal;
        }
        initializeLogger();

        const auto &config = ConfigManager::getInstance();
        auto registry = std::make_shared<const translator::HandlerRegistry>(
            translator::HandlerRegistry::createDefault());
        translator::GCodeInterpreter interpreter(registry, buildInterpreterOptions());

        ExitCode exitCode = ExitCode::Success;
        try {
            interpreter.processFile(options.inputFile);
        } catch (const core::types::FileException &e) {
            Logger::logError(e.what());
            Logger::shutdown();
            return ExitCode::Fatal;
        } catch (const core::types::InterpreterException &) {
            // Already reported by the interpreter
            exitCode = ExitCode::Aborted;
        }

        if (exitCode == ExitCode::Success && !interpreter.getDiagnostics().empty()) {
            Logger::logWarning("[ApplicationController] " + std::to_string(interpreter.getDiagnostics().size()) +
                               " problem(s) reported in " + options.inputFile);
            if (config.getInterpreterConfig().failOnDiagnostics) {
                exitCode = ExitCode::Diagnostics;
            }
        }

        if (config.getReportConfig().finalState) {
            out_ << interpreter.buildReport().dump(2) << std::endl;
        }

        Logger::shutdown();
        return exitCode;
    }

    bool ApplicationController::loadConfiguration(const CommandLineOptions &options) {
        auto &config = ConfigManager::getInstance();

        std::string path = options.configPath.value_or("config.json");
        if (!config.loadFromFile(path) && options.configPath) {
            Logger::logWarning("[ApplicationController] Config file not found: " + path + ", using defaults");
        }
        config.loadFromEnv();

        // Command line wins over file and environment
        if (options.abortOnError) {
            config.set("interpreter.error.policy", "abort");
        }
        if (options.verbose) {
            config.set("logger.level", "info");
        }

        auto validation = config.validate();
        if (!validation.isValid) {
            for (const auto &error: validation.errors) {
                Logger::logError("[ApplicationController] Invalid configuration: " + error);
            }
            return false;
        }
        return true;
    }

    void ApplicationController::initializeLogger() const {
        auto loggerConfig = ConfigManager::getInstance().getLoggerConfig();

        Logger::Options loggerOptions;
        loggerOptions.level = Logger::levelFromString(loggerConfig.level);
        loggerOptions.fileEnabled = loggerConfig.fileEnabled;
        loggerOptions.directory = loggerConfig.directory;
        loggerOptions.maxFileSizeBytes = static_cast<size_t>(loggerConfig.maxSizeMb) * 1024 * 1024;
        loggerOptions.maxFiles = static_cast<size_t>(loggerConfig.maxFiles);
        Logger::init(loggerOptions);
    }

    translator::InterpreterOptions ApplicationController::buildInterpreterOptions() const {
        auto interpreterConfig = ConfigManager::getInstance().getInterpreterConfig();

        translator::InterpreterOptions options;
        options.errorPolicy = translator::errorPolicyFromString(interpreterConfig.errorPolicy);
        options.stopAtProgramEnd = interpreterConfig.stopAtProgramEnd;
        options.requireGcodeExtension = interpreterConfig.requireGcodeExtension;
        return options;
    }

    void ApplicationController::printUsage(std::ostream &stream, const std::string &program) {
        stream << "Usage: " << program << " [options] <file>\n"
               << "\n"
               << "Options:\n"
               << "  --config <path>     JSON configuration file (default: config.json)\n"
               << "  --abort-on-error    stop at the first error instead of reporting and continuing\n"
               << "  -v, --verbose       log every executed command\n"
               << "  -h, --help          show this message\n";
    }

} // namespace cnc::application
