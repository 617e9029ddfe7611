//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/Diagnostic.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace cnc::application {

    enum class ExitCode : int {
        Success = 0,
        Fatal = 1,       // file error, invalid configuration, unexpected exception
        Aborted = 2,     // first error under the abort policy
        Diagnostics = 3, // errors reported and interpreter.fail.on.diagnostics set
        Usage = 64
    };

    struct CommandLineOptions {
        std::string inputFile;
        std::optional<std::string> configPath;
        bool abortOnError = false;
        bool verbose = false;
        bool help = false;
    };

    class ApplicationController {
    public:
        ApplicationController(std::ostream &out, std::ostream &err);

        /**
         * @brief Legge gli argomenti della riga di comando (args[0] è il nome del programma).
         * @return std::nullopt se gli argomenti non sono validi; il motivo è scritto su err.
         */
        std::optional<CommandLineOptions> parseArguments(const std::vector<std::string> &args) const;

        // Loads configuration, runs the interpreter and returns the process exit code
        ExitCode run(const CommandLineOptions &options);

        ExitCode run(const std::vector<std::string> &args);

    private:
        std::ostream &out_;
        std::ostream &err_;

        bool loadConfiguration(const CommandLineOptions &options);

        void initializeLogger() const;

        translator::InterpreterOptions buildInterpreterOptions() const;

        static void printUsage(std::ostream &stream, const std::string &program);
    };

} // namespace cnc::application
