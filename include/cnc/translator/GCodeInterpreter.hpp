//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/CommandDispatcher.hpp"
#include "cnc/translator/Diagnostic.hpp"
#include "cnc/translator/parser/GCodeLineParser.hpp"
#include "cnc/core/state/MachineState.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cnc::translator {

    /**
     * @brief Esegue un programma GCode riga per riga.
     *
     * Possiede lo stato macchina e il contatore di riga (da 1). Ogni riga
     * viene analizzata ed eseguita prima di leggere la successiva. Gli errori
     * diventano diagnostiche; con ErrorPolicy::Abort il primo viene rilanciato.
     */
    class GCodeInterpreter {
    public:
        explicit GCodeInterpreter(std::shared_ptr<const HandlerRegistry> registry,
                                  InterpreterOptions options = InterpreterOptions{});

        /**
         * @throws core::types::FileException se il file non esiste o non è leggibile.
         */
        void processFile(const std::string &filePath);

        void processLines(const std::vector<std::string> &lines);

        // Returns false once processing has stopped (program end or abort)
        bool processLine(const std::string &line);

        const core::state::MachineState &getState() const { return state_; }

        const std::vector<Diagnostic> &getDiagnostics() const { return diagnostics_; }

        const InterpreterOptions &getOptions() const { return options_; }

        size_t getLinesProcessed() const { return lineNumber_; }

        size_t getCommandsExecuted() const { return state_.getExecutedCommands(); }

        size_t getIgnoredLines() const { return ignoredLines_; }

        bool isAborted() const { return aborted_; }

        bool isStopped() const { return stopped_; }

        void reset();

        nlohmann::json buildReport() const;

    private:
        GCodeLineParser parser_;
        CommandDispatcher dispatcher_;
        InterpreterOptions options_;
        core::state::MachineState state_;
        std::vector<Diagnostic> diagnostics_;
        size_t lineNumber_ = 0;
        size_t ignoredLines_ = 0;
        bool aborted_ = false;
        bool stopped_ = false;

        void report(const core::types::InterpreterException &error);

        void warnIgnoredLines() const;

        void checkReadable(const std::string &filePath) const;
    };

} // namespace cnc::translator
