//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/GCodeInterpreter.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/logger/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace cnc::translator {

    using core::types::FileException;
    using core::types::InterpreterException;
    using core::types::ParseException;

    GCodeInterpreter::GCodeInterpreter(std::shared_ptr<const HandlerRegistry> registry, InterpreterOptions options)
        : dispatcher_(std::move(registry)), options_(options) {
        Logger::logInfo("[GCodeInterpreter] Created with " +
                        std::to_string(dispatcher_.getRegistry().size()) + " registry entries, error policy: " +
                        errorPolicyToString(options_.errorPolicy));
    }

    void GCodeInterpreter::processFile(const std::string &filePath) {
        checkReadable(filePath);

        std::ifstream file(filePath);
        if (!file.is_open()) {
            throw FileException(filePath, "cannot open file");
        }

        Logger::logInfo("[GCodeInterpreter] Processing file: " + filePath);

        std::string line;
        while (std::getline(file, line)) {
            processLine(line);
        }

        if (file.bad()) {
            throw FileException(filePath, "read error after line " + std::to_string(lineNumber_));
        }

        warnIgnoredLines();
        Logger::logInfo("[GCodeInterpreter] Finished " + filePath + ": " + std::to_string(lineNumber_) +
                        " lines, " + std::to_string(getCommandsExecuted()) + " commands, " +
                        std::to_string(diagnostics_.size()) + " diagnostics");
    }

    void GCodeInterpreter::processLines(const std::vector<std::string> &lines) {
        for (const auto &line: lines) {
            processLine(line);
        }
        warnIgnoredLines();
    }

    bool GCodeInterpreter::processLine(const std::string &line) {
        size_t lineNumber = ++lineNumber_;

        if (stopped_) {
            try {
                if (!GCodeLineParser::stripComments(line, lineNumber).empty()) {
                    ignoredLines_++;
                }
            } catch (const ParseException &) {
                ignoredLines_++;
            }
            return false;
        }

        try {
            auto command = parser_.parse(line, lineNumber);
            if (!command) {
                return true;
            }
            dispatcher_.dispatch(*command, state_, lineNumber);
        } catch (const InterpreterException &e) {
            report(e);
            if (options_.errorPolicy == ErrorPolicy::Abort) {
                aborted_ = true;
                stopped_ = true;
                Logger::logError("[GCodeInterpreter] Aborting at line " + std::to_string(lineNumber));
                throw;
            }
            return true;
        }

        if (options_.stopAtProgramEnd && state_.isProgramEnded()) {
            stopped_ = true;
            Logger::logInfo("[GCodeInterpreter] Program end reached at line " + std::to_string(lineNumber));
            return false;
        }
        return true;
    }

    void GCodeInterpreter::reset() {
        state_.reset();
        diagnostics_.clear();
        lineNumber_ = 0;
        ignoredLines_ = 0;
        aborted_ = false;
        stopped_ = false;
    }

    nlohmann::json GCodeInterpreter::buildReport() const {
        nlohmann::json diagnostics = nlohmann::json::array();
        for (const auto &diagnostic: diagnostics_) {
            diagnostics.push_back({
                {"kind", core::types::errorKindToString(diagnostic.kind)},
                {"line", diagnostic.lineNumber},
                {"message", diagnostic.message}
            });
        }

        return {
            {"state", state_.toJson()},
            {"summary", {
                {"linesProcessed", lineNumber_},
                {"commandsExecuted", getCommandsExecuted()},
                {"diagnostics", diagnostics_.size()},
                {"ignoredLines", ignoredLines_},
                {"aborted", aborted_},
                {"errorPolicy", errorPolicyToString(options_.errorPolicy)}
            }},
            {"diagnostics", diagnostics}
        };
    }

    void GCodeInterpreter::report(const InterpreterException &error) {
        diagnostics_.push_back({error.kind(), error.lineNumber(), error.what()});
        Logger::logError(error.what());
    }

    void GCodeInterpreter::warnIgnoredLines() const {
        if (ignoredLines_ > 0) {
            Logger::logWarning("[GCodeInterpreter] " + std::to_string(ignoredLines_) +
                               " line(s) after the end of the program were ignored");
        }
    }

    void GCodeInterpreter::checkReadable(const std::string &filePath) const {
        std::error_code ec;
        if (!fs::exists(filePath, ec)) {
            throw FileException(filePath, "file does not exist");
        }
        if (!fs::is_regular_file(filePath, ec)) {
            throw FileException(filePath, "not a regular file");
        }
        if (options_.requireGcodeExtension && fs::path(filePath).extension() != ".gcode") {
            throw FileException(filePath, "expected a '.gcode' file");
        }
    }

} // namespace cnc::translator
