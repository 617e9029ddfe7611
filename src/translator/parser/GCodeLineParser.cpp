//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/parser/GCodeLineParser.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>
#include <sstream>
#include <stdexcept>

namespace cnc::translator {

    namespace {
        // Optional sign, digits with an optional decimal point; no exponent
        const std::regex NUMBER_PATTERN(R"(^[+-]?(\d+\.?\d*|\.\d+)$)");
        const std::regex BLOCK_NUMBER_PATTERN(R"(^N\d+$)");
        const std::regex PROGRAM_NUMBER_PATTERN(R"(^O\d+$)");

        char toUpper(unsigned char c) {
            return static_cast<char>(std::toupper(c));
        }

        std::string trim(const std::string &text) {
            const char *whitespace = " \t\r\n\f\v";
            size_t begin = text.find_first_not_of(whitespace);
            if (begin == std::string::npos) return "";
            size_t end = text.find_last_not_of(whitespace);
            return text.substr(begin, end - begin + 1);
        }
    }

    using core::types::ParseException;

    GCodeLineParser::GCodeLineParser()
        : commandLetters_(DEFAULT_COMMAND_LETTERS) {}

    GCodeLineParser::GCodeLineParser(std::string commandLetters)
        : commandLetters_(std::move(commandLetters)) {
        std::transform(commandLetters_.begin(), commandLetters_.end(), commandLetters_.begin(), toUpper);
    }

    std::optional<Command> GCodeLineParser::parse(const std::string &line, size_t lineNumber) const {
        std::string text = stripComments(line, lineNumber);
        if (text.empty()) {
            return std::nullopt;
        }

        // Letters are case-insensitive
        std::transform(text.begin(), text.end(), text.begin(), toUpper);

        if (isProgramMarker(text)) {
            Logger::logDebug("[GCodeLineParser] Line " + std::to_string(lineNumber) + ": program marker " + text);
            return std::nullopt;
        }

        std::vector<std::string> tokens = tokenize(text);
        size_t index = 0;

        std::optional<long> blockNumber;
        if (std::regex_match(tokens[0], BLOCK_NUMBER_PATTERN)) {
            try {
                blockNumber = std::stol(tokens[0].substr(1));
            } catch (const std::out_of_range &) {
                throw ParseException(lineNumber, tokens[0], "block number out of range");
            }
            index++;
        }

        if (index == tokens.size()) {
            return std::nullopt;
        }

        CommandCode code = parseCode(tokens[index], lineNumber);

        Command::Parameters params;
        Command::ParameterText paramText;
        for (++index; index < tokens.size(); ++index) {
            const std::string &token = tokens[index];

            if (!std::isalpha(static_cast<unsigned char>(token[0]))) {
                throw ParseException(lineNumber, token, "expected a parameter letter");
            }
            if (token.length() < 2) {
                throw ParseException(lineNumber, token, "missing numeric value");
            }

            char letter = token[0];
            double value = parseNumber(token, lineNumber);

            if (params.count(letter)) {
                throw ParseException(lineNumber, token,
                                     "duplicate parameter letter '" + std::string(1, letter) + "'");
            }
            params[letter] = value;
            paramText[letter] = token.substr(1);
        }

        Command command(std::move(code), std::move(params), blockNumber, std::move(paramText));
        Logger::logDebug("[GCodeLineParser] Line " + std::to_string(lineNumber) + ": " + command.toString());
        return command;
    }

    std::string GCodeLineParser::stripComments(const std::string &line, size_t lineNumber) {
        std::string result;
        result.reserve(line.size());

        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (c == ';') {
                break;
            }
            if (c == '(') {
                size_t close = line.find(')', i + 1);
                if (close == std::string::npos) {
                    throw ParseException(lineNumber, trim(line.substr(i)), "unterminated comment");
                }
                // A comment may sit between two words: G0(rapid)X1
                result.push_back(' ');
                i = close;
                continue;
            }
            result.push_back(c);
        }

        return trim(result);
    }

    CommandCode GCodeLineParser::parseCode(const std::string &token, size_t lineNumber) const {
        char letter = token[0];

        if (!std::isalpha(static_cast<unsigned char>(letter))) {
            throw ParseException(lineNumber, token, "missing command letter");
        }
        if (commandLetters_.find(letter) == std::string::npos) {
            throw ParseException(lineNumber, token,
                                 "unsupported command letter '" + std::string(1, letter) + "'");
        }
        if (token.length() < 2) {
            throw ParseException(lineNumber, token, "missing numeric value");
        }

        return {letter, parseNumber(token, lineNumber), token};
    }

    std::vector<std::string> GCodeLineParser::tokenize(const std::string &text) {
        std::istringstream stream(text);
        std::vector<std::string> tokens;
        std::string token;
        while (stream >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    double GCodeLineParser::parseNumber(const std::string &token, size_t lineNumber) {
        std::string digits = token.substr(1);
        if (!std::regex_match(digits, NUMBER_PATTERN)) {
            throw ParseException(lineNumber, token, "invalid numeric value '" + digits + "'");
        }

        try {
            return std::stod(digits);
        } catch (const std::out_of_range &) {
            throw ParseException(lineNumber, token, "numeric value out of range");
        }
    }

    bool GCodeLineParser::isProgramMarker(const std::string &text) {
        return text == "%" || std::regex_match(text, PROGRAM_NUMBER_PATTERN);
    }

} // namespace cnc::translator
