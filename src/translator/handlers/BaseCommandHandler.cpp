//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/BaseCommandHandler.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/core/utils/FloatFormatter.hpp"
#include <cmath>
#include <limits>
#include <utility>

namespace cnc::translator::handlers {

    using core::types::InvalidParameterException;
    using core::utils::formatFloat;

    namespace {
        // Prefer the text the program used, so a message names the value the user wrote
        std::string describeValue(const Command &command, char letter, double value) {
            if (command.has(letter) && command.get(letter) == value) {
                return command.getText(letter);
            }
            const CommandCode &code = command.getCode();
            if (code.letter == letter && code.number == value) {
                return code.valueText();
            }
            return formatFloat(value);
        }
    }

    BaseCommandHandler::BaseCommandHandler(std::string name)
        : name_(std::move(name)) {}

    void BaseCommandHandler::acceptOnly(const Command &command, const std::string &accepted,
                                        size_t lineNumber) const {
        for (const auto &[letter, value]: command.getParams()) {
            if (accepted.find(letter) == std::string::npos) {
                throw InvalidParameterException(lineNumber, command.getCode().toString(), letter,
                                                "parameter not accepted");
            }
        }
    }

    double BaseCommandHandler::requireParam(const Command &command, char letter, size_t lineNumber) const {
        if (!command.has(letter)) {
            throw InvalidParameterException(lineNumber, command.getCode().toString(), letter,
                                            "required parameter missing");
        }
        return command.get(letter);
    }

    void BaseCommandHandler::requirePositive(const Command &command, char letter, double value,
                                             size_t lineNumber) const {
        if (!(value > 0.0)) {
            throw InvalidParameterException(lineNumber, command.getCode().toString(), letter,
                                            "value " + describeValue(command, letter, value) + " must be greater than 0");
        }
    }

    void BaseCommandHandler::requireNonNegative(const Command &command, char letter, double value,
                                                size_t lineNumber) const {
        if (value < 0.0) {
            throw InvalidParameterException(lineNumber, command.getCode().toString(), letter,
                                            "value " + describeValue(command, letter, value) + " must not be negative");
        }
    }

    int BaseCommandHandler::requireIndex(const Command &command, char letter, double value,
                                         size_t lineNumber) const {
        if (value < 0.0 || value != std::floor(value) ||
            value > static_cast<double>(std::numeric_limits<int>::max())) {
            throw InvalidParameterException(lineNumber, command.getCode().toString(), letter,
                                            "value " + describeValue(command, letter, value) +
                                            " must be a non-negative integer");
        }
        return static_cast<int>(value);
    }

    void BaseCommandHandler::unsupported(const Command &command, size_t lineNumber) const {
        throw core::types::UnsupportedCommandException(lineNumber, command.getCode().toString());
    }

} // namespace cnc::translator::handlers
