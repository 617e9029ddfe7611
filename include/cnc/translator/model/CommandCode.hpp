//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include <string>
#include <utility>

namespace cnc::translator {

    /**
     * @brief Codice comando: lettera di categoria + numero (es: G1, M30, G38.2).
     */
    struct CommandCode {
        char letter = 'G';
        double number = 0.0;
        // Token as written in the program (e.g. "G01"); empty when built in code
        std::string text;

        CommandCode() = default;

        CommandCode(char letter, double number) : letter(letter), number(number) {}

        CommandCode(char letter, double number, std::string text)
            : letter(letter), number(number), text(std::move(text)) {}

        // The written token when known, otherwise letter + formatted number
        std::string toString() const;

        // Numeric part as written, e.g. "-5" for S-5
        std::string valueText() const;

        // G01 and G1 compare equal: only letter and value take part

        bool operator==(const CommandCode &other) const {
            return letter == other.letter && number == other.number;
        }

        bool operator!=(const CommandCode &other) const {
            return !(*this == other);
        }

        bool operator<(const CommandCode &other) const {
            if (letter != other.letter) return letter < other.letter;
            return number < other.number;
        }
    };

} // namespace cnc::translator
