//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/model/Command.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cnc::translator {

    /**
     * @brief Turns one line of program text into a Command.
     *
     * Grammar of a line, after comments are removed:
     *   [N<digits>] <code letter><number> (<letter><number>)*
     * Comments start with ';' (rest of line) or are enclosed in '(' ')'.
     * '%' and program number lines (O1234) carry no command.
     *
     * The parser keeps no mutable state: parsing the same text twice gives
     * equal commands. It does not know which letters a code accepts.
     */
    class GCodeLineParser {
    public:
        static constexpr const char *DEFAULT_COMMAND_LETTERS = "GMTSF";

        GCodeLineParser();

        explicit GCodeLineParser(std::string commandLetters);

        /**
         * @brief Analizza una riga.
         * @param line Testo grezzo della riga.
         * @param lineNumber Numero di riga (1-based), usato solo nei messaggi.
         * @return Il comando, oppure std::nullopt se la riga non contiene comandi.
         * @throws core::types::ParseException se la riga è malformata.
         */
        std::optional<Command> parse(const std::string &line, size_t lineNumber) const;

        // Removes ';' and '( )' comments and surrounding whitespace
        static std::string stripComments(const std::string &line, size_t lineNumber);

        const std::string &getCommandLetters() const { return commandLetters_; }

    private:
        std::string commandLetters_;

        CommandCode parseCode(const std::string &token, size_t lineNumber) const;

        static std::vector<std::string> tokenize(const std::string &text);

        static double parseNumber(const std::string &token, size_t lineNumber);

        static bool isProgramMarker(const std::string &text);
    };

} // namespace cnc::translator
