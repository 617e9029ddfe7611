//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/model/CommandCode.hpp"
#include <map>
#include <optional>
#include <string>

namespace cnc::translator {

    /**
     * @brief One parsed GCode block: the code and its lettered parameters.
     */
    class Command {
    public:
        using Parameters = std::map<char, double>;
        // Parameter values as written in the program, keyed by letter
        using ParameterText = std::map<char, std::string>;

        explicit Command(CommandCode code, Parameters params = {}, std::optional<long> blockNumber = std::nullopt,
                         ParameterText paramText = {});

        const CommandCode &getCode() const { return code_; }

        const Parameters &getParams() const { return params_; }

        // N word that prefixed the line, if any
        std::optional<long> getBlockNumber() const { return blockNumber_; }

        bool has(char letter) const;

        // Throws std::out_of_range when the letter is absent
        double get(char letter) const;

        double getOr(char letter, double fallback) const;

        // Value of a parameter as written, or formatted when no text was kept
        std::string getText(char letter) const;

        std::string toString() const;

        bool operator==(const Command &other) const;

        bool operator!=(const Command &other) const { return !(*this == other); }

    private:
        CommandCode code_;
        Parameters params_;
        std::optional<long> blockNumber_;
        ParameterText paramText_;
    };

} // namespace cnc::translator
