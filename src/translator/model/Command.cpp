//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/model/Command.hpp"
#include "cnc/core/utils/FloatFormatter.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cnc::translator {

    Command::Command(CommandCode code, Parameters params, std::optional<long> blockNumber,
                     ParameterText paramText)
        : code_(std::move(code)), params_(std::move(params)), blockNumber_(blockNumber),
          paramText_(std::move(paramText)) {}

    bool Command::has(char letter) const {
        return params_.count(letter) > 0;
    }

    double Command::get(char letter) const {
        auto it = params_.find(letter);
        if (it == params_.end()) {
            throw std::out_of_range(code_.toString() + " has no parameter " + std::string(1, letter));
        }
        return it->second;
    }

    double Command::getOr(char letter, double fallback) const {
        auto it = params_.find(letter);
        return it != params_.end() ? it->second : fallback;
    }

    std::string Command::getText(char letter) const {
        auto it = paramText_.find(letter);
        if (it != paramText_.end()) {
            return it->second;
        }
        return core::utils::formatFloat(get(letter));
    }

    std::string Command::toString() const {
        std::stringstream ss;
        if (blockNumber_) {
            ss << "N" << *blockNumber_ << " ";
        }
        ss << code_.toString();
        for (const auto &entry: params_) {
            ss << " " << entry.first << getText(entry.first);
        }
        return ss.str();
    }

    bool Command::operator==(const Command &other) const {
        return code_ == other.code_ && params_ == other.params_ && blockNumber_ == other.blockNumber_;
    }

} // namespace cnc::translator
