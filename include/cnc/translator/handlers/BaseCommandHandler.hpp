//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/translator/handlers/ICommandHandler.hpp"
#include <string>

namespace cnc::translator::handlers {

    /**
     * @brief Base comune degli handler: validazione dei parametri.
     *
     * Gli handler validano tutti i parametri prima di modificare lo stato:
     * un comando rifiutato non lascia effetti parziali.
     */
    class BaseCommandHandler : public ICommandHandler {
    protected:
        explicit BaseCommandHandler(std::string name);

        // Throws InvalidParameterException for the first letter not in `accepted`
        void acceptOnly(const Command &command, const std::string &accepted, size_t lineNumber) const;

        double requireParam(const Command &command, char letter, size_t lineNumber) const;

        void requirePositive(const Command &command, char letter, double value, size_t lineNumber) const;

        void requireNonNegative(const Command &command, char letter, double value, size_t lineNumber) const;

        // Non-negative integral value, e.g. a tool number
        int requireIndex(const Command &command, char letter, double value, size_t lineNumber) const;

        [[noreturn]] void unsupported(const Command &command, size_t lineNumber) const;

        std::string logPrefix() const { return "[" + name_ + "] "; }

    private:
        std::string name_;
    };

} // namespace cnc::translator::handlers
