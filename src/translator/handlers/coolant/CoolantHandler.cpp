//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/coolant/CoolantHandler.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    using core::state::CoolantState;
    using core::state::MachineState;

    CoolantHandler::CoolantHandler()
        : BaseCommandHandler("CoolantHandler") {}

    void CoolantHandler::apply(const Command &command, MachineState &state, size_t lineNumber) const {
        double number = command.getCode().number;
        CoolantState coolant = CoolantState::Off;
        if (number == 7) {
            coolant = CoolantState::Mist;
        } else if (number == 8) {
            coolant = CoolantState::Flood;
        } else if (number != 9) {
            unsupported(command, lineNumber);
        }

        acceptOnly(command, "", lineNumber);
        state.setCoolantState(coolant);
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": coolant " +
                        MachineState::coolantStateToString(coolant));
    }

} // namespace cnc::translator::handlers
