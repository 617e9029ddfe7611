//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/program/ProgramHandler.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    using core::state::CoolantState;
    using core::state::SpindleState;

    ProgramHandler::ProgramHandler()
        : BaseCommandHandler("ProgramHandler") {}

    void ProgramHandler::apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const {
        double number = command.getCode().number;
        if (number != 0 && number != 1 && number != 2 && number != 30) {
            unsupported(command, lineNumber);
        }

        acceptOnly(command, "", lineNumber);

        if (number == 0 || number == 1) {
            state.setPaused(true);
            Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": program paused");
            return;
        }

        // End of program stops spindle and coolant
        state.setSpindleState(SpindleState::Off);
        state.setCoolantState(CoolantState::Off);
        state.setPaused(false);
        state.setProgramEnded(true);
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": end of program");
    }

} // namespace cnc::translator::handlers
