//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/spindle/SpindleHandler.hpp"
#include "cnc/core/utils/FloatFormatter.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    using core::state::MachineState;
    using core::state::SpindleState;
    using core::utils::formatFloat;

    SpindleHandler::SpindleHandler()
        : BaseCommandHandler("SpindleHandler") {}

    void SpindleHandler::apply(const Command &command, MachineState &state, size_t lineNumber) const {
        const CommandCode &code = command.getCode();

        if (code.letter == 'S') {
            acceptOnly(command, "", lineNumber);
            requireNonNegative(command, 'S', code.number, lineNumber);
            state.setSpindleSpeed(code.number);
            Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": using spindle speed " +
                            formatFloat(code.number) + " [rpm]");
            return;
        }

        if (code.letter != 'M' || (code.number != 3 && code.number != 4 && code.number != 5)) {
            unsupported(command, lineNumber);
        }

        if (code.number == 5) {
            acceptOnly(command, "", lineNumber);
            state.setSpindleState(SpindleState::Off);
            Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": spindle stopped");
            return;
        }

        acceptOnly(command, "S", lineNumber);
        if (command.has('S')) {
            requireNonNegative(command, 'S', command.get('S'), lineNumber);
            state.setSpindleSpeed(command.get('S'));
        }

        state.setSpindleState(code.number == 3 ? SpindleState::Clockwise : SpindleState::CounterClockwise);
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": spindle " +
                        MachineState::spindleStateToString(state.getSpindleState()) + " at " +
                        formatFloat(state.getSpindleSpeed()) + " [rpm]");
    }

} // namespace cnc::translator::handlers
