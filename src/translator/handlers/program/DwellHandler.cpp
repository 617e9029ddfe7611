//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/program/DwellHandler.hpp"
#include "cnc/core/utils/FloatFormatter.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    DwellHandler::DwellHandler()
        : BaseCommandHandler("DwellHandler") {}

    void DwellHandler::apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const {
        if (command.getCode().number != 4) {
            unsupported(command, lineNumber);
        }

        acceptOnly(command, "P", lineNumber);
        double seconds = requireParam(command, 'P', lineNumber);
        requireNonNegative(command, 'P', seconds, lineNumber);

        state.addDwell(seconds);
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": dwell " +
                        core::utils::formatFloat(seconds) + " s");
    }

} // namespace cnc::translator::handlers
