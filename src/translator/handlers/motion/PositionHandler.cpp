//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/motion/PositionHandler.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/core/utils/FloatFormatter.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    PositionHandler::PositionHandler()
        : BaseCommandHandler("PositionHandler") {}

    void PositionHandler::apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const {
        if (command.getCode().number != 92) {
            unsupported(command, lineNumber);
        }

        acceptOnly(command, "XYZ", lineNumber);
        if (command.getParams().empty()) {
            throw core::types::InvalidParameterException(lineNumber, command.getCode().toString(),
                                                         "at least one of X, Y, Z is required");
        }

        // Always absolute, whatever the positioning mode
        for (const auto &[axis, value]: command.getParams()) {
            state.setAxis(axis, state.toMillimeters(value));
        }

        const auto &position = state.getPosition();
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": position set to X=" +
                        core::utils::formatFloat(position.x) + " Y=" + core::utils::formatFloat(position.y) +
                        " Z=" + core::utils::formatFloat(position.z));
    }

} // namespace cnc::translator::handlers
