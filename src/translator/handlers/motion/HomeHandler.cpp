//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/motion/HomeHandler.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    HomeHandler::HomeHandler()
        : BaseCommandHandler("HomeHandler") {}

    void HomeHandler::apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const {
        if (command.getCode().number != 28) {
            unsupported(command, lineNumber);
        }

        // The axis values are ignored, G28 X0 homes X only
        acceptOnly(command, "XYZ", lineNumber);

        if (command.getParams().empty()) {
            state.setPosition(core::types::Position{});
            Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": moving to home");
            return;
        }

        std::string axes;
        for (const auto &[axis, value]: command.getParams()) {
            state.setAxis(axis, 0.0);
            axes += axis;
        }
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": homing axes " + axes);
    }

} // namespace cnc::translator::handlers
