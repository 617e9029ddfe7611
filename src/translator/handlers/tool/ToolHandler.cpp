//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/tool/ToolHandler.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    ToolHandler::ToolHandler()
        : BaseCommandHandler("ToolHandler") {}

    void ToolHandler::apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const {
        const CommandCode &code = command.getCode();

        if (code.letter == 'T') {
            acceptOnly(command, "", lineNumber);
            int tool = requireIndex(command, 'T', code.number, lineNumber);
            state.setPendingTool(tool);
            Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": tool " +
                            std::to_string(tool) + " selected");
            return;
        }

        if (code.letter != 'M' || code.number != 6) {
            unsupported(command, lineNumber);
        }

        acceptOnly(command, "T", lineNumber);

        int tool;
        if (command.has('T')) {
            tool = requireIndex(command, 'T', command.get('T'), lineNumber);
        } else if (state.hasPendingTool()) {
            tool = state.getPendingTool();
        } else {
            throw core::types::InvalidParameterException(lineNumber, code.toString(), 'T', "no tool selected");
        }

        state.setTool(tool);
        state.clearPendingTool();
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": changing tool '" +
                        std::to_string(tool) + "'");
    }

} // namespace cnc::translator::handlers
