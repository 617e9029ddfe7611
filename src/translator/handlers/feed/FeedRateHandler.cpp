//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/feed/FeedRateHandler.hpp"
#include "cnc/core/utils/FloatFormatter.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    using core::state::FeedRateMode;

    FeedRateHandler::FeedRateHandler()
        : BaseCommandHandler("FeedRateHandler") {}

    void FeedRateHandler::apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const {
        const CommandCode &code = command.getCode();
        if (code.letter != 'F') {
            unsupported(command, lineNumber);
        }

        acceptOnly(command, "", lineNumber);
        requirePositive(command, 'F', code.number, lineNumber);

        double feed = state.getFeedRateMode() == FeedRateMode::InverseTime
                      ? code.number
                      : state.toMillimeters(code.number);
        state.setFeedRate(feed);
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": using feed rate " +
                        core::utils::formatFloat(feed));
    }

} // namespace cnc::translator::handlers
