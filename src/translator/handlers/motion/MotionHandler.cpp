//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/motion/MotionHandler.hpp"
#include "cnc/core/types/Error.hpp"
#include "cnc/core/utils/FloatFormatter.hpp"
#include "cnc/logger/Logger.hpp"

namespace cnc::translator::handlers {

    using core::state::FeedRateMode;
    using core::state::MotionMode;
    using core::state::PositioningMode;
    using core::types::InvalidParameterException;
    using core::utils::formatFloat;

    MotionHandler::MotionHandler()
        : BaseCommandHandler("MotionHandler") {}

    void MotionHandler::apply(const Command &command, core::state::MachineState &state, size_t lineNumber) const {
        const CommandCode &code = command.getCode();
        if (code.number != 0 && code.number != 1) {
            unsupported(command, lineNumber);
        }
        MotionMode mode = code.number == 0 ? MotionMode::Rapid : MotionMode::Linear;

        acceptOnly(command, "XYZF", lineNumber);

        bool inverseTime = state.getFeedRateMode() == FeedRateMode::InverseTime;
        bool hasAxis = command.has('X') || command.has('Y') || command.has('Z');

        double feed = state.getFeedRate();
        if (command.has('F')) {
            double value = command.get('F');
            requirePositive(command, 'F', value, lineNumber);
            // In inverse time mode F is 1/minutes, not a length
            feed = inverseTime ? value : state.toMillimeters(value);
        }

        if (mode == MotionMode::Linear && hasAxis) {
            if (inverseTime && !command.has('F')) {
                throw InvalidParameterException(lineNumber, code.toString(), 'F',
                                                "required on every move in inverse time feed mode");
            }
            if (!(feed > 0.0)) {
                throw InvalidParameterException(lineNumber, code.toString(), 'F',
                                                "no feed rate set for linear move");
            }
        }

        core::types::Position target = state.getPosition();
        bool relative = state.getPositioningMode() == PositioningMode::Relative;
        for (char axis: {'X', 'Y', 'Z'}) {
            if (!command.has(axis)) continue;

            double value = state.toMillimeters(command.get(axis));
            double current = state.getAxis(axis);
            double next = relative ? current + value : value;
            switch (axis) {
                case 'X':
                    target.x = next;
                    break;
                case 'Y':
                    target.y = next;
                    break;
                default:
                    target.z = next;
                    break;
            }
        }

        state.setMotionMode(mode);
        if (command.has('F')) {
            state.setFeedRate(feed);
        }

        if (!hasAxis) {
            Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": set " +
                            core::state::MachineState::motionModeToString(mode) + " positioning");
            return;
        }

        state.setPosition(target);
        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": moving to X=" +
                        formatFloat(target.x) + " Y=" + formatFloat(target.y) + " Z=" + formatFloat(target.z) +
                        " [mm]" + (mode == MotionMode::Linear ? " F=" + formatFloat(state.getFeedRate()) : ""));
    }

} // namespace cnc::translator::handlers
