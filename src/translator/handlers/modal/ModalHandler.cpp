//
// Created by Andrea on 19/10/2026.
//

#include "cnc/translator/handlers/modal/ModalHandler.hpp"
#include "cnc/logger/Logger.hpp"
#include <cmath>

namespace cnc::translator::handlers {

    using core::state::FeedRateMode;
    using core::state::MachineState;
    using core::state::Plane;
    using core::state::PositioningMode;
    using core::state::UnitMode;

    namespace {
        // F means 1/min in G93 and length/min in G94: a value from the other mode is meaningless
        void changeFeedRateMode(MachineState &state, FeedRateMode mode) {
            if (state.getFeedRateMode() != mode) {
                state.setFeedRate(0.0);
            }
            state.setFeedRateMode(mode);
        }
    }

    ModalHandler::ModalHandler()
        : BaseCommandHandler("ModalHandler") {}

    void ModalHandler::apply(const Command &command, MachineState &state, size_t lineNumber) const {
        double number = command.getCode().number;
        if (command.getCode().letter != 'G' || number != std::floor(number) || number < 0 || number > 999) {
            unsupported(command, lineNumber);
        }

        acceptOnly(command, "", lineNumber);

        std::string effect;
        switch (static_cast<int>(number)) {
            case 17:
                state.setPlane(Plane::XY);
                effect = "select XY plane";
                break;
            case 18:
                state.setPlane(Plane::XZ);
                effect = "select XZ plane";
                break;
            case 19:
                state.setPlane(Plane::YZ);
                effect = "select YZ plane";
                break;
            case 20:
                state.setUnitMode(UnitMode::Inches);
                effect = "programming in inches";
                break;
            case 21:
                state.setUnitMode(UnitMode::Millimeters);
                effect = "programming in millimeters";
                break;
            case 40:
                state.setToolRadiusCompensation(false);
                effect = "tool radius compensation off";
                break;
            case 49:
                state.setToolLengthOffset(false);
                effect = "cancel tool length offset compensation";
                break;
            case 54:
            case 55:
            case 56:
            case 57:
            case 58:
            case 59:
                state.setWorkOffset(static_cast<int>(number) - 53);
                effect = "select work offset " + std::to_string(state.getWorkOffset());
                break;
            case 80:
                state.setCannedCycle(false);
                effect = "cancel canned cycle";
                break;
            case 90:
                state.setPositioningMode(PositioningMode::Absolute);
                effect = "absolute positioning";
                break;
            case 91:
                state.setPositioningMode(PositioningMode::Relative);
                effect = "relative positioning";
                break;
            case 93:
                changeFeedRateMode(state, FeedRateMode::InverseTime);
                effect = "inverse time feed rate";
                break;
            case 94:
                changeFeedRateMode(state, FeedRateMode::UnitsPerMinute);
                effect = "feed rate per minute";
                break;
            default:
                unsupported(command, lineNumber);
        }

        Logger::logInfo(logPrefix() + "Line " + std::to_string(lineNumber) + ": " + effect);
    }

} // namespace cnc::translator::handlers
