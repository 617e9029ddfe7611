//
// Created by Andrea on 19/10/2026.
//

#include "cnc/core/state/MachineState.hpp"
#include <stdexcept>

namespace cnc::core::state {

    MachineState::MachineState() {
        reset();
    }

    void MachineState::reset() {
        position_ = types::Position{};
        feedRate_ = 0.0;

        positioning_ = PositioningMode::Absolute;
        units_ = UnitMode::Millimeters;
        motionMode_ = MotionMode::Rapid;
        plane_ = Plane::XY;
        feedRateMode_ = FeedRateMode::UnitsPerMinute;
        workOffset_ = 1;
        toolRadiusCompensation_ = false;
        toolLengthOffset_ = false;
        cannedCycle_ = false;

        spindle_ = SpindleState::Off;
        spindleSpeed_ = 0.0;
        coolant_ = CoolantState::Off;

        tool_ = 0;
        pendingTool_ = -1;

        programEnded_ = false;
        paused_ = false;
        dwellSeconds_ = 0.0;

        executedCommands_ = 0;
    }

    double MachineState::getAxis(char axis) const {
        switch (axis) {
            case 'X':
                return position_.x;
            case 'Y':
                return position_.y;
            case 'Z':
                return position_.z;
            default:
                throw std::invalid_argument("Unknown axis: " + std::string(1, axis));
        }
    }

    void MachineState::setAxis(char axis, double value) {
        switch (axis) {
            case 'X':
                position_.x = value;
                break;
            case 'Y':
                position_.y = value;
                break;
            case 'Z':
                position_.z = value;
                break;
            default:
                throw std::invalid_argument("Unknown axis: " + std::string(1, axis));
        }
    }

    nlohmann::json MachineState::toJson() const {
        nlohmann::json pendingTool = nullptr;
        if (hasPendingTool()) {
            pendingTool = pendingTool_;
        }

        return {
            {"position", {{"x", position_.x}, {"y", position_.y}, {"z", position_.z}}},
            {"feedRate", feedRate_},
            {"positioning", positioningModeToString(positioning_)},
            {"units", unitModeToString(units_)},
            {"motionMode", motionModeToString(motionMode_)},
            {"plane", planeToString(plane_)},
            {"feedRateMode", feedRateModeToString(feedRateMode_)},
            {"workOffset", workOffset_},
            {"toolRadiusCompensation", toolRadiusCompensation_},
            {"toolLengthOffset", toolLengthOffset_},
            {"cannedCycle", cannedCycle_},
            {"spindle", {{"state", spindleStateToString(spindle_)}, {"speed", spindleSpeed_}}},
            {"coolant", coolantStateToString(coolant_)},
            {"tool", tool_},
            {"pendingTool", pendingTool},
            {"programEnded", programEnded_},
            {"paused", paused_},
            {"dwellSeconds", dwellSeconds_},
            {"executedCommands", executedCommands_}
        };
    }

    std::string MachineState::positioningModeToString(PositioningMode mode) {
        switch (mode) {
            case PositioningMode::Absolute:
                return "absolute";
            case PositioningMode::Relative:
                return "relative";
        }
        return "unknown";
    }

    std::string MachineState::unitModeToString(UnitMode mode) {
        switch (mode) {
            case UnitMode::Millimeters:
                return "millimeters";
            case UnitMode::Inches:
                return "inches";
        }
        return "unknown";
    }

    std::string MachineState::motionModeToString(MotionMode mode) {
        switch (mode) {
            case MotionMode::Rapid:
                return "rapid";
            case MotionMode::Linear:
                return "linear";
        }
        return "unknown";
    }

    std::string MachineState::planeToString(Plane plane) {
        switch (plane) {
            case Plane::XY:
                return "XY";
            case Plane::XZ:
                return "XZ";
            case Plane::YZ:
                return "YZ";
        }
        return "unknown";
    }

    std::string MachineState::feedRateModeToString(FeedRateMode mode) {
        switch (mode) {
            case FeedRateMode::UnitsPerMinute:
                return "units-per-minute";
            case FeedRateMode::InverseTime:
                return "inverse-time";
        }
        return "unknown";
    }

    std::string MachineState::spindleStateToString(SpindleState state) {
        switch (state) {
            case SpindleState::Off:
                return "off";
            case SpindleState::Clockwise:
                return "clockwise";
            case SpindleState::CounterClockwise:
                return "counter-clockwise";
        }
        return "unknown";
    }

    std::string MachineState::coolantStateToString(CoolantState state) {
        switch (state) {
            case CoolantState::Off:
                return "off";
            case CoolantState::Mist:
                return "mist";
            case CoolantState::Flood:
                return "flood";
        }
        return "unknown";
    }

} // namespace cnc::core::state
