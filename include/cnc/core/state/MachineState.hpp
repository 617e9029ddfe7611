//
// Created by Andrea on 19/10/2026.
//

#pragma once

#include "cnc/core/types/Position.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace cnc::core::state {

    constexpr double MM_PER_INCH = 25.4;

    enum class PositioningMode {
        Absolute, // G90
        Relative  // G91
    };

    enum class UnitMode {
        Millimeters, // G21
        Inches       // G20
    };

    enum class MotionMode {
        Rapid, // G0
        Linear // G1
    };

    enum class Plane {
        XY, // G17
        XZ, // G18
        YZ  // G19
    };

    enum class FeedRateMode {
        UnitsPerMinute, // G94
        InverseTime     // G93
    };

    enum class SpindleState {
        Off,
        Clockwise,
        CounterClockwise
    };

    enum class CoolantState {
        Off,
        Mist,
        Flood
    };

    /**
     * @brief Stato della macchina per un'esecuzione.
     *
     * Lengths are always stored in millimetres; handlers convert incoming
     * values with toMillimeters() before writing them.
     */
    class MachineState {
    public:
        MachineState();

        // Position tracking
        const types::Position &getPosition() const { return position_; }
        void setPosition(const types::Position &position) { position_ = position; }

        double getAxis(char axis) const;

        void setAxis(char axis, double value);

        // Feed rate tracking
        double getFeedRate() const { return feedRate_; }
        void setFeedRate(double feed) { feedRate_ = feed; }
        bool hasFeedRate() const { return feedRate_ > 0.0; }

        // Modal groups
        PositioningMode getPositioningMode() const { return positioning_; }
        void setPositioningMode(PositioningMode mode) { positioning_ = mode; }
        UnitMode getUnitMode() const { return units_; }
        void setUnitMode(UnitMode mode) { units_ = mode; }
        MotionMode getMotionMode() const { return motionMode_; }
        void setMotionMode(MotionMode mode) { motionMode_ = mode; }
        Plane getPlane() const { return plane_; }
        void setPlane(Plane plane) { plane_ = plane; }
        FeedRateMode getFeedRateMode() const { return feedRateMode_; }
        void setFeedRateMode(FeedRateMode mode) { feedRateMode_ = mode; }
        int getWorkOffset() const { return workOffset_; }
        void setWorkOffset(int offset) { workOffset_ = offset; }

        bool isToolRadiusCompensationActive() const { return toolRadiusCompensation_; }
        void setToolRadiusCompensation(bool active) { toolRadiusCompensation_ = active; }
        bool isToolLengthOffsetActive() const { return toolLengthOffset_; }
        void setToolLengthOffset(bool active) { toolLengthOffset_ = active; }
        bool isCannedCycleActive() const { return cannedCycle_; }
        void setCannedCycle(bool active) { cannedCycle_ = active; }

        // Spindle
        SpindleState getSpindleState() const { return spindle_; }
        void setSpindleState(SpindleState state) { spindle_ = state; }
        double getSpindleSpeed() const { return spindleSpeed_; }
        void setSpindleSpeed(double rpm) { spindleSpeed_ = rpm; }

        // Coolant
        CoolantState getCoolantState() const { return coolant_; }
        void setCoolantState(CoolantState state) { coolant_ = state; }

        // Tooling: T selects, M6 loads
        int getTool() const { return tool_; }
        void setTool(int tool) { tool_ = tool; }
        int getPendingTool() const { return pendingTool_; }
        void setPendingTool(int tool) { pendingTool_ = tool; }
        bool hasPendingTool() const { return pendingTool_ >= 0; }
        void clearPendingTool() { pendingTool_ = -1; }

        // Program flow
        bool isProgramEnded() const { return programEnded_; }
        void setProgramEnded(bool ended) { programEnded_ = ended; }
        bool isPaused() const { return paused_; }
        void setPaused(bool paused) { paused_ = paused; }
        double getDwellSeconds() const { return dwellSeconds_; }
        void addDwell(double seconds) { dwellSeconds_ += seconds; }

        // Statistics
        void incrementExecutedCommands() { executedCommands_++; }
        size_t getExecutedCommands() const { return executedCommands_; }

        double toMillimeters(double value) const {
            return units_ == UnitMode::Inches ? value * MM_PER_INCH : value;
        }

        void reset();

        nlohmann::json toJson() const;

        static std::string positioningModeToString(PositioningMode mode);

        static std::string unitModeToString(UnitMode mode);

        static std::string motionModeToString(MotionMode mode);

        static std::string planeToString(Plane plane);

        static std::string feedRateModeToString(FeedRateMode mode);

        static std::string spindleStateToString(SpindleState state);

        static std::string coolantStateToString(CoolantState state);

    private:
        types::Position position_;
        double feedRate_;

        PositioningMode positioning_;
        UnitMode units_;
        MotionMode motionMode_;
        Plane plane_;
        FeedRateMode feedRateMode_;
        int workOffset_;
        bool toolRadiusCompensation_;
        bool toolLengthOffset_;
        bool cannedCycle_;

        SpindleState spindle_;
        double spindleSpeed_;
        CoolantState coolant_;

        int tool_;
        int pendingTool_;

        bool programEnded_;
        bool paused_;
        double dwellSeconds_;

        size_t executedCommands_;
    };

} // namespace cnc::core::state
