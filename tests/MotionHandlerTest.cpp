#include "cnc/translator/handlers/motion/MotionHandler.hpp"
#include "cnc/translator/handlers/motion/HomeHandler.hpp"
#include "cnc/translator/handlers/motion/PositionHandler.hpp"
#include "cnc/translator/handlers/modal/ModalHandler.hpp"
#include "cnc/translator/parser/GCodeLineParser.hpp"
#include "cnc/core/types/Error.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace cnc::core::state;
using cnc::core::types::Position;
using cnc::core::types::InvalidParameterException;
using cnc::translator::Command;
using cnc::translator::GCodeLineParser;
using cnc::translator::handlers::HomeHandler;
using cnc::translator::handlers::ModalHandler;
using cnc::translator::handlers::MotionHandler;
using cnc::translator::handlers::PositionHandler;

namespace {
    Command parse(const std::string &line) {
        auto command = GCodeLineParser().parse(line, 1);
        if (!command) {
            throw std::runtime_error("no command in: " + line);
        }
        return *command;
    }

    class MotionHandlerTest : public ::testing::Test {
    protected:
        MachineState state;
        MotionHandler motion;

        void apply(const std::string &line, size_t lineNumber = 1) {
            motion.apply(parse(line), state, lineNumber);
        }
    };
}

TEST_F(MotionHandlerTest, LinearMoveUpdatesPositionAndFeed) {
    apply("G1 X10 Y5 F100");

    EXPECT_EQ(state.getPosition(), (Position{10.0, 5.0, 0.0}));
    EXPECT_DOUBLE_EQ(state.getFeedRate(), 100.0);
    EXPECT_EQ(state.getMotionMode(), MotionMode::Linear);
}

TEST_F(MotionHandlerTest, OmittedAxesKeepTheirValue) {
    apply("G1 X10 Y5 Z2 F100");
    apply("G1 Y8");

    EXPECT_EQ(state.getPosition(), (Position{10.0, 8.0, 2.0}));
    EXPECT_DOUBLE_EQ(state.getFeedRate(), 100.0);
}

TEST_F(MotionHandlerTest, RelativeModeAddsToCurrentPosition) {
    apply("G0 X1 Y1");
    state.setPositioningMode(PositioningMode::Relative);
    apply("G0 X2 Z-3");

    EXPECT_EQ(state.getPosition(), (Position{3.0, 1.0, -3.0}));
}

TEST_F(MotionHandlerTest, InchValuesAreStoredInMillimeters) {
    state.setUnitMode(UnitMode::Inches);
    apply("G1 X1 F10");

    EXPECT_DOUBLE_EQ(state.getPosition().x, 25.4);
    EXPECT_DOUBLE_EQ(state.getFeedRate(), 254.0);
}

TEST_F(MotionHandlerTest, RapidMoveDoesNotNeedFeedRate) {
    apply("G0 X5");

    EXPECT_DOUBLE_EQ(state.getPosition().x, 5.0);
    EXPECT_EQ(state.getMotionMode(), MotionMode::Rapid);
    EXPECT_DOUBLE_EQ(state.getFeedRate(), 0.0);
}

TEST_F(MotionHandlerTest, RapidWithoutAxesOnlySelectsMode) {
    state.setMotionMode(MotionMode::Linear);
    apply("G0");

    EXPECT_EQ(state.getMotionMode(), MotionMode::Rapid);
    EXPECT_EQ(state.getPosition(), Position{});
}

TEST_F(MotionHandlerTest, LinearMoveWithoutFeedRateIsRejected) {
    try {
        apply("G1 X10", 3);
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException &e) {
        EXPECT_EQ(e.letter(), 'F');
        EXPECT_EQ(e.lineNumber(), 3u);
    }
    EXPECT_EQ(state.getPosition(), Position{});
    EXPECT_EQ(state.getMotionMode(), MotionMode::Rapid);
}

TEST_F(MotionHandlerTest, FeedRateMustBePositive) {
    EXPECT_THROW(apply("G1 X1 F0"), InvalidParameterException);
    EXPECT_THROW(apply("G1 X1 F-20"), InvalidParameterException);
    EXPECT_EQ(state.getPosition(), Position{});
}

TEST_F(MotionHandlerTest, RejectedFeedIsReportedAsWritten) {
    try {
        apply("G1 X1 F-0.0001", 2);
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException &e) {
        EXPECT_EQ(e.letter(), 'F');
        EXPECT_NE(std::string(e.what()).find("value -0.0001 must be greater than 0"), std::string::npos);
    }
}

TEST_F(MotionHandlerTest, FeedFromInverseTimeIsNotReusedPerMinute) {
    ModalHandler modal;
    modal.apply(parse("G93"), state, 1);
    apply("G1 X1 F2", 2);
    modal.apply(parse("G94"), state, 3);

    EXPECT_DOUBLE_EQ(state.getFeedRate(), 0.0);
    EXPECT_THROW(apply("G1 X5", 4), InvalidParameterException);
    EXPECT_DOUBLE_EQ(state.getPosition().x, 1.0);

    apply("G1 X5 F300", 5);
    EXPECT_DOUBLE_EQ(state.getPosition().x, 5.0);
    EXPECT_DOUBLE_EQ(state.getFeedRate(), 300.0);
}

TEST_F(MotionHandlerTest, UnknownParameterIsReportedWithLetterAndCode) {
    try {
        apply("G1 X1 Q2 F100", 9);
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException &e) {
        EXPECT_EQ(e.letter(), 'Q');
        EXPECT_EQ(e.code(), "G1");
        std::string message = e.what();
        EXPECT_NE(message.find("[Line 9]"), std::string::npos);
        EXPECT_NE(message.find("'Q'"), std::string::npos);
        EXPECT_NE(message.find("G1"), std::string::npos);
    }
    EXPECT_EQ(state.getPosition(), Position{});
    EXPECT_DOUBLE_EQ(state.getFeedRate(), 0.0);
}

TEST_F(MotionHandlerTest, InverseTimeNeedsFeedOnEveryMove) {
    state.setFeedRateMode(FeedRateMode::InverseTime);
    state.setFeedRate(2.0);

    EXPECT_THROW(apply("G1 X1"), InvalidParameterException);

    apply("G1 X1 F4");
    EXPECT_DOUBLE_EQ(state.getFeedRate(), 4.0);
    EXPECT_DOUBLE_EQ(state.getPosition().x, 1.0);
}

TEST(HomeHandlerTest, HomesAllAxes) {
    MachineState state;
    state.setPosition({4.0, 5.0, 6.0});

    HomeHandler().apply(parse("G28"), state, 1);

    EXPECT_EQ(state.getPosition(), Position{});
}

TEST(HomeHandlerTest, HomesOnlyNamedAxes) {
    MachineState state;
    state.setPosition({4.0, 5.0, 6.0});

    HomeHandler().apply(parse("G28 Z0"), state, 1);

    EXPECT_EQ(state.getPosition(), (Position{4.0, 5.0, 0.0}));
}

TEST(HomeHandlerTest, RejectsNonAxisParameter) {
    MachineState state;
    EXPECT_THROW(HomeHandler().apply(parse("G28 F100"), state, 1), InvalidParameterException);
}

TEST(PositionHandlerTest, SetsPositionWithoutMoving) {
    MachineState state;
    state.setPosition({4.0, 5.0, 6.0});
    state.setPositioningMode(PositioningMode::Relative);

    PositionHandler().apply(parse("G92 X0 Y1"), state, 1);

    EXPECT_EQ(state.getPosition(), (Position{0.0, 1.0, 6.0}));
}

TEST(PositionHandlerTest, RequiresAtLeastOneAxis) {
    MachineState state;
    try {
        PositionHandler().apply(parse("G92"), state, 6);
        FAIL() << "Expected InvalidParameterException";
    } catch (const InvalidParameterException &e) {
        EXPECT_EQ(e.code(), "G92");
        EXPECT_NE(std::string(e.what()).find("[Line 6]"), std::string::npos);
    }
}
