#include "cnc/translator/CommandDispatcher.hpp"
#include "cnc/translator/parser/GCodeLineParser.hpp"
#include "cnc/core/types/Error.hpp"
#include <gtest/gtest.h>
#include <memory>

using cnc::core::state::MachineState;
using cnc::core::types::InvalidParameterException;
using cnc::core::types::RegistryException;
using cnc::core::types::UnsupportedCommandException;
using cnc::translator::Command;
using cnc::translator::CommandCode;
using cnc::translator::CommandDispatcher;
using cnc::translator::GCodeLineParser;
using cnc::translator::HandlerRegistry;
using cnc::translator::handlers::ICommandHandler;

namespace {
    class RecordingHandler : public ICommandHandler {
    public:
        mutable size_t calls = 0;
        mutable size_t lastLine = 0;

        void apply(const Command &command, MachineState &state, size_t lineNumber) const override {
            calls++;
            lastLine = lineNumber;
            if (command.has('Q')) {
                throw InvalidParameterException(lineNumber, command.getCode().toString(), 'Q', "parameter not accepted");
            }
            state.setAxis('X', command.getOr('X', state.getPosition().x));
        }
    };

    struct Fixture {
        std::shared_ptr<RecordingHandler> handler = std::make_shared<RecordingHandler>();
        std::shared_ptr<CommandDispatcher> dispatcher;

        Fixture() {
            auto registry = std::make_shared<HandlerRegistry>();
            registry->registerHandler({'G', 1}, handler);
            dispatcher = std::make_shared<CommandDispatcher>(registry);
        }
    };
}

TEST(CommandDispatcherTest, InvokesRegisteredHandlerWithLineNumber) {
    Fixture fixture;
    MachineState state;

    fixture.dispatcher->dispatch(Command({'G', 1}, {{'X', 4.0}}), state, 17);

    EXPECT_EQ(fixture.handler->calls, 1u);
    EXPECT_EQ(fixture.handler->lastLine, 17u);
    EXPECT_DOUBLE_EQ(state.getPosition().x, 4.0);
    EXPECT_EQ(state.getExecutedCommands(), 1u);
}

TEST(CommandDispatcherTest, UnregisteredCodeIsReportedAndStateIsUntouched) {
    Fixture fixture;
    MachineState state;
    auto before = state.toJson();

    try {
        fixture.dispatcher->dispatch(Command({'G', 999}, {{'X', 1.0}}), state, 5);
        FAIL() << "Expected UnsupportedCommandException";
    } catch (const UnsupportedCommandException &e) {
        EXPECT_EQ(e.code(), "G999");
        EXPECT_EQ(e.lineNumber(), 5u);
        EXPECT_NE(std::string(e.what()).find("G999"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("[Line 5]"), std::string::npos);
    }

    EXPECT_EQ(fixture.handler->calls, 0u);
    EXPECT_EQ(state.toJson(), before);
}

TEST(CommandDispatcherTest, UnsupportedCodeIsReportedAsWritten) {
    Fixture fixture;
    MachineState state;
    GCodeLineParser parser;

    for (const std::string code: {"G1.0001", "G0.0004", "G100000000000000000000"}) {
        auto command = parser.parse(code + " X1", 3);
        ASSERT_TRUE(command.has_value());
        try {
            fixture.dispatcher->dispatch(*command, state, 3);
            FAIL() << "Expected UnsupportedCommandException for " << code;
        } catch (const UnsupportedCommandException &e) {
            EXPECT_EQ(e.code(), code);
            EXPECT_EQ(std::string(e.what()), "[Line 3] Unsupported command " + code);
        }
    }

    EXPECT_EQ(fixture.handler->calls, 0u);
    EXPECT_DOUBLE_EQ(state.getPosition().x, 0.0);
}

TEST(CommandDispatcherTest, FailedHandlerIsNotCountedAsExecuted) {
    Fixture fixture;
    MachineState state;

    EXPECT_THROW(fixture.dispatcher->dispatch(Command({'G', 1}, {{'Q', 1.0}}), state, 2),
                 InvalidParameterException);
    EXPECT_EQ(state.getExecutedCommands(), 0u);
}

TEST(CommandDispatcherTest, RequiresRegistry) {
    EXPECT_THROW(CommandDispatcher dispatcher(nullptr), RegistryException);
}
