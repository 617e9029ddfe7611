#include "cnc/translator/GCodeInterpreter.hpp"
#include "cnc/core/types/Error.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace cnc::core::state;
using cnc::core::types::Position;
using cnc::core::types::ErrorKind;
using cnc::core::types::FileException;
using cnc::core::types::InterpreterException;
using cnc::translator::ErrorPolicy;
using cnc::translator::GCodeInterpreter;
using cnc::translator::HandlerRegistry;
using cnc::translator::InterpreterOptions;

namespace {
    std::shared_ptr<const HandlerRegistry> defaultRegistry() {
        return std::make_shared<const HandlerRegistry>(HandlerRegistry::createDefault());
    }

    InterpreterOptions abortOptions() {
        InterpreterOptions options;
        options.errorPolicy = ErrorPolicy::Abort;
        return options;
    }

    class TempFile {
    public:
        TempFile(const std::string &name, const std::string &content)
            : path_(fs::temp_directory_path() / name) {
            std::ofstream out(path_);
            out << content;
        }

        ~TempFile() {
            std::error_code ec;
            fs::remove(path_, ec);
        }

        std::string path() const { return path_.string(); }

    private:
        fs::path path_;
    };
}

TEST(GCodeInterpreterTest, LinearMoveScenario) {
    GCodeInterpreter interpreter(defaultRegistry());

    interpreter.processLines({"G90", "G1 X10 Y5 F100", "G1 Y8"});

    const auto &state = interpreter.getState();
    EXPECT_EQ(state.getPosition(), (Position{10.0, 8.0, 0.0}));
    EXPECT_DOUBLE_EQ(state.getFeedRate(), 100.0);
    EXPECT_EQ(state.getPositioningMode(), PositioningMode::Absolute);
    EXPECT_EQ(interpreter.getCommandsExecuted(), 3u);
    EXPECT_TRUE(interpreter.getDiagnostics().empty());
}

TEST(GCodeInterpreterTest, ContinuePolicyCollectsDiagnostics) {
    GCodeInterpreter interpreter(defaultRegistry());

    interpreter.processLines({
        "G1 X1 F100",
        "G1 X",
        "G999",
        "G1 X2 Q5",
        "G1 X3"
    });

    const auto &diagnostics = interpreter.getDiagnostics();
    ASSERT_EQ(diagnostics.size(), 3u);
    EXPECT_EQ(diagnostics[0].kind, ErrorKind::Parse);
    EXPECT_EQ(diagnostics[0].lineNumber, 2u);
    EXPECT_EQ(diagnostics[1].kind, ErrorKind::UnsupportedCommand);
    EXPECT_EQ(diagnostics[1].lineNumber, 3u);
    EXPECT_NE(diagnostics[1].message.find("G999"), std::string::npos);
    EXPECT_EQ(diagnostics[2].kind, ErrorKind::InvalidParameter);
    EXPECT_EQ(diagnostics[2].lineNumber, 4u);

    // Failed lines leave the state as the last good line left it
    EXPECT_DOUBLE_EQ(interpreter.getState().getPosition().x, 3.0);
    EXPECT_EQ(interpreter.getCommandsExecuted(), 2u);
    EXPECT_FALSE(interpreter.isAborted());
}

TEST(GCodeInterpreterTest, MalformedLineGivesExactlyOneDiagnostic) {
    GCodeInterpreter interpreter(defaultRegistry());

    interpreter.processLine("G1 X");

    ASSERT_EQ(interpreter.getDiagnostics().size(), 1u);
    EXPECT_EQ(interpreter.getDiagnostics()[0].kind, ErrorKind::Parse);
    EXPECT_EQ(interpreter.getCommandsExecuted(), 0u);
}

TEST(GCodeInterpreterTest, AbortPolicyStopsAtFirstError) {
    GCodeInterpreter interpreter(defaultRegistry(), abortOptions());

    EXPECT_TRUE(interpreter.processLine("G1 X1 F100"));
    EXPECT_THROW(interpreter.processLine("G999"), InterpreterException);
    EXPECT_TRUE(interpreter.isAborted());
    EXPECT_TRUE(interpreter.isStopped());

    EXPECT_FALSE(interpreter.processLine("G1 X5"));
    EXPECT_DOUBLE_EQ(interpreter.getState().getPosition().x, 1.0);
    EXPECT_EQ(interpreter.getDiagnostics().size(), 1u);
}

TEST(GCodeInterpreterTest, LineNumbersCountBlankAndCommentLines) {
    GCodeInterpreter interpreter(defaultRegistry());

    interpreter.processLines({"%", "", "(header)", "; setup", "G1 X"});

    ASSERT_EQ(interpreter.getDiagnostics().size(), 1u);
    EXPECT_EQ(interpreter.getDiagnostics()[0].lineNumber, 5u);
    EXPECT_NE(interpreter.getDiagnostics()[0].message.find("[Line 5]"), std::string::npos);
    EXPECT_EQ(interpreter.getLinesProcessed(), 5u);
}

TEST(GCodeInterpreterTest, ProgramEndStopsProcessing) {
    GCodeInterpreter interpreter(defaultRegistry());

    interpreter.processLines({"M3 S1000", "G0 X1", "M30", "G0 X9", "", "; trailing comment", "G999"});

    EXPECT_TRUE(interpreter.isStopped());
    EXPECT_FALSE(interpreter.isAborted());
    EXPECT_TRUE(interpreter.getState().isProgramEnded());
    EXPECT_EQ(interpreter.getState().getSpindleState(), SpindleState::Off);
    EXPECT_DOUBLE_EQ(interpreter.getState().getPosition().x, 1.0);
    EXPECT_EQ(interpreter.getIgnoredLines(), 2u);
    EXPECT_TRUE(interpreter.getDiagnostics().empty());
    EXPECT_EQ(interpreter.getLinesProcessed(), 7u);
}

TEST(GCodeInterpreterTest, KeepsGoingAfterProgramEndWhenConfigured) {
    InterpreterOptions options;
    options.stopAtProgramEnd = false;
    GCodeInterpreter interpreter(defaultRegistry(), options);

    interpreter.processLines({"M2", "G0 X9"});

    EXPECT_FALSE(interpreter.isStopped());
    EXPECT_DOUBLE_EQ(interpreter.getState().getPosition().x, 9.0);
    EXPECT_EQ(interpreter.getIgnoredLines(), 0u);
}

TEST(GCodeInterpreterTest, ProcessesFile) {
    TempFile file("cnc_interpreter_test_program.gcode",
                  "O1000 (FACING)\n"
                  "N10 G21\n"
                  "N20 G90\n"
                  "N30 M6 T1\n"
                  "N40 G0 X5 Y5\n"
                  "N50 G1 Z-1 F200\n"
                  "N60 M30\n");
    GCodeInterpreter interpreter(defaultRegistry());

    interpreter.processFile(file.path());

    const auto &state = interpreter.getState();
    EXPECT_EQ(state.getPosition(), (Position{5.0, 5.0, -1.0}));
    EXPECT_EQ(state.getTool(), 1);
    EXPECT_TRUE(state.isProgramEnded());
    EXPECT_EQ(interpreter.getLinesProcessed(), 7u);
    EXPECT_TRUE(interpreter.getDiagnostics().empty());
}

TEST(GCodeInterpreterTest, MissingFileIsFatal) {
    GCodeInterpreter interpreter(defaultRegistry());

    try {
        interpreter.processFile("/nonexistent/cnc/program.gcode");
        FAIL() << "Expected FileException";
    } catch (const FileException &e) {
        EXPECT_EQ(e.kind(), ErrorKind::File);
        EXPECT_NE(std::string(e.what()).find("/nonexistent/cnc/program.gcode"), std::string::npos);
    }
    EXPECT_EQ(interpreter.getLinesProcessed(), 0u);
}

TEST(GCodeInterpreterTest, GcodeExtensionCanBeRequired) {
    TempFile file("cnc_interpreter_test_program.nc", "G0 X1\n");
    InterpreterOptions options;
    options.requireGcodeExtension = true;
    GCodeInterpreter strict(defaultRegistry(), options);

    EXPECT_THROW(strict.processFile(file.path()), FileException);

    GCodeInterpreter lenient(defaultRegistry());
    lenient.processFile(file.path());
    EXPECT_DOUBLE_EQ(lenient.getState().getPosition().x, 1.0);
}

TEST(GCodeInterpreterTest, ReportContainsStateSummaryAndDiagnostics) {
    GCodeInterpreter interpreter(defaultRegistry());
    interpreter.processLines({"G1 X10 Y5 F100", "G999"});

    auto report = interpreter.buildReport();

    EXPECT_DOUBLE_EQ(report["state"]["position"]["x"].get<double>(), 10.0);
    EXPECT_EQ(report["summary"]["linesProcessed"], 2);
    EXPECT_EQ(report["summary"]["commandsExecuted"], 1);
    EXPECT_EQ(report["summary"]["diagnostics"], 1);
    EXPECT_EQ(report["summary"]["aborted"], false);
    EXPECT_EQ(report["summary"]["errorPolicy"], "continue");
    ASSERT_EQ(report["diagnostics"].size(), 1u);
    EXPECT_EQ(report["diagnostics"][0]["line"], 2);
    EXPECT_EQ(report["diagnostics"][0]["kind"], "UnsupportedCommand");
}

TEST(GCodeInterpreterTest, ResetClearsEverything) {
    GCodeInterpreter interpreter(defaultRegistry());
    interpreter.processLines({"G1 X10 F100", "G999", "M30", "G0"});

    interpreter.reset();

    EXPECT_EQ(interpreter.getState().getPosition(), Position{});
    EXPECT_EQ(interpreter.getLinesProcessed(), 0u);
    EXPECT_EQ(interpreter.getCommandsExecuted(), 0u);
    EXPECT_EQ(interpreter.getIgnoredLines(), 0u);
    EXPECT_TRUE(interpreter.getDiagnostics().empty());
    EXPECT_FALSE(interpreter.isStopped());
    EXPECT_TRUE(interpreter.processLine("G0 X1"));
}
