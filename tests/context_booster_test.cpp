#include <gtest/gtest.h>

#include "nl_command/context/context_booster.h"

namespace nl_command {
namespace {

Command MakeCommand(Intent intent, const std::string& action, float confidence) {
    Command command;
    command.intent = intent;
    command.action = action;
    command.confidence = confidence;
    command.canonical_form = BuildCanonicalForm(intent, action, command.parameters);
    return command;
}

class ContextBoosterTest : public ::testing::Test {
protected:
    InterpreterConfig config_;
    ContextBooster booster_{config_};
};

TEST_F(ContextBoosterTest, NoContextNoChange) {
    Command command = MakeCommand(Intent::kSystemStatus, "health", 0.8f);

    BoostResult result = booster_.Boost(command, SessionContext{}, std::nullopt);
    EXPECT_FLOAT_EQ(result.confidence, 0.8f);
    EXPECT_FALSE(result.history_applied);
    EXPECT_FALSE(result.context_applied);
    EXPECT_FALSE(result.mode_applied);
}

TEST_F(ContextBoosterTest, HistoryBonusForSameIntent) {
    Command command = MakeCommand(Intent::kTaskManagement, "create", 0.8f);
    HistoryEntry previous{Intent::kTaskManagement, "task_management.list"};

    BoostResult result = booster_.Boost(command, SessionContext{}, previous);
    EXPECT_TRUE(result.history_applied);
    EXPECT_FLOAT_EQ(result.confidence, 0.8f + config_.history_bonus);
}

TEST_F(ContextBoosterTest, NoHistoryBonusForOtherIntent) {
    Command command = MakeCommand(Intent::kTaskManagement, "create", 0.8f);
    HistoryEntry previous{Intent::kFileOperations, "file_operations.list"};

    EXPECT_FALSE(booster_.Boost(command, SessionContext{}, previous).history_applied);
}

TEST_F(ContextBoosterTest, IdenticalRepeatEarnsNothing) {
    Command command = MakeCommand(Intent::kTaskManagement, "list", 0.8f);
    HistoryEntry previous{Intent::kTaskManagement, command.canonical_form};

    BoostResult result = booster_.Boost(command, SessionContext{}, previous);
    EXPECT_FALSE(result.history_applied);
    EXPECT_FLOAT_EQ(result.confidence, 0.8f);
}

TEST_F(ContextBoosterTest, ContextBonusForCurrentFile) {
    Command command = MakeCommand(Intent::kCodeAnalysis, "analyze_file", 0.7f);
    command.parameters.push_back({"filename", SlotType::kPath, ParamValue("main.py")});

    SessionContext context;
    context.current_file = "main.py";

    BoostResult result = booster_.Boost(command, context, std::nullopt);
    EXPECT_TRUE(result.context_applied);
    EXPECT_FLOAT_EQ(result.confidence, 0.7f + config_.context_bonus);
}

TEST_F(ContextBoosterTest, ContextBonusIgnoresNonPathParameters) {
    Command command = MakeCommand(Intent::kTaskManagement, "create", 0.7f);
    command.parameters.push_back({"task_text", SlotType::kString, ParamValue("main.py")});

    SessionContext context;
    context.current_file = "main.py";

    EXPECT_FALSE(booster_.Boost(command, context, std::nullopt).context_applied);
}

TEST_F(ContextBoosterTest, ModeBonus) {
    Command command = MakeCommand(Intent::kVoiceControl, "volume", 0.6f);

    SessionContext context;
    context.mode_flags.insert("voice_active");

    BoostResult result = booster_.Boost(command, context, std::nullopt);
    EXPECT_TRUE(result.mode_applied);
    EXPECT_FLOAT_EQ(result.confidence, 0.6f + config_.mode_bonus);

    // The flag only helps its own intent.
    Command other = MakeCommand(Intent::kHelp, "general", 0.6f);
    EXPECT_FALSE(booster_.Boost(other, context, std::nullopt).mode_applied);
}

TEST_F(ContextBoosterTest, ClampedToOne) {
    Command command = MakeCommand(Intent::kCodeAnalysis, "analyze_file", 1.0f);
    command.parameters.push_back({"filename", SlotType::kPath, ParamValue("main.py")});

    SessionContext context;
    context.current_file = "main.py";
    HistoryEntry previous{Intent::kCodeAnalysis, "code_analysis.complexity"};

    BoostResult result = booster_.Boost(command, context, previous);
    EXPECT_FLOAT_EQ(result.confidence, 1.0f);
}

TEST_F(ContextBoosterTest, NeverLowersConfidence) {
    Command command = MakeCommand(Intent::kHelp, "general", 0.42f);
    SessionContext context;
    context.mode_flags.insert("task_context");

    EXPECT_GE(booster_.Boost(command, context, std::nullopt).confidence, 0.42f);
}

}  // namespace
}  // namespace nl_command
