#include <gtest/gtest.h>

#include <memory>

#include "nl_command/catalog/default_catalog.h"
#include "nl_command/nlu/candidate_matcher.h"
#include "nl_command/nlu/parameter_extractor.h"

namespace nl_command {
namespace {

class ParameterExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_ = BuildDefaultCatalog();
        matcher_ = std::make_unique<CandidateMatcher>(*catalog_, config_);
    }

    // Runs matching and extraction; fails the test if nothing matched.
    ExtractionResult Extract(const std::string& text,
                             const SessionContext& context = {}) {
        NormalizedText normalized = Normalize(text);
        auto candidates = matcher_->Match(normalized);
        EXPECT_FALSE(candidates.empty()) << text;
        if (candidates.empty()) {
            return {};
        }
        last_action_ = candidates[0].action->QualifiedName();
        return extractor_.Extract(candidates[0], normalized, context);
    }

    static std::string Value(const ExtractionResult& result, const std::string& name) {
        for (const auto& parameter : result.parameters) {
            if (parameter.name == name) return parameter.value.AsString();
        }
        return "<absent>";
    }

    InterpreterConfig config_;
    std::unique_ptr<PatternCatalog> catalog_;
    std::unique_ptr<CandidateMatcher> matcher_;
    ParameterExtractor extractor_;
    std::string last_action_;
};

TEST_F(ParameterExtractorTest, PathAfterKeyword) {
    auto result = Extract("open file test.py");

    EXPECT_EQ(last_action_, "file_operations.open");
    EXPECT_EQ(Value(result, "filename"), "test.py");
    EXPECT_TRUE(result.missing_parameters.empty());
}

TEST_F(ParameterExtractorTest, KeepsOriginalCasing) {
    auto result = Extract("Open file README.md");
    EXPECT_EQ(Value(result, "filename"), "README.md");
}

TEST_F(ParameterExtractorTest, SkipsConnectorWords) {
    EXPECT_EQ(Value(Extract("create file called notes.md"), "filename"), "notes.md");
    EXPECT_EQ(Value(Extract("navigate to the docs folder"), "path"), "docs");
}

TEST_F(ParameterExtractorTest, PatternCapturesFillSlots) {
    auto result = Extract("move notes.txt to archive/");

    EXPECT_EQ(last_action_, "file_operations.move");
    ASSERT_EQ(result.parameters.size(), 2u);
    EXPECT_EQ(result.parameters[0].name, "filename");
    EXPECT_EQ(result.parameters[0].value.AsString(), "notes.txt");
    EXPECT_EQ(result.parameters[1].name, "destination");
    EXPECT_EQ(result.parameters[1].value.AsString(), "archive/");
}

TEST_F(ParameterExtractorTest, ContextFallbackNeedsDeicticWord) {
    SessionContext context;
    context.current_file = "main.py";

    auto with_deictic = Extract("analyze this file", context);
    EXPECT_EQ(last_action_, "code_analysis.analyze_file");
    EXPECT_EQ(Value(with_deictic, "filename"), "main.py");

    auto without = Extract("analyze file", context);
    EXPECT_EQ(Value(without, "filename"), "<absent>");
    EXPECT_EQ(without.missing_parameters, (std::vector<std::string>{"filename"}));
}

TEST_F(ParameterExtractorTest, LiteralPathBeatsContext) {
    SessionContext context;
    context.current_file = "main.py";

    auto result = Extract("analyze this file utils.py", context);
    EXPECT_EQ(Value(result, "filename"), "utils.py");
}

TEST_F(ParameterExtractorTest, DirectoryFallback) {
    SessionContext context;
    context.current_directory = "/home/user/project";

    auto result = Extract("list files here", context);
    EXPECT_EQ(Value(result, "directory"), "/home/user/project");
}

TEST_F(ParameterExtractorTest, EmptyContextLeavesSlotMissing) {
    auto result = Extract("analyze this file");
    EXPECT_EQ(result.missing_parameters, (std::vector<std::string>{"filename"}));
}

TEST_F(ParameterExtractorTest, EnumValuesAndAliases) {
    auto urgent = Extract("creat urgent tsk for code review");
    EXPECT_EQ(last_action_, "task_management.create");
    EXPECT_EQ(Value(urgent, "priority"), "urgent");
    EXPECT_EQ(Value(urgent, "task_text"), "code review");

    auto alias = Extract("set priority critical for task 7");
    EXPECT_EQ(Value(alias, "priority"), "urgent");
    EXPECT_EQ(Value(alias, "task_id"), "7");
}

TEST_F(ParameterExtractorTest, IntegerForms) {
    EXPECT_EQ(Value(Extract("set volume to 75"), "volume_level"), "75");
    EXPECT_EQ(Value(Extract("complete task #12"), "task_id"), "12");
    EXPECT_EQ(Value(Extract("set volume to 40%"), "volume_level"), "40");
}

TEST_F(ParameterExtractorTest, IntegersAreClamped) {
    EXPECT_EQ(Value(Extract("set volume 150"), "volume_level"), "100");
    EXPECT_EQ(Value(Extract("complete task 0"), "task_id"), "1");
}

TEST_F(ParameterExtractorTest, SpokenIntegerAliases) {
    EXPECT_EQ(Value(Extract("mute voice"), "volume_level"), "0");
    EXPECT_EQ(Value(Extract("set volume to max"), "volume_level"), "100");
}

TEST_F(ParameterExtractorTest, IntegerValueIsTyped) {
    auto result = Extract("set volume to 75");
    ASSERT_EQ(result.parameters.size(), 1u);
    EXPECT_EQ(result.parameters[0].type, SlotType::kInteger);
    EXPECT_EQ(result.parameters[0].value.AsInt(), 75);
}

TEST_F(ParameterExtractorTest, FreeTextTakesTheRest) {
    auto result = Extract("create task fix login bug high priority");

    EXPECT_EQ(Value(result, "task_text"), "fix login bug");
    EXPECT_EQ(Value(result, "priority"), "high");
}

TEST_F(ParameterExtractorTest, QuotedFreeText) {
    auto result = Extract("create task \"fix the high memory bug\" low priority");

    // Words inside the quotes are not taken by other slots.
    EXPECT_EQ(Value(result, "task_text"), "fix the high memory bug");
    EXPECT_EQ(Value(result, "priority"), "low");
}

TEST_F(ParameterExtractorTest, FreeTextAfterOtherSlots) {
    auto result = Extract("update task 3 to fix tests");

    EXPECT_EQ(Value(result, "task_id"), "3");
    EXPECT_EQ(Value(result, "task_text"), "fix tests");
}

TEST_F(ParameterExtractorTest, SearchQuery) {
    EXPECT_EQ(Value(Extract("search files for TODO"), "query"), "TODO");
    EXPECT_EQ(Value(Extract("search for main function"), "query"), "main function");
}

TEST_F(ParameterExtractorTest, MentionsAndKeywords) {
    EXPECT_EQ(Value(Extract("assign task 3 to @alice"), "assignee"), "alice");
    EXPECT_EQ(Value(Extract("assign task 4 to bob"), "assignee"), "bob");
    EXPECT_EQ(Value(Extract("explain function parse_input"), "function_name"), "parse_input");
}

TEST_F(ParameterExtractorTest, ClassNameIsNotAFunctionName) {
    auto result = Extract("explain class Parser");

    EXPECT_EQ(last_action_, "code_analysis.explain_class");
    EXPECT_EQ(Value(result, "class_name"), "Parser");
    EXPECT_EQ(Value(result, "function_name"), "<absent>");
    EXPECT_TRUE(result.missing_parameters.empty());
}

TEST_F(ParameterExtractorTest, LanguageBeforeKeywordSlots) {
    auto result = Extract("analyze python file main.py");

    EXPECT_EQ(last_action_, "code_analysis.analyze_file");
    EXPECT_EQ(Value(result, "language"), "python");
    EXPECT_EQ(Value(result, "filename"), "main.py");

    EXPECT_EQ(Value(Extract("analyze file main.cc for c++"), "language"), "cpp");
    EXPECT_EQ(Value(Extract("find bugs in app.js js"), "language"), "javascript");
    EXPECT_EQ(Value(Extract("analyze file main.py"), "language"), "<absent>");
}

TEST_F(ParameterExtractorTest, RewrittenPhraseKeepsRawWords) {
    NormalizedText normalized = Normalize("Look at Main.py", catalog_->PhraseRewrites());
    auto candidates = matcher_->Match(normalized);
    ASSERT_FALSE(candidates.empty());
    EXPECT_EQ(candidates[0].action->QualifiedName(), "code_analysis.analyze_file");

    auto result = extractor_.Extract(candidates[0], normalized, {});
    EXPECT_EQ(Value(result, "filename"), "Main.py");
}

TEST_F(ParameterExtractorTest, MissingRequiredSlot) {
    auto result = Extract("create task");

    EXPECT_TRUE(result.parameters.empty());
    EXPECT_EQ(result.missing_parameters, (std::vector<std::string>{"task_text"}));
}

TEST_F(ParameterExtractorTest, OptionalSlotAbsentIsNotMissing) {
    auto result = Extract("list files");

    EXPECT_TRUE(result.parameters.empty());
    EXPECT_TRUE(result.missing_parameters.empty());
}

TEST_F(ParameterExtractorTest, ParametersInSlotOrder) {
    auto result = Extract("create task high priority write docs");

    ASSERT_EQ(result.parameters.size(), 2u);
    EXPECT_EQ(result.parameters[0].name, "task_text");
    EXPECT_EQ(result.parameters[1].name, "priority");
    EXPECT_EQ(result.parameters[0].value.AsString(), "write docs");
}

TEST(ParameterTokenTest, ParseIntegerToken) {
    int value = 0;
    EXPECT_TRUE(ParseIntegerToken("42", value));
    EXPECT_EQ(value, 42);
    EXPECT_TRUE(ParseIntegerToken("#7", value));
    EXPECT_EQ(value, 7);
    EXPECT_TRUE(ParseIntegerToken("80%", value));
    EXPECT_EQ(value, 80);
    EXPECT_FALSE(ParseIntegerToken("12abc", value));
    EXPECT_FALSE(ParseIntegerToken("#", value));
    EXPECT_FALSE(ParseIntegerToken("99999999999999999999", value));
}

TEST(ParameterTokenTest, LooksLikePath) {
    EXPECT_TRUE(LooksLikePath("test.py"));
    EXPECT_TRUE(LooksLikePath("src/lib"));
    EXPECT_TRUE(LooksLikePath("..\\build"));
    EXPECT_FALSE(LooksLikePath("review"));
    EXPECT_FALSE(LooksLikePath("1.5"));
    EXPECT_FALSE(LooksLikePath(".bashrc"));
}

}  // namespace
}  // namespace nl_command
