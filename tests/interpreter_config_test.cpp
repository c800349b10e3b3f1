#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "nl_command/interpreter_config.h"

namespace nl_command {
namespace {

TEST(InterpreterConfigTest, DefaultsAreValid) {
    InterpreterConfig config;
    std::string error;

    EXPECT_TRUE(ValidateConfig(config, error)) << error;
    EXPECT_FLOAT_EQ(config.discard_floor, 0.3f);
    EXPECT_FLOAT_EQ(config.cache_threshold, 0.9f);
    EXPECT_FLOAT_EQ(config.low_confidence_threshold, 0.5f);
    EXPECT_EQ(config.history_capacity, 20u);
    EXPECT_EQ(config.max_suggestions, 3u);
}

TEST(InterpreterConfigTest, RejectsOutOfRangeThresholds) {
    std::string error;

    InterpreterConfig config;
    config.discard_floor = 1.5f;
    EXPECT_FALSE(ValidateConfig(config, error));
    EXPECT_NE(error.find("discard_floor"), std::string::npos);

    config = InterpreterConfig{};
    config.synonym_weight = -0.1f;
    EXPECT_FALSE(ValidateConfig(config, error));

    config = InterpreterConfig{};
    config.mode_bonus = 2.0f;
    EXPECT_FALSE(ValidateConfig(config, error));
}

TEST(InterpreterConfigTest, RejectsZeroCapacities) {
    std::string error;

    InterpreterConfig config;
    config.history_capacity = 0;
    EXPECT_FALSE(ValidateConfig(config, error));

    config = InterpreterConfig{};
    config.cache_capacity = 0;
    EXPECT_FALSE(ValidateConfig(config, error));
}

TEST(InterpreterConfigTest, LowThresholdMustNotExceedCacheThreshold) {
    InterpreterConfig config;
    config.low_confidence_threshold = 0.95f;
    std::string error;

    EXPECT_FALSE(ValidateConfig(config, error));
}

TEST(InterpreterConfigTest, LoadOverridesOnlyPresentKeys) {
    InterpreterConfig config;
    config.history_capacity = 7;
    std::string error;

    ASSERT_TRUE(LoadConfigFromJson(
        R"({"discard_floor": 0.25, "cache_key_includes_context": true, "unknown": 1})",
        config, error)) << error;

    EXPECT_FLOAT_EQ(config.discard_floor, 0.25f);
    EXPECT_TRUE(config.cache_key_includes_context);
    EXPECT_EQ(config.history_capacity, 7u);
    EXPECT_FLOAT_EQ(config.cache_threshold, 0.9f);
}

TEST(InterpreterConfigTest, LoadFailureLeavesConfigUntouched) {
    InterpreterConfig config;
    std::string error;

    EXPECT_FALSE(LoadConfigFromJson(R"({"discard_floor": 0.1, "cache_capacity": "lots"})",
                                    config, error));
    EXPECT_FALSE(error.empty());
    EXPECT_FLOAT_EQ(config.discard_floor, 0.3f);

    EXPECT_FALSE(LoadConfigFromJson("{not json", config, error));
    EXPECT_FALSE(LoadConfigFromJson("[1, 2]", config, error));
}

TEST(InterpreterConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "nl_command_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"history_capacity": 5, "enable_debug_logging": true})";
    }

    InterpreterConfig config;
    std::string error;
    ASSERT_TRUE(LoadConfigFromFile(path, config, error)) << error;
    EXPECT_EQ(config.history_capacity, 5u);
    EXPECT_TRUE(config.enable_debug_logging);

    std::remove(path.c_str());
}

TEST(InterpreterConfigTest, MissingFile) {
    InterpreterConfig config;
    std::string error;

    EXPECT_FALSE(LoadConfigFromFile("/nonexistent/nl_command.json", config, error));
    EXPECT_NE(error.find("/nonexistent/nl_command.json"), std::string::npos);
}

}  // namespace
}  // namespace nl_command
