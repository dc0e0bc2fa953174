/// @file validator_config_test.cpp
/// @brief Tests for validator configuration loading and range checks

#include <gtest/gtest.h>

#include "guard/validator_config.h"

namespace promptguard::guard {
namespace {

TEST(ScoringWeightsTest, Defaults) {
    ScoringWeights weights;
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kPromptLeak), 3);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kJailbreak), 4);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kSystemTagSpoof), 3);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kDangerousKeyword), 2);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kEncodingBypass), 2);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kObfuscation), 2);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kExcessiveRepetition), 1);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kLengthExceeded), 1);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kBase64HiddenJailbreak), 0);
}

TEST(ScoringWeightsTest, SetWeight) {
    ScoringWeights weights;
    weights.SetWeight(DetectionCategory::kObfuscation, 5);
    EXPECT_EQ(weights.obfuscation, 5);
    EXPECT_EQ(weights.WeightFor(DetectionCategory::kObfuscation), 5);
}

TEST(ValidatorConfigTest, DefaultsAreValid) {
    ValidatorConfig config;
    EXPECT_TRUE(config.Validate().ok());
    EXPECT_EQ(config.max_length, 5000u);
    EXPECT_FALSE(config.strict_mode);
}

TEST(ValidatorConfigTest, RejectsOutOfRangeValues) {
    ValidatorConfig zero_length;
    zero_length.max_length = 0;
    EXPECT_EQ(zero_length.Validate().code(), absl::StatusCode::kInvalidArgument);

    ValidatorConfig huge_length;
    huge_length.max_length = kMaxLengthLimit + 1;
    EXPECT_EQ(huge_length.Validate().code(), absl::StatusCode::kInvalidArgument);
    huge_length.max_length = kMaxLengthLimit;
    EXPECT_TRUE(huge_length.Validate().ok());

    ValidatorConfig bad_ratio;
    bad_ratio.dominant_token_ratio = 1.5;
    EXPECT_FALSE(bad_ratio.Validate().ok());

    ValidatorConfig short_run;
    short_run.encoded_run_min_length = 2;
    EXPECT_FALSE(short_run.Validate().ok());

    ValidatorConfig no_evidence;
    no_evidence.evidence_max_chars = 0;
    EXPECT_FALSE(no_evidence.Validate().ok());
}

TEST(ValidatorConfigTest, RejectsZeroWeight) {
    ValidatorConfig config;
    config.weights.jailbreak = 0;
    auto status = config.Validate();
    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(status.message().find("jailbreak"), std::string_view::npos);
}

TEST(ValidatorConfigTest, HiddenPayloadWeightMayBeZero) {
    ValidatorConfig config;
    config.weights.base64_hidden_jailbreak = 0;
    EXPECT_TRUE(config.Validate().ok());
    config.weights.base64_hidden_jailbreak = -1;
    EXPECT_FALSE(config.Validate().ok());
}

TEST(ValidatorConfigTest, FromConfigReadsValidatorSection) {
    auto config = Config::LoadFromString(R"(
validator:
  max_length: 200
  strict_mode: true
  repetition_threshold: 4
  dominant_token_ratio: 0.75
  weights:
    jailbreak: 6
    base64_hidden_jailbreak: 2
)");
    ASSERT_TRUE(config.ok());

    auto result = ValidatorConfig::FromConfig(*config);
    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_EQ(result->max_length, 200u);
    EXPECT_TRUE(result->strict_mode);
    EXPECT_EQ(result->repetition_threshold, 4u);
    EXPECT_DOUBLE_EQ(result->dominant_token_ratio, 0.75);
    EXPECT_EQ(result->weights.jailbreak, 6);
    EXPECT_EQ(result->weights.base64_hidden_jailbreak, 2);
    EXPECT_EQ(result->weights.prompt_leak, 3);
    EXPECT_EQ(result->encoded_run_min_length, 40u);
}

TEST(ValidatorConfigTest, FromConfigEmptyKeepsDefaults) {
    auto config = Config::LoadFromString("logging:\n  level: info\n");
    ASSERT_TRUE(config.ok());

    auto result = ValidatorConfig::FromConfig(*config);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result->max_length, 5000u);
    EXPECT_EQ(result->weights.jailbreak, 4);
}

TEST(ValidatorConfigTest, FromConfigRejectsNegativeLength) {
    auto config = Config::LoadFromString("validator:\n  max_length: -5\n");
    ASSERT_TRUE(config.ok());

    auto result = ValidatorConfig::FromConfig(*config);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(result.status().message().find("validator.max_length"), std::string_view::npos);
}

TEST(ValidatorConfigTest, FromConfigRejectsMistypedValue) {
    auto config = Config::LoadFromString("validator:\n  strict_mode: sometimes\n");
    ASSERT_TRUE(config.ok());

    auto result = ValidatorConfig::FromConfig(*config);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(result.status().message().find("validator.strict_mode"), std::string_view::npos);
}

TEST(ValidatorConfigTest, FromConfigRejectsInvalidWeight) {
    auto config = Config::LoadFromString("validator:\n  weights:\n    prompt_leak: 0\n");
    ASSERT_TRUE(config.ok());
    EXPECT_FALSE(ValidatorConfig::FromConfig(*config).ok());
}

}  // namespace
}  // namespace promptguard::guard
