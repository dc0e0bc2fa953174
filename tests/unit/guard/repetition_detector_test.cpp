/// @file repetition_detector_test.cpp
/// @brief Tests for flooding detection

#include <string>

#include <gtest/gtest.h>

#include "guard/repetition_detector.h"

namespace promptguard::guard {
namespace {

std::string Repeat(const std::string& unit, size_t count) {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        out += unit;
    }
    return out;
}

// ============================================================================
// Character runs
// ============================================================================

TEST(CharacterRunTest, TriggersAboveThreshold) {
    EXPECT_TRUE(HasCharacterRun(std::string(11, 'a'), 10));
    EXPECT_FALSE(HasCharacterRun(std::string(10, 'a'), 10));
}

TEST(CharacterRunTest, HundredCharacters) {
    EXPECT_TRUE(HasExcessiveRepetition(std::string(100, 'A')));
}

TEST(CharacterRunTest, CountsCodePointsNotBytes) {
    EXPECT_TRUE(HasCharacterRun(Repeat("ㅋ", 11), 10));
    EXPECT_FALSE(HasCharacterRun(Repeat("ㅋ", 10), 10));
}

TEST(CharacterRunTest, RunMustBeConsecutive) {
    EXPECT_FALSE(HasCharacterRun(Repeat("ab", 20), 10));
    EXPECT_FALSE(HasCharacterRun("aaaaaa aaaaaa", 10));
}

TEST(CharacterRunTest, NewlinesDoNotCount) {
    EXPECT_FALSE(HasCharacterRun(std::string(30, '\n'), 10));
    EXPECT_FALSE(HasCharacterRun("aaaaaa\naaaaaa", 10));
}

TEST(CharacterRunTest, PunctuationFlood) {
    EXPECT_TRUE(HasExcessiveRepetition("Tell me about AAPL" + std::string(100, '!')));
}

// ============================================================================
// Token dominance
// ============================================================================

TEST(DominantTokenTest, MajorityTokenTriggers) {
    EXPECT_TRUE(HasDominantToken("buy buy buy buy sell hold", 5, 0.5));
}

TEST(DominantTokenTest, ExactlyHalfDoesNotTrigger) {
    EXPECT_FALSE(HasDominantToken("buy buy buy sell hold keep", 5, 0.5));
}

TEST(DominantTokenTest, NeedsMoreThanMinimumTokens) {
    EXPECT_FALSE(HasDominantToken("buy buy buy buy buy", 5, 0.5));
    EXPECT_TRUE(HasDominantToken("buy buy buy buy buy buy", 5, 0.5));
}

TEST(DominantTokenTest, MixedWhitespaceSeparators) {
    EXPECT_TRUE(HasDominantToken("go\tgo\ngo  go\r\ngo stop", 5, 0.5));
}

TEST(DominantTokenTest, UnicodeWhitespaceSeparators) {
    EXPECT_TRUE(HasDominantToken(Repeat("사기\u3000", 6), 5, 0.5));
    EXPECT_TRUE(HasDominantToken("buy\u00a0buy\u2003buy\u00a0buy\u3000sell buy", 5, 0.5));
}

TEST(DominantTokenTest, TokensAreCaseSensitive) {
    EXPECT_FALSE(HasDominantToken("Buy buy BUY bUy buY BUy", 5, 0.5));
}

TEST(DominantTokenTest, KoreanTokens) {
    EXPECT_TRUE(HasExcessiveRepetition("사줘 사줘 사줘 사줘 사줘 삼성"));
}

TEST(RepetitionTest, OrdinaryQuestionIsClean) {
    EXPECT_FALSE(HasExcessiveRepetition("What was Apple's revenue growth in the last fiscal year?"));
    EXPECT_FALSE(HasExcessiveRepetition("테슬라 재무제표 분석해줘"));
    EXPECT_FALSE(HasExcessiveRepetition(""));
}

TEST(RepetitionTest, CustomOptions) {
    RepetitionOptions options;
    options.char_threshold = 3;
    options.min_token_count = 2;
    options.dominant_ratio = 0.6;

    EXPECT_TRUE(HasExcessiveRepetition("hmmmm", options));
    EXPECT_TRUE(HasExcessiveRepetition("yes yes no", options));
    EXPECT_FALSE(HasExcessiveRepetition("yes no", options));
}

}  // namespace
}  // namespace promptguard::guard
