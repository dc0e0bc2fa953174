/// @file policy_test.cpp
/// @brief Tests for level mapping, acceptance policy and sanitization

#include <string>

#include <gtest/gtest.h>

#include "guard/policy.h"

namespace promptguard::guard {
namespace {

TEST(LevelForScoreTest, Boundaries) {
    EXPECT_EQ(LevelForScore(0), ThreatLevel::kSafe);
    EXPECT_EQ(LevelForScore(1), ThreatLevel::kLow);
    EXPECT_EQ(LevelForScore(2), ThreatLevel::kLow);
    EXPECT_EQ(LevelForScore(3), ThreatLevel::kMedium);
    EXPECT_EQ(LevelForScore(4), ThreatLevel::kMedium);
    EXPECT_EQ(LevelForScore(5), ThreatLevel::kHigh);
    EXPECT_EQ(LevelForScore(6), ThreatLevel::kHigh);
    EXPECT_EQ(LevelForScore(7), ThreatLevel::kCritical);
    EXPECT_EQ(LevelForScore(42), ThreatLevel::kCritical);
}

TEST(IsAcceptableTest, NormalMode) {
    EXPECT_TRUE(IsAcceptable(ThreatLevel::kSafe, false));
    EXPECT_TRUE(IsAcceptable(ThreatLevel::kLow, false));
    EXPECT_TRUE(IsAcceptable(ThreatLevel::kMedium, false));
    EXPECT_FALSE(IsAcceptable(ThreatLevel::kHigh, false));
    EXPECT_FALSE(IsAcceptable(ThreatLevel::kCritical, false));
}

TEST(IsAcceptableTest, StrictMode) {
    EXPECT_TRUE(IsAcceptable(ThreatLevel::kSafe, true));
    EXPECT_TRUE(IsAcceptable(ThreatLevel::kLow, true));
    EXPECT_FALSE(IsAcceptable(ThreatLevel::kMedium, true));
    EXPECT_FALSE(IsAcceptable(ThreatLevel::kHigh, true));
    EXPECT_FALSE(IsAcceptable(ThreatLevel::kCritical, true));
}

TEST(RejectionMessageTest, PerLevel) {
    EXPECT_EQ(RejectionMessage(ThreatLevel::kCritical),
              "죄송합니다. 시스템 보안 정책에 의해 해당 요청을 처리할 수 없습니다.");
    EXPECT_EQ(RejectionMessage(ThreatLevel::kHigh),
              "해당 질문 형식은 지원되지 않습니다. 기업 분석이나 투자 관련 질문을 해주세요.");
    EXPECT_EQ(RejectionMessage(ThreatLevel::kMedium), "입력 내용을 확인해 주세요.");
}

// ============================================================================
// Sanitize
// ============================================================================

TEST(SanitizeTest, RemovesTags) {
    EXPECT_EQ(Sanitize("<b>삼성전자</b> 실적"), "삼성전자 실적");
    EXPECT_EQ(Sanitize("<script>alert(1)</script>AAPL"), "alert(1)AAPL");
}

TEST(SanitizeTest, CollapsesLongWhitespaceRuns) {
    EXPECT_EQ(Sanitize("apple     stock"), "apple  stock");
    EXPECT_EQ(Sanitize("apple\n\n\n\tstock"), "apple  stock");
    EXPECT_EQ(Sanitize("apple  stock"), "apple  stock");
    EXPECT_EQ(Sanitize("apple stock"), "apple stock");
}

TEST(SanitizeTest, TrimsEnds) {
    EXPECT_EQ(Sanitize("   애플 주가 알려줘 \n"), "애플 주가 알려줘");
}

TEST(SanitizeTest, StripsZeroWidthCharacters) {
    EXPECT_EQ(Sanitize("sam\u200bsung"), "samsung");
    EXPECT_EQ(Sanitize("\u2060tesla\u200f"), "tesla");
}

TEST(SanitizeTest, TagRemovalThenCollapse) {
    EXPECT_EQ(Sanitize("a <b> <i> c"), "a  c");
}

TEST(SanitizeTest, Idempotent) {
    const char* inputs[] = {
        "a <b> <i> c",
        "<<b>>x",
        "  hello \u200b   world  ",
        "<b>삼성전자</b>    실적   ",
        "plain",
        "\u3000 x \u00a0\u2003 y\u3000",
        "<a <b>> c",
    };
    for (const char* input : inputs) {
        const std::string once = Sanitize(input);
        EXPECT_EQ(Sanitize(once), once) << input;
    }
}

TEST(SanitizeTest, UnicodeWhitespace) {
    EXPECT_EQ(Sanitize("\u3000\u00a0애플 주가\u3000"), "애플 주가");
    EXPECT_EQ(Sanitize("apple\u3000\u3000\u3000stock"), "apple  stock");
    EXPECT_EQ(Sanitize("apple\u00a0\u00a0stock"), "apple\u00a0\u00a0stock");
    EXPECT_EQ(Sanitize("\u3000\u3000"), "");
}

TEST(SanitizeTest, UnclosedTagIsKept) {
    EXPECT_EQ(Sanitize("a < b"), "a < b");
    EXPECT_EQ(Sanitize("c <> d"), "c <> d");
    EXPECT_EQ(Sanitize("x<y>z<w"), "xz<w");
}

TEST(SanitizeTest, LongRuns) {
    const std::string gap = "a" + std::string(20000, ' ') + "b";
    EXPECT_EQ(Sanitize(gap), "a  b");

    const std::string open_tag = "<" + std::string(20000, 'a');
    EXPECT_EQ(Sanitize(open_tag), open_tag);

    const std::string long_tag = "x<" + std::string(20000, 'a') + ">y";
    EXPECT_EQ(Sanitize(long_tag), "xy");
}

TEST(SanitizeTest, EmptyInput) {
    EXPECT_EQ(Sanitize(""), "");
    EXPECT_EQ(Sanitize("<br>"), "");
}

}  // namespace
}  // namespace promptguard::guard
