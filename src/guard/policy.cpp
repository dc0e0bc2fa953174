#include "guard/policy.h"

#include "guard/utf8.h"

namespace promptguard::guard {

ThreatLevel LevelForScore(int score) {
    if (score <= 0) {
        return ThreatLevel::kSafe;
    }
    if (score <= 2) {
        return ThreatLevel::kLow;
    }
    if (score <= 4) {
        return ThreatLevel::kMedium;
    }
    if (score <= 6) {
        return ThreatLevel::kHigh;
    }
    return ThreatLevel::kCritical;
}

bool IsAcceptable(ThreatLevel level, bool strict_mode) {
    if (strict_mode) {
        return level == ThreatLevel::kSafe || level == ThreatLevel::kLow;
    }
    return level != ThreatLevel::kHigh && level != ThreatLevel::kCritical;
}

std::string_view RejectionMessage(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::kCritical:
            return "죄송합니다. 시스템 보안 정책에 의해 해당 요청을 처리할 수 없습니다.";
        case ThreatLevel::kHigh:
            return "해당 질문 형식은 지원되지 않습니다. 기업 분석이나 투자 관련 질문을 해주세요.";
        default:
            return "입력 내용을 확인해 주세요.";
    }
}

namespace {

/// Removes every "<...>" span with at least one character inside
std::string StripTags(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '<') {
            const size_t close = text.find('>', i + 1);
            if (close == std::string_view::npos) {
                out.append(text.substr(i));
                break;
            }
            if (close > i + 1) {
                i = close + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

}  // namespace

std::string Sanitize(std::string_view text) {
    const std::string visible = utf8::StripZeroWidth(text);
    const std::string untagged = StripTags(visible);
    const std::string collapsed = utf8::CollapseWhitespace(untagged, 3, "  ");
    return std::string(utf8::Trim(collapsed));
}

}  // namespace promptguard::guard
