/// @file pattern_registry.cpp
/// @brief Built-in detection rules and their compilation

#include "guard/pattern_registry.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "guard/run_scanner.h"

namespace promptguard::guard {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
constexpr auto kExact = std::regex::ECMAScript | std::regex::optimize;

}  // namespace

bool PatternRule::Search(std::string_view text, std::string_view* match) const {
    std::string_view found;
    switch (kind) {
        case MatchKind::kRegex: {
            // Regex rules may match an empty span, so they return directly
            std::cmatch m;
            if (!std::regex_search(text.data(), text.data() + text.size(), m, regex)) {
                return false;
            }
            *match = text.substr(static_cast<size_t>(m.position(0)),
                                 static_cast<size_t>(m.length(0)));
            return true;
        }
        case MatchKind::kBase64Run:
            found = FindBase64Run(text, min_run);
            break;
        case MatchKind::kZeroWidthRun:
            found = FindZeroWidthRun(text);
            break;
        case MatchKind::kCombiningMarkRun:
            found = FindCombiningMarkRun(text, min_run);
            break;
    }
    if (found.empty()) {
        return false;
    }
    *match = found;
    return true;
}

std::vector<PatternSpec> DefaultPatternSpecs(const RegistryOptions& options) {
    using C = DetectionCategory;
    return {
        // System prompt extraction
        {C::kPromptLeak,
         R"((show|reveal|print|display|tell|give)\s*(me\s*)?(your|the)?\s*(system\s*|initial\s*|hidden\s*|original\s*)?(prompt|instructions|rules))"},
        {C::kPromptLeak,
         R"((what|how)\s*(were|are)\s*(you|your)\s*(told|instructed|programmed))"},
        {C::kPromptLeak,
         R"((ignore|forget|disregard)\s*(all\s*)?(previous|prior|above)\s*(instructions?|rules?|prompts?))"},
        {C::kPromptLeak,
         R"(repeat\s*(back|after|your)\s*(system|initial)\s*(prompt|instructions?))"},
        {C::kPromptLeak, R"(시스템\s*프롬프트)"},
        {C::kPromptLeak, R"(지시\s*내용\s*(을\s*)?알려)"},
        {C::kPromptLeak, R"(규칙\s*(을\s*)?무시)"},
        {C::kPromptLeak, R"((초기|원래)\s*설정\s*(을\s*)?(보여|알려))"},

        // Persona switch and restriction removal
        {C::kJailbreak, R"(\byou\s*are\s*(now|from\s*now))"},
        {C::kJailbreak, R"(\bact\s+as\s+(a|an|if|though)\b)"},
        {C::kJailbreak, R"(\bpretend\s*(to\s*be|you\s*are))"},
        {C::kJailbreak, R"(\brole\s*-?\s*play\s*as)"},
        {C::kJailbreak,
         R"(\b(DAN|jailbreak|jailbroken|dev(eloper)?\s*mode|god\s*mode|admin\s*mode)\b)"},
        {C::kJailbreak,
         R"((unlock|enable|activate)\s*(hidden|secret|full)\s*(mode|capabilities))"},
        {C::kJailbreak,
         R"((ignore|forget|disregard|override)\s+(all\s+)?(of\s+)?(your\s+|the\s+)?(previous|prior|above|earlier)\s+(instructions?|rules?|prompts?|guidelines?))"},
        {C::kJailbreak, R"(이제부터\s*너는)"},
        {C::kJailbreak, R"(역할\s*(을\s*)?바꿔)"},
        {C::kJailbreak, R"(다른\s*AI\s*처럼)"},
        {C::kJailbreak, R"((이전|앞의|앞)\s*(모든\s*)?지시\s*(사항)?\s*(을|는|를)?\s*무시)"},

        // Fake role and system markers
        {C::kSystemTagSpoof, R"([\[<{]\s*(system|sys|assistant|admin|root)\b)"},
        {C::kSystemTagSpoof, R"(<<\s*SYS\s*>>)"},
        {C::kSystemTagSpoof, R"(\[\[SYSTEM\]\])"},
        {C::kSystemTagSpoof, R"(###\s*(system|instruction))"},
        {C::kSystemTagSpoof, R"(<\|im_start\|>)"},
        {C::kSystemTagSpoof, R"(<\|endoftext\|>)"},
        {C::kSystemTagSpoof, R"(\[/?INST\])"},
        {C::kSystemTagSpoof, R"(\[\s*(시스템|관리자)\s*\])"},
        {C::kSystemTagSpoof, R"((시스템|관리자)\s*(메시지|명령)\s*:)"},

        // Encoded payloads
        {C::kEncodingBypass, "base64 run", false, true, MatchKind::kBase64Run,
         options.encoded_run_min_length},
        {C::kEncodingBypass, R"(\\x[0-9a-fA-F]{2})", false},
        {C::kEncodingBypass, R"(\\u[0-9a-fA-F]{4})", false},
        // Numeric character references; U+10FFFF needs at most 7 digits
        {C::kEncodingBypass, R"(&#x?[0-9a-fA-F]{1,8};)", false},

        // U+200B..U+200F, U+2060..U+206F
        {C::kObfuscation, "zero-width run", false, false, MatchKind::kZeroWidthRun},
        // U+0300..U+036F
        {C::kObfuscation, "combining mark run", false, false, MatchKind::kCombiningMarkRun, 3},
    };
}

std::vector<std::string> DefaultDangerousKeywords() {
    return {
        "sudo", "override", "bypass", "hack", "exploit",
        "injection", "execute", "eval", "shell", "terminal",
        "rm -rf", "DROP TABLE", "DELETE FROM",
    };
}

absl::StatusOr<std::shared_ptr<const PatternRegistry>> PatternRegistry::Create(
    const RegistryOptions& options) {
    return Create(DefaultPatternSpecs(options), DefaultDangerousKeywords(), options);
}

absl::StatusOr<std::shared_ptr<const PatternRegistry>> PatternRegistry::Create(
    const std::vector<PatternSpec>& specs,
    const std::vector<std::string>& keywords,
    const RegistryOptions& options) {
    std::shared_ptr<PatternRegistry> registry(new PatternRegistry());

    for (size_t i = 0; i < specs.size(); ++i) {
        const PatternSpec& spec = specs[i];
        if (spec.kind != MatchKind::kRegex && spec.min_run == 0) {
            return PatternCompilationError(absl::StrCat(
                "rule #", i, " (", std::string(CategoryToString(spec.category)),
                ") needs a positive run length"));
        }
        try {
            PatternRule rule;
            rule.category = spec.category;
            rule.source = spec.pattern;
            rule.kind = spec.kind;
            rule.min_run = spec.min_run;
            if (spec.kind == MatchKind::kRegex) {
                rule.regex = std::regex(spec.pattern, spec.case_insensitive ? kIcase : kExact);
            }
            rule.triggers_payload_inspection = spec.triggers_payload_inspection;
            registry->rules_[static_cast<size_t>(spec.category)].push_back(std::move(rule));
        } catch (const std::regex_error& e) {
            return PatternCompilationError(absl::StrCat(
                "rule #", i, " (", std::string(CategoryToString(spec.category)),
                ") failed to compile: ", e.what()));
        }
    }

    for (const auto& literal : keywords) {
        registry->keywords_.push_back({literal, absl::AsciiStrToLower(literal)});
    }

    registry->inspector_run_min_length_ = options.inspector_run_min_length;

    return std::shared_ptr<const PatternRegistry>(std::move(registry));
}

size_t PatternRegistry::RuleCount() const {
    size_t count = 0;
    for (const auto& rules : rules_) {
        count += rules.size();
    }
    return count;
}

}  // namespace promptguard::guard
