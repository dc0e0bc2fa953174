#pragma once

/// @file pattern_registry.h
/// @brief Immutable, compiled set of categorized detection rules
///
/// The registry is built once and shared read-only between validators and
/// threads. Linguistic categories (prompt leak, jailbreak, system tag) are
/// matched case-insensitively and carry both English and Korean phrasings;
/// encoding and obfuscation rules are case-sensitive. Non-ASCII character
/// classes are written as UTF-8 byte sequences since std::regex works on
/// bytes. Rules over unbounded character runs (Base64 blocks, zero-width and
/// combining-mark runs) are matched by linear scanners instead of regexes.

#include <array>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "guard/types.h"

namespace promptguard::guard {

/// @brief How a rule finds its match
enum class MatchKind {
    kRegex,             ///< std::regex search over the input bytes
    kBase64Run,         ///< Base64-alphabet run of min_run or more, up to two '='
    kZeroWidthRun,      ///< One or more zero-width characters
    kCombiningMarkRun,  ///< min_run or more combining marks
};

/// @brief Uncompiled rule definition
struct PatternSpec {
    DetectionCategory category;

    /// Regex source, or a descriptive label for scanner rules
    std::string pattern;
    bool case_insensitive = true;

    /// A match hands the whole input to the payload inspector
    bool triggers_payload_inspection = false;

    MatchKind kind = MatchKind::kRegex;
    size_t min_run = 1;
};

/// @brief Compiled rule
struct PatternRule {
    DetectionCategory category;
    std::string source;
    MatchKind kind = MatchKind::kRegex;
    std::regex regex;  ///< Only set for MatchKind::kRegex
    size_t min_run = 1;
    bool triggers_payload_inspection = false;

    /// @brief First match of the rule in text
    /// @return true and the matched span in *match, or false
    bool Search(std::string_view text, std::string_view* match) const;
};

/// @brief Literal keyword matched as a case-insensitive substring
struct Keyword {
    std::string literal;   ///< As reported in evidence
    std::string lowered;   ///< ASCII-lowercased for matching
};

struct RegistryOptions {
    /// Minimum Base64-alphabet run that counts as an encoding bypass
    size_t encoded_run_min_length = 40;

    /// Minimum run the payload inspector attempts to decode
    size_t inspector_run_min_length = 20;
};

class PatternRegistry {
public:
    /// @brief Build the registry from the built-in rule set
    static absl::StatusOr<std::shared_ptr<const PatternRegistry>> Create(
        const RegistryOptions& options = {});

    /// @brief Build the registry from explicit rules
    /// @return PatternCompilationError naming the first rule that fails
    static absl::StatusOr<std::shared_ptr<const PatternRegistry>> Create(
        const std::vector<PatternSpec>& specs,
        const std::vector<std::string>& keywords,
        const RegistryOptions& options = {});

    PatternRegistry(const PatternRegistry&) = delete;
    PatternRegistry& operator=(const PatternRegistry&) = delete;

    /// @brief Rules of one category in registration order (may be empty)
    const std::vector<PatternRule>& Rules(DetectionCategory category) const {
        return rules_[static_cast<size_t>(category)];
    }

    const std::vector<Keyword>& DangerousKeywords() const { return keywords_; }

    /// @brief Minimum Base64 run the payload inspector decodes
    size_t InspectorRunMinLength() const { return inspector_run_min_length_; }

    size_t RuleCount() const;

private:
    PatternRegistry() = default;

    std::array<std::vector<PatternRule>, kDetectionCategoryCount> rules_;
    std::vector<Keyword> keywords_;
    size_t inspector_run_min_length_ = 0;
};

/// @brief Built-in rules, in evaluation order within each category
std::vector<PatternSpec> DefaultPatternSpecs(const RegistryOptions& options = {});

/// @brief Built-in dangerous keyword list
std::vector<std::string> DefaultDangerousKeywords();

}  // namespace promptguard::guard
