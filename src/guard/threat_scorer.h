#pragma once

/// @file threat_scorer.h
/// @brief Weighted multi-category scoring of untrusted input

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "guard/pattern_registry.h"
#include "guard/payload_inspector.h"
#include "guard/types.h"
#include "guard/validator_config.h"

namespace promptguard::guard {

/// @brief Score and evidence for one input
struct ScoreResult {
    int total = 0;

    /// Triggered categories in detection order
    std::vector<Detection> detections;

    /// The text that was scored (truncated if the input was too long)
    std::string scored_text;

    bool truncated = false;
};

/// @brief Applies every rule family to an input
///
/// All checks run; nothing short-circuits. Each distinct matching rule
/// contributes its category weight once, however often it matches. Order:
///   1. length (truncate to max_length code points)
///   2. prompt leak, 3. jailbreak, 4. system tag
///   5. dangerous keywords (one contribution per distinct keyword)
///   6. encoding bypass (a Base64-shaped match runs the payload inspector)
///   7. obfuscation, 8. repetition
class ThreatScorer {
public:
    ThreatScorer(std::shared_ptr<const PatternRegistry> registry, ValidatorConfig config);

    ScoreResult Score(std::string_view text) const;

private:
    void ScanRules(DetectionCategory category, std::string_view text,
                   ScoreResult* result) const;
    void ScanKeywords(const std::string& text, ScoreResult* result) const;
    void ScanEncodings(const std::string& text, ScoreResult* result) const;

    void Record(DetectionCategory category, std::string_view evidence,
                ScoreResult* result) const;

    std::shared_ptr<const PatternRegistry> registry_;
    ValidatorConfig config_;
    PayloadInspector inspector_;
};

}  // namespace promptguard::guard
