#pragma once

/// @file validator.h
/// @brief Input validation entry point for the assistant's LLM boundary
///
/// Example:
/// @code
///   ValidatorConfig config;
///   config.strict_mode = true;
///   auto validator = Validator::Create(config);
///   if (!validator.ok()) {
///       PROMPTGUARD_LOG_CRITICAL("Validator unavailable: {}", validator.status().ToString());
///       return;
///   }
///
///   auto result = (*validator)->Validate(user_input);
///   if (!result.is_valid) {
///       // Do not forward user_input or anything derived from it
///       Reply(result.message);
///       return;
///   }
///   Forward(result.sanitized_input);
/// @endcode

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "guard/pattern_registry.h"
#include "guard/threat_scorer.h"
#include "guard/types.h"
#include "guard/validator_config.h"

namespace promptguard::guard {

/// @brief Classifies untrusted input and decides whether it may be forwarded
///
/// Validate() is const and touches no mutable state, so one instance can be
/// shared by any number of threads without locking.
class Validator {
public:
    /// @brief Check the configuration and compile the rule set
    /// @return ConfigurationError for out-of-range settings,
    ///         PatternCompilationError if a rule does not compile
    static absl::StatusOr<std::unique_ptr<Validator>> Create(ValidatorConfig config = {});

    Validator(const Validator&) = delete;
    Validator& operator=(const Validator&) = delete;

    /// @brief Validate one input
    ///
    /// Empty or whitespace-only input is Safe and valid with message
    /// "Empty input" and is not scored.
    ValidationResult Validate(std::string_view text) const;

    /// @brief Validate each input in order
    std::vector<ValidationResult> ValidateBatch(const std::vector<std::string>& texts) const;

    const ValidatorConfig& GetConfig() const { return config_; }
    const PatternRegistry& GetRegistry() const { return *registry_; }

private:
    Validator(ValidatorConfig config, std::shared_ptr<const PatternRegistry> registry);

    void LogVerdict(const ValidationResult& result) const;

    ValidatorConfig config_;
    std::shared_ptr<const PatternRegistry> registry_;
    ThreatScorer scorer_;
};

/// @brief One-shot validation with a throwaway validator
///
/// Compiles the rule set on every call; long-lived callers should hold a
/// Validator instead.
absl::StatusOr<ValidationResult> Validate(std::string_view text, const ValidatorConfig& config);

/// @brief Process-wide validator with the default configuration
///
/// Built exactly once, on first use. The returned pointer stays valid for
/// the lifetime of the process.
absl::StatusOr<const Validator*> SharedValidator();

}  // namespace promptguard::guard
