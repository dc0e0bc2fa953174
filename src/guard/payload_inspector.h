#pragma once

/// @file payload_inspector.h
/// @brief Decodes suspected Base64 payloads and re-checks their plaintext

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "guard/pattern_registry.h"
#include "guard/types.h"

namespace promptguard::guard {

/// @brief Standard (RFC 4648) Base64 decoding
/// @return std::nullopt on characters outside the alphabet, misplaced or
///         inconsistent padding, or a length that cannot be a Base64 string
std::optional<std::string> DecodeBase64(std::string_view input);

/// @brief Searches Base64-shaped runs for hidden jailbreak phrases
///
/// Every Base64 run of at least the registry's inspector length is decoded.
/// The bytes are read as UTF-8 with invalid sequences dropped, white space is
/// folded, and the jailbreak rules are run against the result. Candidates that fail to decode are skipped.
class PayloadInspector {
public:
    explicit PayloadInspector(std::shared_ptr<const PatternRegistry> registry);

    /// @brief First hidden jailbreak found, if any
    std::optional<Detection> Inspect(std::string_view text) const;

private:
    bool MatchesJailbreak(std::string_view plaintext) const;

    std::shared_ptr<const PatternRegistry> registry_;
};

}  // namespace promptguard::guard
