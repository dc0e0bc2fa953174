#pragma once

/// @file error.h
/// @brief Status helpers for configuration and rule-set failures

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/string_view.h>

namespace promptguard {

/// @brief Failure classes the engine and its tooling can report
///
/// Validation itself never fails; these cover startup only.
enum class ErrorCode {
    kOk = 0,
    kInternal,

    /// Setting out of range or of the wrong type
    kConfigurationError,
    /// Configuration file does not exist
    kConfigFileNotFound,
    /// Configuration file or string is not valid YAML
    kConfigParseError,
    /// A detection rule or the payload candidate pattern does not compile
    kPatternCompilationError,
};

/// @brief absl code carried by statuses of the given class
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Stable lowercase name, e.g. "config_parse_error"
std::string_view ErrorCodeName(ErrorCode code);

absl::Status MakeError(ErrorCode code, absl::string_view message);

inline absl::Status ConfigurationError(absl::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

inline absl::Status ConfigFileNotFound(absl::string_view message) {
    return MakeError(ErrorCode::kConfigFileNotFound, message);
}

inline absl::Status ConfigParseError(absl::string_view message) {
    return MakeError(ErrorCode::kConfigParseError, message);
}

inline absl::Status PatternCompilationError(absl::string_view message) {
    return MakeError(ErrorCode::kPatternCompilationError, message);
}

/// @brief Prefix a failed status with where it happened ("<context>: <message>")
///
/// OK statuses are returned unchanged.
absl::Status Annotate(const absl::Status& status, absl::string_view context);

/// @brief Return from the enclosing function if expr yields a non-OK status
#define PROMPTGUARD_RETURN_IF_ERROR(expr)                                      \
    do {                                                                        \
        auto _promptguard_status = (expr);                                      \
        if (!_promptguard_status.ok()) {                                        \
            return _promptguard_status;                                         \
        }                                                                       \
    } while (0)

/// @brief Unwrap a StatusOr into lhs, or return its status
#define PROMPTGUARD_ASSIGN_OR_RETURN(lhs, rhs)                                 \
    PROMPTGUARD_ASSIGN_OR_RETURN_IMPL(                                         \
        PROMPTGUARD_CONCAT(_promptguard_statusor_, __LINE__), lhs, rhs)

#define PROMPTGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                  \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define PROMPTGUARD_CONCAT(a, b) PROMPTGUARD_CONCAT_IMPL(a, b)
#define PROMPTGUARD_CONCAT_IMPL(a, b) a##b

/// @brief Return error_status unless condition holds
#define PROMPTGUARD_CHECK_OR_RETURN(condition, error_status)                   \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace promptguard
