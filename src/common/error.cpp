#include "common/error.h"

namespace promptguard {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kConfigurationError:
        case ErrorCode::kConfigParseError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kConfigFileNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kInternal:
        case ErrorCode::kPatternCompilationError:
            return absl::StatusCode::kInternal;
    }
    return absl::StatusCode::kUnknown;
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kConfigurationError: return "configuration_error";
        case ErrorCode::kConfigFileNotFound: return "config_file_not_found";
        case ErrorCode::kConfigParseError: return "config_parse_error";
        case ErrorCode::kPatternCompilationError: return "pattern_compilation_error";
    }
    return "unknown";
}

absl::Status MakeError(ErrorCode code, absl::string_view message) {
    return absl::Status(ToAbslCode(code), message);
}

absl::Status Annotate(const absl::Status& status, absl::string_view context) {
    if (status.ok()) {
        return status;
    }
    return absl::Status(status.code(), absl::StrCat(context, ": ", status.message()));
}

}  // namespace promptguard
