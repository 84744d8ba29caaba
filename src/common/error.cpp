#include "error.h"

#include <absl/strings/cord.h>

namespace runlens {

namespace {

constexpr std::string_view kErrorCodePayload = "type.runlens.dev/error_code";

constexpr ErrorCode kAllCodes[] = {
    ErrorCode::kValidationError,
    ErrorCode::kMalformedReport,
    ErrorCode::kConfigurationError,
    ErrorCode::kIllegalTransition,
};

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kValidationError:
        case ErrorCode::kMalformedReport:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kConfigurationError:
        case ErrorCode::kIllegalTransition:
            return absl::StatusCode::kFailedPrecondition;
    }
    return absl::StatusCode::kUnknown;
}

}  // namespace

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kValidationError:
            return "validation_error";
        case ErrorCode::kMalformedReport:
            return "malformed_report";
        case ErrorCode::kConfigurationError:
            return "configuration_error";
        case ErrorCode::kIllegalTransition:
            return "illegal_transition";
    }
    return "unknown";
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), message);
    status.SetPayload(kErrorCodePayload, absl::Cord(ErrorCodeName(code)));
    return status;
}

std::optional<ErrorCode> GetErrorCode(const absl::Status& status) {
    auto payload = status.GetPayload(kErrorCodePayload);
    if (!payload) {
        return std::nullopt;
    }
    for (ErrorCode code : kAllCodes) {
        if (*payload == ErrorCodeName(code)) {
            return code;
        }
    }
    return std::nullopt;
}

int ToHttpStatus(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kOk:
            return 200;
        case absl::StatusCode::kInvalidArgument:
        case absl::StatusCode::kOutOfRange:
            return 400;
        case absl::StatusCode::kNotFound:
            return 404;
        case absl::StatusCode::kAlreadyExists:
        case absl::StatusCode::kFailedPrecondition:
            return 409;
        case absl::StatusCode::kUnavailable:
            return 503;
        default:
            return 500;
    }
}

}  // namespace runlens
