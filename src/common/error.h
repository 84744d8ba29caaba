#pragma once

/// @file error.h
/// @brief RunLens error codes carried on absl::Status

#include <optional>
#include <string_view>
#include <utility>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace runlens {

/// @brief Failure kinds raised by RunLens itself
///
/// Each kind maps onto one absl::StatusCode and is also attached to the
/// status as a payload, so callers can tell a rejected job request from a
/// bad argument coming out of absl or the standard library.
enum class ErrorCode {
    kValidationError,     ///< Rejected request (empty KPI list, inverted date range)
    kMalformedReport,     ///< Report that cannot be folded into a KPI
    kConfigurationError,  ///< Invalid daemon configuration
    kIllegalTransition,   ///< Job state machine violation
};

/// @brief Stable snake_case name, e.g. "validation_error"
std::string_view ErrorCodeName(ErrorCode code);

absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief RunLens error code attached by MakeError(), if any
std::optional<ErrorCode> GetErrorCode(const absl::Status& status);

/// @brief HTTP status code for an API error response
int ToHttpStatus(const absl::Status& status);

inline absl::Status InvalidArgumentError(std::string_view message) {
    return absl::InvalidArgumentError(message);
}

inline absl::Status InternalError(std::string_view message) {
    return absl::InternalError(message);
}

#define RUNLENS_RETURN_IF_ERROR(expr)                                           \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Declare-and-assign from an absl::StatusOr, returning its error
#define RUNLENS_ASSIGN_OR_RETURN(lhs, rhs)                                      \
    RUNLENS_ASSIGN_OR_RETURN_IMPL(RUNLENS_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define RUNLENS_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                       \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define RUNLENS_CONCAT(a, b) RUNLENS_CONCAT_IMPL(a, b)
#define RUNLENS_CONCAT_IMPL(a, b) a##b

}  // namespace runlens
