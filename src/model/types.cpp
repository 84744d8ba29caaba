/// @file types.cpp
/// @brief Status enum string conversions

#include "model/types.h"

#include <absl/strings/ascii.h>

namespace runlens {

std::string_view RunStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::kPending: return "pending";
        case RunStatus::kRunning: return "running";
        case RunStatus::kPassed: return "passed";
        case RunStatus::kFailed: return "failed";
        case RunStatus::kError: return "error";
        case RunStatus::kCancelled: return "cancelled";
        case RunStatus::kTimeout: return "timeout";
    }
    return "pending";
}

std::optional<RunStatus> RunStatusFromString(std::string_view text) {
    const std::string lower = absl::AsciiStrToLower(text);
    if (lower == "pending") return RunStatus::kPending;
    if (lower == "running") return RunStatus::kRunning;
    if (lower == "passed") return RunStatus::kPassed;
    if (lower == "failed") return RunStatus::kFailed;
    if (lower == "error") return RunStatus::kError;
    if (lower == "cancelled") return RunStatus::kCancelled;
    if (lower == "timeout") return RunStatus::kTimeout;
    return std::nullopt;
}

std::string_view TestStatusToString(TestStatus status) {
    switch (status) {
        case TestStatus::kPass: return "PASS";
        case TestStatus::kFail: return "FAIL";
        case TestStatus::kSkip: return "SKIP";
    }
    return "PASS";
}

std::optional<TestStatus> TestStatusFromString(std::string_view text) {
    const std::string upper = absl::AsciiStrToUpper(text);
    if (upper == "PASS") return TestStatus::kPass;
    if (upper == "FAIL") return TestStatus::kFail;
    if (upper == "SKIP" || upper == "NOT RUN") return TestStatus::kSkip;
    return std::nullopt;
}

std::string_view KeywordKindToString(KeywordKind kind) {
    switch (kind) {
        case KeywordKind::kKeyword: return "kw";
        case KeywordKind::kSetup: return "setup";
        case KeywordKind::kTeardown: return "teardown";
        case KeywordKind::kControl: return "control";
    }
    return "kw";
}

std::optional<KeywordKind> KeywordKindFromString(std::string_view text) {
    const std::string lower = absl::AsciiStrToLower(text);
    if (lower == "kw" || lower == "keyword") return KeywordKind::kKeyword;
    if (lower == "setup") return KeywordKind::kSetup;
    if (lower == "teardown") return KeywordKind::kTeardown;
    if (lower == "for" || lower == "if" || lower == "try" || lower == "while" ||
        lower == "control") {
        return KeywordKind::kControl;
    }
    return std::nullopt;
}

std::string_view JobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::kPending: return "pending";
        case JobStatus::kRunning: return "running";
        case JobStatus::kCompleted: return "completed";
        case JobStatus::kError: return "error";
    }
    return "pending";
}

}  // namespace runlens
