#pragma once

/// @file report_fixtures.h
/// @brief Builders for run, test and keyword records used across unit tests

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/time_util.h"
#include "model/types.h"

namespace runlens::fixtures {

/// @brief Parse an RFC 3339 literal; test inputs are always valid
inline Timestamp At(std::string_view text) {
    return ParseTimestamp(text).value();
}

inline RunRecord MakeRun(RunId id, RepositoryId repository_id, Timestamp finished_at,
                         RunStatus status = RunStatus::kPassed, double duration_seconds = 60) {
    RunRecord run;
    run.id = id;
    run.repository_id = repository_id;
    run.finished_at = finished_at;
    run.started_at = finished_at - std::chrono::duration_cast<std::chrono::system_clock::duration>(
                                       std::chrono::duration<double>(duration_seconds));
    run.status = status;
    return run;
}

inline TestResult MakeTest(RunId run_id, std::string name, std::string suite,
                           TestStatus status, double duration_seconds = 1.0,
                           std::string error_message = "",
                           std::vector<std::string> tags = {}) {
    TestResult result;
    result.run_id = run_id;
    result.test_name = std::move(name);
    result.suite_name = std::move(suite);
    result.status = status;
    result.duration_seconds = duration_seconds;
    result.error_message = std::move(error_message);
    result.tags = std::move(tags);
    return result;
}

inline KeywordCall MakeStep(RunId run_id, std::string test, std::string keyword,
                            Timestamp start, std::optional<std::string> library = std::nullopt,
                            double duration_seconds = 0.5, int depth = 0,
                            KeywordKind kind = KeywordKind::kKeyword) {
    KeywordCall call;
    call.run_id = run_id;
    call.test_name = std::move(test);
    call.keyword_name = std::move(keyword);
    call.library_name = std::move(library);
    call.start_time = start;
    call.duration_seconds = duration_seconds;
    call.depth = depth;
    call.kind = kind;
    return call;
}

/// @brief Top-level steps of one test, one second apart starting at @p start
inline std::vector<KeywordCall> MakeSteps(RunId run_id, const std::string& test,
                                          const std::vector<std::string>& keywords,
                                          Timestamp start) {
    std::vector<KeywordCall> calls;
    for (size_t i = 0; i < keywords.size(); ++i) {
        calls.push_back(MakeStep(run_id, test, keywords[i],
                                 start + std::chrono::seconds(static_cast<int>(i))));
    }
    return calls;
}

}  // namespace runlens::fixtures
