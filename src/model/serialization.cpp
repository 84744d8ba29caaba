/// @file serialization.cpp
/// @brief JSON encoding of engine records

#include "model/serialization.h"

#include <initializer_list>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

namespace runlens {

using json = nlohmann::json;

namespace {

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json OptionalTimestamp(const std::optional<Timestamp>& ts) {
    return ts ? json(FormatTimestamp(*ts)) : json(nullptr);
}

json OptionalDay(const std::optional<absl::CivilDay>& day) {
    return day ? json(FormatDay(*day)) : json(nullptr);
}

absl::Status RequireFields(const json& j, std::initializer_list<const char*> fields,
                           std::string_view what) {
    if (!j.is_object()) {
        return absl::InvalidArgumentError(absl::StrCat(what, " must be a JSON object"));
    }
    for (const char* field : fields) {
        if (!j.contains(field) || j.at(field).is_null()) {
            return absl::InvalidArgumentError(
                absl::StrCat(what, " is missing required field '", field, "'"));
        }
    }
    return absl::OkStatus();
}

}  // namespace

json ToJson(const RunRecord& run) {
    json j;
    j["id"] = run.id;
    j["repository_id"] = run.repository_id;
    j["started_at"] = FormatTimestamp(run.started_at);
    j["finished_at"] = OptionalTimestamp(run.finished_at);
    j["status"] = std::string(RunStatusToString(run.status));
    return j;
}

json ToJson(const TestResult& result) {
    json j;
    j["run_id"] = result.run_id;
    j["test_name"] = result.test_name;
    j["suite_name"] = result.suite_name;
    j["status"] = std::string(TestStatusToString(result.status));
    j["duration_seconds"] = result.duration_seconds;
    j["error_message"] = result.error_message;
    j["tags"] = result.tags;
    return j;
}

json ToJson(const KeywordCall& call) {
    json j;
    j["run_id"] = call.run_id;
    j["test_name"] = call.test_name;
    j["keyword_name"] = call.keyword_name;
    j["library_name"] = OptionalToJson(call.library_name);
    j["kind"] = std::string(KeywordKindToString(call.kind));
    j["start_time"] = FormatTimestamp(call.start_time);
    j["duration_seconds"] = call.duration_seconds;
    j["depth"] = call.depth;
    return j;
}

json ToJson(const OverviewSnapshot& snapshot) {
    json j;
    j["filter_days"] = snapshot.filter_days;
    j["repository_id"] = OptionalToJson(snapshot.repository_id);
    j["total_runs"] = snapshot.total_runs;
    j["passed_runs"] = snapshot.passed_runs;
    j["failed_runs"] = snapshot.failed_runs;
    j["error_runs"] = snapshot.error_runs;
    j["success_rate"] = snapshot.success_rate;
    j["avg_duration_seconds"] = snapshot.avg_duration_seconds;
    j["total_tests"] = snapshot.total_tests;
    j["flaky_tests"] = snapshot.flaky_tests;
    j["active_repos"] = snapshot.active_repos;
    j["computed_at"] = FormatTimestamp(snapshot.computed_at);
    return j;
}

json ToJson(const TrendPoint& point) {
    return json{
        {"date", FormatDay(point.date)},
        {"passed", point.passed},
        {"failed", point.failed},
        {"error", point.error},
        {"total", point.total},
        {"avg_duration", point.avg_duration},
    };
}

json ToJson(const SuccessRatePoint& point) {
    return json{
        {"date", FormatDay(point.date)},
        {"success_rate", point.success_rate},
        {"total_runs", point.total_runs},
    };
}

json ToJson(const FlakyTestEntry& entry) {
    return json{
        {"test_name", entry.test_name},
        {"suite_name", entry.suite_name},
        {"total_runs", entry.total_runs},
        {"pass_count", entry.pass_count},
        {"fail_count", entry.fail_count},
        {"flip_count", entry.flip_count},
        {"flaky_rate", entry.flaky_rate},
        {"last_status", std::string(TestStatusToString(entry.last_status))},
    };
}

json ToJson(const AggregationWatermark& watermark) {
    return json{
        {"computed_at", FormatTimestamp(watermark.computed_at)},
        {"window_days", watermark.window_days},
        {"repository_id", OptionalToJson(watermark.repository_id)},
    };
}

json ToJson(const AnalysisJob& job) {
    json j;
    j["id"] = job.id;
    j["repository_id"] = OptionalToJson(job.repository_id);
    j["selected_kpis"] = job.selected_kpis;
    j["date_from"] = OptionalDay(job.date_from);
    j["date_to"] = OptionalDay(job.date_to);
    j["status"] = std::string(JobStatusToString(job.status));
    j["progress"] = job.progress;
    j["reports_analyzed"] = job.reports_analyzed;
    j["error_message"] = OptionalToJson(job.error_message);
    j["results"] = job.IsTerminal() ? job.results : json(nullptr);
    j["created_at"] = FormatTimestamp(job.created_at);
    j["started_at"] = OptionalTimestamp(job.started_at);
    j["completed_at"] = OptionalTimestamp(job.completed_at);
    return j;
}

json ToJson(const KpiMeta& meta) {
    return json{
        {"id", meta.id},
        {"category", meta.category},
        {"name", meta.name},
        {"description", meta.description},
    };
}

absl::StatusOr<RunRecord> RunRecordFromJson(const json& j) {
    auto status = RequireFields(j, {"id", "repository_id", "started_at", "status"}, "run");
    if (!status.ok()) {
        return status;
    }

    try {
        RunRecord run;
        run.id = j.at("id").get<RunId>();
        run.repository_id = j.at("repository_id").get<RepositoryId>();

        auto started = ParseTimestamp(j.at("started_at").get<std::string>());
        if (!started.ok()) {
            return started.status();
        }
        run.started_at = *started;

        if (j.contains("finished_at") && !j.at("finished_at").is_null()) {
            auto finished = ParseTimestamp(j.at("finished_at").get<std::string>());
            if (!finished.ok()) {
                return finished.status();
            }
            run.finished_at = *finished;
        }

        auto run_status = RunStatusFromString(j.at("status").get<std::string>());
        if (!run_status) {
            return absl::InvalidArgumentError(
                absl::StrCat("run ", run.id, " has unknown status ", j.at("status").dump()));
        }
        run.status = *run_status;
        return run;
    } catch (const json::exception& e) {
        return absl::InvalidArgumentError(absl::StrCat("Malformed run: ", e.what()));
    }
}

absl::StatusOr<TestResult> TestResultFromJson(const json& j) {
    auto status = RequireFields(j, {"run_id", "test_name", "status"}, "test result");
    if (!status.ok()) {
        return status;
    }

    try {
        TestResult result;
        result.run_id = j.at("run_id").get<RunId>();
        result.test_name = j.at("test_name").get<std::string>();
        result.suite_name = j.value("suite_name", "");
        result.duration_seconds = j.value("duration_seconds", 0.0);
        if (j.contains("error_message") && j.at("error_message").is_string()) {
            result.error_message = j.at("error_message").get<std::string>();
        }

        auto test_status = TestStatusFromString(j.at("status").get<std::string>());
        if (!test_status) {
            return absl::InvalidArgumentError(absl::StrCat(
                "test '", result.test_name, "' has unknown status ", j.at("status").dump()));
        }
        result.status = *test_status;

        // Tags arrive either as an array or as the comma separated DB column
        if (j.contains("tags")) {
            const auto& tags = j.at("tags");
            if (tags.is_array()) {
                result.tags = tags.get<std::vector<std::string>>();
            } else if (tags.is_string()) {
                for (absl::string_view tag :
                     absl::StrSplit(tags.get<std::string>(), ',', absl::SkipWhitespace())) {
                    result.tags.emplace_back(absl::StripAsciiWhitespace(tag));
                }
            }
        }
        return result;
    } catch (const json::exception& e) {
        return absl::InvalidArgumentError(absl::StrCat("Malformed test result: ", e.what()));
    }
}

absl::StatusOr<KeywordCall> KeywordCallFromJson(const json& j) {
    auto status = RequireFields(
        j, {"run_id", "test_name", "keyword_name", "start_time"}, "keyword call");
    if (!status.ok()) {
        return status;
    }

    try {
        KeywordCall call;
        call.run_id = j.at("run_id").get<RunId>();
        call.test_name = j.at("test_name").get<std::string>();
        call.keyword_name = j.at("keyword_name").get<std::string>();
        if (j.contains("library_name") && j.at("library_name").is_string() &&
            !j.at("library_name").get<std::string>().empty()) {
            call.library_name = j.at("library_name").get<std::string>();
        }
        call.duration_seconds = j.value("duration_seconds", 0.0);
        call.depth = j.value("depth", 0);

        if (j.contains("kind")) {
            auto kind = KeywordKindFromString(j.at("kind").get<std::string>());
            if (!kind) {
                return absl::InvalidArgumentError(
                    absl::StrCat("keyword '", call.keyword_name, "' has unknown kind ",
                                 j.at("kind").dump()));
            }
            call.kind = *kind;
        }

        auto start = ParseTimestamp(j.at("start_time").get<std::string>());
        if (!start.ok()) {
            return start.status();
        }
        call.start_time = *start;
        return call;
    } catch (const json::exception& e) {
        return absl::InvalidArgumentError(absl::StrCat("Malformed keyword call: ", e.what()));
    }
}

}  // namespace runlens
