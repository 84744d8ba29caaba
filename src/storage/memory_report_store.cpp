/// @file memory_report_store.cpp
/// @brief In-memory report store and JSON dump loading

#include "storage/memory_report_store.h"

#include <algorithm>
#include <fstream>
#include <mutex>
#include <unordered_set>

#include <absl/strings/str_cat.h>

#include "common/logging.h"
#include "model/serialization.h"

namespace runlens::storage {

using json = nlohmann::json;

absl::Status MemoryReportStore::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return absl::NotFoundError(
            absl::StrCat("Report dump not found: ", path.string()));
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse report dump ", path.string(), ": ", e.what()));
    }

    auto status = LoadFromJson(doc);
    if (!status.ok()) {
        return status;
    }
    RUNLENS_LOG_INFO("Loaded {} runs from {}", RunCount(), path.string());
    return absl::OkStatus();
}

absl::Status MemoryReportStore::LoadFromJson(const json& doc) {
    if (!doc.is_object()) {
        return absl::InvalidArgumentError("Report dump must be a JSON object");
    }

    // Decode everything first so a bad record leaves the store untouched
    std::vector<RunRecord> runs;
    std::vector<TestResult> results;
    std::vector<KeywordCall> calls;

    if (auto it = doc.find("runs"); it != doc.end()) {
        for (const auto& item : *it) {
            auto run = RunRecordFromJson(item);
            if (!run.ok()) {
                return run.status();
            }
            runs.push_back(std::move(*run));
        }
    }
    if (auto it = doc.find("test_results"); it != doc.end()) {
        for (const auto& item : *it) {
            auto result = TestResultFromJson(item);
            if (!result.ok()) {
                return result.status();
            }
            results.push_back(std::move(*result));
        }
    }
    if (auto it = doc.find("keyword_calls"); it != doc.end()) {
        for (const auto& item : *it) {
            auto call = KeywordCallFromJson(item);
            if (!call.ok()) {
                return call.status();
            }
            calls.push_back(std::move(*call));
        }
    }

    std::unique_lock lock(mutex_);
    std::unordered_set<RunId> known;
    for (const auto& run : runs) {
        known.insert(run.id);
    }
    auto is_known = [&](RunId id) { return known.count(id) > 0 || runs_.count(id) > 0; };
    for (const auto& result : results) {
        if (!is_known(result.run_id)) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Test result '", result.test_name, "' references unknown run ",
                result.run_id));
        }
    }
    for (const auto& call : calls) {
        if (!is_known(call.run_id)) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Keyword call '", call.keyword_name, "' references unknown run ",
                call.run_id));
        }
    }

    for (auto& run : runs) {
        RunId id = run.id;
        runs_[id] = std::move(run);
    }
    for (auto& result : results) {
        RunId id = result.run_id;
        test_results_[id].push_back(std::move(result));
    }
    for (auto& call : calls) {
        RunId id = call.run_id;
        keyword_calls_[id].push_back(std::move(call));
    }
    return absl::OkStatus();
}

void MemoryReportStore::AddRun(RunRecord run) {
    std::unique_lock lock(mutex_);
    RunId id = run.id;
    runs_[id] = std::move(run);
}

absl::Status MemoryReportStore::AddTestResult(TestResult result) {
    std::unique_lock lock(mutex_);
    if (runs_.count(result.run_id) == 0) {
        return absl::NotFoundError(absl::StrCat("Unknown run ", result.run_id));
    }
    RunId id = result.run_id;
    test_results_[id].push_back(std::move(result));
    return absl::OkStatus();
}

absl::Status MemoryReportStore::AddKeywordCall(KeywordCall call) {
    std::unique_lock lock(mutex_);
    if (runs_.count(call.run_id) == 0) {
        return absl::NotFoundError(absl::StrCat("Unknown run ", call.run_id));
    }
    RunId id = call.run_id;
    keyword_calls_[id].push_back(std::move(call));
    return absl::OkStatus();
}

size_t MemoryReportStore::RunCount() const {
    std::shared_lock lock(mutex_);
    return runs_.size();
}

absl::StatusOr<std::vector<RunRecord>> MemoryReportStore::ListRuns(const RunFilter& filter) {
    std::vector<RunRecord> out;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, run] : runs_) {
            if (filter.Matches(run)) {
                out.push_back(run);
            }
        }
    }
    std::sort(out.begin(), out.end(), [](const RunRecord& a, const RunRecord& b) {
        if (*a.finished_at != *b.finished_at) {
            return *a.finished_at < *b.finished_at;
        }
        return a.id < b.id;
    });
    return out;
}

absl::StatusOr<std::vector<TestResult>> MemoryReportStore::GetTestResults(RunId run_id) {
    std::shared_lock lock(mutex_);
    auto it = test_results_.find(run_id);
    if (it == test_results_.end()) {
        return std::vector<TestResult>{};
    }
    return it->second;
}

absl::StatusOr<std::vector<KeywordCall>> MemoryReportStore::GetKeywordCalls(RunId run_id) {
    std::vector<KeywordCall> calls;
    {
        std::shared_lock lock(mutex_);
        auto it = keyword_calls_.find(run_id);
        if (it != keyword_calls_.end()) {
            calls = it->second;
        }
    }
    std::stable_sort(calls.begin(), calls.end(), [](const KeywordCall& a, const KeywordCall& b) {
        if (a.test_name != b.test_name) {
            return a.test_name < b.test_name;
        }
        return a.start_time < b.start_time;
    });
    return calls;
}

absl::StatusOr<std::optional<Timestamp>> MemoryReportStore::LatestFinishedAt(
    std::optional<RepositoryId> repository_id) {
    std::shared_lock lock(mutex_);
    std::optional<Timestamp> latest;
    for (const auto& [id, run] : runs_) {
        if (!run.finished_at) {
            continue;
        }
        if (repository_id && run.repository_id != *repository_id) {
            continue;
        }
        if (!latest || *run.finished_at > *latest) {
            latest = run.finished_at;
        }
    }
    return latest;
}

}  // namespace runlens::storage
