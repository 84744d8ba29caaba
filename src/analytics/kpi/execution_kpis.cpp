/// @file execution_kpis.cpp
/// @brief Execution-history KPI accumulators

#include "analytics/kpi/execution_kpis.h"

#include <algorithm>
#include <set>
#include <tuple>

#include "analytics/stats_util.h"

namespace runlens::analytics {

using json = nlohmann::json;

namespace {

Timestamp FinishedAt(const RunRecord& run) {
    return run.finished_at.value_or(run.started_at);
}

/// Later (finished_at, run id) wins; used to pick a test's current suite
template <typename T>
void TrackLatestSuite(T& entry, const RunRecord& run, const std::string& suite) {
    const Timestamp at = FinishedAt(run);
    if (!entry.has_latest ||
        std::tie(at, run.id) > std::tie(entry.latest_at, entry.latest_run)) {
        entry.has_latest = true;
        entry.latest_at = at;
        entry.latest_run = run.id;
        entry.suite = suite;
    }
}

int Severity(TestStatus status) {
    switch (status) {
        case TestStatus::kFail: return 2;
        case TestStatus::kPass: return 1;
        case TestStatus::kSkip: return 0;
    }
    return 0;
}

}  // namespace

// ============================================================================
// test_pass_rate_trend
// ============================================================================

void PassRateTrendAccumulator::Fold(const ReportData& report) {
    for (const auto& test : report.tests) {
        Counts& counts = tests_[test.test_name];
        switch (test.status) {
            case TestStatus::kPass: ++counts.pass; break;
            case TestStatus::kFail: ++counts.fail; break;
            case TestStatus::kSkip: ++counts.skip; break;
        }
        TrackLatestSuite(counts, report.run, test.suite_name);
    }
}

absl::StatusOr<json> PassRateTrendAccumulator::Finalize() {
    struct Row {
        const std::string* name;
        const Counts* counts;
        double rate;
    };
    std::vector<Row> rows;
    for (const auto& [name, counts] : tests_) {
        const int64_t total = counts.pass + counts.fail + counts.skip;
        rows.push_back(Row{&name, &counts,
                           total ? static_cast<double>(counts.pass) / total : 0.0});
    }
    std::stable_sort(rows.begin(), rows.end(),
                     [](const Row& a, const Row& b) { return a.rate < b.rate; });

    json tests = json::array();
    for (size_t i = 0; i < rows.size() && i < config_.pass_rate_top; ++i) {
        const Counts& c = *rows[i].counts;
        const int64_t total = c.pass + c.fail + c.skip;
        tests.push_back({
            {"test_name", *rows[i].name},
            {"suite_name", c.suite},
            {"pass_count", c.pass},
            {"fail_count", c.fail},
            {"skip_count", c.skip},
            {"total_count", total},
            {"pass_rate", Percentage(static_cast<double>(c.pass), static_cast<double>(total))},
        });
    }
    return json{{"total_tests", rows.size()}, {"tests", std::move(tests)}};
}

// ============================================================================
// slowest_tests
// ============================================================================

void SlowestTestsAccumulator::Fold(const ReportData& report) {
    for (const auto& test : report.tests) {
        Durations& d = tests_[test.test_name];
        if (d.runs == 0) {
            d.min = d.max = test.duration_seconds;
        } else {
            d.min = std::min(d.min, test.duration_seconds);
            d.max = std::max(d.max, test.duration_seconds);
        }
        ++d.runs;
        d.sum += test.duration_seconds;
        TrackLatestSuite(d, report.run, test.suite_name);
    }
}

absl::StatusOr<json> SlowestTestsAccumulator::Finalize() {
    std::vector<std::pair<const std::string*, const Durations*>> rows;
    for (const auto& [name, d] : tests_) {
        rows.emplace_back(&name, &d);
    }
    std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
        return a.second->sum / a.second->runs > b.second->sum / b.second->runs;
    });

    json tests = json::array();
    for (size_t i = 0; i < rows.size() && i < config_.slowest_top; ++i) {
        const Durations& d = *rows[i].second;
        tests.push_back({
            {"test_name", *rows[i].first},
            {"suite_name", d.suite},
            {"avg_duration", RoundTo(d.sum / d.runs, 2)},
            {"min_duration", RoundTo(d.min, 2)},
            {"max_duration", RoundTo(d.max, 2)},
            {"run_count", d.runs},
        });
    }
    return json{{"total_tests", rows.size()}, {"tests", std::move(tests)}};
}

// ============================================================================
// flakiness_score
// ============================================================================

void FlakinessScoreAccumulator::Fold(const ReportData& report) {
    for (const auto& test : report.tests) {
        tests_[test.test_name].push_back(
            Observation{FinishedAt(report.run), report.run.id, test.status, test.suite_name});
    }
}

absl::StatusOr<json> FlakinessScoreAccumulator::Finalize() {
    struct Row {
        std::string name;
        std::string suite;
        int64_t total_runs;
        int64_t transitions;
        double score;
        json timeline;
    };
    std::vector<Row> rows;

    for (auto& [name, observations] : tests_) {
        if (observations.size() < 2) {
            continue;
        }
        std::sort(observations.begin(), observations.end(),
                  [](const Observation& a, const Observation& b) {
                      return std::tie(a.finished_at, a.run_id, a.suite) <
                             std::tie(b.finished_at, b.run_id, b.suite);
                  });

        // Only a direct PASS<->FAIL change counts; a SKIP in between breaks the pair
        int64_t transitions = 0;
        for (size_t i = 1; i < observations.size(); ++i) {
            const TestStatus prev = observations[i - 1].status;
            const TestStatus curr = observations[i].status;
            if (prev != TestStatus::kSkip && curr != TestStatus::kSkip && prev != curr) {
                ++transitions;
            }
        }

        json timeline = json::array();
        const size_t start = observations.size() > config_.flakiness_timeline
                                 ? observations.size() - config_.flakiness_timeline
                                 : 0;
        for (size_t i = start; i < observations.size(); ++i) {
            timeline.push_back({{"status", std::string(TestStatusToString(observations[i].status))}});
        }

        const int64_t total = static_cast<int64_t>(observations.size());
        rows.push_back(Row{name, observations.back().suite, total, transitions,
                           RoundTo(static_cast<double>(transitions) / (total - 1), 3),
                           std::move(timeline)});
    }

    const size_t considered = rows.size();
    std::stable_sort(rows.begin(), rows.end(),
                     [](const Row& a, const Row& b) { return a.score > b.score; });

    json tests = json::array();
    for (auto& row : rows) {
        if (tests.size() >= config_.flakiness_top || row.score <= 0) {
            break;
        }
        tests.push_back({
            {"test_name", row.name},
            {"suite_name", row.suite},
            {"total_runs", row.total_runs},
            {"transitions", row.transitions},
            {"flakiness_score", row.score},
            {"timeline", std::move(row.timeline)},
        });
    }
    return json{{"total_tests", considered}, {"tests", std::move(tests)}};
}

// ============================================================================
// failure_heatmap
// ============================================================================

void FailureHeatmapAccumulator::Fold(const ReportData& report) {
    const absl::CivilDay day = ToCivilDay(FinishedAt(report.run));
    for (const auto& test : report.tests) {
        auto key = std::make_pair(test.test_name, day);
        auto it = cells_.find(key);
        if (it == cells_.end()) {
            cells_.emplace(std::move(key), test.status);
        } else if (Severity(test.status) > Severity(it->second)) {
            it->second = test.status;
        }
        if (test.status == TestStatus::kFail) {
            ++failures_[test.test_name];
        }
    }
}

absl::StatusOr<json> FailureHeatmapAccumulator::Finalize() {
    std::set<absl::CivilDay> days;
    for (const auto& [key, status] : cells_) {
        days.insert(key.second);
    }

    std::vector<std::pair<std::string, int64_t>> ranked(failures_.begin(), failures_.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > config_.heatmap_tests) {
        ranked.resize(config_.heatmap_tests);
    }

    json dates = json::array();
    for (const auto& day : days) {
        dates.push_back(FormatDay(day));
    }

    json tests = json::array();
    for (const auto& [name, failures] : ranked) {
        json cells = json::array();
        for (const auto& day : days) {
            auto it = cells_.find(std::make_pair(name, day));
            cells.push_back({
                {"date", FormatDay(day)},
                {"status", it == cells_.end() ? std::string("NONE")
                                              : std::string(TestStatusToString(it->second))},
            });
        }
        tests.push_back({{"test_name", name}, {"failures", failures}, {"cells", std::move(cells)}});
    }
    return json{{"dates", std::move(dates)}, {"tests", std::move(tests)}};
}

// ============================================================================
// suite_duration_treemap
// ============================================================================

void SuiteDurationAccumulator::Fold(const ReportData& report) {
    for (const auto& test : report.tests) {
        Suite& suite = suites_[test.suite_name.empty() ? "Unknown" : test.suite_name];
        suite.total_duration += test.duration_seconds;
        ++suite.test_count;
    }
}

absl::StatusOr<json> SuiteDurationAccumulator::Finalize() {
    double total = 0.0;
    std::vector<std::pair<const std::string*, const Suite*>> ranked;
    for (const auto& [name, suite] : suites_) {
        total += suite.total_duration;
        ranked.emplace_back(&name, &suite);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.second->total_duration > b.second->total_duration;
    });

    json suites = json::array();
    for (size_t i = 0; i < ranked.size() && i < config_.treemap_top; ++i) {
        const Suite& s = *ranked[i].second;
        suites.push_back({
            {"suite_name", *ranked[i].first},
            {"total_duration", RoundTo(s.total_duration, 2)},
            {"test_count", s.test_count},
            {"percentage", Percentage(s.total_duration, total)},
        });
    }
    return json{{"total_duration", RoundTo(total, 2)}, {"suites", std::move(suites)}};
}

}  // namespace runlens::analytics
