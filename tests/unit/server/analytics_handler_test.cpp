/// @file analytics_handler_test.cpp
/// @brief Tests for the stats and analysis API routes

#include <gtest/gtest.h>

#include <memory>

#include <absl/strings/str_cat.h>

#include "common/metrics.h"
#include "report_fixtures.h"
#include "server/analytics_handler.h"
#include "storage/job_store.h"
#include "storage/memory_report_store.h"
#include "storage/snapshot_cache.h"

namespace runlens::server {
namespace {

using fixtures::At;
using fixtures::MakeRun;
using fixtures::MakeTest;
using json = nlohmann::json;

HttpRequest Get(std::string path,
                std::unordered_map<std::string, std::string> query = {}) {
    HttpRequest request;
    request.method = "GET";
    request.path = std::move(path);
    request.query_params = std::move(query);
    return request;
}

HttpRequest Post(std::string path, std::string body = "",
                 std::unordered_map<std::string, std::string> query = {}) {
    HttpRequest request = Get(std::move(path), std::move(query));
    request.method = "POST";
    request.body = std::move(body);
    return request;
}

class AnalyticsHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::Instance().Reset();
        store_ = std::make_shared<storage::MemoryReportStore>();
        store_->AddRun(MakeRun(1, 1, At("2026-03-08T10:00:00Z"), RunStatus::kPassed));
        store_->AddRun(MakeRun(2, 1, At("2026-03-09T10:00:00Z"), RunStatus::kFailed));
        store_->AddRun(MakeRun(3, 2, At("2026-03-09T11:00:00Z"), RunStatus::kPassed));
        ASSERT_TRUE(store_->AddTestResult(MakeTest(1, "Login", "Auth", TestStatus::kPass)).ok());
        ASSERT_TRUE(store_->AddTestResult(MakeTest(2, "Login", "Auth", TestStatus::kFail)).ok());
        ASSERT_TRUE(store_->AddTestResult(MakeTest(3, "Login", "Auth", TestStatus::kPass)).ok());

        aggregation_ = std::make_shared<analytics::AggregationEngine>(
            store_, std::make_shared<storage::SnapshotCache>());
        jobs_ = std::make_shared<analytics::AnalysisJobEngine>(
            store_, nullptr, std::make_shared<storage::JobStore>());
        handler_ = std::make_unique<AnalyticsHandler>(aggregation_, jobs_,
                                                      [] { return At("2026-03-10T12:00:00Z"); });
    }

    json Body(const HttpResponse& response) { return json::parse(response.body); }

    std::shared_ptr<storage::MemoryReportStore> store_;
    std::shared_ptr<analytics::AggregationEngine> aggregation_;
    std::shared_ptr<analytics::AnalysisJobEngine> jobs_;
    std::unique_ptr<AnalyticsHandler> handler_;
};

// ============================================================================
// Operational endpoints
// ============================================================================

TEST_F(AnalyticsHandlerTest, Health) {
    auto response = handler_->Handle(Get("/health"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(Body(response)["status"], "healthy");
    EXPECT_EQ(handler_->Handle(Post("/health")).status_code, 405);
}

TEST_F(AnalyticsHandlerTest, MetricsExport) {
    handler_->Handle(Get("/health"));
    auto response = handler_->Handle(Get("/metrics"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.content_type, "text/plain; version=0.0.4");
    EXPECT_NE(response.body.find("runlens_http_requests_total 2"), std::string::npos);
}

TEST_F(AnalyticsHandlerTest, UnknownRoutes) {
    EXPECT_EQ(handler_->Handle(Get("/nope")).status_code, 404);
    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/nope")).status_code, 404);
    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/aggregate")).status_code, 405);
    EXPECT_EQ(handler_->Handle(Post("/api/v1/stats/overview")).status_code, 405);
}

// ============================================================================
// Aggregated statistics
// ============================================================================

TEST_F(AnalyticsHandlerTest, OverviewNeedsAggregation) {
    auto response = handler_->Handle(Get("/api/v1/stats/overview", {{"days", "7"}}));
    EXPECT_EQ(response.status_code, 404);
    EXPECT_TRUE(Body(response).contains("error"));
}

TEST_F(AnalyticsHandlerTest, AggregateThenRead) {
    auto aggregate = handler_->Handle(Post("/api/v1/stats/aggregate", "", {{"days", "7"}}));
    ASSERT_EQ(aggregate.status_code, 200) << aggregate.body;
    json body = Body(aggregate);
    EXPECT_EQ(body["total_runs"].get<int>(), 3);
    EXPECT_EQ(body["filter_days"].get<int>(), 7);
    EXPECT_TRUE(body["repository_id"].is_null());
    EXPECT_EQ(body["watermark"]["window_days"].get<int>(), 7);
    EXPECT_EQ(body["watermark"]["computed_at"], "2026-03-10T12:00:00Z");

    auto overview = handler_->Handle(Get("/api/v1/stats/overview", {{"days", "7"}}));
    ASSERT_EQ(overview.status_code, 200);
    EXPECT_DOUBLE_EQ(Body(overview)["success_rate"].get<double>(), 66.7);

    auto trends = handler_->Handle(Get("/api/v1/stats/trends/", {{"days", "7"}}));
    ASSERT_EQ(trends.status_code, 200);
    json points = Body(trends);
    ASSERT_TRUE(points.is_array());
    EXPECT_EQ(points.size(), 8u);
    EXPECT_EQ(points.back()["date"], "2026-03-10");

    auto rates = handler_->Handle(Get("/api/v1/stats/success-rate", {{"days", "7"}}));
    ASSERT_EQ(rates.status_code, 200);
    EXPECT_EQ(Body(rates).size(), 8u);

    auto flaky = handler_->Handle(Get("/api/v1/stats/flaky", {{"days", "7"}}));
    ASSERT_EQ(flaky.status_code, 200);
    ASSERT_EQ(Body(flaky).size(), 1u);
    EXPECT_EQ(Body(flaky)[0]["test_name"], "Login");
    EXPECT_EQ(Body(flaky)[0]["flip_count"].get<int>(), 2);
}

TEST_F(AnalyticsHandlerTest, RepositoryScopedAggregation) {
    auto aggregate = handler_->Handle(
        Post("/api/v1/stats/aggregate", "", {{"days", "7"}, {"repository_id", "2"}}));
    ASSERT_EQ(aggregate.status_code, 200);
    EXPECT_EQ(Body(aggregate)["total_runs"].get<int>(), 1);
    EXPECT_EQ(Body(aggregate)["repository_id"].get<int>(), 2);

    // The all-repositories key is still cold
    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/overview", {{"days", "7"}})).status_code, 404);
}

TEST_F(AnalyticsHandlerTest, DefaultWindowIsThirtyDays) {
    auto aggregate = handler_->Handle(Post("/api/v1/stats/aggregate"));
    ASSERT_EQ(aggregate.status_code, 200);
    EXPECT_EQ(Body(aggregate)["filter_days"].get<int>(), AnalyticsHandler::kDefaultDays);
}

TEST_F(AnalyticsHandlerTest, RejectsBadScope) {
    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/overview", {{"days", "5"}})).status_code, 400);
    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/overview", {{"days", "week"}})).status_code,
              400);
    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/trends", {{"repository_id", "x"}})).status_code,
              400);
    EXPECT_EQ(handler_->Handle(Post("/api/v1/stats/aggregate", "", {{"days", "0"}})).status_code,
              400);    // 2^32 + 7 would wrap to a configured window if narrowed
    EXPECT_EQ(
        handler_->Handle(Get("/api/v1/stats/overview", {{"days", "4294967303"}})).status_code,
        400);
}

TEST_F(AnalyticsHandlerTest, FlakyIsLiveWhenCold) {
    auto flaky = handler_->Handle(Get("/api/v1/stats/flaky", {{"days", "7"}}));
    ASSERT_EQ(flaky.status_code, 200);
    EXPECT_EQ(Body(flaky).size(), 1u);
}

TEST_F(AnalyticsHandlerTest, Watermark) {
    auto cold = handler_->Handle(Get("/api/v1/stats/watermark", {{"days", "7"}}));
    ASSERT_EQ(cold.status_code, 200);
    EXPECT_TRUE(Body(cold)["watermark"].is_null());
    EXPECT_TRUE(Body(cold)["stale"].get<bool>());

    ASSERT_EQ(handler_->Handle(Post("/api/v1/stats/aggregate", "", {{"days", "7"}})).status_code,
              200);
    auto fresh = handler_->Handle(Get("/api/v1/stats/watermark", {{"days", "7"}}));
    ASSERT_EQ(fresh.status_code, 200);
    EXPECT_EQ(Body(fresh)["watermark"]["window_days"].get<int>(), 7);
    EXPECT_FALSE(Body(fresh)["stale"].get<bool>());
}

// ============================================================================
// Deep analysis
// ============================================================================

TEST_F(AnalyticsHandlerTest, ListKpis) {
    auto response = handler_->Handle(Get("/api/v1/stats/analysis/kpis"));
    ASSERT_EQ(response.status_code, 200);
    json catalog = Body(response);
    ASSERT_EQ(catalog.size(), 15u);
    EXPECT_EQ(catalog[0]["id"], "keyword_frequency");
    EXPECT_TRUE(catalog[0].contains("description"));
}

TEST_F(AnalyticsHandlerTest, CreateAndPollJob) {
    auto created = handler_->Handle(Post(
        "/api/v1/stats/analysis",
        R"({"repository_id": 1, "selected_kpis": ["test_pass_rate_trend"],
            "date_from": "2026-03-01", "date_to": "2026-03-31"})"));
    ASSERT_EQ(created.status_code, 201) << created.body;
    json job = Body(created);
    EXPECT_EQ(job["status"], "pending");
    EXPECT_EQ(job["repository_id"].get<int>(), 1);
    EXPECT_EQ(job["date_from"], "2026-03-01");
    EXPECT_TRUE(job["results"].is_null());
    const int64_t id = job["id"].get<int64_t>();

    jobs_->WaitForIdle();
    auto polled = handler_->Handle(Get(absl::StrCat("/api/v1/stats/analysis/", id)));
    ASSERT_EQ(polled.status_code, 200);
    json done = Body(polled);
    EXPECT_EQ(done["status"], "completed");
    EXPECT_EQ(done["progress"].get<int>(), 100);
    EXPECT_EQ(done["reports_analyzed"].get<int>(), 2);
    EXPECT_EQ(done["results"]["test_pass_rate_trend"]["total_tests"].get<int>(), 1);
}

TEST_F(AnalyticsHandlerTest, RejectsBadJobRequests) {
    const char* bodies[] = {
        "",
        "not json",
        "[1, 2]",
        R"({"selected_kpis": []})",
        R"({"selected_kpis": "tag_coverage"})",
        R"({"selected_kpis": [3]})",
        R"({"selected_kpis": ["tag_coverage"], "repository_id": "one"})",
        R"({"selected_kpis": ["tag_coverage"], "date_from": "03/01/2026"})",
        R"({"selected_kpis": ["tag_coverage"], "date_from": 20260301})",
        R"({"selected_kpis": ["tag_coverage"], "date_from": "2026-03-05",
            "date_to": "2026-03-01"})",
    };
    for (const char* body : bodies) {
        EXPECT_EQ(handler_->Handle(Post("/api/v1/stats/analysis", body)).status_code, 400)
            << body;
    }
    auto empty = handler_->Handle(Post("/api/v1/stats/analysis", R"({"selected_kpis": []})"));
    EXPECT_EQ(Body(empty)["code"], "validation_error");
    EXPECT_EQ(Body(handler_->Handle(Get("/api/v1/stats/analysis"))).size(), 0u);
}

TEST_F(AnalyticsHandlerTest, ListAndFetchJobs) {
    ASSERT_EQ(handler_->Handle(Post("/api/v1/stats/analysis",
                                    R"({"repository_id": 1, "selected_kpis": ["tag_coverage"]})"))
                  .status_code,
              201);
    ASSERT_EQ(handler_->Handle(Post("/api/v1/stats/analysis",
                                    R"({"repository_id": 2, "selected_kpis": ["tag_coverage"]})"))
                  .status_code,
              201);
    jobs_->WaitForIdle();

    EXPECT_EQ(Body(handler_->Handle(Get("/api/v1/stats/analysis"))).size(), 2u);
    json repo2 = Body(handler_->Handle(Get("/api/v1/stats/analysis", {{"repository_id", "2"}})));
    ASSERT_EQ(repo2.size(), 1u);
    EXPECT_EQ(repo2[0]["repository_id"].get<int>(), 2);

    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/analysis/999")).status_code, 404);
    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/analysis/abc")).status_code, 400);
    EXPECT_EQ(handler_->Handle(Get("/api/v1/stats/analysis", {{"repository_id", "z"}}))
                  .status_code,
              400);
}

}  // namespace
}  // namespace runlens::server
