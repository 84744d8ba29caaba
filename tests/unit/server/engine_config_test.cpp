/// @file engine_config_test.cpp
/// @brief Tests for typed daemon configuration

#include <gtest/gtest.h>

#include "server/engine_config.h"

namespace runlens::server {
namespace {

absl::StatusOr<EngineConfig> Parse(std::string_view yaml) {
    auto config = Config::LoadFromString(yaml);
    if (!config.ok()) {
        return config.status();
    }
    return EngineConfig::FromConfig(*config);
}

TEST(EngineConfigTest, DefaultsWhenEmpty) {
    auto config = Parse("{}");
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->server.host, "0.0.0.0");
    EXPECT_EQ(config->server.port, 8080);
    EXPECT_EQ(config->logging.level, LogLevel::kInfo);
    EXPECT_TRUE(config->logging.file_path.empty());
    EXPECT_TRUE(config->reports_file.empty());
    EXPECT_EQ(config->aggregation.windows, (std::vector<int>{7, 14, 30, 90, 365}));
    EXPECT_EQ(config->aggregation.flaky.min_runs, 2);
    EXPECT_EQ(config->jobs.workers, 2u);
    EXPECT_EQ(config->analysis.keyword_frequency_top, 50u);
    EXPECT_EQ(config->analysis.error_rules.size(), 6u);
    EXPECT_TRUE(config->source.repositories.empty());
}

TEST(EngineConfigTest, ReadsEverySection) {
    auto config = Parse(R"(
server:
  host: 127.0.0.1
  port: 9090
logging:
  level: debug
  file: /tmp/runlens-test.log
data:
  reports_file: /data/reports.json
aggregation:
  windows: [7, 30]
  flaky_min_runs: 3
jobs:
  workers: 4
analysis:
  keyword_frequency_top: 10
  histogram_bounds: [2, 4]
  assertion_words: [check]
  redundancy:
    min_length: 2
    max_length: 4
    top: 5
  error_rules:
    - pattern: "\\d+"
      replacement: "#"
source:
  repositories:
    1: /srv/web-tests
    2: /srv/api-tests
  ignored_dirs: [build]
)");
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->server.host, "127.0.0.1");
    EXPECT_EQ(config->server.port, 9090);
    EXPECT_EQ(config->logging.level, LogLevel::kDebug);
    EXPECT_EQ(config->logging.file_path, "/tmp/runlens-test.log");
    EXPECT_EQ(config->reports_file, "/data/reports.json");
    EXPECT_EQ(config->aggregation.windows, (std::vector<int>{7, 30}));
    EXPECT_EQ(config->aggregation.flaky.min_runs, 3);
    EXPECT_EQ(config->jobs.workers, 4u);

    const auto& analysis = config->analysis;
    EXPECT_EQ(analysis.keyword_frequency_top, 10u);
    EXPECT_EQ(analysis.histogram_bounds, (std::vector<int>{2, 4}));
    EXPECT_EQ(analysis.assertion_words, (std::vector<std::string>{"check"}));
    EXPECT_EQ(analysis.redundancy_min_length, 2);
    EXPECT_EQ(analysis.redundancy_max_length, 4);
    EXPECT_EQ(analysis.redundancy_top, 5u);
    ASSERT_EQ(analysis.error_rules.size(), 1u);
    EXPECT_EQ(analysis.error_rules[0].pattern, "\\d+");
    EXPECT_EQ(analysis.error_rules[0].replacement, "#");

    ASSERT_EQ(config->source.repositories.size(), 2u);
    EXPECT_EQ(config->source.repositories.at(1), "/srv/web-tests");
    EXPECT_EQ(config->source.ignored_dirs, (std::vector<std::string>{"build"}));
}

TEST(EngineConfigTest, RejectsBadPort) {
    EXPECT_TRUE(absl::IsFailedPrecondition(Parse("server: {port: 0}").status()));
    EXPECT_TRUE(absl::IsFailedPrecondition(Parse("server: {port: 70000}").status()));
}

TEST(EngineConfigTest, RejectsBadWindows) {
    EXPECT_TRUE(absl::IsFailedPrecondition(Parse("aggregation: {windows: [7, -1]}").status()));
    EXPECT_TRUE(absl::IsFailedPrecondition(Parse("aggregation: {windows: []}").status()));
    EXPECT_TRUE(
        absl::IsFailedPrecondition(Parse("aggregation: {flaky_min_runs: 0}").status()));
}

TEST(EngineConfigTest, RejectsBadAnalysisSettings) {
    EXPECT_FALSE(Parse("analysis: {slowest_top: -1}").ok());
    EXPECT_FALSE(Parse("analysis: {histogram_bounds: [10, 5]}").ok());
    EXPECT_FALSE(Parse("analysis: {histogram_bounds: [5, 5]}").ok());
    EXPECT_FALSE(Parse("analysis: {assertion_words: []}").ok());
    EXPECT_TRUE(absl::IsInvalidArgument(
        Parse("analysis: {redundancy: {min_length: 4, max_length: 3}}").status()));
    EXPECT_TRUE(absl::IsInvalidArgument(
        Parse("analysis: {error_rules: [{pattern: '(', replacement: x}]}").status()));
    EXPECT_FALSE(Parse("analysis: {error_rules: [{pattern: 'a'}]}").ok());
    EXPECT_FALSE(Parse("analysis: {error_rules: {pattern: 'a'}}").ok());
}

TEST(EngineConfigTest, RejectsUnknownLogLevel) {
    EXPECT_TRUE(absl::IsFailedPrecondition(Parse("logging: {level: chatty}").status()));
    auto config = Parse("logging: {level: WARNING}");
    ASSERT_TRUE(config.ok()) << config.status();
    EXPECT_EQ(config->logging.level, LogLevel::kWarn);
}

TEST(EngineConfigTest, RejectsNonNumericRepositoryId) {
    EXPECT_TRUE(absl::IsFailedPrecondition(
        Parse("source: {repositories: {web: /srv/web}}").status()));
    EXPECT_FALSE(Parse("source: {repositories: [/srv/web]}").ok());
}

TEST(EngineConfigTest, CommandLineOverridesApply) {
    auto config = Config::LoadFromString("server: {port: 8080}");
    ASSERT_TRUE(config.ok());
    config->Set("server.port", int64_t{8181});
    auto engine = EngineConfig::FromConfig(*config);
    ASSERT_TRUE(engine.ok());
    EXPECT_EQ(engine->server.port, 8181);
}

}  // namespace
}  // namespace runlens::server
