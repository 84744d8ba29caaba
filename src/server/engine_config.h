#pragma once

/// @file engine_config.h
/// @brief Typed configuration of the RunLens daemon

#include <cstdint>
#include <string>

#include <absl/status/statusor.h>

#include "analytics/aggregation_engine.h"
#include "analytics/analysis_job_engine.h"
#include "analytics/kpi/analysis_config.h"
#include "common/config.h"
#include "common/logging.h"
#include "storage/robot_source_browser.h"

namespace runlens::server {

/// @brief HTTP listener settings
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
};

/// @brief Everything the daemon wires together
///
/// YAML layout:
/// @code
///   server: {host: 0.0.0.0, port: 8080}
///   logging: {level: info, file: /var/log/runlens.log}
///   data: {reports_file: reports.json}
///   aggregation: {windows: [7, 30], flaky_min_runs: 2}
///   jobs: {workers: 4}
///   analysis:
///     keyword_frequency_top: 50
///     histogram_bounds: [5, 10, 20, 50]
///     assertion_words: [should, verify]
///     redundancy: {min_length: 3, max_length: 5}
///     error_rules: [{pattern: "\\d+", replacement: "<N>"}]
///   source:
///     repositories: {1: /srv/checkouts/web-tests}
/// @endcode
struct EngineConfig {
    ServerConfig server;
    LogConfig logging;
    std::string reports_file;
    analytics::AggregationConfig aggregation;
    analytics::JobEngineConfig jobs;
    analytics::AnalysisConfig analysis;
    storage::RobotSourceConfig source;

    /// @brief Read and validate every section; missing keys keep defaults
    static absl::StatusOr<EngineConfig> FromConfig(const Config& config);
};

}  // namespace runlens::server
