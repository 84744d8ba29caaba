/// @file engine_config.cpp
/// @brief Typed, validated daemon configuration

#include "server/engine_config.h"

#include <algorithm>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "analytics/error_patterns.h"
#include "analytics/redundancy_miner.h"
#include "common/error.h"

namespace runlens::server {

namespace {

absl::Status ConfigError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

/// Non-negative size at @p key, default when absent
absl::StatusOr<size_t> GetSize(const Config& config, std::string_view key, size_t fallback) {
    const int64_t value = config.GetInt(key, static_cast<int64_t>(fallback));
    if (value < 0) {
        return ConfigError(absl::StrCat(key, " must not be negative, got ", value));
    }
    return static_cast<size_t>(value);
}

absl::Status ReadAnalysis(const Config& config, analytics::AnalysisConfig& analysis) {
    struct SizeKey {
        const char* key;
        size_t* target;
    };
    const SizeKey sizes[] = {
        {"analysis.keyword_frequency_top", &analysis.keyword_frequency_top},
        {"analysis.duration_impact_top", &analysis.duration_impact_top},
        {"analysis.complexity_top", &analysis.complexity_top},
        {"analysis.assertion_tests_top", &analysis.assertion_tests_top},
        {"analysis.no_assertion_top", &analysis.no_assertion_top},
        {"analysis.tag_top", &analysis.tag_top},
        {"analysis.error_max_length", &analysis.error_max_length},
        {"analysis.error_patterns_top", &analysis.error_patterns_top},
        {"analysis.error_examples", &analysis.error_examples},
        {"analysis.redundancy.top", &analysis.redundancy_top},
        {"analysis.redundancy.tests", &analysis.redundancy_tests},
        {"analysis.source_keywords_top", &analysis.source_keywords_top},
        {"analysis.source_files_top", &analysis.source_files_top},
        {"analysis.source_library_files", &analysis.source_library_files},
        {"analysis.pass_rate_top", &analysis.pass_rate_top},
        {"analysis.slowest_top", &analysis.slowest_top},
        {"analysis.flakiness_top", &analysis.flakiness_top},
        {"analysis.flakiness_timeline", &analysis.flakiness_timeline},
        {"analysis.heatmap_tests", &analysis.heatmap_tests},
        {"analysis.treemap_top", &analysis.treemap_top},
    };
    for (const auto& entry : sizes) {
        RUNLENS_ASSIGN_OR_RETURN(*entry.target, GetSize(config, entry.key, *entry.target));
    }

    if (config.HasKey("analysis.histogram_bounds")) {
        std::vector<int> bounds;
        for (int64_t bound : config.GetIntList("analysis.histogram_bounds")) {
            bounds.push_back(static_cast<int>(bound));
        }
        if (bounds.empty() || !std::is_sorted(bounds.begin(), bounds.end()) ||
            std::adjacent_find(bounds.begin(), bounds.end()) != bounds.end() ||
            bounds.front() < 0) {
            return ConfigError("analysis.histogram_bounds must be non-negative and increasing");
        }
        analysis.histogram_bounds = std::move(bounds);
    }

    if (config.HasKey("analysis.assertion_words")) {
        analysis.assertion_words = config.GetStringList("analysis.assertion_words");
        if (analysis.assertion_words.empty()) {
            return ConfigError("analysis.assertion_words must not be empty");
        }
    }

    analysis.redundancy_min_length = static_cast<int>(
        config.GetInt("analysis.redundancy.min_length", analysis.redundancy_min_length));
    analysis.redundancy_max_length = static_cast<int>(
        config.GetInt("analysis.redundancy.max_length", analysis.redundancy_max_length));
    analytics::RedundancyMinerConfig miner;
    miner.min_length = analysis.redundancy_min_length;
    miner.max_length = analysis.redundancy_max_length;
    RUNLENS_RETURN_IF_ERROR(analytics::RedundancyMiner::ValidateConfig(miner));

    if (auto rules = config.GetSection("analysis.error_rules")) {
        if (!rules->IsSequence()) {
            return ConfigError("analysis.error_rules must be a list");
        }
        std::vector<analytics::ErrorNormalizationRule> parsed;
        for (const auto& node : *rules) {
            if (!node.IsMap() || !node["pattern"] || !node["replacement"]) {
                return ConfigError(
                    "analysis.error_rules entries need a pattern and a replacement");
            }
            parsed.push_back(analytics::ErrorNormalizationRule{
                node["pattern"].as<std::string>(), node["replacement"].as<std::string>()});
        }
        analysis.error_rules = std::move(parsed);
    }
    return analytics::ErrorPatternClusterer::ValidateRules(analysis.error_rules);
}

absl::Status ReadSource(const Config& config, storage::RobotSourceConfig& source) {
    if (auto repos = config.GetSection("source.repositories")) {
        if (!repos->IsMap()) {
            return ConfigError("source.repositories must map repository ids to paths");
        }
        for (const auto& kv : *repos) {
            const std::string key = kv.first.as<std::string>();
            RepositoryId id = 0;
            if (!absl::SimpleAtoi(key, &id)) {
                return ConfigError(absl::StrCat("Repository id '", key, "' is not an integer"));
            }
            source.repositories[id] = kv.second.as<std::string>();
        }
    }
    if (config.HasKey("source.ignored_dirs")) {
        source.ignored_dirs = config.GetStringList("source.ignored_dirs");
    }
    return absl::OkStatus();
}

}  // namespace

absl::StatusOr<EngineConfig> EngineConfig::FromConfig(const Config& config) {
    EngineConfig out;

    out.server.host = config.GetString("server.host", out.server.host);
    const int64_t port = config.GetInt("server.port", out.server.port);
    if (port <= 0 || port > 65535) {
        return ConfigError(absl::StrCat("server.port out of range: ", port));
    }
    out.server.port = static_cast<uint16_t>(port);

    auto level = ParseLogLevel(config.GetString("logging.level", "info"));
    if (!level.ok()) {
        return ConfigError(level.status().message());
    }
    out.logging.level = *level;
    out.logging.file_path = config.GetString("logging.file");

    out.reports_file = config.GetString("data.reports_file");

    if (config.HasKey("aggregation.windows")) {
        std::vector<int> windows;
        for (int64_t days : config.GetIntList("aggregation.windows")) {
            if (days <= 0) {
                return ConfigError(absl::StrCat("aggregation.windows entry must be positive: ",
                                                days));
            }
            windows.push_back(static_cast<int>(days));
        }
        if (windows.empty()) {
            return ConfigError("aggregation.windows must not be empty");
        }
        out.aggregation.windows = std::move(windows);
    }
    out.aggregation.flaky.min_runs = static_cast<int>(
        config.GetInt("aggregation.flaky_min_runs", out.aggregation.flaky.min_runs));
    if (out.aggregation.flaky.min_runs < 1) {
        return ConfigError("aggregation.flaky_min_runs must be at least 1");
    }

    RUNLENS_ASSIGN_OR_RETURN(out.jobs.workers,
                             GetSize(config, "jobs.workers", out.jobs.workers));

    try {
        RUNLENS_RETURN_IF_ERROR(ReadAnalysis(config, out.analysis));
        RUNLENS_RETURN_IF_ERROR(ReadSource(config, out.source));
    } catch (const YAML::Exception& e) {
        return ConfigError(absl::StrCat("Malformed configuration: ", e.what()));
    }
    return out;
}

}  // namespace runlens::server
