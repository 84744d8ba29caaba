/// @file main.cpp
/// @brief RunLens analytics daemon entry point

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>

#include "analytics/aggregation_engine.h"
#include "analytics/analysis_job_engine.h"
#include "common/config.h"
#include "common/logging.h"
#include "server/analytics_handler.h"
#include "server/engine_config.h"
#include "server/http_server.h"
#include "storage/job_store.h"
#include "storage/memory_report_store.h"
#include "storage/robot_source_browser.h"
#include "storage/snapshot_cache.h"

namespace {

constexpr const char* kVersion = "1.0.0";

std::atomic<bool> g_shutdown{false};

void SignalHandler(int) {
    g_shutdown = true;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"RunLens - test run analytics engine"};

    std::string config_path;
    std::string host;
    int port = 0;
    std::string reports_path;
    std::string log_level;
    int workers = -1;
    bool version_flag = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--host", host, "Listen address");
    app.add_option("--port", port, "Listen port");
    app.add_option("--reports", reports_path, "JSON dump of runs, test results and keyword calls");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--workers", workers, "Analysis worker threads");
    app.add_flag("-v,--version", version_flag, "Print version and exit");

    CLI11_PARSE(app, argc, argv);

    if (version_flag) {
        std::cout << "RunLens v" << kVersion << std::endl;
        return 0;
    }

    std::optional<std::filesystem::path> file;
    if (!config_path.empty()) {
        file = config_path;
    }
    auto raw_config = runlens::Config::Load(file);
    if (!raw_config.ok()) {
        std::cerr << "Failed to load config: " << raw_config.status().message() << std::endl;
        return 1;
    }

    // Command line wins over file and environment
    if (!host.empty()) raw_config->Set("server.host", host);
    if (port > 0) raw_config->Set("server.port", static_cast<int64_t>(port));
    if (!reports_path.empty()) raw_config->Set("data.reports_file", reports_path);
    if (!log_level.empty()) raw_config->Set("logging.level", log_level);
    if (workers >= 0) raw_config->Set("jobs.workers", static_cast<int64_t>(workers));

    auto config = runlens::server::EngineConfig::FromConfig(*raw_config);
    if (!config.ok()) {
        std::cerr << "Invalid configuration: " << config.status().message() << std::endl;
        return 1;
    }

    auto logging = runlens::InitLogging(config->logging);
    if (!logging.ok()) {
        std::cerr << logging.message() << std::endl;
        return 1;
    }
    RUNLENS_LOG_INFO("RunLens v{} starting...", kVersion);

    auto store = std::make_shared<runlens::storage::MemoryReportStore>();
    if (!config->reports_file.empty()) {
        auto loaded = store->LoadFromFile(config->reports_file);
        if (!loaded.ok()) {
            RUNLENS_LOG_ERROR("Failed to load reports: {}", loaded.message());
            return 1;
        }
        RUNLENS_LOG_INFO("Loaded {} runs from {}", store->RunCount(), config->reports_file);
    } else {
        RUNLENS_LOG_WARN("No reports file configured, starting with an empty store");
    }

    auto cache = std::make_shared<runlens::storage::SnapshotCache>();
    auto job_store = std::make_shared<runlens::storage::JobStore>();
    auto browser = std::make_shared<runlens::storage::RobotSourceBrowser>(config->source);

    auto aggregation = std::make_shared<runlens::analytics::AggregationEngine>(
        store, cache, config->aggregation);
    auto jobs = std::make_shared<runlens::analytics::AnalysisJobEngine>(
        store, browser, job_store, config->analysis, config->jobs);
    auto handler = std::make_shared<runlens::server::AnalyticsHandler>(aggregation, jobs);

    runlens::server::HttpServer server(config->server, handler);

    struct sigaction sa;
    sa.sa_handler = SignalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    auto status = server.Start();
    if (!status.ok()) {
        RUNLENS_LOG_ERROR("Failed to start server: {}", status.message());
        return 1;
    }

    RUNLENS_LOG_INFO("RunLens is running. Press Ctrl+C to stop.");
    while (!g_shutdown.load() && server.IsRunning()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    RUNLENS_LOG_INFO("Shutting down");
    server.Stop();
    jobs->WaitForIdle();

    RUNLENS_LOG_INFO("RunLens stopped");
    runlens::ShutdownLogging();
    return 0;
}
