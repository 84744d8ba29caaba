#pragma once

/// @file http_server.h
/// @brief cpp-httplib listener in front of AnalyticsHandler

#include <atomic>
#include <memory>
#include <thread>

#include <absl/status/status.h>

#include "server/analytics_handler.h"
#include "server/engine_config.h"

namespace httplib {
class Server;
}

namespace runlens::server {

/// @brief Serves the API on a background thread until Stop()
class HttpServer {
public:
    HttpServer(ServerConfig config, std::shared_ptr<AnalyticsHandler> handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// @brief Bind and start listening; FailedPrecondition if already running
    absl::Status Start();

    void Stop();

    bool IsRunning() const { return running_.load(); }

private:
    ServerConfig config_;
    std::shared_ptr<AnalyticsHandler> handler_;
    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

}  // namespace runlens::server
