/// @file http_server.cpp
/// @brief cpp-httplib listener implementation

#include "server/http_server.h"

#include <httplib.h>

#include <absl/strings/str_cat.h>

#include "common/logging.h"

namespace runlens::server {

namespace {

HttpRequest Convert(const httplib::Request& req) {
    HttpRequest request;
    request.method = req.method;
    request.path = req.path;
    request.body = req.body;
    for (const auto& [key, value] : req.params) {
        request.query_params.emplace(key, value);
    }
    return request;
}

}  // namespace

HttpServer::HttpServer(ServerConfig config, std::shared_ptr<AnalyticsHandler> handler)
    : config_(std::move(config)), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    Stop();
}

absl::Status HttpServer::Start() {
    if (running_.load()) {
        return absl::FailedPreconditionError("HTTP server already running");
    }

    server_ = std::make_unique<httplib::Server>();
    auto dispatch = [this](const httplib::Request& req, httplib::Response& res) {
        HttpResponse response = handler_->Handle(Convert(req));
        res.status = response.status_code;
        res.set_content(response.body, response.content_type);
        RUNLENS_LOG_DEBUG("{} {} -> {}", req.method, req.path, response.status_code);
    };
    server_->Get(".*", dispatch);
    server_->Post(".*", dispatch);

    server_->set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                RUNLENS_LOG_ERROR("Non-standard exception while serving {}", req.path);
            }
            RUNLENS_LOG_ERROR("Request {} {} failed: {}", req.method, req.path, what);
            res.status = 500;
            res.set_content(nlohmann::json{{"error", what}}.dump(), "application/json");
        });

    if (!server_->bind_to_port(config_.host, config_.port)) {
        return absl::UnavailableError(
            absl::StrCat("Cannot bind ", config_.host, ":", config_.port));
    }

    running_ = true;
    thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            RUNLENS_LOG_ERROR("HTTP listener on {}:{} stopped unexpectedly", config_.host,
                              config_.port);
        }
        running_ = false;
    });
    RUNLENS_LOG_INFO("HTTP API listening on {}:{}", config_.host, config_.port);
    return absl::OkStatus();
}

void HttpServer::Stop() {
    if (server_) {
        server_->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

}  // namespace runlens::server
