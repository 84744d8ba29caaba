#pragma once

/// @file http_types.h
/// @brief Transport-neutral request/response used by the API handler

#include <string>
#include <unordered_map>

#include <absl/status/status.h>
#include <nlohmann/json.hpp>

#include "common/error.h"

namespace runlens::server {

/// @brief HTTP request
struct HttpRequest {
    std::string method = "GET";
    std::string path;
    std::unordered_map<std::string, std::string> query_params;
    std::string body;
};

/// @brief HTTP response
struct HttpResponse {
    int status_code = 200;
    std::string body;
    std::string content_type = "application/json";

    static HttpResponse Ok(const nlohmann::json& body) {
        HttpResponse resp;
        resp.body = body.dump();
        return resp;
    }

    static HttpResponse Created(const nlohmann::json& body) {
        HttpResponse resp;
        resp.status_code = 201;
        resp.body = body.dump();
        return resp;
    }

    static HttpResponse Text(std::string body) {
        HttpResponse resp;
        resp.body = std::move(body);
        resp.content_type = "text/plain; version=0.0.4";
        return resp;
    }

    static HttpResponse NotFound(const std::string& message = "Not found") {
        HttpResponse resp;
        resp.status_code = 404;
        resp.body = nlohmann::json{{"error", message}}.dump();
        return resp;
    }

    static HttpResponse MethodNotAllowed() {
        HttpResponse resp;
        resp.status_code = 405;
        resp.body = nlohmann::json{{"error", "Method not allowed"}}.dump();
        return resp;
    }

    /// @brief Error body with the status code mapped from @p status
    static HttpResponse FromStatus(const absl::Status& status) {
        HttpResponse resp;
        resp.status_code = ToHttpStatus(status);
        nlohmann::json body = {{"error", std::string(status.message())}};
        if (auto code = GetErrorCode(status)) {
            body["code"] = std::string(ErrorCodeName(*code));
        }
        resp.body = body.dump();
        return resp;
    }
};

}  // namespace runlens::server
