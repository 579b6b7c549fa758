#pragma once

#include <chrono>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "obs/logging.h"
#include "obs/metrics.h"

namespace csvsentry {
namespace obs {

// Emits http_request_start on construction and exactly one of
// http_request_error / http_request_end, plus a latency histogram per route.
class HttpRequestLogScope {
public:
    HttpRequestLogScope(const httplib::Request& req,
                        httplib::Response& res,
                        const std::string& component,
                        const std::string& request_id,
                        nlohmann::json fields = nlohmann::json::object())
        : res_(&res),
          component_(component),
          route_(req.path),
          start_(std::chrono::steady_clock::now()) {
        fields_["route"] = req.path;
        fields_["method"] = req.method;
        if (!request_id.empty()) {
            fields_["request_id"] = request_id;
        }
        if (req.has_header("Content-Length")) {
            fields_["content_length"] = req.get_header_value("Content-Length");
        }
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            fields_[it.key()] = it.value();
        }
        LogEvent(LogLevel::Info, "http_request_start", component_, fields_);
    }

    void AddFields(const nlohmann::json& extra) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            fields_[it.key()] = it.value();
        }
    }

    void RecordError(const std::string& error_code, const std::string& message, int status_code) {
        if (error_logged_) return;
        double duration_ms = ElapsedMs();
        nlohmann::json payload = fields_;
        payload["status_code"] = status_code;
        payload["duration_ms"] = duration_ms;
        payload["error_code"] = error_code;
        payload["error"] = message;
        LogLevel level = status_code >= 500 ? LogLevel::Error : LogLevel::Warn;
        LogEvent(level, "http_request_error", component_, payload);
        EmitLatency(status_code, duration_ms);
        error_logged_ = true;
    }

    ~HttpRequestLogScope() {
        if (error_logged_) return;
        double duration_ms = ElapsedMs();
        nlohmann::json payload = fields_;
        int status = res_ ? res_->status : 0;
        payload["status_code"] = status;
        payload["duration_ms"] = duration_ms;
        LogEvent(LogLevel::Info, "http_request_end", component_, payload);
        EmitLatency(status, duration_ms);
    }

    HttpRequestLogScope(const HttpRequestLogScope&) = delete;
    auto operator=(const HttpRequestLogScope&) -> HttpRequestLogScope& = delete;

private:
    auto ElapsedMs() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

    void EmitLatency(int status, double duration_ms) const {
        ::csvsentry::metrics::MetricsRegistry::Instance().RecordLatency(
            "http_request_duration_ms",
            {{"route", route_}, {"status", std::to_string(status)}},
            duration_ms);
    }

    httplib::Response* res_;
    std::string component_;
    std::string route_;
    nlohmann::json fields_ = nlohmann::json::object();
    std::chrono::steady_clock::time_point start_;
    bool error_logged_ = false;
};

} // namespace obs
} // namespace csvsentry
