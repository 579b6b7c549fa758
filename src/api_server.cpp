#include "api_server.h"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>
#include <uuid/uuid.h>

#include "api_debug.h"
#include "detection_response.h"
#include "metrics.h"
#include "obs/context.h"
#include "obs/error_codes.h"
#include "obs/metrics.h"
#include "pipeline/file_validator.h"
#include "route_registry.h"

namespace csvsentry::api {

// Room for multipart boundaries and part headers on top of the file itself.
constexpr size_t kMultipartOverheadBytes = 1024 * 1024;

std::string GenerateUuid() {
    uuid_t out;
    uuid_generate(out);
    char str[37];
    uuid_unparse(out, str);
    return std::string(str);
}

std::string GetRequestId(const httplib::Request& req) {
    if (req.has_header("X-Request-ID")) {
        return req.get_header_value("X-Request-ID");
    }
    return GenerateUuid();
}

ApiServer::ApiServer(ServiceConfig config, std::shared_ptr<const DetectionOrchestrator> orchestrator)
    : config_(std::move(config)), orchestrator_(std::move(orchestrator)) {
    if (!orchestrator_) {
        throw std::invalid_argument("ApiServer requires an orchestrator");
    }
    Initialize();
}

void ApiServer::Initialize() {
    // Configure HTTP Server Limits
    svr_.set_payload_max_length(config_.limits.max_file_size_bytes + kMultipartOverheadBytes);
    svr_.set_read_timeout(30, 0);
    svr_.set_write_timeout(30, 0);

    // Setup Routes
    svr_.Post("/detect", [this](const httplib::Request& req, httplib::Response& res) {
        HandleDetect(req, res);
    });

    svr_.Post("/detect/categorical", [this](const httplib::Request& req, httplib::Response& res) {
        HandleDetectCategorical(req, res);
    });

    svr_.Get("/healthz", [](const httplib::Request& req, httplib::Response& res) {
        std::string rid = GetRequestId(req);
        obs::HttpRequestLogScope log(req, res, "api_server", rid);
        res.status = 200;
        res.set_content("{\"status\":\"OK\"}", "application/json");
    });

    svr_.Get("/limits", [this](const httplib::Request& req, httplib::Response& res) {
        HandleLimits(req, res);
    });

    svr_.Get("/metrics", [](const httplib::Request& req, httplib::Response& res) {
        std::string rid = GetRequestId(req);
        obs::HttpRequestLogScope log(req, res, "api_server", rid);
        res.status = 200;
        res.set_content(metrics::MetricsRegistry::Instance().ToPrometheus(), "text/plain");
    });

    // Bodies over the payload limit are refused by httplib before routing.
    svr_.set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        HandleTransportError(req, res);
    });

    // CORS Support
    svr_.set_pre_routing_handler([](const httplib::Request& req, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, X-Request-ID");
        if (req.method == "OPTIONS") {
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });
}

ApiServer::~ApiServer() {
    Stop();
}

void ApiServer::Start(const std::string& host, int port) {
    ValidateRoutes();
    spdlog::info("HTTP API Server listening on {}:{}", host, port);
    if (!svr_.listen(host, port)) {
        throw std::runtime_error("failed to listen on " + host + ":" + std::to_string(port));
    }
}

void ApiServer::Stop() {
    svr_.stop();
}

void ApiServer::HandleDetect(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    obs::Context ctx;
    ctx.request_id = rid;
    ctx.operation = "detect";
    obs::ScopedContext scope(ctx);
    try {
        auto start = std::chrono::steady_clock::now();
        bool debug = GetBoolParam(req, "debug", false);
        auto upload = ReadUpload(req);

        DetectionReport report = orchestrator_->DetectNumeric(upload.get());
        log.AddFields({{"upload_name", report.metadata.upload_name},
                       {"rows", report.total_rows},
                       {"anomalies", report.anomalies.size()}});

        nlohmann::json resp = ToJson(report);
        if (debug) {
            double duration_ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start).count();
            resp["debug"] = BuildDebugMeta({duration_ms, static_cast<long>(report.total_rows), report.timings});
        }
        SendJson(res, resp, 200, rid);
    } catch (const pipeline::PipelineError& e) {
        RejectUpload(log, res, e, rid);
    } catch (const std::exception& e) {
        log.RecordError(obs::kErrInternal, e.what(), 500);
        SendError({res, "Internal", "Internal error while processing upload", 500, obs::kErrInternal, rid});
    }
}

void ApiServer::HandleDetectCategorical(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    obs::Context ctx;
    ctx.request_id = rid;
    ctx.operation = "detect_categorical";
    obs::ScopedContext scope(ctx);
    try {
        auto start = std::chrono::steady_clock::now();
        bool debug = GetBoolParam(req, "debug", false);
        double percentile = GetDoubleParam(req, "threshold_percentile",
                                           config_.detection.categorical_threshold_percentile);
        log.AddFields({{"threshold_percentile", percentile}});
        auto upload = ReadUpload(req);

        CategoricalReport report = orchestrator_->DetectCategorical(upload.get(), percentile);
        log.AddFields({{"upload_name", report.metadata.upload_name},
                       {"rows", report.total_rows},
                       {"anomalies", report.anomalies.size()}});

        nlohmann::json resp = ToJson(report);
        if (debug) {
            double duration_ms = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start).count();
            resp["debug"] = BuildDebugMeta({duration_ms, static_cast<long>(report.total_rows), report.timings});
        }
        SendJson(res, resp, 200, rid);
    } catch (const pipeline::PipelineError& e) {
        RejectUpload(log, res, e, rid);
    } catch (const std::exception& e) {
        log.RecordError(obs::kErrInternal, e.what(), 500);
        SendError({res, "Internal", "Internal error while processing upload", 500, obs::kErrInternal, rid});
    }
}

void ApiServer::HandleLimits(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    const auto& limits = orchestrator_->Limits();
    nlohmann::json resp;
    resp["max_file_size_bytes"] = limits.max_file_size_bytes;
    resp["max_file_size_mb"] = limits.max_file_size_bytes / (1024 * 1024);
    resp["max_rows"] = limits.max_rows;
    resp["max_columns"] = limits.max_columns;
    resp["min_numeric_columns"] = limits.min_numeric_columns;
    resp["categorical_enabled"] = orchestrator_->CategoricalAvailable();
    resp["default_threshold_percentile"] = config_.detection.categorical_threshold_percentile;
    SendJson(res, resp, 200, rid);
}

void ApiServer::HandleTransportError(const httplib::Request& req, httplib::Response& res) {
    if (res.status != 413 || !res.body.empty()) {
        return;
    }
    std::string rid = GetRequestId(req);
    const auto kind = pipeline::ErrorKind::TooLarge;
    obs::LogEvent(obs::LogLevel::Warn, "http_payload_rejected", "api_server",
                  {{"route", req.path},
                   {"request_id", rid},
                   {"error_code", pipeline::ErrorCodeFor(kind)},
                   {"payload_max_length", config_.limits.max_file_size_bytes + kMultipartOverheadBytes}});
    obs::EmitCounter("uploads_rejected_total", 1, "requests", "api_server", {{"kind", pipeline::KindName(kind)}});
    SendError({res, pipeline::KindName(kind),
               pipeline::FileValidator::TooLargeMessage(orchestrator_->Limits().max_file_size_bytes), 413,
               pipeline::ErrorCodeFor(kind), rid});
}

void ApiServer::RejectUpload(obs::HttpRequestLogScope& log,
                             httplib::Response& res,
                             const pipeline::PipelineError& error,
                             const std::string& request_id) {
    const char* kind = pipeline::KindName(error.Kind());
    const char* code = pipeline::ErrorCodeFor(error.Kind());
    int status = pipeline::HttpStatusFor(error.Kind());
    log.AddFields({{"error_kind", kind}});
    log.RecordError(code, error.what(), status);
    obs::EmitCounter("uploads_rejected_total", 1, "requests", "api_server", {{"kind", kind}});
    SendError({res, kind, pipeline::PublicDetails(error), status, code, request_id});
}

auto ApiServer::SendJson(httplib::Response& res, nlohmann::json j, int status, const std::string& request_id) -> void {
    if (!request_id.empty() && !j.contains("request_id")) {
        j["request_id"] = request_id;
    }
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

void ApiServer::SendError(const ApiErrorArgs& args) {
    metrics::MetricsRegistry::Instance().Increment(
        "http_errors_total", {{"status", std::to_string(args.status)}, {"code", args.code}});
    nlohmann::json j;
    j["error"] = args.error;
    j["details"] = args.details;
    j["code"] = args.code;
    SendJson(args.res, j, args.status, args.request_id);
}

auto ApiServer::ReadUpload(const httplib::Request& req) -> std::unique_ptr<pipeline::RawUpload> {
    if (!req.has_file("file")) {
        return nullptr;
    }
    auto file = req.get_file_value("file");
    auto upload = std::make_unique<pipeline::RawUpload>();
    upload->filename = file.filename;
    upload->content_type = file.content_type;
    upload->stream = std::make_unique<std::istringstream>(file.content);
    return upload;
}

auto ApiServer::GetBoolParam(const httplib::Request& req, const std::string& key, bool def) -> bool {
    if (!req.has_param(key)) { return def; }
    std::string v = req.get_param_value(key);
    return v == "1" || v == "true" || v == "yes";
}

auto ApiServer::GetDoubleParam(const httplib::Request& req, const std::string& key, double def) -> double {
    if (!req.has_param(key)) { return def; }
    std::string raw = req.get_param_value(key);
    double value = 0.0;
    size_t consumed = 0;
    bool parsed = true;
    try {
        value = std::stod(raw, &consumed);
    } catch (const std::exception&) {
        parsed = false;
    }
    if (parsed && consumed == raw.size()) {
        return value;
    }
    throw pipeline::PipelineError(pipeline::ErrorKind::InvalidArgument,
                                  key + " must be a number, got '" + raw + "'");
}

auto ApiServer::ValidateRoutes() -> void {
    if (kRequiredRoutes.size() != 5) {
        spdlog::warn("Route registry count mismatch! Expected 5, got {}", kRequiredRoutes.size());
    } else {
        spdlog::info("Route registry validated ({} routes)", kRequiredRoutes.size());
    }
}

} // namespace csvsentry::api
