#pragma once

#include <memory>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "config.h"
#include "detection_orchestrator.h"
#include "obs/http_log.h"
#include "pipeline/pipeline_error.h"

namespace csvsentry::api {

class ApiServer {
public:
    ApiServer(ServiceConfig config, std::shared_ptr<const DetectionOrchestrator> orchestrator);
    ~ApiServer();

    void Start(const std::string& host, int port);
    void Stop();

private:
    void Initialize();
    // Route Handlers
    void HandleDetect(const httplib::Request& req, httplib::Response& res);
    void HandleDetectCategorical(const httplib::Request& req, httplib::Response& res);
    void HandleLimits(const httplib::Request& req, httplib::Response& res);
    // Gives library-generated 413s the same JSON body as a TooLarge upload.
    void HandleTransportError(const httplib::Request& req, httplib::Response& res);

    void ValidateRoutes();

    // Helpers
    void SendJson(httplib::Response& res, nlohmann::json j, int status = 200, const std::string& request_id = "");
    struct ApiErrorArgs {
        httplib::Response& res;
        std::string error;
        std::string details;
        int status = 400;
        std::string code = "E_INTERNAL";
        std::string request_id = "";
    };

    void SendError(const ApiErrorArgs& args);
    void RejectUpload(obs::HttpRequestLogScope& log,
                      httplib::Response& res,
                      const pipeline::PipelineError& error,
                      const std::string& request_id);

    static auto ReadUpload(const httplib::Request& req) -> std::unique_ptr<pipeline::RawUpload>;
    static auto GetBoolParam(const httplib::Request& req, const std::string& key, bool def) -> bool;
    // Throws PipelineError(InvalidArgument) when present but not a number.
    static auto GetDoubleParam(const httplib::Request& req, const std::string& key, double def) -> double;

    httplib::Server svr_;
    ServiceConfig config_;
    std::shared_ptr<const DetectionOrchestrator> orchestrator_;
};

} // namespace csvsentry::api
