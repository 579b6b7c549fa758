#include <gtest/gtest.h>
#include "api_server.h"
#include "detectors/default_collaborators.h"
#include "http_test_utils.h"
#include "metrics.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <thread>
#include <chrono>

namespace csvsentry {
namespace api {

namespace {

auto NumericCsv() -> std::string {
    std::string csv = "id,reading,label\n";
    for (int i = 0; i < 12; ++i) {
        csv += std::to_string(i) + "," + std::to_string(i * i % 7) + ".5,row" + std::to_string(i) + "\n";
    }
    return csv;
}

auto FileItem(const std::string& content, const std::string& filename = "data.csv")
    -> httplib::MultipartFormDataItems {
    return {{"file", content, filename, "text/csv"}};
}

} // namespace

class ApiServerTest : public ::testing::Test {
protected:
    std::unique_ptr<ApiServer> server;
    std::thread server_thread;
    int port = 0;

    void SetUp() override {
        port = AllocateTestPort();
        ServiceConfig config;
        config.limits.max_file_size_bytes = 1024;
        auto orchestrator = std::make_shared<DetectionOrchestrator>(
            config.limits, anomaly::MakeDefaultCollaborators(config.detection));
        server = std::make_unique<ApiServer>(config, orchestrator);

        server_thread = std::thread([this]() {
            try {
                server->Start("127.0.0.1", port);
            } catch (const std::exception& e) {
                ADD_FAILURE() << "server failed to start: " << e.what();
            }
        });
        ASSERT_TRUE(WaitForServerReady("127.0.0.1", port));
    }

    void TearDown() override {
        server->Stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
    }
};

TEST_F(ApiServerTest, HealthzReportsOk) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/healthz");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "OK");
}

TEST_F(ApiServerTest, DetectWithoutFileIsRejected) {
    httplib::Client cli("127.0.0.1", port);
    httplib::Headers headers = {{"X-Request-ID", "req-no-file"}};
    auto res = cli.Post("/detect", headers, httplib::MultipartFormDataItems{});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);

    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["error"], "NoFile");
    EXPECT_EQ(j["code"], "E_UPLOAD_NO_FILE");
    EXPECT_EQ(j["request_id"], "req-no-file");
}

TEST_F(ApiServerTest, DetectReturnsReport) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/detect", FileItem(NumericCsv()));
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;

    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["total_rows"], 12);
    EXPECT_EQ(j["anomalies_found"].get<size_t>(), j["anomalies"].size());
    EXPECT_EQ(j["metadata"]["filename"], "data.csv");
    EXPECT_EQ(j["metadata"]["scorer"], "pca_reconstruction");
    EXPECT_EQ(j["metadata"]["explainability_status"], "explained");
    EXPECT_FALSE(j.contains("debug"));
    EXPECT_TRUE(j.contains("request_id"));
}

TEST_F(ApiServerTest, DebugFlagAddsStageTimings) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/detect?debug=true", FileItem(NumericCsv()));
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;

    auto j = nlohmann::json::parse(res->body);
    ASSERT_TRUE(j.contains("debug"));
    EXPECT_EQ(j["debug"]["row_count"], 12);
    EXPECT_FALSE(j["debug"]["stages"].empty());
    EXPECT_EQ(j["debug"]["stages"][0]["stage"], "validate");
}

TEST_F(ApiServerTest, NonCsvFilenameIsRejected) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/detect", FileItem(NumericCsv(), "data.txt"));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"], "InvalidFileType");
}

TEST_F(ApiServerTest, OversizeUploadIsRejected) {
    httplib::Client cli("127.0.0.1", port);
    long before = metrics::MetricsRegistry::Instance().GetCounter("uploads_rejected_total", {{"kind", "TooLarge"}});

    auto res = cli.Post("/detect", FileItem(std::string(4096, '1')));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 413);
    EXPECT_EQ(nlohmann::json::parse(res->body)["code"], "E_UPLOAD_TOO_LARGE");

    EXPECT_EQ(metrics::MetricsRegistry::Instance().GetCounter("uploads_rejected_total", {{"kind", "TooLarge"}}),
              before + 1);
    auto metrics_res = cli.Get("/metrics");
    ASSERT_TRUE(metrics_res);
    EXPECT_NE(metrics_res->body.find("uploads_rejected_total"), std::string::npos);
}

TEST_F(ApiServerTest, UploadBeyondPayloadLimitGetsStructuredError) {
    httplib::Client cli("127.0.0.1", port);
    long before = metrics::MetricsRegistry::Instance().GetCounter("uploads_rejected_total", {{"kind", "TooLarge"}});

    // Larger than the 1024-byte limit plus the 1 MiB multipart allowance.
    auto res = cli.Post("/detect", FileItem(std::string(1024 * 1024 + 8192, '1')));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 413);
    auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"], "TooLarge");
    EXPECT_EQ(body["code"], "E_UPLOAD_TOO_LARGE");
    EXPECT_EQ(body["details"], "File too large. Maximum size: 1024 bytes");
    EXPECT_FALSE(body["request_id"].get<std::string>().empty());
    EXPECT_EQ(metrics::MetricsRegistry::Instance().GetCounter("uploads_rejected_total", {{"kind", "TooLarge"}}),
              before + 1);
}

TEST_F(ApiServerTest, UnknownRouteKeepsLibraryResponse) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/no-such-route");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
}

TEST_F(ApiServerTest, CategoricalDetectFlagsRareValue) {
    std::string csv = "color\n";
    for (int i = 0; i < 19; ++i) csv += "red\n";
    csv += "blue\n";

    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/detect/categorical?threshold_percentile=95", FileItem(csv));
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;

    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["anomalies_found"], 1);
    EXPECT_EQ(j["anomalies"][0]["color"], "blue");
    EXPECT_EQ(j["metadata"]["method"], "categorical_frequency");
}

TEST_F(ApiServerTest, BadThresholdPercentileIsRejected) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Post("/detect/categorical?threshold_percentile=abc", FileItem("color\nred\n"));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"], "InvalidArgument");

    res = cli.Post("/detect/categorical?threshold_percentile=120", FileItem("color\nred\n"));
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
}

TEST_F(ApiServerTest, LimitsReflectConfiguration) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/limits");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["max_file_size_bytes"], 1024);
    EXPECT_EQ(j["max_rows"], 1000000);
    EXPECT_EQ(j["categorical_enabled"], true);
}

TEST_F(ApiServerTest, PreflightGetsCorsHeaders) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Options("/detect");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 204);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");
}

} // namespace api
} // namespace csvsentry
